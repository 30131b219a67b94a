#include "ingest/StagePoller.h"

#include "ingest/CancellationToken.h"

#include <QDebug>
#include <QTimer>
#include <QtGlobal>

#include <cmath>
#include <utility>

StagePoller::StagePoller(FetchFunction fetch, int intervalMs, QObject* parent)
    : QObject(parent)
    , m_fetch(std::move(fetch))
    , m_intervalMs(qMax(0, intervalMs))
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &StagePoller::poll);
}

StagePoller::~StagePoller()
{
    stop();
}

void StagePoller::start(CancellationToken* token)
{
    if (m_polling) {
        qDebug() << "StagePoller: Already polling";
        return;
    }

    if (m_token) {
        m_token->disconnect(this);
    }
    m_token = token;
    if (m_token && m_token->isCancelled()) {
        m_token = nullptr;
        emit failed(IngestionError::cancelled());
        return;
    }
    if (m_token) {
        connect(m_token, &CancellationToken::cancelled, this, &StagePoller::onCancelled);
    }

    m_polling = true;
    m_fetchCount = 0;
    poll();
}

void StagePoller::stop()
{
    m_timer->stop();
    if (m_call) {
        m_call->disconnect(this);
        m_call->abort();
    }
    m_call = nullptr;
    finish();
}

bool StagePoller::parseObservation(const QJsonObject& body,
                                   PipelineObservation* observation,
                                   QString* errorMessage)
{
    const QJsonValue stageValue = body.value("stage");
    if (!stageValue.isString()) {
        if (errorMessage) {
            *errorMessage = tr("Status response missing stage");
        }
        return false;
    }

    PipelineObservation parsed;
    parsed.stage = PipelineStage::fromTag(stageValue.toString());

    // Progress arrives as a number, occasionally as a numeric string
    const QJsonValue progressValue = body.value("progress");
    double progress = progressValue.isString() ? progressValue.toString().toDouble()
                                               : progressValue.toDouble(0.0);
    if (!std::isfinite(progress)) {
        progress = 0.0;
    }
    parsed.progress = qBound(0.0, progress, 1.0);
    parsed.message = body.value("message").toString().trimmed();
    parsed.downloadRef = body.value("downloadUrl").toString().trimmed();

    if (observation) {
        *observation = parsed;
    }
    if (errorMessage) {
        errorMessage->clear();
    }
    return true;
}

void StagePoller::poll()
{
    if (!m_polling) {
        return;
    }
    if (m_token && m_token->isCancelled()) {
        return;
    }

    ++m_fetchCount;
    m_call = m_fetch ? m_fetch() : nullptr;
    if (!m_call) {
        finish();
        emit failed(IngestionError::protocol(tr("No status request available")));
        return;
    }
    connect(m_call, &ApiCall::finished, this, &StagePoller::onFetchFinished);
}

void StagePoller::onCancelled()
{
    if (!m_polling) {
        return;
    }
    stop();
    emit failed(IngestionError::cancelled());
}

void StagePoller::onFetchFinished(const ApiResponse& response)
{
    m_call = nullptr;
    if (!m_polling) {
        return;
    }

    if (!response.isSuccess()) {
        finish();
        emit failed(response.error);
        return;
    }

    PipelineObservation observation;
    QString parseError;
    if (!parseObservation(response.body, &observation, &parseError)) {
        finish();
        emit failed(IngestionError::protocol(parseError));
        return;
    }

    emit observed(observation);
    if (!m_polling) {
        return;
    }

    if (observation.stage.isDone()) {
        finish();
        emit succeeded(observation);
        return;
    }

    if (observation.stage.isFailure()) {
        finish();
        const QString message = observation.message.isEmpty()
            ? tr("Remote processing failed (%1)").arg(observation.stage.tag())
            : observation.message;
        emit failed(IngestionError::server(message));
        return;
    }

    if (!observation.stage.isRecognized()) {
        qDebug() << "StagePoller: Unrecognized stage" << observation.stage.tag()
                 << "treated as processing";
    }
    m_timer->start(m_intervalMs);
}

void StagePoller::finish()
{
    m_polling = false;
    m_timer->stop();
    if (m_token) {
        m_token->disconnect(this);
    }
    m_token = nullptr;
}
