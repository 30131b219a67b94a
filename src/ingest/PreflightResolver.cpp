#include "ingest/PreflightResolver.h"

#include "ingest/CancellationToken.h"

#include <QDebug>

PreflightResolver::PreflightResolver(IIngestionApi* api, QObject* parent)
    : QObject(parent)
    , m_api(api)
{
}

PreflightResolver::~PreflightResolver()
{
    if (m_call) {
        m_call->disconnect(this);
        m_call->abort();
    }
}

void PreflightResolver::resolve(const ContentIdentity& identity, CancellationToken* token)
{
    if (m_call) {
        emit failed(IngestionError::protocol(tr("Preflight already in progress")));
        return;
    }

    QString identityError;
    if (!identity.validate(&identityError)) {
        emit failed(IngestionError::protocol(identityError));
        return;
    }

    if (m_token) {
        m_token->disconnect(this);
    }
    m_token = token;
    if (m_token) {
        if (m_token->isCancelled()) {
            emit failed(IngestionError::cancelled());
            return;
        }
        connect(m_token, &CancellationToken::cancelled, this, &PreflightResolver::onCancelled);
    }

    qDebug() << "PreflightResolver: Checking" << identity.registryKey();
    m_call = m_api->createIngestion(identity, 0, true);
    connect(m_call, &ApiCall::finished, this, &PreflightResolver::onCallFinished);
}

bool PreflightResolver::parseResponse(const QJsonObject& body,
                                      PreflightResult* result,
                                      QString* errorMessage)
{
    if (errorMessage) {
        errorMessage->clear();
    }

    PreflightResult parsed;
    parsed.exists = body.value("exists").toBool(false);
    parsed.identity = body.value("objectId").toString().trimmed();

    // Existing content may omit objectId; it is recovered from the download reference later
    if (parsed.identity.isEmpty() && !parsed.exists) {
        if (errorMessage) {
            *errorMessage = tr("Ingestion response missing objectId");
        }
        return false;
    }

    if (parsed.exists) {
        parsed.downloadRef = body.value("downloadUrl").toString().trimmed();
        parsed.rawRef = body.value("rawUrl").toString().trimmed();
        if (parsed.downloadRef.isEmpty()) {
            parsed.downloadRef = parsed.rawRef;
        }
        if (parsed.downloadRef.isEmpty()) {
            if (errorMessage) {
                *errorMessage = tr("Server reported existing content without a download reference");
            }
            return false;
        }
    } else {
        parsed.reusableSessionRef = body.value("uploadId").toString().trimmed();
    }

    if (result) {
        *result = parsed;
    }
    return true;
}

void PreflightResolver::onCallFinished(const ApiResponse& response)
{
    m_call = nullptr;

    if (!response.isSuccess()) {
        finishWithError(response.error);
        return;
    }

    PreflightResult result;
    QString parseError;
    if (!parseResponse(response.body, &result, &parseError)) {
        finishWithError(IngestionError::protocol(parseError));
        return;
    }

    result.downloadRef = m_api->resolveReference(result.downloadRef);
    result.rawRef = m_api->resolveReference(result.rawRef);

    if (m_token) {
        m_token->disconnect(this);
    }

    if (result.exists) {
        qDebug() << "PreflightResolver: Content already processed as" << result.identity;
        emit stageObserved(QString::fromLatin1(PipelineStage::kExists), 1.0);
    } else {
        qDebug() << "PreflightResolver: Content not found, identity" << result.identity
                 << (result.reusableSessionRef.isEmpty() ? "(no session offered)" : "(session offered)");
        emit stageObserved(QString::fromLatin1(PipelineStage::kNotExists), 0.0);
    }
    emit resolved(result);
}

void PreflightResolver::onCancelled()
{
    if (!m_call) {
        return;
    }
    m_call->disconnect(this);
    m_call->abort();
    m_call = nullptr;
    finishWithError(IngestionError::cancelled());
}

void PreflightResolver::finishWithError(const IngestionError& error)
{
    if (m_token) {
        m_token->disconnect(this);
    }
    if (!error.isCancelled()) {
        qWarning() << "PreflightResolver: Resolution failed:" << error.message;
    }
    emit failed(error);
}
