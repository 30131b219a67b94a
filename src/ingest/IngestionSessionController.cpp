#include "ingest/IngestionSessionController.h"

#include "ingest/CancellationToken.h"
#include "ingest/IPayloadSource.h"
#include "ingest/PreflightResolver.h"
#include "ingest/SegmentUploader.h"
#include "ingest/StagePoller.h"
#include "ingest/StageRegistry.h"

#include <QDebug>
#include <QJsonArray>
#include <QRegularExpression>

IngestionSessionController::IngestionSessionController(const IngestionTask& task,
                                                       IIngestionApi* api,
                                                       IPayloadSource* payloadSource,
                                                       StageRegistry* registry,
                                                       const IngestionConfig& config,
                                                       QObject* parent)
    : QObject(parent)
    , m_task(task)
    , m_config(config)
    , m_api(api)
    , m_payloadSource(payloadSource)
    , m_registry(registry)
    , m_token(new CancellationToken(this))
    , m_stateMachine(new TaskStateMachine(this))
{
    // First receiver of cancelled(), so every component sees Phase::Cancelled
    connect(m_token, &CancellationToken::cancelled, this, &IngestionSessionController::onTokenCancelled);

    connect(m_stateMachine, &TaskStateMachine::stateChanged,
            this, &IngestionSessionController::stateChanged);

    if (m_payloadSource) {
        m_payloadSource->setParent(this);
        connect(m_payloadSource, &IPayloadSource::progress, this, &IngestionSessionController::onPayloadProgress);
        connect(m_payloadSource, &IPayloadSource::ready, this, &IngestionSessionController::onPayloadReady);
        connect(m_payloadSource, &IPayloadSource::failed, this, &IngestionSessionController::onPayloadFailed);
    }

    m_resolver = new PreflightResolver(m_api, this);
    connect(m_resolver, &PreflightResolver::stageObserved, this, &IngestionSessionController::onPreflightStage);
    connect(m_resolver, &PreflightResolver::resolved, this, &IngestionSessionController::onPreflightResolved);
    connect(m_resolver, &PreflightResolver::failed, this, &IngestionSessionController::onPreflightFailed);

    SegmentUploader::Options uploadOptions;
    uploadOptions.partSize = m_task.partSize > 0 ? m_task.partSize : m_config.partSize;
    uploadOptions.concurrency = m_task.concurrency > 0 ? m_task.concurrency : m_config.concurrency;
    uploadOptions.maxAttempts = m_config.maxSegmentAttempts;
    uploadOptions.retryDelayMs = m_config.segmentRetryDelayMs;
    m_uploader = new SegmentUploader(m_api, uploadOptions, this);
    connect(m_uploader, &SegmentUploader::progressChanged, this, &IngestionSessionController::onUploadProgress);
    connect(m_uploader, &SegmentUploader::finished, this, &IngestionSessionController::onUploadFinished);
    connect(m_uploader, &SegmentUploader::failed, this, &IngestionSessionController::onUploadFailed);

    m_ingestionPoller = new StagePoller(
        [this]() { return m_api->fetchIngestionStatus(m_sessionRef); }, m_config.pollIntervalMs, this);
    connect(m_ingestionPoller, &StagePoller::observed, this, &IngestionSessionController::onIngestionObserved);
    connect(m_ingestionPoller, &StagePoller::succeeded, this, &IngestionSessionController::onIngestionSucceeded);
    connect(m_ingestionPoller, &StagePoller::failed, this, &IngestionSessionController::onIngestionPollFailed);

    m_deepProcessPoller = new StagePoller(
        [this]() { return m_api->fetchDeepProcessStatus(m_contentRef); }, m_config.pollIntervalMs, this);
    connect(m_deepProcessPoller, &StagePoller::observed, this, &IngestionSessionController::onDeepProcessObserved);
    connect(m_deepProcessPoller, &StagePoller::succeeded, this, &IngestionSessionController::onDeepProcessSucceeded);
    connect(m_deepProcessPoller, &StagePoller::failed, this, &IngestionSessionController::onDeepProcessPollFailed);
}

IngestionSessionController::~IngestionSessionController()
{
    if (m_call) {
        m_call->disconnect(this);
        m_call->abort();
    }
}

const TaskState& IngestionSessionController::state() const
{
    return m_stateMachine->state();
}

TaskStateMachine::Checkpoint IngestionSessionController::checkpoint() const
{
    return m_stateMachine->checkpoint();
}

bool IngestionSessionController::isRunning() const
{
    return m_phase != Phase::Idle && m_phase != Phase::Done
        && m_phase != Phase::Failed && m_phase != Phase::Cancelled;
}

bool IngestionSessionController::start()
{
    if (m_phase != Phase::Idle) {
        qWarning() << "IngestionSessionController: Task already started, phase" << m_phase;
        return false;
    }
    if (!m_payloadSource) {
        failWith(TaskState::ErrorKind::Download, IngestionError::protocol(tr("No payload source")));
        return false;
    }

    qDebug() << "IngestionSessionController: Starting" << m_task.identity.registryKey()
             << "autoTranscode:" << m_task.autoTranscode
             << "autoDeepProcess:" << m_task.autoDeepProcess;
    setPhase(Phase::Preflight);
    m_resolver->resolve(m_task.identity, m_token);
    return true;
}

void IngestionSessionController::cancel()
{
    // A finished task keeps its token usable for a later deep processing run
    if (m_phase == Phase::Done || m_phase == Phase::Failed || m_phase == Phase::Cancelled) {
        return;
    }
    m_token->cancel();
}

void IngestionSessionController::onTokenCancelled()
{
    if (m_phase == Phase::Done || m_phase == Phase::Failed || m_phase == Phase::Cancelled) {
        return;
    }
    enterCancelled();
}

void IngestionSessionController::enterCancelled()
{
    qDebug() << "IngestionSessionController: Cancelled during" << m_phase;
    setPhase(Phase::Cancelled);
    stopActivity();
    m_payload.clear();
    m_stateMachine->onCancelled(tr("Cancelled by user"));
    emit cancelled();
}

// ============================================================================
// Preflight
// ============================================================================

void IngestionSessionController::onPreflightStage(const QString& stage, double progress)
{
    reportStage(stage, progress);
    m_stateMachine->onPreflightStage(PipelineStage::fromTag(stage));
}

void IngestionSessionController::onPreflightResolved(const PreflightResult& result)
{
    if (m_phase != Phase::Preflight) {
        return;
    }

    m_contentRef = result.identity;

    if (result.exists) {
        m_downloadRef = result.downloadRef;
        finishIngestion();
        return;
    }

    if (!result.reusableSessionRef.isEmpty()) {
        m_sessionRef = result.reusableSessionRef;
        m_sessionOffered = true;
    }

    setPhase(Phase::Acquiring);
    m_stateMachine->onDownloadStarted();
    m_payloadSource->fetch();
}

void IngestionSessionController::onPreflightFailed(const IngestionError& error)
{
    if (m_phase == Phase::Preflight) {
        failWith(TaskState::ErrorKind::Upload, error);
    }
}

// ============================================================================
// Payload acquisition
// ============================================================================

void IngestionSessionController::onPayloadProgress(double progress)
{
    if (m_phase == Phase::Acquiring) {
        m_stateMachine->onDownloadProgress(progress);
    }
}

void IngestionSessionController::onPayloadReady(const QByteArray& payload)
{
    if (m_phase != Phase::Acquiring) {
        return;
    }

    if (!m_task.autoTranscode) {
        qDebug() << "IngestionSessionController: Payload kept locally," << payload.size() << "bytes";
        m_finishedLocally = true;
        m_downloadRef = m_payloadSource->localReference();
        setPhase(Phase::Done);
        m_stateMachine->onIngestionFinished(m_downloadRef);
        emit ingestionFinished(m_downloadRef);
        return;
    }

    if (payload.isEmpty()) {
        failWith(TaskState::ErrorKind::Upload, IngestionError::protocol(tr("Payload is empty")));
        return;
    }

    m_payload = payload;

    if (!m_sessionOffered) {
        initializeSession();
    } else if (m_config.resumeReusedSessions) {
        queryMissingSegments();
    } else {
        beginUpload(QSet<int>());
    }
}

void IngestionSessionController::onPayloadFailed(const QString& errorMessage)
{
    if (m_phase == Phase::Acquiring) {
        failWith(TaskState::ErrorKind::Download, IngestionError::transient(errorMessage));
    }
}

// ============================================================================
// Upload session
// ============================================================================

void IngestionSessionController::initializeSession()
{
    setPhase(Phase::Initializing);
    const int total = SegmentUploader::segmentCount(m_payload.size(), m_uploader->options().partSize);
    trackCall(m_api->createIngestion(m_task.identity, total, true),
              &IngestionSessionController::onInitFinished);
}

void IngestionSessionController::onInitFinished(const ApiResponse& response)
{
    if (!response.isSuccess()) {
        failWith(TaskState::ErrorKind::Upload, response.error);
        return;
    }

    PreflightResult result;
    QString parseError;
    if (!PreflightResolver::parseResponse(response.body, &result, &parseError)) {
        failWith(TaskState::ErrorKind::Upload, IngestionError::protocol(parseError));
        return;
    }

    m_contentRef = result.identity;

    if (result.exists) {
        // Another client finished the same content since preflight
        qDebug() << "IngestionSessionController: Content appeared during init:" << result.identity;
        m_payload.clear();
        m_downloadRef = m_api->resolveReference(result.downloadRef);
        reportStage(QString::fromLatin1(PipelineStage::kExists), 1.0);
        finishIngestion();
        return;
    }

    if (result.reusableSessionRef.isEmpty()) {
        failWith(TaskState::ErrorKind::Upload,
                 IngestionError::protocol(tr("Ingestion response missing uploadId")));
        return;
    }

    m_sessionRef = result.reusableSessionRef;
    beginUpload(QSet<int>());
}

void IngestionSessionController::queryMissingSegments()
{
    setPhase(Phase::Resuming);
    trackCall(m_api->fetchMissingSegments(m_sessionRef),
              &IngestionSessionController::onMissingSegmentsFinished);
}

void IngestionSessionController::onMissingSegmentsFinished(const ApiResponse& response)
{
    if (!response.isSuccess()) {
        qWarning() << "IngestionSessionController: Missing-segment query failed, uploading everything:"
                   << response.error.message;
        beginUpload(QSet<int>());
        return;
    }

    const int total = SegmentUploader::segmentCount(m_payload.size(), m_uploader->options().partSize);
    const QJsonArray missingArray = response.body.value("missing").toArray();

    QSet<int> missing;
    for (const QJsonValue& value : missingArray) {
        const int index = value.toInt(0);
        if (index >= 1 && index <= total) {
            missing.insert(index);
        }
    }

    // An empty list carries no information; the server skips duplicates anyway
    if (missing.isEmpty()) {
        beginUpload(QSet<int>());
        return;
    }

    QSet<int> acknowledged;
    for (int index = 1; index <= total; ++index) {
        if (!missing.contains(index)) {
            acknowledged.insert(index);
        }
    }
    qDebug() << "IngestionSessionController: Resuming session," << acknowledged.size() << "of"
             << total << "segments already on server";
    beginUpload(acknowledged);
}

void IngestionSessionController::beginUpload(const QSet<int>& alreadyAcknowledged)
{
    setPhase(Phase::Uploading);
    m_stateMachine->onUploadStarted();
    m_uploader->start(m_sessionRef, m_payload, m_token, alreadyAcknowledged);
}

void IngestionSessionController::onUploadProgress(double progress)
{
    if (m_phase == Phase::Uploading) {
        m_stateMachine->onUploadProgress(progress);
    }
}

void IngestionSessionController::onUploadFinished()
{
    if (m_phase != Phase::Uploading) {
        return;
    }
    m_payload.clear();
    completeSession();
}

void IngestionSessionController::onUploadFailed(const IngestionError& error)
{
    if (m_phase == Phase::Uploading) {
        failWith(TaskState::ErrorKind::Upload, error);
    }
}

void IngestionSessionController::completeSession()
{
    setPhase(Phase::Completing);
    trackCall(m_api->completeIngestion(m_sessionRef), &IngestionSessionController::onCompleteFinished);
}

void IngestionSessionController::onCompleteFinished(const ApiResponse& response)
{
    if (!response.isSuccess()) {
        failWith(TaskState::ErrorKind::Upload, response.error);
        return;
    }

    setPhase(Phase::PollingIngestion);
    m_stateMachine->onIngestionSubmitted();
    m_ingestionPoller->start(m_token);
}

// ============================================================================
// Ingestion job
// ============================================================================

void IngestionSessionController::onIngestionObserved(const PipelineObservation& observation)
{
    if (m_phase != Phase::PollingIngestion) {
        return;
    }
    reportStage(observation.stage.tag(), observation.progress);
    if (!observation.downloadRef.isEmpty()) {
        m_downloadRef = m_api->resolveReference(observation.downloadRef);
    }
    m_stateMachine->onIngestionObservation(observation);
}

void IngestionSessionController::onIngestionSucceeded(const PipelineObservation& observation)
{
    if (m_phase != Phase::PollingIngestion) {
        return;
    }
    if (!observation.downloadRef.isEmpty()) {
        m_downloadRef = m_api->resolveReference(observation.downloadRef);
    }
    finishIngestion();
}

void IngestionSessionController::onIngestionPollFailed(const IngestionError& error)
{
    if (m_phase == Phase::PollingIngestion) {
        failWith(TaskState::ErrorKind::Transcode, error);
    }
}

void IngestionSessionController::finishIngestion()
{
    if (m_contentRef.isEmpty()) {
        m_contentRef = contentRefFromDownloadRef(m_downloadRef);
    }

    qDebug() << "IngestionSessionController: Ingestion finished" << m_task.identity.registryKey()
             << "->" << m_downloadRef;
    setPhase(Phase::Done);
    m_stateMachine->onIngestionFinished(m_downloadRef);
    emit ingestionFinished(m_downloadRef);

    if (m_task.autoDeepProcess && m_phase == Phase::Done) {
        startDeepProcessing();
    }
}

// ============================================================================
// Deep processing
// ============================================================================

bool IngestionSessionController::startDeepProcessing()
{
    if (m_phase != Phase::Done || !m_stateMachine->canStartDeepProcess()) {
        qWarning() << "IngestionSessionController: Deep processing not available in phase" << m_phase;
        return false;
    }
    if (m_finishedLocally) {
        qWarning() << "IngestionSessionController: Content was never sent to the server";
        return false;
    }
    if (m_contentRef.isEmpty()) {
        qWarning() << "IngestionSessionController: No content reference for deep processing";
        return false;
    }
    if (m_token->isCancelled()) {
        qWarning() << "IngestionSessionController: Task was cancelled, deep processing refused";
        return false;
    }
    if (!m_stateMachine->onDeepProcessStarted()) {
        return false;
    }

    qDebug() << "IngestionSessionController: Starting deep processing for" << m_contentRef;
    setPhase(Phase::StartingDeepProcess);
    trackCall(m_api->startDeepProcess(m_contentRef), &IngestionSessionController::onDeepProcessStartFinished);
    return true;
}

void IngestionSessionController::onDeepProcessStartFinished(const ApiResponse& response)
{
    if (!response.isSuccess()) {
        failWith(TaskState::ErrorKind::Transcode, response.error);
        return;
    }
    setPhase(Phase::PollingDeepProcess);
    m_deepProcessPoller->start(m_token);
}

void IngestionSessionController::onDeepProcessObserved(const PipelineObservation& observation)
{
    if (m_phase != Phase::PollingDeepProcess) {
        return;
    }
    reportStage(observation.stage.tag(), observation.progress);
    m_stateMachine->onDeepProcessObservation(observation);
}

void IngestionSessionController::onDeepProcessSucceeded(const PipelineObservation& /*observation*/)
{
    if (m_phase != Phase::PollingDeepProcess) {
        return;
    }
    qDebug() << "IngestionSessionController: Deep processing finished for" << m_contentRef;
    setPhase(Phase::Done);
    m_stateMachine->onDeepProcessFinished();
    emit deepProcessFinished(m_contentRef);
}

void IngestionSessionController::onDeepProcessPollFailed(const IngestionError& error)
{
    if (m_phase == Phase::PollingDeepProcess) {
        failWith(TaskState::ErrorKind::Transcode, error);
    }
}

// ============================================================================
// Helpers
// ============================================================================

QString IngestionSessionController::contentRefFromDownloadRef(const QString& downloadRef)
{
    static const QRegularExpression pattern(QStringLiteral("/download/([0-9a-fA-F]{16})(?:[/?#]|$)"));
    const QRegularExpressionMatch match = pattern.match(downloadRef);
    return match.hasMatch() ? match.captured(1) : QString();
}

void IngestionSessionController::reportStage(const QString& stage, double progress)
{
    if (stage.isEmpty()) {
        return;
    }
    if (m_registry) {
        m_registry->update(m_task.identity.registryKey(), stage);
    }
    emit stageReported(stage, progress);
}

void IngestionSessionController::failWith(TaskState::ErrorKind kind, const IngestionError& error)
{
    if (m_phase == Phase::Done || m_phase == Phase::Failed || m_phase == Phase::Cancelled) {
        return;
    }

    if (error.isCancelled()) {
        if (m_token->isCancelled()) {
            enterCancelled();
        } else {
            m_token->cancel();
        }
        return;
    }

    qWarning() << "IngestionSessionController: Task" << m_task.identity.registryKey()
               << "failed during" << m_phase << ":" << error.message;
    setPhase(Phase::Failed);
    stopActivity();
    m_payload.clear();
    m_stateMachine->onFailed(kind, error.message);
    emit failed(error);
}

void IngestionSessionController::setPhase(Phase phase)
{
    m_phase = phase;
}

void IngestionSessionController::stopActivity()
{
    if (m_call) {
        m_call->disconnect(this);
        m_call->abort();
        m_call = nullptr;
    }
    if (m_payloadSource) {
        m_payloadSource->abort();
    }
    m_ingestionPoller->stop();
    m_deepProcessPoller->stop();
}

void IngestionSessionController::trackCall(ApiCall* call,
                                           void (IngestionSessionController::*handler)(const ApiResponse&))
{
    m_call = call;
    connect(call, &ApiCall::finished, this, [this, handler](const ApiResponse& response) {
        m_call = nullptr;
        (this->*handler)(response);
    });
}
