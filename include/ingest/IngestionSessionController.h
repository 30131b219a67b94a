#ifndef INGESTIONSESSIONCONTROLLER_H
#define INGESTIONSESSIONCONTROLLER_H

#include "ingest/IIngestionApi.h"
#include "ingest/TaskStateMachine.h"

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QSet>

class CancellationToken;
class IPayloadSource;
class PreflightResolver;
class SegmentUploader;
class StagePoller;
class StageRegistry;

/**
 * @brief Runs one ingestion task end to end.
 *
 * Pipeline:
 *   preflight -> (exists: Finished)
 *   -> payload acquisition -> (autoTranscode off: Finished locally)
 *   -> init call (skipped when preflight offered a session)
 *   -> [missing-segment query] -> segment upload -> complete
 *   -> poll ingestion job -> Finished{downloadRef}
 *   -> [deep processing -> poll deep job -> Finished]
 *
 * All sub-components share one CancellationToken. Every remote stage tag is
 * written to the StageRegistry under the task's identity and re-emitted via
 * stageReported().
 */
class IngestionSessionController : public QObject
{
    Q_OBJECT

public:
    enum class Phase {
        Idle,
        Preflight,
        Acquiring,
        Initializing,
        Resuming,
        Uploading,
        Completing,
        PollingIngestion,
        StartingDeepProcess,
        PollingDeepProcess,
        Done,
        Failed,
        Cancelled
    };
    Q_ENUM(Phase)

    /**
     * @param payloadSource Producer of the bytes to upload; the controller
     *        takes ownership.
     * @param registry Shared stage registry; may be null.
     */
    IngestionSessionController(const IngestionTask& task,
                               IIngestionApi* api,
                               IPayloadSource* payloadSource,
                               StageRegistry* registry,
                               const IngestionConfig& config,
                               QObject* parent = nullptr);
    ~IngestionSessionController() override;

    // Returns false if the controller has already been started
    bool start();

    // Stops whatever is running and ends in Error{cancelled}; no effect once the task has ended
    void cancel();

    /**
     * @brief Run the deep processing pipeline for the ingested content.
     *
     * Valid only while Finished after ingestion or after a previous deep
     * processing run.
     */
    bool startDeepProcessing();

    const IngestionTask& task() const { return m_task; }
    const IngestionConfig& config() const { return m_config; }
    const TaskState& state() const;
    TaskStateMachine::Checkpoint checkpoint() const;
    Phase phase() const { return m_phase; }
    bool isRunning() const;
    CancellationToken* cancellationToken() const { return m_token; }

    QString contentRef() const { return m_contentRef; }
    QString downloadRef() const { return m_downloadRef; }
    QString sessionRef() const { return m_sessionRef; }

    // Object id embedded in ".../download/<16 hex>", or empty
    static QString contentRefFromDownloadRef(const QString& downloadRef);

signals:
    void stateChanged(const TaskState& state);
    void stageReported(const QString& stage, double progress);
    void ingestionFinished(const QString& downloadRef);
    void deepProcessFinished(const QString& contentRef);
    void failed(const IngestionError& error);
    void cancelled();

private slots:
    void onTokenCancelled();

    void onPreflightStage(const QString& stage, double progress);
    void onPreflightResolved(const PreflightResult& result);
    void onPreflightFailed(const IngestionError& error);

    void onPayloadProgress(double progress);
    void onPayloadReady(const QByteArray& payload);
    void onPayloadFailed(const QString& errorMessage);

    void onUploadProgress(double progress);
    void onUploadFinished();
    void onUploadFailed(const IngestionError& error);

    void onIngestionObserved(const PipelineObservation& observation);
    void onIngestionSucceeded(const PipelineObservation& observation);
    void onIngestionPollFailed(const IngestionError& error);

    void onDeepProcessObserved(const PipelineObservation& observation);
    void onDeepProcessSucceeded(const PipelineObservation& observation);
    void onDeepProcessPollFailed(const IngestionError& error);

private:
    void initializeSession();
    void onInitFinished(const ApiResponse& response);
    void queryMissingSegments();
    void onMissingSegmentsFinished(const ApiResponse& response);
    void beginUpload(const QSet<int>& alreadyAcknowledged);
    void completeSession();
    void onCompleteFinished(const ApiResponse& response);
    void onDeepProcessStartFinished(const ApiResponse& response);
    void finishIngestion();

    void reportStage(const QString& stage, double progress);
    void failWith(TaskState::ErrorKind kind, const IngestionError& error);
    void enterCancelled();
    void setPhase(Phase phase);
    void stopActivity();
    void trackCall(ApiCall* call, void (IngestionSessionController::*handler)(const ApiResponse&));

    IngestionTask m_task;
    IngestionConfig m_config;
    IIngestionApi* m_api = nullptr;
    IPayloadSource* m_payloadSource = nullptr;
    QPointer<StageRegistry> m_registry;

    CancellationToken* m_token = nullptr;
    TaskStateMachine* m_stateMachine = nullptr;
    PreflightResolver* m_resolver = nullptr;
    SegmentUploader* m_uploader = nullptr;
    StagePoller* m_ingestionPoller = nullptr;
    StagePoller* m_deepProcessPoller = nullptr;
    QPointer<ApiCall> m_call;

    Phase m_phase = Phase::Idle;
    QByteArray m_payload;
    QString m_contentRef;
    QString m_downloadRef;
    QString m_sessionRef;
    bool m_sessionOffered = false;
    bool m_finishedLocally = false;
};

#endif // INGESTIONSESSIONCONTROLLER_H
