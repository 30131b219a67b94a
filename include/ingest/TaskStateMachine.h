#ifndef TASKSTATEMACHINE_H
#define TASKSTATEMACHINE_H

#include "ingest/IngestionTypes.h"

#include <QMetaType>
#include <QObject>
#include <QString>

/**
 * @brief Externally visible state of one ingestion task.
 *
 * Only the fields relevant to `status` are meaningful:
 * - Waiting: waitingKind, label
 * - Downloading / Uploading / Transcoding: progress
 * - Finished: resultRef
 * - Error: errorKind, message
 */
struct TaskState {
    enum class Status { Waiting, Downloading, Uploading, Transcoding, Finished, Error };
    enum class WaitingKind { Check, Download, Upload, Transcode, Server };
    enum class ErrorKind { Download, Upload, Transcode, Cancelled };

    Status status = Status::Waiting;
    WaitingKind waitingKind = WaitingKind::Check;
    QString label;
    double progress = 0.0;
    QString resultRef;
    ErrorKind errorKind = ErrorKind::Transcode;
    QString message;

    static TaskState waiting(WaitingKind kind, const QString& label = QString());
    static TaskState downloading(double progress);
    static TaskState uploading(double progress);
    static TaskState transcoding(double progress);
    static TaskState finished(const QString& resultRef);
    static TaskState error(ErrorKind kind, const QString& message);

    bool isError() const { return status == Status::Error; }
    bool isFinished() const { return status == Status::Finished; }
    bool isCancelled() const { return isError() && errorKind == ErrorKind::Cancelled; }

    // One-line description for logs and the CLI
    QString describe() const;

    bool operator==(const TaskState& other) const;
    bool operator!=(const TaskState& other) const { return !(*this == other); }
};

/**
 * @brief Lifecycle of one ingestion task.
 *
 * Starts in Waiting{Check}. Error is terminal. Finished is a checkpoint that
 * may be left again to run deep processing; the checkpoint() sub-state tells
 * which follow-on actions are valid.
 */
class TaskStateMachine : public QObject
{
    Q_OBJECT

public:
    enum class Checkpoint {
        None,               // ingestion still running
        IngestionDone,      // first pipeline finished
        DeepProcessRunning, // second pipeline running
        DeepProcessDone     // second pipeline finished (may be run again)
    };
    Q_ENUM(Checkpoint)

    explicit TaskStateMachine(QObject* parent = nullptr);

    const TaskState& state() const { return m_state; }
    Checkpoint checkpoint() const { return m_checkpoint; }

    bool isTerminal() const { return m_state.isError(); }
    bool isBusy() const { return !m_state.isError() && !m_state.isFinished(); }
    bool canStartDeepProcess() const;

    // Ingestion pipeline
    void onPreflightStage(const PipelineStage& stage);
    void onDownloadStarted();
    void onDownloadProgress(double progress);
    void onUploadStarted();
    void onUploadProgress(double progress);
    void onIngestionSubmitted();
    void onIngestionObservation(const PipelineObservation& observation);
    void onIngestionFinished(const QString& resultRef);

    // Deep processing pipeline
    bool onDeepProcessStarted();
    void onDeepProcessObservation(const PipelineObservation& observation);
    void onDeepProcessFinished();

    // Failure in whichever pipeline is running
    void onFailed(TaskState::ErrorKind kind, const QString& message);
    void onCancelled(const QString& message = QString());

signals:
    void stateChanged(const TaskState& state);
    void checkpointChanged(TaskStateMachine::Checkpoint checkpoint);

private:
    bool inIngestion() const;
    bool inDeepProcess() const;
    bool transitionTo(const TaskState& next);
    void setCheckpoint(Checkpoint checkpoint);

    TaskState m_state;
    Checkpoint m_checkpoint = Checkpoint::None;
    QString m_resultRef;
};

Q_DECLARE_METATYPE(TaskState)

#endif // TASKSTATEMACHINE_H
