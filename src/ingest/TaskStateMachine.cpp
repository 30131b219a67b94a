#include "ingest/TaskStateMachine.h"

#include <QDebug>
#include <QtGlobal>

// ============================================================================
// TaskState
// ============================================================================

TaskState TaskState::waiting(WaitingKind kind, const QString& label)
{
    TaskState state;
    state.status = Status::Waiting;
    state.waitingKind = kind;
    state.label = label;
    return state;
}

TaskState TaskState::downloading(double progress)
{
    TaskState state;
    state.status = Status::Downloading;
    state.progress = qBound(0.0, progress, 1.0);
    return state;
}

TaskState TaskState::uploading(double progress)
{
    TaskState state;
    state.status = Status::Uploading;
    state.progress = qBound(0.0, progress, 1.0);
    return state;
}

TaskState TaskState::transcoding(double progress)
{
    TaskState state;
    state.status = Status::Transcoding;
    state.progress = qBound(0.0, progress, 1.0);
    return state;
}

TaskState TaskState::finished(const QString& resultRef)
{
    TaskState state;
    state.status = Status::Finished;
    state.resultRef = resultRef;
    return state;
}

TaskState TaskState::error(ErrorKind kind, const QString& message)
{
    TaskState state;
    state.status = Status::Error;
    state.errorKind = kind;
    state.message = message;
    return state;
}

QString TaskState::describe() const
{
    switch (status) {
    case Status::Waiting:
        switch (waitingKind) {
        case WaitingKind::Check:
            return label.isEmpty() ? QObject::tr("Checking whether content exists...") : label;
        case WaitingKind::Download:
            return QObject::tr("Waiting to download...");
        case WaitingKind::Upload:
            return QObject::tr("Waiting to upload...");
        case WaitingKind::Transcode:
            return label.isEmpty() ? QObject::tr("Waiting to transcode...") : label;
        case WaitingKind::Server:
            return label.isEmpty() ? QObject::tr("Processing on server...")
                                   : QObject::tr("Processing on server (%1)").arg(label);
        }
        break;
    case Status::Downloading:
        return QObject::tr("Downloading %1%").arg(qRound(progress * 100.0));
    case Status::Uploading:
        return QObject::tr("Uploading %1%").arg(qRound(progress * 100.0));
    case Status::Transcoding:
        return QObject::tr("Transcoding %1%").arg(qRound(progress * 100.0));
    case Status::Finished:
        return resultRef.isEmpty() ? QObject::tr("Finished")
                                   : QObject::tr("Finished: %1").arg(resultRef);
    case Status::Error:
        return message;
    }
    return QObject::tr("Processing...");
}

bool TaskState::operator==(const TaskState& other) const
{
    if (status != other.status) {
        return false;
    }

    switch (status) {
    case Status::Waiting:
        return waitingKind == other.waitingKind && label == other.label;
    case Status::Downloading:
    case Status::Uploading:
    case Status::Transcoding:
        return progress == other.progress;
    case Status::Finished:
        return resultRef == other.resultRef;
    case Status::Error:
        return errorKind == other.errorKind && message == other.message;
    }
    return false;
}

// ============================================================================
// TaskStateMachine
// ============================================================================

TaskStateMachine::TaskStateMachine(QObject* parent)
    : QObject(parent)
    , m_state(TaskState::waiting(TaskState::WaitingKind::Check))
{
}

bool TaskStateMachine::canStartDeepProcess() const
{
    return m_state.isFinished()
        && (m_checkpoint == Checkpoint::IngestionDone || m_checkpoint == Checkpoint::DeepProcessDone);
}

void TaskStateMachine::onPreflightStage(const PipelineStage& stage)
{
    if (!inIngestion()) {
        return;
    }
    if (stage.kind() == PipelineStage::Kind::Exists || stage.kind() == PipelineStage::Kind::NotExists) {
        transitionTo(TaskState::waiting(TaskState::WaitingKind::Check,
                                        PipelineStage::displayLabel(stage, 0.0)));
    }
}

void TaskStateMachine::onDownloadStarted()
{
    if (inIngestion()) {
        transitionTo(TaskState::waiting(TaskState::WaitingKind::Download));
    }
}

void TaskStateMachine::onDownloadProgress(double progress)
{
    if (inIngestion()) {
        transitionTo(TaskState::downloading(progress));
    }
}

void TaskStateMachine::onUploadStarted()
{
    if (inIngestion()) {
        transitionTo(TaskState::waiting(TaskState::WaitingKind::Upload));
    }
}

void TaskStateMachine::onUploadProgress(double progress)
{
    if (inIngestion()) {
        transitionTo(TaskState::uploading(progress));
    }
}

void TaskStateMachine::onIngestionSubmitted()
{
    if (inIngestion()) {
        transitionTo(TaskState::waiting(TaskState::WaitingKind::Transcode));
    }
}

void TaskStateMachine::onIngestionObservation(const PipelineObservation& observation)
{
    if (!inIngestion()) {
        return;
    }

    using Kind = PipelineStage::Kind;
    const QString label = PipelineStage::displayLabel(observation.stage, observation.progress);

    switch (observation.stage.kind()) {
    case Kind::Done:
    case Kind::Failed:
    case Kind::Unknown:
        // Terminal stages arrive through onIngestionFinished / onFailed
        return;
    case Kind::Queued:
        transitionTo(TaskState::waiting(TaskState::WaitingKind::Server, label));
        return;
    case Kind::Merging:
    case Kind::Merged:
        transitionTo(TaskState::waiting(TaskState::WaitingKind::Transcode, label));
        return;
    case Kind::Transcoding:
        transitionTo(TaskState::transcoding(observation.progress));
        return;
    default:
        transitionTo(TaskState::waiting(TaskState::WaitingKind::Server, label));
        return;
    }
}

void TaskStateMachine::onIngestionFinished(const QString& resultRef)
{
    if (!inIngestion()) {
        return;
    }
    m_resultRef = resultRef;
    setCheckpoint(Checkpoint::IngestionDone);
    transitionTo(TaskState::finished(resultRef));
}

bool TaskStateMachine::onDeepProcessStarted()
{
    if (!canStartDeepProcess()) {
        qWarning() << "TaskStateMachine: Deep processing cannot start from" << m_state.describe()
                   << "checkpoint" << m_checkpoint;
        return false;
    }
    setCheckpoint(Checkpoint::DeepProcessRunning);
    transitionTo(TaskState::waiting(TaskState::WaitingKind::Server, tr("Starting deep processing...")));
    return true;
}

void TaskStateMachine::onDeepProcessObservation(const PipelineObservation& observation)
{
    if (!inDeepProcess()) {
        return;
    }

    if (observation.stage.isTerminal()) {
        return;
    }
    if (observation.stage.kind() == PipelineStage::Kind::Poll) {
        transitionTo(TaskState::transcoding(observation.progress));
        return;
    }
    transitionTo(TaskState::waiting(TaskState::WaitingKind::Server,
                                    PipelineStage::displayLabel(observation.stage, observation.progress)));
}

void TaskStateMachine::onDeepProcessFinished()
{
    if (!inDeepProcess()) {
        return;
    }
    setCheckpoint(Checkpoint::DeepProcessDone);
    transitionTo(TaskState::finished(m_resultRef));
}

void TaskStateMachine::onFailed(TaskState::ErrorKind kind, const QString& message)
{
    if (!isBusy()) {
        qWarning() << "TaskStateMachine: Ignoring failure outside a running pipeline:" << message;
        return;
    }
    transitionTo(TaskState::error(kind, message));
}

void TaskStateMachine::onCancelled(const QString& message)
{
    if (!isBusy()) {
        return;
    }
    transitionTo(TaskState::error(TaskState::ErrorKind::Cancelled,
                                  message.isEmpty() ? tr("Cancelled") : message));
}

bool TaskStateMachine::inIngestion() const
{
    return m_checkpoint == Checkpoint::None && !isTerminal();
}

bool TaskStateMachine::inDeepProcess() const
{
    return m_checkpoint == Checkpoint::DeepProcessRunning && !isTerminal();
}

bool TaskStateMachine::transitionTo(const TaskState& next)
{
    if (isTerminal()) {
        qWarning() << "TaskStateMachine: Rejecting transition out of error state to"
                   << next.describe();
        return false;
    }
    if (next == m_state) {
        return true;
    }
    m_state = next;
    emit stateChanged(m_state);
    return true;
}

void TaskStateMachine::setCheckpoint(Checkpoint checkpoint)
{
    if (m_checkpoint == checkpoint) {
        return;
    }
    m_checkpoint = checkpoint;
    emit checkpointChanged(m_checkpoint);
}
