#ifndef INGESTIONMANAGER_H
#define INGESTIONMANAGER_H

#include "ingest/IngestionTypes.h"
#include "ingest/TaskStateMachine.h"

#include <QList>
#include <QMap>
#include <QObject>

#include <functional>

class IIngestionApi;
class IPayloadSource;
class IngestionSessionController;
class StageRegistry;

/**
 * @brief The set of active ingestion tasks of one process.
 *
 * Each task gets its own IngestionSessionController; the StageRegistry is
 * shared between them. A task leaves the set when the user acknowledges a
 * finished task, cancels it, or deletes it after an error. Retrying a failed
 * task discards it and creates a new one with identical parameters.
 */
class IngestionManager : public QObject
{
    Q_OBJECT

public:
    using PayloadSourceFactory = std::function<IPayloadSource*(const IngestionTask&)>;

    IngestionManager(IIngestionApi* api,
                     StageRegistry* registry,
                     const IngestionConfig& config,
                     PayloadSourceFactory payloadSourceFactory,
                     QObject* parent = nullptr);
    ~IngestionManager() override;

    /**
     * @brief Create and start a task.
     * @return Task id, or -1 if the content is already done or the task is invalid.
     */
    int createTask(const IngestionTask& task, QString* errorMessage = nullptr);

    // Finished tasks only
    bool acknowledgeTask(int taskId);

    // Stops the task if it is still running and removes it
    bool cancelTask(int taskId);

    // Failed tasks only
    bool deleteTask(int taskId);

    /**
     * @brief Replace a failed task with a fresh one for the same request.
     * @return The new task id, or -1.
     */
    int retryTask(int taskId, QString* errorMessage = nullptr);

    bool startDeepProcessing(int taskId);

    IngestionSessionController* controller(int taskId) const;
    QList<int> taskIds() const { return m_tasks.keys(); }
    int taskCount() const { return m_tasks.size(); }
    StageRegistry* registry() const { return m_registry; }

signals:
    void taskAdded(int taskId);
    void taskRemoved(int taskId);
    void taskStateChanged(int taskId, const TaskState& state);

private:
    void removeTask(int taskId);

    IIngestionApi* m_api = nullptr;
    StageRegistry* m_registry = nullptr;
    IngestionConfig m_config;
    PayloadSourceFactory m_payloadSourceFactory;
    QMap<int, IngestionSessionController*> m_tasks;
    int m_nextTaskId = 1;
};

#endif // INGESTIONMANAGER_H
