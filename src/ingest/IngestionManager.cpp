#include "ingest/IngestionManager.h"

#include "ingest/IPayloadSource.h"
#include "ingest/IngestionSessionController.h"
#include "ingest/StageRegistry.h"

#include <QDebug>

#include <utility>

IngestionManager::IngestionManager(IIngestionApi* api,
                                   StageRegistry* registry,
                                   const IngestionConfig& config,
                                   PayloadSourceFactory payloadSourceFactory,
                                   QObject* parent)
    : QObject(parent)
    , m_api(api)
    , m_registry(registry)
    , m_config(config)
    , m_payloadSourceFactory(std::move(payloadSourceFactory))
{
}

IngestionManager::~IngestionManager()
{
    for (IngestionSessionController* controller : std::as_const(m_tasks)) {
        controller->disconnect(this);
        controller->cancel();
    }
}

int IngestionManager::createTask(const IngestionTask& task, QString* errorMessage)
{
    if (errorMessage) {
        errorMessage->clear();
    }

    QString identityError;
    if (!task.identity.validate(&identityError)) {
        if (errorMessage) {
            *errorMessage = identityError;
        }
        return -1;
    }

    const QString key = task.identity.registryKey();
    if (m_registry && m_registry->isDone(key)) {
        qDebug() << "IngestionManager: Refusing task for already processed content" << key;
        if (errorMessage) {
            *errorMessage = tr("Content %1 has already been processed").arg(key);
        }
        return -1;
    }

    IPayloadSource* source = m_payloadSourceFactory ? m_payloadSourceFactory(task) : nullptr;
    if (!source) {
        if (errorMessage) {
            *errorMessage = tr("No payload source available for %1").arg(key);
        }
        return -1;
    }

    const int taskId = m_nextTaskId++;
    auto* controller = new IngestionSessionController(task, m_api, source, m_registry, m_config, this);
    m_tasks.insert(taskId, controller);

    connect(controller, &IngestionSessionController::stateChanged, this,
            [this, taskId](const TaskState& state) { emit taskStateChanged(taskId, state); });

    qDebug() << "IngestionManager: Task" << taskId << "created for" << key;
    emit taskAdded(taskId);

    controller->start();
    return taskId;
}

bool IngestionManager::acknowledgeTask(int taskId)
{
    IngestionSessionController* task = controller(taskId);
    if (!task || !task->state().isFinished() || task->isRunning()) {
        return false;
    }
    removeTask(taskId);
    return true;
}

bool IngestionManager::cancelTask(int taskId)
{
    IngestionSessionController* task = controller(taskId);
    if (!task) {
        return false;
    }
    task->cancel();
    removeTask(taskId);
    return true;
}

bool IngestionManager::deleteTask(int taskId)
{
    IngestionSessionController* task = controller(taskId);
    if (!task || !task->state().isError()) {
        return false;
    }
    removeTask(taskId);
    return true;
}

int IngestionManager::retryTask(int taskId, QString* errorMessage)
{
    IngestionSessionController* task = controller(taskId);
    if (!task || !task->state().isError()) {
        if (errorMessage) {
            *errorMessage = tr("Only failed tasks can be retried");
        }
        return -1;
    }

    const IngestionTask request = task->task();
    removeTask(taskId);
    qDebug() << "IngestionManager: Retrying task" << taskId;
    return createTask(request, errorMessage);
}

bool IngestionManager::startDeepProcessing(int taskId)
{
    IngestionSessionController* task = controller(taskId);
    return task && task->startDeepProcessing();
}

IngestionSessionController* IngestionManager::controller(int taskId) const
{
    return m_tasks.value(taskId, nullptr);
}

void IngestionManager::removeTask(int taskId)
{
    IngestionSessionController* task = m_tasks.take(taskId);
    if (!task) {
        return;
    }
    task->disconnect(this);
    task->deleteLater();
    emit taskRemoved(taskId);
}
