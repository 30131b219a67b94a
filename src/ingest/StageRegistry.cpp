#include "ingest/StageRegistry.h"

#include "ingest/PipelineStage.h"

#include <QDebug>

StageRegistry::StageRegistry(QObject* parent)
    : QObject(parent)
{
}

bool StageRegistry::update(const QString& key, const QString& stage)
{
    if (key.isEmpty() || stage.isEmpty()) {
        return false;
    }

    const auto it = m_stages.constFind(key);
    if (it != m_stages.constEnd()) {
        if (isStickyStage(it.value())) {
            return false;
        }
        if (it.value() == stage) {
            return false;
        }
    }

    m_stages.insert(key, stage);
    qDebug() << "StageRegistry: Stage updated:" << key << "->" << stage;
    emit stageChanged(key, stage);
    return true;
}

QString StageRegistry::stage(const QString& key) const
{
    return m_stages.value(key);
}

bool StageRegistry::isDone(const QString& key) const
{
    return isStickyStage(m_stages.value(key));
}

void StageRegistry::clear()
{
    m_stages.clear();
}

bool StageRegistry::isStickyStage(const QString& stage)
{
    return !stage.isEmpty() && PipelineStage::fromTag(stage).isDone();
}
