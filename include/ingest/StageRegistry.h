#ifndef STAGEREGISTRY_H
#define STAGEREGISTRY_H

#include <QHash>
#include <QObject>
#include <QString>

/**
 * @brief Last known remote stage per content identity.
 *
 * Shared by every task of a process and owned by whoever creates the tasks.
 * Updates are last-write-wins except that DONE is sticky: once an identity
 * is done, later stages reported by overlapping tasks are dropped.
 */
class StageRegistry : public QObject
{
    Q_OBJECT

public:
    explicit StageRegistry(QObject* parent = nullptr);

    /**
     * @brief Record a stage for an identity.
     * @return true if the stored value changed.
     */
    bool update(const QString& key, const QString& stage);

    QString stage(const QString& key) const;
    bool contains(const QString& key) const { return m_stages.contains(key); }
    bool isDone(const QString& key) const;
    int size() const { return m_stages.size(); }
    void clear();

    static bool isStickyStage(const QString& stage);

signals:
    void stageChanged(const QString& key, const QString& stage);

private:
    QHash<QString, QString> m_stages;
};

#endif // STAGEREGISTRY_H
