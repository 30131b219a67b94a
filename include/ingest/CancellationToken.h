#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <QObject>

/**
 * @brief Cooperative cancellation signal shared by every stage of one task.
 *
 * Components check isCancelled() before starting new work and connect to
 * cancelled() to abort whatever request they have outstanding.
 */
class CancellationToken : public QObject
{
    Q_OBJECT

public:
    explicit CancellationToken(QObject* parent = nullptr);

    bool isCancelled() const { return m_cancelled; }

    // Idempotent; cancelled() is emitted once
    void cancel();

signals:
    void cancelled();

private:
    bool m_cancelled = false;
};

#endif // CANCELLATIONTOKEN_H
