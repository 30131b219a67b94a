#include "MockPayloadSource.h"

#include <QTimer>

MockPayloadSource::MockPayloadSource(const QByteArray& payload, QObject* parent)
    : IPayloadSource(parent)
    , m_payload(payload)
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    m_timer->setInterval(1);
    connect(m_timer, &QTimer::timeout, this, &MockPayloadSource::step);
}

void MockPayloadSource::fetch()
{
    m_fetchCalls++;
    m_fetching = true;
    m_step = 0;
    if (m_autoDeliver) {
        m_timer->start();
    }
}

void MockPayloadSource::abort()
{
    m_abortCalls++;
    m_fetching = false;
    m_timer->stop();
}

void MockPayloadSource::simulateProgress(double fraction)
{
    if (m_fetching) {
        emit progress(fraction);
    }
}

void MockPayloadSource::simulateReady()
{
    if (!m_fetching) {
        return;
    }
    m_fetching = false;
    emit progress(1.0);
    emit ready(m_payload);
}

void MockPayloadSource::simulateFailure(const QString& message)
{
    if (!m_fetching) {
        return;
    }
    m_fetching = false;
    emit failed(message);
}

void MockPayloadSource::step()
{
    if (!m_fetching) {
        return;
    }
    if (!m_failureMessage.isEmpty()) {
        simulateFailure(m_failureMessage);
        return;
    }
    if (m_step++ == 0) {
        simulateProgress(0.5);
        m_timer->start();
        return;
    }
    simulateReady();
}
