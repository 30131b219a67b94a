#include "ingest/SegmentUploader.h"

#include "ingest/CancellationToken.h"

#include <QDebug>
#include <QTimer>
#include <QtGlobal>

#include <utility>

SegmentUploader::SegmentUploader(IIngestionApi* api, const Options& options, QObject* parent)
    : QObject(parent)
    , m_api(api)
    , m_options(options)
{
    if (m_options.partSize <= 0) {
        m_options.partSize = IngestionConfig::kDefaultPartSize;
    }
    m_options.concurrency = qMax(1, m_options.concurrency);
    m_options.maxAttempts = qMax(1, m_options.maxAttempts);
    m_options.retryDelayMs = qMax(0, m_options.retryDelayMs);
}

SegmentUploader::~SegmentUploader()
{
    abortOutstanding();
}

void SegmentUploader::start(const QString& sessionRef,
                            const QByteArray& payload,
                            CancellationToken* token,
                            const QSet<int>& alreadyAcknowledged)
{
    if (m_running) {
        emit failed(IngestionError::protocol(tr("Upload already in progress")));
        return;
    }
    if (sessionRef.isEmpty()) {
        emit failed(IngestionError::protocol(tr("Upload session reference is empty")));
        return;
    }
    if (payload.isEmpty()) {
        emit failed(IngestionError::protocol(tr("Payload is empty")));
        return;
    }

    detachToken();
    if (token && token->isCancelled()) {
        emit failed(IngestionError::cancelled(tr("Upload cancelled")));
        return;
    }

    m_payload = payload;
    m_session = UploadSession();
    m_session.sessionRef = sessionRef;
    m_session.totalSegments = segmentCount(payload.size(), m_options.partSize);
    m_pending.clear();

    for (int index = 1; index <= m_session.totalSegments; ++index) {
        if (alreadyAcknowledged.contains(index)) {
            m_session.acknowledged.insert(index);
        } else {
            m_pending.enqueue(index);
        }
    }

    m_running = true;
    m_token = token;
    if (m_token) {
        connect(m_token, &CancellationToken::cancelled, this, &SegmentUploader::onCancelled);
    }

    qDebug() << "SegmentUploader: Uploading" << payload.size() << "bytes as"
             << m_session.totalSegments << "segments of" << m_options.partSize
             << "bytes, concurrency" << m_options.concurrency
             << "(" << m_session.acknowledged.size() << "already on server)";

    if (!m_session.acknowledged.isEmpty()) {
        emit progressChanged(progress());
        if (!m_running) {
            return;
        }
    }

    if (m_pending.isEmpty()) {
        m_running = false;
        detachToken();
        m_payload.clear();
        emit finished();
        return;
    }

    pump();
}

int SegmentUploader::segmentCount(qint64 payloadSize, qint64 partSize)
{
    if (payloadSize <= 0 || partSize <= 0) {
        return 0;
    }
    return static_cast<int>((payloadSize + partSize - 1) / partSize);
}

QPair<qint64, qint64> SegmentUploader::segmentRange(int index, qint64 partSize, qint64 payloadSize)
{
    const qint64 begin = static_cast<qint64>(index - 1) * partSize;
    const qint64 end = qMin(static_cast<qint64>(index) * partSize, payloadSize);
    return qMakePair(begin, end);
}

void SegmentUploader::onCancelled()
{
    if (!m_running) {
        return;
    }
    qDebug() << "SegmentUploader: Cancelled with" << acknowledgedCount() << "of"
             << totalSegments() << "segments acknowledged";
    fail(IngestionError::cancelled(tr("Upload cancelled")));
}

void SegmentUploader::pump()
{
    while (m_running && busyWorkers() < m_options.concurrency && !m_pending.isEmpty()) {
        if (m_token && m_token->isCancelled()) {
            return;
        }
        launch(m_pending.dequeue(), 1);
    }
}

void SegmentUploader::launch(int index, int attempt)
{
    const QPair<qint64, qint64> range = segmentRange(index, m_options.partSize, m_payload.size());
    const QByteArray chunk = m_payload.mid(range.first, range.second - range.first);

    ApiCall* call = m_api->uploadSegment(m_session.sessionRef, index, chunk);
    m_inFlight.insert(index, call);
    connect(call, &ApiCall::finished, this, [this, index, attempt](const ApiResponse& response) {
        onSegmentFinished(index, attempt, response);
    });
}

void SegmentUploader::onSegmentFinished(int index, int attempt, const ApiResponse& response)
{
    m_inFlight.remove(index);
    if (!m_running) {
        return;
    }

    if (response.isSuccess()) {
        m_session.acknowledged.insert(index);
        emit segmentAcknowledged(index);
        emit progressChanged(progress());
        if (!m_running) {
            return;
        }

        if (m_session.isComplete()) {
            m_running = false;
            detachToken();
            m_payload.clear();
            qDebug() << "SegmentUploader: All" << m_session.totalSegments << "segments acknowledged";
            emit finished();
            return;
        }
        pump();
        return;
    }

    if (response.error.isCancelled()) {
        fail(response.error);
        return;
    }

    if (attempt < m_options.maxAttempts) {
        qWarning() << "SegmentUploader: Segment" << index << "attempt" << attempt << "of"
                   << m_options.maxAttempts << "failed:" << response.error.message;
        scheduleRetry(index, attempt);
        return;
    }

    qWarning() << "SegmentUploader: Segment" << index << "failed after" << attempt << "attempts";
    fail(response.error);
}

void SegmentUploader::scheduleRetry(int index, int attempt)
{
    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    m_retryTimers.insert(index, timer);

    connect(timer, &QTimer::timeout, this, [this, index, attempt, timer]() {
        m_retryTimers.remove(index);
        timer->deleteLater();
        if (!m_running || (m_token && m_token->isCancelled())) {
            return;
        }
        launch(index, attempt + 1);
    });
    timer->start(m_options.retryDelayMs);
}

void SegmentUploader::fail(const IngestionError& error)
{
    if (!m_running) {
        return;
    }
    m_running = false;

    abortOutstanding();
    m_pending.clear();
    detachToken();
    m_payload.clear();

    if (!error.isCancelled()) {
        qWarning() << "SegmentUploader: Upload failed:" << error.message;
    }
    emit failed(error);
}

void SegmentUploader::abortOutstanding()
{
    const QHash<int, QPointer<ApiCall>> inFlight = m_inFlight;
    m_inFlight.clear();
    for (const QPointer<ApiCall>& call : inFlight) {
        if (call) {
            call->disconnect(this);
            call->abort();
        }
    }

    for (QTimer* timer : std::as_const(m_retryTimers)) {
        timer->stop();
        timer->deleteLater();
    }
    m_retryTimers.clear();
}

void SegmentUploader::detachToken()
{
    if (m_token) {
        m_token->disconnect(this);
    }
    m_token = nullptr;
}

double SegmentUploader::progress() const
{
    if (m_session.totalSegments <= 0) {
        return 0.0;
    }
    return static_cast<double>(m_session.acknowledged.size())
        / static_cast<double>(m_session.totalSegments);
}
