#ifndef SEGMENTUPLOADER_H
#define SEGMENTUPLOADER_H

#include "ingest/IIngestionApi.h"

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QPair>
#include <QPointer>
#include <QQueue>

class QTimer;

class CancellationToken;

/**
 * @brief Uploads a payload as fixed-size segments with bounded concurrency.
 *
 * Segments are numbered 1..N. A single FIFO of pending indices feeds at most
 * `concurrency` workers; a worker keeps its slot while it waits to retry.
 * Each segment gets `maxAttempts` tries spaced `retryDelayMs` apart, and one
 * segment running out of attempts fails the whole upload.
 */
class SegmentUploader : public QObject
{
    Q_OBJECT

public:
    struct Options {
        qint64 partSize = IngestionConfig::kDefaultPartSize;
        int concurrency = IngestionConfig::kDefaultConcurrency;
        int maxAttempts = IngestionConfig::kDefaultMaxSegmentAttempts;
        int retryDelayMs = IngestionConfig::kDefaultSegmentRetryDelayMs;
    };

    SegmentUploader(IIngestionApi* api, const Options& options, QObject* parent = nullptr);
    ~SegmentUploader() override;

    /**
     * @brief Begin uploading.
     * @param sessionRef Server session that receives the segments.
     * @param payload Complete payload; must not be empty.
     * @param token Optional cancellation token.
     * @param alreadyAcknowledged Indices the server already holds; they count
     *        toward progress but are not sent again.
     */
    void start(const QString& sessionRef,
               const QByteArray& payload,
               CancellationToken* token = nullptr,
               const QSet<int>& alreadyAcknowledged = QSet<int>());

    bool isRunning() const { return m_running; }
    const Options& options() const { return m_options; }
    const UploadSession& session() const { return m_session; }
    int totalSegments() const { return m_session.totalSegments; }
    int acknowledgedCount() const { return m_session.acknowledged.size(); }
    int inFlightCount() const { return m_inFlight.size(); }

    static int segmentCount(qint64 payloadSize, qint64 partSize);

    // Half-open byte range [first, second) of a 1-based segment index
    static QPair<qint64, qint64> segmentRange(int index, qint64 partSize, qint64 payloadSize);

signals:
    void progressChanged(double progress);
    void segmentAcknowledged(int index);
    void finished();
    void failed(const IngestionError& error);

private slots:
    void onCancelled();

private:
    void pump();
    void launch(int index, int attempt);
    void onSegmentFinished(int index, int attempt, const ApiResponse& response);
    void scheduleRetry(int index, int attempt);
    void fail(const IngestionError& error);
    void abortOutstanding();
    void detachToken();
    int busyWorkers() const { return m_inFlight.size() + m_retryTimers.size(); }
    double progress() const;

    IIngestionApi* m_api = nullptr;
    Options m_options;

    QByteArray m_payload;
    UploadSession m_session;
    QQueue<int> m_pending;
    QHash<int, QPointer<ApiCall>> m_inFlight;
    QHash<int, QTimer*> m_retryTimers;
    QPointer<CancellationToken> m_token;
    bool m_running = false;
};

#endif // SEGMENTUPLOADER_H
