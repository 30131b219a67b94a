#ifndef STAGEPOLLER_H
#define STAGEPOLLER_H

#include "ingest/IIngestionApi.h"

#include <QObject>
#include <QPointer>

#include <functional>

class QTimer;

class CancellationToken;

/**
 * @brief Polls a remote job until it reports a terminal stage.
 *
 * Fetches immediately, then again a fixed interval after each non-terminal
 * response. DONE ends with succeeded(), FAILED and UNKNOWN end with failed();
 * every other tag, known or not, is reported through observed() and polling
 * continues. A failed fetch ends polling; fetches are not retried.
 */
class StagePoller : public QObject
{
    Q_OBJECT

public:
    using FetchFunction = std::function<ApiCall*()>;

    explicit StagePoller(FetchFunction fetch,
                         int intervalMs = IngestionConfig::kDefaultPollIntervalMs,
                         QObject* parent = nullptr);
    ~StagePoller() override;

    void start(CancellationToken* token = nullptr);

    // Stops without emitting anything
    void stop();

    bool isPolling() const { return m_polling; }
    int intervalMs() const { return m_intervalMs; }
    int fetchCount() const { return m_fetchCount; }

    static bool parseObservation(const QJsonObject& body,
                                 PipelineObservation* observation,
                                 QString* errorMessage = nullptr);

signals:
    // Every observation, terminal ones included
    void observed(const PipelineObservation& observation);
    void succeeded(const PipelineObservation& observation);
    void failed(const IngestionError& error);

private slots:
    void poll();
    void onCancelled();

private:
    void onFetchFinished(const ApiResponse& response);
    void finish();

    FetchFunction m_fetch;
    int m_intervalMs;
    QTimer* m_timer = nullptr;
    QPointer<ApiCall> m_call;
    QPointer<CancellationToken> m_token;
    bool m_polling = false;
    int m_fetchCount = 0;
};

#endif // STAGEPOLLER_H
