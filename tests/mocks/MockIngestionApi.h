#ifndef MOCKINGESTIONAPI_H
#define MOCKINGESTIONAPI_H

#include "ingest/IIngestionApi.h"

#include <QHash>
#include <QJsonObject>
#include <QList>

#include <functional>

class QTimer;

/**
 * @brief Call that answers after a timer on the event loop.
 */
class MockApiCall : public ApiCall
{
    Q_OBJECT

public:
    MockApiCall(const ApiResponse& response, int delayMs, std::function<void(bool aborted)> onEnd,
                QObject* parent = nullptr);
    ~MockApiCall() override = default;

    void abort() override;

private:
    void deliver();

    ApiResponse m_response;
    QTimer* m_timer = nullptr;
    std::function<void(bool)> m_onEnd;
    bool m_ended = false;
};

/**
 * @brief Mock implementation of IIngestionApi for testing
 *
 * Every request is answered asynchronously with the response produced by a
 * per-operation responder. Requests are recorded, and the number of
 * concurrently outstanding segment uploads is tracked.
 */
class MockIngestionApi : public IIngestionApi
{
    Q_OBJECT

public:
    enum class Operation {
        CreateIngestion,
        UploadSegment,
        CompleteIngestion,
        FetchIngestionStatus,
        FetchMissingSegments,
        StartDeepProcess,
        FetchDeepProcessStatus
    };

    struct Request {
        Operation operation = Operation::CreateIngestion;
        QString ref;
        int index = 0;
        int totalSegments = 0;
        bool autoTranscode = true;
        QByteArray data;
        ContentIdentity identity;
        int attempt = 1; // per segment index, for UploadSegment
    };

    using Responder = std::function<ApiResponse(const Request&)>;

    static constexpr const char* kObjectId = "0123456789abcdef";
    static constexpr const char* kUploadId = "upload-1";

    explicit MockIngestionApi(QObject* parent = nullptr);
    ~MockIngestionApi() override = default;

    // IIngestionApi interface implementation
    ApiCall* createIngestion(const ContentIdentity& identity, int totalSegments, bool autoTranscode) override;
    ApiCall* uploadSegment(const QString& sessionRef, int index, const QByteArray& data) override;
    ApiCall* completeIngestion(const QString& sessionRef) override;
    ApiCall* fetchIngestionStatus(const QString& sessionRef) override;
    ApiCall* fetchMissingSegments(const QString& sessionRef) override;
    ApiCall* startDeepProcess(const QString& contentRef) override;
    ApiCall* fetchDeepProcessStatus(const QString& contentRef) override;
    QString resolveReference(const QString& ref) const override;

    // ========== Mock Control Methods ==========

    // An empty responder restores the default behaviour
    void setResponder(Operation operation, Responder responder);

    /**
     * @brief Status bodies returned by successive fetches; the last one repeats
     */
    void setIngestionStatusScript(const QList<QJsonObject>& script);
    void setDeepProcessStatusScript(const QList<QJsonObject>& script);

    void setDefaultDelay(int delayMs) { m_defaultDelayMs = delayMs; }
    void setDelay(Operation operation, int delayMs) { m_delays.insert(static_cast<int>(operation), delayMs); }

    // Preflight answers exists with this download reference
    void setContentExists(const QString& downloadRef);

    // Preflight offers this session for reuse
    void setOfferedSession(const QString& sessionRef);

    static ApiResponse ok(const QJsonObject& body = QJsonObject());
    static ApiResponse serverError(int status, const QString& message);
    static ApiResponse networkError(const QString& message = QStringLiteral("Connection refused"));
    static QJsonObject stage(const QString& tag, double progress = 0.0, const QString& message = QString());

    // ========== Spy Methods ==========

    QList<Request> requests() const { return m_requests; }
    QList<Request> requests(Operation operation) const;
    int callCount(Operation operation) const;
    int segmentAttempts(int index) const { return m_segmentAttempts.value(index); }
    QList<int> uploadedIndices() const;

    int inFlightSegments() const { return m_inFlightSegments; }
    int maxInFlightSegments() const { return m_maxInFlightSegments; }
    int abortedCalls() const { return m_abortedCalls; }
    int outstandingCalls() const { return m_outstandingCalls; }

    void reset();

private:
    ApiCall* respond(const Request& request);
    static ApiResponse defaultResponse(const Request& request,
                                       QList<QJsonObject>* statusScript,
                                       const QString& existsDownloadRef,
                                       const QString& offeredSession);

    // Keyed by Operation
    QHash<int, Responder> m_responders;
    QHash<int, int> m_delays;
    int m_defaultDelayMs = 1;

    QList<QJsonObject> m_ingestionScript;
    QList<QJsonObject> m_deepProcessScript;
    QString m_existsDownloadRef;
    QString m_offeredSession;

    QList<Request> m_requests;
    QHash<int, int> m_segmentAttempts;
    int m_inFlightSegments = 0;
    int m_maxInFlightSegments = 0;
    int m_abortedCalls = 0;
    int m_outstandingCalls = 0;
};

#endif // MOCKINGESTIONAPI_H
