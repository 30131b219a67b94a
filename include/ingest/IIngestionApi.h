#ifndef IINGESTIONAPI_H
#define IINGESTIONAPI_H

#include "ingest/IngestionTypes.h"

#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>

struct ApiResponse {
    int httpStatus = 0;
    QJsonObject body;
    IngestionError error;

    bool isSuccess() const { return !error.isError(); }

    static ApiResponse success(const QJsonObject& body = QJsonObject(), int httpStatus = 200)
    {
        return {httpStatus, body, IngestionError()};
    }
    static ApiResponse failure(const IngestionError& error)
    {
        return {error.httpStatus, QJsonObject(), error};
    }
};

/**
 * @brief One outstanding request against the ingestion service.
 *
 * The call deletes itself after finished() is delivered or after abort().
 * Once abort() has been called finished() is never emitted; hold calls in a
 * QPointer.
 */
class ApiCall : public QObject
{
    Q_OBJECT

public:
    explicit ApiCall(QObject* parent = nullptr) : QObject(parent) {}
    ~ApiCall() override = default;

    virtual void abort() = 0;

signals:
    void finished(const ApiResponse& response);
};

/**
 * @brief Abstract interface for the remote ingestion service
 *
 * Implementations:
 * - HttpIngestionApi: QNetworkAccessManager against the real backend
 * - MockIngestionApi (tests): scripted responses on the event loop
 *
 * Every method starts exactly one request and returns the call that tracks
 * it; ownership stays with the API object.
 */
class IIngestionApi : public QObject
{
    Q_OBJECT

public:
    explicit IIngestionApi(QObject* parent = nullptr) : QObject(parent) {}
    ~IIngestionApi() override = default;

    // POST /ingestions; totalSegments == 0 asks for a dedup check only
    virtual ApiCall* createIngestion(const ContentIdentity& identity,
                                     int totalSegments,
                                     bool autoTranscode) = 0;

    // POST /ingestions/{sessionRef}/segments?i=N
    virtual ApiCall* uploadSegment(const QString& sessionRef, int index, const QByteArray& data) = 0;

    // POST /ingestions/{sessionRef}/complete
    virtual ApiCall* completeIngestion(const QString& sessionRef) = 0;

    // GET /ingestions/{sessionRef}/status
    virtual ApiCall* fetchIngestionStatus(const QString& sessionRef) = 0;

    // GET /ingestions/{sessionRef}/missing
    virtual ApiCall* fetchMissingSegments(const QString& sessionRef) = 0;

    // POST deep processing start for an already ingested object
    virtual ApiCall* startDeepProcess(const QString& contentRef) = 0;

    // GET deep processing status
    virtual ApiCall* fetchDeepProcessStatus(const QString& contentRef) = 0;

    /**
     * @brief Turn a server-relative reference ("/api/download/...") into an
     * absolute URL string. Absolute references are returned unchanged.
     */
    virtual QString resolveReference(const QString& ref) const { return ref; }
};

Q_DECLARE_METATYPE(ApiResponse)

#endif // IINGESTIONAPI_H
