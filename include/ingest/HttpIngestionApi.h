#ifndef HTTPINGESTIONAPI_H
#define HTTPINGESTIONAPI_H

#include "ingest/IIngestionApi.h"

#include <QNetworkReply>
#include <QPointer>
#include <QUrl>
#include <QUrlQuery>

class QNetworkAccessManager;

/**
 * @brief ApiCall backed by a QNetworkReply.
 */
class NetworkApiCall : public ApiCall
{
    Q_OBJECT

public:
    NetworkApiCall(QNetworkReply* reply, QObject* parent = nullptr);
    ~NetworkApiCall() override;

    void abort() override;

private slots:
    void onReplyFinished();

private:
    QPointer<QNetworkReply> m_reply;
    bool m_aborted = false;
};

class HttpIngestionApi : public IIngestionApi
{
    Q_OBJECT

public:
    explicit HttpIngestionApi(const IngestionConfig& config, QObject* parent = nullptr);
    ~HttpIngestionApi() override;

    ApiCall* createIngestion(const ContentIdentity& identity,
                             int totalSegments,
                             bool autoTranscode) override;
    ApiCall* uploadSegment(const QString& sessionRef, int index, const QByteArray& data) override;
    ApiCall* completeIngestion(const QString& sessionRef) override;
    ApiCall* fetchIngestionStatus(const QString& sessionRef) override;
    ApiCall* fetchMissingSegments(const QString& sessionRef) override;
    ApiCall* startDeepProcess(const QString& contentRef) override;
    ApiCall* fetchDeepProcessStatus(const QString& contentRef) override;

    QString resolveReference(const QString& ref) const override;

    QUrl endpointUrl(const QString& path, const QUrlQuery& query = QUrlQuery()) const;
    const IngestionConfig& config() const { return m_config; }

    static QString joinUrl(const QString& base, const QString& path);

    /**
     * @brief Classify a finished reply into the engine's error taxonomy.
     *
     * - 2xx with a JSON object (or empty) body: success
     * - no HTTP status and a network error: TransientNetwork
     * - non-2xx: Server, with the body's error/message text when present
     * - 2xx with an unparseable body: Protocol
     */
    static ApiResponse interpretReply(int statusCode,
                                      QNetworkReply::NetworkError networkError,
                                      const QString& errorString,
                                      const QByteArray& body);

    static QString parseErrorMessage(const QByteArray& data, int statusCode);

private:
    enum class Method { Get, Post };

    ApiCall* send(Method method,
                  const QUrl& url,
                  const QByteArray& body = QByteArray(),
                  const QByteArray& contentType = QByteArray());
    QString ingestionPath(const QString& sessionRef, const QString& action) const;
    QString deepProcessPath(const QString& contentRef, const QString& action) const;

    QNetworkAccessManager* m_networkManager = nullptr;
    IngestionConfig m_config;
};

#endif // HTTPINGESTIONAPI_H
