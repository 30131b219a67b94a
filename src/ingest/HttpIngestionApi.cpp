#include "ingest/HttpIngestionApi.h"

#include <QDebug>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QRegularExpression>

namespace {

QString fallbackStatusMessage(int statusCode)
{
    switch (statusCode) {
    case 400:
        return QObject::tr("Invalid ingestion request");
    case 404:
        return QObject::tr("Upload session not found");
    case 413:
        return QObject::tr("Segment too large");
    case 500:
        return QObject::tr("Server error while processing request");
    case 503:
        return QObject::tr("Ingestion service unavailable, please retry");
    default:
        if (statusCode > 0) {
            return QObject::tr("Request failed (HTTP %1)").arg(statusCode);
        }
        return QObject::tr("Request failed");
    }
}

QString encodePathSegment(const QString& segment)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(segment));
}

} // namespace

// ============================================================================
// NetworkApiCall
// ============================================================================

NetworkApiCall::NetworkApiCall(QNetworkReply* reply, QObject* parent)
    : ApiCall(parent)
    , m_reply(reply)
{
    connect(m_reply, &QNetworkReply::finished, this, &NetworkApiCall::onReplyFinished);
}

NetworkApiCall::~NetworkApiCall()
{
    if (m_reply && m_reply->isRunning()) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
    }
}

void NetworkApiCall::abort()
{
    if (m_aborted) {
        return;
    }
    m_aborted = true;

    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
        m_reply = nullptr;
    }
    deleteLater();
}

void NetworkApiCall::onReplyFinished()
{
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    if (!reply || m_aborted) {
        return;
    }
    reply->deleteLater();

    const int statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();
    const ApiResponse response =
        HttpIngestionApi::interpretReply(statusCode, reply->error(), reply->errorString(), body);

    if (!response.isSuccess()) {
        qWarning() << "HttpIngestionApi:" << reply->url().toString()
                   << "failed:" << response.error.message;
    }

    emit finished(response);
    deleteLater();
}

// ============================================================================
// HttpIngestionApi
// ============================================================================

HttpIngestionApi::HttpIngestionApi(const IngestionConfig& config, QObject* parent)
    : IIngestionApi(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_config(config)
{
}

HttpIngestionApi::~HttpIngestionApi() = default;

ApiCall* HttpIngestionApi::createIngestion(const ContentIdentity& identity,
                                           int totalSegments,
                                           bool autoTranscode)
{
    QJsonObject body = identity.toJson();
    body["total"] = totalSegments;
    body["autoTranscode"] = autoTranscode;
    if (totalSegments == 0) {
        // Backends that ignore this still answer the dedup part
        body["mode"] = QStringLiteral("preflight");
    }

    return send(Method::Post,
                endpointUrl(m_config.apiPrefix + QStringLiteral("/ingestions")),
                QJsonDocument(body).toJson(QJsonDocument::Compact),
                "application/json");
}

ApiCall* HttpIngestionApi::uploadSegment(const QString& sessionRef, int index, const QByteArray& data)
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("i"), QString::number(index));
    return send(Method::Post,
                endpointUrl(ingestionPath(sessionRef, QStringLiteral("segments")), query),
                data,
                "application/octet-stream");
}

ApiCall* HttpIngestionApi::completeIngestion(const QString& sessionRef)
{
    return send(Method::Post, endpointUrl(ingestionPath(sessionRef, QStringLiteral("complete"))));
}

ApiCall* HttpIngestionApi::fetchIngestionStatus(const QString& sessionRef)
{
    return send(Method::Get, endpointUrl(ingestionPath(sessionRef, QStringLiteral("status"))));
}

ApiCall* HttpIngestionApi::fetchMissingSegments(const QString& sessionRef)
{
    return send(Method::Get, endpointUrl(ingestionPath(sessionRef, QStringLiteral("missing"))));
}

ApiCall* HttpIngestionApi::startDeepProcess(const QString& contentRef)
{
    QJsonObject body;
    body["objectId"] = contentRef;
    return send(Method::Post,
                endpointUrl(m_config.apiPrefix + m_config.deepProcessPath),
                QJsonDocument(body).toJson(QJsonDocument::Compact),
                "application/json");
}

ApiCall* HttpIngestionApi::fetchDeepProcessStatus(const QString& contentRef)
{
    return send(Method::Get, endpointUrl(deepProcessPath(contentRef, QStringLiteral("status"))));
}

QString HttpIngestionApi::resolveReference(const QString& ref) const
{
    if (ref.isEmpty()) {
        return ref;
    }

    static const QRegularExpression absolutePattern(
        QStringLiteral("^https?://"), QRegularExpression::CaseInsensitiveOption);
    if (absolutePattern.match(ref).hasMatch()) {
        return ref;
    }
    return joinUrl(m_config.endpoint.toString(QUrl::StripTrailingSlash), ref);
}

QUrl HttpIngestionApi::endpointUrl(const QString& path, const QUrlQuery& query) const
{
    QUrl url(joinUrl(m_config.endpoint.toString(QUrl::StripTrailingSlash), path));
    if (!query.isEmpty()) {
        url.setQuery(query);
    }
    return url;
}

QString HttpIngestionApi::joinUrl(const QString& base, const QString& path)
{
    QString trimmedBase = base;
    while (trimmedBase.endsWith(QLatin1Char('/'))) {
        trimmedBase.chop(1);
    }
    if (path.isEmpty()) {
        return trimmedBase;
    }
    if (path.startsWith(QLatin1Char('/'))) {
        return trimmedBase + path;
    }
    return trimmedBase + QLatin1Char('/') + path;
}

ApiResponse HttpIngestionApi::interpretReply(int statusCode,
                                             QNetworkReply::NetworkError networkError,
                                             const QString& errorString,
                                             const QByteArray& body)
{
    if (statusCode <= 0) {
        if (networkError != QNetworkReply::NoError) {
            return ApiResponse::failure(IngestionError::transient(
                errorString.isEmpty() ? QObject::tr("Network error") : errorString));
        }
        return ApiResponse::failure(
            IngestionError::protocol(QObject::tr("Response carried no HTTP status")));
    }

    if (statusCode < 200 || statusCode >= 300) {
        return ApiResponse::failure(
            IngestionError::server(parseErrorMessage(body, statusCode), statusCode));
    }

    if (body.trimmed().isEmpty()) {
        return ApiResponse::success(QJsonObject(), statusCode);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        IngestionError error = IngestionError::protocol(QObject::tr("Invalid response from server"));
        error.httpStatus = statusCode;
        return ApiResponse::failure(error);
    }

    return ApiResponse::success(doc.object(), statusCode);
}

QString HttpIngestionApi::parseErrorMessage(const QByteArray& data, int statusCode)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonObject obj = doc.object();
        const QString error = obj.value("error").toString().trimmed();
        if (!error.isEmpty()) {
            return error;
        }
        const QString message = obj.value("message").toString().trimmed();
        if (!message.isEmpty()) {
            return message;
        }
    }
    return fallbackStatusMessage(statusCode);
}

ApiCall* HttpIngestionApi::send(Method method,
                                const QUrl& url,
                                const QByteArray& body,
                                const QByteArray& contentType)
{
    QNetworkRequest request(url);
    if (!contentType.isEmpty()) {
        request.setHeader(QNetworkRequest::ContentTypeHeader, QString::fromLatin1(contentType));
    }

    QNetworkReply* reply = nullptr;
    if (method == Method::Post) {
        request.setHeader(QNetworkRequest::ContentLengthHeader, body.size());
        reply = m_networkManager->post(request, body);
    } else {
        reply = m_networkManager->get(request);
    }

    return new NetworkApiCall(reply, this);
}

QString HttpIngestionApi::ingestionPath(const QString& sessionRef, const QString& action) const
{
    return m_config.apiPrefix + QStringLiteral("/ingestions/") + encodePathSegment(sessionRef)
        + QLatin1Char('/') + action;
}

QString HttpIngestionApi::deepProcessPath(const QString& contentRef, const QString& action) const
{
    return m_config.apiPrefix + m_config.deepProcessPath + QLatin1Char('/')
        + encodePathSegment(contentRef) + QLatin1Char('/') + action;
}
