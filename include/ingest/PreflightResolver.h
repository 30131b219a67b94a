#ifndef PREFLIGHTRESOLVER_H
#define PREFLIGHTRESOLVER_H

#include "ingest/IIngestionApi.h"

#include <QObject>
#include <QPointer>

class CancellationToken;

/**
 * @brief Asks the service whether equivalent content already exists.
 *
 * One round trip per resolve(). On success the pseudo-stage EXISTS or
 * NOT_EXISTS is reported through stageObserved() before resolved().
 */
class PreflightResolver : public QObject
{
    Q_OBJECT

public:
    explicit PreflightResolver(IIngestionApi* api, QObject* parent = nullptr);
    ~PreflightResolver() override;

    void resolve(const ContentIdentity& identity, CancellationToken* token = nullptr);
    bool isResolving() const { return m_call != nullptr; }

    /**
     * @brief Parse a POST /ingestions response body.
     *
     * Also used for the init call, which answers with the same shape.
     * References are left as the server sent them.
     */
    static bool parseResponse(const QJsonObject& body,
                              PreflightResult* result,
                              QString* errorMessage = nullptr);

signals:
    void stageObserved(const QString& stage, double progress);
    void resolved(const PreflightResult& result);
    void failed(const IngestionError& error);

private slots:
    void onCancelled();

private:
    void onCallFinished(const ApiResponse& response);
    void finishWithError(const IngestionError& error);

    IIngestionApi* m_api = nullptr;
    QPointer<ApiCall> m_call;
    QPointer<CancellationToken> m_token;
};

#endif // PREFLIGHTRESOLVER_H
