#ifndef IPAYLOADSOURCE_H
#define IPAYLOADSOURCE_H

#include <QByteArray>
#include <QObject>
#include <QString>

/**
 * @brief Abstract producer of the bytes to ingest
 *
 * Implementations:
 * - BufferPayloadSource: bytes already in memory
 * - FilePayloadSource: reads a local file in chunks
 *
 * Capturing a stream into bytes happens outside the engine; this interface
 * is how the result is handed over. fetch() may be called again after a
 * failure.
 */
class IPayloadSource : public QObject
{
    Q_OBJECT

public:
    explicit IPayloadSource(QObject* parent = nullptr) : QObject(parent) {}
    ~IPayloadSource() override = default;

    virtual void fetch() = 0;

    // No signal is emitted after abort()
    virtual void abort() = 0;

    virtual bool isFetching() const = 0;

    // Local reference reported when the task finishes without the server
    virtual QString localReference() const = 0;

signals:
    void progress(double fraction);
    void ready(const QByteArray& payload);
    void failed(const QString& errorMessage);
};

#endif // IPAYLOADSOURCE_H
