#ifndef PAYLOADSOURCES_H
#define PAYLOADSOURCES_H

#include "ingest/IPayloadSource.h"

#include <QFile>

#include <memory>

class QTimer;

/**
 * @brief Payload that is already in memory.
 *
 * fetch() reports progress 1.0 and the bytes on the next event loop turn.
 */
class BufferPayloadSource : public IPayloadSource
{
    Q_OBJECT

public:
    explicit BufferPayloadSource(const QByteArray& payload,
                                 const QString& reference = QString(),
                                 QObject* parent = nullptr);

    void fetch() override;
    void abort() override;
    bool isFetching() const override { return m_fetching; }
    QString localReference() const override { return m_reference; }

private:
    void deliver();

    QByteArray m_payload;
    QString m_reference;
    bool m_fetching = false;
    int m_generation = 0;
};

/**
 * @brief Reads a local file in fixed-size chunks on the event loop.
 */
class FilePayloadSource : public IPayloadSource
{
    Q_OBJECT

public:
    static constexpr qint64 kDefaultChunkSize = 4 * 1024 * 1024;

    explicit FilePayloadSource(const QString& filePath,
                               qint64 chunkSize = kDefaultChunkSize,
                               QObject* parent = nullptr);
    ~FilePayloadSource() override;

    void fetch() override;
    void abort() override;
    bool isFetching() const override { return m_file != nullptr; }
    QString localReference() const override;

    QString filePath() const { return m_filePath; }

private slots:
    void readNextChunk();

private:
    void finish();

    QString m_filePath;
    qint64 m_chunkSize;
    std::unique_ptr<QFile> m_file;
    QByteArray m_buffer;
    qint64 m_totalSize = 0;
    QTimer* m_timer = nullptr;
    int m_generation = 0;
};

#endif // PAYLOADSOURCES_H
