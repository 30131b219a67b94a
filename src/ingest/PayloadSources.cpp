#include "ingest/PayloadSources.h"

#include <QDebug>
#include <QFileInfo>
#include <QTimer>
#include <QUrl>

#include <limits>

// ============================================================================
// BufferPayloadSource
// ============================================================================

BufferPayloadSource::BufferPayloadSource(const QByteArray& payload,
                                         const QString& reference,
                                         QObject* parent)
    : IPayloadSource(parent)
    , m_payload(payload)
    , m_reference(reference)
{
}

void BufferPayloadSource::fetch()
{
    if (m_fetching) {
        return;
    }
    m_fetching = true;
    const int generation = ++m_generation;
    QTimer::singleShot(0, this, [this, generation]() {
        if (generation == m_generation && m_fetching) {
            deliver();
        }
    });
}

void BufferPayloadSource::abort()
{
    m_fetching = false;
    ++m_generation;
}

void BufferPayloadSource::deliver()
{
    m_fetching = false;
    emit progress(1.0);
    emit ready(m_payload);
}

// ============================================================================
// FilePayloadSource
// ============================================================================

FilePayloadSource::FilePayloadSource(const QString& filePath, qint64 chunkSize, QObject* parent)
    : IPayloadSource(parent)
    , m_filePath(filePath)
    , m_chunkSize(chunkSize > 0 ? chunkSize : kDefaultChunkSize)
    , m_timer(new QTimer(this))
{
    m_timer->setSingleShot(true);
    m_timer->setInterval(0);
    connect(m_timer, &QTimer::timeout, this, &FilePayloadSource::readNextChunk);
}

FilePayloadSource::~FilePayloadSource() = default;

QString FilePayloadSource::localReference() const
{
    return QUrl::fromLocalFile(QFileInfo(m_filePath).absoluteFilePath()).toString();
}

void FilePayloadSource::fetch()
{
    if (m_file) {
        return;
    }

    auto file = std::make_unique<QFile>(m_filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        const QString message = tr("Cannot open %1: %2").arg(m_filePath, file->errorString());
        qWarning() << "FilePayloadSource:" << message;
        // Keep the failure asynchronous like every other outcome
        const int generation = ++m_generation;
        QTimer::singleShot(0, this, [this, generation, message]() {
            if (generation == m_generation) {
                emit failed(message);
            }
        });
        return;
    }

    m_totalSize = file->size();
    m_buffer.clear();
    m_buffer.reserve(static_cast<int>(qMin<qint64>(m_totalSize, std::numeric_limits<int>::max())));
    m_file = std::move(file);
    qDebug() << "FilePayloadSource: Reading" << m_filePath << "size:" << m_totalSize;
    m_timer->start();
}

void FilePayloadSource::abort()
{
    ++m_generation;
    m_timer->stop();
    if (m_file) {
        m_file->close();
        m_file.reset();
    }
    m_buffer.clear();
}

void FilePayloadSource::readNextChunk()
{
    if (!m_file) {
        return;
    }

    const QByteArray chunk = m_file->read(m_chunkSize);
    if (chunk.isEmpty() && !m_file->atEnd()) {
        const QString message = tr("Read error on %1: %2").arg(m_filePath, m_file->errorString());
        abort();
        qWarning() << "FilePayloadSource:" << message;
        emit failed(message);
        return;
    }

    m_buffer.append(chunk);
    if (m_totalSize > 0) {
        emit progress(static_cast<double>(m_buffer.size()) / static_cast<double>(m_totalSize));
    }

    if (m_file->atEnd()) {
        finish();
        return;
    }
    m_timer->start();
}

void FilePayloadSource::finish()
{
    m_file->close();
    m_file.reset();

    QByteArray payload;
    payload.swap(m_buffer);
    if (m_totalSize == 0) {
        emit progress(1.0);
    }
    emit ready(payload);
}
