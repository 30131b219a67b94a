#ifndef INGESTIONSETTINGSMANAGER_H
#define INGESTIONSETTINGSMANAGER_H

#include "ingest/IngestionTypes.h"

#include <QString>
#include <QStringList>
#include <QUrl>

/**
 * @brief Singleton class for managing ingestion settings.
 *
 * Provides centralized access to the service endpoint and the transfer and
 * polling tunables. config() collects them into the IngestionConfig value
 * that the engine components take.
 */
class IngestionSettingsManager
{
public:
    static IngestionSettingsManager& instance();

    // Service location
    QUrl endpoint() const;
    void setEndpoint(const QUrl& endpoint);

    QString apiPrefix() const;
    void setApiPrefix(const QString& prefix);

    QString deepProcessPath() const;
    void setDeepProcessPath(const QString& path);

    // Segment upload
    qint64 partSizeBytes() const;
    void setPartSizeBytes(qint64 bytes);

    int concurrency() const;
    void setConcurrency(int concurrency);

    int maxSegmentAttempts() const;
    void setMaxSegmentAttempts(int attempts);

    int segmentRetryDelayMs() const;
    void setSegmentRetryDelayMs(int delayMs);

    // Status polling interval for both remote pipelines
    int pollIntervalMs() const;
    void setPollIntervalMs(int intervalMs);

    // Query already-received segments before reusing a session
    bool resumeReusedSessions() const;
    void setResumeReusedSessions(bool enabled);

    IngestionConfig config() const;

    void resetToDefaults();

    // Keys owned by this manager, for the config command
    static QStringList keys();

    static constexpr qint64 kMinPartSizeBytes = 64 * 1024;
    static constexpr qint64 kMaxPartSizeBytes = 512 * 1024 * 1024;
    static constexpr int kMinConcurrency = 1;
    static constexpr int kMaxConcurrency = 16;
    static constexpr int kMinSegmentAttempts = 1;
    static constexpr int kMaxSegmentAttempts = 10;
    static constexpr int kMaxDelayMs = 60 * 1000;
    static constexpr int kMinPollIntervalMs = 50;

    static constexpr const char* kSettingsKeyEndpoint = "ingestion/endpoint";
    static constexpr const char* kSettingsKeyApiPrefix = "ingestion/apiPrefix";
    static constexpr const char* kSettingsKeyDeepProcessPath = "ingestion/deepProcessPath";
    static constexpr const char* kSettingsKeyPartSizeBytes = "ingestion/partSizeBytes";
    static constexpr const char* kSettingsKeyConcurrency = "ingestion/concurrency";
    static constexpr const char* kSettingsKeyMaxSegmentAttempts = "ingestion/maxSegmentAttempts";
    static constexpr const char* kSettingsKeySegmentRetryDelayMs = "ingestion/segmentRetryDelayMs";
    static constexpr const char* kSettingsKeyPollIntervalMs = "ingestion/pollIntervalMs";
    static constexpr const char* kSettingsKeyResumeReusedSessions = "ingestion/resumeReusedSessions";

private:
    IngestionSettingsManager() = default;
    IngestionSettingsManager(const IngestionSettingsManager&) = delete;
    IngestionSettingsManager& operator=(const IngestionSettingsManager&) = delete;
};

#endif // INGESTIONSETTINGSMANAGER_H
