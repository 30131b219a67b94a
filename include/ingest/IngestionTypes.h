#ifndef INGESTIONTYPES_H
#define INGESTIONTYPES_H

#include "ingest/PipelineStage.h"

#include <QJsonObject>
#include <QMetaType>
#include <QSet>
#include <QString>
#include <QUrl>

#include <optional>

/**
 * @brief Fields the server uses to recognize equivalent content.
 *
 * Each task carries its own copy; nothing about an identity is shared
 * between tasks.
 */
struct ContentIdentity {
    QString courseId;
    QString courseName;
    QString courseTitle;
    std::optional<qint64> videoId;
    std::optional<qint64> sessionId;
    QString startedAt;
    QString videoType = QStringLiteral("vga");
    QString source = QStringLiteral("projector");
    QString originalFilename;

    // JSON numbers hold integers exactly only up to 2^53 - 1
    static constexpr qint64 kMaxJsonSafeId = (qint64(1) << 53) - 1;

    bool isValid() const { return validate(nullptr); }
    bool validate(QString* errorMessage) const;
    static bool isJsonSafeId(qint64 id) { return id >= -kMaxJsonSafeId && id <= kMaxJsonSafeId; }

    // Key under which StageRegistry tracks this content
    QString registryKey() const;

    // Request body fields for POST /ingestions
    QJsonObject toJson() const;

    bool operator==(const ContentIdentity& other) const;
    bool operator!=(const ContentIdentity& other) const { return !(*this == other); }
};

/**
 * @brief One user-initiated request to ingest a piece of content.
 */
struct IngestionTask {
    ContentIdentity identity;
    qint64 partSize = 0;       // 0 = configured default
    int concurrency = 0;       // 0 = configured default
    bool autoTranscode = true; // hand the payload to the server pipeline
    bool autoDeepProcess = false;
};

struct IngestionError {
    enum class Kind {
        None,
        TransientNetwork, // no HTTP status at all
        Server,           // non-success status or remote FAILED stage
        Cancelled,
        Protocol          // malformed or incomplete response
    };

    Kind kind = Kind::None;
    QString message;
    int httpStatus = 0;

    bool isError() const { return kind != Kind::None; }
    bool isCancelled() const { return kind == Kind::Cancelled; }

    static IngestionError transient(const QString& message)
    {
        return {Kind::TransientNetwork, message, 0};
    }
    static IngestionError server(const QString& message, int httpStatus = 0)
    {
        return {Kind::Server, message, httpStatus};
    }
    static IngestionError cancelled(const QString& message = QString())
    {
        return {Kind::Cancelled, message.isEmpty() ? QStringLiteral("Cancelled") : message, 0};
    }
    static IngestionError protocol(const QString& message)
    {
        return {Kind::Protocol, message, 0};
    }
};

struct PreflightResult {
    bool exists = false;
    QString identity;            // server-side objectId
    QString downloadRef;         // set when exists
    QString rawRef;              // unprocessed original, when the server kept one
    QString reusableSessionRef;  // optional, only when !exists
};

/**
 * @brief Server-assigned handle for one in-progress transfer.
 */
struct UploadSession {
    QString sessionRef;
    int totalSegments = 0;
    QSet<int> acknowledged;

    bool isValid() const { return !sessionRef.isEmpty(); }
    bool isComplete() const { return totalSegments > 0 && acknowledged.size() == totalSegments; }
};

struct PipelineObservation {
    PipelineStage stage;
    double progress = 0.0; // clamped to [0, 1]
    QString message;
    QString downloadRef;
};

/**
 * @brief Tunables shared by every component of the engine.
 *
 * Defaults match the behaviour the service was designed around; see
 * IngestionSettingsManager for the persisted overrides.
 */
struct IngestionConfig {
    static constexpr const char* kDefaultEndpoint = "http://127.0.0.1:5000";
    static constexpr const char* kDefaultApiPrefix = "/api";
    static constexpr const char* kDefaultDeepProcessPath = "/insights";
    static constexpr qint64 kDefaultPartSize = 8 * 1024 * 1024;
    static constexpr int kDefaultConcurrency = 4;
    static constexpr int kDefaultMaxSegmentAttempts = 3;
    static constexpr int kDefaultSegmentRetryDelayMs = 400;
    static constexpr int kDefaultPollIntervalMs = 1000;

    QUrl endpoint = QUrl(QString::fromLatin1(kDefaultEndpoint));
    QString apiPrefix = QString::fromLatin1(kDefaultApiPrefix);
    QString deepProcessPath = QString::fromLatin1(kDefaultDeepProcessPath);
    qint64 partSize = kDefaultPartSize;
    int concurrency = kDefaultConcurrency;
    int maxSegmentAttempts = kDefaultMaxSegmentAttempts;
    int segmentRetryDelayMs = kDefaultSegmentRetryDelayMs;
    int pollIntervalMs = kDefaultPollIntervalMs;
    bool resumeReusedSessions = false;
};

Q_DECLARE_METATYPE(IngestionError)
Q_DECLARE_METATYPE(PreflightResult)
Q_DECLARE_METATYPE(PipelineObservation)

#endif // INGESTIONTYPES_H
