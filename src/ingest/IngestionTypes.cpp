#include "ingest/IngestionTypes.h"

QString ContentIdentity::registryKey() const
{
    return courseId + QLatin1Char('/') + courseTitle;
}

bool ContentIdentity::validate(QString* errorMessage) const
{
    QString error;
    if (courseId.isEmpty() || courseTitle.isEmpty()) {
        error = QStringLiteral("A course id and title are required");
    } else if (videoId && !isJsonSafeId(*videoId)) {
        error = QStringLiteral("Video id %1 is out of range").arg(*videoId);
    } else if (sessionId && !isJsonSafeId(*sessionId)) {
        error = QStringLiteral("Session id %1 is out of range").arg(*sessionId);
    }

    if (errorMessage) {
        *errorMessage = error;
    }
    return error.isEmpty();
}

QJsonObject ContentIdentity::toJson() const
{
    QJsonObject json;
    json["courseId"] = courseId;
    json["courseName"] = courseName;
    json["courseTitle"] = courseTitle;
    json["videoType"] = videoType;
    json["source"] = source;

    if (videoId) {
        json["videoId"] = static_cast<double>(*videoId);
    }
    if (sessionId) {
        json["sessionId"] = static_cast<double>(*sessionId);
    }
    if (!startedAt.isEmpty()) {
        json["startedAt"] = startedAt;
    }

    // Server derives "<title>.ts" when absent
    if (!originalFilename.isEmpty()) {
        json["originalFilename"] = originalFilename;
    }
    return json;
}

bool ContentIdentity::operator==(const ContentIdentity& other) const
{
    return courseId == other.courseId
        && courseName == other.courseName
        && courseTitle == other.courseTitle
        && videoId == other.videoId
        && sessionId == other.sessionId
        && startedAt == other.startedAt
        && videoType == other.videoType
        && source == other.source
        && originalFilename == other.originalFilename;
}
