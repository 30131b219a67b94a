#include "settings/IngestionSettingsManager.h"
#include "settings/Settings.h"

#include <QtGlobal>

namespace {

QUrl defaultEndpoint()
{
    return QUrl(QString::fromLatin1(IngestionConfig::kDefaultEndpoint));
}

bool isUsableEndpoint(const QUrl& url)
{
    return url.isValid() && !url.host().isEmpty()
        && (url.scheme() == QLatin1String("http") || url.scheme() == QLatin1String("https"));
}

// "/api", never "api/" or "/api/"
QString normalizePath(QString path, const char* fallback)
{
    path = path.trimmed();
    while (path.endsWith('/')) {
        path.chop(1);
    }
    if (path.isEmpty()) {
        return QString::fromLatin1(fallback);
    }
    if (!path.startsWith('/')) {
        path.prepend('/');
    }
    return path;
}

} // namespace

IngestionSettingsManager& IngestionSettingsManager::instance()
{
    static IngestionSettingsManager instance;
    return instance;
}

QUrl IngestionSettingsManager::endpoint() const
{
    auto settings = IngestKit::getSettings();
    const QUrl url(settings.value(kSettingsKeyEndpoint).toString().trimmed());
    return isUsableEndpoint(url) ? url : defaultEndpoint();
}

void IngestionSettingsManager::setEndpoint(const QUrl& endpoint)
{
    auto settings = IngestKit::getSettings();
    if (isUsableEndpoint(endpoint)) {
        settings.setValue(kSettingsKeyEndpoint, endpoint.toString());
    } else {
        settings.remove(kSettingsKeyEndpoint);
    }
}

QString IngestionSettingsManager::apiPrefix() const
{
    auto settings = IngestKit::getSettings();
    return normalizePath(settings.value(kSettingsKeyApiPrefix).toString(),
                         IngestionConfig::kDefaultApiPrefix);
}

void IngestionSettingsManager::setApiPrefix(const QString& prefix)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeyApiPrefix, normalizePath(prefix, IngestionConfig::kDefaultApiPrefix));
}

QString IngestionSettingsManager::deepProcessPath() const
{
    auto settings = IngestKit::getSettings();
    return normalizePath(settings.value(kSettingsKeyDeepProcessPath).toString(),
                         IngestionConfig::kDefaultDeepProcessPath);
}

void IngestionSettingsManager::setDeepProcessPath(const QString& path)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeyDeepProcessPath,
                      normalizePath(path, IngestionConfig::kDefaultDeepProcessPath));
}

qint64 IngestionSettingsManager::partSizeBytes() const
{
    auto settings = IngestKit::getSettings();
    const qint64 bytes = settings.value(kSettingsKeyPartSizeBytes, IngestionConfig::kDefaultPartSize).toLongLong();
    return qBound(kMinPartSizeBytes, bytes, kMaxPartSizeBytes);
}

void IngestionSettingsManager::setPartSizeBytes(qint64 bytes)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeyPartSizeBytes, qBound(kMinPartSizeBytes, bytes, kMaxPartSizeBytes));
}

int IngestionSettingsManager::concurrency() const
{
    auto settings = IngestKit::getSettings();
    const int value = settings.value(kSettingsKeyConcurrency, IngestionConfig::kDefaultConcurrency).toInt();
    return qBound(kMinConcurrency, value, kMaxConcurrency);
}

void IngestionSettingsManager::setConcurrency(int concurrency)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeyConcurrency, qBound(kMinConcurrency, concurrency, kMaxConcurrency));
}

int IngestionSettingsManager::maxSegmentAttempts() const
{
    auto settings = IngestKit::getSettings();
    const int value = settings.value(kSettingsKeyMaxSegmentAttempts,
                                     IngestionConfig::kDefaultMaxSegmentAttempts).toInt();
    return qBound(kMinSegmentAttempts, value, kMaxSegmentAttempts);
}

void IngestionSettingsManager::setMaxSegmentAttempts(int attempts)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeyMaxSegmentAttempts,
                      qBound(kMinSegmentAttempts, attempts, kMaxSegmentAttempts));
}

int IngestionSettingsManager::segmentRetryDelayMs() const
{
    auto settings = IngestKit::getSettings();
    const int value = settings.value(kSettingsKeySegmentRetryDelayMs,
                                     IngestionConfig::kDefaultSegmentRetryDelayMs).toInt();
    return qBound(0, value, kMaxDelayMs);
}

void IngestionSettingsManager::setSegmentRetryDelayMs(int delayMs)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeySegmentRetryDelayMs, qBound(0, delayMs, kMaxDelayMs));
}

int IngestionSettingsManager::pollIntervalMs() const
{
    auto settings = IngestKit::getSettings();
    const int value = settings.value(kSettingsKeyPollIntervalMs, IngestionConfig::kDefaultPollIntervalMs).toInt();
    return qBound(kMinPollIntervalMs, value, kMaxDelayMs);
}

void IngestionSettingsManager::setPollIntervalMs(int intervalMs)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeyPollIntervalMs, qBound(kMinPollIntervalMs, intervalMs, kMaxDelayMs));
}

bool IngestionSettingsManager::resumeReusedSessions() const
{
    auto settings = IngestKit::getSettings();
    return settings.value(kSettingsKeyResumeReusedSessions, false).toBool();
}

void IngestionSettingsManager::setResumeReusedSessions(bool enabled)
{
    auto settings = IngestKit::getSettings();
    settings.setValue(kSettingsKeyResumeReusedSessions, enabled);
}

IngestionConfig IngestionSettingsManager::config() const
{
    IngestionConfig config;
    config.endpoint = endpoint();
    config.apiPrefix = apiPrefix();
    config.deepProcessPath = deepProcessPath();
    config.partSize = partSizeBytes();
    config.concurrency = concurrency();
    config.maxSegmentAttempts = maxSegmentAttempts();
    config.segmentRetryDelayMs = segmentRetryDelayMs();
    config.pollIntervalMs = pollIntervalMs();
    config.resumeReusedSessions = resumeReusedSessions();
    return config;
}

void IngestionSettingsManager::resetToDefaults()
{
    auto settings = IngestKit::getSettings();
    for (const QString& key : keys()) {
        settings.remove(key);
    }
    settings.sync();
}

QStringList IngestionSettingsManager::keys()
{
    return {
        QString::fromLatin1(kSettingsKeyEndpoint),
        QString::fromLatin1(kSettingsKeyApiPrefix),
        QString::fromLatin1(kSettingsKeyDeepProcessPath),
        QString::fromLatin1(kSettingsKeyPartSizeBytes),
        QString::fromLatin1(kSettingsKeyConcurrency),
        QString::fromLatin1(kSettingsKeyMaxSegmentAttempts),
        QString::fromLatin1(kSettingsKeySegmentRetryDelayMs),
        QString::fromLatin1(kSettingsKeyPollIntervalMs),
        QString::fromLatin1(kSettingsKeyResumeReusedSessions),
    };
}
