#include "cli/commands/ConfigCommand.h"

#include "settings/IngestionSettingsManager.h"

#include <QTextStream>
#include <QUrl>

namespace IngestKit {
namespace CLI {

namespace {

// Accepts "concurrency" as well as "ingestion/concurrency"
QString resolveKey(const QString& key)
{
    const QStringList keys = IngestionSettingsManager::keys();
    if (keys.contains(key)) {
        return key;
    }
    const QString qualified = QStringLiteral("ingestion/") + key;
    return keys.contains(qualified) ? qualified : QString();
}

QString effectiveValue(const QString& key)
{
    const auto& manager = IngestionSettingsManager::instance();
    if (key == IngestionSettingsManager::kSettingsKeyEndpoint) {
        return manager.endpoint().toString();
    }
    if (key == IngestionSettingsManager::kSettingsKeyApiPrefix) {
        return manager.apiPrefix();
    }
    if (key == IngestionSettingsManager::kSettingsKeyDeepProcessPath) {
        return manager.deepProcessPath();
    }
    if (key == IngestionSettingsManager::kSettingsKeyPartSizeBytes) {
        return QString::number(manager.partSizeBytes());
    }
    if (key == IngestionSettingsManager::kSettingsKeyConcurrency) {
        return QString::number(manager.concurrency());
    }
    if (key == IngestionSettingsManager::kSettingsKeyMaxSegmentAttempts) {
        return QString::number(manager.maxSegmentAttempts());
    }
    if (key == IngestionSettingsManager::kSettingsKeySegmentRetryDelayMs) {
        return QString::number(manager.segmentRetryDelayMs());
    }
    if (key == IngestionSettingsManager::kSettingsKeyPollIntervalMs) {
        return QString::number(manager.pollIntervalMs());
    }
    if (key == IngestionSettingsManager::kSettingsKeyResumeReusedSessions) {
        return manager.resumeReusedSessions() ? QStringLiteral("true") : QStringLiteral("false");
    }
    return QString();
}

bool parseBool(const QString& value, bool* ok)
{
    const QString lowered = value.trimmed().toLower();
    *ok = true;
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    *ok = false;
    return false;
}

bool applySetting(const QString& key, const QString& value, QString* errorMessage)
{
    auto& manager = IngestionSettingsManager::instance();
    bool ok = false;

    if (key == IngestionSettingsManager::kSettingsKeyEndpoint) {
        const QUrl url(value.trimmed());
        if (!url.isValid() || url.host().isEmpty()) {
            *errorMessage = QString("Invalid endpoint URL: %1").arg(value);
            return false;
        }
        manager.setEndpoint(url);
        return true;
    }
    if (key == IngestionSettingsManager::kSettingsKeyApiPrefix) {
        manager.setApiPrefix(value);
        return true;
    }
    if (key == IngestionSettingsManager::kSettingsKeyDeepProcessPath) {
        manager.setDeepProcessPath(value);
        return true;
    }
    if (key == IngestionSettingsManager::kSettingsKeyResumeReusedSessions) {
        const bool enabled = parseBool(value, &ok);
        if (!ok) {
            *errorMessage = QString("Expected true or false for %1").arg(key);
            return false;
        }
        manager.setResumeReusedSessions(enabled);
        return true;
    }

    const qint64 number = value.trimmed().toLongLong(&ok);
    if (!ok) {
        *errorMessage = QString("Expected a number for %1: %2").arg(key, value);
        return false;
    }
    if (key == IngestionSettingsManager::kSettingsKeyPartSizeBytes) {
        manager.setPartSizeBytes(number);
    } else if (key == IngestionSettingsManager::kSettingsKeyConcurrency) {
        manager.setConcurrency(static_cast<int>(number));
    } else if (key == IngestionSettingsManager::kSettingsKeyMaxSegmentAttempts) {
        manager.setMaxSegmentAttempts(static_cast<int>(number));
    } else if (key == IngestionSettingsManager::kSettingsKeySegmentRetryDelayMs) {
        manager.setSegmentRetryDelayMs(static_cast<int>(number));
    } else if (key == IngestionSettingsManager::kSettingsKeyPollIntervalMs) {
        manager.setPollIntervalMs(static_cast<int>(number));
    } else {
        *errorMessage = QString("Unknown setting: %1").arg(key);
        return false;
    }
    return true;
}

} // namespace

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Show or manage ingestion settings"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    // --get: Get setting value
    if (parser.isSet("get")) {
        const QString key = resolveKey(parser.value("get"));
        if (key.isEmpty()) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Setting not found: %1").arg(parser.value("get")));
        }
        return CLIResult::success(effectiveValue(key));
    }

    // --set: Set setting value
    if (parser.isSet("set")) {
        const QString key = resolveKey(parser.value("set"));
        if (key.isEmpty()) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Setting not found: %1").arg(parser.value("set")));
        }
        const QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }
        QString errorMessage;
        if (!applySetting(key, positionalArgs.first(), &errorMessage)) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, errorMessage);
        }
        return CLIResult::success(QString("Set %1 = %2").arg(key, effectiveValue(key)));
    }

    // --reset: Reset to defaults
    if (parser.isSet("reset")) {
        IngestionSettingsManager::instance().resetToDefaults();
        return CLIResult::success("Settings reset to defaults");
    }

    // --list, or no option at all
    QString output;
    QTextStream out(&output);
    out << "Current settings:\n";
    for (const QString& key : IngestionSettingsManager::keys()) {
        out << QString("  %1 = %2\n").arg(key, effectiveValue(key));
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace IngestKit
