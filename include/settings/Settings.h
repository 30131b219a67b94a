#pragma once

#include <QSettings>
#include <QString>
#include "version.h"

namespace IngestKit {

inline constexpr const char* kOrganizationName = "IngestKit";
inline constexpr const char* kApplicationName = INGESTKIT_APP_NAME;

// Debug builds keep their settings apart from release builds
inline bool isDebugSettingsNamespace()
{
    return QString::fromLatin1(INGESTKIT_APP_BUNDLE_ID).endsWith(QStringLiteral(".debug"));
}

inline QString settingsApplicationName()
{
    if (isDebugSettingsNamespace()) {
        return QString::fromLatin1(kApplicationName) + QStringLiteral("-Debug");
    }
    return QString::fromLatin1(kApplicationName);
}

inline QSettings getSettings()
{
    return QSettings(QString::fromLatin1(kOrganizationName), settingsApplicationName());
}

} // namespace IngestKit
