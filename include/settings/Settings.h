#pragma once

#include <QDir>
#include <QSettings>
#include "version.h"

namespace PressHold {

inline constexpr const char* kOrganizationName = "PressHold";
inline constexpr const char* kApplicationName = PRESSHOLD_APP_NAME;

inline QString macSettingsPath()
{
    const QString fileName = QString::fromLatin1(PRESSHOLD_APP_BUNDLE_ID) + QStringLiteral(".plist");
    return QDir::homePath() + QStringLiteral("/Library/Preferences/") + fileName;
}

inline QSettings getSettings()
{
#if defined(Q_OS_MACOS)
    return QSettings(macSettingsPath(), QSettings::NativeFormat);
#else
    return QSettings(kOrganizationName, kApplicationName);
#endif
}

} // namespace PressHold
