#pragma once

#include <QSettings>
#include <QString>
#include "version.h"

namespace CommandWatch {

inline constexpr const char* kOrganizationName = "CommandWatch";
inline constexpr const char* kApplicationName = COMMANDWATCH_APP_NAME;

// Hotkey settings keys
inline constexpr const char* kSettingsKeyTogglePauseHotkey = "hotkeys/togglePause";
inline constexpr const char* kSettingsKeyReselectRegionHotkey = "hotkeys/reselectRegion";
inline constexpr const char* kSettingsKeyStopAutomationHotkey = "hotkeys/stopAutomation";

// Hotkey default values
inline constexpr const char* kDefaultTogglePauseHotkey = "Ctrl+Alt+P";
inline constexpr const char* kDefaultReselectRegionHotkey = "";  // No default
inline constexpr const char* kDefaultStopAutomationHotkey = "";  // No default

inline bool isDebugSettingsNamespace()
{
    return QString::fromLatin1(COMMANDWATCH_APP_BUNDLE_ID).endsWith(QStringLiteral(".debug"));
}

inline QSettings getSettings()
{
    if (isDebugSettingsNamespace()) {
        return QSettings(kOrganizationName, QStringLiteral("%1-Debug").arg(kApplicationName));
    }
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace CommandWatch
