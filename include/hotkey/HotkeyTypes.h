/**
 * @file HotkeyTypes.h
 * @brief Hotkey system type definitions
 *
 * Actions are numbered by category so new ones slot in without renumbering.
 */

#pragma once

#include "settings/Settings.h"

#include <QObject>
#include <QString>

namespace CommandWatch {

/**
 * @brief Hotkey action identifiers.
 *
 * Categories:
 * - Automation: 100-199
 * - Region: 200-299
 */
enum class HotkeyAction {
    None = 0,

    // Automation actions (100-199)
    TogglePause = 100,
    StopAutomation = 101,

    // Region actions (200-299)
    ReselectRegion = 200,
};

enum class HotkeyCategory {
    Automation,
    Region,
};

/**
 * @brief Hotkey registration status.
 */
enum class HotkeyStatus {
    Unset,      ///< No hotkey configured (empty key sequence)
    Registered, ///< Successfully registered with the OS
    Failed,     ///< Not registered: the OS, another app or an earlier action holds it
};

/**
 * @brief Runtime configuration for a single hotkey.
 */
struct HotkeyConfig {
    HotkeyAction action = HotkeyAction::None;
    HotkeyCategory category = HotkeyCategory::Automation;
    QString keySequence;        ///< Current key sequence (e.g. "Ctrl+Alt+P")
    QString displayName;
    QString description;
    QString settingsKey;        ///< QSettings key for persistence
    QString defaultKeySequence; ///< Used when nothing is stored
    HotkeyStatus status = HotkeyStatus::Unset;

    bool isEmpty() const { return keySequence.isEmpty(); }
};

struct HotkeyMetadata {
    HotkeyAction action;
    HotkeyCategory category;
    const char* displayName;
    const char* description;
    const char* settingsKey;
    const char* defaultKeySequence;
};

inline constexpr HotkeyMetadata kDefaultHotkeys[] = {
    {
        HotkeyAction::TogglePause,
        HotkeyCategory::Automation,
        "Pause / Resume",
        "Pause or resume watching the region",
        kSettingsKeyTogglePauseHotkey,
        kDefaultTogglePauseHotkey
    },
    {
        HotkeyAction::StopAutomation,
        HotkeyCategory::Automation,
        "Stop",
        "Stop the current watch run",
        kSettingsKeyStopAutomationHotkey,
        kDefaultStopAutomationHotkey
    },
    {
        HotkeyAction::ReselectRegion,
        HotkeyCategory::Region,
        "Reselect Region",
        "Select a new region to watch",
        kSettingsKeyReselectRegionHotkey,
        kDefaultReselectRegionHotkey
    },
};

inline constexpr size_t kDefaultHotkeyCount = sizeof(kDefaultHotkeys) / sizeof(kDefaultHotkeys[0]);

}  // namespace CommandWatch
