#pragma once

#include "HotkeyTypes.h"
#include <QMap>
#include <QObject>
#include <optional>

class QHotkey;

namespace CommandWatch {

/**
 * @brief Global shortcuts that steer a watch run while another window
 * has focus.
 *
 * Key sequences live in QSettings in portable text form and are changed
 * with `commandwatch config --set hotkeys/<action>`. Every activation
 * is reported through actionTriggered(); the manager knows nothing about
 * what the actions do.
 */
class HotkeyManager : public QObject
{
    Q_OBJECT

public:
    static HotkeyManager& instance();

    /**
     * @brief Load sequences from settings and register them with the OS.
     *
     * Emits registrationFailed() once with every hotkey that could not be
     * registered, including one whose sequence an earlier action already
     * uses. Calling it again after shutdown() reloads settings.
     */
    void initialize();
    void shutdown();
    bool isInitialized() const { return m_initialized; }

    HotkeyConfig getConfig(HotkeyAction action) const;
    QList<HotkeyConfig> getAllConfigs() const;
    /**
     * @brief The action already bound to @p keySequence, compared in
     * portable form regardless of case and spacing.
     */
    std::optional<HotkeyAction> hasConflict(const QString& keySequence,
                                            std::optional<HotkeyAction> excludeAction = std::nullopt) const;

signals:
    void actionTriggered(CommandWatch::HotkeyAction action);
    void registrationFailed(const QStringList& displayNames);

private:
    HotkeyManager();
    ~HotkeyManager() override;
    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    void loadConfigs();

    // Drops any existing registration and registers config.keySequence.
    HotkeyStatus bind(HotkeyConfig& config);
    void unbind(HotkeyAction action);

    static QString normalizeKeySequence(const QString& keySequence);

    QMap<HotkeyAction, HotkeyConfig> m_configs;
    QMap<HotkeyAction, QHotkey*> m_hotkeys;
    bool m_initialized = false;
};

}  // namespace CommandWatch

Q_DECLARE_METATYPE(CommandWatch::HotkeyAction)
Q_DECLARE_METATYPE(CommandWatch::HotkeyConfig)
Q_DECLARE_METATYPE(CommandWatch::HotkeyStatus)
