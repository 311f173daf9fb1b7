#include "hotkey/HotkeyManager.h"
#include "settings/Settings.h"

#include <QDebug>
#include <QHotkey>
#include <QKeySequence>

namespace CommandWatch {

HotkeyManager& HotkeyManager::instance()
{
    static HotkeyManager s_instance;
    return s_instance;
}

HotkeyManager::HotkeyManager()
    : QObject(nullptr)
{
    qRegisterMetaType<HotkeyAction>("CommandWatch::HotkeyAction");
    qRegisterMetaType<HotkeyConfig>("CommandWatch::HotkeyConfig");
    qRegisterMetaType<HotkeyStatus>("CommandWatch::HotkeyStatus");
}

HotkeyManager::~HotkeyManager()
{
    shutdown();
}

void HotkeyManager::initialize()
{
    if (m_initialized) {
        return;
    }

    loadConfigs();

    QStringList failed;
    QList<HotkeyAction> bound;
    for (HotkeyConfig& config : m_configs) {
        // The first action keeps a shared sequence, later ones stay unbound
        const auto conflict = hasConflict(config.keySequence, config.action);
        if (conflict && bound.contains(*conflict)) {
            qWarning() << "HotkeyManager:" << config.keySequence << "for" << config.displayName
                       << "is already used by" << m_configs.value(*conflict).displayName;
            config.status = HotkeyStatus::Failed;
            failed << config.displayName;
            continue;
        }

        if (bind(config) == HotkeyStatus::Failed) {
            failed << config.displayName;
        }
        bound << config.action;
    }
    m_initialized = true;

    if (!failed.isEmpty()) {
        qWarning() << "HotkeyManager: Failed to register" << failed;
        emit registrationFailed(failed);
    }
}

void HotkeyManager::shutdown()
{
    if (!m_initialized) {
        return;
    }

    const QList<HotkeyAction> actions = m_hotkeys.keys();
    for (HotkeyAction action : actions) {
        unbind(action);
    }
    m_initialized = false;
}

HotkeyConfig HotkeyManager::getConfig(HotkeyAction action) const
{
    return m_configs.value(action);
}

QList<HotkeyConfig> HotkeyManager::getAllConfigs() const
{
    return m_configs.values();
}

std::optional<HotkeyAction> HotkeyManager::hasConflict(const QString& keySequence,
                                                       std::optional<HotkeyAction> excludeAction) const
{
    if (keySequence.trimmed().isEmpty()) {
        return std::nullopt;
    }

    const QString wanted = normalizeKeySequence(keySequence);
    for (const HotkeyConfig& config : m_configs) {
        if (excludeAction && config.action == *excludeAction) {
            continue;
        }
        if (!config.isEmpty() && normalizeKeySequence(config.keySequence) == wanted) {
            return config.action;
        }
    }
    return std::nullopt;
}

void HotkeyManager::loadConfigs()
{
    m_configs.clear();
    auto settings = getSettings();

    for (const HotkeyMetadata& meta : kDefaultHotkeys) {
        HotkeyConfig config;
        config.action = meta.action;
        config.category = meta.category;
        config.displayName = QString::fromUtf8(meta.displayName);
        config.description = QString::fromUtf8(meta.description);
        config.settingsKey = QString::fromUtf8(meta.settingsKey);
        config.defaultKeySequence = QString::fromUtf8(meta.defaultKeySequence);
        config.keySequence = settings.value(config.settingsKey, config.defaultKeySequence)
                                 .toString().trimmed();
        m_configs.insert(meta.action, config);
    }
}

HotkeyStatus HotkeyManager::bind(HotkeyConfig& config)
{
    unbind(config.action);

    if (config.isEmpty()) {
        config.status = HotkeyStatus::Unset;
        return config.status;
    }

    const QKeySequence sequence(config.keySequence, QKeySequence::PortableText);
    if (sequence.isEmpty()) {
        qWarning() << "HotkeyManager: Cannot parse" << config.keySequence
                   << "for" << config.displayName;
        config.status = HotkeyStatus::Failed;
        return config.status;
    }

    auto* hotkey = new QHotkey(sequence, true, this);
    const HotkeyAction action = config.action;
    connect(hotkey, &QHotkey::activated, this, [this, action]() {
        emit actionTriggered(action);
    });
    m_hotkeys.insert(action, hotkey);

    if (hotkey->isRegistered()) {
        config.status = HotkeyStatus::Registered;
    } else {
        qWarning() << "HotkeyManager: Registration failed for" << config.displayName
                   << config.keySequence;
        config.status = HotkeyStatus::Failed;
    }
    return config.status;
}

void HotkeyManager::unbind(HotkeyAction action)
{
    if (QHotkey* hotkey = m_hotkeys.take(action)) {
        hotkey->setRegistered(false);
        delete hotkey;
    }
}

QString HotkeyManager::normalizeKeySequence(const QString& keySequence)
{
    const QKeySequence sequence(keySequence.trimmed(), QKeySequence::PortableText);
    if (sequence.isEmpty()) {
        return keySequence.simplified().toLower();
    }
    return sequence.toString(QKeySequence::PortableText).toLower();
}

}  // namespace CommandWatch
