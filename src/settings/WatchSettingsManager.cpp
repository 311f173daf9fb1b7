#include "settings/WatchSettingsManager.h"
#include "settings/Settings.h"

#include <QDebug>
#include <QtGlobal>

namespace {

int clampPollIntervalMs(int intervalMs)
{
    return qBound(100, intervalMs, 10000);
}

int clampActionDelayMs(int delayMs)
{
    return qBound(0, delayMs, 5000);
}

int clampKeyStepDelayMs(int delayMs)
{
    return qBound(0, delayMs, 1000);
}

int clampCountdownSeconds(int seconds)
{
    return qBound(0, seconds, 10);
}

QStringList normalizePhrases(const QStringList &phrases)
{
    QStringList result;
    for (const QString &phrase : phrases) {
        const QString normalized = phrase.trimmed().toLower();
        if (!normalized.isEmpty() && !result.contains(normalized)) {
            result.append(normalized);
        }
    }
    return result;
}

QString stringOrDefault(const QSettings &settings, const char *key, const char *fallback)
{
    const QString value = settings.value(key).toString();
    return value.isEmpty() ? QString::fromUtf8(fallback) : value;
}

} // namespace

WatchSettingsManager& WatchSettingsManager::instance()
{
    static WatchSettingsManager instance;
    return instance;
}

QStringList WatchSettingsManager::defaultAcceptPhrases()
{
    return {
        QStringLiteral("run command"),
        QStringLiteral("run this command"),
        QStringLiteral("run the command"),
        QStringLiteral("accept"),
        QStringLiteral("accept all"),
        QStringLiteral("command"),
        QString::fromUtf8("command ⌘")
    };
}

QStringList WatchSettingsManager::defaultCompletedPhrases()
{
    return {
        QStringLiteral("completed"),
        QStringLiteral("done"),
        QStringLiteral("success"),
        QStringLiteral("finished")
    };
}

bool WatchSettingsManager::hasRegion() const
{
    const QRect region = loadRegion();
    return region.width() >= kMinRegionSize && region.height() >= kMinRegionSize;
}

QRect WatchSettingsManager::loadRegion() const
{
    auto settings = CommandWatch::getSettings();
    return settings.value(kSettingsKeyRegion, QRect()).toRect();
}

QString WatchSettingsManager::loadRegionScreenName() const
{
    auto settings = CommandWatch::getSettings();
    return settings.value(kSettingsKeyRegionScreen).toString();
}

void WatchSettingsManager::saveRegion(const QRect &region, const QString &screenName)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyRegion, region.normalized());
    settings.setValue(kSettingsKeyRegionScreen, screenName);
    qDebug() << "WatchSettingsManager: Saved region" << region << "on screen" << screenName;
}

void WatchSettingsManager::clearRegion()
{
    auto settings = CommandWatch::getSettings();
    settings.remove(kSettingsKeyRegion);
    settings.remove(kSettingsKeyRegionScreen);
}

int WatchSettingsManager::loadPollIntervalMs() const
{
    auto settings = CommandWatch::getSettings();
    return clampPollIntervalMs(
        settings.value(kSettingsKeyPollIntervalMs, kDefaultPollIntervalMs).toInt());
}

void WatchSettingsManager::savePollIntervalMs(int intervalMs)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyPollIntervalMs, clampPollIntervalMs(intervalMs));
}

int WatchSettingsManager::loadActionDelayMs() const
{
    auto settings = CommandWatch::getSettings();
    return clampActionDelayMs(
        settings.value(kSettingsKeyActionDelayMs, kDefaultActionDelayMs).toInt());
}

void WatchSettingsManager::saveActionDelayMs(int delayMs)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyActionDelayMs, clampActionDelayMs(delayMs));
}

int WatchSettingsManager::loadKeyStepDelayMs() const
{
    auto settings = CommandWatch::getSettings();
    return clampKeyStepDelayMs(
        settings.value(kSettingsKeyKeyStepDelayMs, kDefaultKeyStepDelayMs).toInt());
}

void WatchSettingsManager::saveKeyStepDelayMs(int delayMs)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyKeyStepDelayMs, clampKeyStepDelayMs(delayMs));
}

int WatchSettingsManager::loadCountdownSeconds() const
{
    auto settings = CommandWatch::getSettings();
    return clampCountdownSeconds(
        settings.value(kSettingsKeyCountdownSeconds, kDefaultCountdownSeconds).toInt());
}

void WatchSettingsManager::saveCountdownSeconds(int seconds)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyCountdownSeconds, clampCountdownSeconds(seconds));
}

QStringList WatchSettingsManager::loadAcceptPhrases() const
{
    auto settings = CommandWatch::getSettings();
    const QStringList phrases =
        normalizePhrases(settings.value(kSettingsKeyAcceptPhrases).toStringList());
    return phrases.isEmpty() ? defaultAcceptPhrases() : phrases;
}

void WatchSettingsManager::saveAcceptPhrases(const QStringList &phrases)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyAcceptPhrases, normalizePhrases(phrases));
}

QStringList WatchSettingsManager::loadCompletedPhrases() const
{
    auto settings = CommandWatch::getSettings();
    const QStringList phrases =
        normalizePhrases(settings.value(kSettingsKeyCompletedPhrases).toStringList());
    return phrases.isEmpty() ? defaultCompletedPhrases() : phrases;
}

void WatchSettingsManager::saveCompletedPhrases(const QStringList &phrases)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyCompletedPhrases, normalizePhrases(phrases));
}

QString WatchSettingsManager::loadAcceptChord() const
{
    auto settings = CommandWatch::getSettings();
    return stringOrDefault(settings, kSettingsKeyAcceptChord, kDefaultAcceptChord);
}

void WatchSettingsManager::saveAcceptChord(const QString &chord)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyAcceptChord, chord.trimmed());
}

QString WatchSettingsManager::loadChatFocusChord() const
{
    auto settings = CommandWatch::getSettings();
    return stringOrDefault(settings, kSettingsKeyChatFocusChord, kDefaultChatFocusChord);
}

void WatchSettingsManager::saveChatFocusChord(const QString &chord)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyChatFocusChord, chord.trimmed());
}

QString WatchSettingsManager::loadContinueMessage() const
{
    auto settings = CommandWatch::getSettings();
    return stringOrDefault(settings, kSettingsKeyContinueMessage, kDefaultContinueMessage);
}

void WatchSettingsManager::saveContinueMessage(const QString &message)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyContinueMessage, message);
}

QString WatchSettingsManager::loadNextStepMessage() const
{
    auto settings = CommandWatch::getSettings();
    return stringOrDefault(settings, kSettingsKeyNextStepMessage, kDefaultNextStepMessage);
}

void WatchSettingsManager::saveNextStepMessage(const QString &message)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyNextStepMessage, message);
}

QString WatchSettingsManager::loadCompleteStepMessage() const
{
    auto settings = CommandWatch::getSettings();
    return stringOrDefault(settings, kSettingsKeyCompleteStepMessage, kDefaultCompleteStepMessage);
}

void WatchSettingsManager::saveCompleteStepMessage(const QString &message)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyCompleteStepMessage, message);
}

QString WatchSettingsManager::loadStepsFilePath() const
{
    auto settings = CommandWatch::getSettings();
    return stringOrDefault(settings, kSettingsKeyStepsFilePath, kDefaultStepsFilePath);
}

void WatchSettingsManager::saveStepsFilePath(const QString &path)
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kSettingsKeyStepsFilePath, path);
}
