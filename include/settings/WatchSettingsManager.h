#ifndef WATCHSETTINGSMANAGER_H
#define WATCHSETTINGSMANAGER_H

#include <QRect>
#include <QString>
#include <QStringList>

/**
 * @brief Persistent settings for the watch loop: region, timing, phrases,
 * key chords and the messages typed into the chat box.
 *
 * Every getter reads QSettings directly and clamps to a sane range, so a
 * hand-edited config can never push the loop outside its limits.
 */
class WatchSettingsManager
{
public:
    static WatchSettingsManager& instance();

    // Region
    bool hasRegion() const;
    QRect loadRegion() const;
    QString loadRegionScreenName() const;
    void saveRegion(const QRect &region, const QString &screenName);
    void clearRegion();

    // Timing
    int loadPollIntervalMs() const;
    void savePollIntervalMs(int intervalMs);

    int loadActionDelayMs() const;
    void saveActionDelayMs(int delayMs);

    int loadKeyStepDelayMs() const;
    void saveKeyStepDelayMs(int delayMs);

    int loadCountdownSeconds() const;
    void saveCountdownSeconds(int seconds);

    // Phrases
    QStringList loadAcceptPhrases() const;
    void saveAcceptPhrases(const QStringList &phrases);

    QStringList loadCompletedPhrases() const;
    void saveCompletedPhrases(const QStringList &phrases);

    // Key chords
    QString loadAcceptChord() const;
    void saveAcceptChord(const QString &chord);

    QString loadChatFocusChord() const;
    void saveChatFocusChord(const QString &chord);

    // Messages
    QString loadContinueMessage() const;
    void saveContinueMessage(const QString &message);

    QString loadNextStepMessage() const;
    void saveNextStepMessage(const QString &message);

    QString loadCompleteStepMessage() const;
    void saveCompleteStepMessage(const QString &message);

    // Steps file
    QString loadStepsFilePath() const;
    void saveStepsFilePath(const QString &path);

    static QStringList defaultAcceptPhrases();
    static QStringList defaultCompletedPhrases();

    static constexpr int kMinRegionSize = 10;
    static constexpr int kDefaultPollIntervalMs = 500;
    static constexpr int kDefaultActionDelayMs = 500;
    static constexpr int kDefaultKeyStepDelayMs = 150;
    static constexpr int kDefaultCountdownSeconds = 3;
    static constexpr const char* kDefaultAcceptChord = "Ctrl+Return";
    static constexpr const char* kDefaultChatFocusChord = "Ctrl+/";
    static constexpr const char* kDefaultContinueMessage =
        "continue with the steps and update the project steps with what we have completed "
        "and whats in progress and the implementation unless there is something critical "
        "you need to add or unless the test scripts dont show 100% functionality";
    static constexpr const char* kDefaultNextStepMessage = "move on to the next step";
    static constexpr const char* kDefaultCompleteStepMessage =
        "complete the current steps functionality";
    static constexpr const char* kDefaultStepsFilePath = "project_steps.md";

private:
    WatchSettingsManager() = default;
    ~WatchSettingsManager() = default;
    WatchSettingsManager(const WatchSettingsManager&) = delete;
    WatchSettingsManager& operator=(const WatchSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyRegion = "watch/region";
    static constexpr const char* kSettingsKeyRegionScreen = "watch/screen";
    static constexpr const char* kSettingsKeyPollIntervalMs = "watch/pollIntervalMs";
    static constexpr const char* kSettingsKeyActionDelayMs = "watch/actionDelayMs";
    static constexpr const char* kSettingsKeyKeyStepDelayMs = "watch/keyStepDelayMs";
    static constexpr const char* kSettingsKeyCountdownSeconds = "watch/countdownSeconds";
    static constexpr const char* kSettingsKeyAcceptPhrases = "detection/acceptPhrases";
    static constexpr const char* kSettingsKeyCompletedPhrases = "detection/completedPhrases";
    static constexpr const char* kSettingsKeyAcceptChord = "input/acceptChord";
    static constexpr const char* kSettingsKeyChatFocusChord = "input/chatFocusChord";
    static constexpr const char* kSettingsKeyContinueMessage = "messages/continue";
    static constexpr const char* kSettingsKeyNextStepMessage = "messages/nextStep";
    static constexpr const char* kSettingsKeyCompleteStepMessage = "messages/completeStep";
    static constexpr const char* kSettingsKeyStepsFilePath = "steps/filePath";
};

#endif // WATCHSETTINGSMANAGER_H
