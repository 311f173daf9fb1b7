#ifndef AUTOMATIONSESSION_H
#define AUTOMATIONSESSION_H

#include "detection/ButtonClassifier.h"
#include "input/KeyChord.h"

#include <QObject>
#include <QSet>
#include <QString>

class IKeySynthesizer;

/**
 * @brief Timing, chords and messages used by AutomationSession.
 */
struct SessionConfig {
    QStringList acceptPhrases;
    QStringList completedPhrases;
    KeyChord acceptChord;
    KeyChord chatFocusChord;
    int actionDelayMs = 500;      ///< Wait before reacting to a detected button
    int keyStepDelayMs = 150;     ///< Wait between synthesized key events
    int messageSettleMs = 500;    ///< Wait around typing into the chat box
    QString continueMessage;
    QString nextStepMessage;
    QString completeStepMessage;

    static SessionConfig fromSettings();
};

/**
 * @brief The detection-and-action step of the watch loop.
 *
 * Consumes recognized text one frame at a time, decides whether a button
 * needs pressing, and drives the key synthesizer. All methods block for the
 * configured delays and must run on the detection worker thread.
 */
class AutomationSession : public QObject
{
    Q_OBJECT

public:
    enum class MessageKind {
        Continue,
        NextStep,
        CompleteStep
    };

    explicit AutomationSession(IKeySynthesizer *synthesizer,
                               const SessionConfig &config,
                               QObject *parent = nullptr);

    void setConfig(const SessionConfig &config);
    SessionConfig config() const { return m_config; }

    /**
     * @brief Process the text of one captured frame.
     * @return The category acted upon, ButtonKind::None when nothing happened
     */
    ButtonKind handleText(const QString &text);

    /**
     * @brief Focus the chat box, type the message and submit it.
     */
    bool sendMessage(MessageKind kind);

    void reset();

    int commandsExecuted() const { return m_commandsExecuted; }
    int messagesSent() const { return m_messagesSent; }
    bool isWaitingForCompletion() const { return m_waitingForCompletion; }
    QString lastText() const { return m_lastText; }
    QString lastStatus() const { return m_lastStatus; }
    int seenTextCount() const { return m_seenTexts.size(); }

    static QString messageLabel(MessageKind kind);

signals:
    void statusChanged(const QString &status);
    void countersChanged(int commandsExecuted, int messagesSent);
    void errorOccurred(const QString &message);

private:
    bool pressAcceptChord();
    QString messageText(MessageKind kind) const;
    void report(const QString &status);
    void reportError(const QString &status);
    static void wait(int ms);

    IKeySynthesizer *m_synthesizer;
    SessionConfig m_config;
    ButtonClassifier m_classifier;

    QString m_lastText;
    QString m_lastStatus;
    QSet<QString> m_seenTexts;
    bool m_waitingForCompletion = false;
    int m_commandsExecuted = 0;
    int m_messagesSent = 0;
};

#endif // AUTOMATIONSESSION_H
