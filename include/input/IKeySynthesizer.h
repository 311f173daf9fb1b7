#ifndef IKEYSYNTHESIZER_H
#define IKEYSYNTHESIZER_H

#include <QString>
#include <Qt>

class KeyChord;

/**
 * @brief Abstract interface for synthesizing keyboard input into the
 * focused window.
 *
 * Implementations block the calling thread for the delays they are given,
 * so they are driven from the detection worker, never from the UI thread.
 */
class IKeySynthesizer
{
public:
    virtual ~IKeySynthesizer() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Press modifiers, tap the key, release modifiers in reverse.
     * @param stepDelayMs Pause between consecutive key events
     */
    virtual bool pressChord(const KeyChord &chord, int stepDelayMs) = 0;

    virtual bool pressKey(Qt::Key key) = 0;

    /**
     * @brief Type @p text into the focused window.
     * @return false when any key event was rejected or no character could be
     *         typed; the caller must not submit the text in that case
     */
    virtual bool typeText(const QString &text) = 0;

    virtual QString backendName() const = 0;

    QString lastError() const { return m_lastError; }

    /**
     * @brief Error for a typing attempt, empty when it succeeded.
     * @param length Characters requested
     * @param skipped Characters the keyboard layout could not produce
     * @param eventsAccepted Whether every sent key event was accepted
     */
    static QString typingFailure(int length, int skipped, bool eventsAccepted)
    {
        if (!eventsAccepted) {
            return QStringLiteral("Key events were rejected while typing");
        }
        if (length > 0 && skipped >= length) {
            return QStringLiteral("None of the %1 characters exist in the keyboard layout").arg(length);
        }
        return QString();
    }

protected:
    QString m_lastError;
};

#endif // IKEYSYNTHESIZER_H
