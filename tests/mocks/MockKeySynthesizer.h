#ifndef MOCKKEYSYNTHESIZER_H
#define MOCKKEYSYNTHESIZER_H

#include "input/IKeySynthesizer.h"
#include "input/KeyChord.h"

#include <QMutex>
#include <QStringList>

/**
 * @brief Records synthesized input as readable events instead of sending it.
 *
 * Events look like "chord:Ctrl+Return", "key:Return" and "text:continue".
 * Safe to inspect from the test thread while a worker drives it.
 */
class MockKeySynthesizer : public IKeySynthesizer
{
public:
    MockKeySynthesizer() = default;

    bool isAvailable() const override { return true; }
    bool pressChord(const KeyChord &chord, int stepDelayMs) override;
    bool pressKey(Qt::Key key) override;
    bool typeText(const QString &text) override;
    QString backendName() const override { return QStringLiteral("Mock"); }

    void setFailing(bool failing, const QString &error = QStringLiteral("Mock input failure"));
    // Fails typeText() only, chords and keys still succeed.
    void setTypingFails(bool fails);

    QStringList events() const;
    int chordCount() const;
    int typedCount() const;
    void clear();

private:
    bool record(const QString &event);

    mutable QMutex m_mutex;
    QStringList m_events;
    bool m_failing = false;
    bool m_typingFails = false;
    QString m_failureMessage;
};

#endif // MOCKKEYSYNTHESIZER_H
