#ifndef KEYCHORD_H
#define KEYCHORD_H

#include <QString>
#include <Qt>

/**
 * @brief A single key plus modifiers, parsed from Qt key-sequence text
 * such as "Ctrl+Return" or "Ctrl+/".
 */
class KeyChord
{
public:
    KeyChord() = default;
    KeyChord(Qt::KeyboardModifiers modifiers, Qt::Key key);

    static KeyChord fromString(const QString &text);

    bool isValid() const;
    Qt::KeyboardModifiers modifiers() const { return m_modifiers; }
    Qt::Key key() const { return m_key; }

    // Portable text, e.g. "Ctrl+Return"
    QString toString() const;

    bool operator==(const KeyChord &other) const
    {
        return m_modifiers == other.m_modifiers && m_key == other.m_key;
    }
    bool operator!=(const KeyChord &other) const { return !(*this == other); }

private:
    Qt::KeyboardModifiers m_modifiers = Qt::NoModifier;
    Qt::Key m_key = Qt::Key_unknown;
};

#endif // KEYCHORD_H
