#include "input/KeyChord.h"

#include <QKeyCombination>
#include <QKeySequence>

namespace {

bool isModifierKey(Qt::Key key)
{
    switch (key) {
    case Qt::Key_Control:
    case Qt::Key_Shift:
    case Qt::Key_Alt:
    case Qt::Key_Meta:
    case Qt::Key_AltGr:
        return true;
    default:
        return false;
    }
}

} // namespace

KeyChord::KeyChord(Qt::KeyboardModifiers modifiers, Qt::Key key)
    : m_modifiers(modifiers)
    , m_key(key)
{
}

KeyChord KeyChord::fromString(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return KeyChord();
    }

    // "Ctrl+Enter" reads more naturally in settings than "Ctrl+Return"
    QString normalized = trimmed;
    if (normalized.endsWith(QStringLiteral("+Enter"), Qt::CaseInsensitive)
        || normalized.compare(QStringLiteral("Enter"), Qt::CaseInsensitive) == 0) {
        normalized.chop(5);
        normalized += QStringLiteral("Return");
    }

    const QKeySequence sequence(normalized, QKeySequence::PortableText);
    if (sequence.count() != 1) {
        return KeyChord();
    }

    const QKeyCombination combination = sequence[0];
    return KeyChord(combination.keyboardModifiers(), combination.key());
}

bool KeyChord::isValid() const
{
    return m_key != Qt::Key_unknown && m_key != 0 && !isModifierKey(m_key);
}

QString KeyChord::toString() const
{
    if (!isValid()) {
        return QString();
    }
    return QKeySequence(QKeyCombination(m_modifiers, m_key)).toString(QKeySequence::PortableText);
}
