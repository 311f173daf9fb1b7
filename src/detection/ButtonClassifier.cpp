#include "detection/ButtonClassifier.h"
#include "settings/WatchSettingsManager.h"

namespace {

QStringList lowered(const QStringList &phrases)
{
    QStringList result;
    result.reserve(phrases.size());
    for (const QString &phrase : phrases) {
        const QString value = phrase.trimmed().toLower();
        if (!value.isEmpty()) {
            result.append(value);
        }
    }
    return result;
}

} // namespace

ButtonClassifier::ButtonClassifier()
    : ButtonClassifier(WatchSettingsManager::defaultAcceptPhrases(),
                       WatchSettingsManager::defaultCompletedPhrases())
{
}

ButtonClassifier::ButtonClassifier(const QStringList &acceptPhrases,
                                   const QStringList &completedPhrases)
    : m_acceptPhrases(lowered(acceptPhrases))
    , m_completedPhrases(lowered(completedPhrases))
{
}

ButtonMatch ButtonClassifier::classify(const QString &text) const
{
    ButtonMatch match;
    const QString lower = text.toLower();
    if (lower.trimmed().isEmpty()) {
        return match;
    }

    match.accept = containsAny(lower, m_acceptPhrases);
    match.completed = containsAny(lower, m_completedPhrases);
    match.generating = containsAny(lower, generatingPhrases());
    match.cancel = containsAny(lower, cancelPhrases());
    return match;
}

QStringList ButtonClassifier::generatingPhrases()
{
    return {QStringLiteral("generating"), QStringLiteral("loading")};
}

QStringList ButtonClassifier::cancelPhrases()
{
    return {QStringLiteral("cancel"), QStringLiteral("skip")};
}

QString ButtonClassifier::kindName(ButtonKind kind)
{
    switch (kind) {
    case ButtonKind::Accept:     return QStringLiteral("accept");
    case ButtonKind::Completed:  return QStringLiteral("completed");
    case ButtonKind::Generating: return QStringLiteral("generating");
    case ButtonKind::Cancel:     return QStringLiteral("cancel");
    case ButtonKind::None:       break;
    }
    return QStringLiteral("none");
}

bool ButtonClassifier::containsAny(const QString &lowered, const QStringList &phrases)
{
    for (const QString &phrase : phrases) {
        if (lowered.contains(phrase)) {
            return true;
        }
    }
    return false;
}
