#ifndef BUTTONCLASSIFIER_H
#define BUTTONCLASSIFIER_H

#include <QString>
#include <QStringList>

enum class ButtonKind {
    None,
    Accept,      ///< "Run Command" style button waiting for confirmation
    Completed,   ///< The previous command finished
    Generating,  ///< The assistant is still producing output
    Cancel       ///< Only a cancel/skip button is visible
};

/**
 * @brief Which phrase categories a recognized text matched.
 */
struct ButtonMatch {
    bool accept = false;
    bool completed = false;
    bool generating = false;
    bool cancel = false;

    ButtonKind primaryKind() const
    {
        if (accept) return ButtonKind::Accept;
        if (completed) return ButtonKind::Completed;
        if (generating) return ButtonKind::Generating;
        if (cancel) return ButtonKind::Cancel;
        return ButtonKind::None;
    }

    bool any() const { return accept || completed || generating || cancel; }
};

/**
 * @brief Maps OCR text to button categories by case-insensitive substring.
 *
 * Accept and completed phrases are configurable; generating and cancel
 * phrases are fixed.
 */
class ButtonClassifier
{
public:
    ButtonClassifier();
    ButtonClassifier(const QStringList &acceptPhrases, const QStringList &completedPhrases);

    ButtonMatch classify(const QString &text) const;

    QStringList acceptPhrases() const { return m_acceptPhrases; }
    QStringList completedPhrases() const { return m_completedPhrases; }

    static QStringList generatingPhrases();
    static QStringList cancelPhrases();
    static QString kindName(ButtonKind kind);

private:
    static bool containsAny(const QString &lowered, const QStringList &phrases);

    QStringList m_acceptPhrases;
    QStringList m_completedPhrases;
};

#endif // BUTTONCLASSIFIER_H
