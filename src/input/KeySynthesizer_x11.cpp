#include "input/KeySynthesizerFactory.h"
#include "input/IKeySynthesizer.h"
#include "input/KeyChord.h"

#include <QDebug>
#include <QThread>
#include <QtGlobal>

#ifdef Q_OS_LINUX
#include <X11/Xlib.h>
#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

#include <cstdlib>
#include <vector>

namespace {

constexpr unsigned long kTypingIntervalMs = 12;

KeySym keySymForQtKey(Qt::Key key)
{
    switch (key) {
    case Qt::Key_Return:    return XK_Return;
    case Qt::Key_Enter:     return XK_KP_Enter;
    case Qt::Key_Tab:       return XK_Tab;
    case Qt::Key_Escape:    return XK_Escape;
    case Qt::Key_Backspace: return XK_BackSpace;
    case Qt::Key_Delete:    return XK_Delete;
    case Qt::Key_Insert:    return XK_Insert;
    case Qt::Key_Home:      return XK_Home;
    case Qt::Key_End:       return XK_End;
    case Qt::Key_PageUp:    return XK_Page_Up;
    case Qt::Key_PageDown:  return XK_Page_Down;
    case Qt::Key_Left:      return XK_Left;
    case Qt::Key_Right:     return XK_Right;
    case Qt::Key_Up:        return XK_Up;
    case Qt::Key_Down:      return XK_Down;
    case Qt::Key_Space:     return XK_space;
    default:
        break;
    }

    if (key >= Qt::Key_F1 && key <= Qt::Key_F35) {
        return XK_F1 + (key - Qt::Key_F1);
    }
    if (key >= Qt::Key_A && key <= Qt::Key_Z) {
        return XK_a + (key - Qt::Key_A);
    }
    // Remaining Latin-1 keys share their code with the X keysym
    if (key > 0x20 && key <= 0xff) {
        return static_cast<KeySym>(key);
    }
    return NoSymbol;
}

KeySym keySymForChar(QChar ch)
{
    if (ch == QLatin1Char('\n')) return XK_Return;
    if (ch == QLatin1Char('\t')) return XK_Tab;
    if (ch == QLatin1Char(' '))  return XK_space;

    const char16_t code = ch.unicode();
    if (code >= 0x20 && code <= 0xff) {
        return static_cast<KeySym>(code);
    }
    // X11 encodes other Unicode code points with the 0x01000000 prefix
    return static_cast<KeySym>(0x01000000 | code);
}

std::vector<KeySym> modifierKeySyms(Qt::KeyboardModifiers modifiers)
{
    std::vector<KeySym> syms;
    if (modifiers & Qt::ControlModifier) syms.push_back(XK_Control_L);
    if (modifiers & Qt::ShiftModifier)   syms.push_back(XK_Shift_L);
    if (modifiers & Qt::AltModifier)     syms.push_back(XK_Alt_L);
    if (modifiers & Qt::MetaModifier)    syms.push_back(XK_Super_L);
    return syms;
}

class X11KeySynthesizer : public IKeySynthesizer
{
public:
    X11KeySynthesizer() = default;

    ~X11KeySynthesizer() override
    {
        if (m_display) {
            XCloseDisplay(m_display);
            m_display = nullptr;
        }
    }

    bool isAvailable() const override
    {
        return std::getenv("DISPLAY") != nullptr;
    }

    QString backendName() const override { return QStringLiteral("X11 XTest"); }

    bool pressChord(const KeyChord &chord, int stepDelayMs) override
    {
        if (!chord.isValid()) {
            m_lastError = QStringLiteral("Invalid key chord");
            return false;
        }
        if (!ensureDisplay()) {
            return false;
        }

        const KeySym keySym = keySymForQtKey(chord.key());
        const KeyCode keyCode = keySym == NoSymbol ? 0 : XKeysymToKeycode(m_display, keySym);
        if (keyCode == 0) {
            m_lastError = QStringLiteral("No keycode for %1").arg(chord.toString());
            return false;
        }

        std::vector<KeyCode> modifierCodes;
        for (KeySym sym : modifierKeySyms(chord.modifiers())) {
            const KeyCode code = XKeysymToKeycode(m_display, sym);
            if (code == 0) {
                m_lastError = QStringLiteral("No keycode for modifier in %1").arg(chord.toString());
                return false;
            }
            modifierCodes.push_back(code);
        }

        const unsigned long delay = static_cast<unsigned long>(qMax(0, stepDelayMs));
        bool ok = true;
        for (KeyCode code : modifierCodes) {
            ok = sendKey(code, true) && ok;
            pause(delay);
        }
        ok = sendKey(keyCode, true) && ok;
        pause(delay);
        ok = sendKey(keyCode, false) && ok;
        for (auto it = modifierCodes.rbegin(); it != modifierCodes.rend(); ++it) {
            ok = sendKey(*it, false) && ok;
        }
        pause(delay);

        if (!ok) {
            m_lastError = QStringLiteral("XTest rejected a key event for %1").arg(chord.toString());
        }
        return ok;
    }

    bool pressKey(Qt::Key key) override
    {
        return pressChord(KeyChord(Qt::NoModifier, key), 0);
    }

    bool typeText(const QString &text) override
    {
        if (!ensureDisplay()) {
            return false;
        }

        const KeyCode shiftCode = XKeysymToKeycode(m_display, XK_Shift_L);
        int skipped = 0;
        bool accepted = true;
        for (const QChar ch : text) {
            const KeySym sym = keySymForChar(ch);
            const KeyCode code = XKeysymToKeycode(m_display, sym);
            if (code == 0) {
                ++skipped;
                continue;
            }

            const bool needsShift = XkbKeycodeToKeysym(m_display, code, 0, 0) != sym
                && XkbKeycodeToKeysym(m_display, code, 0, 1) == sym;

            if (needsShift) accepted = sendKey(shiftCode, true) && accepted;
            accepted = sendKey(code, true) && accepted;
            accepted = sendKey(code, false) && accepted;
            if (needsShift) accepted = sendKey(shiftCode, false) && accepted;
            pause(kTypingIntervalMs);
        }

        if (skipped > 0) {
            qWarning() << "X11KeySynthesizer: Skipped" << skipped
                       << "characters without a keycode in the current layout";
        }

        const QString failure = typingFailure(static_cast<int>(text.size()), skipped, accepted);
        if (!failure.isEmpty()) {
            m_lastError = failure;
            return false;
        }
        return true;
    }

private:
    bool ensureDisplay()
    {
        if (m_display) {
            return true;
        }

        m_display = XOpenDisplay(nullptr);
        if (!m_display) {
            m_lastError = QStringLiteral("Cannot open X display");
            return false;
        }

        int eventBase = 0;
        int errorBase = 0;
        int major = 0;
        int minor = 0;
        if (!XTestQueryExtension(m_display, &eventBase, &errorBase, &major, &minor)) {
            m_lastError = QStringLiteral("XTest extension is not available");
            XCloseDisplay(m_display);
            m_display = nullptr;
            return false;
        }

        qDebug() << "X11KeySynthesizer: XTest" << major << "." << minor << "ready";
        return true;
    }

    bool sendKey(KeyCode code, bool press)
    {
        const bool ok = XTestFakeKeyEvent(m_display, code, press ? True : False, CurrentTime) != 0;
        XFlush(m_display);
        return ok;
    }

    static void pause(unsigned long ms)
    {
        if (ms > 0) {
            QThread::msleep(ms);
        }
    }

    Display *m_display = nullptr;
};

} // namespace

std::unique_ptr<IKeySynthesizer> createPlatformKeySynthesizer()
{
    return std::make_unique<X11KeySynthesizer>();
}

bool isPlatformKeySynthesisAvailable()
{
    return std::getenv("DISPLAY") != nullptr;
}

#else

std::unique_ptr<IKeySynthesizer> createPlatformKeySynthesizer()
{
    return nullptr;
}

bool isPlatformKeySynthesisAvailable()
{
    return false;
}

#endif
