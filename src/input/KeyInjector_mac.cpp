#include "input/KeyInjector.h"
#include "input/SyntheticKeyInjector.h"

#include <QDebug>
#include <QtGlobal>

#ifdef Q_OS_MACOS
#include <ApplicationServices/ApplicationServices.h>
#include <CoreFoundation/CoreFoundation.h>
#endif

namespace PressHold {

#ifdef Q_OS_MACOS

namespace {

// HIToolbox virtual key codes of the ANSI layout
bool virtualKeyForQtKey(int key, CGKeyCode *code)
{
    static const CGKeyCode kLetterCodes[26] = {
        0x00, 0x0B, 0x08, 0x02, 0x0E, 0x03, 0x05, 0x04, 0x22, 0x26, 0x28, 0x25, 0x2E,  // A-M
        0x2D, 0x1F, 0x23, 0x0C, 0x0F, 0x01, 0x11, 0x20, 0x09, 0x0D, 0x07, 0x10, 0x06   // N-Z
    };
    static const CGKeyCode kDigitCodes[10] = {
        0x1D, 0x12, 0x13, 0x14, 0x15, 0x17, 0x16, 0x1A, 0x1C, 0x19                     // 0-9
    };

    if (key >= Qt::Key_A && key <= Qt::Key_Z) {
        *code = kLetterCodes[key - Qt::Key_A];
        return true;
    }
    if (key >= Qt::Key_0 && key <= Qt::Key_9) {
        *code = kDigitCodes[key - Qt::Key_0];
        return true;
    }

    switch (key) {
    case Qt::Key_Backspace:
        *code = 0x33;
        return true;
    case Qt::Key_Escape:
        *code = 0x35;
        return true;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        *code = 0x24;
        return true;
    case Qt::Key_Tab:
        *code = 0x30;
        return true;
    case Qt::Key_Space:
        *code = 0x31;
        return true;
    default:
        return false;
    }
}

/**
 * @brief macOS implementation posting CGEvents at the HID event tap.
 *
 * Events enter the window server like hardware input, so holding a key
 * triggers the system accent popup in the focused application.
 */
class NativeKeyInjector final : public KeyInjector
{
public:
    NativeKeyInjector(CGEventSourceRef source, QObject *uiContext, QObject *parent)
        : KeyInjector(uiContext, parent)
        , m_source(source)
    {
    }

    ~NativeKeyInjector() override
    {
        if (m_source) {
            CFRelease(m_source);
            m_source = nullptr;
        }
    }

    void keyPress(int key) override
    {
        post(key, true);
        applyAutoDelay();
    }

    void keyRelease(int key) override
    {
        post(key, false);
        applyAutoDelay();
    }

    QString backendName() const override { return QStringLiteral("native"); }

private:
    void post(int key, bool keyDown)
    {
        CGKeyCode code = 0;
        const bool mapped = virtualKeyForQtKey(key, &code);

        CGEventRef event = CGEventCreateKeyboardEvent(m_source, code, keyDown);
        if (!event) {
            qWarning() << "NativeKeyInjector: Failed to create keyboard event for key" << key;
            return;
        }

        if (!mapped) {
            // No ANSI key: let the event carry the character itself
            const QString text = SyntheticKeyInjector::textForKey(key);
            if (text.isEmpty()) {
                qWarning() << "NativeKeyInjector: Unsupported key" << key;
                CFRelease(event);
                return;
            }
            CGEventKeyboardSetUnicodeString(event, static_cast<UniCharCount>(text.size()),
                                            reinterpret_cast<const UniChar *>(text.utf16()));
        }

        CGEventSetFlags(event, static_cast<CGEventFlags>(0));
        CGEventPost(kCGHIDEventTap, event);
        CFRelease(event);
    }

    CGEventSourceRef m_source = nullptr;
};

} // namespace

KeyInjector* createNativeKeyInjector(QObject *uiContext, QString *errorMessage, QObject *parent)
{
    if (!AXIsProcessTrusted()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral(
                "Accessibility permission is required to post keyboard events");
        }
        return nullptr;
    }

    CGEventSourceRef source = CGEventSourceCreate(kCGEventSourceStateHIDSystemState);
    if (!source) {
        qWarning() << "NativeKeyInjector: Failed to create event source";
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to create HID event source");
        }
        return nullptr;
    }

    return new NativeKeyInjector(source, uiContext, parent);
}

#else

KeyInjector* createNativeKeyInjector(QObject *uiContext, QString *errorMessage, QObject *parent)
{
    Q_UNUSED(uiContext);
    Q_UNUSED(parent);
    if (errorMessage) {
        *errorMessage = QStringLiteral("Native key injection is unsupported on this platform");
    }
    return nullptr;
}

#endif // Q_OS_MACOS

} // namespace PressHold
