#ifndef KEYINJECTOR_H
#define KEYINJECTOR_H

#include <QObject>
#include <QPointer>
#include <QString>

namespace PressHold {

enum class KeyInjectorBackend {
    Native,
    Synthetic
};

/**
 * @brief Abstract interface for injecting keyboard input.
 *
 * Key codes are Qt::Key values. Every press and release is followed by
 * the auto delay. Methods are called from the scenario thread; the UI
 * context is the object whose thread processes the resulting events.
 *
 * Platform implementations:
 * - macOS: Posts CGEvents at the HID tap (requires Accessibility permission)
 * - Synthetic: Delivers QKeyEvents to the focus widget in-process
 */
class KeyInjector : public QObject
{
    Q_OBJECT

public:
    explicit KeyInjector(QObject *uiContext, QObject *parent = nullptr);
    ~KeyInjector() override = default;

    virtual void keyPress(int key) = 0;
    virtual void keyRelease(int key) = 0;

    virtual QString backendName() const = 0;

    void setAutoDelay(int ms);
    int autoDelay() const { return m_autoDelayMs; }

    void delay(int ms);

    /**
     * @brief Block until the UI thread has processed all pending events.
     */
    void waitForIdle();

    /**
     * @brief Press a key repeatedly without releasing it, then release once.
     *
     * Long enough holds surface the platform accent popup.
     */
    void holdKey(int key, int repeatCount);

    /**
     * @brief Press and release the key code of every character in order.
     */
    void typeText(const QString &text);

    /**
     * @brief Extended key code for a character.
     *
     * Letters and digits map to their Qt::Key value; other printable
     * characters map to their upper case code point. Returns
     * Qt::Key_unknown for control characters.
     */
    static int keyCodeForChar(QChar ch);

    /**
     * @brief Factory method to create an injector for the given backend.
     * @param uiContext Object living on the UI thread
     * @param errorMessage Receives the reason when creation fails
     * @return New KeyInjector instance, or nullptr if unavailable
     */
    static KeyInjector* create(KeyInjectorBackend backend, QObject *uiContext,
                               QString *errorMessage, QObject *parent = nullptr);

protected:
    void applyAutoDelay();
    QObject* uiContext() const { return m_uiContext; }

private:
    QPointer<QObject> m_uiContext;
    int m_autoDelayMs = 0;
};

} // namespace PressHold

#endif // KEYINJECTOR_H
