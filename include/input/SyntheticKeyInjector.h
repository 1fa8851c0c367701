#ifndef SYNTHETICKEYINJECTOR_H
#define SYNTHETICKEYINJECTOR_H

#include "input/KeyInjector.h"

#include <QEvent>
#include <QSet>

namespace PressHold {

/**
 * @brief In-process injector delivering QKeyEvents to the focus widget.
 *
 * Events bypass the window server, so no accent popup ever appears:
 * holding a key repeats it. A press of a key that is already down is
 * sent as an auto-repeat.
 */
class SyntheticKeyInjector : public KeyInjector
{
    Q_OBJECT

public:
    explicit SyntheticKeyInjector(QObject *uiContext, QObject *parent = nullptr);
    ~SyntheticKeyInjector() override = default;

    void keyPress(int key) override;
    void keyRelease(int key) override;
    QString backendName() const override { return QStringLiteral("synthetic"); }

    bool isKeyDown(int key) const { return m_pressedKeys.contains(key); }

    // Text a key produces without modifiers, empty for non-printing keys
    static QString textForKey(int key);

protected:
    /**
     * @brief Queue a key event for the widget focused on the UI thread.
     */
    void postKeyEvent(QEvent::Type type, int key, const QString &text, bool autoRepeat);

private:
    QSet<int> m_pressedKeys;
};

} // namespace PressHold

#endif // SYNTHETICKEYINJECTOR_H
