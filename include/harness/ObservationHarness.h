#ifndef OBSERVATIONHARNESS_H
#define OBSERVATIONHARNESS_H

#include "harness/ResultSlot.h"

#include <QObject>
#include <QPointer>
#include <QSemaphore>
#include <atomic>
#include <functional>

namespace PressHold {

class TextProbeWindow;

/**
 * @brief Owns the probe window on the UI thread and exposes it to the
 *        scenario thread.
 *
 * Lifecycle: Unfocused -> Focused -> Disposed. Every window operation is
 * queued to the thread this object lives on; dispose() blocks until the
 * window is gone. Text changes are published to result().
 */
class ObservationHarness : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Unfocused,
        Focused,
        Disposed
    };

    explicit ObservationHarness(QObject *parent = nullptr);
    ~ObservationHarness() override;

    // Build, attach listeners and show the window (queued)
    void show();

    /**
     * @brief Block until the window first gains focus.
     * @param timeoutMs Negative waits forever
     * @return false if the timeout elapsed or the harness was disposed
     */
    bool waitForFocus(int timeoutMs = -1);

    // Empty the text field (queued)
    void clearText();

    /**
     * @brief Detach listeners, then release the window.
     *
     * Blocks the caller until done on the UI thread. Safe to call twice.
     */
    void dispose();

    State state() const { return m_state.load(); }

    const ResultSlot& result() const { return m_result; }

    // UI thread only
    TextProbeWindow* window() const { return m_window; }

signals:
    void focusGained();
    void disposed();

private:
    void createWindow();
    void onFocusGained();
    void disposeWindow();
    void runOnUiThread(std::function<void()> task, Qt::ConnectionType type);

    QPointer<TextProbeWindow> m_window;
    ResultSlot m_result;
    QSemaphore m_focusLatch;
    std::atomic<State> m_state{State::Unfocused};
    std::atomic<bool> m_focusSignaled{false};
};

} // namespace PressHold

#endif // OBSERVATIONHARNESS_H
