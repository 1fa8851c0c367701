#include "harness/ObservationHarness.h"
#include "harness/TextProbeWindow.h"
#include "utils/ResourceCleanupHelper.h"

#include <QDebug>
#include <QThread>

namespace PressHold {

ObservationHarness::ObservationHarness(QObject *parent)
    : QObject(parent)
{
}

ObservationHarness::~ObservationHarness()
{
    if (m_window) {
        disposeWindow();
    }
}

void ObservationHarness::runOnUiThread(std::function<void()> task, Qt::ConnectionType type)
{
    if (QThread::currentThread() == thread()) {
        if (type == Qt::BlockingQueuedConnection) {
            task();
            return;
        }
        QMetaObject::invokeMethod(this, std::move(task), Qt::QueuedConnection);
        return;
    }
    QMetaObject::invokeMethod(this, std::move(task), type);
}

void ObservationHarness::show()
{
    runOnUiThread([this]() { createWindow(); }, Qt::QueuedConnection);
}

void ObservationHarness::createWindow()
{
    if (m_state.load() == State::Disposed || m_window) {
        return;
    }

    m_window = new TextProbeWindow();
    m_window->setTextChangedHandler([this](const QString& text) {
        m_result.publish(text);
    });
    m_window->setFocusGainedHandler([this]() {
        onFocusGained();
    });
    m_window->present();
    qDebug() << "ObservationHarness: Window shown";
}

void ObservationHarness::onFocusGained()
{
    // Later activations of the window are not of interest
    bool expected = false;
    if (!m_focusSignaled.compare_exchange_strong(expected, true)) {
        return;
    }

    State unfocused = State::Unfocused;
    m_state.compare_exchange_strong(unfocused, State::Focused);
    m_focusLatch.release();
    emit focusGained();
}

bool ObservationHarness::waitForFocus(int timeoutMs)
{
    if (timeoutMs < 0) {
        m_focusLatch.acquire();
    } else if (!m_focusLatch.tryAcquire(1, timeoutMs)) {
        qWarning() << "ObservationHarness: Window did not gain focus within" << timeoutMs << "ms";
        return false;
    }
    return m_state.load() == State::Focused;
}

void ObservationHarness::clearText()
{
    runOnUiThread([this]() {
        if (m_window) {
            m_window->clearText();
        }
    }, Qt::QueuedConnection);
}

void ObservationHarness::dispose()
{
    if (m_state.load() == State::Disposed) {
        return;
    }
    runOnUiThread([this]() { disposeWindow(); }, Qt::BlockingQueuedConnection);
}

void ObservationHarness::disposeWindow()
{
    if (m_window) {
        m_window->clearHandlers();
        m_window->hide();
        TextProbeWindow *window = m_window.data();
        ResourceCleanupHelper::disconnectAndDestroy(window);
    }

    const State previous = m_state.exchange(State::Disposed);
    if (previous == State::Disposed) {
        return;
    }

    // Release a waiter still blocked on a focus that never came
    if (!m_focusSignaled.exchange(true)) {
        m_focusLatch.release();
    }

    qDebug() << "ObservationHarness: Disposed";
    emit disposed();
}

} // namespace PressHold
