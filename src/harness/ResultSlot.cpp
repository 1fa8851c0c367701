#include "harness/ResultSlot.h"

#include <QDeadlineTimer>
#include <QMutexLocker>

namespace PressHold {

void ResultSlot::publish(const QString& text)
{
    QMutexLocker locker(&m_mutex);
    m_text = text;
    ++m_serial;
    m_updated.wakeAll();
}

QString ResultSlot::latest() const
{
    QMutexLocker locker(&m_mutex);
    return m_text;
}

quint64 ResultSlot::serial() const
{
    QMutexLocker locker(&m_mutex);
    return m_serial;
}

bool ResultSlot::waitForUpdate(quint64 afterSerial, int timeoutMs) const
{
    QDeadlineTimer deadline = timeoutMs < 0
        ? QDeadlineTimer(QDeadlineTimer::Forever)
        : QDeadlineTimer(timeoutMs);

    QMutexLocker locker(&m_mutex);
    while (m_serial <= afterSerial) {
        if (!m_updated.wait(&m_mutex, deadline)) {
            return m_serial > afterSerial;
        }
    }
    return true;
}

void ResultSlot::reset()
{
    QMutexLocker locker(&m_mutex);
    m_text.clear();
    ++m_serial;
    m_updated.wakeAll();
}

} // namespace PressHold
