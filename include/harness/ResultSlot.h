#ifndef RESULTSLOT_H
#define RESULTSLOT_H

#include <QMutex>
#include <QString>
#include <QWaitCondition>

namespace PressHold {

/**
 * @brief Single-slot channel carrying the latest observed text.
 *
 * The UI thread publishes on every text change; the scenario thread
 * reads after the injector went idle. Each publish overwrites the
 * previous value and bumps the serial.
 */
class ResultSlot
{
public:
    ResultSlot() = default;

    ResultSlot(const ResultSlot&) = delete;
    ResultSlot& operator=(const ResultSlot&) = delete;

    void publish(const QString& text);

    QString latest() const;
    quint64 serial() const;

    /**
     * @brief Wait until a value newer than afterSerial is published.
     * @param timeoutMs Upper bound, negative waits forever
     * @return true if a newer value is available
     */
    bool waitForUpdate(quint64 afterSerial, int timeoutMs) const;

    void reset();

private:
    mutable QMutex m_mutex;
    mutable QWaitCondition m_updated;
    QString m_text;
    quint64 m_serial = 0;
};

} // namespace PressHold

#endif // RESULTSLOT_H
