#ifndef SCENARIOTHREAD_H
#define SCENARIOTHREAD_H

#include "scenario/ScenarioRunner.h"

#include <QMutex>
#include <QThread>

namespace PressHold {

/**
 * @brief Worker thread executing a ScenarioRunner off the UI thread.
 *
 * The UI thread keeps processing window and input events while the
 * runner blocks on focus, delays and idle waits.
 */
class ScenarioThread : public QThread
{
    Q_OBJECT

public:
    explicit ScenarioThread(QObject *parent = nullptr);
    ~ScenarioThread() override;

    /**
     * @brief Set the runner to execute (call before start)
     * Ownership remains with caller - the runner must outlive this thread.
     */
    void initialize(ScenarioRunner *runner);

    // Valid once finished() was emitted
    RunReport report() const;

protected:
    void run() override;

private:
    ScenarioRunner *m_runner = nullptr;

    mutable QMutex m_mutex;
    RunReport m_report;
};

} // namespace PressHold

#endif // SCENARIOTHREAD_H
