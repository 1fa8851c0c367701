#ifndef SCENARIORUNNER_H
#define SCENARIORUNNER_H

#include "scenario/ProbeOptions.h"
#include "scenario/Scenario.h"

#include <QString>
#include <QStringList>
#include <QVector>

namespace PressHold {

class KeyInjector;
class ObservationHarness;

struct RunReport {
    enum class Outcome {
        Passed,
        Failed,
        Skipped,
        EnvironmentError
    };

    Outcome outcome = Outcome::EnvironmentError;
    QString message;
    QVector<ScenarioOutcome> scenarios;

    // One "Bad sample" line per failed scenario, in run order
    QStringList mismatchLines() const;
    bool scenariosRan() const { return !scenarios.isEmpty(); }
};

/**
 * @brief Drives the probe and the four popup scenarios.
 *
 * Must run on a thread other than the harness's UI thread: show() is
 * queued there while run() blocks on the focus wait. All scenarios run
 * even after one fails. The harness is always disposed before run()
 * returns.
 */
class ScenarioRunner
{
public:
    ScenarioRunner(KeyInjector &injector, ObservationHarness &harness, const ProbeOptions &options);

    RunReport run();

    // Timeout passed to the harness focus wait, negative waits forever
    void setFocusTimeout(int timeoutMs) { m_focusTimeoutMs = timeoutMs; }

private:
    void holdDownSampleKey();
    void typeSampleBody();
    ScenarioOutcome runScenario(const Scenario &scenario);
    void resetText();
    QString observed() const;

    static constexpr int kClearTimeoutMs = 500;

    KeyInjector &m_injector;
    ObservationHarness &m_harness;
    ProbeOptions m_options;
    int m_focusTimeoutMs = -1;
};

} // namespace PressHold

#endif // SCENARIORUNNER_H
