#include "scenario/ScenarioRunner.h"

#include "harness/ObservationHarness.h"
#include "input/KeyInjector.h"

#include <QDebug>
#include <QScopeGuard>

namespace PressHold {

QStringList RunReport::mismatchLines() const
{
    QStringList lines;
    for (const ScenarioOutcome &scenario : scenarios) {
        if (!scenario.passed()) {
            lines.append(scenario.mismatchLine());
        }
    }
    return lines;
}

ScenarioRunner::ScenarioRunner(KeyInjector &injector, ObservationHarness &harness,
                               const ProbeOptions &options)
    : m_injector(injector)
    , m_harness(harness)
    , m_options(options)
{
    m_injector.setAutoDelay(m_options.autoDelayMs);
}

RunReport ScenarioRunner::run()
{
    RunReport report;

    auto teardown = qScopeGuard([this]() {
        m_harness.dispose();
        // Grace period for the UI thread to settle after the window is gone
        m_injector.delay(m_options.pauseMs);
    });

    m_harness.show();
    if (!m_harness.waitForFocus(m_focusTimeoutMs)) {
        report.outcome = RunReport::Outcome::EnvironmentError;
        report.message = QStringLiteral("ERROR: Probe window did not receive input focus");
        return report;
    }

    holdDownSampleKey();
    m_injector.waitForIdle();
    if (observed() == Scenarios::pressAndHoldDisabled()) {
        report.outcome = RunReport::Outcome::EnvironmentError;
        report.message = QStringLiteral(
            "ERROR: Test requires ApplePressAndHoldEnabled system property set to true");
        return report;
    }
    resetText();

    bool failed = false;
    const QVector<Scenario> scenarios = Scenarios::all();
    for (const Scenario &scenario : scenarios) {
        const ScenarioOutcome outcome = runScenario(scenario);
        if (!outcome.passed()) {
            qWarning() << "ScenarioRunner: Scenario" << outcome.name << "failed";
            failed = true;
        }
        report.scenarios.append(outcome);
        resetText();
    }

    if (failed) {
        report.outcome = RunReport::Outcome::Failed;
        report.message = QStringLiteral(
            "TEST FAILED: User input did not continue normally after accent menu popup");
    } else {
        report.outcome = RunReport::Outcome::Passed;
        report.message = QStringLiteral("TEST PASSED");
    }
    return report;
}

void ScenarioRunner::holdDownSampleKey()
{
    m_injector.holdKey(Scenarios::sampleKey(), m_options.holdRepeatCount);
}

void ScenarioRunner::typeSampleBody()
{
    m_injector.delay(m_options.pauseMs);
    m_injector.typeText(Scenarios::sampleBody());
    m_injector.delay(m_options.pauseMs);
    m_injector.waitForIdle();
}

ScenarioOutcome ScenarioRunner::runScenario(const Scenario &scenario)
{
    ScenarioOutcome outcome;
    outcome.name = scenario.name;
    outcome.expected = scenario.expected;
    outcome.textBefore = observed();

    qDebug() << "ScenarioRunner: Scenario" << scenario.name;

    holdDownSampleKey();
    m_injector.keyPress(scenario.followUpKey);
    m_injector.keyRelease(scenario.followUpKey);
    typeSampleBody();

    outcome.received = observed();
    return outcome;
}

void ScenarioRunner::resetText()
{
    const ResultSlot &result = m_harness.result();
    const quint64 serialBefore = result.serial();
    const bool expectUpdate = !result.latest().isEmpty();

    m_harness.clearText();
    m_injector.waitForIdle();

    if (expectUpdate && !result.waitForUpdate(serialBefore, qMax(m_options.pauseMs, kClearTimeoutMs))) {
        qWarning() << "ScenarioRunner: Text field was not cleared, still" << result.latest();
    }
}

QString ScenarioRunner::observed() const
{
    return m_harness.result().latest();
}

} // namespace PressHold
