#include <QtTest/QtTest>
#include <QMutex>

#include "MockPressAndHoldInjector.h"
#include "harness/ObservationHarness.h"
#include "scenario/Scenario.h"
#include "scenario/ScenarioRunner.h"
#include "scenario/ScenarioThread.h"

namespace {

QMutex s_logMutex;
QStringList s_logLines;

void captureMessage(QtMsgType type, const QMessageLogContext &, const QString &message)
{
    if (type == QtDebugMsg) {
        return;
    }
    QMutexLocker locker(&s_logMutex);
    s_logLines.append(message);
}

} // namespace

using PressHold::ObservationHarness;
using PressHold::ProbeOptions;
using PressHold::RunReport;
using PressHold::ScenarioOutcome;
using PressHold::ScenarioRunner;
using PressHold::ScenarioThread;

/**
 * @brief Runs the probe against an emulated accent popup.
 *
 * Covers:
 * - All four scenarios passing on a working popup
 * - Abort before scenarios when Press and Hold is disabled
 * - Mismatch accumulation and reporting
 * - Text reset between scenarios and guaranteed teardown
 */
class tst_ScenarioRunner : public QObject
{
    Q_OBJECT

private slots:
    void scenarios_definitionsMatchExpectedLiterals();
    void mismatchLine_format();

    void run_workingPopup_allScenariosPass();
    void run_everyScenarioStartsFromEmptyText();
    void run_disabledPressAndHold_abortsBeforeScenarios();
    void run_inputFreezesAfterPopup_allScenariosFail();
    void run_droppedAccent_failsOnlyAccentScenario();
    void run_windowNeverFocused_reportsEnvironmentError();
    void run_failedScenarios_logNamesWithoutMismatchLines();

private:
    static ProbeOptions fastOptions();
    void runOnWorker(MockPressAndHoldInjector::Behavior behavior, RunReport *report,
                     int *popupCount = nullptr);
};

ProbeOptions tst_ScenarioRunner::fastOptions()
{
    ProbeOptions options;
    options.pauseMs = 20;
    options.autoDelayMs = 1;
    options.holdRepeatCount = 10;
    options.backend = PressHold::KeyInjectorBackend::Synthetic;
    return options;
}

void tst_ScenarioRunner::runOnWorker(MockPressAndHoldInjector::Behavior behavior, RunReport *report,
                                     int *popupCount)
{
    ObservationHarness harness;
    MockPressAndHoldInjector injector(&harness);
    injector.setBehavior(behavior);

    ScenarioRunner runner(injector, harness, fastOptions());
    runner.setFocusTimeout(10000);

    ScenarioThread thread;
    thread.initialize(&runner);
    thread.start();

    QTRY_VERIFY_WITH_TIMEOUT(thread.isFinished(), 30000);
    thread.wait();

    QCOMPARE(harness.state(), ObservationHarness::State::Disposed);
    QVERIFY(!harness.window());

    *report = thread.report();
    if (popupCount) {
        *popupCount = injector.popupCount();
    }
}

void tst_ScenarioRunner::scenarios_definitionsMatchExpectedLiterals()
{
    const auto scenarios = PressHold::Scenarios::all();
    QCOMPARE(scenarios.size(), 4);

    QCOMPARE(scenarios.at(0).followUpKey, int(Qt::Key_2));
    QCOMPARE(scenarios.at(0).expected, QString::fromUtf8("échantillon"));
    QCOMPARE(scenarios.at(1).followUpKey, int(Qt::Key_Backspace));
    QCOMPARE(scenarios.at(1).expected, QStringLiteral("chantillon"));
    QCOMPARE(scenarios.at(2).followUpKey, int(Qt::Key_Escape));
    QCOMPARE(scenarios.at(2).expected, QStringLiteral("echantillon"));
    QCOMPARE(scenarios.at(3).followUpKey, int(Qt::Key_0));
    QCOMPARE(scenarios.at(3).expected, QStringLiteral("e0chantillon"));

    QCOMPARE(PressHold::Scenarios::sampleKey(), int(Qt::Key_E));
    QCOMPARE(PressHold::Scenarios::sampleBody(), QStringLiteral("chantillon"));
    QCOMPARE(PressHold::Scenarios::pressAndHoldDisabled(), QStringLiteral("eeeeeeeeee"));
}

void tst_ScenarioRunner::mismatchLine_format()
{
    ScenarioOutcome outcome;
    outcome.expected = QStringLiteral("echantillon");
    outcome.received = QStringLiteral("e");

    QVERIFY(!outcome.passed());
    QCOMPARE(outcome.mismatchLine(),
             QStringLiteral("Bad sample: expected \"echantillon\", but received \"e\""));
}

void tst_ScenarioRunner::run_workingPopup_allScenariosPass()
{
    RunReport report;
    int popupCount = 0;
    runOnWorker(MockPressAndHoldInjector::Behavior::Normal, &report, &popupCount);
    if (QTest::currentTestFailed()) {
        return;
    }

    QCOMPARE(report.outcome, RunReport::Outcome::Passed);
    QCOMPARE(report.message, QStringLiteral("TEST PASSED"));
    QCOMPARE(report.scenarios.size(), 4);
    for (const ScenarioOutcome &scenario : report.scenarios) {
        QVERIFY2(scenario.passed(), qPrintable(scenario.mismatchLine()));
    }
    QVERIFY(report.mismatchLines().isEmpty());

    // Probe plus one popup per scenario
    QCOMPARE(popupCount, 5);
}

void tst_ScenarioRunner::run_everyScenarioStartsFromEmptyText()
{
    RunReport report;
    runOnWorker(MockPressAndHoldInjector::Behavior::Normal, &report);
    if (QTest::currentTestFailed()) {
        return;
    }

    QCOMPARE(report.scenarios.size(), 4);
    for (const ScenarioOutcome &scenario : report.scenarios) {
        QVERIFY2(scenario.textBefore.isEmpty(), qPrintable(scenario.name));
    }
}

void tst_ScenarioRunner::run_disabledPressAndHold_abortsBeforeScenarios()
{
    RunReport report;
    runOnWorker(MockPressAndHoldInjector::Behavior::Disabled, &report);
    if (QTest::currentTestFailed()) {
        return;
    }

    QCOMPARE(report.outcome, RunReport::Outcome::EnvironmentError);
    QVERIFY(report.message.contains("ApplePressAndHoldEnabled"));
    QVERIFY(!report.scenariosRan());
}

void tst_ScenarioRunner::run_inputFreezesAfterPopup_allScenariosFail()
{
    RunReport report;
    runOnWorker(MockPressAndHoldInjector::Behavior::FreezeAfterPopup, &report);
    if (QTest::currentTestFailed()) {
        return;
    }

    QCOMPARE(report.outcome, RunReport::Outcome::Failed);
    QCOMPARE(report.message,
             QStringLiteral("TEST FAILED: User input did not continue normally after accent menu popup"));

    // Every scenario still ran after the first failure
    QCOMPARE(report.scenarios.size(), 4);
    const QStringList lines = report.mismatchLines();
    QCOMPARE(lines.size(), 4);
    QCOMPARE(lines.first(),
             QString::fromUtf8("Bad sample: expected \"échantillon\", but received \"e\""));
}

void tst_ScenarioRunner::run_droppedAccent_failsOnlyAccentScenario()
{
    RunReport report;
    runOnWorker(MockPressAndHoldInjector::Behavior::DropAccent, &report);
    if (QTest::currentTestFailed()) {
        return;
    }

    QCOMPARE(report.outcome, RunReport::Outcome::Failed);
    QCOMPARE(report.scenarios.size(), 4);
    QVERIFY(!report.scenarios.at(0).passed());
    QCOMPARE(report.scenarios.at(0).received, QStringLiteral("echantillon"));
    QVERIFY(report.scenarios.at(1).passed());
    QVERIFY(report.scenarios.at(2).passed());
    QVERIFY(report.scenarios.at(3).passed());

    QCOMPARE(report.mismatchLines(),
             QStringList({QString::fromUtf8(
                 "Bad sample: expected \"échantillon\", but received \"echantillon\"")}));
}

void tst_ScenarioRunner::run_windowNeverFocused_reportsEnvironmentError()
{
    ObservationHarness harness;
    // Disposed before the run: show() is a no-op and the focus wait is released empty
    harness.dispose();

    MockPressAndHoldInjector injector(&harness);
    ScenarioRunner runner(injector, harness, fastOptions());
    runner.setFocusTimeout(5000);

    ScenarioThread thread;
    thread.initialize(&runner);
    thread.start();
    QTRY_VERIFY_WITH_TIMEOUT(thread.isFinished(), 10000);
    thread.wait();

    const RunReport report = thread.report();
    QCOMPARE(report.outcome, RunReport::Outcome::EnvironmentError);
    QCOMPARE(report.message, QStringLiteral("ERROR: Probe window did not receive input focus"));
    QVERIFY(!report.scenariosRan());
    QCOMPARE(injector.pressCount(), 0);
}

void tst_ScenarioRunner::run_failedScenarios_logNamesWithoutMismatchLines()
{
    {
        QMutexLocker locker(&s_logMutex);
        s_logLines.clear();
    }
    const QtMessageHandler previous = qInstallMessageHandler(captureMessage);

    RunReport report;
    runOnWorker(MockPressAndHoldInjector::Behavior::FreezeAfterPopup, &report);

    qInstallMessageHandler(previous);
    if (QTest::currentTestFailed()) {
        return;
    }

    QStringList lines;
    {
        QMutexLocker locker(&s_logMutex);
        lines = s_logLines;
    }

    // Mismatch lines leave only through the report
    QCOMPARE(report.mismatchLines().size(), 4);
    QCOMPARE(lines.filter(QStringLiteral("Bad sample")).size(), 0);
    QCOMPARE(lines.filter(QStringLiteral("ScenarioRunner: Scenario")).size(), 4);
}

QTEST_MAIN(tst_ScenarioRunner)
#include "tst_ScenarioRunner.moc"
