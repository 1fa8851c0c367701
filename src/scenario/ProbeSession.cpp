#include "scenario/ProbeSession.h"

#include "harness/ObservationHarness.h"
#include "input/KeyInjector.h"
#include "scenario/ScenarioThread.h"

#include <QDebug>
#include <QEventLoop>

namespace PressHold {

ProbeSession::ProbeSession(const ProbeOptions &options)
    : m_options(options)
{
}

ProbeSession::~ProbeSession() = default;

void ProbeSession::setEnvironment(const OsVersionGate::Environment &environment)
{
    m_environment = environment;
}

void ProbeSession::setInjectorFactory(InjectorFactory factory)
{
    m_injectorFactory = std::move(factory);
}

std::unique_ptr<KeyInjector> ProbeSession::createInjector(QObject *uiContext, QString *errorMessage) const
{
    if (m_injectorFactory) {
        return m_injectorFactory(uiContext, errorMessage);
    }
    return std::unique_ptr<KeyInjector>(KeyInjector::create(m_options.backend, uiContext, errorMessage));
}

RunReport ProbeSession::run()
{
    RunReport report;

    const OsVersionGate::Environment environment =
        m_environment ? *m_environment : OsVersionGate::currentEnvironment();
    const OsVersionGate::Decision decision =
        OsVersionGate::evaluate(environment, m_options.minimumOsVersion);

    switch (decision.verdict) {
    case OsVersionGate::Verdict::Skip:
        report.outcome = RunReport::Outcome::Skipped;
        report.message = decision.message;
        return report;
    case OsVersionGate::Verdict::EnvironmentError:
        report.outcome = RunReport::Outcome::EnvironmentError;
        report.message = decision.message;
        return report;
    case OsVersionGate::Verdict::Run:
        break;
    }

    qDebug() << "ProbeSession: macOS signature" << decision.signature
             << "pause" << m_options.pauseMs << "ms, auto delay" << m_options.autoDelayMs << "ms";

    ObservationHarness harness;

    QString injectorError;
    std::unique_ptr<KeyInjector> injector = createInjector(&harness, &injectorError);
    if (!injector) {
        report.outcome = RunReport::Outcome::EnvironmentError;
        report.message = QStringLiteral("ERROR: Cannot create key injector: %1").arg(injectorError);
        return report;
    }

    ScenarioRunner runner(*injector, harness, m_options);
    runner.setFocusTimeout(m_focusTimeoutMs);

    ScenarioThread thread;
    thread.initialize(&runner);

    QEventLoop loop;
    QObject::connect(&thread, &QThread::finished, &loop, &QEventLoop::quit);
    thread.start();
    loop.exec();
    thread.wait();

    return thread.report();
}

} // namespace PressHold
