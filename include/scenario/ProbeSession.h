#ifndef PROBESESSION_H
#define PROBESESSION_H

#include "platform/OsVersionGate.h"
#include "scenario/ProbeOptions.h"
#include "scenario/ScenarioRunner.h"

#include <functional>
#include <memory>
#include <optional>

namespace PressHold {

class KeyInjector;

/**
 * @brief One complete probe run: gate, window, scenarios, teardown.
 *
 * Must be run on the UI thread. Scenarios execute on a ScenarioThread
 * while a local event loop keeps the window responsive.
 */
class ProbeSession
{
public:
    using InjectorFactory =
        std::function<std::unique_ptr<KeyInjector>(QObject *uiContext, QString *errorMessage)>;

    explicit ProbeSession(const ProbeOptions &options);
    ~ProbeSession();

    // Replaces the detected display and OS version
    void setEnvironment(const OsVersionGate::Environment &environment);

    // Replaces KeyInjector::create() for the configured backend
    void setInjectorFactory(InjectorFactory factory);

    void setFocusTimeout(int timeoutMs) { m_focusTimeoutMs = timeoutMs; }

    RunReport run();

private:
    std::unique_ptr<KeyInjector> createInjector(QObject *uiContext, QString *errorMessage) const;

    ProbeOptions m_options;
    std::optional<OsVersionGate::Environment> m_environment;
    InjectorFactory m_injectorFactory;
    int m_focusTimeoutMs = -1;
};

} // namespace PressHold

#endif // PROBESESSION_H
