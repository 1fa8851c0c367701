#ifndef PROBESETTINGSMANAGER_H
#define PROBESETTINGSMANAGER_H

#include "input/KeyInjector.h"

#include <QString>

namespace PressHold {

struct ProbeOptions;

/**
 * @brief Singleton class for managing probe timing and injector settings.
 *
 * Values persist in the application settings store and are clamped
 * to their valid ranges on load. Command line options override them
 * for a single run.
 */
class ProbeSettingsManager
{
public:
    static ProbeSettingsManager& instance();

    // Settle pause around typed text and teardown grace delay (0 - 60000 ms)
    int loadPauseMs() const;
    void savePauseMs(int pauseMs);

    // Delay after every injected key event (0 - 1000 ms)
    int loadAutoDelayMs() const;
    void saveAutoDelayMs(int autoDelayMs);

    // Key presses sent while holding the sample key (1 - 100)
    int loadHoldRepeatCount() const;
    void saveHoldRepeatCount(int count);

    // Lowest major/minor macOS signature with Press and Hold
    int loadMinimumOsVersion() const;
    void saveMinimumOsVersion(int signature);

    KeyInjectorBackend loadInjectorBackend() const;
    void saveInjectorBackend(KeyInjectorBackend backend);

    ProbeOptions loadOptions() const;

    static QString backendToString(KeyInjectorBackend backend);
    static bool backendFromString(const QString& name, KeyInjectorBackend* backend);

    // Default values
    static constexpr int kDefaultPauseMs = 2000;
    static constexpr int kDefaultAutoDelayMs = 50;
    static constexpr int kDefaultHoldRepeatCount = 10;
    static constexpr int kDefaultMinimumOsVersion = 107;
    static constexpr KeyInjectorBackend kDefaultInjectorBackend = KeyInjectorBackend::Native;

    static constexpr int kMaxPauseMs = 60000;
    static constexpr int kMaxAutoDelayMs = 1000;
    static constexpr int kMaxHoldRepeatCount = 100;

    static constexpr const char* kSettingsKeyPauseMs = "probe/pauseMs";
    static constexpr const char* kSettingsKeyAutoDelayMs = "probe/autoDelayMs";
    static constexpr const char* kSettingsKeyHoldRepeatCount = "probe/holdRepeatCount";
    static constexpr const char* kSettingsKeyMinimumOsVersion = "probe/minimumOsVersion";
    static constexpr const char* kSettingsKeyInjectorBackend = "probe/injectorBackend";

private:
    ProbeSettingsManager() = default;
    ProbeSettingsManager(const ProbeSettingsManager&) = delete;
    ProbeSettingsManager& operator=(const ProbeSettingsManager&) = delete;
};

} // namespace PressHold

#endif // PROBESETTINGSMANAGER_H
