#include "settings/ProbeSettingsManager.h"
#include "scenario/ProbeOptions.h"
#include "settings/Settings.h"

#include <QSettings>
#include <QtGlobal>

namespace PressHold {

ProbeSettingsManager& ProbeSettingsManager::instance()
{
    static ProbeSettingsManager instance;
    return instance;
}

int ProbeSettingsManager::loadPauseMs() const
{
    auto settings = getSettings();
    const int pauseMs = settings.value(kSettingsKeyPauseMs, kDefaultPauseMs).toInt();
    return qBound(0, pauseMs, kMaxPauseMs);
}

void ProbeSettingsManager::savePauseMs(int pauseMs)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyPauseMs, pauseMs);
}

int ProbeSettingsManager::loadAutoDelayMs() const
{
    auto settings = getSettings();
    const int autoDelayMs = settings.value(kSettingsKeyAutoDelayMs, kDefaultAutoDelayMs).toInt();
    return qBound(0, autoDelayMs, kMaxAutoDelayMs);
}

void ProbeSettingsManager::saveAutoDelayMs(int autoDelayMs)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyAutoDelayMs, autoDelayMs);
}

int ProbeSettingsManager::loadHoldRepeatCount() const
{
    auto settings = getSettings();
    const int count = settings.value(kSettingsKeyHoldRepeatCount, kDefaultHoldRepeatCount).toInt();
    return qBound(1, count, kMaxHoldRepeatCount);
}

void ProbeSettingsManager::saveHoldRepeatCount(int count)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyHoldRepeatCount, count);
}

int ProbeSettingsManager::loadMinimumOsVersion() const
{
    auto settings = getSettings();
    bool ok = false;
    const int signature = settings.value(kSettingsKeyMinimumOsVersion, kDefaultMinimumOsVersion).toInt(&ok);
    if (!ok || signature <= 0) {
        return kDefaultMinimumOsVersion;
    }
    return signature;
}

void ProbeSettingsManager::saveMinimumOsVersion(int signature)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyMinimumOsVersion, signature);
}

KeyInjectorBackend ProbeSettingsManager::loadInjectorBackend() const
{
    auto settings = getSettings();
    const QString name = settings.value(kSettingsKeyInjectorBackend,
                                        backendToString(kDefaultInjectorBackend)).toString();
    KeyInjectorBackend backend = kDefaultInjectorBackend;
    if (!backendFromString(name, &backend)) {
        return kDefaultInjectorBackend;
    }
    return backend;
}

void ProbeSettingsManager::saveInjectorBackend(KeyInjectorBackend backend)
{
    auto settings = getSettings();
    settings.setValue(kSettingsKeyInjectorBackend, backendToString(backend));
}

ProbeOptions ProbeSettingsManager::loadOptions() const
{
    ProbeOptions options;
    options.pauseMs = loadPauseMs();
    options.autoDelayMs = loadAutoDelayMs();
    options.holdRepeatCount = loadHoldRepeatCount();
    options.minimumOsVersion = loadMinimumOsVersion();
    options.backend = loadInjectorBackend();
    return options;
}

QString ProbeSettingsManager::backendToString(KeyInjectorBackend backend)
{
    switch (backend) {
    case KeyInjectorBackend::Synthetic:
        return QStringLiteral("synthetic");
    case KeyInjectorBackend::Native:
        break;
    }
    return QStringLiteral("native");
}

bool ProbeSettingsManager::backendFromString(const QString& name, KeyInjectorBackend* backend)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("native")) {
        *backend = KeyInjectorBackend::Native;
        return true;
    }
    if (normalized == QLatin1String("synthetic")) {
        *backend = KeyInjectorBackend::Synthetic;
        return true;
    }
    return false;
}

} // namespace PressHold
