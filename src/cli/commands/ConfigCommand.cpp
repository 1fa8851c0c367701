#include "cli/commands/ConfigCommand.h"

#include "settings/ProbeSettingsManager.h"
#include "settings/Settings.h"

#include <QSettings>
#include <QTextStream>

namespace PressHold {
namespace CLI {

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Get or set probe configuration"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

QStringList ConfigCommand::knownKeys()
{
    return {
        ProbeSettingsManager::kSettingsKeyPauseMs,
        ProbeSettingsManager::kSettingsKeyAutoDelayMs,
        ProbeSettingsManager::kSettingsKeyHoldRepeatCount,
        ProbeSettingsManager::kSettingsKeyMinimumOsVersion,
        ProbeSettingsManager::kSettingsKeyInjectorBackend,
    };
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    auto& manager = ProbeSettingsManager::instance();

    // --list: Effective values, defaults included
    if (parser.isSet("list")) {
        QString output;
        QTextStream out(&output);
        out << "Current settings:\n";
        out << QString("  %1 = %2\n").arg(ProbeSettingsManager::kSettingsKeyPauseMs).arg(manager.loadPauseMs());
        out << QString("  %1 = %2\n").arg(ProbeSettingsManager::kSettingsKeyAutoDelayMs).arg(manager.loadAutoDelayMs());
        out << QString("  %1 = %2\n").arg(ProbeSettingsManager::kSettingsKeyHoldRepeatCount).arg(manager.loadHoldRepeatCount());
        out << QString("  %1 = %2\n").arg(ProbeSettingsManager::kSettingsKeyMinimumOsVersion).arg(manager.loadMinimumOsVersion());
        out << QString("  %1 = %2\n").arg(ProbeSettingsManager::kSettingsKeyInjectorBackend,
                                          ProbeSettingsManager::backendToString(manager.loadInjectorBackend()));
        return CLIResult::success(output);
    }

    // --get: Get setting value
    if (parser.isSet("get")) {
        const QString key = parser.value("get");
        if (!knownKeys().contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not found: %1").arg(key));
        }
        auto settings = getSettings();
        if (!settings.contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not set: %1").arg(key));
        }
        return CLIResult::success(settings.value(key).toString());
    }

    // --set: Set setting value
    if (parser.isSet("set")) {
        const QString key = parser.value("set");
        if (!knownKeys().contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not found: %1").arg(key));
        }
        const QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }
        const QString value = positionalArgs.first();

        if (key == QLatin1String(ProbeSettingsManager::kSettingsKeyInjectorBackend)) {
            KeyInjectorBackend backend = KeyInjectorBackend::Native;
            if (!ProbeSettingsManager::backendFromString(value, &backend)) {
                return CLIResult::error(
                    CLIResult::Code::InvalidArguments, QString("Unknown backend: %1").arg(value));
            }
            manager.saveInjectorBackend(backend);
        } else {
            bool ok = false;
            const int number = value.toInt(&ok);
            if (!ok) {
                return CLIResult::error(
                    CLIResult::Code::InvalidArguments, QString("Invalid number: %1").arg(value));
            }
            auto settings = getSettings();
            settings.setValue(key, number);
            settings.sync();
        }
        return CLIResult::success(QString("Set %1 = %2").arg(key, value));
    }

    // --reset: Reset to defaults
    if (parser.isSet("reset")) {
        auto settings = getSettings();
        for (const QString& key : knownKeys()) {
            settings.remove(key);
        }
        settings.sync();
        return CLIResult::success("Settings reset to defaults");
    }

    return CLIResult::error(CLIResult::Code::InvalidArguments, parser.helpText());
}

} // namespace CLI
} // namespace PressHold
