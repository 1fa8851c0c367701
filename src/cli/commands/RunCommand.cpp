#include "cli/commands/RunCommand.h"

#include "scenario/ProbeSession.h"
#include "settings/ProbeSettingsManager.h"

#include <limits>

namespace PressHold {
namespace CLI {

namespace {

bool parseBoundedInt(const QString& text, int minimum, int maximum, int* value)
{
    bool ok = false;
    const int parsed = text.toInt(&ok);
    if (!ok || parsed < minimum || parsed > maximum) {
        return false;
    }
    *value = parsed;
    return true;
}

} // namespace

QString RunCommand::name() const { return "run"; }

QString RunCommand::description() const { return "Run the Press and Hold input probe"; }

void RunCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"pause", "Settle pause around typed text in milliseconds", "ms"});
    parser.addOption({"auto-delay", "Delay after each injected key event in milliseconds", "ms"});
    parser.addOption({"hold-count", "Key presses sent while holding the sample key", "count"});
    parser.addOption({"min-os-version", "Lowest macOS major/minor signature to run on", "signature"});
    parser.addOption({"backend", "Key injector backend (native, synthetic)", "name"});
}

bool RunCommand::resolveOptions(
    const QCommandLineParser& parser, ProbeOptions* options, QString* errorMessage)
{
    *options = ProbeSettingsManager::instance().loadOptions();

    if (parser.isSet("pause")) {
        const QString value = parser.value("pause");
        if (!parseBoundedInt(value, 0, ProbeSettingsManager::kMaxPauseMs, &options->pauseMs)) {
            *errorMessage = QString("Invalid pause value: %1").arg(value);
            return false;
        }
    }

    if (parser.isSet("auto-delay")) {
        const QString value = parser.value("auto-delay");
        if (!parseBoundedInt(value, 0, ProbeSettingsManager::kMaxAutoDelayMs, &options->autoDelayMs)) {
            *errorMessage = QString("Invalid auto delay value: %1").arg(value);
            return false;
        }
    }

    if (parser.isSet("hold-count")) {
        const QString value = parser.value("hold-count");
        if (!parseBoundedInt(value, 1, ProbeSettingsManager::kMaxHoldRepeatCount,
                             &options->holdRepeatCount)) {
            *errorMessage = QString("Invalid hold count: %1").arg(value);
            return false;
        }
    }

    if (parser.isSet("min-os-version")) {
        const QString value = parser.value("min-os-version");
        if (!parseBoundedInt(value, 1, std::numeric_limits<int>::max(), &options->minimumOsVersion)) {
            *errorMessage = QString("Invalid minimum OS version: %1").arg(value);
            return false;
        }
    }

    if (parser.isSet("backend")) {
        const QString value = parser.value("backend");
        if (!ProbeSettingsManager::backendFromString(value, &options->backend)) {
            *errorMessage = QString("Unknown backend: %1").arg(value);
            return false;
        }
    }

    return true;
}

CLIResult RunCommand::toCLIResult(const RunReport& report)
{
    switch (report.outcome) {
    case RunReport::Outcome::Passed:
    case RunReport::Outcome::Skipped:
        return CLIResult::success(report.message);
    case RunReport::Outcome::Failed:
        return CLIResult::failure(report.message, report.mismatchLines());
    case RunReport::Outcome::EnvironmentError:
        break;
    }
    return CLIResult::error(CLIResult::Code::EnvironmentError, report.message);
}

CLIResult RunCommand::execute(const QCommandLineParser& parser)
{
    ProbeOptions options;
    QString errorMessage;
    if (!resolveOptions(parser, &options, &errorMessage)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, errorMessage);
    }

    ProbeSession session(options);
    return toCLIResult(session.run());
}

} // namespace CLI
} // namespace PressHold
