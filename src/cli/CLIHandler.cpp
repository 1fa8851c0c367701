#include "cli/CLIHandler.h"

#include "cli/commands/ConfigCommand.h"
#include "cli/commands/RunCommand.h"
#include "platform/OsVersionGate.h"
#include "version.h"

#include <QCommandLineParser>
#include <QTextStream>

namespace PressHold {
namespace CLI {

CLIHandler::CLIHandler() { registerCommands(); }

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommands()
{
    auto addCmd = [this](CLICommandPtr cmd) { m_commands[cmd->name()] = std::move(cmd); };

    addCmd(std::make_unique<RunCommand>());
    addCmd(std::make_unique<ConfigCommand>());
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    QStringList cmdArgs = arguments;
    if (cmdArgs.isEmpty()) {
        cmdArgs.append(QStringLiteral(PRESSHOLD_APP_NAME));
    }

    if (cmdArgs.size() > 1) {
        const QString& cmdOrOption = cmdArgs.at(1);

        // Handle global options
        if (cmdOrOption == "--help" || cmdOrOption == "-h") {
            return CLIResult::success(getHelpText());
        }
        if (cmdOrOption == "--version" || cmdOrOption == "-v") {
            return CLIResult::success(getVersionText());
        }
    }

    // Options without a command belong to the default command
    CLICommand* command = nullptr;
    if (cmdArgs.size() < 2 || cmdArgs.at(1).startsWith('-')) {
        command = findCommand(kDefaultCommand);
    } else {
        command = findCommand(cmdArgs.at(1));
        if (!command) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QString("Unknown command: %1\n\n%2").arg(cmdArgs.at(1), getHelpText()));
        }
        cmdArgs.removeAt(1); // Remove command name
    }

    // Setup and parse command arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(command->description());
    parser.addHelpOption();

    command->setupOptions(parser);

    if (!parser.parse(cmdArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    return command->execute(parser);
}

bool CLIHandler::needsDisplay(const QStringList& arguments)
{
    if (arguments.size() < 2) {
        return true;
    }

    const QString& cmdOrOption = arguments.at(1);
    if (cmdOrOption == "--help" || cmdOrOption == "-h"
        || cmdOrOption == "--version" || cmdOrOption == "-v") {
        return false;
    }

    QStringList cmdArgs = arguments.mid(1);
    if (!cmdOrOption.startsWith('-')) {
        if (cmdOrOption.toLower() != QLatin1String(kDefaultCommand)) {
            return false;
        }
        cmdArgs.removeFirst();
    }

    // "run --help" only prints the parser help
    return !cmdArgs.contains("--help") && !cmdArgs.contains("-h");
}

CLIResult CLIHandler::noDisplayResult()
{
    return CLIResult::error(CLIResult::Code::EnvironmentError, OsVersionGate::headlessMessage());
}

CLICommand* CLIHandler::findCommand(const QString& name) const
{
    auto it = m_commands.find(name.toLower());
    return it != m_commands.end() ? it->second.get() : nullptr;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << "PressHoldProbe - macOS Press and Hold input regression probe\n\n";
    out << "Usage: pressholdprobe [command] [options]\n\n";
    out << "Commands:\n";

    // Sort commands for consistent display
    QStringList names;
    for (const auto& [name, cmd] : m_commands) {
        names.append(name);
    }
    names.sort();

    for (const QString& name : names) {
        const auto& cmd = m_commands.at(name);
        out << QString("  %1  %2\n").arg(name, -10).arg(cmd->description());
    }

    out << "\nGlobal Options:\n";
    out << "  -h, --help     Display this help message\n";
    out << "  -v, --version  Display version information\n";
    out << "\nWithout a command, 'run' is executed.\n";
    out << "Use 'pressholdprobe <command> --help' for more information about a command.\n";

    return help;
}

QString CLIHandler::getVersionText()
{
    return QString("%1 version %2").arg(PRESSHOLD_APP_NAME, PRESSHOLD_VERSION);
}

} // namespace CLI
} // namespace PressHold
