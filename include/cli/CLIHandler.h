#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

namespace PressHold {
namespace CLI {

/**
 * @brief CLI handler for parsing and executing commands
 *
 * Without a command name the probe runs with stored settings, which is
 * how a hosting test harness launches the binary.
 */
class CLIHandler
{
public:
    CLIHandler();
    ~CLIHandler();

    /**
     * @brief Parse and execute command line
     * @param arguments Command line arguments (including program name)
     * @return Execution result
     */
    CLIResult process(const QStringList& arguments);

    /**
     * @brief Get main help text
     */
    QString getHelpText() const;

    /**
     * @brief Get version text
     */
    static QString getVersionText();

    /**
     * @brief Whether the arguments resolve to a probe run
     *
     * Only a run needs a QApplication; help, version and config work
     * under QCoreApplication on hosts without a display.
     */
    static bool needsDisplay(const QStringList& arguments);

    // Result of a run on a host without a reachable display server
    static CLIResult noDisplayResult();

    static constexpr const char* kDefaultCommand = "run";

private:
    void registerCommands();
    CLICommand* findCommand(const QString& name) const;

    std::map<QString, CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace PressHold

#endif // CLI_HANDLER_H
