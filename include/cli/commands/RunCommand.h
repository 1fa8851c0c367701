#ifndef RUN_COMMAND_H
#define RUN_COMMAND_H

#include "cli/CLICommand.h"
#include "scenario/ProbeOptions.h"

namespace PressHold {

struct RunReport;

namespace CLI {

/**
 * @brief Run the Press and Hold probe and its four scenarios
 */
class RunCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    /**
     * @brief Apply command line overrides on top of stored settings
     * @return false with errorMessage set when a value is invalid
     */
    static bool resolveOptions(
        const QCommandLineParser& parser, ProbeOptions* options, QString* errorMessage);

    static CLIResult toCLIResult(const RunReport& report);
};

} // namespace CLI
} // namespace PressHold

#endif // RUN_COMMAND_H
