#ifndef CONFIG_COMMAND_H
#define CONFIG_COMMAND_H

#include "cli/CLICommand.h"

#include <QStringList>

namespace PressHold {
namespace CLI {

/**
 * @brief Get or set stored probe configuration
 */
class ConfigCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    static QStringList knownKeys();
};

} // namespace CLI
} // namespace PressHold

#endif // CONFIG_COMMAND_H
