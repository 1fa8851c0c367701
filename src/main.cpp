#include <QApplication>
#include <QCoreApplication>
#include <QTextStream>

#include "cli/CLIHandler.h"
#include "platform/OsVersionGate.h"
#include "settings/Settings.h"
#include "version.h"

namespace {

QStringList argumentsFrom(int argc, char *argv[])
{
    QStringList arguments;
    for (int i = 0; i < argc; ++i) {
        arguments.append(QString::fromLocal8Bit(argv[i]));
    }
    return arguments;
}

// Value of Qt's own -platform option, if given
QString platformArgument(const QStringList &arguments)
{
    const int index = arguments.indexOf(QStringLiteral("-platform"));
    if (index < 0 || index + 1 >= arguments.size()) {
        return QString();
    }
    return arguments.at(index + 1);
}

int writeResult(const PressHold::CLI::CLIResult &result)
{
    QTextStream out(stdout);
    QTextStream err(stderr);
    for (const QString &line : result.details) {
        err << line << Qt::endl;
    }
    if (!result.message.isEmpty()) {
        if (result.isSuccess()) {
            out << result.message << Qt::endl;
        } else {
            err << result.message << Qt::endl;
        }
    }
    return static_cast<int>(result.code);
}

} // namespace

int main(int argc, char *argv[])
{
    // Set application metadata
    QCoreApplication::setApplicationName(PressHold::kApplicationName);
    QCoreApplication::setOrganizationName(PressHold::kOrganizationName);
    QCoreApplication::setApplicationVersion(PRESSHOLD_VERSION);

    using PressHold::CLI::CLIHandler;
    const QStringList arguments = argumentsFrom(argc, argv);
    CLIHandler handler;

    if (!CLIHandler::needsDisplay(arguments)) {
        QCoreApplication app(argc, argv);
        return writeResult(handler.process(app.arguments()));
    }

    // QApplication aborts when its platform plugin cannot reach a display
    if (!PressHold::OsVersionGate::displayServerAvailable(platformArgument(arguments))) {
        return writeResult(CLIHandler::noDisplayResult());
    }

    QApplication app(argc, argv);
    return writeResult(handler.process(app.arguments()));
}
