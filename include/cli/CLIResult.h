#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QString>
#include <QStringList>

namespace PressHold {
namespace CLI {

/**
 * @brief CLI execution result
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,
        InvalidArguments = 2,
        EnvironmentError = 3,
        TestFailed = 4,
    };

    Code code = Code::Success;
    QString message;
    QStringList details; // Written to stderr before the message

    bool isSuccess() const { return code == Code::Success; }

    static CLIResult success(const QString& msg = QString())
    {
        return {Code::Success, msg, {}};
    }

    static CLIResult error(Code code, const QString& msg) { return {code, msg, {}}; }

    static CLIResult failure(const QString& msg, const QStringList& details)
    {
        return {Code::TestFailed, msg, details};
    }
};

} // namespace CLI
} // namespace PressHold

#endif // CLI_RESULT_H
