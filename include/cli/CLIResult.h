#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QRect>
#include <QString>

namespace CommandWatch {
namespace CLI {

/**
 * @brief Overrides for a GUI session started by `commandwatch run`
 */
struct LaunchOptions
{
    QString stepsFile;
    QRect region;           ///< Invalid when --region was not given
    int pollIntervalMs = -1; ///< -1 keeps the stored interval
    bool noCountdown = false;
};

/**
 * @brief CLI execution result
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,
        InvalidArguments = 2,
        FileError = 3,
    };

    Code code = Code::Success;
    QString message;
    bool launchGui = false;
    LaunchOptions launch;

    bool isSuccess() const { return code == Code::Success; }
    int exitCode() const { return static_cast<int>(code); }

    static CLIResult success(const QString& msg = QString())
    {
        CLIResult result;
        result.message = msg;
        return result;
    }

    static CLIResult error(Code code, const QString& msg)
    {
        CLIResult result;
        result.code = code;
        result.message = msg;
        return result;
    }

    static CLIResult launchWith(const LaunchOptions& options)
    {
        CLIResult result;
        result.launchGui = true;
        result.launch = options;
        return result;
    }
};

} // namespace CLI
} // namespace CommandWatch

#endif // CLI_RESULT_H
