#ifndef CHECK_COMMAND_H
#define CHECK_COMMAND_H

#include "cli/CLICommand.h"

struct StepsDiagnostics;

namespace CommandWatch {
namespace CLI {

/**
 * @brief Validate a steps file and show the step that would be tracked
 */
class CheckCommand : public CLICommand
{
public:
    CheckCommand();

    void addOptions(QCommandLineParser& parser) override;
    CLIResult run(const QCommandLineParser& parser) override;

    static QString formatReport(const QString& filePath,
                                const StepsDiagnostics& diagnostics,
                                const QString& currentStep);
};

} // namespace CLI
} // namespace CommandWatch

#endif // CHECK_COMMAND_H
