#ifndef RUN_COMMAND_H
#define RUN_COMMAND_H

#include "cli/CLICommand.h"

namespace CommandWatch {
namespace CLI {

/**
 * @brief Start the tray application with command line overrides
 */
class RunCommand : public CLICommand
{
public:
    RunCommand();

    void addOptions(QCommandLineParser& parser) override;
    CLIResult run(const QCommandLineParser& parser) override;
    bool startsTray() const override { return true; }

    /**
     * @brief Parse "x,y,width,height"; returns an invalid rect on error.
     */
    static QRect parseRegion(const QString& text);
};

} // namespace CLI
} // namespace CommandWatch

#endif // RUN_COMMAND_H
