#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QStringList>
#include <vector>

namespace CommandWatch {
namespace CLI {

/**
 * @brief Dispatches `commandwatch <command> [options]`
 *
 * check and config answer on the console. run produces LaunchOptions that
 * main() turns into a tray session.
 */
class CLIHandler
{
public:
    CLIHandler();

    // arguments[0] is the program name.
    CLIResult process(const QStringList& arguments);

    static bool hasArguments(const QStringList& arguments);

    // No command, or a command that starts the tray, needs QApplication.
    bool requiresGUI(const QStringList& arguments) const;

    QString getHelpText() const;
    static QString getVersionText();

private:
    CLICommand* commandNamed(const QString& word) const;

    std::vector<CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace CommandWatch

#endif // CLI_HANDLER_H
