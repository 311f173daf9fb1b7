#ifndef CLI_COMMAND_H
#define CLI_COMMAND_H

#include "CLIResult.h"

#include <QCommandLineParser>
#include <QString>
#include <memory>

namespace CommandWatch {
namespace CLI {

/**
 * @brief One `commandwatch <name>` subcommand
 *
 * The handler strips the command word, lets the command declare its options
 * on a fresh parser, and calls run() once parsing succeeded.
 */
class CLICommand
{
public:
    CLICommand(const QString& name, const QString& summary)
        : m_name(name), m_summary(summary) {}
    virtual ~CLICommand() = default;

    const QString& name() const { return m_name; }
    const QString& summary() const { return m_summary; }

    virtual void addOptions(QCommandLineParser& parser) = 0;
    virtual CLIResult run(const QCommandLineParser& parser) = 0;

    // True when the command hands off to the tray app instead of printing.
    virtual bool startsTray() const { return false; }

private:
    QString m_name;
    QString m_summary;
};

using CLICommandPtr = std::unique_ptr<CLICommand>;

} // namespace CLI
} // namespace CommandWatch

#endif // CLI_COMMAND_H
