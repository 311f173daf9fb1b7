#include "cli/CLIHandler.h"

#include "cli/commands/CheckCommand.h"
#include "cli/commands/ConfigCommand.h"
#include "cli/commands/RunCommand.h"
#include "version.h"

#include <QTextStream>
#include <algorithm>

namespace CommandWatch {
namespace CLI {

namespace {

bool isHelpFlag(const QString& word)
{
    return word == QLatin1String("-h") || word == QLatin1String("--help");
}

bool isVersionFlag(const QString& word)
{
    return word == QLatin1String("-v") || word == QLatin1String("--version");
}

} // namespace

CLIHandler::CLIHandler()
{
    m_commands.push_back(std::make_unique<CheckCommand>());
    m_commands.push_back(std::make_unique<ConfigCommand>());
    m_commands.push_back(std::make_unique<RunCommand>());
    std::sort(m_commands.begin(), m_commands.end(),
              [](const CLICommandPtr& a, const CLICommandPtr& b) { return a->name() < b->name(); });
}

bool CLIHandler::hasArguments(const QStringList& arguments)
{
    return arguments.size() > 1;
}

bool CLIHandler::requiresGUI(const QStringList& arguments) const
{
    if (!hasArguments(arguments)) {
        return true;
    }
    const CLICommand* command = commandNamed(arguments.at(1));
    return command && command->startsTray();
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    if (!hasArguments(arguments)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, getHelpText());
    }

    const QString word = arguments.at(1);
    if (isHelpFlag(word)) {
        return CLIResult::success(getHelpText());
    }
    if (isVersionFlag(word)) {
        return CLIResult::success(getVersionText());
    }

    CLICommand* command = commandNamed(word);
    if (!command) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                QString("Unknown command: %1\n\n%2").arg(word, getHelpText()));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(command->summary());
    const QCommandLineOption helpOption = parser.addHelpOption();
    command->addOptions(parser);

    // The parser treats argv[0] as the program, so drop only the command word
    QStringList commandArguments = arguments;
    commandArguments.removeAt(1);
    if (!parser.parse(commandArguments)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }
    if (parser.isSet(helpOption)) {
        return CLIResult::success(parser.helpText());
    }

    return command->run(parser);
}

CLICommand* CLIHandler::commandNamed(const QString& word) const
{
    for (const CLICommandPtr& command : m_commands) {
        if (command->name().compare(word, Qt::CaseInsensitive) == 0) {
            return command.get();
        }
    }
    return nullptr;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << COMMANDWATCH_APP_NAME << " watches a screen region and answers the prompts it reads.\n\n"
        << "Usage: commandwatch [<command> [options]]\n"
        << "With no command the tray application starts.\n\n"
        << "Commands:\n";
    for (const CLICommandPtr& command : m_commands) {
        out << "  " << command->name().leftJustified(10) << command->summary() << "\n";
    }
    out << "\nOptions:\n"
        << "  -h, --help      Show this help\n"
        << "  -v, --version   Show the version\n\n"
        << "Run 'commandwatch <command> --help' for the options of one command.\n";
    return help;
}

QString CLIHandler::getVersionText()
{
    return QString("%1 %2").arg(COMMANDWATCH_APP_NAME, COMMANDWATCH_VERSION);
}

} // namespace CLI
} // namespace CommandWatch
