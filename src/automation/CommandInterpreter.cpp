#include "automation/CommandInterpreter.h"

namespace {

struct CommandEntry {
    const char* name;
    ConsoleCommand::Type type;
    const char* help;
};

constexpr CommandEntry kCommands[] = {
    {"step",     ConsoleCommand::Type::Step,     "Start tracking a step (step <name>)"},
    {"complete", ConsoleCommand::Type::Complete, "Mark the current step complete"},
    {"fail",     ConsoleCommand::Type::Fail,     "Mark the current step failed"},
    {"metrics",  ConsoleCommand::Type::Metrics,  "Show project metrics"},
    {"pause",    ConsoleCommand::Type::Pause,    "Pause automation"},
    {"resume",   ConsoleCommand::Type::Resume,   "Resume automation"},
    {"reselect", ConsoleCommand::Type::Reselect, "Reselect region"},
    {"next",     ConsoleCommand::Type::Next,     "Force next step"},
    {"finish",   ConsoleCommand::Type::Finish,   "Force complete step"},
    {"help",     ConsoleCommand::Type::Help,     "Show this help"},
    {"log",      ConsoleCommand::Type::Log,      "Show log location"},
    {"stop",     ConsoleCommand::Type::Stop,     "Stop automation (also exit, quit)"},
    {"exit",     ConsoleCommand::Type::Stop,     nullptr},
    {"quit",     ConsoleCommand::Type::Stop,     nullptr},
};

} // namespace

namespace CommandInterpreter {

ConsoleCommand parse(const QString& line)
{
    ConsoleCommand command;
    command.raw = line.trimmed();
    if (command.raw.isEmpty()) {
        return command;
    }

    const int space = command.raw.indexOf(QLatin1Char(' '));
    const QString keyword = (space < 0 ? command.raw : command.raw.left(space)).toLower();
    const QString argument = space < 0 ? QString() : command.raw.mid(space + 1).trimmed();

    command.type = ConsoleCommand::Type::Unknown;
    for (const auto& entry : kCommands) {
        if (keyword != QLatin1String(entry.name)) {
            continue;
        }
        if (entry.type == ConsoleCommand::Type::Step) {
            if (!argument.isEmpty()) {
                command.type = entry.type;
                command.argument = argument;
            }
        } else if (argument.isEmpty()) {
            command.type = entry.type;
        }
        break;
    }
    return command;
}

QString helpText()
{
    QStringList lines;
    lines << QStringLiteral("Available commands:");
    for (const auto& entry : kCommands) {
        if (!entry.help) {
            continue;
        }
        lines << QStringLiteral("  %1 : %2")
                     .arg(QString::fromLatin1(entry.name), -10)
                     .arg(QString::fromLatin1(entry.help));
    }
    return lines.join(QLatin1Char('\n'));
}

QStringList commandNames()
{
    QStringList names;
    for (const auto& entry : kCommands) {
        names << QString::fromLatin1(entry.name);
    }
    return names;
}

} // namespace CommandInterpreter
