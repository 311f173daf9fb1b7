#ifndef COMMANDINTERPRETER_H
#define COMMANDINTERPRETER_H

#include <QString>
#include <QStringList>

/**
 * @brief Parsed console command typed into the control panel.
 */
struct ConsoleCommand {
    enum class Type {
        Empty,
        Step,       ///< step <name>: start tracking a metrics step
        Complete,   ///< end the current metrics step as complete
        Fail,       ///< end the current metrics step as failed
        Metrics,    ///< show the metrics report
        Pause,
        Resume,
        Reselect,   ///< select a new watch region
        Next,       ///< send the next-step message
        Finish,     ///< send the complete-step message
        Help,
        Log,        ///< show the log file location
        Stop,       ///< stop, exit or quit
        Unknown
    };

    Type type = Type::Empty;
    QString argument;
    QString raw;

    bool isValid() const { return type != Type::Empty && type != Type::Unknown; }
};

namespace CommandInterpreter {

/**
 * @brief Parse a console line. Keywords are case-insensitive and the line
 * is trimmed. A bare "step" without a name is Unknown.
 */
ConsoleCommand parse(const QString& line);

QString helpText();
QStringList commandNames();

} // namespace CommandInterpreter

#endif // COMMANDINTERPRETER_H
