#ifndef CONFIG_COMMAND_H
#define CONFIG_COMMAND_H

#include "cli/CLICommand.h"

#include <QVariant>

class QSettings;

namespace CommandWatch {
namespace CLI {

/**
 * @brief Raw access to the stored settings
 *
 * Keys are the QSettings paths the settings managers use, for example
 * `watch/pollIntervalMs`. Known keys are stored with the type their manager
 * reads back: timings as integers, phrase lists as string lists split on
 * commas, and `watch/region` as a QRect parsed from `x,y,width,height`.
 * Other keys are stored as strings.
 */
class ConfigCommand : public CLICommand
{
public:
    ConfigCommand();

    void addOptions(QCommandLineParser& parser) override;
    CLIResult run(const QCommandLineParser& parser) override;

    /**
     * @brief Convert the text given to --set into the stored type for @p key
     * @return An invalid QVariant, with @p error set, when the text does not parse
     */
    static QVariant parseValue(const QString& key, const QString& text, QString* error);

private:
    static CLIResult listAll(const QSettings& settings);
};

} // namespace CLI
} // namespace CommandWatch

#endif // CONFIG_COMMAND_H
