#include "cli/commands/RunCommand.h"

#include "settings/WatchSettingsManager.h"

#include <QFileInfo>

namespace CommandWatch {
namespace CLI {

namespace {
constexpr int kMinIntervalMs = 100;
constexpr int kMaxIntervalMs = 10000;
}

RunCommand::RunCommand()
    : CLICommand(QStringLiteral("run"), QStringLiteral("Start watching with the given overrides"))
{
}

void RunCommand::addOptions(QCommandLineParser& parser)
{
    parser.addOption({"steps", "Markdown steps file to track", "file"});
    parser.addOption({"region", "Region to watch (x,y,width,height)", "rect"});
    parser.addOption({"interval", "Poll interval in milliseconds", "ms"});
    parser.addOption({"no-countdown", "Start watching without the countdown"});
}

CLIResult RunCommand::run(const QCommandLineParser& parser)
{
    LaunchOptions options;

    if (parser.isSet("steps")) {
        options.stepsFile = parser.value("steps");
        if (!QFileInfo::exists(options.stepsFile)) {
            return CLIResult::error(CLIResult::Code::FileError,
                                    QString("Steps file not found: %1").arg(options.stepsFile));
        }
    }

    if (parser.isSet("region")) {
        const QString regionText = parser.value("region");
        options.region = parseRegion(regionText);
        if (!options.region.isValid()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("Invalid region: %1 (expected x,y,width,height)").arg(regionText));
        }
        if (options.region.width() < WatchSettingsManager::kMinRegionSize ||
            options.region.height() < WatchSettingsManager::kMinRegionSize) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("Region must be at least %1x%1 pixels")
                                        .arg(WatchSettingsManager::kMinRegionSize));
        }
    }

    if (parser.isSet("interval")) {
        bool ok = false;
        const QString intervalText = parser.value("interval");
        const int interval = intervalText.toInt(&ok);
        if (!ok || interval < kMinIntervalMs || interval > kMaxIntervalMs) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("Invalid interval value: %1 (%2-%3 ms)")
                                        .arg(intervalText)
                                        .arg(kMinIntervalMs)
                                        .arg(kMaxIntervalMs));
        }
        options.pollIntervalMs = interval;
    }

    options.noCountdown = parser.isSet("no-countdown");
    return CLIResult::launchWith(options);
}

QRect RunCommand::parseRegion(const QString& text)
{
    const QStringList parts = text.split(',');
    if (parts.size() != 4) {
        return QRect();
    }

    int values[4];
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = parts.at(i).trimmed().toInt(&ok);
        if (!ok) {
            return QRect();
        }
    }

    if (values[2] <= 0 || values[3] <= 0) {
        return QRect();
    }
    return QRect(values[0], values[1], values[2], values[3]);
}

} // namespace CLI
} // namespace CommandWatch
