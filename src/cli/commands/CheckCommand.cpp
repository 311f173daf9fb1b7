#include "cli/commands/CheckCommand.h"

#include "settings/WatchSettingsManager.h"
#include "steps/ProjectStepsTracker.h"

#include <QTextStream>

namespace CommandWatch {
namespace CLI {

CheckCommand::CheckCommand()
    : CLICommand(QStringLiteral("check"), QStringLiteral("Validate a project steps file"))
{
}

void CheckCommand::addOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("file", "Steps file (defaults to the configured one)");
}

CLIResult CheckCommand::run(const QCommandLineParser& parser)
{
    const QStringList positional = parser.positionalArguments();
    const QString filePath = positional.isEmpty()
        ? WatchSettingsManager::instance().loadStepsFilePath()
        : positional.first();

    ProjectStepsTracker tracker(filePath);
    const StepsDiagnostics diagnostics = tracker.validate();
    tracker.refresh();

    const QString report = formatReport(filePath, diagnostics, tracker.currentStep());
    if (!diagnostics.isValid()) {
        return CLIResult::error(CLIResult::Code::FileError, report);
    }
    return CLIResult::success(report);
}

QString CheckCommand::formatReport(const QString& filePath,
                                   const StepsDiagnostics& diagnostics,
                                   const QString& currentStep)
{
    QString output;
    QTextStream out(&output);

    out << "File: " << filePath << "\n";

    if (!diagnostics.readError.isEmpty()) {
        out << "Error reading file: " << diagnostics.readError << "\n";
        return output;
    }

    out << "File Statistics:\n";
    out << "  • Total Steps: " << diagnostics.totalSteps << "\n";
    out << "  • Completed: " << diagnostics.completed << "\n";
    out << "  • In Progress: " << diagnostics.inProgress << "\n";
    out << "  • Incomplete: " << diagnostics.incomplete << "\n";

    if (!diagnostics.issues.isEmpty()) {
        out << "Critical Issues Found:\n";
        for (const QString& issue : diagnostics.issues) {
            out << "  • " << issue << "\n";
        }
        out << "File should have:\n";
        out << "  1. Sections marked with ##\n";
        out << "  2. Steps marked with " << ProjectStepsTracker::kCompleteMarker
            << " (complete), " << ProjectStepsTracker::kInProgressMarker
            << " (in progress) or " << ProjectStepsTracker::kIncompleteMarker
            << " (incomplete)\n";
        return output;
    }

    if (!diagnostics.warnings.isEmpty()) {
        out << "Warnings:\n";
        for (const QString& warning : diagnostics.warnings) {
            out << "  • " << warning << "\n";
        }
        out << "Note: Will proceed with earliest in-progress step\n";
    }

    if (currentStep.isEmpty()) {
        out << "No current step found - Add " << ProjectStepsTracker::kInProgressMarker
            << " to your current step\n";
    } else {
        out << "Current Step:\n";
        const QStringList parts = ProjectStepsTracker::splitStepPath(currentStep);
        for (int i = 0; i < parts.size(); ++i) {
            out << "  " << QString(i * 2, ' ') << parts.at(i) << "\n";
        }
    }

    out << "File format looks good! Ready to start automation.\n";
    return output;
}

} // namespace CLI
} // namespace CommandWatch
