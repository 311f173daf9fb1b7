#include <QtTest>
#include <QTemporaryDir>

#include "cli/commands/CheckCommand.h"
#include "steps/ProjectStepsTracker.h"

using namespace CommandWatch::CLI;

class tst_CheckCommand : public QObject
{
    Q_OBJECT

private slots:
    void testReportForValidFile();
    void testReportForIssues();
    void testReportWarnsOnMultipleInProgress();
    void testReportWithoutCurrentStep();
    void testExecuteValidFile();
};

void tst_CheckCommand::testReportForValidFile()
{
    const QString content = "## Build\n### Parser\n- " + ProjectStepsTracker::kInProgressMarker
                            + " Tokens\n- " + ProjectStepsTracker::kCompleteMarker + " Setup";
    const StepsDiagnostics diagnostics = ProjectStepsTracker::validateContent(content);

    const QString report = CheckCommand::formatReport("steps.md", diagnostics,
                                                      ProjectStepsTracker::parseCurrentStep(content));
    QVERIFY(report.startsWith("File: steps.md\n"));
    QVERIFY(report.contains("Total Steps: 2"));
    QVERIFY(report.contains("Completed: 1"));
    QVERIFY(report.contains("Current Step:\n  Build\n    Parser\n      Tokens\n"));
    QVERIFY(report.endsWith("File format looks good! Ready to start automation.\n"));
}

void tst_CheckCommand::testReportForIssues()
{
    const StepsDiagnostics diagnostics = ProjectStepsTracker::validateContent("just text");
    const QString report = CheckCommand::formatReport("steps.md", diagnostics, QString());

    QVERIFY(report.contains("Critical Issues Found:"));
    QVERIFY(report.contains("No sections (##) found"));
    QVERIFY(report.contains("Sections marked with ##"));
    QVERIFY(!report.contains("Ready to start automation"));
}

void tst_CheckCommand::testReportWarnsOnMultipleInProgress()
{
    const QString active = ProjectStepsTracker::kInProgressMarker;
    const QString content = "## A\n- " + active + " one\n- " + active + " two";
    const StepsDiagnostics diagnostics = ProjectStepsTracker::validateContent(content);
    const QString report = CheckCommand::formatReport("steps.md", diagnostics,
                                                      ProjectStepsTracker::parseCurrentStep(content));

    QVERIFY(report.contains("Warnings:"));
    QVERIFY(report.contains("Note: Will proceed with earliest in-progress step"));
    QVERIFY(report.contains("  A\n    one\n"));
}

void tst_CheckCommand::testReportWithoutCurrentStep()
{
    StepsDiagnostics diagnostics;
    diagnostics.hasSections = true;
    const QString report = CheckCommand::formatReport("steps.md", diagnostics, QString());
    QVERIFY(report.contains("No current step found"));
}

void tst_CheckCommand::testExecuteValidFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("plan.md");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(("## Ship\n- " + ProjectStepsTracker::kIncompleteMarker + " Release").toUtf8());
    file.close();

    CheckCommand command;
    QCommandLineParser parser;
    command.addOptions(parser);
    QVERIFY(parser.parse({"commandwatch", path}));

    const CLIResult result = command.run(parser);
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.contains("Ship\n    Release"));
}

QTEST_MAIN(tst_CheckCommand)
#include "tst_CheckCommand.moc"
