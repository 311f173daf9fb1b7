#include <QtTest>
#include <QTemporaryDir>

#include "cli/CLIHandler.h"
#include "cli/commands/RunCommand.h"
#include "settings/Settings.h"
#include "settings/WatchSettingsManager.h"

using namespace CommandWatch::CLI;

class tst_CLIHandler : public QObject
{
    Q_OBJECT

private slots:
    void testHasArguments();
    void testRequiresGUI();
    void testHelpAndVersion();
    void testUnknownCommand();
    void testRunDefaults();
    void testRunWithOverrides();
    void testRunMissingStepsFile();
    void testRunInvalidInterval_data();
    void testRunInvalidInterval();
    void testRunInvalidRegion_data();
    void testRunInvalidRegion();
    void testParseRegion();
    void testCheckMissingFileIsFileError();
    void testConfigSetStoresPhraseList();
    void testConfigSetStoresRegion();
    void testConfigSetStoresInteger();
    void testConfigSetRejectsInvalidValue_data();
    void testConfigSetRejectsInvalidValue();
    void cleanup();
};

void tst_CLIHandler::cleanup()
{
    auto settings = CommandWatch::getSettings();
    settings.remove("watch");
    settings.remove("detection");
    settings.remove("OCR");
    settings.sync();
}

void tst_CLIHandler::testHasArguments()
{
    QVERIFY(!CLIHandler::hasArguments({"commandwatch"}));
    QVERIFY(CLIHandler::hasArguments({"commandwatch", "check"}));
}

void tst_CLIHandler::testRequiresGUI()
{
    CLIHandler handler;
    QVERIFY(handler.requiresGUI({"commandwatch"}));
    QVERIFY(handler.requiresGUI({"commandwatch", "run", "--no-countdown"}));
    QVERIFY(handler.requiresGUI({"commandwatch", "RUN"}));
    QVERIFY(!handler.requiresGUI({"commandwatch", "check"}));
    QVERIFY(!handler.requiresGUI({"commandwatch", "config", "--list"}));
    QVERIFY(!handler.requiresGUI({"commandwatch", "--version"}));
}

void tst_CLIHandler::testHelpAndVersion()
{
    CLIHandler handler;

    const CLIResult help = handler.process({"commandwatch", "--help"});
    QVERIFY(help.isSuccess());
    QVERIFY(help.message.contains("run"));
    QVERIFY(help.message.contains("check"));
    QVERIFY(help.message.contains("config"));

    const CLIResult version = handler.process({"commandwatch", "-v"});
    QVERIFY(version.isSuccess());
    QVERIFY(version.message.startsWith("CommandWatch "));
    QCOMPARE(version.message, CLIHandler::getVersionText());
}

void tst_CLIHandler::testUnknownCommand()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "record"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.startsWith("Unknown command: record"));
    QCOMPARE(result.exitCode(), 2);
}

void tst_CLIHandler::testRunDefaults()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "run"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.launchGui);
    QVERIFY(result.launch.stepsFile.isEmpty());
    QVERIFY(!result.launch.region.isValid());
    QCOMPARE(result.launch.pollIntervalMs, -1);
    QVERIFY(!result.launch.noCountdown);
}

void tst_CLIHandler::testRunWithOverrides()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString steps = dir.filePath("steps.md");
    QFile file(steps);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();

    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "run",
                                              "--steps", steps,
                                              "--region", "10,20,300,40",
                                              "--interval", "250",
                                              "--no-countdown"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.launchGui);
    QCOMPARE(result.launch.stepsFile, steps);
    QCOMPARE(result.launch.region, QRect(10, 20, 300, 40));
    QCOMPARE(result.launch.pollIntervalMs, 250);
    QVERIFY(result.launch.noCountdown);
}

void tst_CLIHandler::testRunMissingStepsFile()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "run", "--steps", "/nonexistent/steps.md"});
    QCOMPARE(result.code, CLIResult::Code::FileError);
    QVERIFY(!result.launchGui);
    QCOMPARE(result.exitCode(), 3);
}

void tst_CLIHandler::testRunInvalidInterval_data()
{
    QTest::addColumn<QString>("interval");
    QTest::newRow("too small") << "50";
    QTest::newRow("too large") << "20000";
    QTest::newRow("not a number") << "fast";
}

void tst_CLIHandler::testRunInvalidInterval()
{
    QFETCH(QString, interval);
    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "run", "--interval", interval});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains(interval));
}

void tst_CLIHandler::testRunInvalidRegion_data()
{
    QTest::addColumn<QString>("region");
    QTest::newRow("too few parts") << "1,2,3";
    QTest::newRow("not numeric") << "a,b,c,d";
    QTest::newRow("too small") << "0,0,5,100";
}

void tst_CLIHandler::testRunInvalidRegion()
{
    QFETCH(QString, region);
    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "run", "--region", region});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
}

void tst_CLIHandler::testParseRegion()
{
    QCOMPARE(RunCommand::parseRegion(" 1, 2, 30, 40 "), QRect(1, 2, 30, 40));
    QCOMPARE(RunCommand::parseRegion("-100,0,30,40"), QRect(-100, 0, 30, 40));
    QVERIFY(!RunCommand::parseRegion("1,2,0,40").isValid());
    QVERIFY(!RunCommand::parseRegion("").isValid());
}

void tst_CLIHandler::testCheckMissingFileIsFileError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "check", dir.filePath("missing.md")});
    QCOMPARE(result.code, CLIResult::Code::FileError);
    QVERIFY(result.message.contains("Error reading file"));
}

void tst_CLIHandler::testConfigSetStoresPhraseList()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "config", "--set",
                                              "detection/acceptPhrases", "Run Command, accept all ,,"});
    QVERIFY(result.isSuccess());

    const QStringList expected{"Run Command", "accept all"};
    QCOMPARE(CommandWatch::getSettings().value("detection/acceptPhrases").toStringList(), expected);
    QCOMPARE(WatchSettingsManager::instance().loadAcceptPhrases(),
             QStringList({"run command", "accept all"}));
}

void tst_CLIHandler::testConfigSetStoresRegion()
{
    CLIHandler handler;
    const CLIResult set = handler.process({"commandwatch", "config", "--set",
                                           "watch/region", "10,20,300,40"});
    QVERIFY(set.isSuccess());
    QCOMPARE(WatchSettingsManager::instance().loadRegion(), QRect(10, 20, 300, 40));

    const CLIResult get = handler.process({"commandwatch", "config", "--get", "watch/region"});
    QVERIFY(get.isSuccess());
    QCOMPARE(get.message, QString("10,20,300,40"));

    const CLIResult list = handler.process({"commandwatch", "config", "--list"});
    QVERIFY(list.message.contains("watch/region = 10,20,300,40"));
}

void tst_CLIHandler::testConfigSetStoresInteger()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "config", "--set",
                                              "watch/pollIntervalMs", " 250 "});
    QVERIFY(result.isSuccess());
    QCOMPARE(WatchSettingsManager::instance().loadPollIntervalMs(), 250);
}

void tst_CLIHandler::testConfigSetRejectsInvalidValue_data()
{
    QTest::addColumn<QString>("key");
    QTest::addColumn<QString>("value");
    QTest::newRow("region with three parts") << "watch/region" << "1,2,3";
    QTest::newRow("region with zero width") << "watch/region" << "0,0,0,40";
    QTest::newRow("timing not numeric") << "watch/actionDelayMs" << "soon";
    QTest::newRow("confidence not numeric") << "OCR/minConfidence" << "high";
    QTest::newRow("no phrases") << "detection/completedPhrases" << " , ,";
}

void tst_CLIHandler::testConfigSetRejectsInvalidValue()
{
    QFETCH(QString, key);
    QFETCH(QString, value);

    CLIHandler handler;
    const CLIResult result = handler.process({"commandwatch", "config", "--set", key, value});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains(key));
    QVERIFY(!CommandWatch::getSettings().contains(key));
}

QTEST_MAIN(tst_CLIHandler)
#include "tst_CLIHandler.moc"
