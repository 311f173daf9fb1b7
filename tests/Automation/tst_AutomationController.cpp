#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "automation/AutomationController.h"
#include "steps/ProjectMetrics.h"
#include "MockCaptureEngine.h"
#include "MockKeySynthesizer.h"

using State = AutomationController::State;

class tst_AutomationController : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testStartWithoutRegionRequestsOne();
    void testStartImmediately();
    void testCountdownThenRun();
    void testStartIgnoredWhenActive();
    void testCaptureFailureReturnsToIdle();
    void testPauseStopsCapturing();
    void testStopEndsMetricsStep();
    void testStepCommands();
    void testInformationCommands();
    void testNextQueuesMessageWhileRunning();
    void testMessageCommandsRequireRun();
    void testStopCommandWhenIdle();
    void testStopCommandWhenIdleEndsStep();
    void testUnknownCommand();
    void testReselectCommand();
    void testSmallRegionRejected();
    void testFormatRuntime();

private:
    AutomationController *createController();

    QTemporaryDir *m_dir = nullptr;
    AutomationController *m_controller = nullptr;
    MockCaptureEngine *m_engine = nullptr;
    MockKeySynthesizer *m_keys = nullptr;
};

void tst_AutomationController::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
    m_controller = createController();
}

void tst_AutomationController::cleanup()
{
    delete m_controller;
    m_controller = nullptr;
    m_engine = nullptr;
    m_keys = nullptr;
    delete m_dir;
    m_dir = nullptr;
}

AutomationController *tst_AutomationController::createController()
{
    auto *controller = new AutomationController();

    m_engine = new MockCaptureEngine();
    controller->setCaptureEngine(m_engine);
    controller->setSynthesizerFactory([this]() {
        auto keys = std::make_unique<MockKeySynthesizer>();
        m_keys = keys.get();
        return std::unique_ptr<IKeySynthesizer>(std::move(keys));
    });

    SessionConfig config;
    config.acceptPhrases = {"run command"};
    config.completedPhrases = {"done"};
    config.acceptChord = KeyChord::fromString("Ctrl+Return");
    config.chatFocusChord = KeyChord::fromString("Ctrl+/");
    config.actionDelayMs = 0;
    config.keyStepDelayMs = 0;
    config.messageSettleMs = 0;
    config.continueMessage = "continue";
    config.nextStepMessage = "next";
    config.completeStepMessage = "complete";
    controller->setSessionConfig(config);

    controller->setCountdownSeconds(0);
    controller->setPollIntervalMs(20);
    controller->setStepsFilePath(m_dir->filePath("project_steps.md"));
    controller->setMetricsDirectory(m_dir->path());
    return controller;
}

void tst_AutomationController::testStartWithoutRegionRequestsOne()
{
    QSignalSpy regionSpy(m_controller, &AutomationController::regionRequired);

    QVERIFY(!m_controller->start());
    QCOMPARE(regionSpy.count(), 1);
    QCOMPARE(m_controller->state(), State::Idle);
    QCOMPARE(m_controller->lastStatus(), QString("Select a region to watch first"));
    QCOMPARE(m_engine->startCallCount(), 0);
}

void tst_AutomationController::testStartImmediately()
{
    QSignalSpy stateSpy(m_controller, &AutomationController::stateChanged);
    m_controller->setRegion(QRect(10, 10, 200, 80), nullptr);

    QVERIFY(m_controller->start());
    QCOMPARE(m_controller->state(), State::Running);
    QCOMPARE(stateSpy.count(), 1);
    QCOMPARE(m_engine->startCallCount(), 1);
    QCOMPARE(m_engine->lastRegion(), QRect(10, 10, 200, 80));
    QVERIFY(m_keys);
    QCOMPARE(m_controller->lastStatus(), QString("Starting automation... Type 'help' for commands"));

    QTRY_VERIFY(m_engine->captureFrameCallCount() > 0);

    m_controller->stop();
    QCOMPARE(m_controller->state(), State::Idle);
    QCOMPARE(m_engine->stopCallCount(), 1);
    QCOMPARE(m_controller->runtimeSeconds(), qint64(0));
}

void tst_AutomationController::testCountdownThenRun()
{
    m_controller->setCountdownSeconds(1);
    m_controller->setRegion(QRect(0, 0, 50, 50), nullptr);
    QSignalSpy tickSpy(m_controller, &AutomationController::countdownTick);

    QVERIFY(m_controller->start());
    QCOMPARE(m_controller->state(), State::CountingDown);
    QCOMPARE(m_controller->lastStatus(), QString("Starting in 1 seconds..."));
    QCOMPARE(m_engine->startCallCount(), 0);

    QTRY_COMPARE_WITH_TIMEOUT(m_controller->state(), State::Running, 3000);
    QCOMPARE(tickSpy.first().at(0).toInt(), 1);
    QCOMPARE(tickSpy.last().at(0).toInt(), 0);
}

void tst_AutomationController::testStartIgnoredWhenActive()
{
    m_controller->setRegion(QRect(0, 0, 50, 50), nullptr);
    QVERIFY(m_controller->start());
    QVERIFY(!m_controller->start());
    QCOMPARE(m_engine->startCallCount(), 1);
}

void tst_AutomationController::testCaptureFailureReturnsToIdle()
{
    m_engine->setStartSucceeds(false);
    m_controller->setRegion(QRect(0, 0, 50, 50), nullptr);
    QSignalSpy errorSpy(m_controller, &AutomationController::errorOccurred);

    QVERIFY(!m_controller->start());
    QCOMPARE(m_controller->state(), State::Idle);
    QVERIFY(errorSpy.count() >= 1);
    QVERIFY(m_controller->lastStatus().startsWith("Failed to start screen capture"));
}

void tst_AutomationController::testPauseStopsCapturing()
{
    m_controller->setRegion(QRect(0, 0, 50, 50), nullptr);
    QVERIFY(m_controller->start());

    m_controller->togglePause();
    QVERIFY(m_controller->isPaused());
    QCOMPARE(m_controller->lastStatus(), QString("Automation paused"));

    m_engine->resetCounters();
    QTest::qWait(150);
    QCOMPARE(m_engine->captureFrameCallCount(), 0);

    m_controller->executeCommand("resume");
    QVERIFY(m_controller->isRunning());
    QTRY_VERIFY(m_engine->captureFrameCallCount() > 0);
}

void tst_AutomationController::testStopEndsMetricsStep()
{
    m_controller->setRegion(QRect(0, 0, 50, 50), nullptr);
    QVERIFY(m_controller->start());
    m_controller->executeCommand("step Parser");

    m_controller->executeCommand("stop");
    QCOMPARE(m_controller->state(), State::Idle);
    QCOMPARE(m_controller->lastStatus(), QString("Stopping automation..."));

    const StepMetrics *step = m_controller->metrics()->step("Parser");
    QVERIFY(step);
    QCOMPARE(step->status, QString("✓"));
    QVERIFY(QFile::exists(m_controller->metrics()->metricsFilePath()));
}

void tst_AutomationController::testStepCommands()
{
    m_controller->executeCommand("step Build Parser");
    QCOMPARE(m_controller->lastStatus(), QString("Started step: Build Parser"));
    QCOMPARE(m_controller->metrics()->currentStep(), QString("Build Parser"));

    m_controller->executeCommand("fail");
    QCOMPARE(m_controller->lastStatus(), QString("Marked current step as failed"));
    QCOMPARE(m_controller->metrics()->step("Build Parser")->status, QString("❌"));

    m_controller->executeCommand("step Lexer");
    m_controller->executeCommand("complete");
    QCOMPARE(m_controller->lastStatus(), QString("Completed current step"));
    QCOMPARE(m_controller->metrics()->step("Lexer")->status, QString("✓"));
    QVERIFY(!m_controller->metrics()->hasCurrentStep());
}

void tst_AutomationController::testInformationCommands()
{
    QSignalSpy infoSpy(m_controller, &AutomationController::informationRequested);

    m_controller->executeCommand("help");
    m_controller->executeCommand("metrics");
    m_controller->executeCommand("log");

    QCOMPARE(infoSpy.count(), 3);
    QCOMPARE(infoSpy.at(0).at(0).toString(), QString("Available Commands"));
    QCOMPARE(infoSpy.at(1).at(0).toString(), QString("Project Metrics"));
    QVERIFY(infoSpy.at(1).at(1).toString().contains("project_steps"));
    QCOMPARE(infoSpy.at(2).at(0).toString(), QString("Log Location"));
}

void tst_AutomationController::testNextQueuesMessageWhileRunning()
{
    m_controller->setRegion(QRect(0, 0, 50, 50), nullptr);
    QVERIFY(m_controller->start());
    QSignalSpy countersSpy(m_controller, &AutomationController::countersChanged);

    m_controller->executeCommand("next");
    QCOMPARE(m_controller->lastStatus(), QString("Queued next step message"));

    QVERIFY(m_keys);
    QTRY_COMPARE(m_keys->typedCount(), 1);
    QTRY_COMPARE(m_controller->messagesSent(), 1);
    QVERIFY(countersSpy.count() >= 1);
    QVERIFY(m_keys->events().contains("text:next"));
}

void tst_AutomationController::testMessageCommandsRequireRun()
{
    m_controller->executeCommand("finish");
    QCOMPARE(m_controller->lastStatus(), QString("Automation is not running"));
}

void tst_AutomationController::testStopCommandWhenIdle()
{
    QSignalSpy stateSpy(m_controller, &AutomationController::stateChanged);
    m_controller->executeCommand("quit");
    QCOMPARE(m_controller->lastStatus(), QString("Automation is not running"));
    QCOMPARE(stateSpy.count(), 0);
}

void tst_AutomationController::testStopCommandWhenIdleEndsStep()
{
    m_controller->executeCommand("step Tokenizer");
    QVERIFY(m_controller->metrics()->hasCurrentStep());

    QSignalSpy stateSpy(m_controller, &AutomationController::stateChanged);
    m_controller->executeCommand("exit");

    QVERIFY(!m_controller->metrics()->hasCurrentStep());
    const StepMetrics *step = m_controller->metrics()->step("Tokenizer");
    QVERIFY(step);
    QCOMPARE(step->status, QString("✓"));
    QVERIFY(step->endTime.isValid());
    QCOMPARE(stateSpy.count(), 0);
}

void tst_AutomationController::testUnknownCommand()
{
    m_controller->executeCommand("dance now");
    QCOMPARE(m_controller->lastStatus(), QString("Unknown command: dance now"));
}

void tst_AutomationController::testReselectCommand()
{
    QSignalSpy reselectSpy(m_controller, &AutomationController::reselectRequested);
    m_controller->executeCommand("reselect");
    QCOMPARE(reselectSpy.count(), 1);
}

void tst_AutomationController::testSmallRegionRejected()
{
    m_controller->setRegion(QRect(0, 0, 9, 100), nullptr);
    QVERIFY(!m_controller->hasRegion());

    m_controller->setRegion(QRect(5, 5, 10, 10), nullptr);
    QVERIFY(m_controller->hasRegion());
    QCOMPARE(m_controller->region(), QRect(5, 5, 10, 10));
}

void tst_AutomationController::testFormatRuntime()
{
    QCOMPARE(AutomationController::formatRuntime(0), QString("00:00:00"));
    QCOMPARE(AutomationController::formatRuntime(61), QString("00:01:01"));
    QCOMPARE(AutomationController::formatRuntime(3600 * 27 + 5), QString("27:00:05"));
}

QTEST_MAIN(tst_AutomationController)
#include "tst_AutomationController.moc"
