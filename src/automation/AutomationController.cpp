#include "automation/AutomationController.h"
#include "automation/CommandInterpreter.h"
#include "capture/ICaptureEngine.h"
#include "input/IKeySynthesizer.h"
#include "input/KeySynthesizerFactory.h"
#include "logging/LogManager.h"
#include "settings/WatchSettingsManager.h"
#include "steps/ProjectMetrics.h"
#include "steps/ProjectStepsTracker.h"

#include <QDebug>
#include <QFileInfo>
#include <QGuiApplication>
#include <QScreen>
#include <QTimer>

namespace {

QString metricsProjectName(const QString &stepsFilePath)
{
    const QString baseName = QFileInfo(stepsFilePath).completeBaseName();
    return baseName.isEmpty() ? QStringLiteral("project") : baseName;
}

QString defaultMetricsDirectory()
{
    const QString logFile = LogManager::logFilePath();
    return logFile.isEmpty() ? QStringLiteral("logs") : QFileInfo(logFile).absolutePath();
}

} // namespace

AutomationController::AutomationController(QObject *parent)
    : QObject(parent)
    , m_sessionConfig(SessionConfig::fromSettings())
    , m_recognitionConfig(RecognitionConfig::fromSettings())
    , m_pollTimer(new QTimer(this))
    , m_countdownTimer(new QTimer(this))
    , m_pollIntervalMs(WatchSettingsManager::instance().loadPollIntervalMs())
    , m_countdownSeconds(WatchSettingsManager::instance().loadCountdownSeconds())
    , m_stepsTracker(new ProjectStepsTracker(WatchSettingsManager::instance().loadStepsFilePath(), this))
{
    m_pollTimer->setTimerType(Qt::PreciseTimer);
    connect(m_pollTimer, &QTimer::timeout, this, &AutomationController::onPollTick);

    m_countdownTimer->setInterval(1000);
    connect(m_countdownTimer, &QTimer::timeout, this, &AutomationController::onCountdownTick);

    connect(m_stepsTracker, &ProjectStepsTracker::currentStepChanged,
            this, &AutomationController::currentStepChanged);

    resetMetrics(defaultMetricsDirectory());
}

AutomationController::~AutomationController()
{
    if (m_worker) {
        m_worker->requestStop();
        m_worker->wait();
    }
}

bool AutomationController::hasRegion() const
{
    return m_region.width() >= ICaptureEngine::kMinRegionSize &&
           m_region.height() >= ICaptureEngine::kMinRegionSize;
}

bool AutomationController::loadSavedRegion()
{
    const auto& settings = WatchSettingsManager::instance();
    if (!settings.hasRegion()) {
        return false;
    }

    const QRect region = settings.loadRegion();
    const QString screenName = settings.loadRegionScreenName();

    QScreen *screen = nullptr;
    const auto screens = QGuiApplication::screens();
    for (QScreen *candidate : screens) {
        if (candidate->name() == screenName) {
            screen = candidate;
            break;
        }
    }
    if (!screen) {
        screen = QGuiApplication::screenAt(region.center());
    }
    if (!screen) {
        screen = QGuiApplication::primaryScreen();
    }

    setRegion(region, screen);
    return hasRegion();
}

void AutomationController::setCaptureEngine(ICaptureEngine *engine)
{
    if (m_captureEngine == engine) {
        return;
    }
    if (m_captureEngine) {
        m_captureEngine->stop();
        m_captureEngine->deleteLater();
    }
    m_captureEngine = engine;
    if (m_captureEngine) {
        m_captureEngine->setParent(this);
        connect(m_captureEngine, &ICaptureEngine::error,
                this, &AutomationController::reportError);
    }
}

void AutomationController::setSynthesizerFactory(SynthesizerFactory factory)
{
    m_synthesizerFactory = std::move(factory);
}

void AutomationController::setPollIntervalMs(int intervalMs)
{
    m_pollIntervalMs = qMax(1, intervalMs);
    if (m_pollTimer->isActive()) {
        m_pollTimer->setInterval(m_pollIntervalMs);
    }
}

void AutomationController::setStepsFilePath(const QString &path)
{
    m_stepsTracker->setFilePath(path);
    m_stepsTracker->refresh();

    if (m_metrics && !m_metrics->hasCurrentStep() && m_metrics->steps().isEmpty()) {
        resetMetrics(QFileInfo(m_metrics->metricsFilePath()).absolutePath());
    }
}

QString AutomationController::stepsFilePath() const
{
    return m_stepsTracker->filePath();
}

void AutomationController::setMetricsDirectory(const QString &directory)
{
    resetMetrics(directory);
}

QString AutomationController::runtimeText() const
{
    return formatRuntime(runtimeSeconds());
}

qint64 AutomationController::runtimeSeconds() const
{
    return m_runtime.isValid() ? m_runtime.elapsed() / 1000 : 0;
}

QString AutomationController::currentStep() const
{
    return m_stepsTracker->currentStep();
}

qint64 AutomationController::droppedFrameCount() const
{
    return m_worker ? m_worker->droppedCount() : 0;
}

QString AutomationController::formatRuntime(qint64 seconds)
{
    const qint64 hours = seconds / 3600;
    const qint64 minutes = (seconds % 3600) / 60;
    const qint64 secs = seconds % 60;
    return QStringLiteral("%1:%2:%3")
        .arg(hours, 2, 10, QLatin1Char('0'))
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(secs, 2, 10, QLatin1Char('0'));
}

bool AutomationController::start()
{
    if (m_state != State::Idle) {
        qDebug() << "AutomationController: start() ignored, state" << m_state;
        return false;
    }

    if (!hasRegion()) {
        setStatus(QStringLiteral("Select a region to watch first"));
        emit regionRequired();
        return false;
    }

    m_stepsTracker->refresh();

    if (m_countdownSeconds > 0) {
        m_countdownRemaining = m_countdownSeconds;
        setState(State::CountingDown);
        setStatus(QStringLiteral("Starting in %1 seconds...").arg(m_countdownRemaining));
        emit countdownTick(m_countdownRemaining);
        m_countdownTimer->start();
        return true;
    }

    return beginRunning();
}

void AutomationController::pause()
{
    if (m_state != State::Running) {
        return;
    }
    setState(State::Paused);
    setStatus(QStringLiteral("Automation paused"));
}

void AutomationController::resume()
{
    if (m_state != State::Paused) {
        return;
    }
    setState(State::Running);
    setStatus(QStringLiteral("Automation resumed"));
}

void AutomationController::togglePause()
{
    if (m_state == State::Paused) {
        resume();
    } else {
        pause();
    }
}

void AutomationController::stop()
{
    if (m_state == State::Idle) {
        return;
    }

    m_countdownTimer->stop();
    m_pollTimer->stop();

    if (m_worker) {
        m_worker->requestStop();
        m_worker->wait();
        qDebug() << "AutomationController: Worker stopped, dropped frames:"
                 << m_worker->droppedCount();
        m_worker.reset();
    }

    if (m_captureEngine) {
        m_captureEngine->stop();
    }

    if (m_metrics && m_metrics->hasCurrentStep()) {
        m_metrics->endStep();
    }

    m_runtime.invalidate();
    setState(State::Idle);
    setStatus(QStringLiteral("Stopping automation..."));
}

void AutomationController::setRegion(const QRect &region, QScreen *screen)
{
    m_region = region.normalized();
    m_screen = screen;

    if (m_captureEngine && (m_state == State::Running || m_state == State::Paused)) {
        if (!m_captureEngine->setRegion(m_region, screen)) {
            reportError(QStringLiteral("Failed to apply the new region"));
        }
    }

    emit regionChanged(m_region);
    setStatus(QStringLiteral("Region selected: (%1x%2)").arg(m_region.width()).arg(m_region.height()));
}

void AutomationController::executeCommand(const QString &text)
{
    const ConsoleCommand command = CommandInterpreter::parse(text);

    switch (command.type) {
    case ConsoleCommand::Type::Empty:
        break;
    case ConsoleCommand::Type::Step:
        m_metrics->startStep(command.argument);
        m_metrics->updateStepMetrics(m_commandsExecuted, m_messagesSent);
        setStatus(QStringLiteral("Started step: %1").arg(command.argument));
        break;
    case ConsoleCommand::Type::Complete:
        m_metrics->endStep(QStringLiteral("✓"));
        setStatus(QStringLiteral("Completed current step"));
        break;
    case ConsoleCommand::Type::Fail:
        m_metrics->endStep(QStringLiteral("❌"));
        setStatus(QStringLiteral("Marked current step as failed"));
        break;
    case ConsoleCommand::Type::Metrics:
        emit informationRequested(QStringLiteral("Project Metrics"), m_metrics->generateReport());
        break;
    case ConsoleCommand::Type::Pause:
        pause();
        break;
    case ConsoleCommand::Type::Resume:
        resume();
        break;
    case ConsoleCommand::Type::Reselect:
        setStatus(QStringLiteral("Reselecting region"));
        emit reselectRequested();
        break;
    case ConsoleCommand::Type::Next:
        requestMessage(AutomationSession::MessageKind::NextStep);
        break;
    case ConsoleCommand::Type::Finish:
        requestMessage(AutomationSession::MessageKind::CompleteStep);
        break;
    case ConsoleCommand::Type::Help:
        emit informationRequested(QStringLiteral("Available Commands"), CommandInterpreter::helpText());
        break;
    case ConsoleCommand::Type::Log: {
        const QString path = LogManager::logFilePath();
        emit informationRequested(QStringLiteral("Log Location"),
                                  path.isEmpty() ? QStringLiteral("Logging to console only")
                                                 : QStringLiteral("Log file: %1").arg(path));
        break;
    }
    case ConsoleCommand::Type::Stop:
        if (m_state == State::Idle) {
            // A step started from the console is closed even without a run
            if (m_metrics->hasCurrentStep()) {
                m_metrics->endStep(QStringLiteral("✓"));
            }
            setStatus(QStringLiteral("Automation is not running"));
        } else {
            stop();
        }
        break;
    case ConsoleCommand::Type::Unknown:
        setStatus(QStringLiteral("Unknown command: %1").arg(command.raw));
        break;
    }
}

void AutomationController::onCountdownTick()
{
    if (m_state != State::CountingDown) {
        m_countdownTimer->stop();
        return;
    }

    --m_countdownRemaining;
    if (m_countdownRemaining > 0) {
        setStatus(QStringLiteral("Starting in %1 seconds...").arg(m_countdownRemaining));
        emit countdownTick(m_countdownRemaining);
        return;
    }

    m_countdownTimer->stop();
    emit countdownTick(0);
    beginRunning();
}

void AutomationController::onPollTick()
{
    if (m_state != State::Running) {
        return;
    }

    m_stepsTracker->refresh();

    if (!m_captureEngine || !m_worker) {
        return;
    }

    const QImage frame = m_captureEngine->captureFrame();
    if (frame.isNull()) {
        qWarning() << "AutomationController: Capture failed, skipping tick";
        return;
    }

    m_worker->submitFrame(frame);
}

void AutomationController::onSessionCounters(int commandsExecuted, int messagesSent)
{
    m_commandsExecuted = commandsExecuted;
    m_messagesSent = messagesSent;
    if (m_metrics && m_metrics->hasCurrentStep()) {
        m_metrics->updateStepMetrics(commandsExecuted, messagesSent);
    }
    emit countersChanged(commandsExecuted, messagesSent);
}

bool AutomationController::beginRunning()
{
    if (!m_captureEngine) {
        setCaptureEngine(ICaptureEngine::createBestEngine(this));
    }
    if (!m_captureEngine) {
        reportError(QStringLiteral("No capture engine available"));
        setState(State::Idle);
        return false;
    }

    if (!m_captureEngine->setRegion(m_region, m_screen) || !m_captureEngine->start()) {
        reportError(QStringLiteral("Failed to start screen capture with %1")
                        .arg(m_captureEngine->engineName()));
        setState(State::Idle);
        return false;
    }

    std::unique_ptr<IKeySynthesizer> synthesizer = m_synthesizerFactory
        ? m_synthesizerFactory()
        : createPlatformKeySynthesizer();
    if (!synthesizer) {
        qWarning() << "AutomationController: No keyboard backend, buttons will be detected but not pressed";
    }

    m_worker = std::make_unique<DetectionWorker>(std::move(synthesizer),
                                                 m_sessionConfig, m_recognitionConfig);
    AutomationSession *session = m_worker->session();
    connect(session, &AutomationSession::statusChanged,
            this, &AutomationController::setStatus);
    connect(session, &AutomationSession::countersChanged,
            this, &AutomationController::onSessionCounters);
    connect(session, &AutomationSession::errorOccurred,
            this, &AutomationController::errorOccurred);
    connect(m_worker.get(), &DetectionWorker::ocrUnavailable,
            this, &AutomationController::reportError);

    m_commandsExecuted = 0;
    m_messagesSent = 0;
    emit countersChanged(m_commandsExecuted, m_messagesSent);

    m_worker->start();
    m_runtime.start();
    m_pollTimer->start(m_pollIntervalMs);

    setState(State::Running);
    setStatus(QStringLiteral("Starting automation... Type 'help' for commands"));
    qDebug() << "AutomationController: Watching" << m_region << "every" << m_pollIntervalMs << "ms";
    return true;
}

void AutomationController::setState(State newState)
{
    if (m_state == newState) {
        return;
    }
    m_state = newState;
    emit stateChanged(m_state);
}

void AutomationController::setStatus(const QString &status)
{
    if (status.isEmpty()) {
        return;
    }
    m_lastStatus = status;
    emit statusChanged(status);
}

void AutomationController::reportError(const QString &message)
{
    qWarning().noquote() << "AutomationController:" << message;
    setStatus(message);
    emit errorOccurred(message);
}

void AutomationController::requestMessage(AutomationSession::MessageKind kind)
{
    if (!m_worker || m_state == State::CountingDown) {
        setStatus(QStringLiteral("Automation is not running"));
        return;
    }
    m_worker->requestMessage(kind);
    setStatus(QStringLiteral("Queued %1 message").arg(AutomationSession::messageLabel(kind)));
}

void AutomationController::resetMetrics(const QString &directory)
{
    m_metrics = std::make_unique<ProjectMetrics>(metricsProjectName(stepsFilePath()), directory);
}
