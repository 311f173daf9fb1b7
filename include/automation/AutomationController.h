#ifndef AUTOMATIONCONTROLLER_H
#define AUTOMATIONCONTROLLER_H

#include "automation/AutomationSession.h"
#include "automation/DetectionWorker.h"

#include <QElapsedTimer>
#include <QObject>
#include <QPointer>
#include <QRect>
#include <functional>
#include <memory>

class ICaptureEngine;
class IKeySynthesizer;
class ProjectMetrics;
class ProjectStepsTracker;
class QScreen;
class QTimer;

/**
 * @brief Owns one watch run: countdown, poll timer, capture and the worker.
 *
 * Lives on the UI thread. Each poll tick grabs the region and hands the frame
 * to the DetectionWorker; the worker reports status and counters back through
 * queued signals.
 */
class AutomationController : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,          // Not watching
        CountingDown,  // Start requested, waiting for the countdown
        Running,       // Capturing on every poll tick
        Paused         // Timer keeps ticking but nothing is captured
    };
    Q_ENUM(State)

    using SynthesizerFactory = std::function<std::unique_ptr<IKeySynthesizer>()>;

    explicit AutomationController(QObject *parent = nullptr);
    ~AutomationController() override;

    State state() const { return m_state; }
    bool isActive() const { return m_state != State::Idle; }
    bool isRunning() const { return m_state == State::Running; }
    bool isPaused() const { return m_state == State::Paused; }

    // Region
    bool hasRegion() const;
    QRect region() const { return m_region; }
    QScreen *screen() const { return m_screen; }
    bool loadSavedRegion();

    // Configuration, applied on the next start()
    void setCaptureEngine(ICaptureEngine *engine);
    void setSynthesizerFactory(SynthesizerFactory factory);
    void setSessionConfig(const SessionConfig &config) { m_sessionConfig = config; }
    void setRecognitionConfig(const RecognitionConfig &config) { m_recognitionConfig = config; }
    void setPollIntervalMs(int intervalMs);
    int pollIntervalMs() const { return m_pollIntervalMs; }
    void setCountdownSeconds(int seconds) { m_countdownSeconds = qMax(0, seconds); }
    int countdownSeconds() const { return m_countdownSeconds; }

    void setStepsFilePath(const QString &path);
    QString stepsFilePath() const;
    ProjectStepsTracker *stepsTracker() const { return m_stepsTracker; }

    /**
     * @brief Replace the metrics store, e.g. to write into another directory.
     */
    void setMetricsDirectory(const QString &directory);
    ProjectMetrics *metrics() const { return m_metrics.get(); }

    // Status
    QString runtimeText() const;
    qint64 runtimeSeconds() const;
    QString currentStep() const;
    QString lastStatus() const { return m_lastStatus; }
    int commandsExecuted() const { return m_commandsExecuted; }
    int messagesSent() const { return m_messagesSent; }
    qint64 droppedFrameCount() const;

    static QString formatRuntime(qint64 seconds);

public slots:
    /**
     * @brief Start watching. Emits regionRequired() when no region is set.
     * @return false when the run could not be started
     */
    bool start();
    void pause();
    void resume();
    void togglePause();
    void stop();
    void setRegion(const QRect &region, QScreen *screen);

    /**
     * @brief Run a console command typed into the control panel.
     */
    void executeCommand(const QString &text);

signals:
    void stateChanged(State state);
    void statusChanged(const QString &status);
    void countersChanged(int commandsExecuted, int messagesSent);
    void currentStepChanged(const QString &step);
    void countdownTick(int secondsRemaining);
    void regionChanged(const QRect &region);
    void regionRequired();
    void reselectRequested();
    void informationRequested(const QString &title, const QString &text);
    void errorOccurred(const QString &message);

private slots:
    void onCountdownTick();
    void onPollTick();
    void onSessionCounters(int commandsExecuted, int messagesSent);

private:
    bool beginRunning();
    void setState(State newState);
    void setStatus(const QString &status);
    void reportError(const QString &message);
    void requestMessage(AutomationSession::MessageKind kind);
    void resetMetrics(const QString &directory);

    State m_state = State::Idle;
    QRect m_region;
    QPointer<QScreen> m_screen;

    ICaptureEngine *m_captureEngine = nullptr;
    std::unique_ptr<DetectionWorker> m_worker;
    SynthesizerFactory m_synthesizerFactory;
    SessionConfig m_sessionConfig;
    RecognitionConfig m_recognitionConfig;

    QTimer *m_pollTimer;
    QTimer *m_countdownTimer;
    int m_countdownRemaining = 0;
    int m_pollIntervalMs;
    int m_countdownSeconds;
    QElapsedTimer m_runtime;

    ProjectStepsTracker *m_stepsTracker;
    std::unique_ptr<ProjectMetrics> m_metrics;

    QString m_lastStatus;
    int m_commandsExecuted = 0;
    int m_messagesSent = 0;
};

#endif // AUTOMATIONCONTROLLER_H
