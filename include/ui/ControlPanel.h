#ifndef CONTROLPANEL_H
#define CONTROLPANEL_H

#include "automation/AutomationController.h"

#include <QWidget>

class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QTimer;

/**
 * @brief Status window for a watch run.
 *
 * Shows runtime, current step, counters and the last action, and takes
 * console commands. The panel only reads from the controller and forwards
 * user input; it holds no automation state of its own.
 */
class ControlPanel : public QWidget
{
    Q_OBJECT

public:
    explicit ControlPanel(AutomationController *controller, QWidget *parent = nullptr);
    ~ControlPanel() override;

    static QString truncateStatus(const QString &status);
    static QStringList formatStepLines(const QString &stepPath);

    static constexpr int kStatusDisplayLength = 48;
    static constexpr int kStatusTruncateThreshold = 51;

signals:
    void selectRegionRequested();

private slots:
    void onStateChanged(AutomationController::State state);
    void onStatusChanged(const QString &status);
    void onCountersChanged(int commandsExecuted, int messagesSent);
    void onCurrentStepChanged(const QString &step);
    void onInformationRequested(const QString &title, const QString &text);
    void onCommandEntered();
    void updateRuntime();

private:
    void setupUi();
    void applyTheme();
    void updateButtons();
    void updateLogLocation();

    AutomationController *m_controller;

    QLabel *m_runtimeLabel;
    QLabel *m_stateLabel;
    QLabel *m_stepLabel;
    QLabel *m_messagesLabel;
    QLabel *m_commandsLabel;
    QLabel *m_lastActionLabel;
    QLabel *m_logLabel;
    QPlainTextEdit *m_outputView;
    QLineEdit *m_commandEdit;
    QPushButton *m_selectButton;
    QPushButton *m_startButton;
    QPushButton *m_pauseButton;
    QPushButton *m_stopButton;
    QTimer *m_runtimeTimer;
};

#endif // CONTROLPANEL_H
