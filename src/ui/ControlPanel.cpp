#include "ui/ControlPanel.h"
#include "logging/LogManager.h"
#include "steps/ProjectStepsTracker.h"

#include <QFontDatabase>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QTimer>
#include <QVBoxLayout>

ControlPanel::ControlPanel(AutomationController *controller, QWidget *parent)
    : QWidget(parent, Qt::Window)
    , m_controller(controller)
    , m_runtimeLabel(nullptr)
    , m_stateLabel(nullptr)
    , m_stepLabel(nullptr)
    , m_messagesLabel(nullptr)
    , m_commandsLabel(nullptr)
    , m_lastActionLabel(nullptr)
    , m_logLabel(nullptr)
    , m_outputView(nullptr)
    , m_commandEdit(nullptr)
    , m_selectButton(nullptr)
    , m_startButton(nullptr)
    , m_pauseButton(nullptr)
    , m_stopButton(nullptr)
    , m_runtimeTimer(new QTimer(this))
{
    setWindowTitle(tr("CommandWatch Control Panel"));
    setupUi();
    applyTheme();
    setMinimumWidth(460);

    connect(m_controller, &AutomationController::stateChanged,
            this, &ControlPanel::onStateChanged);
    connect(m_controller, &AutomationController::statusChanged,
            this, &ControlPanel::onStatusChanged);
    connect(m_controller, &AutomationController::countersChanged,
            this, &ControlPanel::onCountersChanged);
    connect(m_controller, &AutomationController::currentStepChanged,
            this, &ControlPanel::onCurrentStepChanged);
    connect(m_controller, &AutomationController::informationRequested,
            this, &ControlPanel::onInformationRequested);

    m_runtimeTimer->setInterval(1000);
    connect(m_runtimeTimer, &QTimer::timeout, this, &ControlPanel::updateRuntime);
    m_runtimeTimer->start();

    onCurrentStepChanged(m_controller->currentStep());
    onCountersChanged(m_controller->commandsExecuted(), m_controller->messagesSent());
    onStatusChanged(m_controller->lastStatus());
    onStateChanged(m_controller->state());
    updateRuntime();
    updateLogLocation();
}

ControlPanel::~ControlPanel() = default;

QString ControlPanel::truncateStatus(const QString &status)
{
    if (status.size() > kStatusTruncateThreshold) {
        return status.left(kStatusDisplayLength) + QStringLiteral("...");
    }
    return status;
}

QStringList ControlPanel::formatStepLines(const QString &stepPath)
{
    QStringList lines;
    const QStringList parts = ProjectStepsTracker::splitStepPath(stepPath);
    for (int i = 0; i < parts.size(); ++i) {
        lines << QString(i * 2, QLatin1Char(' ')) + parts.at(i);
    }
    return lines;
}

void ControlPanel::setupUi()
{
    auto *mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(16, 16, 16, 16);
    mainLayout->setSpacing(8);

    auto *headerLayout = new QHBoxLayout();
    m_runtimeLabel = new QLabel(this);
    m_runtimeLabel->setObjectName("runtimeLabel");
    m_stateLabel = new QLabel(this);
    m_stateLabel->setObjectName("stateLabel");
    headerLayout->addWidget(m_runtimeLabel);
    headerLayout->addStretch();
    headerLayout->addWidget(m_stateLabel);
    mainLayout->addLayout(headerLayout);

    auto *stepTitle = new QLabel(tr("Current Step:"), this);
    stepTitle->setObjectName("sectionTitle");
    mainLayout->addWidget(stepTitle);

    m_stepLabel = new QLabel(this);
    m_stepLabel->setObjectName("stepLabel");
    m_stepLabel->setTextFormat(Qt::PlainText);
    m_stepLabel->setWordWrap(true);
    mainLayout->addWidget(m_stepLabel);

    m_messagesLabel = new QLabel(this);
    m_commandsLabel = new QLabel(this);
    mainLayout->addWidget(m_messagesLabel);
    mainLayout->addWidget(m_commandsLabel);

    m_lastActionLabel = new QLabel(this);
    m_lastActionLabel->setObjectName("lastActionLabel");
    m_lastActionLabel->setTextFormat(Qt::PlainText);
    mainLayout->addWidget(m_lastActionLabel);

    auto *buttonLayout = new QHBoxLayout();
    buttonLayout->setSpacing(6);
    m_selectButton = new QPushButton(tr("Select Region"), this);
    m_startButton = new QPushButton(tr("Start"), this);
    m_pauseButton = new QPushButton(tr("Pause"), this);
    m_stopButton = new QPushButton(tr("Stop"), this);
    buttonLayout->addWidget(m_selectButton);
    buttonLayout->addWidget(m_startButton);
    buttonLayout->addWidget(m_pauseButton);
    buttonLayout->addWidget(m_stopButton);
    mainLayout->addLayout(buttonLayout);

    connect(m_selectButton, &QPushButton::clicked, this, &ControlPanel::selectRegionRequested);
    connect(m_startButton, &QPushButton::clicked, m_controller, &AutomationController::start);
    connect(m_pauseButton, &QPushButton::clicked, m_controller, &AutomationController::togglePause);
    connect(m_stopButton, &QPushButton::clicked, m_controller, &AutomationController::stop);

    m_outputView = new QPlainTextEdit(this);
    m_outputView->setReadOnly(true);
    m_outputView->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    m_outputView->setMinimumHeight(140);
    mainLayout->addWidget(m_outputView, 1);

    m_commandEdit = new QLineEdit(this);
    m_commandEdit->setPlaceholderText(tr("Enter command (type 'help' for commands)"));
    connect(m_commandEdit, &QLineEdit::returnPressed, this, &ControlPanel::onCommandEntered);
    mainLayout->addWidget(m_commandEdit);

    m_logLabel = new QLabel(this);
    m_logLabel->setObjectName("logLabel");
    m_logLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    mainLayout->addWidget(m_logLabel);
}

void ControlPanel::applyTheme()
{
    setStyleSheet(QStringLiteral(R"(
        QLabel#runtimeLabel {
            font-size: 15px;
            font-weight: 600;
        }
        QLabel#stateLabel {
            color: #8E8E93;
        }
        QLabel#sectionTitle {
            font-weight: 600;
            margin-top: 4px;
        }
        QLabel#stepLabel {
            padding-left: 8px;
        }
        QLabel#lastActionLabel {
            color: #0A84FF;
        }
        QLabel#logLabel {
            color: #8E8E93;
            font-size: 11px;
        }
        QPushButton {
            padding: 6px 12px;
        }
    )"));
}

void ControlPanel::onStateChanged(AutomationController::State state)
{
    switch (state) {
    case AutomationController::State::Idle:
        m_stateLabel->setText(tr("Idle"));
        break;
    case AutomationController::State::CountingDown:
        m_stateLabel->setText(tr("Starting"));
        break;
    case AutomationController::State::Running:
        m_stateLabel->setText(tr("Watching"));
        break;
    case AutomationController::State::Paused:
        m_stateLabel->setText(tr("Paused"));
        break;
    }
    updateButtons();
    updateRuntime();
    updateLogLocation();
}

void ControlPanel::onStatusChanged(const QString &status)
{
    if (status.isEmpty()) {
        m_lastActionLabel->setText(QString());
        return;
    }
    m_lastActionLabel->setText(tr("Last Action: %1").arg(truncateStatus(status)));
    m_lastActionLabel->setToolTip(status);
}

void ControlPanel::onCountersChanged(int commandsExecuted, int messagesSent)
{
    m_messagesLabel->setText(tr("Messages Sent: %1").arg(messagesSent));
    m_commandsLabel->setText(tr("Commands Executed: %1").arg(commandsExecuted));
}

void ControlPanel::onCurrentStepChanged(const QString &step)
{
    if (step.isEmpty()) {
        m_stepLabel->setText(tr("No current step found"));
        return;
    }
    m_stepLabel->setText(formatStepLines(step).join(QLatin1Char('\n')));
}

void ControlPanel::onInformationRequested(const QString &title, const QString &text)
{
    m_outputView->appendPlainText(QStringLiteral("== %1 ==").arg(title));
    m_outputView->appendPlainText(text);
    m_outputView->appendPlainText(QString());
}

void ControlPanel::onCommandEntered()
{
    const QString text = m_commandEdit->text().trimmed();
    m_commandEdit->clear();
    if (text.isEmpty()) {
        return;
    }

    m_outputView->appendPlainText(QStringLiteral("> %1").arg(text));
    m_controller->executeCommand(text);
}

void ControlPanel::updateRuntime()
{
    m_runtimeLabel->setText(tr("Runtime: %1").arg(m_controller->runtimeText()));
}

void ControlPanel::updateButtons()
{
    const AutomationController::State state = m_controller->state();
    const bool idle = state == AutomationController::State::Idle;

    m_startButton->setEnabled(idle);
    m_stopButton->setEnabled(!idle);
    m_pauseButton->setEnabled(state == AutomationController::State::Running ||
                              state == AutomationController::State::Paused);
    m_pauseButton->setText(state == AutomationController::State::Paused ? tr("Resume") : tr("Pause"));
}

void ControlPanel::updateLogLocation()
{
    const QString path = LogManager::logFilePath();
    m_logLabel->setText(path.isEmpty() ? tr("Logging to console only")
                                       : tr("Log file: %1").arg(path));
}
