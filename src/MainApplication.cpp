#include "MainApplication.h"
#include "PlatformFeatures.h"
#include "automation/AutomationController.h"
#include "hotkey/HotkeyManager.h"
#include "region/WatchRegionSelector.h"
#include "settings/WatchSettingsManager.h"
#include "steps/ProjectStepsTracker.h"
#include "ui/ControlPanel.h"
#include "version.h"

#include <QAction>
#include <QApplication>
#include <QCursor>
#include <QDebug>
#include <QFileInfo>
#include <QGuiApplication>
#include <QMenu>
#include <QScreen>
#include <QSystemTrayIcon>

using CommandWatch::HotkeyAction;
using CommandWatch::HotkeyManager;

MainApplication::MainApplication(QObject* parent)
    : QObject(parent)
    , m_controller(nullptr)
    , m_controlPanel(nullptr)
    , m_trayIcon(nullptr)
    , m_trayMenu(nullptr)
    , m_selectRegionAction(nullptr)
    , m_startAction(nullptr)
    , m_pauseAction(nullptr)
    , m_startAfterSelection(false)
{
}

MainApplication::~MainApplication()
{
    if (m_controller) {
        m_controller->stop();
    }
    HotkeyManager::instance().shutdown();
    delete m_controlPanel;
    delete m_trayMenu;
}

void MainApplication::initialize(const CommandWatch::CLI::LaunchOptions &options, bool autoStart)
{
    m_controller = new AutomationController(this);
    m_controller->loadSavedRegion();
    applyLaunchOptions(options);

    connect(m_controller, &AutomationController::regionRequired,
            this, &MainApplication::onRegionRequired);
    connect(m_controller, &AutomationController::reselectRequested,
            this, &MainApplication::onSelectRegion);
    connect(m_controller, &AutomationController::errorOccurred,
            this, &MainApplication::onErrorOccurred);
    connect(m_controller, &AutomationController::stateChanged,
            this, &MainApplication::updateTrayActions);

    m_controlPanel = new ControlPanel(m_controller);
    connect(m_controlPanel, &ControlPanel::selectRegionRequested,
            this, &MainApplication::onSelectRegion);

    setupTray();
    setupHotkeys();
    checkEnvironment();

    m_controlPanel->show();

    if (autoStart) {
        onStart();
    }

    qDebug() << COMMANDWATCH_APP_NAME << "initialized and running in system tray";
}

void MainApplication::setupTray()
{
    m_trayIcon = new QSystemTrayIcon(PlatformFeatures::instance().createTrayIcon(), this);
    m_trayMenu = new QMenu();

    m_selectRegionAction = m_trayMenu->addAction(tr("Select Region"));
    connect(m_selectRegionAction, &QAction::triggered, this, &MainApplication::onSelectRegion);

    m_startAction = m_trayMenu->addAction(tr("Start"));
    connect(m_startAction, &QAction::triggered, this, &MainApplication::onStart);

    m_pauseAction = m_trayMenu->addAction(tr("Pause"));
    connect(m_pauseAction, &QAction::triggered, this, &MainApplication::onTogglePause);

    m_trayMenu->addSeparator();

    QAction* showPanelAction = m_trayMenu->addAction(tr("Show Panel"));
    connect(showPanelAction, &QAction::triggered, this, &MainApplication::onShowPanel);

    m_trayMenu->addSeparator();

    QAction* exitAction = m_trayMenu->addAction(tr("Exit"));
    connect(exitAction, &QAction::triggered, this, &MainApplication::onExit);

    connect(m_trayIcon, &QSystemTrayIcon::activated, this,
            [this](QSystemTrayIcon::ActivationReason reason) {
                if (reason == QSystemTrayIcon::Trigger) {
                    onShowPanel();
                }
            });

    m_trayIcon->setContextMenu(m_trayMenu);
    m_trayIcon->setToolTip(QStringLiteral("%1 - watching for buttons").arg(COMMANDWATCH_APP_NAME));
    m_trayIcon->show();

    updateTrayActions();
}

void MainApplication::setupHotkeys()
{
    auto& hotkeys = HotkeyManager::instance();
    connect(&hotkeys, &HotkeyManager::actionTriggered, this, &MainApplication::onHotkeyAction);
    connect(&hotkeys, &HotkeyManager::registrationFailed, this, [this](const QStringList& names) {
        m_trayIcon->showMessage(tr("Hotkey Registration Failed"),
                                names.join(QStringLiteral(", ")) + tr(" failed to register."),
                                QSystemTrayIcon::Warning, 5000);
    });
    hotkeys.initialize();

    const auto toggle = hotkeys.getConfig(HotkeyAction::TogglePause);
    if (toggle.status == CommandWatch::HotkeyStatus::Registered) {
        m_pauseAction->setShortcut(QKeySequence(toggle.keySequence));
    }
}

void MainApplication::applyLaunchOptions(const CommandWatch::CLI::LaunchOptions &options)
{
    if (!options.stepsFile.isEmpty()) {
        m_controller->setStepsFilePath(options.stepsFile);
    }
    if (options.region.isValid()) {
        QScreen *screen = QGuiApplication::screenAt(options.region.center());
        if (!screen) {
            screen = QGuiApplication::primaryScreen();
        }
        m_controller->setRegion(options.region, screen);
    }
    if (options.pollIntervalMs > 0) {
        m_controller->setPollIntervalMs(options.pollIntervalMs);
    }
    if (options.noCountdown) {
        m_controller->setCountdownSeconds(0);
    }
}

void MainApplication::checkEnvironment()
{
    const QString stepsFile = m_controller->stepsFilePath();
    if (!QFileInfo::exists(stepsFile)) {
        qWarning().noquote() << QStringLiteral("Warning: Steps file not found at %1").arg(stepsFile);
    } else {
        const StepsDiagnostics diagnostics = m_controller->stepsTracker()->validate();
        for (const QString& issue : diagnostics.issues) {
            qWarning().noquote() << "Steps file issue:" << issue;
        }
        for (const QString& warning : diagnostics.warnings) {
            qWarning().noquote() << "Steps file warning:" << warning;
        }
    }

    const QStringList missing = PlatformFeatures::instance().unavailableFeatures();
    if (!missing.isEmpty()) {
        m_trayIcon->showMessage(tr("Running With Reduced Features"),
                                tr("Unavailable:\n%1").arg(missing.join('\n')),
                                QSystemTrayIcon::Warning, 5000);
    }
}

void MainApplication::onSelectRegion()
{
    if (m_regionSelector) {
        m_regionSelector->activateWindow();
        m_regionSelector->raise();
        return;
    }

    // Close any open popup menus to prevent focus conflicts
    if (QWidget *popup = QApplication::activePopupWidget()) {
        popup->close();
    }

    QScreen *screen = QGuiApplication::screenAt(QCursor::pos());
    if (!screen) {
        screen = QGuiApplication::primaryScreen();
    }
    if (!screen) {
        onErrorOccurred(tr("No screen available for region selection"));
        return;
    }

    m_regionSelector = new WatchRegionSelector();
    if (m_controller->hasRegion() && m_controller->screen() == screen) {
        m_regionSelector->initializeWithRegion(screen, m_controller->region());
    } else {
        m_regionSelector->initializeForScreen(screen);
    }

    connect(m_regionSelector, &WatchRegionSelector::regionSelected,
            this, &MainApplication::onRegionSelected);
    connect(m_regionSelector, &WatchRegionSelector::cancelled,
            this, &MainApplication::onRegionSelectionCancelled);

    m_regionSelector->show();
    m_regionSelector->activateWindow();
    m_regionSelector->raise();
}

void MainApplication::onStart()
{
    m_controller->start();
}

void MainApplication::onTogglePause()
{
    m_controller->togglePause();
}

void MainApplication::onShowPanel()
{
    m_controlPanel->show();
    m_controlPanel->raise();
    m_controlPanel->activateWindow();
}

void MainApplication::onExit()
{
    m_controller->stop();
    QCoreApplication::quit();
}

void MainApplication::onHotkeyAction(HotkeyAction action)
{
    switch (action) {
    case HotkeyAction::TogglePause:
        m_controller->togglePause();
        break;
    case HotkeyAction::ReselectRegion:
        onSelectRegion();
        break;
    case HotkeyAction::StopAutomation:
        m_controller->stop();
        break;
    case HotkeyAction::None:
        break;
    }
}

void MainApplication::onRegionSelected(const QRect &region, QScreen *screen)
{
    WatchSettingsManager::instance().saveRegion(region, screen ? screen->name() : QString());
    m_controller->setRegion(region, screen);

    if (m_startAfterSelection) {
        m_startAfterSelection = false;
        m_controller->start();
    }
    updateTrayActions();
}

void MainApplication::onRegionSelectionCancelled()
{
    m_startAfterSelection = false;
}

void MainApplication::onRegionRequired()
{
    m_startAfterSelection = true;
    onSelectRegion();
}

void MainApplication::onErrorOccurred(const QString &message)
{
    if (m_trayIcon) {
        m_trayIcon->showMessage(tr("%1 Error").arg(COMMANDWATCH_APP_NAME), message,
                                QSystemTrayIcon::Warning, 5000);
    }
}

void MainApplication::updateTrayActions()
{
    if (!m_startAction) {
        return;
    }

    const bool idle = !m_controller->isActive();
    m_startAction->setEnabled(idle);
    m_pauseAction->setEnabled(m_controller->isRunning() || m_controller->isPaused());
    m_pauseAction->setText(m_controller->isPaused() ? tr("Resume") : tr("Pause"));
}
