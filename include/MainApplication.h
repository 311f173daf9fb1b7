#ifndef MAINAPPLICATION_H
#define MAINAPPLICATION_H

#include "cli/CLIResult.h"
#include "hotkey/HotkeyTypes.h"

#include <QObject>
#include <QPointer>
#include <QRect>

class QSystemTrayIcon;
class QMenu;
class QAction;
class QScreen;
class AutomationController;
class ControlPanel;
class WatchRegionSelector;

class MainApplication : public QObject
{
    Q_OBJECT

public:
    explicit MainApplication(QObject *parent = nullptr);
    ~MainApplication();

    /**
     * @brief Build the controller, panel and tray icon.
     * @param autoStart Start watching right away (the run command)
     */
    void initialize(const CommandWatch::CLI::LaunchOptions &options, bool autoStart);

private slots:
    void onSelectRegion();
    void onStart();
    void onTogglePause();
    void onShowPanel();
    void onExit();
    void onHotkeyAction(CommandWatch::HotkeyAction action);
    void onRegionSelected(const QRect &region, QScreen *screen);
    void onRegionSelectionCancelled();
    void onRegionRequired();
    void onErrorOccurred(const QString &message);
    void updateTrayActions();

private:
    void setupTray();
    void setupHotkeys();
    void applyLaunchOptions(const CommandWatch::CLI::LaunchOptions &options);
    void checkEnvironment();

    AutomationController *m_controller;
    ControlPanel *m_controlPanel;
    QPointer<WatchRegionSelector> m_regionSelector;
    QSystemTrayIcon *m_trayIcon;
    QMenu *m_trayMenu;
    QAction *m_selectRegionAction;
    QAction *m_startAction;
    QAction *m_pauseAction;
    bool m_startAfterSelection;
};

#endif // MAINAPPLICATION_H
