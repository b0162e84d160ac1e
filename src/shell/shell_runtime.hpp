#pragma once

#include <exception>
#include <functional>

#include <QObject>
#include <QString>

#include "shell/application_state.hpp"
#include "shell/tray_controller.hpp"
#include "shell/update_checker.hpp"

namespace streamshell {

class TraySurface;
class WindowController;

/**
 * ShellRuntime wires the supervisor, the tray and the main window together
 * and owns the shutdown sequence.
 *
 * Every way out of the application (tray Quit, a Unix exit signal, the
 * application's aboutToQuit, a fatal UI error) funnels through shutdown(),
 * which terminates the background service exactly once before the exit
 * function is called.
 */
class ShellRuntime : public QObject
{
    Q_OBJECT
public:
    using ExitFunction = std::function<void(int)>;

    ShellRuntime(ApplicationState &state,
                 WindowController &windows,
                 const TrayController &tray,
                 TraySurface &traySurface,
                 UpdateChecker &updates,
                 QObject *parent = nullptr);
    ~ShellRuntime() override;

    // Defaults to QCoreApplication::exit.
    void setExitFunction(ExitFunction exitFunction);
    void setUpdateCheckInterval(int hours) { m_updateIntervalHours = hours; }

    // Spawns the service, waits the grace period, shows tray and window.
    // Throws SpawnError; the window is never shown in that case.
    void startup();

    // Operations exposed to the UI layer.
    QString appVersion() const;
    void checkForUpdates(UpdateChecker::ResultCallback done);
    void minimizeToTray();

    // Close handler for the main window. Hides it; a missing window is fatal.
    void onWindowCloseRequested();

    void dispatch(TrayAction action);

    // Returns true if this call performed the cleanup.
    bool shutdown(const QString &trigger);

    LifecycleState lifecycleState() const { return m_state.state(); }

public slots:
    void onMenuItemClicked(const QString &id);
    void onIconClicked(streamshell::TrayClick click);
    void requestQuit();
    void onExitSignal(int signalNumber);
    void onAboutToQuit();

signals:
    void shutdownCompleted();

private:
    void runGuarded(const QString &where, const std::function<void()> &operation);
    void failFatally(const QString &where, const std::exception &ex);
    void notifyUpdateAvailable(const QString &latestVersion, const QString &releaseUrl);

    ApplicationState &m_state;
    WindowController &m_windows;
    const TrayController &m_tray;
    TraySurface &m_traySurface;
    UpdateChecker &m_updates;
    ExitFunction m_exit;
    int m_updateIntervalHours = 0;
};

} // namespace streamshell
