#include "shell/shell_runtime.hpp"

#include <QCoreApplication>

#include <cstdlib>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/version.hpp"
#include "shell/errors.hpp"
#include "shell/service_supervisor.hpp"
#include "shell/tray_icon.hpp"
#include "shell/window_controller.hpp"

namespace streamshell {

ShellRuntime::ShellRuntime(ApplicationState &state,
                           WindowController &windows,
                           const TrayController &tray,
                           TraySurface &traySurface,
                           UpdateChecker &updates,
                           QObject *parent)
    : QObject(parent)
    , m_state(state)
    , m_windows(windows)
    , m_tray(tray)
    , m_traySurface(traySurface)
    , m_updates(updates)
    , m_exit([](int code) { QCoreApplication::exit(code); })
{
    connect(&m_updates, &UpdateChecker::updateAvailable,
            this, &ShellRuntime::notifyUpdateAvailable);
}

ShellRuntime::~ShellRuntime() = default;

void ShellRuntime::setExitFunction(ExitFunction exitFunction)
{
    m_exit = std::move(exitFunction);
}

void ShellRuntime::startup()
{
    if (m_state.state() != LifecycleState::Uninitialized) {
        SSLOG_WARN(QStringLiteral("ShellRuntime"),
                   QStringLiteral("startup"),
                   QStringLiteral("startup_ignored"),
                   QStringLiteral("already_started"),
                   (nlohmann::json{{"state", lifecycleStateName(m_state.state()).toStdString()}}));
        return;
    }

    SSLOG_INFO(QStringLiteral("ShellRuntime"),
               QStringLiteral("startup"),
               QStringLiteral("shell_startup"),
               QStringLiteral("process_start"),
               (nlohmann::json{{"version", appVersion().toStdString()}}));

    // SpawnError propagates; nothing below runs without a service.
    m_state.supervisor().start();

    m_traySurface.showTray();
    m_windows.show();
    m_state.markRunning();
    m_updates.startAutoCheck(m_updateIntervalHours);
}

QString ShellRuntime::appVersion() const
{
    return streamshell::appVersion();
}

void ShellRuntime::checkForUpdates(UpdateChecker::ResultCallback done)
{
    m_updates.checkForUpdates(std::move(done));
}

void ShellRuntime::minimizeToTray()
{
    runGuarded(QStringLiteral("minimizeToTray"), [this]() {
        m_windows.hide();
    });
}

void ShellRuntime::onWindowCloseRequested()
{
    runGuarded(QStringLiteral("onWindowCloseRequested"), [this]() {
        m_windows.onCloseRequested();
    });
}

void ShellRuntime::dispatch(TrayAction action)
{
    SSLOG_INFO(QStringLiteral("ShellRuntime"),
               QStringLiteral("dispatch"),
               QStringLiteral("tray_action"),
               QStringLiteral("user_action"),
               (nlohmann::json{{"action", trayActionName(action).toStdString()}}));

    switch (action) {
    case TrayAction::ShowWindow:
        runGuarded(QStringLiteral("dispatch"), [this]() { m_windows.show(); });
        break;
    case TrayAction::HideWindow:
        runGuarded(QStringLiteral("dispatch"), [this]() { m_windows.hide(); });
        break;
    case TrayAction::ToggleAutoStart:
        // No persisted effect: auto-start is not implemented.
        SSLOG_INFO(QStringLiteral("ShellRuntime"),
                   QStringLiteral("dispatch"),
                   QStringLiteral("auto_start_toggled"),
                   QStringLiteral("not_implemented"),
                   nlohmann::json::object());
        break;
    case TrayAction::CheckForUpdates:
        m_updates.checkForUpdates();
        break;
    case TrayAction::Quit:
        requestQuit();
        break;
    }
}

bool ShellRuntime::shutdown(const QString &trigger)
{
    if (!m_state.beginShutdown()) {
        SSLOG_DEBUG(QStringLiteral("ShellRuntime"),
                    QStringLiteral("shutdown"),
                    QStringLiteral("shutdown_skipped"),
                    trigger,
                    (nlohmann::json{{"state", lifecycleStateName(m_state.state()).toStdString()}}));
        return false;
    }

    SSLOG_INFO(QStringLiteral("ShellRuntime"),
               QStringLiteral("shutdown"),
               QStringLiteral("shutdown_started"),
               trigger,
               nlohmann::json::object());

    // Pending update results are dropped; shutdown does not wait for them.
    m_updates.shutdown();
    m_state.supervisor().terminate();
    m_state.markTerminated();

    SSLOG_INFO(QStringLiteral("ShellRuntime"),
               QStringLiteral("shutdown"),
               QStringLiteral("shutdown_completed"),
               trigger,
               nlohmann::json::object());
    emit shutdownCompleted();
    return true;
}

void ShellRuntime::onMenuItemClicked(const QString &id)
{
    const auto action = m_tray.actionForMenuItem(id);
    if (!action) {
        SSLOG_DEBUG(QStringLiteral("ShellRuntime"),
                    QStringLiteral("onMenuItemClicked"),
                    QStringLiteral("unknown_menu_item"),
                    QStringLiteral("tray_menu"),
                    (nlohmann::json{{"id", id.toStdString()}}));
        return;
    }
    dispatch(*action);
}

void ShellRuntime::onIconClicked(TrayClick click)
{
    const auto action = m_tray.actionForIconClick(click);
    if (action) {
        dispatch(*action);
    }
}

void ShellRuntime::requestQuit()
{
    shutdown(QStringLiteral("tray_quit"));
    m_exit(EXIT_SUCCESS);
}

void ShellRuntime::onExitSignal(int signalNumber)
{
    shutdown(QStringLiteral("signal_%1").arg(signalNumber));
    m_exit(EXIT_SUCCESS);
}

void ShellRuntime::onAboutToQuit()
{
    shutdown(QStringLiteral("about_to_quit"));
}

void ShellRuntime::runGuarded(const QString &where, const std::function<void()> &operation)
{
    try {
        operation();
    } catch (const WindowLookupError &ex) {
        failFatally(where, ex);
    } catch (const std::exception &ex) {
        SSLOG_ERROR(QStringLiteral("ShellRuntime"),
                    where,
                    QStringLiteral("ui_action_failed"),
                    QStringLiteral("exception"),
                    (nlohmann::json{{"error", ex.what()}}));
    }
}

void ShellRuntime::failFatally(const QString &where, const std::exception &ex)
{
    SSLOG_ERROR(QStringLiteral("ShellRuntime"),
                where,
                QStringLiteral("fatal_error"),
                QStringLiteral("invariant_violation"),
                (nlohmann::json{{"error", ex.what()}}));
    shutdown(QStringLiteral("fatal_error"));
    m_exit(EXIT_FAILURE);
}

void ShellRuntime::notifyUpdateAvailable(const QString &latestVersion, const QString &releaseUrl)
{
    QString message = QStringLiteral("Version %1 is available (installed: %2).")
                          .arg(latestVersion, m_updates.currentVersion());
    if (!releaseUrl.isEmpty()) {
        message += QLatin1Char('\n') + releaseUrl;
    }
    m_traySurface.showNotification(QStringLiteral("Update available"), message);
}

} // namespace streamshell
