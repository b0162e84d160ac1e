#include <QApplication>
#include <QMessageBox>
#include <QProcessEnvironment>
#include <QSystemTrayIcon>

#include <cstdio>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/shell_config.hpp"
#include "common/version.hpp"
#include "shell/application_state.hpp"
#include "shell/errors.hpp"
#include "shell/github_release_source.hpp"
#include "shell/main_window.hpp"
#include "shell/process_handle.hpp"
#include "shell/service_supervisor.hpp"
#include "shell/shell_runtime.hpp"
#include "shell/tray_controller.hpp"
#include "shell/tray_icon.hpp"
#include "shell/unix_signal_watcher.hpp"
#include "shell/update_checker.hpp"
#include "shell/window_controller.hpp"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("streamshell"));
    QCoreApplication::setApplicationVersion(streamshell::appVersion());

    // Closing the window hides it; only the tray or a signal ends the session.
    app.setQuitOnLastWindowClosed(false);

    const streamshell::ShellConfigResult parsed = streamshell::parseShellConfig(
        QCoreApplication::arguments(), QProcessEnvironment::systemEnvironment());
    if (parsed.helpRequested) {
        std::fprintf(stdout, "%s", parsed.helpText.toUtf8().constData());
        return 0;
    }
    if (parsed.versionRequested) {
        std::fprintf(stdout, "streamshell %s\n", streamshell::appVersion().toUtf8().constData());
        return 0;
    }
    if (!parsed.config) {
        std::fprintf(stderr, "streamshell: %s\n", parsed.error.toUtf8().constData());
        return 1;
    }
    const streamshell::ShellConfig &config = *parsed.config;

    streamshell::logging::initLogging(QStringLiteral("streamshell"), config.verbose);
    SSLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("shell_start"),
               QStringLiteral("user_start"),
               (nlohmann::json{{"version", streamshell::appVersion().toStdString()},
                               {"workdir", config.workingDirectory.toStdString()}}));

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        SSLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("tray_unavailable"),
                    QStringLiteral("platform"),
                    nlohmann::json::object());
        std::fprintf(stderr, "streamshell: system tray not available. Exiting.\n");
        return 1;
    }

    streamshell::ServiceCommand command{config.serviceProgram,
                                        config.serviceArguments,
                                        config.workingDirectory};
    streamshell::SupervisorTimings timings{config.startupGracePeriod,
                                           config.terminateTimeout};
    streamshell::ServiceSupervisor supervisor(
        command, timings,
        []() { return std::make_unique<streamshell::QtProcessHandle>(); });
    streamshell::ApplicationState state(supervisor);

    streamshell::MainWindow window(streamshell::appVersion(), config.dashboardUrl);
    streamshell::WindowRegistry windows;
    windows.add(window);
    streamshell::WindowController windowController(windows);

    streamshell::TrayController trayController;
    streamshell::TrayIcon trayIcon(trayController.menu());

    streamshell::UpdateChecker updates(
        std::make_unique<streamshell::GithubReleaseSource>(config.updateRepository),
        streamshell::appVersion());

    streamshell::ShellRuntime runtime(state, windowController, trayController,
                                      trayIcon, updates);
    runtime.setUpdateCheckInterval(config.updateCheckIntervalHours);
    // Exceptions must not escape closeEvent; the runtime turns them into a
    // clean fatal shutdown.
    window.setCloseHandler([&runtime]() {
        runtime.onWindowCloseRequested();
    });

    QObject::connect(&trayIcon, &streamshell::TrayIcon::menuItemClicked,
                     &runtime, &streamshell::ShellRuntime::onMenuItemClicked);
    QObject::connect(&trayIcon, &streamshell::TrayIcon::iconClicked,
                     &runtime, &streamshell::ShellRuntime::onIconClicked);
    QObject::connect(&window, &streamshell::MainWindow::minimizeToTrayRequested,
                     &runtime, &streamshell::ShellRuntime::minimizeToTray);
    QObject::connect(&window, &streamshell::MainWindow::checkForUpdatesRequested,
                     &window, [&runtime, &window]() {
        window.setUpdateStatus(QStringLiteral("Checking for updates..."));
        runtime.checkForUpdates([&window](const streamshell::UpdateCheckResult &result) {
            switch (result.status) {
            case streamshell::UpdateCheckResult::Status::UpdateAvailable:
                window.setUpdateStatus(QStringLiteral("Version %1 is available.")
                                           .arg(result.latestVersion));
                break;
            case streamshell::UpdateCheckResult::Status::UpToDate:
                window.setUpdateStatus(QStringLiteral("You are running the latest version."));
                break;
            case streamshell::UpdateCheckResult::Status::Failed:
                window.setUpdateStatus(result.failureReason);
                break;
            }
        });
    });

    streamshell::UnixSignalWatcher signalWatcher;
    QObject::connect(&signalWatcher, &streamshell::UnixSignalWatcher::exitSignalReceived,
                     &runtime, &streamshell::ShellRuntime::onExitSignal);
    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     &runtime, &streamshell::ShellRuntime::onAboutToQuit);

    try {
        runtime.startup();
    } catch (const streamshell::SpawnError &ex) {
        SSLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("startup_aborted"),
                    QStringLiteral("spawn_error"),
                    (nlohmann::json{{"error", ex.what()}}));
        std::fprintf(stderr, "streamshell: %s\n", ex.what());
        QMessageBox::critical(nullptr,
                              QStringLiteral("Stream Helper"),
                              QStringLiteral("The background service could not be started:\n%1")
                                  .arg(QString::fromUtf8(ex.what())));
        return 1;
    } catch (const streamshell::WindowLookupError &ex) {
        SSLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("startup_aborted"),
                    QStringLiteral("window_lookup_error"),
                    (nlohmann::json{{"error", ex.what()}}));
        std::fprintf(stderr, "streamshell: %s\n", ex.what());
        return 1;
    }

    const int exitCode = app.exec();
    // aboutToQuit has already run the shutdown; this is a no-op then.
    runtime.shutdown(QStringLiteral("event_loop_exit"));
    return exitCode;
}
