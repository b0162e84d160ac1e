#include <QtTest/QtTest>

#include <QSignalSpy>

#include <csignal>
#include <memory>
#include <vector>

#include "shell/application_state.hpp"
#include "shell/errors.hpp"
#include "shell/service_supervisor.hpp"
#include "shell/shell_runtime.hpp"
#include "shell/tray_controller.hpp"
#include "shell/update_checker.hpp"
#include "shell/window_controller.hpp"
#include "test_fakes.hpp"

using namespace std::chrono_literals;
using streamshell::LifecycleState;
using streamshell::TrayAction;
using streamshell::TrayClick;

class ShellRuntimeTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testQuitTerminatesServiceOnce();
    void testStartupOrder();
    void testSpawnFailureNeverShowsWindow();
    void testCloseHidesWithoutTerminating();
    void testTrayEventsNeverRespawn();
    void testUnknownMenuItemIgnored();
    void testExitSignalDuringUpdateCheck();
    void testUpdateNotification();
    void testMissingWindowIsFatal();
    void testMissingWindowOnCloseIsFatal();
    void testMinimizeToTray();
    void testAppVersion();
    void testAutoStartHasNoEffect();
    void testAutoCheckOnStartup();

private:
    std::unique_ptr<TempHome> m_home;
};

namespace {

// Everything main() wires together, with fakes at the process, window,
// tray and network seams.
struct Harness {
    std::shared_ptr<FakeProcessStats> stats = std::make_shared<FakeProcessStats>();
    QStringList events;
    FakeWindow window;
    streamshell::WindowRegistry registry;
    FakeTraySurface traySurface;
    FakeUpdateSource *updateSource = nullptr;
    std::vector<int> exitCodes;

    std::unique_ptr<streamshell::ServiceSupervisor> supervisor;
    std::unique_ptr<streamshell::ApplicationState> state;
    std::unique_ptr<streamshell::WindowController> windows;
    streamshell::TrayController tray;
    std::unique_ptr<streamshell::UpdateChecker> updates;
    std::unique_ptr<streamshell::ShellRuntime> runtime;

    explicit Harness(const QString &currentVersion = QStringLiteral("1.0.0"))
    {
        supervisor = std::make_unique<streamshell::ServiceSupervisor>(
            streamshell::ServiceCommand{QStringLiteral("node"), {QStringLiteral("server.js")}, QString()},
            streamshell::SupervisorTimings{2000ms, 3000ms},
            fakeProcessFactory(stats),
            [this](std::chrono::milliseconds delay) {
                events << QStringLiteral("grace:%1").arg(delay.count());
                events << QStringLiteral("visible:%1").arg(window.visible ? 1 : 0);
                events << QStringLiteral("tray:%1").arg(traySurface.showTrayCalls);
            });
        state = std::make_unique<streamshell::ApplicationState>(*supervisor);
        registry.add(window);
        windows = std::make_unique<streamshell::WindowController>(registry);

        auto source = std::make_unique<FakeUpdateSource>();
        updateSource = source.get();
        updates = std::make_unique<streamshell::UpdateChecker>(std::move(source), currentVersion);

        runtime = std::make_unique<streamshell::ShellRuntime>(*state, *windows, tray, traySurface,
                                                              *updates);
        runtime->setExitFunction([this](int code) { exitCodes.push_back(code); });
    }
};

} // namespace

void ShellRuntimeTests::initTestCase()
{
    m_home = std::make_unique<TempHome>();
    QVERIFY(m_home->isValid());
}

void ShellRuntimeTests::testQuitTerminatesServiceOnce()
{
    Harness h;
    QSignalSpy completedSpy(h.runtime.get(), &streamshell::ShellRuntime::shutdownCompleted);

    h.runtime->startup();
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Running);
    QCOMPARE(h.stats->spawnCalls, 1);

    h.runtime->onMenuItemClicked(streamshell::tray_ids::kQuit);
    QCOMPARE(h.stats->terminateCalls, 1);
    QVERIFY(h.exitCodes == std::vector<int>{0});
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Terminated);
    QCOMPARE(completedSpy.count(), 1);

    // The event loop then emits aboutToQuit; cleanup must not run again.
    h.runtime->onAboutToQuit();
    h.runtime->onExitSignal(SIGTERM);
    QCOMPARE(h.stats->terminateCalls, 1);
    QCOMPARE(h.supervisor->terminationAttempts(), 1);
    QCOMPARE(completedSpy.count(), 1);
}

void ShellRuntimeTests::testStartupOrder()
{
    Harness h;
    h.runtime->startup();

    // The grace period elapses before the tray or window appear.
    QCOMPARE(h.events, (QStringList{QStringLiteral("grace:2000"), QStringLiteral("visible:0"),
                                    QStringLiteral("tray:0")}));
    QCOMPARE(h.traySurface.showTrayCalls, 1);
    QCOMPARE(h.window.calls, (QStringList{QStringLiteral("show"), QStringLiteral("focus")}));

    // A second startup is ignored.
    h.runtime->startup();
    QCOMPARE(h.stats->spawnCalls, 1);
    QCOMPARE(h.traySurface.showTrayCalls, 1);
}

void ShellRuntimeTests::testSpawnFailureNeverShowsWindow()
{
    Harness h;
    h.stats->failSpawn = true;

    bool thrown = false;
    try {
        h.runtime->startup();
    } catch (const streamshell::SpawnError &) {
        thrown = true;
    }
    QVERIFY(thrown);
    QVERIFY(h.window.calls.isEmpty());
    QCOMPARE(h.traySurface.showTrayCalls, 0);
    QVERIFY(h.events.isEmpty());
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Uninitialized);
    QVERIFY(h.exitCodes.empty());
}

void ShellRuntimeTests::testCloseHidesWithoutTerminating()
{
    Harness h;
    h.runtime->startup();

    h.runtime->onWindowCloseRequested();
    QVERIFY(!h.window.visible);
    QCOMPARE(h.stats->terminateCalls, 0);
    QVERIFY(h.exitCodes.empty());
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Running);

    h.runtime->onIconClicked(TrayClick::LeftClick);
    QVERIFY(h.window.visible);
    QCOMPARE(h.window.count(QStringLiteral("focus")), 2);
}

void ShellRuntimeTests::testTrayEventsNeverRespawn()
{
    Harness h;
    h.runtime->startup();

    const std::vector<TrayAction> actions{TrayAction::HideWindow, TrayAction::ShowWindow,
                                          TrayAction::ToggleAutoStart, TrayAction::HideWindow,
                                          TrayAction::ShowWindow, TrayAction::ToggleAutoStart};
    for (TrayAction action : actions) {
        h.runtime->dispatch(action);
    }
    h.runtime->onIconClicked(TrayClick::DoubleClick);
    h.runtime->onIconClicked(TrayClick::MiddleClick);
    h.runtime->onIconClicked(TrayClick::LeftClick);
    h.runtime->onWindowCloseRequested();

    QCOMPARE(h.stats->handlesCreated, 1);
    QCOMPARE(h.stats->spawnCalls, 1);
    QCOMPARE(h.stats->terminateCalls, 0);
    QVERIFY(h.supervisor->isServiceAlive());
}

void ShellRuntimeTests::testUnknownMenuItemIgnored()
{
    Harness h;
    h.runtime->startup();
    const QStringList before = h.window.calls;

    h.runtime->onMenuItemClicked(QStringLiteral("restart_server"));
    h.runtime->onMenuItemClicked(QString());

    QCOMPARE(h.window.calls, before);
    QCOMPARE(h.stats->terminateCalls, 0);
    QCOMPARE(h.updateSource->fetchCalls, 0);
    QVERIFY(h.exitCodes.empty());
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Running);
}

void ShellRuntimeTests::testExitSignalDuringUpdateCheck()
{
    Harness h;
    h.runtime->startup();

    int callbacks = 0;
    h.runtime->checkForUpdates([&callbacks](const streamshell::UpdateCheckResult &) { ++callbacks; });
    QCOMPARE(h.updateSource->fetchCalls, 1);

    h.runtime->onExitSignal(SIGTERM);
    QCOMPARE(h.stats->terminateCalls, 1);
    QVERIFY(h.exitCodes == std::vector<int>{0});
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Terminated);

    h.updateSource->completeWithVersion(QStringLiteral("2.0.0"));
    QCOMPARE(callbacks, 0);
    QVERIFY(h.traySurface.notificationTitles.isEmpty());
}

void ShellRuntimeTests::testUpdateNotification()
{
    Harness h(QStringLiteral("1.0.0"));
    h.runtime->startup();

    h.runtime->onMenuItemClicked(streamshell::tray_ids::kUpdate);
    QCOMPARE(h.updateSource->fetchCalls, 1);
    h.updateSource->completeWithVersion(QStringLiteral("2.0.0"));

    QCOMPARE(h.traySurface.notificationTitles, QStringList{QStringLiteral("Update available")});
    QVERIFY(h.traySurface.notificationMessages.first().contains(QStringLiteral("2.0.0")));
    QVERIFY(h.traySurface.notificationMessages.first().contains(QStringLiteral("1.0.0")));

    streamshell::UpdateCheckResult seen;
    h.runtime->checkForUpdates([&seen](const streamshell::UpdateCheckResult &result) { seen = result; });
    h.updateSource->completeWithVersion(QStringLiteral("1.0.0"));
    QVERIFY(seen.status == streamshell::UpdateCheckResult::Status::UpToDate);
    QCOMPARE(h.traySurface.notificationTitles.size(), 1);
}

void ShellRuntimeTests::testMissingWindowIsFatal()
{
    Harness h;
    h.runtime->startup();
    h.registry.remove(streamshell::kMainWindowName);

    h.runtime->dispatch(TrayAction::ShowWindow);

    QVERIFY(h.exitCodes == std::vector<int>{1});
    QCOMPARE(h.stats->terminateCalls, 1);
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Terminated);
}

void ShellRuntimeTests::testMissingWindowOnCloseIsFatal()
{
    Harness h;
    h.runtime->startup();
    h.registry.remove(streamshell::kMainWindowName);

    // Must not throw out of the window's close handler.
    h.runtime->onWindowCloseRequested();

    QVERIFY(h.exitCodes == std::vector<int>{1});
    QCOMPARE(h.stats->terminateCalls, 1);
    QVERIFY(h.runtime->lifecycleState() == LifecycleState::Terminated);
}

void ShellRuntimeTests::testMinimizeToTray()
{
    Harness h;
    h.runtime->startup();
    QVERIFY(h.window.visible);

    h.runtime->minimizeToTray();
    QVERIFY(!h.window.visible);
    QCOMPARE(h.stats->terminateCalls, 0);
    QVERIFY(h.exitCodes.empty());
}

void ShellRuntimeTests::testAppVersion()
{
    Harness h;
    QCOMPARE(h.runtime->appVersion(), QStringLiteral(STREAMSHELL_VERSION));
}

void ShellRuntimeTests::testAutoStartHasNoEffect()
{
    Harness h;
    h.runtime->startup();
    const QStringList before = h.window.calls;

    h.runtime->onMenuItemClicked(streamshell::tray_ids::kAutoStart);

    QCOMPARE(h.window.calls, before);
    QCOMPARE(h.stats->spawnCalls, 1);
    QCOMPARE(h.stats->terminateCalls, 0);
    QVERIFY(h.exitCodes.empty());
}

void ShellRuntimeTests::testAutoCheckOnStartup()
{
    Harness h;
    h.runtime->setUpdateCheckInterval(24);
    h.runtime->startup();
    QCOMPARE(h.updateSource->fetchCalls, 1);

    Harness disabled;
    disabled.runtime->startup();
    QCOMPARE(disabled.updateSource->fetchCalls, 0);
}

QTEST_MAIN(ShellRuntimeTests)
#include "test_shell_runtime.moc"
