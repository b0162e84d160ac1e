#include "shell/service_supervisor.hpp"

#include <QThread>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "shell/errors.hpp"

namespace streamshell {

namespace {

const char *phaseName(ServiceSupervisor::Phase phase)
{
    switch (phase) {
    case ServiceSupervisor::Phase::Idle:
        return "idle";
    case ServiceSupervisor::Phase::Starting:
        return "starting";
    case ServiceSupervisor::Phase::Running:
        return "running";
    case ServiceSupervisor::Phase::Stopped:
        return "stopped";
    }
    return "unknown";
}

} // namespace

ServiceSupervisor::ServiceSupervisor(ServiceCommand command,
                                     SupervisorTimings timings,
                                     ProcessHandleFactory factory,
                                     Sleeper sleeper)
    : m_command(std::move(command))
    , m_timings(timings)
    , m_factory(std::move(factory))
    , m_sleeper(std::move(sleeper))
{
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds delay) {
            QThread::msleep(static_cast<unsigned long>(delay.count()));
        };
    }
}

ServiceSupervisor::~ServiceSupervisor()
{
    terminate();
}

void ServiceSupervisor::start()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_phase != Phase::Idle) {
            SSLOG_WARN(QStringLiteral("ServiceSupervisor"),
                       QStringLiteral("start"),
                       QStringLiteral("start_ignored"),
                       QStringLiteral("already_started"),
                       (nlohmann::json{{"phase", phaseName(m_phase)}}));
            return;
        }
        m_phase = Phase::Starting;
    }

    SSLOG_INFO(QStringLiteral("ServiceSupervisor"),
               QStringLiteral("start"),
               QStringLiteral("spawn_service"),
               QStringLiteral("app_startup"),
               (nlohmann::json{{"program", m_command.program.toStdString()},
                               {"args", m_command.arguments.join(QLatin1Char(' ')).toStdString()},
                               {"cwd", m_command.workingDirectory.toStdString()}}));

    // Spawning may block for seconds; the lock is not held across it.
    std::unique_ptr<ProcessHandle> handle = m_factory();
    try {
        handle->spawn(m_command);
    } catch (const SpawnError &ex) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_phase = Phase::Stopped;
        }
        SSLOG_ERROR(QStringLiteral("ServiceSupervisor"),
                    QStringLiteral("start"),
                    QStringLiteral("spawn_failed"),
                    QStringLiteral("app_startup"),
                    (nlohmann::json{{"error", ex.what()}}));
        throw;
    }

    const qint64 pid = handle->pid();
    bool stoppedWhileStarting = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_phase == Phase::Starting) {
            m_handle = std::move(handle);
            m_phase = Phase::Running;
        } else {
            // terminate() ran during the spawn; this start owns the cleanup.
            stoppedWhileStarting = true;
            ++m_terminationAttempts;
        }
    }

    if (stoppedWhileStarting) {
        SSLOG_WARN(QStringLiteral("ServiceSupervisor"),
                   QStringLiteral("start"),
                   QStringLiteral("terminated_while_starting"),
                   QStringLiteral("shutdown"),
                   (nlohmann::json{{"pid", pid}}));
        terminateHandle(*handle);
        return;
    }

    // Fixed delay, not a readiness probe. The service may still be
    // initializing (or already dead) when this returns.
    SSLOG_DEBUG(QStringLiteral("ServiceSupervisor"),
                QStringLiteral("start"),
                QStringLiteral("grace_period_wait"),
                QStringLiteral("service_spawned"),
                (nlohmann::json{{"pid", pid},
                                {"graceMs", static_cast<qint64>(m_timings.startupGracePeriod.count())}}));
    m_sleeper(m_timings.startupGracePeriod);

    SSLOG_INFO(QStringLiteral("ServiceSupervisor"),
               QStringLiteral("start"),
               QStringLiteral("service_ready"),
               QStringLiteral("grace_period_elapsed"),
               (nlohmann::json{{"pid", pid}}));
}

void ServiceSupervisor::terminate()
{
    std::unique_ptr<ProcessHandle> handle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handle = std::move(m_handle);
        m_phase = Phase::Stopped;
        if (handle) {
            ++m_terminationAttempts;
        }
    }

    if (!handle) {
        SSLOG_DEBUG(QStringLiteral("ServiceSupervisor"),
                    QStringLiteral("terminate"),
                    QStringLiteral("terminate_noop"),
                    QStringLiteral("no_live_handle"),
                    nlohmann::json::object());
        return;
    }

    terminateHandle(*handle);
}

void ServiceSupervisor::terminateHandle(ProcessHandle &handle)
{
    const qint64 pid = handle.pid();
    try {
        if (handle.hasExited()) {
            SSLOG_INFO(QStringLiteral("ServiceSupervisor"),
                       QStringLiteral("terminate"),
                       QStringLiteral("service_already_exited"),
                       QStringLiteral("shutdown"),
                       (nlohmann::json{{"pid", pid}}));
            return;
        }
        handle.terminate(m_timings.terminateTimeout);
        SSLOG_INFO(QStringLiteral("ServiceSupervisor"),
                   QStringLiteral("terminate"),
                   QStringLiteral("service_terminated"),
                   QStringLiteral("shutdown"),
                   (nlohmann::json{{"pid", pid}}));
    } catch (const std::exception &ex) {
        // Shutdown is already underway; nothing left to recover.
        SSLOG_ERROR(QStringLiteral("ServiceSupervisor"),
                    QStringLiteral("terminate"),
                    QStringLiteral("terminate_failed"),
                    QStringLiteral("shutdown"),
                    (nlohmann::json{{"pid", pid}, {"error", ex.what()}}));
    }
}

bool ServiceSupervisor::isServiceAlive() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handle && !m_handle->hasExited();
}

qint64 ServiceSupervisor::servicePid() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handle ? m_handle->pid() : 0;
}

ServiceSupervisor::Phase ServiceSupervisor::phase() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_phase;
}

int ServiceSupervisor::terminationAttempts() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_terminationAttempts;
}

} // namespace streamshell
