#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include "shell/process_handle.hpp"

namespace streamshell {

struct SupervisorTimings {
    std::chrono::milliseconds startupGracePeriod{2000};
    std::chrono::milliseconds terminateTimeout{3000};
};

/**
 * ServiceSupervisor owns the one background service process of a session.
 *
 * - start() spawns the service once, then blocks for the startup grace
 *   period. Readiness is not probed: the wait is a fixed delay.
 * - terminate() is idempotent. The handle is taken under the lock and
 *   terminated outside it; failures are logged, never rethrown.
 * - The lock is never held across spawn. A terminate() that lands while
 *   the service is starting wins: the fresh process is stopped at once.
 * - A terminated service is never respawned.
 */
class ServiceSupervisor
{
public:
    enum class Phase {
        Idle,
        Starting,
        Running,
        Stopped
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    ServiceSupervisor(ServiceCommand command,
                      SupervisorTimings timings,
                      ProcessHandleFactory factory,
                      Sleeper sleeper = Sleeper());
    ~ServiceSupervisor();

    ServiceSupervisor(const ServiceSupervisor &) = delete;
    ServiceSupervisor &operator=(const ServiceSupervisor &) = delete;

    // Throws SpawnError. Calling it again after the first call is a no-op.
    void start();
    void terminate();

    bool isServiceAlive() const;
    qint64 servicePid() const;
    Phase phase() const;
    int terminationAttempts() const;

    const ServiceCommand &command() const { return m_command; }

private:
    // Logs failures instead of throwing.
    void terminateHandle(ProcessHandle &handle);

    ServiceCommand m_command;
    SupervisorTimings m_timings;
    ProcessHandleFactory m_factory;
    Sleeper m_sleeper;

    mutable std::mutex m_mutex;
    std::unique_ptr<ProcessHandle> m_handle;
    Phase m_phase = Phase::Idle;
    int m_terminationAttempts = 0;
};

} // namespace streamshell
