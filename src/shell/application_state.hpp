#pragma once

#include <mutex>

#include <QString>

namespace streamshell {

class ServiceSupervisor;

enum class LifecycleState {
    Uninitialized,
    Running,
    ShuttingDown,
    Terminated
};

QString lifecycleStateName(LifecycleState state);

/**
 * ApplicationState is the per-run context handed to the runtime.
 * It references the session's ServiceSupervisor and tracks the lifecycle,
 * which only ever advances one step at a time:
 * Uninitialized -> Running -> ShuttingDown -> Terminated.
 */
class ApplicationState
{
public:
    explicit ApplicationState(ServiceSupervisor &supervisor);

    ServiceSupervisor &supervisor() { return m_supervisor; }
    LifecycleState state() const;

    // Each returns false (and changes nothing) unless the current state is
    // the immediate predecessor of the requested one.
    bool markRunning();
    bool beginShutdown();
    bool markTerminated();

private:
    bool advance(LifecycleState from, LifecycleState to);

    ServiceSupervisor &m_supervisor;
    mutable std::mutex m_mutex;
    LifecycleState m_state = LifecycleState::Uninitialized;
};

} // namespace streamshell
