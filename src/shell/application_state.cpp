#include "shell/application_state.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace streamshell {

QString lifecycleStateName(LifecycleState state)
{
    switch (state) {
    case LifecycleState::Uninitialized:
        return QStringLiteral("uninitialized");
    case LifecycleState::Running:
        return QStringLiteral("running");
    case LifecycleState::ShuttingDown:
        return QStringLiteral("shutting_down");
    case LifecycleState::Terminated:
        return QStringLiteral("terminated");
    }
    return QStringLiteral("unknown");
}

ApplicationState::ApplicationState(ServiceSupervisor &supervisor)
    : m_supervisor(supervisor)
{
}

LifecycleState ApplicationState::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool ApplicationState::markRunning()
{
    return advance(LifecycleState::Uninitialized, LifecycleState::Running);
}

bool ApplicationState::beginShutdown()
{
    return advance(LifecycleState::Running, LifecycleState::ShuttingDown);
}

bool ApplicationState::markTerminated()
{
    return advance(LifecycleState::ShuttingDown, LifecycleState::Terminated);
}

bool ApplicationState::advance(LifecycleState from, LifecycleState to)
{
    LifecycleState current;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        current = m_state;
        if (current == from) {
            m_state = to;
        }
    }

    if (current != from) {
        SSLOG_DEBUG(QStringLiteral("ApplicationState"),
                    QStringLiteral("advance"),
                    QStringLiteral("transition_rejected"),
                    QStringLiteral("not_predecessor"),
                    (nlohmann::json{{"current", lifecycleStateName(current).toStdString()},
                                    {"requested", lifecycleStateName(to).toStdString()}}));
        return false;
    }

    SSLOG_INFO(QStringLiteral("ApplicationState"),
               QStringLiteral("advance"),
               QStringLiteral("lifecycle_transition"),
               QStringLiteral("runtime"),
               (nlohmann::json{{"from", lifecycleStateName(from).toStdString()},
                               {"to", lifecycleStateName(to).toStdString()}}));
    return true;
}

} // namespace streamshell
