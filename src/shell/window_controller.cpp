#include "shell/window_controller.hpp"

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "shell/errors.hpp"

namespace streamshell {

void WindowRegistry::add(ShellWindow &window)
{
    m_windows[window.windowName()] = &window;
}

void WindowRegistry::remove(const QString &name)
{
    m_windows.erase(name);
}

ShellWindow &WindowRegistry::find(const QString &name) const
{
    const auto it = m_windows.find(name);
    if (it == m_windows.end() || it->second == nullptr) {
        throw WindowLookupError(QStringLiteral("Window '%1' does not exist")
                                    .arg(name)
                                    .toStdString());
    }
    return *it->second;
}

bool WindowRegistry::contains(const QString &name) const
{
    return m_windows.find(name) != m_windows.end();
}

WindowController::WindowController(WindowRegistry &registry, QString windowName)
    : m_registry(registry)
    , m_windowName(std::move(windowName))
{
}

void WindowController::show()
{
    ShellWindow &target = window();
    target.showWindow();
    target.focusWindow();
    SSLOG_DEBUG(QStringLiteral("WindowController"),
                QStringLiteral("show"),
                QStringLiteral("window_shown"),
                QStringLiteral("ui_action"),
                (nlohmann::json{{"window", m_windowName.toStdString()}}));
}

void WindowController::hide()
{
    window().hideWindow();
    SSLOG_DEBUG(QStringLiteral("WindowController"),
                QStringLiteral("hide"),
                QStringLiteral("window_hidden"),
                QStringLiteral("ui_action"),
                (nlohmann::json{{"window", m_windowName.toStdString()}}));
}

void WindowController::onCloseRequested()
{
    SSLOG_INFO(QStringLiteral("WindowController"),
               QStringLiteral("onCloseRequested"),
               QStringLiteral("close_intercepted"),
               QStringLiteral("window_close_button"),
               (nlohmann::json{{"window", m_windowName.toStdString()}}));
    hide();
}

bool WindowController::isVisible() const
{
    return window().isWindowVisible();
}

ShellWindow &WindowController::window() const
{
    return m_registry.find(m_windowName);
}

} // namespace streamshell
