#pragma once

#include <map>

#include <QString>

namespace streamshell {

inline const QString kMainWindowName = QStringLiteral("main");

// What the lifecycle controller needs from a top-level window.
class ShellWindow
{
public:
    virtual ~ShellWindow() = default;

    virtual QString windowName() const = 0;
    virtual void showWindow() = 0;
    virtual void hideWindow() = 0;
    virtual void focusWindow() = 0;
    virtual bool isWindowVisible() const = 0;
};

// Borrowed references to the application's windows, looked up by name.
// The registry does not own the windows.
class WindowRegistry
{
public:
    void add(ShellWindow &window);
    void remove(const QString &name);

    // Throws WindowLookupError if no window is registered under `name`.
    ShellWindow &find(const QString &name) const;
    bool contains(const QString &name) const;

private:
    std::map<QString, ShellWindow *> m_windows;
};

/**
 * WindowController drives the main window. A close request from the
 * window system never destroys the window: it is turned into hide().
 * Quitting is only reachable through the tray or a process signal.
 */
class WindowController
{
public:
    explicit WindowController(WindowRegistry &registry,
                              QString windowName = kMainWindowName);

    // Make visible, then request input focus.
    void show();
    void hide();

    // Called from the window's close handler. Always hides; the caller
    // must cancel the default close.
    void onCloseRequested();

    bool isVisible() const;

private:
    ShellWindow &window() const;

    WindowRegistry &m_registry;
    QString m_windowName;
};

} // namespace streamshell
