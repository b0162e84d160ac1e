#pragma once

#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>

#include "shell/tray_controller.hpp"

namespace streamshell {

// What the runtime needs from the notification-area icon.
class TraySurface
{
public:
    virtual ~TraySurface() = default;

    virtual void showTray() = 0;
    virtual void showNotification(const QString &title, const QString &message) = 0;
};

// TrayIcon renders a TrayMenuModel into a QSystemTrayIcon and reports
// clicks by menu identifier. It carries no application logic.
class TrayIcon : public QObject, public TraySurface
{
    Q_OBJECT
public:
    explicit TrayIcon(const TrayMenuModel &menu, QObject *parent = nullptr);
    ~TrayIcon() override;

    void showTray() override;
    void showNotification(const QString &title, const QString &message) override;

    QMenu &contextMenu() { return m_menu; }

signals:
    void menuItemClicked(const QString &id);
    void iconClicked(streamshell::TrayClick click);

private slots:
    void onActivated(QSystemTrayIcon::ActivationReason reason);

private:
    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
};

} // namespace streamshell
