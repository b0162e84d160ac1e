#include "shell/tray_icon.hpp"

#include <QAction>
#include <QApplication>
#include <QIcon>
#include <QStyle>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace streamshell {

TrayIcon::TrayIcon(const TrayMenuModel &menu, QObject *parent)
    : QObject(parent)
{
    for (const TrayMenuEntry &entry : menu.entries()) {
        if (entry.kind == TrayMenuEntry::Kind::Separator) {
            m_menu.addSeparator();
            continue;
        }

        QAction *action = m_menu.addAction(entry.label);
        action->setData(entry.id);
        const QString id = entry.id;
        connect(action, &QAction::triggered, this, [this, id]() {
            emit menuItemClicked(id);
        });
    }

    QIcon icon = QIcon::fromTheme(QStringLiteral("media-record"));
    if (icon.isNull() && qApp) {
        icon = qApp->style()->standardIcon(QStyle::SP_ComputerIcon);
    }
    m_trayIcon.setIcon(icon);
    m_trayIcon.setToolTip(QStringLiteral("Stream Helper"));
    m_trayIcon.setContextMenu(&m_menu);

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &TrayIcon::onActivated);
}

TrayIcon::~TrayIcon() = default;

void TrayIcon::showTray()
{
    m_trayIcon.show();
}

void TrayIcon::showNotification(const QString &title, const QString &message)
{
    SSLOG_DEBUG(QStringLiteral("TrayIcon"),
                QStringLiteral("showNotification"),
                QStringLiteral("tray_notification"),
                QStringLiteral("runtime_request"),
                (nlohmann::json{{"title", title.toStdString()}}));
    m_trayIcon.showMessage(title, message, QSystemTrayIcon::Information);
}

void TrayIcon::onActivated(QSystemTrayIcon::ActivationReason reason)
{
    switch (reason) {
    case QSystemTrayIcon::Trigger:
        emit iconClicked(TrayClick::LeftClick);
        break;
    case QSystemTrayIcon::DoubleClick:
        emit iconClicked(TrayClick::DoubleClick);
        break;
    case QSystemTrayIcon::MiddleClick:
        emit iconClicked(TrayClick::MiddleClick);
        break;
    case QSystemTrayIcon::Context:
        emit iconClicked(TrayClick::ContextMenu);
        break;
    case QSystemTrayIcon::Unknown:
        break;
    }
}

} // namespace streamshell
