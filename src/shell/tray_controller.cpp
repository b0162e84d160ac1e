#include "shell/tray_controller.hpp"

namespace streamshell {

namespace {

TrayMenuEntry item(const QString &id, const QString &label)
{
    return TrayMenuEntry{TrayMenuEntry::Kind::Action, id, label};
}

TrayMenuEntry separator()
{
    return TrayMenuEntry{TrayMenuEntry::Kind::Separator, QString(), QString()};
}

} // namespace

QString trayActionName(TrayAction action)
{
    switch (action) {
    case TrayAction::ShowWindow:
        return QStringLiteral("show_window");
    case TrayAction::HideWindow:
        return QStringLiteral("hide_window");
    case TrayAction::ToggleAutoStart:
        return QStringLiteral("toggle_auto_start");
    case TrayAction::CheckForUpdates:
        return QStringLiteral("check_for_updates");
    case TrayAction::Quit:
        return QStringLiteral("quit");
    }
    return QStringLiteral("unknown");
}

TrayMenuModel::TrayMenuModel(std::vector<TrayMenuEntry> entries)
    : m_entries(std::move(entries))
{
}

TrayMenuModel TrayMenuModel::standard()
{
    return TrayMenuModel({
        item(tray_ids::kShow, QStringLiteral("Show Window")),
        item(tray_ids::kHide, QStringLiteral("Hide Window")),
        separator(),
        item(tray_ids::kAutoStart, QStringLiteral("Auto-Start on Boot")),
        separator(),
        item(tray_ids::kUpdate, QStringLiteral("Check for Updates")),
        separator(),
        item(tray_ids::kQuit, QStringLiteral("Quit")),
    });
}

TrayController::TrayController()
    : m_menu(TrayMenuModel::standard())
{
}

std::optional<TrayAction> TrayController::actionForMenuItem(const QString &id) const
{
    if (id == tray_ids::kShow) {
        return TrayAction::ShowWindow;
    }
    if (id == tray_ids::kHide) {
        return TrayAction::HideWindow;
    }
    if (id == tray_ids::kAutoStart) {
        return TrayAction::ToggleAutoStart;
    }
    if (id == tray_ids::kUpdate) {
        return TrayAction::CheckForUpdates;
    }
    if (id == tray_ids::kQuit) {
        return TrayAction::Quit;
    }
    return std::nullopt;
}

std::optional<TrayAction> TrayController::actionForIconClick(TrayClick click) const
{
    // Only a plain left click on the icon maps to an action; the context
    // menu is opened by the tray itself.
    if (click == TrayClick::LeftClick) {
        return TrayAction::ShowWindow;
    }
    return std::nullopt;
}

} // namespace streamshell
