#pragma once

#include <optional>
#include <vector>

#include <QString>

namespace streamshell {

enum class TrayAction {
    ShowWindow,
    HideWindow,
    ToggleAutoStart,
    CheckForUpdates,
    Quit
};

enum class TrayClick {
    LeftClick,
    DoubleClick,
    MiddleClick,
    ContextMenu
};

QString trayActionName(TrayAction action);

struct TrayMenuEntry {
    enum class Kind {
        Action,
        Separator
    };

    Kind kind = Kind::Separator;
    QString id;
    QString label;
};

// Ordered, immutable tray menu description.
class TrayMenuModel
{
public:
    explicit TrayMenuModel(std::vector<TrayMenuEntry> entries);

    // Show, Hide | Auto-Start | Check for Updates | Quit
    static TrayMenuModel standard();

    const std::vector<TrayMenuEntry> &entries() const { return m_entries; }

private:
    std::vector<TrayMenuEntry> m_entries;
};

// Stable identifiers carried by the tray menu actions.
namespace tray_ids {
inline const QString kShow = QStringLiteral("show");
inline const QString kHide = QStringLiteral("hide");
inline const QString kAutoStart = QStringLiteral("auto_start");
inline const QString kUpdate = QStringLiteral("update");
inline const QString kQuit = QStringLiteral("quit");
} // namespace tray_ids

// Translates tray events into actions. Holds no state beyond the menu.
class TrayController
{
public:
    TrayController();

    const TrayMenuModel &menu() const { return m_menu; }

    // Unknown identifiers yield std::nullopt and are otherwise ignored.
    std::optional<TrayAction> actionForMenuItem(const QString &id) const;
    std::optional<TrayAction> actionForIconClick(TrayClick click) const;

private:
    TrayMenuModel m_menu;
};

} // namespace streamshell
