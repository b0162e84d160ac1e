#include <QtTest/QtTest>

#include "shell/tray_controller.hpp"

using streamshell::TrayAction;
using streamshell::TrayClick;
using streamshell::TrayMenuEntry;

class TrayControllerTests : public QObject
{
    Q_OBJECT
private slots:
    void testStandardMenuLayout();
    void testMenuItemMapping();
    void testUnknownMenuItemIgnored();
    void testIconClicks();
    void testActionNames();
};

void TrayControllerTests::testStandardMenuLayout()
{
    streamshell::TrayController tray;
    const auto &entries = tray.menu().entries();
    QCOMPARE(entries.size(), size_t(8));

    const QStringList expectedIds{QStringLiteral("show"), QStringLiteral("hide"), QString(),
                                  QStringLiteral("auto_start"), QString(),
                                  QStringLiteral("update"), QString(), QStringLiteral("quit")};
    const QStringList expectedLabels{QStringLiteral("Show Window"), QStringLiteral("Hide Window"),
                                     QString(), QStringLiteral("Auto-Start on Boot"), QString(),
                                     QStringLiteral("Check for Updates"), QString(),
                                     QStringLiteral("Quit")};

    for (int i = 0; i < expectedIds.size(); ++i) {
        const TrayMenuEntry &entry = entries[static_cast<size_t>(i)];
        const bool separator = expectedIds[i].isEmpty();
        QCOMPARE(entry.kind == TrayMenuEntry::Kind::Separator, separator);
        QCOMPARE(entry.id, expectedIds[i]);
        QCOMPARE(entry.label, expectedLabels[i]);
    }
}

void TrayControllerTests::testMenuItemMapping()
{
    streamshell::TrayController tray;
    QVERIFY(tray.actionForMenuItem(streamshell::tray_ids::kShow) == TrayAction::ShowWindow);
    QVERIFY(tray.actionForMenuItem(streamshell::tray_ids::kHide) == TrayAction::HideWindow);
    QVERIFY(tray.actionForMenuItem(streamshell::tray_ids::kAutoStart) == TrayAction::ToggleAutoStart);
    QVERIFY(tray.actionForMenuItem(streamshell::tray_ids::kUpdate) == TrayAction::CheckForUpdates);
    QVERIFY(tray.actionForMenuItem(streamshell::tray_ids::kQuit) == TrayAction::Quit);

    // Every action entry in the menu resolves to an action.
    for (const TrayMenuEntry &entry : tray.menu().entries()) {
        if (entry.kind == TrayMenuEntry::Kind::Action) {
            QVERIFY2(tray.actionForMenuItem(entry.id).has_value(), qPrintable(entry.id));
        }
    }
}

void TrayControllerTests::testUnknownMenuItemIgnored()
{
    streamshell::TrayController tray;
    QVERIFY(!tray.actionForMenuItem(QStringLiteral("restart")).has_value());
    QVERIFY(!tray.actionForMenuItem(QStringLiteral("QUIT")).has_value());
    QVERIFY(!tray.actionForMenuItem(QString()).has_value());
}

void TrayControllerTests::testIconClicks()
{
    streamshell::TrayController tray;
    QVERIFY(tray.actionForIconClick(TrayClick::LeftClick) == TrayAction::ShowWindow);
    QVERIFY(!tray.actionForIconClick(TrayClick::DoubleClick).has_value());
    QVERIFY(!tray.actionForIconClick(TrayClick::MiddleClick).has_value());
    QVERIFY(!tray.actionForIconClick(TrayClick::ContextMenu).has_value());
}

void TrayControllerTests::testActionNames()
{
    QCOMPARE(streamshell::trayActionName(TrayAction::ShowWindow), QStringLiteral("show_window"));
    QCOMPARE(streamshell::trayActionName(TrayAction::HideWindow), QStringLiteral("hide_window"));
    QCOMPARE(streamshell::trayActionName(TrayAction::ToggleAutoStart), QStringLiteral("toggle_auto_start"));
    QCOMPARE(streamshell::trayActionName(TrayAction::CheckForUpdates), QStringLiteral("check_for_updates"));
    QCOMPARE(streamshell::trayActionName(TrayAction::Quit), QStringLiteral("quit"));
}

QTEST_MAIN(TrayControllerTests)
#include "test_tray_controller.moc"
