#include <QtTest/QtTest>

#include <QLabel>
#include <QPushButton>
#include <QSignalSpy>

#include "shell/main_window.hpp"
#include "shell/window_controller.hpp"

class MainWindowTests : public QObject
{
    Q_OBJECT
private slots:
    void testIdentity();
    void testCloseHidesWithoutHandler();
    void testCloseCallsHandler();
    void testCloseThroughController();
    void testButtonsEmitSignals();
    void testUpdateStatus();

private:
    static QPushButton *button(streamshell::MainWindow &window, const QString &text);
};

QPushButton *MainWindowTests::button(streamshell::MainWindow &window, const QString &text)
{
    const auto buttons = window.findChildren<QPushButton *>();
    for (QPushButton *candidate : buttons) {
        if (candidate->text() == text) {
            return candidate;
        }
    }
    return nullptr;
}

void MainWindowTests::testIdentity()
{
    streamshell::MainWindow window(QStringLiteral("1.2.3"), QUrl(QStringLiteral("http://localhost:3000")));
    QCOMPARE(window.windowName(), QStringLiteral("main"));
    QCOMPARE(window.objectName(), streamshell::kMainWindowName);

    QVERIFY(button(window, QStringLiteral("Open Dashboard")));
    QVERIFY(button(window, QStringLiteral("Check for Updates")));
    QVERIFY(button(window, QStringLiteral("Minimize to Tray")));
}

void MainWindowTests::testCloseHidesWithoutHandler()
{
    streamshell::MainWindow window(QStringLiteral("1.2.3"), QUrl(QStringLiteral("http://localhost:3000")));
    window.showWindow();
    QVERIFY(window.isWindowVisible());

    QVERIFY(!window.close());
    QVERIFY(!window.isWindowVisible());

    window.showWindow();
    QVERIFY(window.isWindowVisible());
}

void MainWindowTests::testCloseCallsHandler()
{
    streamshell::MainWindow window(QStringLiteral("1.2.3"), QUrl(QStringLiteral("http://localhost:3000")));
    int handled = 0;
    window.setCloseHandler([&handled]() { ++handled; });
    window.showWindow();

    QVERIFY(!window.close());
    QCOMPARE(handled, 1);
    // The handler decides; the close itself never hides or destroys.
    QVERIFY(window.isWindowVisible());
}

void MainWindowTests::testCloseThroughController()
{
    streamshell::MainWindow window(QStringLiteral("1.2.3"), QUrl(QStringLiteral("http://localhost:3000")));
    streamshell::WindowRegistry registry;
    registry.add(window);
    streamshell::WindowController controller(registry);
    window.setCloseHandler([&controller]() { controller.onCloseRequested(); });

    controller.show();
    QVERIFY(controller.isVisible());
    QVERIFY(!window.close());
    QVERIFY(!controller.isVisible());

    controller.show();
    QVERIFY(controller.isVisible());
}

void MainWindowTests::testButtonsEmitSignals()
{
    streamshell::MainWindow window(QStringLiteral("1.2.3"), QUrl(QStringLiteral("http://localhost:3000")));
    QSignalSpy minimizeSpy(&window, &streamshell::MainWindow::minimizeToTrayRequested);
    QSignalSpy updateSpy(&window, &streamshell::MainWindow::checkForUpdatesRequested);

    QPushButton *minimize = button(window, QStringLiteral("Minimize to Tray"));
    QPushButton *update = button(window, QStringLiteral("Check for Updates"));
    QVERIFY(minimize);
    QVERIFY(update);

    minimize->click();
    update->click();
    update->click();

    QCOMPARE(minimizeSpy.count(), 1);
    QCOMPARE(updateSpy.count(), 2);
}

void MainWindowTests::testUpdateStatus()
{
    streamshell::MainWindow window(QStringLiteral("1.2.3"), QUrl(QStringLiteral("http://localhost:3000")));
    auto *label = window.findChild<QLabel *>(QStringLiteral("updateStatus"));
    QVERIFY(label);

    window.setUpdateStatus(QStringLiteral("Up to date"));
    QCOMPARE(label->text(), QStringLiteral("Up to date"));
}

QTEST_MAIN(MainWindowTests)
#include "test_main_window.moc"
