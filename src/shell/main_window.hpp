#pragma once

#include <functional>

#include <QLabel>
#include <QMainWindow>
#include <QUrl>

#include "shell/window_controller.hpp"

class QCloseEvent;

namespace streamshell {

// The single main window ("main"). Closing it only ever hides it.
class MainWindow : public QMainWindow, public ShellWindow
{
    Q_OBJECT
public:
    MainWindow(const QString &version, const QUrl &dashboardUrl, QWidget *parent = nullptr);
    ~MainWindow() override;

    QString windowName() const override;
    void showWindow() override;
    void hideWindow() override;
    void focusWindow() override;
    bool isWindowVisible() const override;

    void setCloseHandler(std::function<void()> handler);

public slots:
    void setUpdateStatus(const QString &text);

signals:
    void checkForUpdatesRequested();
    void minimizeToTrayRequested();

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    void createUi(const QString &version);

    QUrl m_dashboardUrl;
    QLabel *m_updateStatusLabel = nullptr;
    std::function<void()> m_closeHandler;
};

} // namespace streamshell
