#include "shell/main_window.hpp"

#include <QCloseEvent>
#include <QDesktopServices>
#include <QHBoxLayout>
#include <QPushButton>
#include <QVBoxLayout>

namespace streamshell {

MainWindow::MainWindow(const QString &version, const QUrl &dashboardUrl, QWidget *parent)
    : QMainWindow(parent)
    , m_dashboardUrl(dashboardUrl)
{
    setObjectName(kMainWindowName);
    createUi(version);
}

MainWindow::~MainWindow() = default;

void MainWindow::createUi(const QString &version)
{
    auto *centralWidget = new QWidget(this);
    auto *layout = new QVBoxLayout(centralWidget);

    auto *titleLabel = new QLabel(QStringLiteral("<b>Stream Helper</b>"), centralWidget);
    auto *versionLabel = new QLabel(QStringLiteral("Version %1").arg(version), centralWidget);
    auto *dashboardLabel = new QLabel(
        QStringLiteral("Dashboard: %1").arg(m_dashboardUrl.toString()), centralWidget);
    m_updateStatusLabel = new QLabel(centralWidget);
    m_updateStatusLabel->setObjectName(QStringLiteral("updateStatus"));

    auto *openButton = new QPushButton(QStringLiteral("Open Dashboard"), centralWidget);
    auto *updateButton = new QPushButton(QStringLiteral("Check for Updates"), centralWidget);
    auto *minimizeButton = new QPushButton(QStringLiteral("Minimize to Tray"), centralWidget);

    connect(openButton, &QPushButton::clicked, this, [this]() {
        QDesktopServices::openUrl(m_dashboardUrl);
    });
    connect(updateButton, &QPushButton::clicked,
            this, &MainWindow::checkForUpdatesRequested);
    connect(minimizeButton, &QPushButton::clicked,
            this, &MainWindow::minimizeToTrayRequested);

    auto *buttons = new QHBoxLayout();
    buttons->addWidget(openButton);
    buttons->addWidget(updateButton);
    buttons->addWidget(minimizeButton);

    layout->addWidget(titleLabel);
    layout->addWidget(versionLabel);
    layout->addWidget(dashboardLabel);
    layout->addWidget(m_updateStatusLabel);
    layout->addLayout(buttons);

    setCentralWidget(centralWidget);
    setWindowTitle(QStringLiteral("Stream Helper"));
    resize(420, 180);
}

QString MainWindow::windowName() const
{
    return objectName();
}

void MainWindow::showWindow()
{
    showNormal();
}

void MainWindow::hideWindow()
{
    hide();
}

void MainWindow::focusWindow()
{
    raise();
    activateWindow();
}

bool MainWindow::isWindowVisible() const
{
    return isVisible();
}

void MainWindow::setCloseHandler(std::function<void()> handler)
{
    m_closeHandler = std::move(handler);
}

void MainWindow::setUpdateStatus(const QString &text)
{
    m_updateStatusLabel->setText(text);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    event->ignore();
    if (m_closeHandler) {
        m_closeHandler();
    } else {
        hide();
    }
}

} // namespace streamshell
