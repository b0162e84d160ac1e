#include "shell/unix_signal_watcher.hpp"

#include <csignal>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace streamshell {

int UnixSignalWatcher::s_fds[2] = {-1, -1};

namespace {

const int kWatchedSignals[] = {SIGINT, SIGTERM, SIGHUP};

} // namespace

UnixSignalWatcher::UnixSignalWatcher(QObject *parent)
    : QObject(parent)
{
    if (s_fds[0] != -1) {
        SSLOG_WARN(QStringLiteral("UnixSignalWatcher"),
                   QStringLiteral("UnixSignalWatcher"),
                   QStringLiteral("signal_watcher_duplicate"),
                   QStringLiteral("already_installed"),
                   nlohmann::json::object());
        return;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_fds) != 0) {
        SSLOG_ERROR(QStringLiteral("UnixSignalWatcher"),
                    QStringLiteral("UnixSignalWatcher"),
                    QStringLiteral("socketpair_failed"),
                    QStringLiteral("signal_setup"),
                    (nlohmann::json{{"error", std::strerror(errno)}}));
        s_fds[0] = s_fds[1] = -1;
        return;
    }

    // The handler must never block on a full buffer.
    const int flags = ::fcntl(s_fds[0], F_GETFL);
    if (flags != -1) {
        ::fcntl(s_fds[0], F_SETFL, flags | O_NONBLOCK);
    }

    m_notifier = std::make_unique<QSocketNotifier>(s_fds[1], QSocketNotifier::Read);
    connect(m_notifier.get(), &QSocketNotifier::activated,
            this, &UnixSignalWatcher::onReadable);

    struct sigaction action {};
    action.sa_handler = &UnixSignalWatcher::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    for (const int signalNumber : kWatchedSignals) {
        if (::sigaction(signalNumber, &action, nullptr) != 0) {
            SSLOG_WARN(QStringLiteral("UnixSignalWatcher"),
                       QStringLiteral("UnixSignalWatcher"),
                       QStringLiteral("sigaction_failed"),
                       QStringLiteral("signal_setup"),
                       (nlohmann::json{{"signal", signalNumber},
                                       {"error", std::strerror(errno)}}));
        }
    }
}

UnixSignalWatcher::~UnixSignalWatcher()
{
    if (!m_notifier) {
        return;
    }

    for (const int signalNumber : kWatchedSignals) {
        ::signal(signalNumber, SIG_DFL);
    }
    m_notifier.reset();
    ::close(s_fds[0]);
    ::close(s_fds[1]);
    s_fds[0] = s_fds[1] = -1;
}

void UnixSignalWatcher::handleSignal(int signalNumber)
{
    const char byte = static_cast<char>(signalNumber);
    // write() is async-signal-safe; a dropped byte only loses a duplicate.
    const ssize_t written = ::write(s_fds[0], &byte, sizeof(byte));
    (void)written;
}

void UnixSignalWatcher::onReadable()
{
    m_notifier->setEnabled(false);
    char byte = 0;
    const ssize_t count = ::read(s_fds[1], &byte, sizeof(byte));
    m_notifier->setEnabled(true);
    if (count != 1) {
        return;
    }

    const int signalNumber = static_cast<int>(byte);
    SSLOG_INFO(QStringLiteral("UnixSignalWatcher"),
               QStringLiteral("onReadable"),
               QStringLiteral("exit_signal"),
               QStringLiteral("os_signal"),
               (nlohmann::json{{"signal", signalNumber}}));
    emit exitSignalReceived(signalNumber);
}

} // namespace streamshell
