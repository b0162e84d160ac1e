#pragma once

#include <QObject>
#include <QSocketNotifier>

#include <memory>

namespace streamshell {

/**
 * UnixSignalWatcher turns SIGINT, SIGTERM and SIGHUP into a Qt signal
 * delivered on the event loop. The handler only writes the signal number
 * to a socketpair; everything else happens in the notifier slot.
 * Only one watcher may be installed per process.
 */
class UnixSignalWatcher : public QObject
{
    Q_OBJECT
public:
    explicit UnixSignalWatcher(QObject *parent = nullptr);
    ~UnixSignalWatcher() override;

    bool isInstalled() const { return m_notifier != nullptr; }

signals:
    void exitSignalReceived(int signalNumber);

private slots:
    void onReadable();

private:
    static void handleSignal(int signalNumber);
    static int s_fds[2];

    std::unique_ptr<QSocketNotifier> m_notifier;
};

} // namespace streamshell
