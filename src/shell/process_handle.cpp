#include "shell/process_handle.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

#include <algorithm>
#include <limits>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "shell/errors.hpp"

namespace streamshell {

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kKillWaitMs = 1000;

bool isRunnableFile(const QFileInfo &info)
{
    return info.exists() && info.isFile() && info.isExecutable();
}

} // namespace

QString resolveServiceProgram(const QString &program, const QString &workingDirectory)
{
    const QFileInfo direct(program);
    if (direct.isAbsolute()) {
        return isRunnableFile(direct) ? direct.absoluteFilePath() : QString();
    }

    // Relative paths ("./node", "bin/node") name a file under the working
    // directory and are never looked up on PATH.
    if (program.contains(QLatin1Char('/'))) {
        const QFileInfo candidate(QDir(workingDirectory).absoluteFilePath(program));
        return isRunnableFile(candidate) ? candidate.absoluteFilePath() : QString();
    }

    // Bare names come from PATH; the working directory is not searched.
    const QString onPath = QStandardPaths::findExecutable(program);
    if (!onPath.isEmpty()) {
        return onPath;
    }
    if (QCoreApplication::instance()) {
        const QFileInfo bundled(QDir(QCoreApplication::applicationDirPath()).absoluteFilePath(program));
        if (isRunnableFile(bundled)) {
            return bundled.absoluteFilePath();
        }
    }
    return QString();
}

QtProcessHandle::QtProcessHandle() = default;

QtProcessHandle::~QtProcessHandle()
{
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->kill();
        m_process->waitForFinished(kKillWaitMs);
    }
}

void QtProcessHandle::spawn(const ServiceCommand &command)
{
    if (m_process) {
        throw SpawnError("process handle was already spawned");
    }

    const QString resolved = resolveServiceProgram(command.program, command.workingDirectory);
    if (resolved.isEmpty()) {
        throw SpawnError(QStringLiteral("Service program '%1' was not found (is it installed?)")
                             .arg(command.program)
                             .toStdString());
    }

    auto process = std::make_unique<QProcess>();
    process->setProgram(resolved);
    process->setArguments(command.arguments);
    process->setWorkingDirectory(command.workingDirectory);
    process->setProcessChannelMode(QProcess::ForwardedChannels);
    process->setInputChannelMode(QProcess::ForwardedInputChannel);
    process->start();

    if (!process->waitForStarted(kStartTimeoutMs)) {
        throw SpawnError(QStringLiteral("Failed to start '%1': %2")
                             .arg(resolved, process->errorString())
                             .toStdString());
    }

    m_pid = process->processId();
    m_process = std::move(process);

    SSLOG_DEBUG(QStringLiteral("QtProcessHandle"),
                QStringLiteral("spawn"),
                QStringLiteral("process_started"),
                QStringLiteral("supervisor_start"),
                (nlohmann::json{{"program", resolved.toStdString()},
                                {"pid", m_pid}}));
}

void QtProcessHandle::terminate(std::chrono::milliseconds timeout)
{
    if (hasExited()) {
        return;
    }

    // A negative wait would block forever.
    const int waitMs = static_cast<int>(
        std::clamp<qint64>(timeout.count(), 0, std::numeric_limits<int>::max()));
    m_process->terminate();
    if (m_process->waitForFinished(waitMs)) {
        return;
    }

    SSLOG_WARN(QStringLiteral("QtProcessHandle"),
               QStringLiteral("terminate"),
               QStringLiteral("force_kill"),
               QStringLiteral("terminate_timeout"),
               (nlohmann::json{{"pid", m_pid},
                               {"timeoutMs", static_cast<qint64>(timeout.count())}}));
    m_process->kill();
    if (!m_process->waitForFinished(kKillWaitMs)) {
        throw TerminationError(QStringLiteral("Process %1 did not exit after SIGKILL: %2")
                                   .arg(m_pid)
                                   .arg(m_process->errorString())
                                   .toStdString());
    }
}

bool QtProcessHandle::hasExited() const
{
    if (!m_process) {
        return true;
    }
    if (m_process->state() == QProcess::NotRunning) {
        return true;
    }
    // Picks up an exit that the event loop has not delivered yet.
    m_process->waitForFinished(0);
    return m_process->state() == QProcess::NotRunning;
}

qint64 QtProcessHandle::pid() const
{
    return m_pid;
}

} // namespace streamshell
