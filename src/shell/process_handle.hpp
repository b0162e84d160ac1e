#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include <QString>
#include <QStringList>

class QProcess;

namespace streamshell {

struct ServiceCommand {
    QString program;
    QStringList arguments;
    QString workingDirectory;
};

/**
 * ProcessHandle owns a single OS child process.
 *
 * A handle is spawned at most once. terminate() is best-effort and
 * throws TerminationError if the process survives; spawn() throws
 * SpawnError if the program cannot be launched.
 */
class ProcessHandle
{
public:
    virtual ~ProcessHandle() = default;

    virtual void spawn(const ServiceCommand &command) = 0;
    virtual void terminate(std::chrono::milliseconds timeout) = 0;

    // True once the child has exited and been reaped (or was never started).
    virtual bool hasExited() const = 0;
    virtual qint64 pid() const = 0;
};

using ProcessHandleFactory = std::function<std::unique_ptr<ProcessHandle>()>;

// Resolves the service program. A bare name is looked up on PATH, then
// beside the application binary; a relative path is taken from the working
// directory. Returns an empty string if not found.
QString resolveServiceProgram(const QString &program, const QString &workingDirectory);

// ProcessHandle backed by QProcess. The child inherits stdio and environment.
class QtProcessHandle : public ProcessHandle
{
public:
    QtProcessHandle();
    ~QtProcessHandle() override;

    void spawn(const ServiceCommand &command) override;
    void terminate(std::chrono::milliseconds timeout) override;
    bool hasExited() const override;
    qint64 pid() const override;

private:
    std::unique_ptr<QProcess> m_process;
    qint64 m_pid = 0;
};

} // namespace streamshell
