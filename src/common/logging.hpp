#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace streamshell::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool verbose);

bool isVerbose();

// Directory holding the per-process log files.
QString logsDirPath();

// Structured log event, one JSON object per line.
// `what` names the event, `why` names what triggered it.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace streamshell::logging

#define SSLOG_DEBUG(component, where, what, why, ctxJson) \
    ::streamshell::logging::logEvent(::streamshell::logging::LogLevel::Debug, \
                                     (component), (where), (what), (why), (ctxJson))

#define SSLOG_INFO(component, where, what, why, ctxJson) \
    ::streamshell::logging::logEvent(::streamshell::logging::LogLevel::Info, \
                                     (component), (where), (what), (why), (ctxJson))

#define SSLOG_WARN(component, where, what, why, ctxJson) \
    ::streamshell::logging::logEvent(::streamshell::logging::LogLevel::Warn, \
                                     (component), (where), (what), (why), (ctxJson))

#define SSLOG_ERROR(component, where, what, why, ctxJson) \
    ::streamshell::logging::logEvent(::streamshell::logging::LogLevel::Error, \
                                     (component), (where), (what), (why), (ctxJson))
