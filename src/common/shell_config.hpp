#pragma once

#include <chrono>
#include <optional>

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <QUrl>

namespace streamshell {

struct ShellConfig {
    QString serviceProgram = QStringLiteral("node");
    QStringList serviceArguments = {QStringLiteral("server.js")};
    QString workingDirectory;
    std::chrono::milliseconds startupGracePeriod{2000};
    std::chrono::milliseconds terminateTimeout{3000};
    QString updateRepository = QStringLiteral("Loggableim/pupcidslittletiktokhelper");
    int updateCheckIntervalHours = 24;
    QUrl dashboardUrl = QUrl(QStringLiteral("http://localhost:3000"));
    bool verbose = false;
};

struct ShellConfigResult {
    std::optional<ShellConfig> config;
    QString error;
    bool helpRequested = false;
    bool versionRequested = false;
    QString helpText;
};

// Builds the configuration from defaults, STREAMSHELL_* environment
// variables and then command-line options (highest precedence).
// `arguments` includes the program name as its first element.
ShellConfigResult parseShellConfig(const QStringList &arguments,
                                   const QProcessEnvironment &environment);

} // namespace streamshell
