#include "common/shell_config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>

#include <limits>

namespace streamshell {

namespace {

std::optional<qint64> parseNonNegative(const QString &text)
{
    bool ok = false;
    const qint64 value = text.trimmed().toLongLong(&ok);
    if (!ok || value < 0) {
        return std::nullopt;
    }
    return value;
}

constexpr qint64 kMaxMilliseconds = std::numeric_limits<int>::max();
constexpr qint64 kMaxIntervalHours = std::numeric_limits<int>::max() / (60 * 60 * 1000);

// Applies one numeric setting; returns false and fills `error` when the
// text is not an integer in [0, max].
template <typename Apply>
bool applyNumber(const QString &name, const QString &text, qint64 max, QString &error, Apply apply)
{
    const auto value = parseNonNegative(text);
    if (!value) {
        error = QStringLiteral("Invalid value for %1: '%2' (expected a non-negative integer)")
                    .arg(name, text);
        return false;
    }
    if (*value > max) {
        error = QStringLiteral("Invalid value for %1: '%2' (must not exceed %3)")
                    .arg(name, text)
                    .arg(max);
        return false;
    }
    apply(*value);
    return true;
}

} // namespace

ShellConfigResult parseShellConfig(const QStringList &arguments,
                                   const QProcessEnvironment &environment)
{
    ShellConfigResult result;
    ShellConfig config;
    config.workingDirectory = QDir::currentPath();

    // Environment layer.
    if (environment.contains(QStringLiteral("STREAMSHELL_SERVICE_PROGRAM"))) {
        config.serviceProgram = environment.value(QStringLiteral("STREAMSHELL_SERVICE_PROGRAM"));
    }
    if (environment.contains(QStringLiteral("STREAMSHELL_SERVICE_ARGS"))) {
        config.serviceArguments = environment.value(QStringLiteral("STREAMSHELL_SERVICE_ARGS"))
                                      .split(QLatin1Char(' '), Qt::SkipEmptyParts);
    }
    if (environment.contains(QStringLiteral("STREAMSHELL_WORKDIR"))) {
        config.workingDirectory = environment.value(QStringLiteral("STREAMSHELL_WORKDIR"));
    }
    if (environment.contains(QStringLiteral("STREAMSHELL_UPDATE_REPO"))) {
        config.updateRepository = environment.value(QStringLiteral("STREAMSHELL_UPDATE_REPO"));
    }
    if (environment.contains(QStringLiteral("STREAMSHELL_DASHBOARD_URL"))) {
        config.dashboardUrl = QUrl(environment.value(QStringLiteral("STREAMSHELL_DASHBOARD_URL")));
    }
    if (environment.value(QStringLiteral("STREAMSHELL_VERBOSE")) == QStringLiteral("1")) {
        config.verbose = true;
    }

    QString graceText = environment.value(QStringLiteral("STREAMSHELL_GRACE_MS"));
    QString terminateText = environment.value(QStringLiteral("STREAMSHELL_TERMINATE_TIMEOUT_MS"));
    QString intervalText = environment.value(QStringLiteral("STREAMSHELL_UPDATE_INTERVAL_HOURS"));

    // Command-line layer.
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Tray shell that keeps the stream helper service running."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    QCommandLineOption programOption(QStringList() << "service-program",
                                     "Program used to launch the background service.",
                                     "program");
    QCommandLineOption argOption(QStringList() << "service-arg",
                                 "Argument passed to the service program (repeatable).",
                                 "arg");
    QCommandLineOption workdirOption(QStringList() << "workdir",
                                     "Working directory of the background service.",
                                     "path");
    QCommandLineOption graceOption(QStringList() << "grace-ms",
                                   "Startup grace period after spawning the service.",
                                   "ms");
    QCommandLineOption terminateOption(QStringList() << "terminate-timeout-ms",
                                       "How long to wait for the service to exit before killing it.",
                                       "ms");
    QCommandLineOption repoOption(QStringList() << "update-repo",
                                  "GitHub repository (owner/name) queried for releases.",
                                  "repo");
    QCommandLineOption intervalOption(QStringList() << "update-interval-hours",
                                      "Hours between automatic update checks (0 disables).",
                                      "hours");
    QCommandLineOption dashboardOption(QStringList() << "dashboard-url",
                                       "URL of the service dashboard.",
                                       "url");
    QCommandLineOption verboseOption(QStringList() << "verbose",
                                     "Write debug events to the log.");
    parser.addOption(programOption);
    parser.addOption(argOption);
    parser.addOption(workdirOption);
    parser.addOption(graceOption);
    parser.addOption(terminateOption);
    parser.addOption(repoOption);
    parser.addOption(intervalOption);
    parser.addOption(dashboardOption);
    parser.addOption(verboseOption);

    if (!parser.parse(arguments)) {
        result.error = parser.errorText();
        return result;
    }
    if (parser.isSet(helpOption)) {
        result.helpRequested = true;
        result.helpText = parser.helpText();
        return result;
    }
    if (parser.isSet(versionOption)) {
        result.versionRequested = true;
        return result;
    }

    if (parser.isSet(programOption)) {
        config.serviceProgram = parser.value(programOption);
    }
    if (parser.isSet(argOption)) {
        config.serviceArguments = parser.values(argOption);
    }
    if (parser.isSet(workdirOption)) {
        config.workingDirectory = parser.value(workdirOption);
    }
    if (parser.isSet(repoOption)) {
        config.updateRepository = parser.value(repoOption);
    }
    if (parser.isSet(dashboardOption)) {
        config.dashboardUrl = QUrl(parser.value(dashboardOption));
    }
    if (parser.isSet(verboseOption)) {
        config.verbose = true;
    }
    if (parser.isSet(graceOption)) {
        graceText = parser.value(graceOption);
    }
    if (parser.isSet(terminateOption)) {
        terminateText = parser.value(terminateOption);
    }
    if (parser.isSet(intervalOption)) {
        intervalText = parser.value(intervalOption);
    }

    if (!graceText.isEmpty()
        && !applyNumber(QStringLiteral("grace period"), graceText, kMaxMilliseconds, result.error,
                        [&config](qint64 v) { config.startupGracePeriod = std::chrono::milliseconds(v); })) {
        return result;
    }
    if (!terminateText.isEmpty()
        && !applyNumber(QStringLiteral("terminate timeout"), terminateText, kMaxMilliseconds,
                        result.error,
                        [&config](qint64 v) { config.terminateTimeout = std::chrono::milliseconds(v); })) {
        return result;
    }
    if (!intervalText.isEmpty()
        && !applyNumber(QStringLiteral("update interval"), intervalText, kMaxIntervalHours,
                        result.error,
                        [&config](qint64 v) { config.updateCheckIntervalHours = static_cast<int>(v); })) {
        return result;
    }

    if (config.serviceProgram.trimmed().isEmpty()) {
        result.error = QStringLiteral("Service program must not be empty");
        return result;
    }

    const QFileInfo workdir(config.workingDirectory);
    if (!workdir.exists() || !workdir.isDir()) {
        result.error = QStringLiteral("Working directory does not exist: %1")
                           .arg(config.workingDirectory);
        return result;
    }
    config.workingDirectory = workdir.absoluteFilePath();

    if (!config.dashboardUrl.isValid()) {
        result.error = QStringLiteral("Invalid dashboard URL");
        return result;
    }

    result.config = config;
    return result;
}

} // namespace streamshell
