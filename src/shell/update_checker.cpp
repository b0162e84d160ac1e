#include "shell/update_checker.hpp"

#include <QPointer>

#include <algorithm>
#include <limits>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/version.hpp"

namespace streamshell {

namespace {

constexpr int kMillisecondsPerHour = 60 * 60 * 1000;

} // namespace

UpdateChecker::UpdateChecker(std::unique_ptr<UpdateSource> source,
                             QString currentVersion,
                             QObject *parent)
    : QObject(parent)
    , m_source(std::move(source))
    , m_currentVersion(std::move(currentVersion))
{
    connect(&m_autoCheckTimer, &QTimer::timeout, this, [this]() {
        checkForUpdates();
    });
}

UpdateChecker::~UpdateChecker() = default;

void UpdateChecker::checkForUpdates(ResultCallback done)
{
    if (m_shutDown) {
        SSLOG_DEBUG(QStringLiteral("UpdateChecker"),
                    QStringLiteral("checkForUpdates"),
                    QStringLiteral("update_check_skipped"),
                    QStringLiteral("shutting_down"),
                    nlohmann::json::object());
        return;
    }

    if (done) {
        m_waiters.push_back(std::move(done));
    }

    if (m_inFlight) {
        SSLOG_DEBUG(QStringLiteral("UpdateChecker"),
                    QStringLiteral("checkForUpdates"),
                    QStringLiteral("update_check_joined"),
                    QStringLiteral("check_in_flight"),
                    nlohmann::json::object());
        return;
    }

    SSLOG_INFO(QStringLiteral("UpdateChecker"),
               QStringLiteral("checkForUpdates"),
               QStringLiteral("update_check_started"),
               QStringLiteral("user_or_timer"),
               (nlohmann::json{{"currentVersion", m_currentVersion.toStdString()}}));

    m_inFlight = true;
    QPointer<UpdateChecker> guard(this);
    m_source->fetchLatestRelease([guard](const ReleaseFetchOutcome &outcome) {
        if (guard) {
            guard->onFetched(outcome);
        }
    });
}

void UpdateChecker::startAutoCheck(int intervalHours)
{
    if (intervalHours <= 0 || m_shutDown) {
        return;
    }

    const qint64 intervalMs = std::min<qint64>(
        static_cast<qint64>(intervalHours) * kMillisecondsPerHour,
        std::numeric_limits<int>::max());
    m_autoCheckTimer.setInterval(static_cast<int>(intervalMs));
    m_autoCheckTimer.start();
    SSLOG_INFO(QStringLiteral("UpdateChecker"),
               QStringLiteral("startAutoCheck"),
               QStringLiteral("auto_check_started"),
               QStringLiteral("app_startup"),
               (nlohmann::json{{"intervalHours", intervalHours}}));
    checkForUpdates();
}

void UpdateChecker::shutdown()
{
    if (m_shutDown) {
        return;
    }
    m_shutDown = true;
    m_autoCheckTimer.stop();
    m_waiters.clear();
    SSLOG_DEBUG(QStringLiteral("UpdateChecker"),
                QStringLiteral("shutdown"),
                QStringLiteral("update_checker_closed"),
                QStringLiteral("app_shutdown"),
                (nlohmann::json{{"checkInFlight", m_inFlight}}));
}

void UpdateChecker::onFetched(const ReleaseFetchOutcome &outcome)
{
    m_inFlight = false;

    if (m_shutDown) {
        SSLOG_DEBUG(QStringLiteral("UpdateChecker"),
                    QStringLiteral("onFetched"),
                    QStringLiteral("late_result_discarded"),
                    QStringLiteral("shutting_down"),
                    nlohmann::json::object());
        return;
    }

    const UpdateCheckResult result = evaluate(outcome);
    switch (result.status) {
    case UpdateCheckResult::Status::UpdateAvailable:
        SSLOG_INFO(QStringLiteral("UpdateChecker"),
                   QStringLiteral("onFetched"),
                   QStringLiteral("update_available"),
                   QStringLiteral("newer_release"),
                   (nlohmann::json{{"current", result.currentVersion.toStdString()},
                                   {"latest", result.latestVersion.toStdString()}}));
        emit updateAvailable(result.latestVersion, result.releaseUrl);
        break;
    case UpdateCheckResult::Status::UpToDate:
        SSLOG_INFO(QStringLiteral("UpdateChecker"),
                   QStringLiteral("onFetched"),
                   QStringLiteral("up_to_date"),
                   QStringLiteral("no_newer_release"),
                   (nlohmann::json{{"current", result.currentVersion.toStdString()},
                                   {"latest", result.latestVersion.toStdString()}}));
        emit upToDate(result.currentVersion);
        break;
    case UpdateCheckResult::Status::Failed:
        SSLOG_WARN(QStringLiteral("UpdateChecker"),
                   QStringLiteral("onFetched"),
                   QStringLiteral("update_check_failed"),
                   QStringLiteral("source_error"),
                   (nlohmann::json{{"reason", result.failureReason.toStdString()}}));
        emit checkFailed(result.failureReason);
        break;
    }

    std::vector<ResultCallback> waiters;
    waiters.swap(m_waiters);
    for (const ResultCallback &waiter : waiters) {
        waiter(result);
    }
}

UpdateCheckResult UpdateChecker::evaluate(const ReleaseFetchOutcome &outcome) const
{
    UpdateCheckResult result;
    result.currentVersion = m_currentVersion;

    if (!outcome.release) {
        result.status = UpdateCheckResult::Status::Failed;
        result.failureReason = outcome.error.isEmpty()
            ? QStringLiteral("Update check failed")
            : outcome.error;
        return result;
    }

    result.latestVersion = outcome.release->version;
    result.releaseUrl = outcome.release->url;
    result.status = compareVersions(result.latestVersion, m_currentVersion) > 0
        ? UpdateCheckResult::Status::UpdateAvailable
        : UpdateCheckResult::Status::UpToDate;
    return result;
}

} // namespace streamshell
