#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <QObject>
#include <QString>
#include <QTimer>

namespace streamshell {

struct ReleaseInfo {
    QString version;
    QString name;
    QString url;
    QString publishedAt;
};

// Either a release or a failure reason.
struct ReleaseFetchOutcome {
    std::optional<ReleaseInfo> release;
    QString error;
};

// External capability: asynchronously look up the latest published release.
// The callback must be invoked on the caller's thread (the event loop).
class UpdateSource
{
public:
    using Callback = std::function<void(const ReleaseFetchOutcome &)>;

    virtual ~UpdateSource() = default;
    virtual void fetchLatestRelease(Callback done) = 0;
};

struct UpdateCheckResult {
    enum class Status {
        UpdateAvailable,
        UpToDate,
        Failed
    };

    Status status = Status::Failed;
    QString currentVersion;
    QString latestVersion;
    QString releaseUrl;
    QString failureReason;

    bool succeeded() const { return status != Status::Failed; }
};

/**
 * UpdateChecker compares the latest published release against the running
 * build. Checks never block the event loop; requests made while a check is
 * in flight share its result. After shutdown() every pending or late result
 * is dropped.
 */
class UpdateChecker : public QObject
{
    Q_OBJECT
public:
    using ResultCallback = std::function<void(const UpdateCheckResult &)>;

    UpdateChecker(std::unique_ptr<UpdateSource> source,
                  QString currentVersion,
                  QObject *parent = nullptr);
    ~UpdateChecker() override;

    void checkForUpdates(ResultCallback done = ResultCallback());

    // Runs a check now and then every `intervalHours`. 0 disables.
    void startAutoCheck(int intervalHours);
    void shutdown();

    bool isCheckInFlight() const { return m_inFlight; }
    bool isShutDown() const { return m_shutDown; }
    const QString &currentVersion() const { return m_currentVersion; }

signals:
    void updateAvailable(const QString &latestVersion, const QString &releaseUrl);
    void upToDate(const QString &currentVersion);
    void checkFailed(const QString &reason);

private:
    void onFetched(const ReleaseFetchOutcome &outcome);
    UpdateCheckResult evaluate(const ReleaseFetchOutcome &outcome) const;

    std::unique_ptr<UpdateSource> m_source;
    QString m_currentVersion;
    QTimer m_autoCheckTimer;
    bool m_inFlight = false;
    bool m_shutDown = false;
    std::vector<ResultCallback> m_waiters;
};

} // namespace streamshell
