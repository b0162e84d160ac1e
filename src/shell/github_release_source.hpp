#pragma once

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QUrl>

#include "shell/update_checker.hpp"

namespace streamshell {

// Looks up the latest release of a GitHub repository over the REST API.
class GithubReleaseSource : public QObject, public UpdateSource
{
    Q_OBJECT
public:
    explicit GithubReleaseSource(QString repository, QObject *parent = nullptr);
    ~GithubReleaseSource() override;

    void fetchLatestRelease(Callback done) override;

    QUrl latestReleaseUrl() const;

    // Throws UpdateCheckError on malformed payloads.
    static ReleaseInfo parseReleasePayload(const QByteArray &payload);

    static ReleaseFetchOutcome outcomeForReply(int httpStatus,
                                               QNetworkReply::NetworkError error,
                                               const QString &errorString,
                                               const QByteArray &payload);

private:
    QString m_repository;
    QNetworkAccessManager m_network;
};

} // namespace streamshell
