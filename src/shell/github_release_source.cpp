#include "shell/github_release_source.hpp"

#include <QNetworkRequest>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/version.hpp"
#include "shell/errors.hpp"

namespace streamshell {

namespace {

constexpr int kTransferTimeoutMs = 10000;
constexpr int kHttpNotFound = 404;

QString stringField(const nlohmann::json &obj, const char *key)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return QString();
    }
    return QString::fromStdString(it->get<std::string>());
}

} // namespace

GithubReleaseSource::GithubReleaseSource(QString repository, QObject *parent)
    : QObject(parent)
    , m_repository(std::move(repository))
{
}

GithubReleaseSource::~GithubReleaseSource() = default;

QUrl GithubReleaseSource::latestReleaseUrl() const
{
    return QUrl(QStringLiteral("https://api.github.com/repos/%1/releases/latest")
                    .arg(m_repository));
}

void GithubReleaseSource::fetchLatestRelease(Callback done)
{
    QNetworkRequest request(latestReleaseUrl());
    request.setHeader(QNetworkRequest::UserAgentHeader,
                      QStringLiteral("streamshell/%1").arg(appVersion()));
    request.setRawHeader("Accept", "application/vnd.github.v3+json");
    request.setTransferTimeout(kTransferTimeoutMs);

    SSLOG_DEBUG(QStringLiteral("GithubReleaseSource"),
                QStringLiteral("fetchLatestRelease"),
                QStringLiteral("release_query"),
                QStringLiteral("update_check"),
                (nlohmann::json{{"url", latestReleaseUrl().toString().toStdString()}}));

    QNetworkReply *reply = m_network.get(request);
    connect(reply, &QNetworkReply::finished, this, [reply, done = std::move(done)]() {
        const int status =
            reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const ReleaseFetchOutcome outcome =
            outcomeForReply(status, reply->error(), reply->errorString(), reply->readAll());
        reply->deleteLater();
        done(outcome);
    });
}

ReleaseInfo GithubReleaseSource::parseReleasePayload(const QByteArray &payload)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(payload.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        throw UpdateCheckError("Malformed release response");
    }

    if (!root.is_object()) {
        throw UpdateCheckError("Malformed release response");
    }

    QString tag = stringField(root, "tag_name").trimmed();
    if (tag.startsWith(QLatin1Char('v'))) {
        tag.remove(0, 1);
    }
    if (tag.isEmpty()) {
        throw UpdateCheckError("Release response has no tag_name");
    }

    ReleaseInfo info;
    info.version = tag;
    info.name = stringField(root, "name");
    info.url = stringField(root, "html_url");
    info.publishedAt = stringField(root, "published_at");
    return info;
}

ReleaseFetchOutcome GithubReleaseSource::outcomeForReply(int httpStatus,
                                                         QNetworkReply::NetworkError error,
                                                         const QString &errorString,
                                                         const QByteArray &payload)
{
    ReleaseFetchOutcome outcome;
    if (httpStatus == kHttpNotFound) {
        outcome.error = QStringLiteral("No releases available yet");
        return outcome;
    }
    if (error != QNetworkReply::NoError) {
        outcome.error = QStringLiteral("Update check failed: %1").arg(errorString);
        return outcome;
    }

    try {
        outcome.release = parseReleasePayload(payload);
    } catch (const UpdateCheckError &ex) {
        outcome.error = QString::fromUtf8(ex.what());
    }
    return outcome;
}

} // namespace streamshell
