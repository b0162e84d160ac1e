#include "common/version.hpp"

#include <QStringList>

#include <algorithm>

#ifndef STREAMSHELL_VERSION
#define STREAMSHELL_VERSION "0.0.0"
#endif

namespace streamshell {

namespace {

int leadingNumber(const QString &part)
{
    int digits = 0;
    while (digits < part.size() && part.at(digits).isDigit()) {
        ++digits;
    }
    if (digits == 0) {
        return 0;
    }
    return part.left(digits).toInt();
}

QStringList versionParts(QString version)
{
    version = version.trimmed();
    if (version.startsWith(QLatin1Char('v')) || version.startsWith(QLatin1Char('V'))) {
        version.remove(0, 1);
    }
    return version.split(QLatin1Char('.'));
}

} // namespace

QString appVersion()
{
    return QStringLiteral(STREAMSHELL_VERSION);
}

int compareVersions(const QString &a, const QString &b)
{
    const QStringList partsA = versionParts(a);
    const QStringList partsB = versionParts(b);
    const auto count = std::max(partsA.size(), partsB.size());

    for (qsizetype i = 0; i < count; ++i) {
        const int lhs = i < partsA.size() ? leadingNumber(partsA.at(i)) : 0;
        const int rhs = i < partsB.size() ? leadingNumber(partsB.at(i)) : 0;
        if (lhs > rhs) {
            return 1;
        }
        if (lhs < rhs) {
            return -1;
        }
    }
    return 0;
}

} // namespace streamshell
