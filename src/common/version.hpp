#pragma once

#include <QString>

namespace streamshell {

// Semantic version of this build, injected by the build system.
QString appVersion();

// Returns 1 if a > b, -1 if a < b, 0 if equal.
// Missing parts count as 0; a leading 'v' and non-numeric part suffixes are ignored.
int compareVersions(const QString &a, const QString &b);

} // namespace streamshell
