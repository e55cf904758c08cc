#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QStringView>

namespace Utils::PathUtils {

// Diff paths are POSIX style and relative to the archive root. These helpers
// never touch the file system and never rewrite separators.
UTILS_EXPORT QStringList splitSegments(QStringView path);
UTILS_EXPORT QString joinPath(QStringView base, QStringView child);

// Path of `path` below `base`, or `path` itself when `base` is empty or not a
// prefix.
UTILS_EXPORT QString relativePath(QStringView path, QStringView base);
UTILS_EXPORT bool isAncestorPath(QStringView ancestor, QStringView path);

// Segment-wise ordering: `a/b` sorts before `a.b`.
UTILS_EXPORT int comparePaths(QStringView lhs, QStringView rhs);

} // namespace Utils::PathUtils
