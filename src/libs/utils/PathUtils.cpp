// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathUtils.hpp"

#include <algorithm>

namespace Utils::PathUtils {

QStringList splitSegments(QStringView path)
{
    QStringList out;
    for (QStringView part : path.split(u'/', Qt::SkipEmptyParts)) {
        if (part == u".")
            continue;
        out.push_back(part.toString());
    }
    return out;
}

QString joinPath(QStringView base, QStringView child)
{
    if (base.isEmpty())
        return child.toString();
    if (child.isEmpty())
        return base.toString();

    QString joined;
    joined.reserve(base.size() + child.size() + 1);
    joined.append(base);
    joined.append(QLatin1Char('/'));
    joined.append(child);
    return joined;
}

bool isAncestorPath(QStringView ancestor, QStringView path)
{
    if (ancestor.isEmpty())
        return !path.isEmpty();
    if (path.size() <= ancestor.size() + 1)
        return false;
    return path.startsWith(ancestor) && path.at(ancestor.size()) == u'/';
}

QString relativePath(QStringView path, QStringView base)
{
    if (!isAncestorPath(base, path) || base.isEmpty())
        return path.toString();
    return path.mid(base.size() + 1).toString();
}

int comparePaths(QStringView lhs, QStringView rhs)
{
    const auto left = lhs.split(u'/', Qt::SkipEmptyParts);
    const auto right = rhs.split(u'/', Qt::SkipEmptyParts);

    const qsizetype n = std::min(left.size(), right.size());
    for (qsizetype i = 0; i < n; ++i) {
        const int c = left[i].compare(right[i], Qt::CaseSensitive);
        if (c != 0)
            return c < 0 ? -1 : 1;
    }
    if (left.size() == right.size())
        return 0;
    return left.size() < right.size() ? -1 : 1;
}

} // namespace Utils::PathUtils
