// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archivediff/DiffSortPolicy.hpp"

#include <utils/PathUtils.hpp>

namespace ArchiveDiff {

int changeSortRank(ChangeType type) noexcept
{
    switch (type) {
        case ChangeType::Added: return 1;
        case ChangeType::None:
        case ChangeType::Modified: return 2;
        case ChangeType::Removed: return 3;
    }
    return 2;
}

int compareSortKeys(const DiffSortKey& lhs, const DiffSortKey& rhs, DiffColumn column)
{
    switch (column) {
        case DiffColumn::Name:
            return Utils::PathUtils::comparePaths(lhs.name, rhs.name);
        case DiffColumn::Change:
            return (lhs.changeRank > rhs.changeRank) - (lhs.changeRank < rhs.changeRank);
        case DiffColumn::Size:
            return (lhs.size > rhs.size) - (lhs.size < rhs.size);
    }
    return 0;
}

bool diffLessThan(const DiffSortKey& lhs,
                  const DiffSortKey& rhs,
                  DiffColumn column,
                  Qt::SortOrder order,
                  bool foldersOnTop)
{
    // Flipped for descending order so the proxy's reversal keeps folders first.
    if (foldersOnTop && lhs.hasChildren != rhs.hasChildren)
        return order == Qt::AscendingOrder ? lhs.hasChildren : rhs.hasChildren;

    const int cmp = compareSortKeys(lhs, rhs, column);
    if (cmp != 0 || column == DiffColumn::Name)
        return cmp < 0;

    // Ties on change or size fall back to the name.
    return compareSortKeys(lhs, rhs, DiffColumn::Name) < 0;
}

QString columnName(DiffColumn column)
{
    switch (column) {
        case DiffColumn::Name: return QStringLiteral("name");
        case DiffColumn::Change: return QStringLiteral("change");
        case DiffColumn::Size: return QStringLiteral("size");
    }
    return {};
}

bool columnFromName(QStringView name, DiffColumn& column)
{
    for (DiffColumn c : { DiffColumn::Name, DiffColumn::Change, DiffColumn::Size }) {
        if (name.compare(columnName(c), Qt::CaseInsensitive) == 0) {
            column = c;
            return true;
        }
    }
    return false;
}

} // namespace ArchiveDiff
