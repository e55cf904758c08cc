// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archivediff/ArchiveDiffGlobal.hpp"
#include "archivediff/DiffTypes.hpp"

#include <QtCore/QString>
#include <QtCore/Qt>

namespace ArchiveDiff {

enum class DiffColumn : int {
    Name = 0,
    Change = 1,
    Size = 2
};

inline constexpr int kDiffColumnCount = 3;

// Everything the policy needs to order two sibling rows.
struct DiffSortKey final {
    QString name;
    int changeRank = 0;
    qint64 size = 0;
    bool hasChildren = false;
};

// Explicit rank table: Added=1, Modified=2, Removed=3. Unchanged placeholders
// rank with Modified.
ARCHIVEDIFF_EXPORT int changeSortRank(ChangeType type) noexcept;

// Three-way comparison of the key for one column; names compare path-wise.
ARCHIVEDIFF_EXPORT int compareSortKeys(const DiffSortKey& lhs, const DiffSortKey& rhs, DiffColumn column);

// Less-than in the sense of QSortFilterProxyModel::lessThan(): the proxy
// reverses it for descending order. With `foldersOnTop`, rows with children
// end up first in both orders.
ARCHIVEDIFF_EXPORT bool diffLessThan(const DiffSortKey& lhs,
                                     const DiffSortKey& rhs,
                                     DiffColumn column,
                                     Qt::SortOrder order,
                                     bool foldersOnTop);

ARCHIVEDIFF_EXPORT QString columnName(DiffColumn column);
ARCHIVEDIFF_EXPORT bool columnFromName(QStringView name, DiffColumn& column);

} // namespace ArchiveDiff
