// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archivediff/DiffSortProxyModel.hpp"

#include "archivediff/DiffSortPolicy.hpp"
#include "archivediff/DiffTreeModel.hpp"

namespace ArchiveDiff {

DiffSortProxyModel::DiffSortProxyModel(QObject* parent)
    : QSortFilterProxyModel(parent)
{
    setRecursiveFilteringEnabled(false);
}

void DiffSortProxyModel::setFoldersOnTop(bool enabled)
{
    if (enabled == m_foldersOnTop)
        return;
    m_foldersOnTop = enabled;

    // sort() skips an unchanged column and order, so the mapping is rebuilt.
    invalidate();
    if (sortColumn() >= 0)
        emit sorted(sortColumn(), sortOrder());
}

void DiffSortProxyModel::sort(int column, Qt::SortOrder order)
{
    QSortFilterProxyModel::sort(column, order);
    emit sorted(column, order);
}

bool DiffSortProxyModel::lessThan(const QModelIndex& left, const QModelIndex& right) const
{
    const auto* model = qobject_cast<const DiffTreeModel*>(sourceModel());
    if (!model || left.column() < 0 || left.column() >= kDiffColumnCount)
        return QSortFilterProxyModel::lessThan(left, right);

    return diffLessThan(model->sortKey(left),
                        model->sortKey(right),
                        static_cast<DiffColumn>(left.column()),
                        sortOrder(),
                        m_foldersOnTop);
}

} // namespace ArchiveDiff
