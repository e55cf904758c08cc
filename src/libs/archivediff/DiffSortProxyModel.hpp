// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archivediff/ArchiveDiffGlobal.hpp"

#include <QtCore/QSortFilterProxyModel>

namespace ArchiveDiff {

class ARCHIVEDIFF_EXPORT DiffSortProxyModel final : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit DiffSortProxyModel(QObject* parent = nullptr);

    bool foldersOnTop() const noexcept { return m_foldersOnTop; }
    void setFoldersOnTop(bool enabled);

    void sort(int column, Qt::SortOrder order = Qt::AscendingOrder) override;

signals:
    void sorted(int column, Qt::SortOrder order);

protected:
    bool lessThan(const QModelIndex& left, const QModelIndex& right) const override;

private:
    bool m_foldersOnTop = false;
};

} // namespace ArchiveDiff
