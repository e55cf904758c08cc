// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archivediff/ArchiveDiffGlobal.hpp"
#include "archivediff/DiffSortPolicy.hpp"
#include "archivediff/DiffTypes.hpp"

#include <utils/PathTreeModel.hpp>

namespace ArchiveDiff {

// Path tree of diff entries. Ancestors that no record describes get
// placeholder data, and every node's size includes the sizes of its subtree.
class ARCHIVEDIFF_EXPORT DiffTreeModel final : public Utils::PathTreeModel<ArchiveDiff::DiffData>
{
    Q_OBJECT

public:
    enum Role {
        PathRole = Qt::UserRole + 1,
        ChangeTypeRole,
        FileTypeRole,
        SizeRole,
        SortKeyRole
    };

    explicit DiffTreeModel(QObject* parent = nullptr);

    void addEntries(const DiffEntryList& entries);

    DiffSortKey sortKey(const QModelIndex& index) const;

    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;

protected:
    bool flatFilter(const Node& node) const override;
    bool simplifyFilter(const Node& node) const override;
    bool mergePayload(Node& node, DiffData&& incoming) override;
    void processChild(Node& child) override;
    void processMerge(Node& node, const std::optional<DiffData>& previous) override;
    void processRemoval(Node& node) override;

private:
    void rollUp(const Node& from, qint64 delta);
    QString toolTip(const Node& node, int column) const;
};

} // namespace ArchiveDiff
