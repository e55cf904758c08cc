// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archivediff/DiffTreeModel.hpp"

namespace ArchiveDiff {

DiffTreeModel::DiffTreeModel(QObject* parent)
    : Utils::PathTreeModel<DiffData>(parent)
{
    connect(this, &Utils::PathTreeModelBase::displayModeChanged, this, [](DisplayMode mode) {
        qCDebug(archivediffmodellog) << "display mode changed to" << mode;
    });
}

void DiffTreeModel::addEntries(const DiffEntryList& entries)
{
    for (const DiffEntry& entry : entries)
        addItem(entry.path, entry.data);
    qCDebug(archivediffmodellog) << "added" << entries.size() << "entries," << tree().size() - 1 << "nodes";
}

DiffSortKey DiffTreeModel::sortKey(const QModelIndex& index) const
{
    DiffSortKey key;
    const Node* n = nodeForIndex(index);
    if (!n)
        return key;

    key.name = displayName(*n);
    if (n->payload) {
        key.changeRank = changeSortRank(n->payload->changeType);
        key.size = n->payload->size;
    } else {
        key.changeRank = changeSortRank(ChangeType::None);
    }
    key.hasChildren = !n->children.isEmpty();
    return key;
}

int DiffTreeModel::columnCount(const QModelIndex& parent) const
{
    Q_UNUSED(parent);
    return kDiffColumnCount;
}

QVariant DiffTreeModel::data(const QModelIndex& index, int role) const
{
    const Node* n = nodeForIndex(index);
    if (!n)
        return {};

    const DiffData d = n->payload.value_or(DiffData::placeholder());
    const auto column = static_cast<DiffColumn>(index.column());

    switch (role) {
    case Qt::DisplayRole:
        switch (column) {
        case DiffColumn::Name: return displayName(*n);
        case DiffColumn::Change: return changeTypeShort(d.changeType);
        case DiffColumn::Size: return formatSize(d.size);
        }
        return {};
    case Qt::ToolTipRole:
        return toolTip(*n, index.column());
    case PathRole:
        return n->path;
    case ChangeTypeRole:
        return QVariant::fromValue(d.changeType);
    case FileTypeRole:
        return QVariant::fromValue(d.fileType);
    case SizeRole:
        return d.size;
    case SortKeyRole: {
        const DiffSortKey key = sortKey(index);
        switch (column) {
        case DiffColumn::Name: return key.name;
        case DiffColumn::Change: return key.changeRank;
        case DiffColumn::Size: return key.size;
        }
        return {};
    }
    default:
        break;
    }
    return {};
}

QVariant DiffTreeModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (orientation != Qt::Horizontal || role != Qt::DisplayRole)
        return {};

    switch (section) {
    case 0: return tr("Name");
    case 1: return tr("Change");
    case 2: return tr("Size");
    default: break;
    }
    return {};
}

Qt::ItemFlags DiffTreeModel::flags(const QModelIndex& index) const
{
    if (!index.isValid())
        return Qt::NoItemFlags;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

bool DiffTreeModel::flatFilter(const Node& node) const
{
    return node.payload && node.payload->changeType != ChangeType::None;
}

bool DiffTreeModel::simplifyFilter(const Node& node) const
{
    return !node.payload || node.payload->changeType == ChangeType::None;
}

bool DiffTreeModel::mergePayload(Node& node, DiffData&& incoming)
{
    if (!node.payload || node.payload->isPlaceholder()) {
        // The record replaces the placeholder; sizes already rolled up from
        // the subtree stay.
        const qint64 aggregated = node.payload ? node.payload->size : 0;
        incoming.size += aggregated;
        node.payload = std::move(incoming);
        return true;
    }

    qCDebug(archivediffmodellog) << "ignoring second record for" << node.path;
    return false;
}

void DiffTreeModel::processChild(Node& child)
{
    if (!child.payload) {
        child.payload = DiffData::placeholder();
        notifyPayloadChanged(child.id);
    }

    if (child.payload->size != 0)
        rollUp(child, child.payload->size);
}

void DiffTreeModel::processMerge(Node& node, const std::optional<DiffData>& previous)
{
    const qint64 delta = node.payload->size - (previous ? previous->size : 0);
    if (delta != 0)
        rollUp(node, delta);
}

void DiffTreeModel::processRemoval(Node& node)
{
    if (node.payload && node.payload->size != 0)
        rollUp(node, -node.payload->size);
}

void DiffTreeModel::rollUp(const Node& from, qint64 delta)
{
    Utils::TreeNodeId current = from.parent;
    while (Node* ancestor = mutableNode(current)) {
        if (ancestor->isRoot())
            break;
        if (!ancestor->payload)
            qFatal("DiffTreeModel: ancestor '%s' has no data.", qPrintable(ancestor->path));

        ancestor->payload->size += delta;
        notifyPayloadChanged(ancestor->id);
        current = ancestor->parent;
    }
}

QString DiffTreeModel::toolTip(const Node& node, int column) const
{
    if (column == 0)
        return node.path;

    const DiffData d = node.payload.value_or(DiffData::placeholder());
    QString tip = QStringLiteral("%1\n\n%2 %3")
                      .arg(node.segment, fileTypeName(d.fileType), changeTypeName(d.changeType));

    if (d.contentChange) {
        tip += QLatin1Char('\n')
               + tr("Added %1, deleted %2")
                     .arg(formatSize(d.contentChange->added), formatSize(d.contentChange->removed));
    }
    if (d.modeChange)
        tip += QStringLiteral("\n%1 -> %2").arg(d.modeChange->oldMode, d.modeChange->newMode);
    if (d.ownerChange) {
        const OwnerChange& o = *d.ownerChange;
        tip += QStringLiteral("\n%1 -> %2")
                   .arg(QStringLiteral("%1:%2").arg(o.oldUser, o.oldGroup), -10)
                   .arg(QStringLiteral("%1:%2").arg(o.newUser, o.newGroup), 10);
    }
    return tip;
}

} // namespace ArchiveDiff
