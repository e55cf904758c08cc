// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/PathTree.hpp"
#include "utils/PathUtils.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QAbstractItemModel>
#include <QtCore/QHash>
#include <QtCore/QSet>
#include <QtCore/QVector>

#include <algorithm>
#include <optional>
#include <utility>

namespace Utils {

// Non-template half of PathTreeModel. Owns the display mode so moc has a
// concrete class to work with.
class UTILS_EXPORT PathTreeModelBase : public QAbstractItemModel
{
    Q_OBJECT

public:
    enum class DisplayMode : unsigned char {
        Tree,
        SimplifiedTree,
        Flat
    };
    Q_ENUM(DisplayMode)

    explicit PathTreeModelBase(QObject* parent = nullptr);

    DisplayMode displayMode() const noexcept { return m_mode; }

    // Switching modes is a pure projection change and resets attached views.
    void setDisplayMode(DisplayMode mode);

signals:
    void displayModeChanged(Utils::PathTreeModelBase::DisplayMode mode);

protected:
    DisplayMode m_mode = DisplayMode::Tree;
};

// Item model over a PathTree. Three projections of the same tree:
//
//  - Tree: every node at its natural depth.
//  - SimplifiedTree: a node with a single child that passes simplifyFilter()
//    is shown merged with that child. The merged row carries the deepest node
//    of the chain and the row number of the topmost one.
//  - Flat: nodes passing flatFilter(), in insertion order, without parents.
//
// Subclasses customise payload handling through the protected hooks.
template <typename Payload>
class PathTreeModel : public PathTreeModelBase
{
public:
    using Tree = PathTree<Payload>;
    using Node = typename Tree::Node;

    struct Item final {
        QString path;
        std::optional<Payload> payload;
    };
    using ItemList = QVector<Item>;

    explicit PathTreeModel(QObject* parent = nullptr)
        : PathTreeModelBase(parent)
    {}

    const Tree& tree() const noexcept { return m_tree; }

    void addItems(const ItemList& items)
    {
        for (const Item& item : items)
            addItem(item.path, item.payload);
    }

    // Creates every missing ancestor of `path`, then creates or merges the
    // terminal node. Returns the terminal node id, or a null id for an empty
    // path.
    TreeNodeId addItem(QStringView path, std::optional<Payload> payload)
    {
        const QStringList segments = PathUtils::splitSegments(path);
        if (segments.isEmpty())
            return TreeNodeId::null();

        TreeNodeId current = m_tree.rootId();
        for (qsizetype i = 0; i < segments.size(); ++i) {
            const bool terminal = (i == segments.size() - 1);
            current = addChild(current, segments[i], terminal ? std::move(payload) : std::nullopt);
        }
        return current;
    }

    // Removes the node at `path` with its subtree. A missing path is not an
    // error: nothing happens and false is returned.
    bool removeItem(QStringView path)
    {
        const TreeNodeId id = m_tree.lookup(path);
        if (id.isNull() || id == m_tree.rootId())
            return false;

        removeNode(id);
        return true;
    }

    void clear()
    {
        beginResetModel();
        m_tree.clear();
        m_flattened.clear();
        m_flatRows.clear();
        endResetModel();
    }

    TreeNodeId itemForPath(QStringView path) const
    {
        const TreeNodeId id = m_tree.lookup(path);
        return id == m_tree.rootId() ? TreeNodeId::null() : id;
    }

    std::optional<Payload> payloadForPath(QStringView path) const
    {
        const Node* n = m_tree.node(itemForPath(path));
        return n ? n->payload : std::nullopt;
    }

    const Node* nodeForIndex(const QModelIndex& index) const
    {
        if (!index.isValid() || index.model() != this)
            return nullptr;
        return m_tree.node(TreeNodeId::fromValue(index.internalId()));
    }

    // Row of `path` under the active mode. A node merged away in the
    // simplified tree resolves to the row that displays it; a node outside
    // the flat list resolves to an invalid index.
    QModelIndex indexForPath(QStringView path, int column = 0) const
    {
        return indexForNode(itemForPath(path), column);
    }

    QModelIndex indexForNode(TreeNodeId id, int column = 0) const
    {
        const Node* n = m_tree.node(id);
        if (!n || n->isRoot() || column < 0)
            return {};

        switch (m_mode) {
        case DisplayMode::Flat: {
            const int row = m_flatRows.value(id, -1);
            return row < 0 ? QModelIndex() : createIndex(row, column, quintptr(id.value()));
        }
        case DisplayMode::Tree:
            return createIndex(m_tree.childIndex(n->parent, id), column, quintptr(id.value()));
        case DisplayMode::SimplifiedTree: {
            const TreeNodeId shown = displayNode(id);
            const TreeNodeId top = chainTop(shown);
            const int row = m_tree.childIndex(m_tree.parent(top), top);
            return createIndex(row, column, quintptr(shown.value()));
        }
        }
        return {};
    }

    // Path of the row that parents `path` under the active mode. Top-level
    // rows, flat rows and unknown paths have none.
    std::optional<QString> parentPathOf(QStringView path) const
    {
        const Node* parentNode = nodeForIndex(parent(indexForPath(path)));
        if (!parentNode)
            return std::nullopt;
        return parentNode->path;
    }

    // Path of the closest ancestor that is visible under the active mode; the
    // empty string stands for the invisible root.
    QString visibleParentPath(const Node& n) const
    {
        if (m_mode == DisplayMode::Flat)
            return {};

        TreeNodeId p = n.parent;
        if (m_mode == DisplayMode::SimplifiedTree)
            p = m_tree.parent(chainTop(n.id));

        const Node* parentNode = m_tree.node(p);
        return parentNode ? parentNode->path : QString();
    }

    // Label of a node under the active mode.
    QString displayName(const Node& n) const
    {
        switch (m_mode) {
        case DisplayMode::Flat:
            return n.path;
        case DisplayMode::SimplifiedTree:
            return PathUtils::relativePath(n.path, visibleParentPath(n));
        case DisplayMode::Tree:
            break;
        }
        return n.segment;
    }

    int rowCount(const QModelIndex& parent = QModelIndex()) const override
    {
        if (parent.column() > 0)
            return 0;

        if (m_mode == DisplayMode::Flat)
            return parent.isValid() ? 0 : static_cast<int>(m_flattened.size());

        const Node* n = parent.isValid() ? nodeForIndex(parent) : m_tree.node(m_tree.rootId());
        return n ? static_cast<int>(n->children.size()) : 0;
    }

    int columnCount(const QModelIndex& parent = QModelIndex()) const override
    {
        Q_UNUSED(parent);
        return 1;
    }

    QModelIndex index(int row, int column, const QModelIndex& parent = QModelIndex()) const override
    {
        if (row < 0 || column < 0 || column >= columnCount(parent))
            return {};

        if (m_mode == DisplayMode::Flat) {
            if (parent.isValid() || row >= m_flattened.size())
                return {};
            return createIndex(row, column, quintptr(m_flattened[row].value()));
        }

        const Node* parentNode = parent.isValid() ? nodeForIndex(parent) : m_tree.node(m_tree.rootId());
        if (!parentNode || row >= parentNode->children.size())
            return {};

        TreeNodeId child = parentNode->children[row];
        if (m_mode == DisplayMode::SimplifiedTree)
            child = displayNode(child);
        return createIndex(row, column, quintptr(child.value()));
    }

    QModelIndex parent(const QModelIndex& index) const override
    {
        const Node* n = nodeForIndex(index);
        if (!n || m_mode == DisplayMode::Flat)
            return {};

        TreeNodeId p = n->parent;
        if (m_mode == DisplayMode::SimplifiedTree)
            p = m_tree.parent(chainTop(n->id));

        if (p.isNull() || p == m_tree.rootId())
            return {};
        return indexForNode(p);
    }

    using QObject::parent;

protected:
    // Whether a node appears in the flat projection.
    virtual bool flatFilter(const Node& node) const
    {
        Q_UNUSED(node);
        return true;
    }

    // Whether a node with a single child may be merged with that child.
    virtual bool simplifyFilter(const Node& node) const
    {
        Q_UNUSED(node);
        return true;
    }

    // Merges a payload observed again for an existing node. The default keeps
    // the first payload. Returns whether the stored payload changed.
    virtual bool mergePayload(Node& node, Payload&& incoming)
    {
        if (node.payload)
            return false;
        node.payload = std::move(incoming);
        return true;
    }

    // Runs once per created node, after views have been told about it.
    virtual void processChild(Node& child) { Q_UNUSED(child); }

    // Runs after mergePayload() changed a node's payload.
    virtual void processMerge(Node& node, const std::optional<Payload>& previous)
    {
        Q_UNUSED(node);
        Q_UNUSED(previous);
    }

    // Runs before a node and its subtree are removed.
    virtual void processRemoval(Node& node) { Q_UNUSED(node); }

    Node* mutableNode(TreeNodeId id) { return m_tree.node(id); }

    void notifyPayloadChanged(TreeNodeId id)
    {
        const QModelIndex first = indexForNode(id, 0);
        if (!first.isValid())
            return;
        const int lastColumn = columnCount(first.parent()) - 1;
        emit dataChanged(first, first.siblingAtColumn(lastColumn));
    }

private:
    // True when the node is shown merged with its only child.
    bool collapses(const Node& n) const
    {
        return !n.isRoot() && n.children.size() == 1 && simplifyFilter(n);
    }

    TreeNodeId displayNode(TreeNodeId id) const
    {
        const Node* n = m_tree.node(id);
        while (n && collapses(*n)) {
            id = n->children.front();
            n = m_tree.node(id);
        }
        return id;
    }

    TreeNodeId chainTop(TreeNodeId id) const
    {
        const Node* n = m_tree.node(id);
        while (n) {
            const Node* p = m_tree.node(n->parent);
            if (!p || !collapses(*p))
                break;
            id = p->id;
            n = p;
        }
        return id;
    }

    TreeNodeId addChild(TreeNodeId parentId, const QString& segment, std::optional<Payload> payload)
    {
        const TreeNodeId existing = m_tree.findChild(parentId, segment);
        if (!existing.isNull()) {
            if (payload)
                mergeInto(existing, std::move(*payload));
            return existing;
        }
        return createChild(parentId, segment, std::move(payload));
    }

    TreeNodeId createChild(TreeNodeId parentId, const QString& segment, std::optional<Payload> payload)
    {
        const Node* parentNode = m_tree.node(parentId);
        const int row = static_cast<int>(parentNode->children.size());

        TreeNodeId id;
        if (m_mode == DisplayMode::Flat) {
            id = m_tree.addChild(parentId, segment, std::move(payload));
        } else if (m_mode == DisplayMode::SimplifiedTree && !parentNode->isRoot()
                   && row <= 1 && simplifyFilter(*parentNode)) {
            // The parent switches between shown-on-its-own and merged.
            beginLayoutChange();
            id = m_tree.addChild(parentId, segment, std::move(payload));
            endLayoutChange();
        } else {
            beginInsertRows(indexForNode(parentId), row, row);
            id = m_tree.addChild(parentId, segment, std::move(payload));
            endInsertRows();
        }

        Node* child = m_tree.node(id);
        processChild(*child);
        syncFlatMembership(*child);
        return id;
    }

    void mergeInto(TreeNodeId id, Payload&& incoming)
    {
        Node* n = m_tree.node(id);
        const std::optional<Payload> previous = n->payload;

        // With a single child the merge may flip whether the node is merged
        // into its child, so the simplified layout is rebuilt around it.
        const bool relayout = m_mode == DisplayMode::SimplifiedTree && n->children.size() == 1;
        if (relayout)
            beginLayoutChange();
        const bool changed = mergePayload(*n, std::move(incoming));
        if (relayout)
            endLayoutChange();

        if (!changed)
            return;

        notifyPayloadChanged(id);
        processMerge(*n, previous);
        syncFlatMembership(*n);
    }

    void removeNode(TreeNodeId id)
    {
        Node* n = m_tree.node(id);
        processRemoval(*n);

        // Derived indices first, descendants before the node itself.
        const QVector<TreeNodeId> doomed = m_tree.subtree(id);
        removeFromFlat(doomed, m_mode == DisplayMode::Flat);

        const TreeNodeId parentId = n->parent;
        const Node* parentNode = m_tree.node(parentId);
        const int row = m_tree.childIndex(parentId, id);
        const int siblings = static_cast<int>(parentNode->children.size());

        if (m_mode == DisplayMode::Flat) {
            m_tree.removeSubtree(id);
        } else if (m_mode == DisplayMode::SimplifiedTree && !parentNode->isRoot()
                   && siblings <= 2 && simplifyFilter(*parentNode)) {
            beginLayoutChange();
            m_tree.removeSubtree(id);
            endLayoutChange();
        } else {
            beginRemoveRows(indexForNode(parentId), row, row);
            m_tree.removeSubtree(id);
            endRemoveRows();
        }
    }

    void syncFlatMembership(const Node& n)
    {
        const bool wanted = flatFilter(n);
        const bool present = m_flatRows.contains(n.id);
        if (wanted == present)
            return;

        if (!wanted) {
            removeFromFlat({ n.id }, m_mode == DisplayMode::Flat);
            return;
        }

        const int row = static_cast<int>(m_flattened.size());
        const bool notify = m_mode == DisplayMode::Flat;
        if (notify)
            beginInsertRows(QModelIndex(), row, row);
        m_flattened.push_back(n.id);
        m_flatRows.insert(n.id, row);
        if (notify)
            endInsertRows();
    }

    void removeFromFlat(const QVector<TreeNodeId>& ids, bool notify)
    {
        if (notify) {
            for (TreeNodeId id : ids) {
                const int row = m_flatRows.value(id, -1);
                if (row < 0)
                    continue;
                beginRemoveRows(QModelIndex(), row, row);
                m_flattened.removeAt(row);
                m_flatRows.remove(id);
                renumberFlatFrom(row);
                endRemoveRows();
            }
            return;
        }

        int first = static_cast<int>(m_flattened.size());
        for (TreeNodeId id : ids) {
            const int row = m_flatRows.value(id, -1);
            if (row >= 0)
                first = std::min(first, row);
            m_flatRows.remove(id);
        }
        if (first == m_flattened.size())
            return;

        const QSet<TreeNodeId> gone(ids.cbegin(), ids.cend());
        m_flattened.removeIf([&gone](TreeNodeId id) { return gone.contains(id); });
        renumberFlatFrom(first);
    }

    void renumberFlatFrom(int row)
    {
        for (int i = row; i < m_flattened.size(); ++i)
            m_flatRows.insert(m_flattened[i], i);
    }

    void beginLayoutChange()
    {
        emit layoutAboutToBeChanged();
        m_layoutFrom = persistentIndexList();
    }

    void endLayoutChange()
    {
        QModelIndexList to;
        to.reserve(m_layoutFrom.size());
        for (const QModelIndex& from : std::as_const(m_layoutFrom)) {
            const TreeNodeId id = TreeNodeId::fromValue(from.internalId());
            to.push_back(m_tree.contains(id) ? indexForNode(id, from.column()) : QModelIndex());
        }
        changePersistentIndexList(m_layoutFrom, to);
        m_layoutFrom.clear();
        emit layoutChanged();
    }

    Tree m_tree;
    QVector<TreeNodeId> m_flattened;
    QHash<TreeNodeId, int> m_flatRows;
    QModelIndexList m_layoutFrom;
};

} // namespace Utils
