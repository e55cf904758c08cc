// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/PathUtils.hpp"
#include "utils/TreeIds.hpp"

#include <QtCore/QHash>
#include <QtCore/QSharedPointer>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>
#include <utility>

namespace Utils {

// Ordered tree keyed by path segments. The tree owns every node through its
// arena; nodes refer to their parent and children by id only.
template <typename Payload>
class PathTree final {
public:
    struct Node final {
        TreeNodeId id{};
        TreeNodeId parent{};
        QString segment;
        QString path;
        QVector<TreeNodeId> children{};
        std::optional<Payload> payload{};

        bool isRoot() const noexcept { return parent.isNull(); }
    };

    PathTree() { clear(); }
    PathTree(const PathTree&) = delete;
    PathTree& operator=(const PathTree&) = delete;
    PathTree(PathTree&&) = default;
    PathTree& operator=(PathTree&&) = default;

    TreeNodeId rootId() const noexcept { return m_root; }

    // Drops every node and starts over with a fresh root.
    void clear()
    {
        m_nodes.clear();
        m_childLookup.clear();

        m_root = TreeNodeId::create();
        auto root = QSharedPointer<Node>::create();
        root->id = m_root;
        m_nodes.insert(m_root, root);
    }

    // Node count including the root.
    int size() const noexcept { return static_cast<int>(m_nodes.size()); }
    bool contains(TreeNodeId id) const noexcept { return m_nodes.contains(id); }

    Node* node(TreeNodeId id)
    {
        auto it = m_nodes.find(id);
        return it == m_nodes.end() ? nullptr : it.value().data();
    }

    const Node* node(TreeNodeId id) const
    {
        auto it = m_nodes.constFind(id);
        return it == m_nodes.cend() ? nullptr : it.value().data();
    }

    TreeNodeId parent(TreeNodeId id) const
    {
        const Node* n = node(id);
        return n ? n->parent : TreeNodeId::null();
    }

    QVector<TreeNodeId> children(TreeNodeId id) const
    {
        const Node* n = node(id);
        return n ? n->children : QVector<TreeNodeId>{};
    }

    int childIndex(TreeNodeId parent, TreeNodeId child) const
    {
        const Node* n = node(parent);
        if (!n)
            return -1;
        return static_cast<int>(n->children.indexOf(child));
    }

    TreeNodeId findChild(TreeNodeId parent, const QString& segment) const
    {
        return m_childLookup.value(ChildKey{ parent, segment });
    }

    TreeNodeId lookup(const QStringList& segments) const
    {
        TreeNodeId current = m_root;
        for (const QString& segment : segments) {
            current = findChild(current, segment);
            if (current.isNull())
                return TreeNodeId::null();
        }
        return current;
    }

    TreeNodeId lookup(QStringView path) const { return lookup(PathUtils::splitSegments(path)); }

    // Appends a new child. Sibling segments are unique; asking for a second
    // child with the same segment is a caller bug and aborts.
    TreeNodeId addChild(TreeNodeId parent,
                        const QString& segment,
                        std::optional<Payload> payload = std::nullopt)
    {
        Node* parentNode = node(parent);
        if (!parentNode || segment.isEmpty())
            return TreeNodeId::null();

        const ChildKey key{ parent, segment };
        if (m_childLookup.contains(key)) {
            qFatal("PathTree::addChild: segment '%s' already exists below '%s'.",
                   qPrintable(segment), qPrintable(parentNode->path));
        }

        const TreeNodeId id = TreeNodeId::create();
        auto child = QSharedPointer<Node>::create();
        child->id = id;
        child->parent = parent;
        child->segment = segment;
        child->path = PathUtils::joinPath(parentNode->path, segment);
        child->payload = std::move(payload);

        parentNode->children.push_back(id);
        m_nodes.insert(id, child);
        m_childLookup.insert(key, id);
        return id;
    }

    // Post-order listing of the subtree below `id`: descendants first, `id` last.
    QVector<TreeNodeId> subtree(TreeNodeId id) const
    {
        QVector<TreeNodeId> out;
        if (contains(id))
            collectPostOrder(id, out);
        return out;
    }

    // Removes `id` and its subtree. The root cannot be removed; use clear().
    bool removeSubtree(TreeNodeId id)
    {
        Node* n = node(id);
        if (!n || n->isRoot())
            return false;

        Node* parentNode = node(n->parent);
        const int index = static_cast<int>(parentNode->children.indexOf(id));

        const QVector<TreeNodeId> doomed = subtree(id);
        for (TreeNodeId victim : doomed) {
            const Node* v = node(victim);
            m_childLookup.remove(ChildKey{ v->parent, v->segment });
            m_nodes.remove(victim);
        }

        parentNode->children.removeAt(index);
        return true;
    }

private:
    struct ChildKey final {
        TreeNodeId parent;
        QString segment;

        friend bool operator==(const ChildKey&, const ChildKey&) = default;
        friend size_t qHash(const ChildKey& key, size_t seed = 0) noexcept
        {
            return qHashMulti(seed, key.parent, key.segment);
        }
    };

    void collectPostOrder(TreeNodeId id, QVector<TreeNodeId>& out) const
    {
        const Node* n = node(id);
        for (TreeNodeId child : n->children)
            collectPostOrder(child, out);
        out.push_back(id);
    }

    QHash<TreeNodeId, QSharedPointer<Node>> m_nodes;
    QHash<ChildKey, TreeNodeId> m_childLookup;
    TreeNodeId m_root{};
};

} // namespace Utils
