// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/PathTreeModel.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QPersistentModelIndex>
#include <QtTest/QAbstractItemModelTester>
#include <QtTest/QSignalSpy>

namespace {

using DisplayMode = Utils::PathTreeModelBase::DisplayMode;

QCoreApplication* ensureApp()
{
    static QCoreApplication* app = []() {
        static int argc = 1;
        static char arg0[] = "utils-pathtreemodel-tests";
        static char* argv[] = { arg0, nullptr };
        return new QCoreApplication(argc, argv);
    }();
    return app;
}

// Placeholders (no payload) merge in the simplified tree; only described
// nodes are listed flat.
class LabelModel final : public Utils::PathTreeModel<QString>
{
public:
    using PathTreeModel::PathTreeModel;

    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override
    {
        const Node* n = nodeForIndex(index);
        if (!n || role != Qt::DisplayRole)
            return {};
        return displayName(*n);
    }

    QStringList processed;

protected:
    bool flatFilter(const Node& node) const override { return node.payload.has_value(); }
    bool simplifyFilter(const Node& node) const override { return !node.payload.has_value(); }
    void processChild(Node& child) override { processed.push_back(child.path); }
};

QString label(const QAbstractItemModel& model, int row, const QModelIndex& parent = {})
{
    return model.index(row, 0, parent).data().toString();
}

} // namespace

TEST(PathTreeModelTests, TreeModeFollowsPaths)
{
    ensureApp();
    LabelModel model;
    QAbstractItemModelTester tester(&model, QAbstractItemModelTester::FailureReportingMode::Fatal);

    model.addItem(u"a/b/c", QStringLiteral("c"));
    model.addItem(u"a/d", QStringLiteral("d"));

    ASSERT_EQ(model.rowCount(), 1);
    const QModelIndex a = model.index(0, 0);
    EXPECT_EQ(a.data().toString(), "a");
    ASSERT_EQ(model.rowCount(a), 2);

    const QModelIndex b = model.index(0, 0, a);
    const QModelIndex d = model.index(1, 0, a);
    EXPECT_EQ(b.data().toString(), "b");
    EXPECT_EQ(d.data().toString(), "d");

    const QModelIndex c = model.index(0, 0, b);
    EXPECT_EQ(c.data().toString(), "c");
    EXPECT_EQ(model.parent(c), b);
    EXPECT_EQ(model.parent(a), QModelIndex());

    EXPECT_EQ(model.indexForPath(u"a/d"), d);
    EXPECT_FALSE(model.indexForPath(u"a/x").isValid());
    EXPECT_TRUE(model.itemForPath(u"").isNull());
    EXPECT_EQ(model.parentPathOf(u"a/b/c"), QStringLiteral("a/b"));
    EXPECT_EQ(model.parentPathOf(u"a"), std::nullopt);

    EXPECT_EQ(model.payloadForPath(u"a/d"), QStringLiteral("d"));
    EXPECT_EQ(model.payloadForPath(u"a"), std::nullopt);
}

TEST(PathTreeModelTests, SimplifiedTreeMergesPlaceholderChains)
{
    ensureApp();
    LabelModel model;
    model.setDisplayMode(DisplayMode::SimplifiedTree);
    QAbstractItemModelTester tester(&model, QAbstractItemModelTester::FailureReportingMode::Fatal);

    model.addItem(u"a/b/c", QStringLiteral("c"));

    ASSERT_EQ(model.rowCount(), 1);
    QModelIndex top = model.index(0, 0);
    EXPECT_EQ(top.data().toString(), "a/b/c");
    EXPECT_EQ(model.rowCount(top), 0);
    EXPECT_EQ(model.indexForPath(u"a"), top);
    EXPECT_EQ(model.indexForPath(u"a/b"), top);

    const QPersistentModelIndex persistentC(model.indexForPath(u"a/b/c"));
    QSignalSpy layoutSpy(&model, &QAbstractItemModel::layoutChanged);

    model.addItem(u"a/d", QStringLiteral("d"));
    EXPECT_EQ(layoutSpy.count(), 1);

    top = model.index(0, 0);
    EXPECT_EQ(top.data().toString(), "a");
    ASSERT_EQ(model.rowCount(top), 2);
    EXPECT_EQ(label(model, 0, top), "b/c");
    EXPECT_EQ(label(model, 1, top), "d");

    EXPECT_EQ(QModelIndex(persistentC), model.indexForPath(u"a/b/c"));
    EXPECT_EQ(persistentC.parent(), top);
    EXPECT_EQ(model.indexForPath(u"a/b"), model.index(0, 0, top));
    EXPECT_EQ(model.parentPathOf(u"a/b/c"), QStringLiteral("a"));
}

TEST(PathTreeModelTests, SimplifiedTreeKeepsDescribedNodes)
{
    ensureApp();
    LabelModel model;
    model.setDisplayMode(DisplayMode::SimplifiedTree);

    model.addItem(u"a", QStringLiteral("a"));
    model.addItem(u"a/b/c", QStringLiteral("c"));

    ASSERT_EQ(model.rowCount(), 1);
    const QModelIndex a = model.index(0, 0);
    EXPECT_EQ(a.data().toString(), "a");
    ASSERT_EQ(model.rowCount(a), 1);
    EXPECT_EQ(label(model, 0, a), "b/c");
}

TEST(PathTreeModelTests, SimplifiedTreeCollapsesAgainAfterRemoval)
{
    ensureApp();
    LabelModel model;
    model.setDisplayMode(DisplayMode::SimplifiedTree);
    QAbstractItemModelTester tester(&model, QAbstractItemModelTester::FailureReportingMode::Fatal);

    model.addItem(u"a/b/c", QStringLiteral("c"));
    model.addItem(u"a/d", QStringLiteral("d"));
    ASSERT_EQ(label(model, 0), "a");

    QSignalSpy layoutSpy(&model, &QAbstractItemModel::layoutChanged);
    EXPECT_TRUE(model.removeItem(u"a/d"));
    EXPECT_EQ(layoutSpy.count(), 1);

    ASSERT_EQ(model.rowCount(), 1);
    EXPECT_EQ(label(model, 0), "a/b/c");
    EXPECT_FALSE(model.indexForPath(u"a/d").isValid());
}

TEST(PathTreeModelTests, FlatListsFilteredNodesInInsertionOrder)
{
    ensureApp();
    LabelModel model;
    model.setDisplayMode(DisplayMode::Flat);
    QAbstractItemModelTester tester(&model, QAbstractItemModelTester::FailureReportingMode::Fatal);

    model.addItem(u"x/y", QStringLiteral("y"));
    model.addItem(u"a", QStringLiteral("a"));
    EXPECT_EQ(model.rowCount(), 2);

    // Describing the placeholder appends it to the list.
    model.addItem(u"x", QStringLiteral("x"));
    ASSERT_EQ(model.rowCount(), 3);
    EXPECT_EQ(label(model, 0), "x/y");
    EXPECT_EQ(label(model, 1), "a");
    EXPECT_EQ(label(model, 2), "x");
    EXPECT_EQ(model.rowCount(model.index(0, 0)), 0);
    EXPECT_EQ(model.parent(model.index(0, 0)), QModelIndex());
    EXPECT_EQ(model.indexForPath(u"x").row(), 2);

    QSignalSpy removedSpy(&model, &QAbstractItemModel::rowsRemoved);
    EXPECT_TRUE(model.removeItem(u"x"));
    ASSERT_EQ(removedSpy.count(), 2);
    EXPECT_EQ(removedSpy.at(0).at(1).toInt(), 0);
    EXPECT_EQ(removedSpy.at(1).at(1).toInt(), 1);

    ASSERT_EQ(model.rowCount(), 1);
    EXPECT_EQ(label(model, 0), "a");
    EXPECT_EQ(model.indexForPath(u"a").row(), 0);
}

TEST(PathTreeModelTests, RemovingMissingPathIsNoop)
{
    ensureApp();
    LabelModel model;
    model.addItem(u"a/b", QStringLiteral("b"));

    QSignalSpy removedSpy(&model, &QAbstractItemModel::rowsRemoved);
    EXPECT_FALSE(model.removeItem(u"a/x"));
    EXPECT_FALSE(model.removeItem(u""));
    EXPECT_EQ(removedSpy.count(), 0);
    EXPECT_EQ(model.tree().size(), 3);
}

TEST(PathTreeModelTests, AddingKnownPathWithoutPayloadChangesNothing)
{
    ensureApp();
    LabelModel model;
    model.addItem(u"a/b", QStringLiteral("b"));
    ASSERT_EQ(model.processed, QStringList({ "a", "a/b" }));

    QSignalSpy insertedSpy(&model, &QAbstractItemModel::rowsInserted);
    QSignalSpy changedSpy(&model, &QAbstractItemModel::dataChanged);
    model.addItem(u"a/b", std::nullopt);
    model.addItem(u"a/b", std::nullopt);

    EXPECT_EQ(insertedSpy.count(), 0);
    EXPECT_EQ(changedSpy.count(), 0);
    EXPECT_EQ(model.tree().size(), 3);
    EXPECT_EQ(model.processed.size(), 2);
    EXPECT_EQ(model.payloadForPath(u"a/b"), QStringLiteral("b"));
}

TEST(PathTreeModelTests, SecondPayloadIsIgnored)
{
    ensureApp();
    LabelModel model;
    model.addItem(u"a", QStringLiteral("first"));

    QSignalSpy changedSpy(&model, &QAbstractItemModel::dataChanged);
    model.addItem(u"a", QStringLiteral("second"));
    EXPECT_EQ(changedSpy.count(), 0);
    EXPECT_EQ(model.payloadForPath(u"a"), QStringLiteral("first"));
}

TEST(PathTreeModelTests, SwitchingModesResetsModel)
{
    ensureApp();
    LabelModel model;
    model.addItem(u"a/b", QStringLiteral("b"));

    QSignalSpy resetSpy(&model, &QAbstractItemModel::modelReset);
    QSignalSpy modeSpy(&model, &Utils::PathTreeModelBase::displayModeChanged);

    model.setDisplayMode(DisplayMode::Flat);
    model.setDisplayMode(DisplayMode::Flat);
    EXPECT_EQ(resetSpy.count(), 1);
    ASSERT_EQ(modeSpy.count(), 1);
    EXPECT_EQ(modeSpy.at(0).at(0).value<DisplayMode>(), DisplayMode::Flat);

    EXPECT_EQ(model.rowCount(), 1);
    EXPECT_EQ(label(model, 0), "a/b");
}

TEST(PathTreeModelTests, ModelContractHoldsInEveryMode)
{
    ensureApp();
    for (DisplayMode mode : { DisplayMode::Tree, DisplayMode::SimplifiedTree, DisplayMode::Flat }) {
        LabelModel model;
        model.setDisplayMode(mode);
        QAbstractItemModelTester tester(&model, QAbstractItemModelTester::FailureReportingMode::Fatal);

        model.addItem(u"usr/share/doc/readme", QStringLiteral("readme"));
        model.addItem(u"usr/share/man", QStringLiteral("man"));
        model.addItem(u"usr/bin/tool", QStringLiteral("tool"));
        model.addItem(u"usr", QStringLiteral("usr"));
        model.addItem(u"etc/hosts", QStringLiteral("hosts"));
        EXPECT_TRUE(model.removeItem(u"usr/share/man"));
        EXPECT_TRUE(model.removeItem(u"usr/bin"));
        model.addItem(u"usr/share/doc/changelog", QStringLiteral("changelog"));
        EXPECT_TRUE(model.removeItem(u"usr"));

        EXPECT_TRUE(model.indexForPath(u"etc/hosts").isValid());
        EXPECT_FALSE(model.indexForPath(u"usr/share/doc/readme").isValid());

        model.clear();
        EXPECT_EQ(model.rowCount(), 0);
        EXPECT_EQ(model.tree().size(), 1);
    }
}
