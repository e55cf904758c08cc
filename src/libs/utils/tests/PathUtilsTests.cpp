// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/PathUtils.hpp"

using Utils::PathUtils::comparePaths;
using Utils::PathUtils::isAncestorPath;
using Utils::PathUtils::joinPath;
using Utils::PathUtils::relativePath;
using Utils::PathUtils::splitSegments;

TEST(PathUtilsTests, SplitSkipsEmptyAndDotSegments)
{
    EXPECT_EQ(splitSegments(u"home//user/./docs/"), QStringList({ "home", "user", "docs" }));
    EXPECT_EQ(splitSegments(u"/a/./b/"), QStringList({ "a", "b" }));
    EXPECT_TRUE(splitSegments(u"").isEmpty());
    EXPECT_TRUE(splitSegments(u"/").isEmpty());
}

TEST(PathUtilsTests, JoinPath)
{
    EXPECT_EQ(joinPath(u"", u"a"), "a");
    EXPECT_EQ(joinPath(u"a", u""), "a");
    EXPECT_EQ(joinPath(u"a", u"b"), "a/b");
    EXPECT_EQ(joinPath(u"a/b", u"c.txt"), "a/b/c.txt");
}

TEST(PathUtilsTests, RelativePaths)
{
    EXPECT_TRUE(isAncestorPath(u"a", u"a/b"));
    EXPECT_TRUE(isAncestorPath(u"", u"a"));
    EXPECT_FALSE(isAncestorPath(u"a", u"ab"));
    EXPECT_FALSE(isAncestorPath(u"a", u"a"));

    EXPECT_EQ(relativePath(u"a/b/c", u"a"), "b/c");
    EXPECT_EQ(relativePath(u"a/b/c", u""), "a/b/c");
    EXPECT_EQ(relativePath(u"x/y", u"a"), "x/y");
}

TEST(PathUtilsTests, ComparePathsSegmentWise)
{
    EXPECT_LT(comparePaths(u"a/b", u"a.b"), 0);
    EXPECT_GT(comparePaths(u"a.b", u"a/b"), 0);
    EXPECT_LT(comparePaths(u"a", u"a/b"), 0);
    EXPECT_EQ(comparePaths(u"a/b", u"a//b"), 0);
    EXPECT_LT(comparePaths(u"B", u"a"), 0);
}
