#pragma once

#include <courier/path_resolver.hpp>

#include <gtest/gtest.h>

namespace Test
{
    using namespace Courier;

    TEST(PathResolverTests, ParentOfNestedPath)
    {
        EXPECT_EQ(PathResolver::parentOf("/a/b/c"), "/a/b");
        EXPECT_EQ(PathResolver::parentOf("a/b"), "a");
    }

    TEST(PathResolverTests, ParentOfTopLevelEntryIsTheRoot)
    {
        EXPECT_EQ(PathResolver::parentOf("/a"), "");
    }

    TEST(PathResolverTests, PathWithoutSeparatorHasNoParent)
    {
        EXPECT_FALSE(PathResolver::parentOf("root").has_value());
        EXPECT_FALSE(PathResolver::parentOf("").has_value());
    }

    TEST(PathResolverTests, FileNameAndDirectoryPrefix)
    {
        EXPECT_EQ(PathResolver::fileNameOf("/a/b/file.txt"), "file.txt");
        EXPECT_EQ(PathResolver::fileNameOf("file.txt"), "file.txt");
        EXPECT_EQ(PathResolver::directoryPrefixOf("/a/b/file.txt"), "/a/b/");
        EXPECT_EQ(PathResolver::directoryPrefixOf("file.txt"), "");
    }

    TEST(PathResolverTests, JoinUsesExactlyOneSeparator)
    {
        EXPECT_EQ(PathResolver::join("/a", "b"), "/a/b");
        EXPECT_EQ(PathResolver::join("/a/", "b"), "/a/b");
        EXPECT_EQ(PathResolver::join("/a", "/b"), "/a/b");
        EXPECT_EQ(PathResolver::join("/", "b"), "/b");
        EXPECT_EQ(PathResolver::join("", "b"), "/b");
    }

    TEST(PathResolverTests, EmptyWildcardBecomesStar)
    {
        const auto pattern = PathResolver::validateWildcard("");
        ASSERT_TRUE(pattern.has_value());
        EXPECT_EQ(*pattern, "*");
    }

    TEST(PathResolverTests, WildcardWithSeparatorIsRejected)
    {
        const auto pattern = PathResolver::validateWildcard("sub/*.txt");
        ASSERT_FALSE(pattern.has_value());
        EXPECT_EQ(pattern.error().type, ErrorType::ConfigurationError);
    }

    TEST(PathResolverTests, WildcardMatching)
    {
        EXPECT_TRUE(PathResolver::matchesWildcard("report.csv", "*.csv"));
        EXPECT_TRUE(PathResolver::matchesWildcard("a1.txt", "a?.txt"));
        EXPECT_FALSE(PathResolver::matchesWildcard("a12.txt", "a?.txt"));
        EXPECT_FALSE(PathResolver::matchesWildcard("Report.CSV", "*.csv"));
        EXPECT_TRUE(PathResolver::matchesWildcard("anything", "*"));
    }
}
