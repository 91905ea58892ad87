#pragma once

#include <utility/wildcard.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    TEST(WildcardTests, StarMatchesEverything)
    {
        EXPECT_TRUE(matchesWildcard("file.txt", "*"));
        EXPECT_TRUE(matchesWildcard("", "*"));
        EXPECT_TRUE(matchesWildcard(".hidden", "*"));
    }

    TEST(WildcardTests, StarWithExtension)
    {
        EXPECT_TRUE(matchesWildcard("file.txt", "*.txt"));
        EXPECT_TRUE(matchesWildcard(".txt", "*.txt"));
        EXPECT_FALSE(matchesWildcard("file.txt.bak", "*.txt"));
        EXPECT_TRUE(matchesWildcard("a.b.c", "*.*"));
        EXPECT_FALSE(matchesWildcard("noextension", "*.*"));
    }

    TEST(WildcardTests, QuestionMarkMatchesExactlyOneCharacter)
    {
        EXPECT_TRUE(matchesWildcard("file1.txt", "file?.txt"));
        EXPECT_FALSE(matchesWildcard("file.txt", "file?.txt"));
        EXPECT_FALSE(matchesWildcard("file12.txt", "file?.txt"));
    }

    TEST(WildcardTests, LiteralPatternIsCaseSensitive)
    {
        EXPECT_TRUE(matchesWildcard("myfile.txt", "myfile.txt"));
        EXPECT_FALSE(matchesWildcard("MyFile.txt", "myfile.txt"));
    }

    TEST(WildcardTests, StarBacktracks)
    {
        EXPECT_TRUE(matchesWildcard("abcabcabd", "*abd"));
        EXPECT_TRUE(matchesWildcard("report-2024-final.csv", "report*final*"));
        EXPECT_FALSE(matchesWildcard("report-2024.csv", "report*final*"));
    }
}
