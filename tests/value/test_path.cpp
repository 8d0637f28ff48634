/**
 * @file test_path.cpp
 * @brief Path value normalization tests
 */

#include "objfmt/value.hpp"

#include <gtest/gtest.h>

using objfmt::PathValue;

TEST(PathNormalization, UnixPaths)
{
    EXPECT_EQ(PathValue("/home/user/project").str(), "/home/user/project");
    EXPECT_EQ(PathValue("/home/user/project/").str(), "/home/user/project");
    EXPECT_EQ(PathValue("/home/user/./project").str(), "/home/user/project");
}

TEST(PathNormalization, RepeatedSeparators)
{
    EXPECT_EQ(PathValue("a//b///c").str(), "a/b/c");
    EXPECT_EQ(PathValue("//x/y").str(), "/x/y");
}

TEST(PathNormalization, DotDotIsKept)
{
    // Lexical normalization only
    EXPECT_EQ(PathValue("a/b/../c").str(), "a/b/../c");
    EXPECT_EQ(PathValue("../a/b").str(), "../a/b");
}

TEST(PathNormalization, Dot)
{
    EXPECT_EQ(PathValue("./a/b").str(), "a/b");
    EXPECT_EQ(PathValue("a/./b").str(), "a/b");
    EXPECT_EQ(PathValue("a/b/.").str(), "a/b");
}

TEST(PathNormalization, EmptyAndRoot)
{
    EXPECT_EQ(PathValue("").str(), ".");
    EXPECT_EQ(PathValue("./").str(), ".");
    EXPECT_EQ(PathValue("/").str(), "/");
}

TEST(PathNormalization, EqualityAfterNormalization)
{
    EXPECT_EQ(PathValue("/x/y/"), PathValue("/x//y"));
    EXPECT_NE(PathValue("/x/y"), PathValue("x/y"));
}
