#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "util/StringUtils.hpp"

using namespace gitminer;

using Parts = std::vector<std::string>;

// Test: Multi-character delimiter keeps empty fragments
TEST(StringUtilsTest, SplitOnStringDelimiter) {
    EXPECT_EQ(StringUtils::split("a--b--c", "--"), (Parts{"a", "b", "c"}));
    EXPECT_EQ(StringUtils::split("--a--b--", "--"), (Parts{"", "a", "b", ""}));
    EXPECT_EQ(StringUtils::split("a----b", "--"), (Parts{"a", "", "b"}));
    EXPECT_EQ(StringUtils::split("", "--"), (Parts{""}));
    EXPECT_EQ(StringUtils::split("abc", ""), (Parts{"abc"}));
}

// Test: Blank-line delimiter
TEST(StringUtilsTest, SplitOnBlankLine) {
    EXPECT_EQ(StringUtils::split("x\ny\n\nz", "\n\n"), (Parts{"x\ny", "z"}));
    EXPECT_EQ(StringUtils::split("x\n\n\nz", "\n\n"), (Parts{"x", "\nz"}));
}

// Test: Single character delimiter
TEST(StringUtilsTest, SplitOnChar) {
    EXPECT_EQ(StringUtils::split("3\t1\tfoo.txt", '\t'), (Parts{"3", "1", "foo.txt"}));
    EXPECT_EQ(StringUtils::split("\t\t", '\t'), (Parts{"", "", ""}));
}

TEST(StringUtilsTest, RemoveAll) {
    EXPECT_EQ(StringUtils::removeAll("'--a--b'", '\''), "--a--b");
    EXPECT_EQ(StringUtils::removeAll("it's", '\''), "its");
    EXPECT_EQ(StringUtils::removeAll("", '\''), "");
}

TEST(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::startsWith("'--abc", "'--"));
    EXPECT_FALSE(StringUtils::startsWith("'abc--", "'--"));
    EXPECT_FALSE(StringUtils::startsWith("'-", "'--"));
    EXPECT_TRUE(StringUtils::startsWith("anything", ""));
}

TEST(StringUtilsTest, TrimAndJoin) {
    EXPECT_EQ(StringUtils::trim("  a b \t\r\n"), "a b");
    EXPECT_EQ(StringUtils::trim(" \t "), "");
    EXPECT_EQ(StringUtils::join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(StringUtils::join({}, ", "), "");
}
