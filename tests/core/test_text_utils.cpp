#include "clippy/core/text_utils.hpp"
#include <gtest/gtest.h>

namespace clippy::text {

class TextUtilsTest : public ::testing::Test {};

TEST_F(TextUtilsTest, CollapseWhitespaceKeepsEdges)
{
    EXPECT_EQ(collapse_whitespace("  a \n\t b  "), " a b ");
    EXPECT_EQ(collapse_whitespace("plain"), "plain");
    EXPECT_EQ(collapse_whitespace(""), "");
}

TEST_F(TextUtilsTest, TrimVariants)
{
    EXPECT_EQ(trim("\n  hello world \t"), "hello world");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim_right("  keep left  "), "  keep left");
    EXPECT_TRUE(is_blank(" \r\n\f"));
    EXPECT_FALSE(is_blank(" x "));
}

TEST_F(TextUtilsTest, SplitLinesDropsCarriageReturns)
{
    auto lines = split_lines("one\r\ntwo\n\nthree");

    ASSERT_EQ(lines.size(), 4);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "three");
}

TEST_F(TextUtilsTest, SplitByWhitespace)
{
    auto tokens = split_by_whitespace("  language-cpp   hljs ");

    ASSERT_EQ(tokens.size(), 2);
    EXPECT_EQ(tokens[0], "language-cpp");
    EXPECT_EQ(tokens[1], "hljs");
}

TEST_F(TextUtilsTest, CaseInsensitivePrefix)
{
    EXPECT_TRUE(starts_with_ignore_case("HTTPS://x", "https:"));
    EXPECT_FALSE(starts_with_ignore_case("http", "https:"));
    EXPECT_EQ(to_lowercase("MiXeD"), "mixed");
}

TEST_F(TextUtilsTest, ReplaceAll)
{
    EXPECT_EQ(replace_all("a(b)c(d)", "(", "%28"), "a%28b)c%28d)");
    EXPECT_EQ(replace_all("same", "", "x"), "same");
}

TEST_F(TextUtilsTest, TruncateNeverSplitsMultibyteCharacters)
{
    // "é" is two bytes
    std::string text = "ab\xC3\xA9";

    EXPECT_EQ(truncate_utf8(text, 3), "ab");
    EXPECT_EQ(truncate_utf8(text, 4), text);
    EXPECT_EQ(truncate_utf8("abcdef", 3), "abc");
}

TEST_F(TextUtilsTest, LongestRun)
{
    EXPECT_EQ(longest_run("a ``` b `` c", '`'), 3);
    EXPECT_EQ(longest_run("none", '`'), 0);
}

} // namespace clippy::text
