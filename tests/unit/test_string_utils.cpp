#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "utils/StringUtils.hpp"

using namespace CodeRisk::Utils;

TEST(StringUtilsTest, TrimStripsBothEnds) {
    EXPECT_EQ(trim("  \tvalue \n"), "value");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(ltrim("  x "), "x ");
    EXPECT_EQ(rtrim("  x "), "  x");
}

TEST(StringUtilsTest, SplitLinesKeepsTrailingEmptyLine) {
    EXPECT_TRUE(splitLines("").empty());

    const auto lines = splitLines("a\n\nb\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[2], "b");
    EXPECT_EQ(lines[3], "");
}

TEST(StringUtilsTest, SplitDropsEmptyFieldsUnlessAsked) {
    EXPECT_EQ(split("a,,b", ',').size(), 2u);
    EXPECT_EQ(split("a,,b", ',', true).size(), 3u);
}

TEST(StringUtilsTest, CountOccurrencesIsNonOverlapping) {
    EXPECT_EQ(countOccurrences("aaaa", "aa"), 2u);
    EXPECT_EQ(countOccurrences("if x: if y:", "if"), 2u);
    EXPECT_EQ(countOccurrences("abc", ""), 0u);
}

TEST(StringUtilsTest, EscapeJsonHandlesQuotesAndControls) {
    EXPECT_EQ(escapeJson("say \"hi\"\n"), "say \\\"hi\\\"\\n");
    EXPECT_EQ(escapeJson("a\\b"), "a\\\\b");
    EXPECT_EQ(escapeJson(std::string(1, '\x01')), "\\u0001");
}

TEST(StringUtilsTest, TruncateAppendsEllipsis) {
    EXPECT_EQ(CodeRisk::Utils::truncate("short", 10), "short");
    EXPECT_EQ(CodeRisk::Utils::truncate("abcdefgh", 3), "abc...");
}

TEST(StringUtilsTest, CollapseWhitespace) {
    EXPECT_EQ(collapseWhitespace("  a \t b\n\nc  "), "a b c");
}

TEST(StringUtilsTest, JoinAndCase) {
    EXPECT_EQ(join({"x", "y", "z"}, ", "), "x, y, z");
    EXPECT_EQ(join({}, ","), "");
    EXPECT_EQ(toLower("PyThOn"), "python");
    EXPECT_TRUE(startsWith("python.eval", "python."));
    EXPECT_TRUE(endsWith("main.py", ".py"));
}
