#include <gtest/gtest.h>
#include <limits>
#include "liveline/common/text.hpp"

using namespace liveline::common;

TEST(TextTest, EncodesCodepointsAcrossPlanes) {
    EXPECT_EQ(encodeUtf8(U'A'), "A");
    EXPECT_EQ(encodeUtf8(U'\u00e9'), "\xC3\xA9");
    EXPECT_EQ(encodeUtf8(U'\u2705'), "\xE2\x9C\x85");
    EXPECT_EQ(encodeUtf8(U'\U0001F55C'), "\xF0\x9F\x95\x9C");
}

TEST(TextTest, ReplaceNonBmpKeepsBasicPlane) {
    std::string text = "Done! \xE2\x9C\x85 caf\xC3\xA9";
    EXPECT_EQ(replaceNonBmp(text), text);
}

TEST(TextTest, ReplaceNonBmpSubstitutesAstralCharacters) {
    std::string clock = encodeUtf8(U'\U0001F55C');
    EXPECT_EQ(replaceNonBmp("a" + clock + "b"), "a\xEF\xBF\xBD" "b");
}

TEST(TextTest, ReplaceNonBmpSubstitutesMalformedBytes) {
    EXPECT_EQ(replaceNonBmp("x\xFFy"), "x\xEF\xBF\xBDy");
    EXPECT_EQ(replaceNonBmp("x\xE2\x9C"), "x\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(TextTest, FormatsClock) {
    EXPECT_EQ(formatClock(0), "00:00:00");
    EXPECT_EQ(formatClock(59.9), "00:00:59");
    EXPECT_EQ(formatClock(3725), "01:02:05");
    EXPECT_EQ(formatClock(-4), "00:00:00");
}

TEST(TextTest, FormatClockCapsUnboundedDurations) {
    EXPECT_EQ(formatClock(1e12), "277777777:46:40");
    EXPECT_EQ(formatClock(1e22), "277777777:46:40");
    EXPECT_EQ(formatClock(std::numeric_limits<double>::infinity()), "277777777:46:40");
    EXPECT_EQ(formatClock(std::numeric_limits<double>::quiet_NaN()), "00:00:00");
}

TEST(TextTest, SplitsLinesOnAnyTerminator) {
    auto lines = splitLines("one\ntwo\r\nthree\rfour");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
    EXPECT_EQ(lines[3], "four");
}

TEST(TextTest, SplitLinesDropsTrailingTerminator) {
    auto lines = splitLines("only\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "only");
    EXPECT_TRUE(splitLines("").empty());
}

TEST(TextTest, DetectsBlankText) {
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\n"));
    EXPECT_FALSE(isBlank("  x "));
}

TEST(TextTest, BaseName) {
    EXPECT_EQ(baseName("/usr/src/liveline/demo.cpp"), "demo.cpp");
    EXPECT_EQ(baseName("C:\\work\\main.cpp"), "main.cpp");
    EXPECT_EQ(baseName("plain.cpp"), "plain.cpp");
}
