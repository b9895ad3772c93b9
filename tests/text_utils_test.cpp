#include <gtest/gtest.h>
#include "text_utils.hpp"
#include <chrono>

using namespace memory_core;

TEST(TextUtilsTest, LowercasesAscii) {
    EXPECT_EQ(utf8_lower("Hello WORLD 42"), "hello world 42");
}

TEST(TextUtilsTest, LowercasesCyrillic) {
    EXPECT_EQ(utf8_lower("ПОМОЩЬ"), "помощь");
    EXPECT_EQ(utf8_lower("Срочно Нужна"), "срочно нужна");
    EXPECT_EQ(utf8_lower("ЁЖ"), "ёж");
}

TEST(TextUtilsTest, LowercasesLatinAndGreek) {
    EXPECT_EQ(utf8_lower("ÄÖÜ"), "äöü");
    EXPECT_EQ(utf8_lower("ΑΒΓ"), "αβγ");
    EXPECT_EQ(utf8_lower("Ł"), "ł");
}

TEST(TextUtilsTest, MalformedBytesPassThrough) {
    std::string bad = "A\xFF" "B";
    EXPECT_EQ(utf8_lower(bad), "a\xFF" "b");
}

TEST(TextUtilsTest, CountsCodePoints) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    EXPECT_EQ(utf8_length("помощь"), 6u);
}

TEST(TextUtilsTest, PrefixNeverSplitsSequences) {
    EXPECT_EQ(utf8_prefix("помощь", 3), "пом");
    EXPECT_EQ(utf8_prefix("abc", 10), "abc");
    EXPECT_EQ(utf8_prefix("abc", 0), "");
}

TEST(TextUtilsTest, SplitsOnAnyWhitespace) {
    auto tokens = split_whitespace("  one\ttwo\n three  ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "one");
    EXPECT_EQ(tokens[1], "two");
    EXPECT_EQ(tokens[2], "three");
    EXPECT_TRUE(split_whitespace("   ").empty());
}

TEST(TextUtilsTest, SplitsOnUnicodeWhitespace) {
    // U+00A0 no-break space, U+3000 ideographic space, U+2009 thin space
    auto tokens = split_whitespace("срочно\u00A0помощь\u3000now\u2009later");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0], "срочно");
    EXPECT_EQ(tokens[1], "помощь");
    EXPECT_EQ(tokens[2], "now");
    EXPECT_EQ(tokens[3], "later");
    EXPECT_TRUE(split_whitespace("\u00A0\u3000 ").empty());
}

TEST(TextUtilsTest, SplitKeepsMalformedBytesInsideTokens) {
    auto tokens = split_whitespace("ab\xFF" "cd ef");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], "ab\xFF" "cd");
}

TEST(TextUtilsTest, HashIsStableFnv1a) {
    // Reference values of 64-bit FNV-1a
    EXPECT_EQ(hash64(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(hash64("a"), 0xaf63dc4c8601ec8cULL);
    EXPECT_NE(hash64("hello"), hash64("Hello"));
}

TEST(TextUtilsTest, HexIsSixteenLowercaseDigits) {
    EXPECT_EQ(hex64(0), "0000000000000000");
    EXPECT_EQ(hex64(0xABCDEFULL), "0000000000abcdef");
    EXPECT_EQ(hex64(hash64("text")).size(), 16u);
}

TEST(TextUtilsTest, CurrentTimestampParsesBack) {
    std::string ts = current_timestamp();
    EXPECT_EQ(ts.size(), 32u);
    EXPECT_EQ(ts.substr(26), "+00:00");

    auto parsed = parse_rfc3339(ts);
    ASSERT_TRUE(parsed.has_value());
    auto drift = std::chrono::system_clock::now() - *parsed;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(drift).count(), 5);
}

TEST(TextUtilsTest, ParsesRfc3339Variants) {
    auto epoch = parse_rfc3339("1970-01-01T00:00:00Z");
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(epoch->time_since_epoch().count(), 0);

    auto offset = parse_rfc3339("1970-01-01T02:00:00+02:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*offset, *epoch);

    auto fraction = parse_rfc3339("1970-01-01 00:00:01.5z");
    ASSERT_TRUE(fraction.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(fraction->time_since_epoch()).count(), 1500);

    auto later = parse_rfc3339("2000-01-01T00:00:00Z");
    ASSERT_TRUE(later.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(later->time_since_epoch()).count(), 946684800);
}

TEST(TextUtilsTest, RejectsInvalidTimestamps) {
    EXPECT_FALSE(parse_rfc3339("").has_value());
    EXPECT_FALSE(parse_rfc3339("not-a-timestamp").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-01T00:00:00").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-01T00:00:00.Z").has_value());
    EXPECT_FALSE(parse_rfc3339("2024-01-01T00:00:00Zjunk").has_value());
}
