// =============================================================================
// UTF-8 Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include "ipaseg/util/utf8.hpp"

using namespace ipaseg::util;

class Utf8Test : public ::testing::Test {};

TEST_F(Utf8Test, DecodeAscii) {
    EXPECT_EQ(decode_utf8("pat"), U"pat");
    EXPECT_TRUE(decode_utf8("").empty());
}

TEST_F(Utf8Test, DecodeMultiByte) {
    // 2-byte (æ), 2-byte combining (U+0325), 3-byte (ⁿ), 4-byte (U+1F600)
    std::u32string cps = decode_utf8("\xC3\xA6\xCC\xA5\xE2\x81\xBF\xF0\x9F\x98\x80");
    ASSERT_EQ(cps.size(), 4u);
    EXPECT_EQ(cps[0], U'æ');
    EXPECT_EQ(cps[1], U'\u0325');
    EXPECT_EQ(cps[2], U'ⁿ');
    EXPECT_EQ(cps[3], U'\U0001F600');
}

TEST_F(Utf8Test, CombiningMarksStaySeparate) {
    // a + combining tilde is two codepoints, never composed
    std::u32string cps = decode_utf8("a\u0303");
    ASSERT_EQ(cps.size(), 2u);
    EXPECT_EQ(cps[0], U'a');
    EXPECT_EQ(cps[1], U'\u0303');
}

TEST_F(Utf8Test, LeadingBomDropped) {
    EXPECT_EQ(decode_utf8("\xEF\xBB\xBFp"), U"p");
}

TEST_F(Utf8Test, InvalidBytesBecomeReplacement) {
    std::u32string cps = decode_utf8("a\xFF" "b");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[0], U'a');
    EXPECT_EQ(cps[1], U'\uFFFD');
    EXPECT_EQ(cps[2], U'b');
}

TEST_F(Utf8Test, TruncatedSequence) {
    std::u32string cps = decode_utf8("\xE2\x81");
    ASSERT_FALSE(cps.empty());
    EXPECT_EQ(cps[0], U'\uFFFD');
}

TEST_F(Utf8Test, EncodeRoundTrip) {
    const std::string text = "k\u032Aʰⁿaˈ";
    EXPECT_EQ(encode_utf8(decode_utf8(text)), text);
    EXPECT_EQ(encode_utf8(U'ʰ'), "\xCA\xB0");
    EXPECT_EQ(encode_utf8(U'\U0001F600'), "\xF0\x9F\x98\x80");
}

TEST_F(Utf8Test, Whitespace) {
    EXPECT_TRUE(is_space(U' '));
    EXPECT_TRUE(is_space(U'\t'));
    EXPECT_TRUE(is_space(U'\n'));
    EXPECT_TRUE(is_space(U'\r'));
    EXPECT_TRUE(is_space(U'\u00A0'));
    EXPECT_TRUE(is_space(U'\u2009'));
    EXPECT_TRUE(is_space(U'\u3000'));

    EXPECT_FALSE(is_space(U'p'));
    EXPECT_FALSE(is_space(U'.'));
    EXPECT_FALSE(is_space(U'ˈ'));
    EXPECT_FALSE(is_space(U'\u200B'));  // zero width space is not White_Space
}

TEST_F(Utf8Test, FormatCodepoint) {
    EXPECT_EQ(format_codepoint(U'p'), "U+0070");
    EXPECT_EQ(format_codepoint(U'ʰ'), "U+02B0");
    EXPECT_EQ(format_codepoint(U'\U0001F600'), "U+1F600");
}

TEST_F(Utf8Test, ParseCodepoint) {
    EXPECT_EQ(parse_codepoint("U+0070"), U'p');
    EXPECT_EQ(parse_codepoint("u+2b0"), U'ʰ');
    EXPECT_EQ(parse_codepoint("0x0361"), U'\u0361');
    EXPECT_EQ(parse_codepoint("207F"), U'ⁿ');

    EXPECT_FALSE(parse_codepoint("").has_value());
    EXPECT_FALSE(parse_codepoint("U+").has_value());
    EXPECT_FALSE(parse_codepoint("U+XYZ").has_value());
    EXPECT_FALSE(parse_codepoint("110000").has_value());
    EXPECT_FALSE(parse_codepoint("1234567").has_value());
}
