#include <gtest/gtest.h>

#include <string>

#include "util/sha256.hpp"
#include "util/utf8.hpp"
#include "util/uuid.hpp"

namespace utf8 = kbindexer::utf8;

TEST(Utf8Test, LengthCountsCodePoints) {
    EXPECT_EQ(utf8::length(""), 0u);
    EXPECT_EQ(utf8::length("abc"), 3u);
    EXPECT_EQ(utf8::length("caf\xC3\xA9"), 4u);
    EXPECT_EQ(utf8::length("\xE6\x97\xA5\xE6\x9C\xAC"), 2u);     // two CJK characters
    EXPECT_EQ(utf8::length("\xF0\x9F\x98\x80!"), 2u);            // emoji then '!'
}

TEST(Utf8Test, OffsetsEndWithSentinel) {
    const std::string text = "a\xC3\xA9z";
    const auto offsets = utf8::code_point_offsets(text);
    ASSERT_EQ(offsets.size(), 4u);
    EXPECT_EQ(offsets[0], 0u);
    EXPECT_EQ(offsets[1], 1u);
    EXPECT_EQ(offsets[2], 3u);
    EXPECT_EQ(offsets[3], text.size());
}

TEST(Utf8Test, MalformedBytesCountOnceEach) {
    EXPECT_FALSE(utf8::is_valid("ab\xFF"));
    EXPECT_FALSE(utf8::is_valid("\xC3"));
    EXPECT_EQ(utf8::length("ab\xFF\xFE"), 4u);
    EXPECT_TRUE(utf8::is_valid("plain ascii"));
}

TEST(Utf8Test, DecodeReplacesMalformedBytes) {
    EXPECT_EQ(utf8::decode("caf\xC3\xA9"), U"caf\u00E9");
    EXPECT_EQ(utf8::decode("\xE6\x97\xA5"), U"\u65E5");
    EXPECT_EQ(utf8::decode("a\xFF" "b"), U"a\uFFFD" U"b");
    EXPECT_TRUE(utf8::decode("").empty());
}

TEST(Utf8Test, BlankUsesUnicodeWhitespace) {
    EXPECT_TRUE(utf8::is_blank(""));
    EXPECT_TRUE(utf8::is_blank(" \t\r\n\v\f"));
    EXPECT_TRUE(utf8::is_blank("\xC2\xA0"));
    EXPECT_TRUE(utf8::is_blank("\xE3\x80\x80\xE2\x80\xA8\xE2\x80\xAF"));
    EXPECT_FALSE(utf8::is_blank("a\xC2\xA0"));
    EXPECT_FALSE(utf8::is_blank("\xE2\x80\x8B"));  // zero width space
    EXPECT_FALSE(utf8::is_blank("\xFF"));

    EXPECT_TRUE(utf8::is_whitespace(U'\u0085'));
    EXPECT_TRUE(utf8::is_whitespace(U'\u001F'));
    EXPECT_FALSE(utf8::is_whitespace(U'\u200B'));
}

TEST(Utf8Test, Latin1Conversion) {
    EXPECT_EQ(utf8::from_latin1("caf\xE9"), "caf\xC3\xA9");
    EXPECT_EQ(utf8::from_latin1("plain"), "plain");
}

TEST(Sha256Test, KnownDigests) {
    EXPECT_EQ(kbindexer::sha256::hex_digest(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(kbindexer::sha256::hex_digest("hello"),
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(UuidTest, GeneratesVersion4) {
    const auto first = kbindexer::uuid::generate();
    const auto second = kbindexer::uuid::generate();
    ASSERT_EQ(first.size(), 36u);
    EXPECT_EQ(first[8], '-');
    EXPECT_EQ(first[14], '4');
    EXPECT_NE(first, second);
}
