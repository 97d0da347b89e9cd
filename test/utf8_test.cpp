/**
 * @file utf8_test.cpp
 * @brief Tests for UTF-8 decoding and validation.
 */

#include "lazycsv/utf8.h"

#include <gtest/gtest.h>

#include <string>

using namespace lazycsv;

class Utf8Test : public ::testing::Test {
protected:
  static size_t validate(const std::string& s) {
    return utf8_validate(reinterpret_cast<const uint8_t*>(s.data()), s.size());
  }
};

// =============================================================================
// UTF-8 Decode Tests
// =============================================================================

TEST_F(Utf8Test, DecodeAscii) {
  uint32_t cp;
  std::string_view str = "AB";
  EXPECT_EQ(utf8_decode(str, 0, cp), 1u);
  EXPECT_EQ(cp, 'A');
  EXPECT_EQ(utf8_decode(str, 1, cp), 1u);
  EXPECT_EQ(cp, 'B');
}

TEST_F(Utf8Test, DecodeMultiByte) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\xc3\xb1", 0, cp), 2u);  // ñ
  EXPECT_EQ(cp, 0x00F1u);
  EXPECT_EQ(utf8_decode("\xe2\x82\xac", 0, cp), 3u);  // €
  EXPECT_EQ(cp, 0x20ACu);
  EXPECT_EQ(utf8_decode("\xf0\x9f\x98\x80", 0, cp), 4u);  // 😀
  EXPECT_EQ(cp, 0x1F600u);
}

TEST_F(Utf8Test, DecodeAtEnd) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("a", 1, cp), 0u);
  EXPECT_EQ(cp, 0xFFFDu);
}

TEST_F(Utf8Test, DecodeInvalidLeadByte) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\x80x", 0, cp), 1u);
  EXPECT_EQ(cp, 0xFFFDu);
}

TEST_F(Utf8Test, DecodeTruncatedSequence) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("\xe2\x82", 0, cp), 1u);
  EXPECT_EQ(cp, 0xFFFDu);
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST_F(Utf8Test, ValidInputs) {
  EXPECT_TRUE(is_valid_utf8(""));
  EXPECT_TRUE(is_valid_utf8("plain ascii text that is longer than eight bytes"));
  EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80"));
  EXPECT_TRUE(is_valid_utf8("\xef\xbf\xbf"));      // U+FFFF
  EXPECT_TRUE(is_valid_utf8("\xf4\x8f\xbf\xbf"));  // U+10FFFF
}

TEST_F(Utf8Test, RejectsStrayContinuation) {
  EXPECT_EQ(validate("ab\x80"), 2u);
}

TEST_F(Utf8Test, RejectsOverlongEncodings) {
  EXPECT_EQ(validate("\xc0\xaf"), 0u);
  EXPECT_EQ(validate("x\xe0\x80\xaf"), 1u);
  EXPECT_EQ(validate("\xf0\x80\x80\xaf"), 0u);
}

TEST_F(Utf8Test, RejectsSurrogates) {
  EXPECT_EQ(validate("\xed\xa0\x80"), 0u);  // U+D800
  EXPECT_EQ(validate("\xed\xbf\xbf"), 0u);  // U+DFFF
}

TEST_F(Utf8Test, RejectsBeyondUnicodeRange) {
  EXPECT_EQ(validate("\xf4\x90\x80\x80"), 0u);  // U+110000
  EXPECT_EQ(validate("\xf8\x88\x80\x80\x80"), 0u);
}

TEST_F(Utf8Test, RejectsTruncatedAtEnd) {
  EXPECT_EQ(validate("abc\xe2\x82"), 3u);
}

TEST_F(Utf8Test, ReportsOffsetAfterLongAsciiRun) {
  std::string s(37, 'a');
  s += "\xff";
  s += "tail";
  EXPECT_EQ(validate(s), 37u);
}

TEST_F(Utf8Test, MultiByteAfterAsciiWord) {
  std::string s = "12345678\xc3\xa9" "12345678";
  EXPECT_EQ(validate(s), s.size());
}
