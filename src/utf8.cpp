/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 decoding and validation.
 */

#include "lazycsv/utf8.h"

#include <cstring>

namespace lazycsv {

namespace {

// Decodes one sequence from p[0, avail). Sets len to the bytes the sequence
// claims (1 for a bad lead byte or a bad continuation) and returns false if
// the sequence is malformed.
bool decode_sequence(const uint8_t* p, size_t avail, uint32_t& codepoint, size_t& len) {
  uint8_t byte = p[0];

  // ASCII (0xxxxxxx)
  if ((byte & 0x80) == 0) {
    codepoint = byte;
    len = 1;
    return true;
  }

  uint32_t cp;
  if ((byte & 0xE0) == 0xC0) {
    // Two-byte sequence (110xxxxx)
    len = 2;
    cp = byte & 0x1F;
  } else if ((byte & 0xF0) == 0xE0) {
    // Three-byte sequence (1110xxxx)
    len = 3;
    cp = byte & 0x0F;
  } else if ((byte & 0xF8) == 0xF0) {
    // Four-byte sequence (11110xxx)
    len = 4;
    cp = byte & 0x07;
  } else {
    // Invalid leading byte or stray continuation byte
    len = 1;
    return false;
  }

  if (len > avail) {
    len = 1;
    return false;
  }

  // Continuation bytes (10xxxxxx)
  for (size_t i = 1; i < len; ++i) {
    uint8_t cont = p[i];
    if ((cont & 0xC0) != 0x80) {
      len = 1;
      return false;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  // Overlong encodings
  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
    return false;
  }

  // Surrogates and values past the Unicode range
  if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    return false;
  }

  codepoint = cp;
  return true;
}

constexpr uint64_t HIGH_BITS = 0x8080808080808080ULL;

} // namespace

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
  if (pos >= str.size()) {
    codepoint = 0xFFFD; // Replacement character
    return 0;
  }

  size_t len = 0;
  const uint8_t* p = reinterpret_cast<const uint8_t*>(str.data()) + pos;
  if (!decode_sequence(p, str.size() - pos, codepoint, len)) {
    codepoint = 0xFFFD;
  }
  return len;
}

size_t utf8_validate(const uint8_t* data, size_t len) {
  size_t pos = 0;

  while (pos < len) {
    // Word-at-a-time skip over pure ASCII
    while (len - pos >= 8) {
      uint64_t word;
      std::memcpy(&word, data + pos, sizeof(word));
      if ((word & HIGH_BITS) != 0) {
        break;
      }
      pos += 8;
    }
    if (pos >= len) {
      break;
    }

    if (data[pos] < 0x80) {
      ++pos;
      continue;
    }

    uint32_t cp;
    size_t seq_len = 0;
    if (!decode_sequence(data + pos, len - pos, cp, seq_len)) {
      return pos;
    }
    pos += seq_len;
  }

  return len;
}

} // namespace lazycsv
