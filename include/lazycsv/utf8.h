/**
 * @file utf8.h
 * @brief UTF-8 decoding and validation used by the cell decoder.
 *
 * Validation follows RFC 3629: overlong encodings, surrogates (U+D800 to
 * U+DFFF), code points above U+10FFFF and truncated sequences are rejected.
 */

#ifndef LAZYCSV_UTF8_H
#define LAZYCSV_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lazycsv {

/**
 * @brief Decode a UTF-8 sequence starting at the given position.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] codepoint The decoded code point (0xFFFD for invalid sequences)
 * @return The number of bytes consumed (1-4, 1 for invalid lead bytes, 0 at end)
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/**
 * @brief Find the first byte that is not part of a well-formed sequence.
 *
 * Runs of ASCII are skipped eight bytes at a time.
 *
 * @return len when the whole range is valid, otherwise the offset of the
 *         first byte of the offending sequence.
 */
size_t utf8_validate(const uint8_t* data, size_t len);

inline bool is_valid_utf8(const uint8_t* data, size_t len) {
  return utf8_validate(data, len) == len;
}

inline bool is_valid_utf8(std::string_view str) {
  return is_valid_utf8(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

} // namespace lazycsv

#endif // LAZYCSV_UTF8_H
