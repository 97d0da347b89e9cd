/**
 * @file boundary_scanner.h
 * @brief Vectorized search for the next structural byte.
 *
 * The scanner answers one question: starting at a cursor, where is the next
 * byte that belongs to a small set (separator, newline, quote)? Full 64-byte
 * blocks are classified with Google Highway vector compares into a bitmask,
 * the first set bit is found with count-trailing-zeros, and only the final
 * partial block falls back to a scalar loop.
 *
 * The scanner never reads at or beyond buf + len, so buffers need no padding.
 * All functions are pure and may be called concurrently on the same buffer.
 */

#ifndef LAZYCSV_BOUNDARY_SCANNER_H
#define LAZYCSV_BOUNDARY_SCANNER_H

#include <cstddef>
#include <cstdint>
#include <optional>

namespace lazycsv {

/**
 * @brief Find the first byte in [from, len) equal to a, b or c.
 *
 * @param buf  Start of the buffer.
 * @param len  Length of the buffer; nothing at or past buf + len is read.
 * @param from Offset to start searching at. Values >= len find nothing.
 * @return Absolute offset of the match, or std::nullopt.
 */
std::optional<size_t> find_next_of(const uint8_t* buf, size_t len, size_t from, uint8_t a,
                                   uint8_t b, uint8_t c);

inline std::optional<size_t> find_next_of(const uint8_t* buf, size_t len, size_t from, uint8_t a,
                                          uint8_t b) {
  return find_next_of(buf, len, from, a, b, b);
}

inline std::optional<size_t> find_next_of(const uint8_t* buf, size_t len, size_t from,
                                          uint8_t a) {
  return find_next_of(buf, len, from, a, a, a);
}

/**
 * @brief Bitmask of positions in one 64-byte block equal to a, b or c.
 *
 * Bit i is set when block[i] matches. block must have 64 readable bytes.
 */
uint64_t scan_block_for_chars(const uint8_t* block, uint8_t a, uint8_t b, uint8_t c);

} // namespace lazycsv

#endif // LAZYCSV_BOUNDARY_SCANNER_H
