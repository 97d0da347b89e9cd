// Boundary scanner kernels using Google Highway.
//
// This file is included multiple times by boundary_scanner.cpp with different
// SIMD targets defined by Highway's foreach_target.h mechanism.

#include "lazycsv/common_defs.h"

#include "hwy/highway.h"

#include <cstddef>
#include <cstdint>

HWY_BEFORE_NAMESPACE();
namespace lazycsv {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// Classify 64 bytes against three needles. Lanes are capped at 64 so wide
// targets (SVE, RVV) never load past the block.
HWY_INLINE uint64_t BlockMask(const uint8_t* HWY_RESTRICT block, uint8_t a, uint8_t b,
                              uint8_t c) {
  const hn::CappedTag<uint8_t, LAZYCSV_BLOCK_SIZE> d;
  const size_t N = hn::Lanes(d);
  const auto va = hn::Set(d, a);
  const auto vb = hn::Set(d, b);
  const auto vc = hn::Set(d, c);

  uint64_t result = 0;

  for (size_t chunk = 0; chunk < LAZYCSV_BLOCK_SIZE; chunk += N) {
    const auto bytes = hn::LoadU(d, block + chunk);
    const auto match = hn::Or(hn::Or(hn::Eq(bytes, va), hn::Eq(bytes, vb)), hn::Eq(bytes, vc));

    uint8_t mask_bytes[LAZYCSV_BLOCK_SIZE / 8] = {0};
    hn::StoreMaskBits(d, match, mask_bytes);

    const size_t num_mask_bytes = (N + 7) / 8;
    for (size_t i = 0; i < num_mask_bytes; ++i) {
      const size_t bit_offset = chunk + i * 8;
      if (bit_offset < LAZYCSV_BLOCK_SIZE) {
        result |= static_cast<uint64_t>(mask_bytes[i]) << bit_offset;
      }
    }
  }

  return result;
}

HWY_NOINLINE uint64_t ScanBlockImpl(const uint8_t* block, uint8_t a, uint8_t b, uint8_t c) {
  return BlockMask(block, a, b, c);
}

// Returns the offset of the first match in data[0, len), or len.
HWY_NOINLINE size_t FindNextOfImpl(const uint8_t* data, size_t len, uint8_t a, uint8_t b,
                                   uint8_t c) {
  size_t pos = 0;

  while (len - pos >= LAZYCSV_BLOCK_SIZE) {
    const uint64_t mask = BlockMask(data + pos, a, b, c);
    if (mask != 0) {
      return pos + static_cast<size_t>(LAZYCSV_CTZ64(mask));
    }
    pos += LAZYCSV_BLOCK_SIZE;
  }

  // Scalar tail, shorter than one block
  for (; pos < len; ++pos) {
    const uint8_t byte = data[pos];
    if (byte == a || byte == b || byte == c) {
      return pos;
    }
  }

  return len;
}

} // namespace HWY_NAMESPACE
} // namespace lazycsv
HWY_AFTER_NAMESPACE();
