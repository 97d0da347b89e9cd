// Boundary scanner using Google Highway.
//
// This file uses Highway's dynamic dispatch to select the optimal
// implementation at runtime based on CPU capabilities.

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "parser/boundary_scanner-inl.h"
#include "hwy/foreach_target.h"
#include "parser/boundary_scanner-inl.h"

// Generate dispatch tables and public API (only once)
#if HWY_ONCE

#include "lazycsv/boundary_scanner.h"

namespace lazycsv {

HWY_EXPORT(ScanBlockImpl);
HWY_EXPORT(FindNextOfImpl);

std::optional<size_t> find_next_of(const uint8_t* buf, size_t len, size_t from, uint8_t a,
                                   uint8_t b, uint8_t c) {
  if (from >= len) {
    return std::nullopt;
  }
  const size_t remaining = len - from;
  const size_t rel = HWY_DYNAMIC_DISPATCH(FindNextOfImpl)(buf + from, remaining, a, b, c);
  if (rel == remaining) {
    return std::nullopt;
  }
  return from + rel;
}

uint64_t scan_block_for_chars(const uint8_t* block, uint8_t a, uint8_t b, uint8_t c) {
  return HWY_DYNAMIC_DISPATCH(ScanBlockImpl)(block, a, b, c);
}

} // namespace lazycsv

#endif // HWY_ONCE
