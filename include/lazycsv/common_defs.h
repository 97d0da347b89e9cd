#ifndef LAZYCSV_COMMON_DEFS_H
#define LAZYCSV_COMMON_DEFS_H

#include <cstdint>

// Width of one scanner block. Masks are built 64 bytes at a time so that a
// single uint64_t holds one bit per input byte.
#define LAZYCSV_BLOCK_SIZE 64

#ifdef _MSC_VER

#include <intrin.h>

#define really_inline inline
#define never_inline __declspec(noinline)

#ifndef likely
#define likely(x) x
#endif
#ifndef unlikely
#define unlikely(x) x
#endif

inline unsigned long lazycsv_ctz64_msvc(uint64_t x) {
  unsigned long index;
  _BitScanForward64(&index, x);
  return index;
}
#define LAZYCSV_CTZ64(x) lazycsv_ctz64_msvc(x)

#else

#define really_inline inline __attribute__((always_inline, unused))
#define never_inline inline __attribute__((noinline, unused))

#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif

// Undefined for x == 0; callers test the mask first.
#define LAZYCSV_CTZ64(x) __builtin_ctzll(x)

#endif  // _MSC_VER

#endif  // LAZYCSV_COMMON_DEFS_H
