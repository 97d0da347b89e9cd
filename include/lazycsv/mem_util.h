/**
 * @file mem_util.h
 * @brief Portable aligned memory allocation.
 *
 * Memory from aligned_malloc() must be released with aligned_free(), never
 * with free() or delete.
 *
 * @see FileBuffer in io_util.h for RAII ownership.
 */

#ifndef LAZYCSV_MEM_UTIL_H
#define LAZYCSV_MEM_UTIL_H

#include <stdlib.h>

namespace lazycsv {

/// Allocate size bytes aligned to alignment (a power of two). Returns nullptr on failure.
static inline void* aligned_malloc(size_t alignment, size_t size) {
  void* p;
#ifdef _MSC_VER
  p = _aligned_malloc(size, alignment);
#elif defined(__MINGW32__) || defined(__MINGW64__)
  p = __mingw_aligned_malloc(size, alignment);
#else
  // posix_memalign may return a unique pointer or null for size 0
  if (posix_memalign(&p, alignment, size == 0 ? 1 : size) != 0) { return nullptr; }
#endif
  return p;
}

static inline void aligned_free(void* memblock) {
  if (memblock == nullptr) { return; }
#ifdef _MSC_VER
  _aligned_free(memblock);
#elif defined(__MINGW32__) || defined(__MINGW64__)
  __mingw_aligned_free(memblock);
#else
  free(memblock);
#endif
}

} // namespace lazycsv

#endif // LAZYCSV_MEM_UTIL_H
