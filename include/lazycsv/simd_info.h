#ifndef LAZYCSV_SIMD_INFO_H
#define LAZYCSV_SIMD_INFO_H

#include <string>
#include <vector>

namespace lazycsv {

/// Returns the name of the best SIMD target Highway can dispatch to on this CPU.
/// Examples: "AVX2", "AVX3", "NEON", "SSE4", "EMU128"
std::string simd_best_target();

/// Returns names of all compiled SIMD targets this CPU can run, best first.
std::vector<std::string> simd_supported_targets();

} // namespace lazycsv

#endif // LAZYCSV_SIMD_INFO_H
