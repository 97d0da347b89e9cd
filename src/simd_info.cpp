#include "lazycsv/simd_info.h"

#include "hwy/targets.h"

namespace lazycsv {

namespace {

// Targets this binary was compiled for that the CPU can run. Dynamic dispatch
// always picks from this set.
int64_t dispatchable_targets() {
  int64_t targets = hwy::SupportedTargets() & HWY_TARGETS;
  return targets != 0 ? targets : static_cast<int64_t>(HWY_STATIC_TARGET);
}

} // namespace

std::string simd_best_target() {
  int64_t targets = dispatchable_targets();
  // Lower bit positions are better targets, so best = lowest set bit.
  int64_t best = targets & -targets;
  return hwy::TargetName(best);
}

std::vector<std::string> simd_supported_targets() {
  std::vector<std::string> result;
  int64_t targets = dispatchable_targets();
  while (targets != 0) {
    int64_t lowest = targets & -targets;
    result.push_back(hwy::TargetName(lowest));
    targets &= targets - 1;
  }
  return result;
}

} // namespace lazycsv
