#pragma once

#include <chrono>
#include <cstdint>

#include "common/models.hpp"

namespace histscrub {

// Seconds between 1601-01-01 and 1970-01-01 (the Windows FILETIME epoch used
// by Chromium-derived history stores).
constexpr int64_t kChromiumEpochOffsetSeconds = 11644473600LL;
constexpr int64_t kMicrosPerSecond = 1000000LL;

// Converts a time window into per-epoch-family cutoffs. Pure integer
// arithmetic on whole seconds; `now` is truncated toward the epoch.
// Windows older than the Chromium epoch saturate to the unbounded set.
CutoffSet computeCutoffs(const TimeWindow &window, int64_t nowEpochSeconds);
CutoffSet computeCutoffs(const TimeWindow &window,
                         std::chrono::system_clock::time_point now);

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp);

// Inverse of the cutoff conversion: a stored timestamp in `family`'s unit
// and epoch, as whole seconds since 1970-01-01.
int64_t toUnixSeconds(EpochFamily family, int64_t storedValue);

} // namespace histscrub
