#include "engine/epoch_normalizer.hpp"

#include <limits>

namespace histscrub {

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

int64_t toUnixSeconds(EpochFamily family, int64_t storedValue)
{
    switch (family) {
    case EpochFamily::ChromiumMicros1601:
        return storedValue / kMicrosPerSecond - kChromiumEpochOffsetSeconds;
    case EpochFamily::GeckoMicros1970:
        return storedValue / kMicrosPerSecond;
    case EpochFamily::WebKitSeconds1970:
        return storedValue;
    }
    return storedValue;
}

CutoffSet computeCutoffs(const TimeWindow &window, int64_t nowEpochSeconds)
{
    CutoffSet cutoffs;
    // A window reaching back past 1601-01-01 covers every representable
    // visit in every family, so it is treated as AllTime.
    if (window.isAllTime()
        || window.seconds() > nowEpochSeconds + kChromiumEpochOffsetSeconds) {
        constexpr int64_t kFloor = std::numeric_limits<int64_t>::min();
        cutoffs.chromiumMicros1601 = kFloor;
        cutoffs.geckoMicros1970 = kFloor;
        cutoffs.webkitSeconds1970 = kFloor;
        cutoffs.unbounded = true;
        return cutoffs;
    }

    const int64_t cutoffSeconds = nowEpochSeconds - window.seconds();
    cutoffs.chromiumMicros1601 =
        (cutoffSeconds + kChromiumEpochOffsetSeconds) * kMicrosPerSecond;
    cutoffs.geckoMicros1970 = cutoffSeconds * kMicrosPerSecond;
    cutoffs.webkitSeconds1970 = cutoffSeconds;
    cutoffs.unbounded = false;
    return cutoffs;
}

CutoffSet computeCutoffs(const TimeWindow &window,
                         std::chrono::system_clock::time_point now)
{
    return computeCutoffs(window, toEpochSeconds(now));
}

} // namespace histscrub
