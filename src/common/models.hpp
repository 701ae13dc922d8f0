#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace histscrub {

// TimeWindow selects which visits are pruned: every visit (AllTime) or
// only the most recent N hours. Immutable once built.
class TimeWindow {
public:
    // Largest window whose length in seconds fits an int64_t.
    static constexpr int64_t kMaxHours = std::numeric_limits<int64_t>::max() / 3600;

    static TimeWindow allTime();
    // Throws std::invalid_argument when hours <= 0 or hours > kMaxHours.
    static TimeWindow relativeHours(int64_t hours);

    static TimeWindow lastHour() { return relativeHours(1); }
    static TimeWindow lastDay() { return relativeHours(24); }
    static TimeWindow lastWeek() { return relativeHours(168); }

    bool isAllTime() const { return m_hours == 0; }
    int64_t hours() const { return m_hours; }
    int64_t seconds() const { return m_hours * 3600; }

    std::string describe() const;

    bool operator==(const TimeWindow &other) const { return m_hours == other.m_hours; }
    bool operator!=(const TimeWindow &other) const { return !(*this == other); }

private:
    explicit TimeWindow(int64_t hours)
        : m_hours(hours)
    {
    }

    int64_t m_hours = 0;
};

struct CutoffSet {
    int64_t chromiumMicros1601 = 0;
    int64_t geckoMicros1970 = 0;
    int64_t webkitSeconds1970 = 0;
    // Set for AllTime: no time filter, every visit is affected.
    bool unbounded = false;

    int64_t valueFor(EpochFamily family) const;
};

struct StoreTarget {
    Browser browser = Browser::Chrome;
    std::string profileLabel;
    std::filesystem::path storePath;
};

// One cache directory to sweep. Independent of whether the profile it
// belongs to has a history store.
struct CacheTarget {
    Browser browser = Browser::Chrome;
    // Profile directory name, or "system" for a per-user cache root.
    std::string profileLabel;
    std::filesystem::path dir;
};

struct MutationResult {
    int64_t rowsRemoved = 0;
    bool succeeded = false;
    std::optional<std::string> errorDetail;
    std::optional<ErrorKind> errorKind;

    MutationState finalState = MutationState::Idle;
    std::filesystem::path backupRetained;
    bool restoreAttempted = false;
    std::vector<std::string> warnings;
};

struct StoreError {
    Browser browser = Browser::Chrome;
    std::string profileLabel;
    std::filesystem::path storePath;
    ErrorKind kind = ErrorKind::DeleteFailed;
    std::string detail;
};

struct SkippedStore {
    Browser browser = Browser::Chrome;
    std::string profileLabel;
    std::filesystem::path storePath;
    std::string reason;
};

// Something that went wrong without failing the store or cache it concerns.
struct SweepWarning {
    Browser browser = Browser::Chrome;
    std::string profileLabel;
    std::filesystem::path path;
    std::string detail;
};

struct CacheSweepResult {
    uint64_t bytesFreed = 0;
    uint64_t filesRemoved = 0;
    uint64_t failures = 0;
};

// One visit as listed by the read-only inspector.
struct HistoryEntry {
    Browser browser = Browser::Chrome;
    std::string profileLabel;
    std::string url;
    // Seconds since 1970-01-01 UTC.
    int64_t visitedAt = 0;
};

struct InspectReport {
    // Newest first across every store read, at most the requested limit.
    std::vector<HistoryEntry> entries;
    int storesRead = 0;
    std::vector<Browser> absent;
    std::vector<StoreError> errors;
    std::vector<SweepWarning> warnings;
};

struct SweepSummary {
    std::vector<Browser> browsersCleaned;
    int64_t historyRowsRemoved = 0;
    uint64_t cacheBytesFreed = 0;
    int storesProcessed = 0;
    std::vector<Browser> absent;
    std::vector<SkippedStore> skipped;
    std::vector<StoreError> errors;
    std::vector<SweepWarning> warnings;
    // Cache files that could not be removed, summed over every directory.
    uint64_t cacheFailures = 0;

    bool hasErrors() const { return !errors.empty(); }
    bool hasRestoreFailure() const;
    void markCleaned(Browser browser);
};

} // namespace histscrub
