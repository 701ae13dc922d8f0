#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace histscrub {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toBrowserString(Browser browser)
{
    switch (browser) {
    case Browser::Chrome:
        return "Chrome";
    case Browser::Brave:
        return "Brave";
    case Browser::Firefox:
        return "Firefox";
    case Browser::Safari:
        return "Safari";
    }
    return "Chrome";
}

inline std::optional<Browser> parseBrowserString(const std::string &value)
{
    if (value == "chrome" || value == "Chrome") {
        return Browser::Chrome;
    }
    if (value == "brave" || value == "Brave") {
        return Browser::Brave;
    }
    if (value == "firefox" || value == "Firefox") {
        return Browser::Firefox;
    }
    if (value == "safari" || value == "Safari") {
        return Browser::Safari;
    }
    return std::nullopt;
}

inline SchemaFamily familyOf(Browser browser)
{
    switch (browser) {
    case Browser::Chrome:
    case Browser::Brave:
        return SchemaFamily::Chromium;
    case Browser::Firefox:
        return SchemaFamily::Gecko;
    case Browser::Safari:
        return SchemaFamily::WebKit;
    }
    return SchemaFamily::Chromium;
}

inline std::string toFamilyString(SchemaFamily family)
{
    switch (family) {
    case SchemaFamily::Chromium:
        return "chromium";
    case SchemaFamily::Gecko:
        return "gecko";
    case SchemaFamily::WebKit:
        return "webkit";
    }
    return "chromium";
}

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::ProfileNotFound:
        return "ProfileNotFound";
    case ErrorKind::SchemaMismatch:
        return "SchemaMismatch";
    case ErrorKind::BackupFailed:
        return "BackupFailed";
    case ErrorKind::CopyFailed:
        return "CopyFailed";
    case ErrorKind::DeleteFailed:
        return "DeleteFailed";
    case ErrorKind::CompactFailed:
        return "CompactFailed";
    case ErrorKind::SwapFailed:
        return "SwapFailed";
    case ErrorKind::RestoreFailed:
        return "RestoreFailed";
    case ErrorKind::ReadFailed:
        return "ReadFailed";
    }
    return "DeleteFailed";
}

inline std::string toStateString(MutationState state)
{
    switch (state) {
    case MutationState::Idle:
        return "idle";
    case MutationState::BackedUp:
        return "backed_up";
    case MutationState::WorkingCopyOpen:
        return "working_copy_open";
    case MutationState::CountedAffected:
        return "counted_affected";
    case MutationState::Deleted:
        return "deleted";
    case MutationState::Committed:
        return "committed";
    case MutationState::Compacted:
        return "compacted";
    case MutationState::Swapped:
        return "swapped";
    case MutationState::BackupRemoved:
        return "backup_removed";
    case MutationState::Done:
        return "done";
    case MutationState::Failed:
        return "failed";
    }
    return "failed";
}

inline void to_json(nlohmann::json &j, const Browser &browser)
{
    j = toBrowserString(browser);
}

inline void to_json(nlohmann::json &j, const ErrorKind &kind)
{
    j = toErrorKindString(kind);
}

inline void to_json(nlohmann::json &j, const MutationResult &result)
{
    j = nlohmann::json{
        {"rowsRemoved", result.rowsRemoved},
        {"succeeded", result.succeeded},
        {"finalState", toStateString(result.finalState)},
        {"restoreAttempted", result.restoreAttempted},
        {"warnings", result.warnings}
    };
    if (result.errorKind.has_value()) {
        j["errorKind"] = *result.errorKind;
    }
    if (result.errorDetail.has_value()) {
        j["errorDetail"] = *result.errorDetail;
    }
    if (!result.backupRetained.empty()) {
        j["backupRetained"] = result.backupRetained.string();
    }
}

inline void to_json(nlohmann::json &j, const StoreError &error)
{
    j = nlohmann::json{
        {"browser", error.browser},
        {"family", toFamilyString(familyOf(error.browser))},
        {"profile", error.profileLabel},
        {"storePath", error.storePath.string()},
        {"kind", error.kind},
        {"detail", error.detail}
    };
}

inline void to_json(nlohmann::json &j, const SkippedStore &skipped)
{
    j = nlohmann::json{
        {"browser", skipped.browser},
        {"profile", skipped.profileLabel},
        {"storePath", skipped.storePath.string()},
        {"reason", skipped.reason}
    };
}

inline void to_json(nlohmann::json &j, const SweepWarning &warning)
{
    j = nlohmann::json{
        {"browser", warning.browser},
        {"profile", warning.profileLabel},
        {"path", warning.path.string()},
        {"detail", warning.detail}
    };
}

inline void to_json(nlohmann::json &j, const HistoryEntry &entry)
{
    j = nlohmann::json{
        {"browser", entry.browser},
        {"profile", entry.profileLabel},
        {"url", entry.url},
        {"visitedAt", toIso8601Utc(std::chrono::system_clock::time_point(
                          std::chrono::seconds(entry.visitedAt)))},
        {"visitedAtEpoch", entry.visitedAt}
    };
}

inline void to_json(nlohmann::json &j, const InspectReport &report)
{
    j = nlohmann::json{
        {"entries", report.entries},
        {"storesRead", report.storesRead},
        {"absent", report.absent},
        {"errors", report.errors},
        {"warnings", report.warnings}
    };
}

inline void to_json(nlohmann::json &j, const SweepSummary &summary)
{
    j = nlohmann::json{
        {"browsersCleaned", summary.browsersCleaned},
        {"historyRowsRemoved", summary.historyRowsRemoved},
        {"cacheBytesFreed", summary.cacheBytesFreed},
        {"storesProcessed", summary.storesProcessed},
        {"absent", summary.absent},
        {"skipped", summary.skipped},
        {"errors", summary.errors},
        {"warnings", summary.warnings},
        {"cacheFailures", summary.cacheFailures},
        {"restoreFailure", summary.hasRestoreFailure()}
    };
}

} // namespace histscrub
