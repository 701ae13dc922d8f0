#include "engine/sweep_orchestrator.hpp"

#include <exception>

#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/epoch_normalizer.hpp"

namespace histscrub {

namespace {

nlohmann::json targetContext(const StoreTarget &target)
{
    return nlohmann::json{{"browser", toBrowserString(target.browser)},
                          {"family", toFamilyString(familyOf(target.browser))},
                          {"profile", target.profileLabel},
                          {"store", target.storePath.string()}};
}

} // namespace

SweepOrchestrator::SweepOrchestrator(const ProfileLocator &locator)
    : m_locator(locator)
{
}

SweepOrchestrator::SweepOrchestrator(const ProfileLocator &locator, StoreFileOps &fileOps)
    : m_locator(locator)
    , m_mutator(fileOps)
{
}

SweepSummary SweepOrchestrator::run(const SweepOptions &options)
{
    const auto now = options.now.value_or(std::chrono::system_clock::now());
    const CutoffSet cutoffs = computeCutoffs(options.window, now);

    HSLOG_INFO(QStringLiteral("SweepOrchestrator"),
               QStringLiteral("run"),
               QStringLiteral("sweep_start"),
               QStringLiteral("user_request"),
               QStringLiteral("sequential_stores"),
               ::histscrub::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"browsers", options.browsers},
                               {"history", options.cleanHistory},
                               {"cache", options.cleanCache},
                               {"window", options.window.describe()},
                               {"now", toIso8601Utc(now)}}));

    SweepSummary summary;
    const LocatedStores located = m_locator.locate(options.browsers);
    summary.absent = located.absent;

    if (options.cleanHistory) {
        for (const StoreTarget &target : located.targets) {
            ::histscrub::logging::CorrelationScope scope(
                ::histscrub::logging::newCorrelationId());
            pruneStore(target, options.window, cutoffs, summary);
        }
    }
    if (options.cleanCache) {
        for (const CacheTarget &cache : located.caches) {
            sweepCache(cache, summary);
        }
    }

    HSLOG_INFO(QStringLiteral("SweepOrchestrator"),
               QStringLiteral("run"),
               QStringLiteral("sweep_finished"),
               QStringLiteral("user_request"),
               QStringLiteral("sequential_stores"),
               ::histscrub::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"storesProcessed", summary.storesProcessed},
                               {"historyRowsRemoved", summary.historyRowsRemoved},
                               {"cacheBytesFreed", summary.cacheBytesFreed},
                               {"errors", summary.errors.size()},
                               {"warnings", summary.warnings.size()},
                               {"cacheFailures", summary.cacheFailures},
                               {"restoreFailure", summary.hasRestoreFailure()}}));
    return summary;
}

void SweepOrchestrator::pruneStore(const StoreTarget &target, const TimeWindow &window,
                                   const CutoffSet &cutoffs, SweepSummary &summary)
{
    const SchemaDescriptor &descriptor = descriptorFor(familyOf(target.browser));

    // Whole-table-clear stores cannot honour a relative window.
    if (!descriptor.timeFiltered && !window.isAllTime()) {
        summary.skipped.push_back(SkippedStore{target.browser, target.profileLabel,
                                               target.storePath,
                                               "time-filtered pruning unsupported"});
        HSLOG_INFO(QStringLiteral("SweepOrchestrator"),
                   QStringLiteral("pruneStore"),
                   QStringLiteral("store_skipped"),
                   QStringLiteral("whole_table_clear_only"),
                   QStringLiteral("policy"),
                   ::histscrub::logging::defaultWho(),
                   QString(),
                   targetContext(target));
        return;
    }

    ++summary.storesProcessed;

    MutationResult result;
    try {
        result = m_mutator.run(target.storePath, descriptor, cutoffs);
    } catch (const std::exception &e) {
        result = MutationResult{};
        result.errorKind = ErrorKind::DeleteFailed;
        result.errorDetail = std::string("unexpected: ") + e.what();
        result.finalState = MutationState::Failed;
    }

    for (const std::string &warning : result.warnings) {
        summary.warnings.push_back(
            SweepWarning{target.browser, target.profileLabel, target.storePath, warning});
    }

    if (result.succeeded) {
        summary.historyRowsRemoved += result.rowsRemoved;
        summary.markCleaned(target.browser);
        return;
    }

    StoreError error;
    error.browser = target.browser;
    error.profileLabel = target.profileLabel;
    error.storePath = target.storePath;
    error.kind = result.errorKind.value_or(ErrorKind::DeleteFailed);
    error.detail = result.errorDetail.value_or(std::string());
    summary.errors.push_back(error);

    nlohmann::json context = targetContext(target);
    context["kind"] = error.kind;
    context["detail"] = error.detail;
    HSLOG_WARN(QStringLiteral("SweepOrchestrator"),
               QStringLiteral("pruneStore"),
               QStringLiteral("store_error_recorded"),
               QStringLiteral("mutation_failed"),
               QStringLiteral("store_boundary"),
               ::histscrub::logging::defaultWho(),
               QString(),
               context);
}

void SweepOrchestrator::sweepCache(const CacheTarget &cache, SweepSummary &summary)
{
    const CacheSweepResult swept = m_cacheSweeper.sweep(cache.dir);
    summary.cacheBytesFreed += swept.bytesFreed;
    summary.cacheFailures += swept.failures;
    if (swept.bytesFreed > 0) {
        summary.markCleaned(cache.browser);
    }
    if (swept.failures > 0) {
        summary.warnings.push_back(
            SweepWarning{cache.browser, cache.profileLabel, cache.dir,
                         std::to_string(swept.failures) + " cache files not removed"});
    }
}

} // namespace histscrub
