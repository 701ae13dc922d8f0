#include "common/models.hpp"

#include <algorithm>
#include <stdexcept>

namespace histscrub {

TimeWindow TimeWindow::allTime()
{
    return TimeWindow(0);
}

TimeWindow TimeWindow::relativeHours(int64_t hours)
{
    if (hours <= 0) {
        throw std::invalid_argument("time window must cover at least one hour");
    }
    if (hours > kMaxHours) {
        throw std::invalid_argument("time window is too large");
    }
    return TimeWindow(hours);
}

std::string TimeWindow::describe() const
{
    switch (m_hours) {
    case 0:
        return "all time";
    case 1:
        return "the last hour";
    case 24:
        return "the last 24 hours";
    case 168:
        return "the last week";
    default:
        return "the last " + std::to_string(m_hours) + " hours";
    }
}

int64_t CutoffSet::valueFor(EpochFamily family) const
{
    switch (family) {
    case EpochFamily::ChromiumMicros1601:
        return chromiumMicros1601;
    case EpochFamily::GeckoMicros1970:
        return geckoMicros1970;
    case EpochFamily::WebKitSeconds1970:
        return webkitSeconds1970;
    }
    return chromiumMicros1601;
}

bool SweepSummary::hasRestoreFailure() const
{
    return std::any_of(errors.begin(), errors.end(), [](const StoreError &error) {
        return error.kind == ErrorKind::RestoreFailed;
    });
}

void SweepSummary::markCleaned(Browser browser)
{
    if (std::find(browsersCleaned.begin(), browsersCleaned.end(), browser)
        == browsersCleaned.end()) {
        browsersCleaned.push_back(browser);
    }
}

} // namespace histscrub
