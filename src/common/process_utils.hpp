#pragma once

#include <QString>

#include "common/enums.hpp"

namespace histscrub {

// Process name matched exactly by pgrep for each browser.
QString browserProcessName(Browser browser);

// True when a process with the browser's name is running. Any pgrep
// failure (pgrep missing, timeout) reads as "not running".
bool isBrowserRunning(Browser browser);

} // namespace histscrub
