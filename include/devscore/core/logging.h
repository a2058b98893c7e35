#pragma once

#include <string_view>

namespace devscore::logging {

// Map "trace|debug|info|warn|error|off" onto the default spdlog logger.
// Returns false and leaves the level untouched for unrecognised names.
bool applyLogLevel(std::string_view level);

// Applies DEVSCORE_LOG_LEVEL when set; returns true if a level was applied.
bool applyLogLevelFromEnv();

} // namespace devscore::logging
