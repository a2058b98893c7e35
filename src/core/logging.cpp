#include <devscore/core/logging.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace devscore::logging {

bool applyLogLevel(std::string_view level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn" || level == "warning") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        return false;
    }
    return true;
}

bool applyLogLevelFromEnv() {
    const char* env = std::getenv("DEVSCORE_LOG_LEVEL");
    if (!env || !*env)
        return false;
    if (!applyLogLevel(env)) {
        spdlog::warn("Ignoring unrecognised DEVSCORE_LOG_LEVEL='{}'", env);
        return false;
    }
    return true;
}

} // namespace devscore::logging
