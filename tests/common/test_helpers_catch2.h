// Test helpers shared by the devscore Catch2 suites

#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/core/types.h>
#include <devscore/timing/state_transition_stack.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace devscore::test {

/**
 * @brief UTC instant from calendar fields.
 */
inline TimePoint utc(int y, unsigned m, unsigned d, int h = 0, int min = 0) {
    using namespace std::chrono;
    return sys_days{year{y} / month{m} / day{d}} + hours{h} + minutes{min};
}

/**
 * @brief Wall-clock time in the fixed UTC-6 zone ("CST-06") used by most tests.
 */
inline TimePoint cst(int y, unsigned m, unsigned d, int h = 0, int min = 0) {
    return utc(y, m, d, h, min) + std::chrono::hours{6};
}

inline TimePoint plusHours(TimePoint tp, double hours) {
    return tp + std::chrono::duration_cast<TimePoint::duration>(
                    std::chrono::duration<double, std::ratio<3600>>(hours));
}

inline TimePoint plusDays(TimePoint tp, int days) {
    return tp + std::chrono::hours{24 * days};
}

/**
 * @brief 09:00-18:00 in UTC-6, 8h cap, Monday to Friday.
 */
inline config::BusinessHoursConfig officeHours() {
    config::BusinessHoursConfig cfg;
    cfg.officeStartHour = 9.0;
    cfg.officeEndHour = 18.0;
    cfg.maxHoursPerDay = 8.0;
    cfg.timezone = "CST-06";
    return cfg;
}

inline timing::StateChange change(const std::string& state, TimePoint at) {
    return timing::StateChange{at, state};
}

/**
 * @brief Creates a unique temporary directory with the given prefix.
 */
inline std::filesystem::path make_temp_dir(std::string_view prefix = "devscore_test_") {
    namespace fs = std::filesystem;
    const auto base = fs::temp_directory_path();
    std::uniform_int_distribution<int> dist(0, 9999);
    thread_local std::mt19937_64 rng{std::random_device{}()};
    for (int attempt = 0; attempt < 512; ++attempt) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto candidate =
            base / (std::string(prefix) + std::to_string(stamp) + "_" + std::to_string(dist(rng)));
        std::error_code ec;
        if (fs::create_directories(candidate, ec)) {
            return candidate;
        }
    }
    return base;
}

/**
 * @brief Write data to a file, creating parent directories as needed.
 */
inline std::filesystem::path write_file(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary);
    stream.write(data.data(), static_cast<std::streamsize>(data.size()));
    stream.close();
    return path;
}

/**
 * @brief RAII helper to set an environment variable and restore it on scope exit.
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, std::optional<std::string> value)
        : key_(std::move(key)), previous_(get_env(key_)) {
        set_env(key_, std::move(value));
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

    ~ScopedEnvVar() { set_env(key_, previous_); }

private:
    static std::optional<std::string> get_env(const std::string& key) {
        if (const auto* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    }

    static void set_env(const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            ::setenv(key.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(key.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> previous_;
};

} // namespace devscore::test
