#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace devscore {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using WorkItemId = int64_t;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidConfiguration,
    InvalidWeights,
    UnknownTimeZone,
    MissingTimestamp,
    InvalidTimestamp,
    InvalidEstimate,
    InvalidData,
    NotFound,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidConfiguration: return "Invalid configuration";
        case ErrorCode::InvalidWeights: return "Score weights do not sum to 1.0";
        case ErrorCode::UnknownTimeZone: return "Unknown time zone";
        case ErrorCode::MissingTimestamp: return "Missing timestamp";
        case ErrorCode::InvalidTimestamp: return "Invalid timestamp";
        case ErrorCode::InvalidEstimate: return "Invalid estimate";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Config errors abort a run; input errors only exclude the offending item.
enum class ErrorKind { Config, Input, Internal };

constexpr ErrorKind classifyError(ErrorCode error) {
    switch (error) {
        case ErrorCode::InvalidConfiguration:
        case ErrorCode::InvalidWeights:
        case ErrorCode::UnknownTimeZone:
            return ErrorKind::Config;
        case ErrorCode::InvalidArgument:
        case ErrorCode::MissingTimestamp:
        case ErrorCode::InvalidTimestamp:
        case ErrorCode::InvalidEstimate:
        case ErrorCode::InvalidData:
        case ErrorCode::NotFound:
            return ErrorKind::Input;
        case ErrorCode::Success:
        case ErrorCode::InternalError:
        case ErrorCode::Unknown:
            return ErrorKind::Internal;
    }
    return ErrorKind::Internal;
}

constexpr const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config: return "config";
        case ErrorKind::Input: return "input";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    ErrorKind kind() const { return classifyError(code); }

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace devscore

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<devscore::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(devscore::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", devscore::errorToString(error));
    }
};
#endif

namespace devscore {

inline constexpr double SECONDS_PER_HOUR = 3600.0;
inline constexpr double HOURS_PER_DAY = 24.0;

// Hours between two instants; negative spans yield 0.
inline double hoursBetween(TimePoint start, TimePoint end) {
    if (end <= start)
        return 0.0;
    return std::chrono::duration<double>(end - start).count() / SECONDS_PER_HOUR;
}

} // namespace devscore
