#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace kgrag {

/// Persisted timestamps are milliseconds since the Unix epoch.
using EpochMillis = std::int64_t;

/**
 * @brief Failure categories raised across kgrag
 *
 * The orchestrator retries NetworkError, DatabaseError, Timeout and ResourceExhausted;
 * everything else fails a task on its first attempt.
 */
enum class ErrorCode {
    // caller mistakes
    InvalidArgument,
    ValidationError,
    InvalidState,
    NotInitialized,
    NotFound,

    // content that cannot be used
    InvalidData,
    CorruptedData,

    // environment
    FileNotFound,
    PermissionDenied,
    ResourceExhausted,
    DatabaseError,
    NetworkError,
    Timeout,

    // lifecycle
    OperationCancelled,
    SystemShutdown,
    InternalError
};

constexpr const char* errorName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::SystemShutdown: return "System shutdown";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unrecognised error";
}

struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorName(c)) {}

    friend bool operator==(const Error& e, ErrorCode c) { return e.code == c; }
};

namespace detail {
[[noreturn]] inline void throwErrorAccess(const Error& e) {
    throw std::runtime_error("Result holds an error: " + e.message);
}
[[noreturn]] inline void throwValueAccess() {
    throw std::runtime_error("Result holds a value, not an error");
}
} // namespace detail

/**
 * @brief Value or Error, returned by every fallible kgrag operation
 *
 * Converting from ErrorCode or Error yields the failed state; accessing the
 * absent alternative throws std::runtime_error.
 */
template <typename T> class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}
    Result(ErrorCode code) : Result(Error{code}) {}

    bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & {
        if (!has_value())
            detail::throwErrorAccess(std::get<1>(state_));
        return std::get<0>(state_);
    }
    const T& value() const& {
        if (!has_value())
            detail::throwErrorAccess(std::get<1>(state_));
        return std::get<0>(state_);
    }
    T&& value() && {
        if (!has_value())
            detail::throwErrorAccess(std::get<1>(state_));
        return std::get<0>(std::move(state_));
    }

    const Error& error() const {
        if (has_value())
            detail::throwValueAccess();
        return std::get<1>(state_);
    }

    template <typename U> T value_or(U&& fallback) const& {
        if (has_value())
            return std::get<0>(state_);
        return static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, Error> state_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code) : error_(Error{code}) {}

    bool has_value() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (error_)
            detail::throwErrorAccess(*error_);
    }

    const Error& error() const {
        if (!error_)
            detail::throwValueAccess();
        return *error_;
    }

private:
    std::optional<Error> error_;
};

inline EpochMillis nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace kgrag

#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<kgrag::ErrorCode> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(kgrag::ErrorCode code, FormatContext& ctx) const {
        return fmt::formatter<fmt::string_view>::format(kgrag::errorName(code), ctx);
    }
};
