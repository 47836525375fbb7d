// =============================================================================
// PrinterHub - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every engine operation that can fail returns one of these; nothing in the
// coordination path throws across a component boundary.
//
// Usage:
//   Result<int> allocate() {
//       if (free_.empty()) return Err<int>(ErrorKind::ResourceExhausted, "no ports");
//       return Ok(port);
//   }
//
//   auto result = allocate();
//   if (result.is_ok()) {
//       use(result.value());
//   } else {
//       PHLOG_WARN("tag", "%s", result.error().message.c_str());
//   }
// =============================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace printerhub {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    Connection,            // device unreachable (retried locally)
    UnsupportedOperation,  // backend lacks the capability (never retried)
    ExecutionFailed,       // device rejected or timed out a supported operation
    ResourceExhausted,     // allocator range used up
    QueueOverflow,         // internal queue limit exceeded
    DuplicateDevice,       // same physical device already has a context
    NotFound,              // unknown context id / no active context
    InvalidArgument,
    InvalidState,
    Cancelled,
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Connection:           return "ConnectionError";
        case ErrorKind::UnsupportedOperation: return "UnsupportedOperationError";
        case ErrorKind::ExecutionFailed:      return "ExecutionFailedError";
        case ErrorKind::ResourceExhausted:    return "ResourceExhaustedError";
        case ErrorKind::QueueOverflow:        return "QueueOverflowError";
        case ErrorKind::DuplicateDevice:      return "DuplicateDeviceError";
        case ErrorKind::NotFound:             return "NotFoundError";
        case ErrorKind::InvalidArgument:      return "InvalidArgumentError";
        case ErrorKind::InvalidState:         return "InvalidStateError";
        case ErrorKind::Cancelled:            return "CancelledError";
    }
    return "UnknownError";
}

struct Error {
    ErrorKind kind = ErrorKind::ExecutionFailed;
    std::string message;
    int code = 0;

    Error() = default;
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    // Transient failures are worth another attempt
    bool retryable() const {
        return kind == ErrorKind::Connection || kind == ErrorKind::ExecutionFailed;
    }

    // "ConnectionError: timed out"
    std::string describe() const {
        return std::string(errorKindName(kind)) + ": " + message;
    }
};

namespace detail {
[[noreturn]] inline void badResultAccess(const char* what) {
    throw std::logic_error(what);
}
} // namespace detail

// =============================================================================
// Result<T, E>
// =============================================================================
// Holds a T or an E. value() on an error and error() on a success throw
// std::logic_error: both are caller bugs, never part of normal flow.

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return !is_ok(); }

    T& value() & {
        requireValue();
        return std::get<0>(data_);
    }
    const T& value() const& {
        requireValue();
        return std::get<0>(data_);
    }
    T&& value() && {
        requireValue();
        return std::get<0>(std::move(data_));
    }

    const E& error() const {
        if (is_ok()) detail::badResultAccess("error() on a successful Result");
        return std::get<1>(data_);
    }

private:
    void requireValue() const {
        if (is_err()) detail::badResultAccess("value() on a failed Result");
    }

    std::variant<T, E> data_;
};

// Success carries nothing; only the error side is stored.
template<typename E>
class Result<void, E> {
public:
    Result() = default;

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : error_(E(std::move(error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const E& error() const {
        if (is_ok()) detail::badResultAccess("error() on a successful Result");
        return *error_;
    }

private:
    std::optional<E> error_;
};

// =============================================================================
// Constructors
// =============================================================================

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T>
Result<T> Err(ErrorKind kind, std::string message, int code = 0) {
    return Result<T>(Error(kind, std::move(message), code));
}

} // namespace printerhub
