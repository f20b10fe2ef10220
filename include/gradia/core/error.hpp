#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace gradia {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    ValidationError,
    PoolExhausted,
    PoolClosed,
    EngineTimeout,
    EngineCrashed,
    EngineUnavailable,
    EmptyTimetable,
    ExtractionError,
    Timeout,
    ConnectionFailed,
    ConnectionClosed,
    ProtocolError,
    BrowserError,
    IoError,
    InternalError,
};

/// User-facing failure kinds. Every ErrorCode belongs to exactly one.
enum class FailureKind {
    Validation,
    PoolExhausted,
    TransientEngine,
    Extraction,
    Unexpected,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::ValidationError: return "VALIDATION_ERROR";
        case ErrorCode::PoolExhausted: return "POOL_EXHAUSTED";
        case ErrorCode::PoolClosed: return "POOL_CLOSED";
        case ErrorCode::EngineTimeout: return "ENGINE_TIMEOUT";
        case ErrorCode::EngineCrashed: return "ENGINE_CRASHED";
        case ErrorCode::EngineUnavailable: return "ENGINE_UNAVAILABLE";
        case ErrorCode::EmptyTimetable: return "EMPTY_TIMETABLE";
        case ErrorCode::ExtractionError: return "EXTRACTION_ERROR";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::BrowserError: return "BROWSER_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// Classifies an error code for retry decisions and caller-facing reporting.
inline auto failure_kind(ErrorCode code) -> FailureKind {
    switch (code) {
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidArgument:
            return FailureKind::Validation;
        case ErrorCode::PoolExhausted:
        case ErrorCode::PoolClosed:
            return FailureKind::PoolExhausted;
        case ErrorCode::EngineTimeout:
        case ErrorCode::EngineCrashed:
        case ErrorCode::EngineUnavailable:
        case ErrorCode::EmptyTimetable:
        case ErrorCode::Timeout:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::ProtocolError:
        case ErrorCode::BrowserError:
            return FailureKind::TransientEngine;
        case ErrorCode::ExtractionError:
            return FailureKind::Extraction;
        default:
            return FailureKind::Unexpected;
    }
}

inline auto failure_kind_to_string(FailureKind kind) -> std::string_view {
    switch (kind) {
        case FailureKind::Validation: return "validation";
        case FailureKind::PoolExhausted: return "pool_exhausted";
        case FailureKind::TransientEngine: return "transient_engine";
        case FailureKind::Extraction: return "extraction";
        case FailureKind::Unexpected: return "unexpected";
    }
    return "unexpected";
}

/// Suggested HTTP status for the layer that exposes ParseTimetable.
inline auto http_status_for(ErrorCode code) -> int {
    switch (code) {
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidArgument:
            return 400;
        case ErrorCode::PoolExhausted:
        case ErrorCode::PoolClosed:
        case ErrorCode::EngineUnavailable:
        case ErrorCode::EngineCrashed:
            return 503;
        case ErrorCode::EngineTimeout:
        case ErrorCode::Timeout:
            return 504;
        case ErrorCode::EmptyTimetable:
        case ErrorCode::ExtractionError:
            return 502;
        default:
            return 500;
    }
}

// GCC 14 ICE workaround for co_return std::unexpected(...) in coroutines.
// GCC 14 crashes (internal compiler error) when a coroutine uses
// co_return std::unexpected(...) due to bugs in special member call
// resolution within coroutine frames. This wrapper defers the
// std::unexpected -> std::expected conversion to a user-defined
// conversion operator outside the coroutine frame.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=112341
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

/// Use co_return make_fail(err) instead of co_return std::unexpected(err).
inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

/// Use co_return ok_result() instead of co_return Result<void>{}.
inline auto ok_result() -> Result<void> { return {}; }

} // namespace gradia
