#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace vaultref {

enum class ErrorCode {
    Unknown = 1,
    InvalidArgument,
    InvalidReference,
    InvalidConfig,
    NotFound,
    Unauthorized,
    Forbidden,
    Timeout,
    Cancelled,
    ConnectionFailed,
    ConnectionClosed,
    ProtocolError,
    SerializationError,
    IoError,
    ProviderError,
    ResolutionFailed,
    InternalError,
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

    /// The error this one wraps, or nullptr.
    [[nodiscard]] auto cause() const noexcept -> const Error* { return cause_.get(); }

    /// Returns a copy of this error with `cause` attached as the underlying failure.
    [[nodiscard]] auto with_cause(Error cause) const -> Error {
        Error copy = *this;
        copy.cause_ = std::make_shared<const Error>(std::move(cause));
        return copy;
    }

    /// The innermost error of the cause chain (this error if it has no cause).
    [[nodiscard]] auto root_cause() const noexcept -> const Error& {
        const Error* e = this;
        while (e->cause_) e = e->cause_.get();
        return *e;
    }

    [[nodiscard]] auto what() const -> std::string {
        std::string out = detail_.empty() ? message_ : message_ + ": " + detail_;
        if (cause_) {
            out += " (caused by: " + cause_->what() + ")";
        }
        return out;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::shared_ptr<const Error> cause_;
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

/// Wraps `cause` in a new error that keeps the cause's code.
inline auto wrap_error(const Error& cause, std::string message) -> Error {
    return Error(cause.code(), std::move(message)).with_cause(cause);
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidReference: return "INVALID_REFERENCE";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Unauthorized: return "UNAUTHORIZED";
        case ErrorCode::Forbidden: return "FORBIDDEN";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::ConnectionFailed: return "CONNECTION_FAILED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::ProviderError: return "PROVIDER_ERROR";
        case ErrorCode::ResolutionFailed: return "RESOLUTION_FAILED";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
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

} // namespace vaultref
