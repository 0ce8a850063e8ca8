#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace prebuilt {

// Type aliases
using ByteSpan = std::span<const std::byte>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    HttpStatus,
    RedirectLoop,
    DigestMismatch,
    DigestState,
    FilesystemError,
    ExtractError,
    ConfigError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::TlsVerificationFailed: return "TLS verification failed";
        case ErrorCode::HttpStatus: return "HTTP error";
        case ErrorCode::RedirectLoop: return "Too many redirects";
        case ErrorCode::DigestMismatch: return "Digest mismatch";
        case ErrorCode::DigestState: return "Digest already finalized";
        case ErrorCode::FilesystemError: return "Filesystem error";
        case ErrorCode::ExtractError: return "Extraction failed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

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

} // namespace prebuilt

// fmt library support for ErrorCode (for spdlog)
template <> struct fmt::formatter<prebuilt::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(prebuilt::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", prebuilt::errorToString(error));
    }
};

namespace prebuilt {

// Common constants
inline constexpr std::size_t HASH_STRING_SIZE = 64;     // Hex encoded
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024; // 64KB

} // namespace prebuilt
