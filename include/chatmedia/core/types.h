#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace chatmedia {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    SourceMissing,
    KeyMissing,
    DecryptionFailed,
    DecodeFailed,
    EncodeFailed,
    Timeout,
    CorruptOutput,
    Unresolvable,
    InvalidArgument,
    IOError,
    InternalError,
    NotInitialized,
    OperationCancelled,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::SourceMissing: return "Source blob missing";
        case ErrorCode::KeyMissing: return "Decryption key missing";
        case ErrorCode::DecryptionFailed: return "Decryption failed";
        case ErrorCode::DecodeFailed: return "Speech decode failed";
        case ErrorCode::EncodeFailed: return "Audio encode failed";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::CorruptOutput: return "Corrupt output";
        case ErrorCode::Unresolvable: return "Unresolvable";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
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

// Value-or-error result used across the pipeline API
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
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const T* operator->() const { return &value(); }
    const T& operator*() const& { return value(); }

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
            throw std::runtime_error("Result contains error: " + error_.message);
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

} // namespace chatmedia

// Format support for ErrorCode
#include <format>
template <> struct std::formatter<chatmedia::ErrorCode> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(chatmedia::ErrorCode error, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", chatmedia::errorToString(error));
    }
};

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<chatmedia::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(chatmedia::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", chatmedia::errorToString(error));
    }
};
#endif

namespace chatmedia {

// Common constants
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024;  // 64KB
inline constexpr std::size_t SIGNATURE_SNIFF_SIZE = 16;
inline constexpr std::size_t AES_KEY_SIZE = 16;

} // namespace chatmedia
