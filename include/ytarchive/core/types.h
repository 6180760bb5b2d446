#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>

namespace ytarchive {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidPattern,
    NotIdentified,
    AmbiguousIdentity,
    NotFound,
    NetworkError,
    HttpError,
    Timeout,
    InvalidData,
    EmptyResults,
    CacheMiss,
    CacheBuildFailed,
    DownloaderUnavailable,
    SpawnFailed,
    DownloadFailed,
    PermissionDenied,
    WriteError,
    OperationCancelled,
    InvalidState,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidPattern: return "Invalid regex pattern";
        case ErrorCode::NotIdentified: return "No identifying information for channel";
        case ErrorCode::AmbiguousIdentity: return "Ambiguous channel identity";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::HttpError: return "HTTP error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::EmptyResults: return "No results returned";
        case ErrorCode::CacheMiss: return "Channel not in cache";
        case ErrorCode::CacheBuildFailed: return "Build channel cache failed";
        case ErrorCode::DownloaderUnavailable: return "Downloader unavailable";
        case ErrorCode::SpawnFailed: return "Process spawn failed";
        case ErrorCode::DownloadFailed: return "Download failed";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InternalError: return "Internal error";
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

// Prefix an error's message with context while keeping its code.
inline Error wrapError(const Error& error, const std::string& context) {
    return Error{error.code, context + ": " + error.message};
}

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

    T& value() & {
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

} // namespace ytarchive

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<ytarchive::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(ytarchive::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", ytarchive::errorToString(error));
    }
};
