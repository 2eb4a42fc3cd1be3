#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cohort {

// Error categories with distinct ranges
enum class ErrorCategory : uint16_t {
    None = 0,
    Input = 1000,
    Sharing = 2000,
    Protocol = 3000,
    Session = 4000,
    Storage = 5000
};

// Structured error codes
enum class ErrorCode : uint32_t {
    // Success
    Success = 0,

    // Input errors (1000-1999)
    ValidationError = 1001,
    PrecisionLossError = 1002,

    // Secret sharing errors (2000-2999)
    InsufficientShares = 2001,
    DuplicateShareError = 2002,

    // Multi-round protocol errors (3000-3999)
    DimensionMismatch = 3001,

    // Session errors (4000-4999)
    NotFoundError = 4001,
    StateError = 4002,

    // Storage errors (5000-5999)
    StorageError = 5001
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    Result(T value) noexcept : value_(std::move(value)), code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& moveValue() noexcept { return std::move(value_); }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    T value_;
    ErrorCode code_;
    std::string message_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() noexcept : code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    ErrorCode code_;
    std::string message_;
};

// Helper function to get error category
inline ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint32_t value = static_cast<uint32_t>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= 1000 && value < 2000) return ErrorCategory::Input;
    if (value >= 2000 && value < 3000) return ErrorCategory::Sharing;
    if (value >= 3000 && value < 4000) return ErrorCategory::Protocol;
    if (value >= 4000 && value < 5000) return ErrorCategory::Session;
    if (value >= 5000 && value < 6000) return ErrorCategory::Storage;
    return ErrorCategory::None;
}

// Convert error code to string
inline std::string_view errorToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::PrecisionLossError: return "PrecisionLossError";

        case ErrorCode::InsufficientShares: return "InsufficientShares";
        case ErrorCode::DuplicateShareError: return "DuplicateShareError";

        case ErrorCode::DimensionMismatch: return "DimensionMismatch";

        case ErrorCode::NotFoundError: return "NotFoundError";
        case ErrorCode::StateError: return "StateError";

        case ErrorCode::StorageError: return "StorageError";

        default: return "UnknownError";
    }
}

// Inverse of errorToString, used when reading persisted error records
inline ErrorCode errorFromString(std::string_view name) noexcept {
    for (ErrorCode code : {ErrorCode::ValidationError, ErrorCode::PrecisionLossError,
                           ErrorCode::InsufficientShares, ErrorCode::DuplicateShareError,
                           ErrorCode::DimensionMismatch, ErrorCode::NotFoundError,
                           ErrorCode::StateError, ErrorCode::StorageError}) {
        if (errorToString(code) == name) return code;
    }
    return ErrorCode::Success;
}

} // namespace cohort
