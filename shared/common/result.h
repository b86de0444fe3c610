// ============================================================================
// File: shared/common/result.h
// Description: Unified Result / Error handling structure for command runner
// ============================================================================

#pragma once
#include <string>
#include <utility>
#include <optional>
#include <cstdint>


// NOTE: int-based so codes survive the JSON reply boundary. Extend by appending.
enum class ResultCode : int32_t {
    OK                  = 0,
    Fail                = 1,
    Cancelled           = 2,

    // input & state error
    InvalidArgument     = 100,
    AlreadyExists       = 101,
    NotFound            = 103,

    // option validation
    MissingRequired     = 110,
    RuleViolation       = 111,
    InvalidChoice       = 112,

    // registration
    InvalidCommand      = 120,

    // query sandbox
    DisallowedPattern   = 130,
    DisallowedVerb      = 131,
    MalformedQuery      = 132,
    UnknownEntityType   = 133,

    // policy
    PermissionDenied    = 200,
    ConfirmationRequired = 201,
    Disabled            = 202,

    // execution
    InternalError       = 300,
    ExecutionError      = 301,

    Unknown
};

inline constexpr bool isSuccess(ResultCode code) noexcept {
    return code == ResultCode::OK;
}

inline constexpr bool isFailure(ResultCode code) noexcept {
    return !isSuccess(code);
}

// ----------------------------------------------------------------------------
// Result<T, E>
// ----------------------------------------------------------------------------

template <typename T, typename E = std::optional<std::string>>
class Result {
public:
    // Default constructor: success by default
    Result() : code_(ResultCode::OK), error_() {}

    // Factory methods
    static Result OK(T value) { return Result(std::move(value)); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = E{}) { return Result(code, std::move(error)); }

    // Query
    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] ResultCode code() const noexcept { return code_; }
    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] T& value() noexcept  { return value_; }
    [[nodiscard]] const E& error() const noexcept  { return error_; }

private:
    ResultCode code_;
    T value_{};
    E error_;

    // Success constructor
    explicit Result(T val)
        : code_(ResultCode::OK), value_(std::move(val)), error_() {}

    // Error constructor
    Result(ResultCode code, E err)
        : code_(code), error_(std::move(err)) {}
};

// ----------------------------------------------------------------------------
// Partial specialization for void
// ----------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    Result() : code_(ResultCode::OK), error_() {}
    static Result OK() { return Result(ResultCode::OK, E{}); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = E{}) { return Result(code, std::move(error)); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] const E& error() const noexcept  { return error_; }
    [[nodiscard]] ResultCode code() const noexcept  { return code_; }

private:
    ResultCode code_;
    E error_;

    Result(ResultCode code, E e)
        : code_(code), error_(std::move(e)) {}
};

// ----------------------------------------------------------------------------
// String conversion (for logging / replies)
// ----------------------------------------------------------------------------

constexpr const char* to_string(ResultCode code) {
    switch (code) {
        case ResultCode::OK:                   return "OK";
        case ResultCode::Fail:                 return "Fail";
        case ResultCode::Cancelled:            return "Cancelled";
        case ResultCode::InvalidArgument:      return "InvalidArgument";
        case ResultCode::AlreadyExists:        return "AlreadyExists";
        case ResultCode::NotFound:             return "NotFound";
        case ResultCode::MissingRequired:      return "MissingRequired";
        case ResultCode::RuleViolation:        return "RuleViolation";
        case ResultCode::InvalidChoice:        return "InvalidChoice";
        case ResultCode::InvalidCommand:       return "InvalidCommand";
        case ResultCode::DisallowedPattern:    return "DisallowedPattern";
        case ResultCode::DisallowedVerb:       return "DisallowedVerb";
        case ResultCode::MalformedQuery:       return "MalformedQuery";
        case ResultCode::UnknownEntityType:    return "UnknownEntityType";
        case ResultCode::PermissionDenied:     return "PermissionDenied";
        case ResultCode::ConfirmationRequired: return "ConfirmationRequired";
        case ResultCode::Disabled:             return "Disabled";
        case ResultCode::InternalError:        return "InternalError";
        case ResultCode::ExecutionError:       return "ExecutionError";
        default:                               return "Unknown";
    }
}


// LOGI("Registration result: {}", to_string(result));
inline std::string to_string(const Result<void>& r) {
    return std::string(to_string(r.code())) +
           (r.error().has_value() ? (": " + *r.error()) : "");
}


inline Result<void> OK() noexcept { return Result<void>::OK(); }
inline Result<void> Fail() noexcept { return Result<void>::Fail(); }
inline Result<void> Error(ResultCode code, std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(code, std::move(msg));
}
