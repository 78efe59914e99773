#pragma once

/**
 * @file result.hpp
 * @brief Error codes and the Result type used across the attest API
 *
 * Every fallible operation returns a Result<T>. Check isOk() before reading
 * value(), or isErr() before reading error().
 *
 * @example
 * ```cpp
 * auto tip = registry.tip("user");
 * if (tip.isErr()) {
 *     std::cerr << error_code_to_string(tip.error().code()) << "\n";
 * }
 * ```
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace attest {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Verifier
    SIGNATURE_MISMATCH,
    UNTRUSTED_ROOT,
    EXPIRED_CERTIFICATE,
    FOREIGN_MACHINE_IDENTITY,
    CAPABILITY_DENIED,
    SIGNATURE_REQUIRED,

    // Tree / chain
    SCOPE_NOT_FOUND,
    SCOPE_EXISTS,
    BINARY_NOT_FOUND,
    BINARY_EXISTS,
    SIGNING_FAILED,
    TAMPER_DETECTED,
    CHAIN_EMPTY,

    // Primitives
    KEY_UNAVAILABLE,
    INVALID_DIGEST,

    // Orchestration
    LOCK_TIMEOUT,
    DEADLINE_EXCEEDED,

    // System / IO
    IO_ERROR,
    PARSE_ERROR,
    CONFIG_INVALID,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SIGNATURE_MISMATCH: return "SignatureMismatch";
        case ErrorCode::UNTRUSTED_ROOT: return "UntrustedRoot";
        case ErrorCode::EXPIRED_CERTIFICATE: return "ExpiredCertificate";
        case ErrorCode::FOREIGN_MACHINE_IDENTITY: return "ForeignMachineIdentity";
        case ErrorCode::CAPABILITY_DENIED: return "CapabilityDenied";
        case ErrorCode::SIGNATURE_REQUIRED: return "SignatureRequired";
        case ErrorCode::SCOPE_NOT_FOUND: return "ScopeNotFound";
        case ErrorCode::SCOPE_EXISTS: return "ScopeExists";
        case ErrorCode::BINARY_NOT_FOUND: return "BinaryNotFound";
        case ErrorCode::BINARY_EXISTS: return "BinaryExists";
        case ErrorCode::SIGNING_FAILED: return "SigningFailed";
        case ErrorCode::TAMPER_DETECTED: return "TamperDetected";
        case ErrorCode::CHAIN_EMPTY: return "ChainEmpty";
        case ErrorCode::KEY_UNAVAILABLE: return "KeyUnavailable";
        case ErrorCode::INVALID_DIGEST: return "InvalidDigest";
        case ErrorCode::LOCK_TIMEOUT: return "LockTimeout";
        case ErrorCode::DEADLINE_EXCEEDED: return "DeadlineExceeded";
        case ErrorCode::IO_ERROR: return "IoError";
        case ErrorCode::PARSE_ERROR: return "ParseError";
        case ErrorCode::CONFIG_INVALID: return "ConfigInvalid";
    }
    return "Unknown";
}

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error type with code, message and, for TAMPER_DETECTED, the index
 *        of the first record that failed to validate
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Error tamper(std::uint64_t at_index, const std::string& message) {
        Error e(ErrorCode::TAMPER_DETECTED, message);
        e.at_index_ = at_index;
        return e;
    }

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::optional<std::uint64_t> atIndex() const { return at_index_; }

    std::string toString() const {
        std::string s = std::string(error_code_to_string(code_)) + ": " + message_;
        if (at_index_) {
            s += " (at index " + std::to_string(*at_index_) + ")";
        }
        return s;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::optional<std::uint64_t> at_index_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace attest
