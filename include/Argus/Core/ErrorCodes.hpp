/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for the Argus detection core
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * This file defines all error codes used throughout Argus, along with
 * a Result type for error handling without exceptions.
 */

#pragma once

#ifndef ARGUS_CORE_ERROR_CODES_HPP
#define ARGUS_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace Argus {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None          = 0x00,  ///< No error
    Validation    = 0x02,  ///< Pattern definition validation errors
    Matching      = 0x03,  ///< Regex evaluation errors
    Scoring       = 0x04,  ///< Confidence scoring errors
    Deduplication = 0x05,  ///< Deduplication engine errors
    Resource      = 0x06,  ///< Time/memory budget errors
    Crypto        = 0x07,  ///< Hashing errors
    Config        = 0x08,  ///< Configuration errors
    IO            = 0x09,  ///< File I/O errors
    Parse         = 0x0A,  ///< Parsing errors
    Internal      = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all Argus operations
 *
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0200-0x02FF: Validation errors
 * - 0x0300-0x03FF: Matching errors
 * - 0x0400-0x04FF: Scoring errors
 * - 0x0500-0x05FF: Deduplication errors
 * - 0x0600-0x06FF: Resource limit errors
 * - 0x0700-0x07FF: Crypto errors
 * - 0x0800-0x08FF: Config errors
 * - 0x0900-0x09FF: I/O errors
 * - 0x0A00-0x0AFF: Parse errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================

    /// Operation completed successfully
    Success = 0x0000,

    // ========================================================================
    // Validation Errors (0x0200-0x02FF)
    // ========================================================================

    /// Generic pattern validation error
    PatternInvalid = 0x0200,

    /// Required pattern field missing (id, name, regex)
    MissingField = 0x0201,

    /// Category not on the allow-list
    InvalidCategory = 0x0202,

    /// Severity not on the allow-list
    InvalidSeverity = 0x0203,

    /// Regex source failed to compile
    InvalidRegex = 0x0204,

    /// Pattern id already registered
    DuplicatePattern = 0x0205,

    /// Base confidence outside [0, 1]
    InvalidConfidence = 0x0206,

    /// minLength/maxLength/extractGroup inconsistent
    InvalidLengthBounds = 0x0207,

    /// False-positive filter failed to compile or is empty
    InvalidFilter = 0x0208,

    // ========================================================================
    // Matching Errors (0x0300-0x03FF)
    // ========================================================================

    /// Generic matching error
    MatchingError = 0x0300,

    /// Regex could not be evaluated (not compiled, or over its memory budget)
    RegexEvaluationFailed = 0x0301,

    /// False-positive predicate threw
    FilterFailed = 0x0302,

    // ========================================================================
    // Scoring Errors (0x0400-0x04FF)
    // ========================================================================

    /// Generic scoring error
    ScoringError = 0x0400,

    /// Validator predicate threw
    ValidatorFailed = 0x0401,

    // ========================================================================
    // Deduplication Errors (0x0500-0x05FF)
    // ========================================================================

    /// Generic deduplication error
    DeduplicationFailed = 0x0500,

    /// Fingerprint could not be computed
    FingerprintFailed = 0x0501,

    /// Circuit breaker is open, call short-circuited
    CircuitOpen = 0x0502,

    // ========================================================================
    // Resource Limit Errors (0x0600-0x06FF)
    // ========================================================================

    /// Operation exceeded its time budget
    Timeout = 0x0600,

    /// Estimated memory exceeded the configured limit
    MemoryLimitExceeded = 0x0601,

    // ========================================================================
    // Crypto Errors (0x0700-0x07FF)
    // ========================================================================

    /// Generic crypto error
    CryptoError = 0x0700,

    /// Hash computation failed
    HashFailed = 0x0701,

    // ========================================================================
    // Config Errors (0x0800-0x08FF)
    // ========================================================================

    /// Generic configuration error
    ConfigError = 0x0800,

    /// Configuration value invalid
    ConfigInvalid = 0x0801,

    // ========================================================================
    // I/O Errors (0x0900-0x09FF)
    // ========================================================================

    /// Generic I/O error
    IOError = 0x0900,

    /// File not found
    FileNotFound = 0x0901,

    /// File too large
    FileTooLarge = 0x0902,

    /// Invalid file path
    InvalidPath = 0x0903,

    /// Access denied
    AccessDenied = 0x0904,

    // ========================================================================
    // Parse Errors (0x0A00-0x0AFF)
    // ========================================================================

    /// Generic parse error
    ParseError = 0x0A00,

    /// JSON parse error
    JsonParseFailed = 0x0A01,

    /// Invalid JSON structure
    JsonInvalid = 0x0A02,

    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================

    /// Unknown internal error
    InternalError = 0xFF00,

    /// Invalid state
    InvalidState = 0xFF03,

    /// Invalid argument
    InvalidArgument = 0xFF05
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code is a time/memory budget violation
 */
[[nodiscard]] constexpr bool isResourceLimit(ErrorCode code) noexcept {
    return getErrorCategory(code) == ErrorCategory::Resource;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

/**
 * @brief Get the error class name reported to callers
 *
 * Maps an error code onto its kind, e.g. "ValidationError",
 * "DeduplicationError", "ResourceLimitError".
 */
[[nodiscard]] std::string_view getErrorKindName(ErrorCode code) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 *
 * This is a discriminated union that holds either a value of type T
 * or an ErrorCode. Use this for error handling without exceptions.
 *
 * @tparam T The success value type
 *
 * @example
 * ```cpp
 * Result<Fingerprint> fp = generator.generate(id, path, value);
 * if (fp.isSuccess()) {
 *     use(fp.value());
 * } else {
 *     log(getErrorMessage(fp.error()));
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}

    /// Construct from success value
    Result(const T& value) : m_data(value) {}

    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}

    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    /// Static method to create success result
    [[nodiscard]] static Result Success(T value) {
        return Result(std::move(value));
    }

    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }

    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }

    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }

    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }

    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}

    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}

    [[nodiscard]] static Result Success() {
        return Result();
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }

    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 *
 * Usage:
 * ```cpp
 * ARGUS_TRY(registry.registerPattern(def));
 * ```
 */
#define ARGUS_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

} // namespace Argus

#endif // ARGUS_CORE_ERROR_CODES_HPP
