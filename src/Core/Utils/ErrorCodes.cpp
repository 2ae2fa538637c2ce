/**
 * @file ErrorCodes.cpp
 * @brief Human-readable error messages and kind names
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/ErrorCodes.hpp>

namespace Argus {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:               return "Success";

        case ErrorCode::PatternInvalid:        return "Invalid pattern definition";
        case ErrorCode::MissingField:          return "Pattern is missing a required field";
        case ErrorCode::InvalidCategory:       return "Pattern category is not allowed";
        case ErrorCode::InvalidSeverity:       return "Pattern severity is not allowed";
        case ErrorCode::InvalidRegex:          return "Pattern regex failed to compile";
        case ErrorCode::DuplicatePattern:      return "Pattern id already registered";
        case ErrorCode::InvalidConfidence:     return "Pattern confidence outside [0, 1]";
        case ErrorCode::InvalidLengthBounds:   return "Pattern length bounds are inconsistent";
        case ErrorCode::InvalidFilter:         return "False-positive filter is invalid";

        case ErrorCode::MatchingError:         return "Matching error";
        case ErrorCode::RegexEvaluationFailed: return "Regex evaluation failed";
        case ErrorCode::FilterFailed:          return "False-positive predicate failed";

        case ErrorCode::ScoringError:          return "Scoring error";
        case ErrorCode::ValidatorFailed:       return "Validator predicate failed";

        case ErrorCode::DeduplicationFailed:   return "Deduplication failed";
        case ErrorCode::FingerprintFailed:     return "Fingerprint generation failed";
        case ErrorCode::CircuitOpen:           return "Circuit breaker is open";

        case ErrorCode::Timeout:               return "Operation exceeded its time budget";
        case ErrorCode::MemoryLimitExceeded:   return "Operation exceeded its memory limit";

        case ErrorCode::CryptoError:           return "Cryptographic error";
        case ErrorCode::HashFailed:            return "Hash computation failed";

        case ErrorCode::ConfigError:           return "Configuration error";
        case ErrorCode::ConfigInvalid:         return "Invalid configuration value";

        case ErrorCode::IOError:               return "I/O error";
        case ErrorCode::FileNotFound:          return "File not found";
        case ErrorCode::FileTooLarge:          return "File too large";
        case ErrorCode::InvalidPath:           return "Invalid path";
        case ErrorCode::AccessDenied:          return "Access denied";

        case ErrorCode::ParseError:            return "Parse error";
        case ErrorCode::JsonParseFailed:       return "JSON parse failed";
        case ErrorCode::JsonInvalid:           return "Invalid JSON structure";

        case ErrorCode::InternalError:         return "Internal error";
        case ErrorCode::InvalidState:          return "Invalid state";
        case ErrorCode::InvalidArgument:       return "Invalid argument";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:          return "None";
        case ErrorCategory::Validation:    return "Validation";
        case ErrorCategory::Matching:      return "Matching";
        case ErrorCategory::Scoring:       return "Scoring";
        case ErrorCategory::Deduplication: return "Deduplication";
        case ErrorCategory::Resource:      return "Resource";
        case ErrorCategory::Crypto:        return "Crypto";
        case ErrorCategory::Config:        return "Config";
        case ErrorCategory::IO:            return "IO";
        case ErrorCategory::Parse:         return "Parse";
        case ErrorCategory::Internal:      return "Internal";
    }
    return "Unknown";
}

std::string_view getErrorKindName(ErrorCode code) noexcept {
    switch (getErrorCategory(code)) {
        case ErrorCategory::Validation:    return "ValidationError";
        case ErrorCategory::Matching:      return "MatchingError";
        case ErrorCategory::Scoring:       return "ScoringError";
        case ErrorCategory::Deduplication: return "DeduplicationError";
        case ErrorCategory::Resource:      return "ResourceLimitError";
        case ErrorCategory::Crypto:        return "CryptoError";
        case ErrorCategory::Config:        return "ConfigError";
        case ErrorCategory::IO:            return "IOError";
        case ErrorCategory::Parse:         return "ParseError";
        default:                           return "InternalError";
    }
}

} // namespace Argus
