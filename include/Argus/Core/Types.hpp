/**
 * @file Types.hpp
 * @brief Core type definitions for the Argus detection core
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the Argus codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef ARGUS_CORE_TYPES_HPP
#define ARGUS_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <chrono>

namespace Argus {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw buffers
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

// ============================================================================
// Time Types
// ============================================================================

/// Monotonic clock for budgets, timeouts and breaker transitions
using Clock = std::chrono::steady_clock;

/// Time point type
using TimePoint = Clock::time_point;

/// Wall clock used for timestamps that leave the process
using WallClock = std::chrono::system_clock;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Milliseconds since the Unix epoch
 */
[[nodiscard]] int64_t toEpochMillis(WallClock::time_point tp) noexcept;

/**
 * @brief Format a wall-clock time as UTC ISO-8601 ("2025-01-31T12:00:00.000Z")
 */
[[nodiscard]] std::string toIso8601(WallClock::time_point tp);

// ============================================================================
// Hash Types
// ============================================================================

/// SHA-256 hash (32 bytes)
using SHA256Hash = std::array<Byte, 32>;

// ============================================================================
// Detection Classification
// ============================================================================

/**
 * @brief Ordinal risk classification
 *
 * Ordered so that a larger value is more severe, which lets merges take
 * std::max directly.
 */
enum class Severity : uint8_t {
    Low      = 1,
    Medium   = 2,
    High     = 3,
    Critical = 4
};

/**
 * @brief Pattern category
 */
enum class PatternCategory : uint8_t {
    Secrets         = 0,
    Vulnerabilities = 1,
    Configurations  = 2
};

/// All categories in their canonical order
constexpr std::array<PatternCategory, 3> ALL_CATEGORIES = {
    PatternCategory::Secrets,
    PatternCategory::Vulnerabilities,
    PatternCategory::Configurations
};

/**
 * @brief Get the lower-case wire name of a severity ("critical", "high", ...)
 */
[[nodiscard]] constexpr const char* severityToString(Severity severity) noexcept {
    switch (severity) {
        case Severity::Critical: return "critical";
        case Severity::High:     return "high";
        case Severity::Medium:   return "medium";
        case Severity::Low:      return "low";
    }
    return "low";
}

/**
 * @brief Parse a severity name (case-insensitive)
 * @return Severity or nullopt if the name is not on the allow-list
 */
[[nodiscard]] std::optional<Severity> parseSeverity(std::string_view name) noexcept;

/**
 * @brief Return the more severe of two severities
 */
[[nodiscard]] constexpr Severity maxSeverity(Severity a, Severity b) noexcept {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b) ? a : b;
}

/**
 * @brief Get the lower-case wire name of a category ("secrets", ...)
 */
[[nodiscard]] constexpr const char* categoryToString(PatternCategory category) noexcept {
    switch (category) {
        case PatternCategory::Secrets:         return "secrets";
        case PatternCategory::Vulnerabilities: return "vulnerabilities";
        case PatternCategory::Configurations:  return "configurations";
    }
    return "secrets";
}

/**
 * @brief Parse a category name (case-insensitive)
 * @return Category or nullopt if the name is not on the allow-list
 */
[[nodiscard]] std::optional<PatternCategory> parseCategory(std::string_view name) noexcept;

} // namespace Argus

#endif // ARGUS_CORE_TYPES_HPP
