/**
 * @file Settings.hpp
 * @brief Typed engine settings built from a ConfigMap
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Recognised keys:
 * | Key                              | Type                      |
 * |----------------------------------|---------------------------|
 * | scan.confidence_threshold        | number in [0, 1]          |
 * | scan.max_matches                 | positive integer          |
 * | scan.max_matches_per_pattern     | positive integer          |
 * | scan.context_window              | non-negative integer      |
 * | scan.enable_deduplication        | bool                      |
 * | scan.categories                  | comma-separated names     |
 * | dedup.max_cache_size             | non-negative integer      |
 * | dedup.max_time_ms                | positive integer          |
 * | dedup.memory_limit_mb            | positive number           |
 * | dedup.circuit_breaker_enabled    | bool                      |
 * | dedup.circuit_breaker_threshold  | positive integer          |
 * | dedup.circuit_breaker_reset_ms   | non-negative integer      |
 * | log.level                        | trace..critical, off      |
 * | log.file                         | path                      |
 *
 * Unknown keys are ignored.
 */

#pragma once

#ifndef ARGUS_CORE_SETTINGS_HPP
#define ARGUS_CORE_SETTINGS_HPP

#include <Argus/Core/Config.hpp>
#include <Argus/Core/PatternEngine.hpp>
#include <Argus/Core/DeduplicationEngine.hpp>
#include <Argus/Core/Logger.hpp>
#include <string>

namespace Argus::Config {

struct EngineSettings {
    Core::ScanOptions scan;
    Core::DedupConfig dedup;
    Core::LogLevel logLevel = Core::LogLevel::Info;
    std::string logFile;      ///< Empty for console only

    /**
     * @brief Overlay @p config on the defaults
     * @return ConfigInvalid naming the first bad key in the log
     */
    [[nodiscard]] static Result<EngineSettings> fromConfigMap(const ConfigMap& config);
};

/**
 * @brief Parse "true/false/yes/no/on/off/1/0", case-insensitive
 */
[[nodiscard]] std::optional<bool> parseBool(std::string_view text);

} // namespace Argus::Config

#endif // ARGUS_CORE_SETTINGS_HPP
