/**
 * @file Config.hpp
 * @brief Configuration file loading
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Files are read with protection against:
 * - TOCTOU races between the size check and the read
 * - Path traversal outside an allowed directory
 * - Symlink substitution of the final component
 * - Oversized files
 */

#pragma once

#ifndef ARGUS_CORE_CONFIG_HPP
#define ARGUS_CORE_CONFIG_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace Argus::Config {

/// Flat key -> raw value map; section headers become key prefixes
using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief key=value configuration loader
 *
 * Format:
 * @code
 * # comment
 * [scan]
 * confidence_threshold = 0.6    ; stored as "scan.confidence_threshold"
 * log.level = debug             ; dotted keys work outside sections too
 * @endcode
 */
class ConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;  // 1MB default
        std::string allowed_directory;       // Restrict to directory
    };

    ConfigLoader() : ConfigLoader(Options{}) {}
    explicit ConfigLoader(const Options& options);
    ~ConfigLoader();

    /**
     * @brief Load configuration from file
     * @return Parsed configuration, or InvalidPath, AccessDenied,
     *         FileNotFound, FileTooLarge, IOError
     */
    Result<ConfigMap> load(const std::string& path);

    /**
     * @brief Parse configuration text
     * @return ConfigInvalid for a malformed section header
     */
    Result<ConfigMap> loadFromString(std::string_view text);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Argus::Config

#endif // ARGUS_CORE_CONFIG_HPP
