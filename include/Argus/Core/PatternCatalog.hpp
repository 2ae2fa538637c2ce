/**
 * @file PatternCatalog.hpp
 * @brief Built-in secret, vulnerability and configuration patterns
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#pragma once

#ifndef ARGUS_CORE_PATTERN_CATALOG_HPP
#define ARGUS_CORE_PATTERN_CATALOG_HPP

#include <Argus/Core/PatternRegistry.hpp>
#include <vector>

namespace Argus::Core {

/// Provider credentials (API keys, tokens)
std::vector<PatternDefinition> secretPatterns();

/// Code-level vulnerability indicators
std::vector<PatternDefinition> vulnerabilityPatterns();

/// Credentials embedded in configuration (connection strings, keys, URLs)
std::vector<PatternDefinition> configurationPatterns();

/// All built-in patterns: secrets, then vulnerabilities, then configurations
std::vector<PatternDefinition> builtInPatterns();

/**
 * @brief Register every built-in pattern
 * @return First registration failure, if any
 */
Result<void> registerBuiltInPatterns(PatternRegistry& registry);

} // namespace Argus::Core

#endif // ARGUS_CORE_PATTERN_CATALOG_HPP
