/**
 * @file PatternEngine.hpp
 * @brief Content scanning pipeline: match, score, claim, merge
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#pragma once

#ifndef ARGUS_CORE_PATTERN_ENGINE_HPP
#define ARGUS_CORE_PATTERN_ENGINE_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/Finding.hpp>
#include <Argus/Core/PatternRegistry.hpp>
#include <Argus/Core/MatchFinder.hpp>
#include <Argus/Core/ConfidenceScorer.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Argus::Core {

class LearningStore;

/**
 * @brief Options for one scanContent call
 */
struct ScanOptions {
    std::vector<PatternCategory> categories{ALL_CATEGORIES.begin(), ALL_CATEGORIES.end()};
    double confidenceThreshold = 0.5;
    size_t maxMatches = 100;              ///< Cap on the returned findings
    size_t maxMatchesPerPattern = 20;
    size_t contextWindow = 50;
    bool enableDeduplication = true;      ///< Merge equal (pattern, value) findings
    std::optional<std::string> filePath;  ///< Stamped on every location
};

/**
 * @brief Matches within this distance with equal values collapse into one
 */
constexpr size_t PROXIMITY_WINDOW = 10;

/**
 * @brief Scanning pipeline over a pattern registry
 *
 * Patterns run in registration order. A match that clears the threshold
 * claims its range, and later patterns cannot match inside claimed text, so
 * within one call accepted matches never overlap.
 *
 * The registry and learning store must outlive the engine.
 */
class PatternEngine {
public:
    explicit PatternEngine(const PatternRegistry& registry, const LearningStore* learning = nullptr);

    /**
     * @brief Scan one content blob
     * @return Findings sorted by confidence (descending), then position
     *
     * A pattern whose regex fails during evaluation is skipped with a
     * warning; the remaining patterns still run.
     */
    [[nodiscard]] std::vector<Finding> scanContent(std::string_view content,
                                                   const ScanOptions& options = {}) const;

    [[nodiscard]] const PatternRegistry& registry() const noexcept { return m_registry; }
    [[nodiscard]] const ConfidenceScorer& scorer() const noexcept { return m_scorer; }

    /**
     * @brief Collapse equal values that sit within PROXIMITY_WINDOW of each other
     *
     * The survivor has the larger total context, then the longer value, then
     * the earlier position. Input and output are in position order.
     */
    [[nodiscard]] static std::vector<RawMatch> collapseNearbyMatches(std::vector<RawMatch> matches);

private:
    const PatternRegistry& m_registry;
    ConfidenceScorer m_scorer;
};

} // namespace Argus::Core

#endif // ARGUS_CORE_PATTERN_ENGINE_HPP
