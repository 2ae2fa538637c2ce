/**
 * @file MatchFinder.hpp
 * @brief Non-overlapping regex matching with context extraction
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#pragma once

#ifndef ARGUS_CORE_MATCH_FINDER_HPP
#define ARGUS_CORE_MATCH_FINDER_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <Argus/Core/Finding.hpp>
#include <Argus/Core/PatternRegistry.hpp>
#include <string_view>
#include <utility>
#include <vector>

namespace Argus::Core {

/**
 * @brief Set of claimed half-open character ranges
 */
class PositionLedger {
public:
    /**
     * @brief Check whether [start, end) intersects any claimed range
     *
     * An empty range intersects a claimed range that strictly contains it.
     */
    [[nodiscard]] bool overlaps(size_t start, size_t end) const noexcept;

    void claim(size_t start, size_t end);

    [[nodiscard]] size_t size() const noexcept { return m_ranges.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_ranges.empty(); }
    void clear() noexcept { m_ranges.clear(); }

    [[nodiscard]] const std::vector<std::pair<size_t, size_t>>& ranges() const noexcept {
        return m_ranges;
    }

private:
    std::vector<std::pair<size_t, size_t>> m_ranges;
};

/**
 * @brief Match finder options
 */
struct MatchOptions {
    size_t contextWindow = 50;   ///< Characters of context on each side
    size_t maxMatches = 20;      ///< Accepted matches per pattern
};

/**
 * @brief Finds the raw matches of one pattern over one content blob
 *
 * Candidates overlapping the shared ledger or an earlier candidate of the
 * same pass are skipped, as are candidates hit by a false-positive filter.
 * The shared ledger is only read; promotion is the caller's decision.
 */
class MatchFinder {
public:
    explicit MatchFinder(MatchOptions options = {}) : m_options(options) {}

    /**
     * @brief Run @p pattern over @p content
     * @return Accepted matches in position order; RegexEvaluationFailed when
     *         the pattern holds no compiled regex, FilterFailed when a
     *         predicate filter throws
     */
    Result<std::vector<RawMatch>> find(std::string_view content,
                                       const CompiledPattern& pattern,
                                       const PositionLedger& claimed) const;

    /**
     * @brief Check a candidate against the pattern's false-positive filters
     * @throws whatever a predicate filter throws
     */
    static bool isFalsePositive(const RawMatch& match, const CompiledPattern& pattern);

    [[nodiscard]] const MatchOptions& options() const noexcept { return m_options; }

private:
    MatchOptions m_options;
};

} // namespace Argus::Core

#endif // ARGUS_CORE_MATCH_FINDER_HPP
