/**
 * @file Finding.hpp
 * @brief Match, finding and finding-record data model
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * RawMatch and Finding are produced by the pattern pipeline for a single
 * content blob. FindingRecord is the loosely-typed record exchanged with the
 * orchestrator and consumed by the deduplication engine: every field is
 * optional and the record is normalized at the JSON boundary.
 */

#pragma once

#ifndef ARGUS_CORE_FINDING_HPP
#define ARGUS_CORE_FINDING_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Argus::Core {

// ============================================================================
// Location
// ============================================================================

/**
 * @brief One place a finding was observed
 *
 * Line and column are 1-based; zero means unknown.
 */
struct Location {
    std::string file;   ///< File path or URL, empty if unknown
    size_t line = 0;
    size_t column = 0;
    size_t index = 0;   ///< Character offset within the scanned content

    /// Two locations are the same place when file, line and column agree
    [[nodiscard]] bool samePlace(const Location& other) const noexcept {
        return file == other.file && line == other.line && column == other.column;
    }
};

/**
 * @brief 1-based line of a character offset
 */
[[nodiscard]] size_t lineOfIndex(std::string_view content, size_t index) noexcept;

/**
 * @brief 1-based column of a character offset
 */
[[nodiscard]] size_t columnOfIndex(std::string_view content, size_t index) noexcept;

/**
 * @brief Location of a character offset within @p content
 */
[[nodiscard]] Location locate(std::string_view content, size_t index, const std::string& file = {});

// ============================================================================
// Pipeline Types
// ============================================================================

/**
 * @brief Text around a match
 */
struct MatchContext {
    std::string before;
    std::string after;
    std::string full;   ///< before + match + after
};

/**
 * @brief A single regex hit that passed the false-positive filters
 */
struct RawMatch {
    std::string value;       ///< Extracted group, or the full match
    std::string fullMatch;
    size_t index = 0;        ///< Start offset in the content
    size_t length = 0;       ///< Length of fullMatch
    MatchContext context;
    std::vector<std::string> groups;  ///< Capture groups 1..n, empty if not participating

    [[nodiscard]] size_t end() const noexcept { return index + length; }
};

/**
 * @brief Identifying summary of the pattern that produced a finding
 */
struct PatternSummary {
    std::string id;
    std::string name;
    PatternCategory category = PatternCategory::Secrets;
    Severity severity = Severity::Medium;
};

/**
 * @brief Clamp a score to [0, 1]
 */
[[nodiscard]] constexpr double clampConfidence(double value) noexcept {
    return value < 0.0 ? 0.0 : (value > 1.0 ? 1.0 : value);
}

/**
 * @brief A scored match, possibly merged across several occurrences
 *
 * occurrenceCount always equals locations.size().
 */
struct Finding {
    RawMatch match;
    double confidence = 0.0;
    PatternSummary pattern;
    size_t occurrenceCount = 1;
    std::vector<Location> locations;
};

// ============================================================================
// FindingRecord
// ============================================================================

/**
 * @brief Optional-field finding exchanged with the orchestrator
 *
 * Records come from many producers and may miss any field. The
 * deduplication engine skips records without a value and treats every
 * other missing field as empty.
 */
struct FindingRecord {
    std::optional<std::string> patternId;
    std::optional<std::string> patternName;
    std::optional<PatternCategory> category;
    std::optional<Severity> severity;
    std::optional<std::string> file;
    std::optional<std::string> value;
    std::optional<double> confidence;
    std::optional<size_t> line;
    std::optional<size_t> column;
    std::optional<size_t> index;
    std::optional<size_t> occurrenceCount;
    std::vector<Location> locations;
    std::optional<int64_t> firstSeen;   ///< Epoch milliseconds
    std::optional<int64_t> lastSeen;    ///< Epoch milliseconds
    std::optional<std::string> deduplicationStatus;
    std::optional<std::string> fallbackReason;

    /**
     * @brief Location described by this record's own file/line/column/index
     */
    [[nodiscard]] Location ownLocation() const;

    /**
     * @brief Parse a record from JSON
     *
     * Accepts camelCase keys and a nested "pattern" object
     * ({id, name, category, severity}) as produced by toJson() and by the
     * scan pipeline. Non-objects and wrongly typed fields yield nullopt.
     * Unknown category or severity names are left unset. Confidence is
     * clamped to [0, 1].
     */
    [[nodiscard]] static std::optional<FindingRecord> fromJson(const nlohmann::json& json);

    /**
     * @brief Serialize to JSON, omitting unset fields
     */
    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Bridge a pipeline finding into a record
     * @param finding Finding produced by PatternEngine::scanContent
     * @param filePath File the content came from (empty keeps the locations' file)
     */
    [[nodiscard]] static FindingRecord fromFinding(const Finding& finding,
                                                   const std::string& filePath = {});
};

/// Loose batch as received from producers; nullopt entries are allowed
using FindingBatch = std::vector<std::optional<FindingRecord>>;

/**
 * @brief Parse a JSON array into a batch, mapping malformed entries to nullopt
 * @return Batch, or JsonInvalid if @p json is not an array
 */
[[nodiscard]] Result<FindingBatch> parseFindingBatch(const nlohmann::json& json);

} // namespace Argus::Core

#endif // ARGUS_CORE_FINDING_HPP
