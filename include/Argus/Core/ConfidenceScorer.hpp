/**
 * @file ConfidenceScorer.hpp
 * @brief Confidence scoring for raw matches
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * The score starts from the pattern's base confidence, adds context, length,
 * validator, value-format, entropy and feedback terms, then applies the category and
 * severity factors to the running total and clamps to [0, 1].
 */

#pragma once

#ifndef ARGUS_CORE_CONFIDENCE_SCORER_HPP
#define ARGUS_CORE_CONFIDENCE_SCORER_HPP

#include <Argus/Core/Finding.hpp>
#include <Argus/Core/PatternRegistry.hpp>
#include <string_view>

namespace Argus::Core {

class LearningStore;

/**
 * @brief Per-term contributions to a confidence score
 *
 * category and severity are the deltas produced by the multiplicative
 * factors, so base + every term equals the unclamped total.
 */
struct ScoreBreakdown {
    double base = 0.0;
    double context = 0.0;
    double length = 0.0;
    double validator = 0.0;
    double format = 0.0;
    double entropy = 0.0;
    double feedback = 0.0;
    double category = 0.0;
    double severity = 0.0;
    double total = 0.0;       ///< Clamped final score
};

/**
 * @brief Confidence scorer
 *
 * Stateless apart from the optional learning store, which must outlive the
 * scorer. Safe to share between threads.
 */
class ConfidenceScorer {
public:
    // Context adjustments
    static constexpr double ASSIGNMENT_BONUS = 0.15;
    static constexpr double ENVIRONMENT_BONUS = 0.20;
    static constexpr double CONFIG_ACCESS_BONUS = 0.10;
    static constexpr double FALSE_POSITIVE_CONTEXT_PENALTY = 0.30;
    static constexpr double COMMENT_PENALTY = 0.20;

    static constexpr double LENGTH_BONUS = 0.10;
    static constexpr double VALIDATOR_BONUS = 0.15;

    // Value-format adjustments
    static constexpr double BASE64_BONUS = 0.10;
    static constexpr double HEX_BONUS = 0.08;
    static constexpr double UUID_BONUS = 0.05;
    static constexpr double JWT_BONUS = 0.15;
    static constexpr double NON_SECRET_PENALTY = 0.20;

    static constexpr double HIGH_ENTROPY = 3.5;
    static constexpr double LOW_ENTROPY = 2.0;
    static constexpr double HIGH_ENTROPY_BONUS = 0.10;
    static constexpr double LOW_ENTROPY_PENALTY = 0.20;

    explicit ConfidenceScorer(const LearningStore* learning = nullptr, bool contextAnalysis = true)
        : m_learning(learning)
        , m_contextAnalysis(contextAnalysis)
    {}

    /**
     * @brief Score a match produced by @p pattern
     * @return Confidence in [0, 1]
     */
    [[nodiscard]] double score(const RawMatch& match, const CompiledPattern& pattern) const;

    /**
     * @brief Score with every term reported
     */
    [[nodiscard]] ScoreBreakdown breakdown(const RawMatch& match, const CompiledPattern& pattern) const;

    /**
     * @brief Context term alone
     */
    [[nodiscard]] static double contextAdjustment(const MatchContext& context);

    /**
     * @brief Value-format term alone
     *
     * Rewards base64 (20+ chars), hex (32+ chars), UUID and JWT shapes; the
     * bonuses add up when a value fits several. Booleans, toggles, plain
     * numbers, all-letter words and http(s) URLs take the non-secret penalty.
     */
    [[nodiscard]] static double formatAdjustment(std::string_view value);

    /**
     * @brief Shannon entropy (base 2) of the characters in @p value
     */
    [[nodiscard]] static double shannonEntropy(std::string_view value) noexcept;

    /**
     * @brief True if the text before a match leaves it inside a comment
     *
     * Looks for "//" or "#" on the last line, or a block or HTML comment
     * opened and not closed before the match.
     */
    [[nodiscard]] static bool isInComment(std::string_view before) noexcept;

    void setLearningStore(const LearningStore* learning) noexcept { m_learning = learning; }

private:
    bool runValidator(const CompiledPattern& pattern, const std::string& value) const;

    const LearningStore* m_learning;
    bool m_contextAnalysis;
};

} // namespace Argus::Core

#endif // ARGUS_CORE_CONFIDENCE_SCORER_HPP
