/**
 * @file LearningStore.hpp
 * @brief User feedback on findings, consulted by the confidence scorer
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Feedback is keyed by the fingerprint of (pattern, value) with no file,
 * so a verdict on one occurrence applies wherever the value reappears.
 */

#pragma once

#ifndef ARGUS_CORE_LEARNING_STORE_HPP
#define ARGUS_CORE_LEARNING_STORE_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <Argus/Core/Finding.hpp>
#include <Argus/Core/Fingerprint.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace Argus::Core {

/**
 * @brief Accumulated verdicts for one (pattern, value)
 */
struct FeedbackRecord {
    std::string patternId;
    std::string value;                ///< Normalized value
    size_t falsePositiveCount = 0;
    size_t truePositiveCount = 0;
    bool lastVerdictFalsePositive = false;
    int64_t timestamp = 0;            ///< Epoch milliseconds of the last verdict
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Feedback and learned value sets
 *
 * Thread-safe. Starts with a seed set of placeholder values that are always
 * treated as false positives.
 */
class LearningStore {
public:
    /// Largest downward adjustment from feedback
    static constexpr double MAX_PENALTY = 0.30;

    /// Largest upward adjustment from feedback
    static constexpr double MAX_BOOST = 0.20;

    /// Adjustment contributed by each net vote
    static constexpr double PER_VOTE = 0.10;

    struct Statistics {
        size_t falsePositivePatterns = 0;
        size_t truePositivePatterns = 0;
        size_t feedbackEntries = 0;
    };

    /**
     * @param fingerprinter Key generator; defaults to SHA-256
     */
    explicit LearningStore(std::shared_ptr<const IFingerprinter> fingerprinter = nullptr);
    ~LearningStore() = default;

    LearningStore(const LearningStore&) = delete;
    LearningStore& operator=(const LearningStore&) = delete;

    /**
     * @brief Record a verdict on a finding
     * @param finding The finding the user judged
     * @param patternId Pattern that produced it
     * @param isFalsePositive Verdict
     * @param metadata Free-form data stored with the verdict (object or null)
     * @return FingerprintFailed if the key cannot be computed
     */
    Result<void> recordFeedback(const RawMatch& finding, const std::string& patternId,
                                bool isFalsePositive,
                                const nlohmann::json& metadata = nlohmann::json::object());

    /**
     * @brief Confidence adjustment for a value
     *
     * Feedback for (pattern, value) decides when present: net
     * false-positive votes lower the score by PER_VOTE each up to
     * MAX_PENALTY, net true-positive votes raise it up to MAX_BOOST. Without
     * feedback, a seed placeholder gets -MAX_PENALTY, a value learned as a
     * false positive under another pattern gets -PER_VOTE and a learned true
     * positive gets +PER_VOTE. A value never moves further than one vote on
     * the strength of another pattern's verdict.
     */
    [[nodiscard]] double feedbackAdjustment(const std::string& patternId, std::string_view value) const;

    /**
     * @brief Feedback entry for (pattern, value), if any
     */
    [[nodiscard]] std::optional<FeedbackRecord> feedbackFor(const std::string& patternId,
                                                            std::string_view value) const;

    /**
     * @brief Whole store as {falsePositivePatterns, truePositivePatterns, feedbackData, timestamp}
     */
    [[nodiscard]] nlohmann::json exportLearningData() const;

    /**
     * @brief Merge a previously exported document into the store
     *
     * The document is validated completely before anything is merged.
     * @return JsonInvalid for a structurally invalid document
     */
    Result<void> importLearningData(const nlohmann::json& data);

    /**
     * @brief Parse and merge an exported document
     * @return JsonParseFailed for malformed text, JsonInvalid for bad structure
     */
    Result<void> importLearningData(std::string_view text);

    /**
     * @brief Drop all learned data and restore the seed set
     */
    void clearLearningData();

    [[nodiscard]] Statistics getStatistics() const;

    /**
     * @brief Built-in placeholder values
     */
    static const std::set<std::string>& seedFalsePositives();

private:
    Result<std::string> keyFor(const std::string& patternId, std::string_view value) const;

    std::shared_ptr<const IFingerprinter> m_fingerprinter;

    mutable std::mutex m_mutex;
    std::set<std::string> m_falsePositiveValues;
    std::set<std::string> m_truePositiveValues;
    std::map<std::string, FeedbackRecord> m_feedback;
};

} // namespace Argus::Core

#endif // ARGUS_CORE_LEARNING_STORE_HPP
