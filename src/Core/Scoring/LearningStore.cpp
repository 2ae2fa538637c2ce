/**
 * @file LearningStore.cpp
 * @brief Feedback counters, learned value sets and their JSON form
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/LearningStore.hpp>
#include <Argus/Core/Logger.hpp>
#include <algorithm>
#include <vector>

namespace Argus::Core {

using json = nlohmann::json;

namespace {

constexpr const char* VERDICT_FALSE_POSITIVE = "false_positive";
constexpr const char* VERDICT_TRUE_POSITIVE = "true_positive";

bool isStringArray(const json& value) {
    return value.is_array() &&
           std::all_of(value.begin(), value.end(), [](const json& v) { return v.is_string(); });
}

bool isCount(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it == obj.end() || it->is_number_unsigned() ||
           (it->is_number_integer() && it->get<int64_t>() >= 0);
}

bool isOptional(const json& obj, const char* key, json::value_t type) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (type == json::value_t::number_integer) {
        return it->is_number_integer();
    }
    return it->type() == type;
}

/**
 * @brief Structural check of one [key, record] feedback entry
 */
bool isFeedbackEntry(const json& entry) {
    if (!entry.is_array() || entry.size() != 2 || !entry[0].is_string() || !entry[1].is_object()) {
        return false;
    }
    const json& record = entry[1];
    return isOptional(record, "patternId", json::value_t::string) &&
           isOptional(record, "value", json::value_t::string) &&
           isOptional(record, "lastVerdict", json::value_t::string) &&
           isOptional(record, "timestamp", json::value_t::number_integer) &&
           isCount(record, "falsePositiveCount") &&
           isCount(record, "truePositiveCount");
}

FeedbackRecord feedbackFromJson(const json& record) {
    FeedbackRecord out;
    out.patternId = record.value("patternId", std::string());
    out.value = record.value("value", std::string());
    out.falsePositiveCount = record.value("falsePositiveCount", size_t{0});
    out.truePositiveCount = record.value("truePositiveCount", size_t{0});
    out.lastVerdictFalsePositive = record.value("lastVerdict", std::string()) == VERDICT_FALSE_POSITIVE;
    out.timestamp = record.value("timestamp", int64_t{0});
    if (auto it = record.find("metadata"); it != record.end() && !it->is_null()) {
        out.metadata = *it;
    }
    return out;
}

json feedbackToJson(const FeedbackRecord& record) {
    return json{
        {"patternId", record.patternId},
        {"value", record.value},
        {"falsePositiveCount", record.falsePositiveCount},
        {"truePositiveCount", record.truePositiveCount},
        {"lastVerdict", record.lastVerdictFalsePositive ? VERDICT_FALSE_POSITIVE : VERDICT_TRUE_POSITIVE},
        {"timestamp", record.timestamp},
        {"metadata", record.metadata}
    };
}

} // anonymous namespace

// ============================================================================
// Seed data
// ============================================================================

const std::set<std::string>& LearningStore::seedFalsePositives() {
    static const std::set<std::string> seed = {
        // Placeholders
        "your_api_key_here", "your_secret_key", "replace_with_your_key",
        "insert_your_key_here", "add_your_api_key", "your_token_here",
        // Fixtures
        "test_key_123", "example_secret", "demo_token", "sample_api_key",
        "mock_secret_key", "fake_token_123",
        // Common non-secrets
        "localhost", "example.com", "test.com", "development", "production", "staging",
        // Defaults
        "null", "undefined", "empty", "none", "default", "changeme", ""
    };
    return seed;
}

// ============================================================================
// LearningStore
// ============================================================================

LearningStore::LearningStore(std::shared_ptr<const IFingerprinter> fingerprinter)
    : m_fingerprinter(fingerprinter ? std::move(fingerprinter)
                                    : std::make_shared<FingerprintGenerator>())
    , m_falsePositiveValues(seedFalsePositives())
{
}

Result<std::string> LearningStore::keyFor(const std::string& patternId, std::string_view value) const {
    return m_fingerprinter->fingerprint(patternId, "", value);
}

Result<void> LearningStore::recordFeedback(const RawMatch& finding, const std::string& patternId,
                                           bool isFalsePositive, const json& metadata) {
    auto key = keyFor(patternId, finding.value);
    if (key.isFailure()) {
        return key.error();
    }

    const std::string value = normalizeValue(finding.value);

    std::lock_guard<std::mutex> lock(m_mutex);

    FeedbackRecord& record = m_feedback[key.value()];
    record.patternId = patternId;
    record.value = value;
    if (isFalsePositive) {
        record.falsePositiveCount++;
        m_falsePositiveValues.insert(value);
    } else {
        record.truePositiveCount++;
        m_truePositiveValues.insert(value);
    }
    record.lastVerdictFalsePositive = isFalsePositive;
    record.timestamp = toEpochMillis(WallClock::now());
    if (!metadata.is_null()) {
        record.metadata = metadata;
    }

    ARGUS_LOG_INFO_F("Recorded feedback for pattern '%s': %s (fp=%zu, tp=%zu)",
                     patternId.c_str(), isFalsePositive ? "false positive" : "true positive",
                     record.falsePositiveCount, record.truePositiveCount);
    return Result<void>::Success();
}

double LearningStore::feedbackAdjustment(const std::string& patternId, std::string_view value) const {
    const std::string normalized = normalizeValue(value);
    auto key = keyFor(patternId, value);

    std::lock_guard<std::mutex> lock(m_mutex);

    if (key.isSuccess()) {
        auto it = m_feedback.find(key.value());
        if (it != m_feedback.end()) {
            const auto& record = it->second;
            const double net = static_cast<double>(record.falsePositiveCount) -
                               static_cast<double>(record.truePositiveCount);
            if (net > 0) {
                return -std::min(MAX_PENALTY, PER_VOTE * net);
            }
            if (net < 0) {
                return std::min(MAX_BOOST, PER_VOTE * -net);
            }
            return 0.0;
        }
    }

    if (seedFalsePositives().count(normalized) != 0) {
        return -MAX_PENALTY;
    }
    if (m_falsePositiveValues.count(normalized) != 0) {
        return -PER_VOTE;
    }
    if (m_truePositiveValues.count(normalized) != 0) {
        return PER_VOTE;
    }
    return 0.0;
}

std::optional<FeedbackRecord> LearningStore::feedbackFor(const std::string& patternId,
                                                         std::string_view value) const {
    auto key = keyFor(patternId, value);
    if (key.isFailure()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_feedback.find(key.value());
    if (it == m_feedback.end()) {
        return std::nullopt;
    }
    return it->second;
}

json LearningStore::exportLearningData() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json feedback = json::array();
    for (const auto& [key, record] : m_feedback) {
        feedback.push_back(json::array({key, feedbackToJson(record)}));
    }

    return json{
        {"falsePositivePatterns", m_falsePositiveValues},
        {"truePositivePatterns", m_truePositiveValues},
        {"feedbackData", std::move(feedback)},
        {"timestamp", toIso8601(WallClock::now())}
    };
}

Result<void> LearningStore::importLearningData(const json& data) {
    if (!data.is_object()) {
        ARGUS_LOG_WARNING("Rejected learning data: document is not an object");
        return ErrorCode::JsonInvalid;
    }

    static const char* const VALUE_SETS[] = {"falsePositivePatterns", "truePositivePatterns"};
    for (const char* name : VALUE_SETS) {
        auto it = data.find(name);
        if (it != data.end() && !it->is_null() && !isStringArray(*it)) {
            ARGUS_LOG_WARNING_F("Rejected learning data: '%s' is not an array of strings", name);
            return ErrorCode::JsonInvalid;
        }
    }

    auto feedbackIt = data.find("feedbackData");
    const bool hasFeedback = feedbackIt != data.end() && !feedbackIt->is_null();
    if (hasFeedback) {
        if (!feedbackIt->is_array() ||
            !std::all_of(feedbackIt->begin(), feedbackIt->end(), isFeedbackEntry)) {
            ARGUS_LOG_WARNING("Rejected learning data: malformed 'feedbackData'");
            return ErrorCode::JsonInvalid;
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (auto it = data.find("falsePositivePatterns"); it != data.end() && it->is_array()) {
        for (const auto& v : *it) {
            m_falsePositiveValues.insert(v.get<std::string>());
        }
    }
    if (auto it = data.find("truePositivePatterns"); it != data.end() && it->is_array()) {
        for (const auto& v : *it) {
            m_truePositiveValues.insert(v.get<std::string>());
        }
    }
    if (hasFeedback) {
        for (const auto& entry : *feedbackIt) {
            m_feedback[entry[0].get<std::string>()] = feedbackFromJson(entry[1]);
        }
    }

    ARGUS_LOG_INFO_F("Imported learning data: %zu false positives, %zu true positives, %zu feedback entries",
                     m_falsePositiveValues.size(), m_truePositiveValues.size(), m_feedback.size());
    return Result<void>::Success();
}

Result<void> LearningStore::importLearningData(std::string_view text) {
    json parsed = json::parse(text.begin(), text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        ARGUS_LOG_WARNING("Rejected learning data: not valid JSON");
        return ErrorCode::JsonParseFailed;
    }
    return importLearningData(parsed);
}

void LearningStore::clearLearningData() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_falsePositiveValues = seedFalsePositives();
    m_truePositiveValues.clear();
    m_feedback.clear();
}

LearningStore::Statistics LearningStore::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statistics stats;
    stats.falsePositivePatterns = m_falsePositiveValues.size();
    stats.truePositivePatterns = m_truePositiveValues.size();
    stats.feedbackEntries = m_feedback.size();
    return stats;
}

} // namespace Argus::Core
