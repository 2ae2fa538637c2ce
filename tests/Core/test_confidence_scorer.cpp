/**
 * @file test_confidence_scorer.cpp
 * @brief Unit tests for confidence scoring terms
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/ConfidenceScorer.hpp>
#include <Argus/Core/LearningStore.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace Argus;
using namespace Argus::Core;
using namespace Argus::Testing;

namespace {

// 16 distinct characters, entropy 4.0
constexpr const char* HIGH_ENTROPY_VALUE = "Zx9!qT4#mK2@pL7$";

CompiledPattern compile(const PatternDefinition& def) {
    auto result = compilePattern(def);
    EXPECT_TRUE(result.isSuccess()) << getErrorMessage(result.error());
    return result.value();
}

constexpr double EPS = 1e-9;

} // anonymous namespace

// ============================================================================
// Entropy and comments
// ============================================================================

TEST(ConfidenceScorerTest, ShannonEntropy) {
    EXPECT_DOUBLE_EQ(ConfidenceScorer::shannonEntropy(""), 0.0);
    EXPECT_DOUBLE_EQ(ConfidenceScorer::shannonEntropy("aaaa"), 0.0);
    EXPECT_NEAR(ConfidenceScorer::shannonEntropy("ab"), 1.0, EPS);
    EXPECT_NEAR(ConfidenceScorer::shannonEntropy("abcd"), 2.0, EPS);
    EXPECT_NEAR(ConfidenceScorer::shannonEntropy(HIGH_ENTROPY_VALUE), 4.0, EPS);
}

TEST(ConfidenceScorerTest, DetectsComments) {
    EXPECT_TRUE(ConfidenceScorer::isInComment("// token: "));
    EXPECT_TRUE(ConfidenceScorer::isInComment("x = 1\n# key "));
    EXPECT_TRUE(ConfidenceScorer::isInComment("/* still open "));
    EXPECT_TRUE(ConfidenceScorer::isInComment("<!-- html "));

    EXPECT_FALSE(ConfidenceScorer::isInComment("/* closed */ key = "));
    EXPECT_FALSE(ConfidenceScorer::isInComment("// old line\nkey = "));
    EXPECT_FALSE(ConfidenceScorer::isInComment(""));
}

// ============================================================================
// Context
// ============================================================================

TEST(ConfidenceScorerTest, ContextTerms) {
    MatchContext context;

    context.before = "api_key = ";
    EXPECT_NEAR(ConfidenceScorer::contextAdjustment(context), ConfidenceScorer::ASSIGNMENT_BONUS, EPS);

    context.before = "getenv(";
    EXPECT_NEAR(ConfidenceScorer::contextAdjustment(context), ConfidenceScorer::ENVIRONMENT_BONUS, EPS);

    context.before = "config.";
    EXPECT_NEAR(ConfidenceScorer::contextAdjustment(context), ConfidenceScorer::CONFIG_ACCESS_BONUS, EPS);

    context.before = "// ";
    EXPECT_NEAR(ConfidenceScorer::contextAdjustment(context), -ConfidenceScorer::COMMENT_PENALTY, EPS);

    context.before = "sample ";
    EXPECT_NEAR(ConfidenceScorer::contextAdjustment(context),
                -ConfidenceScorer::FALSE_POSITIVE_CONTEXT_PENALTY, EPS);

    context.before = "";
    context.after = " (DUMMY)";
    EXPECT_NEAR(ConfidenceScorer::contextAdjustment(context),
                -ConfidenceScorer::FALSE_POSITIVE_CONTEXT_PENALTY, EPS);
}

TEST(ConfidenceScorerTest, ContextAnalysisCanBeDisabled) {
    auto pattern = compile(makePattern("p", "x"));
    ConfidenceScorer scorer(nullptr, false);

    auto parts = scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE, "// mock "), pattern);
    EXPECT_DOUBLE_EQ(parts.context, 0.0);
}

// ============================================================================
// Value terms
// ============================================================================

TEST(ConfidenceScorerTest, BaseAndEntropy) {
    auto pattern = compile(makePattern("p", "x"));
    ConfidenceScorer scorer;

    EXPECT_NEAR(scorer.score(makeMatch(HIGH_ENTROPY_VALUE), pattern), 0.9, EPS);

    // Low entropy and an all-letter value: 0.8 - 0.2 - 0.2 = 0.4, then secrets scale by 0.8
    EXPECT_NEAR(scorer.score(makeMatch("aaaa"), pattern), 0.32, EPS);

    // Entropy between the thresholds adds nothing
    auto parts = scorer.breakdown(makeMatch("abcdefg1"), pattern);
    EXPECT_DOUBLE_EQ(parts.entropy, 0.0);
    EXPECT_DOUBLE_EQ(parts.format, 0.0);
    EXPECT_NEAR(parts.total, 0.8, EPS);
}

TEST(ConfidenceScorerTest, FormatTerms) {
    EXPECT_DOUBLE_EQ(ConfidenceScorer::formatAdjustment(HIGH_ENTROPY_VALUE), 0.0);

    EXPECT_NEAR(ConfidenceScorer::formatAdjustment("QWxhZGRpbjpvcGVuIHNlc2FtZQ=="),
                ConfidenceScorer::BASE64_BONUS, EPS);
    EXPECT_NEAR(ConfidenceScorer::formatAdjustment("123e4567-E89B-12d3-a456-426614174000"),
                ConfidenceScorer::UUID_BONUS, EPS);
    EXPECT_NEAR(ConfidenceScorer::formatAdjustment("eyJhbGciOiJIUzI1NiJ9.eyJzdWIiOiIxIn0.c2ln"),
                ConfidenceScorer::JWT_BONUS, EPS);

    // Long hex is also base64-shaped; 20-31 hex chars are only base64
    EXPECT_NEAR(ConfidenceScorer::formatAdjustment("9f86d081884c7d659a2feaa0c55ad015"),
                ConfidenceScorer::BASE64_BONUS + ConfidenceScorer::HEX_BONUS, EPS);
    EXPECT_NEAR(ConfidenceScorer::formatAdjustment("9f86d081884c7d659a2f"),
                ConfidenceScorer::BASE64_BONUS, EPS);

    for (const char* value : {"true", "No", "OFF", "disabled", "12345", "https://api.internal/v1", "hunter"}) {
        EXPECT_NEAR(ConfidenceScorer::formatAdjustment(value), -ConfidenceScorer::NON_SECRET_PENALTY, EPS)
            << value;
    }

    // A long all-letter run is base64-shaped and a plain word at once
    EXPECT_NEAR(ConfidenceScorer::formatAdjustment("abcdefghijklmnopqrstuvwxyz"),
                ConfidenceScorer::BASE64_BONUS - ConfidenceScorer::NON_SECRET_PENALTY, EPS);
}

TEST(ConfidenceScorerTest, FormatTermFeedsTotal) {
    auto pattern = compile(makePattern("p", "x", 0.6));
    ConfidenceScorer scorer;

    auto parts = scorer.breakdown(makeMatch("9f86d081884c7d659a2feaa0c55ad015"), pattern);
    EXPECT_NEAR(parts.format, 0.18, EPS);
    EXPECT_NEAR(parts.entropy, ConfidenceScorer::HIGH_ENTROPY_BONUS, EPS);
    EXPECT_NEAR(parts.total, 0.88, EPS);
}

TEST(ConfidenceScorerTest, LengthBonusRespectsBounds) {
    auto def = makePattern("p", "x");
    def.minLength = 4;
    ConfidenceScorer scorer;

    EXPECT_NEAR(scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE), compile(def)).length,
                ConfidenceScorer::LENGTH_BONUS, EPS);
    EXPECT_DOUBLE_EQ(scorer.breakdown(makeMatch("abc"), compile(def)).length, 0.0);

    def.maxLength = 8;
    EXPECT_DOUBLE_EQ(scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE), compile(def)).length, 0.0);
}

TEST(ConfidenceScorerTest, ValidatorBonus) {
    auto def = makePattern("p", "x");
    def.validator = [](std::string_view value) { return value.size() == 16; };
    ConfidenceScorer scorer;

    EXPECT_NEAR(scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE), compile(def)).validator,
                ConfidenceScorer::VALIDATOR_BONUS, EPS);
    EXPECT_DOUBLE_EQ(scorer.breakdown(makeMatch("short"), compile(def)).validator, 0.0);
}

TEST(ConfidenceScorerTest, ThrowingValidatorCountsAsFailed) {
    auto def = makePattern("p", "x");
    def.validator = [](std::string_view) -> bool { throw std::runtime_error("bad input"); };
    ConfidenceScorer scorer;

    ScoreBreakdown parts;
    EXPECT_NO_THROW(parts = scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE), compile(def)));
    EXPECT_DOUBLE_EQ(parts.validator, 0.0);
    EXPECT_NEAR(parts.total, 0.9, EPS);
}

TEST(ConfidenceScorerTest, ValidatorThrowingNonStandardTypeCountsAsFailed) {
    auto def = makePattern("p", "x");
    def.validator = [](std::string_view) -> bool { throw 42; };
    ConfidenceScorer scorer;

    ScoreBreakdown parts;
    EXPECT_NO_THROW(parts = scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE), compile(def)));
    EXPECT_DOUBLE_EQ(parts.validator, 0.0);
    EXPECT_NEAR(parts.total, 0.9, EPS);
}

// ============================================================================
// Category and severity
// ============================================================================

TEST(ConfidenceScorerTest, CategoryFactors) {
    ConfidenceScorer scorer;
    auto match = makeMatch(HIGH_ENTROPY_VALUE);

    // 0.4 + 0.1 = 0.5 is below 0.6, secrets scale by 0.8
    EXPECT_NEAR(scorer.score(match, compile(makePattern("s", "x", 0.4))), 0.4, EPS);

    // 0.5 + 0.1 = 0.6 is below 0.7, vulnerabilities scale by 0.9
    EXPECT_NEAR(scorer.score(match, compile(makePattern("v", "x", 0.5, "vulnerabilities"))), 0.54, EPS);

    // Configurations always scale by 1.1
    auto parts = scorer.breakdown(match, compile(makePattern("c", "x", 0.5, "configurations")));
    EXPECT_NEAR(parts.category, 0.06, EPS);
    EXPECT_NEAR(parts.total, 0.66, EPS);
}

TEST(ConfidenceScorerTest, SeverityFactors) {
    ConfidenceScorer scorer;
    auto match = makeMatch(HIGH_ENTROPY_VALUE);

    // 0.6 + 0.1 = 0.7 is below 0.8, critical scales by 0.7
    EXPECT_NEAR(scorer.score(match, compile(makePattern("c", "x", 0.6, "secrets", "critical"))), 0.49, EPS);
    EXPECT_NEAR(scorer.score(match, compile(makePattern("c2", "x", 0.75, "secrets", "critical"))), 0.85, EPS);

    EXPECT_NEAR(scorer.score(match, compile(makePattern("l", "x", 0.6, "secrets", "low"))), 0.77, EPS);
}

TEST(ConfidenceScorerTest, TotalIsClamped) {
    auto def = makePattern("p", "x", 1.0);
    def.validator = [](std::string_view) { return true; };
    ConfidenceScorer scorer;

    auto high = scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE, "getenv("), compile(def));
    EXPECT_DOUBLE_EQ(high.total, 1.0);

    auto low = scorer.breakdown(makeMatch("aaaa", "// fake "), compile(makePattern("q", "x", 0.1)));
    EXPECT_DOUBLE_EQ(low.total, 0.0);

    EXPECT_DOUBLE_EQ(clampConfidence(1.7), 1.0);
    EXPECT_DOUBLE_EQ(clampConfidence(-0.2), 0.0);
    EXPECT_DOUBLE_EQ(clampConfidence(0.42), 0.42);
}

TEST(ConfidenceScorerTest, BreakdownSumsToTotal) {
    auto def = makePattern("p", "x", 0.5, "configurations", "low");
    def.minLength = 8;
    ConfidenceScorer scorer;

    auto parts = scorer.breakdown(makeMatch(HIGH_ENTROPY_VALUE, "config.token = "), compile(def));
    const double sum = parts.base + parts.context + parts.length + parts.validator + parts.format +
                       parts.entropy + parts.feedback + parts.category + parts.severity;
    EXPECT_NEAR(clampConfidence(sum), parts.total, EPS);
}

// ============================================================================
// Feedback
// ============================================================================

TEST(ConfidenceScorerTest, FeedbackFromLearningStore) {
    LearningStore learning;
    auto pattern = compile(makePattern("p", "x"));
    ConfidenceScorer scorer(&learning);

    auto match = makeMatch(HIGH_ENTROPY_VALUE);
    EXPECT_DOUBLE_EQ(scorer.breakdown(match, pattern).feedback, 0.0);

    ASSERT_TRUE(learning.recordFeedback(match, "p", true).isSuccess());
    EXPECT_NEAR(scorer.breakdown(match, pattern).feedback, -LearningStore::PER_VOTE, EPS);

    // Seeded placeholder without any recorded verdict
    EXPECT_NEAR(scorer.breakdown(makeMatch("changeme"), pattern).feedback,
                -LearningStore::MAX_PENALTY, EPS);

    scorer.setLearningStore(nullptr);
    EXPECT_DOUBLE_EQ(scorer.breakdown(makeMatch("changeme"), pattern).feedback, 0.0);
}
