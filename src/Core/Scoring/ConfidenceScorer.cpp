/**
 * @file ConfidenceScorer.cpp
 * @brief Context, entropy, validator and feedback scoring
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/ConfidenceScorer.hpp>
#include <Argus/Core/LearningStore.hpp>
#include <Argus/Core/Logger.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <exception>
#include <vector>

namespace Argus::Core {

namespace {

/**
 * @brief Context and value-format regexes, compiled once
 */
struct ContextRules {
    std::vector<RegexPtr> assignment;
    RegexPtr falsePositive;

    RegexPtr base64;
    RegexPtr hex;
    RegexPtr uuid;
    RegexPtr jwt;
    std::vector<RegexPtr> nonSecret;

    ContextRules() {
        assignment.push_back(compileRegex(R"((?:const|let|var)\s+\w+\s*=\s*$)", false));
        assignment.push_back(compileRegex(R"(\w+\s*[:=]\s*$)", false));
        assignment.push_back(compileRegex(R"(['"`]\s*$)", false));
        falsePositive = compileRegex("example|placeholder|test|demo|sample|mock|fake|dummy", true);

        base64 = compileRegex(R"([A-Za-z0-9+/]{20,}={0,2})", false);
        hex = compileRegex(R"([a-fA-F0-9]{32,})", false);
        uuid = compileRegex(R"([0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})", true);
        jwt = compileRegex(R"(eyJ[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+\.[A-Za-z0-9_-]*)", false);

        nonSecret.push_back(compileRegex("true|false|yes|no|on|off|enabled|disabled", true));
        nonSecret.push_back(compileRegex(R"(\d+)", false));
        nonSecret.push_back(compileRegex("[a-zA-Z]+", false));
    }
};

const ContextRules& rules() {
    static const ContextRules instance;
    return instance;
}

constexpr std::array<std::string_view, 6> ENVIRONMENT_MARKERS = {
    "process.env.", "process.env[", "ENV[", "getenv(", "os.environ", "System.getenv"
};

constexpr std::array<std::string_view, 4> CONFIG_MARKERS = {
    "config.", "settings.", "options.", "credentials."
};

template<size_t N>
bool containsAny(std::string_view text, const std::array<std::string_view, N>& markers) {
    return std::any_of(markers.begin(), markers.end(), [&](std::string_view marker) {
        return text.find(marker) != std::string_view::npos;
    });
}

bool searchAny(const std::string& text, const std::vector<RegexPtr>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(), [&](const RegexPtr& re) {
        return RE2::PartialMatch(text, *re);
    });
}

bool matchesWhole(std::string_view value, const RE2& re) {
    return RE2::FullMatch(re2::StringPiece(value.data(), value.size()), re);
}

bool startsWithHttp(std::string_view value) noexcept {
    auto hasPrefix = [value](std::string_view prefix) {
        return value.size() >= prefix.size() &&
               std::equal(prefix.begin(), prefix.end(), value.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    };
    return hasPrefix("http://") || hasPrefix("https://");
}

bool unclosed(std::string_view text, std::string_view open, std::string_view close) {
    const size_t at = text.rfind(open);
    if (at == std::string_view::npos) {
        return false;
    }
    return text.find(close, at + open.size()) == std::string_view::npos;
}

double categoryFactor(PatternCategory category, double running) noexcept {
    switch (category) {
        case PatternCategory::Secrets:
            return running < 0.6 ? 0.8 : 1.0;
        case PatternCategory::Vulnerabilities:
            return running < 0.7 ? 0.9 : 1.0;
        case PatternCategory::Configurations:
            return 1.1;
    }
    return 1.0;
}

double severityFactor(Severity severity, double running) noexcept {
    switch (severity) {
        case Severity::Critical:
            return running < 0.8 ? 0.7 : 1.0;
        case Severity::Low:
            return 1.1;
        default:
            return 1.0;
    }
}

} // anonymous namespace

// ============================================================================
// Static helpers
// ============================================================================

double ConfidenceScorer::shannonEntropy(std::string_view value) noexcept {
    if (value.empty()) {
        return 0.0;
    }

    std::array<size_t, 256> counts{};
    for (char c : value) {
        counts[static_cast<unsigned char>(c)]++;
    }

    const double length = static_cast<double>(value.size());
    double entropy = 0.0;
    for (size_t count : counts) {
        if (count == 0) {
            continue;
        }
        const double p = static_cast<double>(count) / length;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

bool ConfidenceScorer::isInComment(std::string_view before) noexcept {
    const size_t lineStart = before.rfind('\n');
    const std::string_view lastLine =
        lineStart == std::string_view::npos ? before : before.substr(lineStart + 1);

    if (lastLine.find("//") != std::string_view::npos || lastLine.find('#') != std::string_view::npos) {
        return true;
    }
    return unclosed(before, "/*", "*/") || unclosed(before, "<!--", "-->");
}

double ConfidenceScorer::contextAdjustment(const MatchContext& context) {
    const auto& r = rules();
    double adjustment = 0.0;

    if (searchAny(context.before, r.assignment)) {
        adjustment += ASSIGNMENT_BONUS;
    }
    if (containsAny(context.before, ENVIRONMENT_MARKERS)) {
        adjustment += ENVIRONMENT_BONUS;
    }
    if (containsAny(context.before, CONFIG_MARKERS)) {
        adjustment += CONFIG_ACCESS_BONUS;
    }
    if (RE2::PartialMatch(context.before, *r.falsePositive) ||
        RE2::PartialMatch(context.after, *r.falsePositive)) {
        adjustment -= FALSE_POSITIVE_CONTEXT_PENALTY;
    }
    if (isInComment(context.before)) {
        adjustment -= COMMENT_PENALTY;
    }
    return adjustment;
}

double ConfidenceScorer::formatAdjustment(std::string_view value) {
    const auto& r = rules();
    double adjustment = 0.0;

    if (matchesWhole(value, *r.base64)) {
        adjustment += BASE64_BONUS;
    }
    if (matchesWhole(value, *r.hex)) {
        adjustment += HEX_BONUS;
    }
    if (matchesWhole(value, *r.uuid)) {
        adjustment += UUID_BONUS;
    }
    if (matchesWhole(value, *r.jwt)) {
        adjustment += JWT_BONUS;
    }

    const bool nonSecret = startsWithHttp(value) ||
        std::any_of(r.nonSecret.begin(), r.nonSecret.end(),
                    [&](const RegexPtr& re) { return matchesWhole(value, *re); });
    if (nonSecret) {
        adjustment -= NON_SECRET_PENALTY;
    }
    return adjustment;
}

// ============================================================================
// Scoring
// ============================================================================

bool ConfidenceScorer::runValidator(const CompiledPattern& pattern, const std::string& value) const {
    if (!pattern.validator) {
        return false;
    }
    try {
        return pattern.validator(value);
    } catch (const std::exception& e) {
        ARGUS_LOG_DEBUG_F("Validator for pattern '%s' failed: %s (%s)", pattern.id.c_str(), e.what(),
                          std::string(getErrorMessage(ErrorCode::ValidatorFailed)).c_str());
        return false;
    } catch (...) {
        ARGUS_LOG_DEBUG_F("Validator for pattern '%s' threw a non-standard exception (%s)", pattern.id.c_str(),
                          std::string(getErrorMessage(ErrorCode::ValidatorFailed)).c_str());
        return false;
    }
}

ScoreBreakdown ConfidenceScorer::breakdown(const RawMatch& match, const CompiledPattern& pattern) const {
    ScoreBreakdown parts;
    parts.base = pattern.confidence;

    if (m_contextAnalysis) {
        parts.context = contextAdjustment(match.context);
    }

    const size_t length = match.value.size();
    if (pattern.minLength && length >= *pattern.minLength &&
        (!pattern.maxLength || length <= *pattern.maxLength)) {
        parts.length = LENGTH_BONUS;
    }

    if (runValidator(pattern, match.value)) {
        parts.validator = VALIDATOR_BONUS;
    }
    parts.format = formatAdjustment(match.value);

    const double entropy = shannonEntropy(match.value);
    if (entropy > HIGH_ENTROPY) {
        parts.entropy = HIGH_ENTROPY_BONUS;
    } else if (entropy < LOW_ENTROPY) {
        parts.entropy = -LOW_ENTROPY_PENALTY;
    }

    if (m_learning != nullptr) {
        parts.feedback = m_learning->feedbackAdjustment(pattern.id, match.value);
    }

    double running = parts.base + parts.context + parts.length + parts.validator +
                     parts.format + parts.entropy + parts.feedback;

    const double afterCategory = running * categoryFactor(pattern.category, running);
    parts.category = afterCategory - running;
    running = afterCategory;

    const double afterSeverity = running * severityFactor(pattern.severity, running);
    parts.severity = afterSeverity - running;
    running = afterSeverity;

    parts.total = clampConfidence(running);
    return parts;
}

double ConfidenceScorer::score(const RawMatch& match, const CompiledPattern& pattern) const {
    return breakdown(match, pattern).total;
}

} // namespace Argus::Core
