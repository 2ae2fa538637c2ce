/**
 * @file PatternRegistry.hpp
 * @brief Validated catalog of detection patterns
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * A PatternDefinition is the declarative form of a pattern, as written in
 * the built-in catalog or loaded from configuration. Registration validates
 * it, compiles its regex and filters, and stores an immutable
 * CompiledPattern indexed by id and by category.
 */

#pragma once

#ifndef ARGUS_CORE_PATTERN_REGISTRY_HPP
#define ARGUS_CORE_PATTERN_REGISTRY_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <Argus/Core/Finding.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Argus::Core {

// ============================================================================
// Pattern Definition
// ============================================================================

/**
 * @brief Predicate confirming that an extracted value has the expected shape
 *
 * May throw; a throwing validator counts as "did not validate".
 */
using Validator = std::function<bool(std::string_view value)>;

/**
 * @brief Caller-supplied false-positive test over a whole candidate
 *
 * Returns true to reject the candidate. A throw aborts the pattern's pass
 * with FilterFailed.
 */
using FilterPredicate = std::function<bool(const RawMatch& match)>;

/**
 * @brief Declarative false-positive filter
 */
struct FalsePositiveFilter {
    enum class Kind : uint8_t {
        Regex,    ///< Regex tested against the extracted value and the full match
        Keyword,  ///< Substring looked up in the lower-cased context window
        Predicate ///< Arbitrary test; expression is its display name
    };

    Kind kind = Kind::Regex;
    std::string expression;
    bool caseInsensitive = true;
    FilterPredicate predicate;

    static FalsePositiveFilter regex(std::string expression, bool caseInsensitive = true) {
        return FalsePositiveFilter{Kind::Regex, std::move(expression), caseInsensitive};
    }

    static FalsePositiveFilter keyword(std::string word) {
        return FalsePositiveFilter{Kind::Keyword, std::move(word), true};
    }

    static FalsePositiveFilter custom(std::string name, FilterPredicate predicate) {
        return FalsePositiveFilter{Kind::Predicate, std::move(name), true, std::move(predicate)};
    }
};

/**
 * @brief Pattern as declared, before validation
 *
 * Category and severity are names so that definitions loaded from text are
 * checked against the allow-lists at registration.
 */
struct PatternDefinition {
    std::string id;
    std::string name;
    std::string category = "secrets";
    std::string severity = "medium";
    std::string regex;                        ///< RE2 source text
    bool caseInsensitive = true;
    std::optional<size_t> extractGroup;       ///< Capture group holding the value
    double confidence = 0.8;                  ///< Base confidence
    std::optional<size_t> minLength;
    std::optional<size_t> maxLength;
    Validator validator;
    std::vector<FalsePositiveFilter> falsePositiveFilters;
    std::string description;
};

// ============================================================================
// Compiled Pattern
// ============================================================================

using RegexPtr = std::shared_ptr<const re2::RE2>;

/**
 * @brief Filter with its regex compiled
 */
struct CompiledFilter {
    FalsePositiveFilter::Kind kind = FalsePositiveFilter::Kind::Regex;
    std::string expression;   ///< Source text, lower-cased for keywords
    RegexPtr regex;              ///< Regex filters only
    FilterPredicate predicate;   ///< Predicate filters only
};

/**
 * @brief Registered, immutable pattern
 */
struct CompiledPattern {
    std::string id;
    std::string name;
    PatternCategory category = PatternCategory::Secrets;
    Severity severity = Severity::Medium;
    std::string source;
    RegexPtr regex;
    std::optional<size_t> extractGroup;
    double confidence = 0.8;
    std::optional<size_t> minLength;
    std::optional<size_t> maxLength;
    Validator validator;
    std::vector<CompiledFilter> filters;
    std::string description;
    size_t order = 0;         ///< Registration order

    [[nodiscard]] PatternSummary summary() const {
        return PatternSummary{id, name, category, severity};
    }
};

using PatternPtr = std::shared_ptr<const CompiledPattern>;

// ============================================================================
// Registry
// ============================================================================

/**
 * @brief Thread-safe pattern catalog
 *
 * Registration happens at startup; lookups take a shared lock and return
 * shared pointers, so a pattern outlives a concurrent clear().
 */
class PatternRegistry {
public:
    /**
     * @brief Per-category counts
     */
    struct Statistics {
        size_t totalPatterns = 0;
        std::map<PatternCategory, size_t> categoryCounts;
        std::vector<PatternSummary> patterns;   ///< Registration order
    };

    PatternRegistry() = default;
    ~PatternRegistry() = default;

    PatternRegistry(const PatternRegistry&) = delete;
    PatternRegistry& operator=(const PatternRegistry&) = delete;

    /**
     * @brief Validate, compile and index one definition
     * @return Success, or a Validation error code describing the first problem
     */
    Result<void> registerPattern(const PatternDefinition& definition);

    /**
     * @brief Register definitions in order, stopping at the first failure
     *
     * Definitions before the failing one stay registered.
     */
    Result<void> registerPatterns(const std::vector<PatternDefinition>& definitions);

    /**
     * @brief Look up a pattern by id
     */
    [[nodiscard]] PatternPtr find(const std::string& id) const;

    /**
     * @brief Patterns in any of @p categories, in registration order
     */
    [[nodiscard]] std::vector<PatternPtr> patternsFor(const std::vector<PatternCategory>& categories) const;

    /**
     * @brief All patterns in registration order
     */
    [[nodiscard]] std::vector<PatternPtr> all() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] Statistics getStats() const;

    /**
     * @brief Remove every pattern
     */
    void clear();

private:
    mutable std::shared_mutex m_mutex;
    std::vector<PatternPtr> m_patterns;
    std::unordered_map<std::string, PatternPtr> m_byId;
    std::map<PatternCategory, std::vector<PatternPtr>> m_byCategory;
};

/**
 * @brief Validate and compile a definition without registering it
 */
[[nodiscard]] Result<CompiledPattern> compilePattern(const PatternDefinition& definition);

/**
 * @brief Compile @p source with the options every detection regex uses
 *
 * Latin-1, linear-time RE2. Compile errors are left to the caller to report
 * through ok() and error().
 */
[[nodiscard]] RegexPtr compileRegex(const std::string& source, bool caseInsensitive);

} // namespace Argus::Core

#endif // ARGUS_CORE_PATTERN_REGISTRY_HPP
