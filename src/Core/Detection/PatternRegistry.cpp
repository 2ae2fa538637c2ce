/**
 * @file PatternRegistry.cpp
 * @brief Pattern validation, compilation and indexing
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/PatternRegistry.hpp>
#include <Argus/Core/Logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>

namespace Argus::Core {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

Result<CompiledFilter> compileFilter(const std::string& patternId, const FalsePositiveFilter& filter) {
    if (filter.expression.empty()) {
        ARGUS_LOG_ERROR_F("Pattern '%s' has an empty false-positive filter", patternId.c_str());
        return ErrorCode::InvalidFilter;
    }

    CompiledFilter compiled;
    compiled.kind = filter.kind;

    if (filter.kind == FalsePositiveFilter::Kind::Keyword) {
        compiled.expression = toLower(filter.expression);
        return compiled;
    }

    compiled.expression = filter.expression;
    if (filter.kind == FalsePositiveFilter::Kind::Predicate) {
        if (!filter.predicate) {
            ARGUS_LOG_ERROR_F("Pattern '%s' filter '%s' has no predicate",
                              patternId.c_str(), filter.expression.c_str());
            return ErrorCode::InvalidFilter;
        }
        compiled.predicate = filter.predicate;
        return compiled;
    }

    compiled.regex = compileRegex(filter.expression, filter.caseInsensitive);
    if (!compiled.regex->ok()) {
        ARGUS_LOG_ERROR_F("Pattern '%s' filter /%s/ does not compile: %s",
                          patternId.c_str(), filter.expression.c_str(), compiled.regex->error().c_str());
        return ErrorCode::InvalidFilter;
    }
    return compiled;
}

} // anonymous namespace

// ============================================================================
// Compilation
// ============================================================================

RegexPtr compileRegex(const std::string& source, bool caseInsensitive) {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_case_sensitive(!caseInsensitive);
    options.set_log_errors(false);
    return std::make_shared<const RE2>(source, options);
}

Result<CompiledPattern> compilePattern(const PatternDefinition& def) {
    if (def.id.empty() || def.name.empty() || def.regex.empty()) {
        ARGUS_LOG_ERROR_F("Pattern '%s' is missing id, name or regex", def.id.c_str());
        return ErrorCode::MissingField;
    }

    auto category = parseCategory(def.category);
    if (!category) {
        ARGUS_LOG_ERROR_F("Pattern '%s' has unknown category '%s'", def.id.c_str(), def.category.c_str());
        return ErrorCode::InvalidCategory;
    }

    auto severity = parseSeverity(def.severity);
    if (!severity) {
        ARGUS_LOG_ERROR_F("Pattern '%s' has unknown severity '%s'", def.id.c_str(), def.severity.c_str());
        return ErrorCode::InvalidSeverity;
    }

    if (!std::isfinite(def.confidence) || def.confidence < 0.0 || def.confidence > 1.0) {
        ARGUS_LOG_ERROR_F("Pattern '%s' confidence %f is outside [0, 1]", def.id.c_str(), def.confidence);
        return ErrorCode::InvalidConfidence;
    }

    if (def.minLength && def.maxLength && *def.minLength > *def.maxLength) {
        ARGUS_LOG_ERROR_F("Pattern '%s' has minLength %zu > maxLength %zu",
                          def.id.c_str(), *def.minLength, *def.maxLength);
        return ErrorCode::InvalidLengthBounds;
    }

    CompiledPattern compiled;
    compiled.id = def.id;
    compiled.name = def.name;
    compiled.category = *category;
    compiled.severity = *severity;
    compiled.source = def.regex;
    compiled.extractGroup = def.extractGroup;
    compiled.confidence = def.confidence;
    compiled.minLength = def.minLength;
    compiled.maxLength = def.maxLength;
    compiled.validator = def.validator;
    compiled.description = def.description;

    compiled.regex = compileRegex(def.regex, def.caseInsensitive);
    if (!compiled.regex->ok()) {
        ARGUS_LOG_ERROR_F("Pattern '%s' regex does not compile: %s",
                          def.id.c_str(), compiled.regex->error().c_str());
        return ErrorCode::InvalidRegex;
    }

    const int groups = compiled.regex->NumberOfCapturingGroups();
    if (def.extractGroup && *def.extractGroup > static_cast<size_t>(groups)) {
        ARGUS_LOG_ERROR_F("Pattern '%s' extracts group %zu but the regex has %d groups",
                          def.id.c_str(), *def.extractGroup, groups);
        return ErrorCode::PatternInvalid;
    }

    compiled.filters.reserve(def.falsePositiveFilters.size());
    for (const auto& filter : def.falsePositiveFilters) {
        auto result = compileFilter(def.id, filter);
        if (result.isFailure()) {
            return result.error();
        }
        compiled.filters.push_back(std::move(result.value()));
    }

    return compiled;
}

// ============================================================================
// PatternRegistry
// ============================================================================

Result<void> PatternRegistry::registerPattern(const PatternDefinition& definition) {
    auto compiled = compilePattern(definition);
    if (compiled.isFailure()) {
        return compiled.error();
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_byId.count(definition.id) != 0) {
        ARGUS_LOG_ERROR_F("Pattern '%s' is already registered", definition.id.c_str());
        return ErrorCode::DuplicatePattern;
    }

    compiled.value().order = m_patterns.size();
    auto pattern = std::make_shared<const CompiledPattern>(std::move(compiled.value()));

    m_patterns.push_back(pattern);
    m_byId.emplace(pattern->id, pattern);
    m_byCategory[pattern->category].push_back(pattern);

    ARGUS_LOG_DEBUG_F("Registered pattern '%s' (%s, %s)", pattern->id.c_str(),
                      categoryToString(pattern->category), severityToString(pattern->severity));
    return Result<void>::Success();
}

Result<void> PatternRegistry::registerPatterns(const std::vector<PatternDefinition>& definitions) {
    for (const auto& def : definitions) {
        ARGUS_TRY(registerPattern(def));
    }
    return Result<void>::Success();
}

PatternPtr PatternRegistry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_byId.find(id);
    return it == m_byId.end() ? nullptr : it->second;
}

std::vector<PatternPtr> PatternRegistry::patternsFor(const std::vector<PatternCategory>& categories) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::vector<PatternCategory> wanted(categories);
    std::sort(wanted.begin(), wanted.end());
    wanted.erase(std::unique(wanted.begin(), wanted.end()), wanted.end());

    std::vector<PatternPtr> result;
    for (PatternCategory category : wanted) {
        auto it = m_byCategory.find(category);
        if (it != m_byCategory.end()) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }

    std::sort(result.begin(), result.end(),
              [](const PatternPtr& a, const PatternPtr& b) { return a->order < b->order; });
    return result;
}

std::vector<PatternPtr> PatternRegistry::all() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_patterns;
}

size_t PatternRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_patterns.size();
}

PatternRegistry::Statistics PatternRegistry::getStats() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    Statistics stats;
    stats.totalPatterns = m_patterns.size();
    for (PatternCategory category : ALL_CATEGORIES) {
        auto it = m_byCategory.find(category);
        stats.categoryCounts[category] = it == m_byCategory.end() ? 0 : it->second.size();
    }
    stats.patterns.reserve(m_patterns.size());
    for (const auto& pattern : m_patterns) {
        stats.patterns.push_back(pattern->summary());
    }
    return stats;
}

void PatternRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_patterns.clear();
    m_byId.clear();
    m_byCategory.clear();
}

} // namespace Argus::Core
