/**
 * @file test_pattern_registry.cpp
 * @brief Unit tests for pattern validation, compilation and lookup
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/PatternRegistry.hpp>
#include <Argus/Core/PatternCatalog.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace Argus;
using namespace Argus::Core;
using namespace Argus::Testing;

// ============================================================================
// Validation
// ============================================================================

TEST(PatternRegistryTest, RegistersValidPatternWithDefaults) {
    PatternRegistry registry;

    PatternDefinition def;
    def.id = "generic-token";
    def.name = "Generic Token";
    def.regex = "tok_[a-z0-9]{8}";

    ASSERT_TRUE(registry.registerPattern(def).isSuccess());

    auto pattern = registry.find("generic-token");
    ASSERT_NE(pattern, nullptr);
    EXPECT_EQ(pattern->category, PatternCategory::Secrets);
    EXPECT_EQ(pattern->severity, Severity::Medium);
    EXPECT_DOUBLE_EQ(pattern->confidence, 0.8);
    EXPECT_TRUE(pattern->filters.empty());
    EXPECT_EQ(pattern->order, 0u);
}

TEST(PatternRegistryTest, MissingRequiredFields) {
    PatternRegistry registry;

    auto noId = makePattern("", "abc");
    EXPECT_EQ(registry.registerPattern(noId).error(), ErrorCode::MissingField);

    auto noRegex = makePattern("no-regex", "");
    EXPECT_EQ(registry.registerPattern(noRegex).error(), ErrorCode::MissingField);

    auto noName = makePattern("no-name", "abc");
    noName.name.clear();
    EXPECT_EQ(registry.registerPattern(noName).error(), ErrorCode::MissingField);

    EXPECT_EQ(registry.size(), 0u);
}

TEST(PatternRegistryTest, RejectsValuesOutsideAllowLists) {
    PatternRegistry registry;

    EXPECT_EQ(registry.registerPattern(makePattern("a", "x", 0.8, "credentials")).error(),
              ErrorCode::InvalidCategory);
    EXPECT_EQ(registry.registerPattern(makePattern("b", "x", 0.8, "secrets", "urgent")).error(),
              ErrorCode::InvalidSeverity);
    EXPECT_EQ(registry.registerPattern(makePattern("c", "x", 1.5)).error(),
              ErrorCode::InvalidConfidence);
    EXPECT_EQ(registry.registerPattern(makePattern("d", "x", -0.1)).error(),
              ErrorCode::InvalidConfidence);
}

TEST(PatternRegistryTest, AcceptsCaseInsensitiveNames) {
    PatternRegistry registry;
    ASSERT_TRUE(registry.registerPattern(makePattern("a", "x", 0.8, "Configurations", "CRITICAL")).isSuccess());

    auto pattern = registry.find("a");
    ASSERT_NE(pattern, nullptr);
    EXPECT_EQ(pattern->category, PatternCategory::Configurations);
    EXPECT_EQ(pattern->severity, Severity::Critical);
}

TEST(PatternRegistryTest, RejectsBadRegexAndBounds) {
    PatternRegistry registry;

    EXPECT_EQ(registry.registerPattern(makePattern("bad-regex", "([a-z")).error(), ErrorCode::InvalidRegex);

    auto bounds = makePattern("bounds", "abc");
    bounds.minLength = 10;
    bounds.maxLength = 5;
    EXPECT_EQ(registry.registerPattern(bounds).error(), ErrorCode::InvalidLengthBounds);

    auto group = makePattern("group", "a(b)c");
    group.extractGroup = 2;
    EXPECT_EQ(registry.registerPattern(group).error(), ErrorCode::PatternInvalid);

    auto filter = makePattern("filter", "abc");
    filter.falsePositiveFilters.push_back(FalsePositiveFilter::regex("[unclosed"));
    EXPECT_EQ(registry.registerPattern(filter).error(), ErrorCode::InvalidFilter);

    EXPECT_EQ(registry.size(), 0u);
}

TEST(PatternRegistryTest, RejectsDuplicateIds) {
    PatternRegistry registry;
    ASSERT_TRUE(registry.registerPattern(makePattern("dup", "abc")).isSuccess());

    auto result = registry.registerPattern(makePattern("dup", "xyz"));
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::DuplicatePattern);
    EXPECT_EQ(getErrorKindName(result.error()), "ValidationError");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(PatternRegistryTest, RegisterPatternsStopsAtFirstFailure) {
    PatternRegistry registry;
    std::vector<PatternDefinition> defs = {
        makePattern("one", "1"),
        makePattern("two", "("),
        makePattern("three", "3"),
    };

    auto result = registry.registerPatterns(defs);
    EXPECT_EQ(result.error(), ErrorCode::InvalidRegex);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_NE(registry.find("one"), nullptr);
    EXPECT_EQ(registry.find("three"), nullptr);
}

// ============================================================================
// Lookup
// ============================================================================

TEST(PatternRegistryTest, PatternsForKeepsRegistrationOrder) {
    PatternRegistry registry;
    ASSERT_TRUE(registry.registerPattern(makePattern("cfg", "c", 0.8, "configurations")).isSuccess());
    ASSERT_TRUE(registry.registerPattern(makePattern("sec1", "s")).isSuccess());
    ASSERT_TRUE(registry.registerPattern(makePattern("vuln", "v", 0.8, "vulnerabilities")).isSuccess());
    ASSERT_TRUE(registry.registerPattern(makePattern("sec2", "t")).isSuccess());

    auto selected = registry.patternsFor({PatternCategory::Secrets, PatternCategory::Configurations,
                                          PatternCategory::Secrets});
    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(selected[0]->id, "cfg");
    EXPECT_EQ(selected[1]->id, "sec1");
    EXPECT_EQ(selected[2]->id, "sec2");

    EXPECT_TRUE(registry.patternsFor({}).empty());
}

TEST(PatternRegistryTest, StatsCountPerCategory) {
    PatternRegistry registry;
    ASSERT_TRUE(registry.registerPattern(makePattern("a", "a")).isSuccess());
    ASSERT_TRUE(registry.registerPattern(makePattern("b", "b")).isSuccess());
    ASSERT_TRUE(registry.registerPattern(makePattern("c", "c", 0.8, "vulnerabilities")).isSuccess());

    auto stats = registry.getStats();
    EXPECT_EQ(stats.totalPatterns, 3u);
    EXPECT_EQ(stats.categoryCounts[PatternCategory::Secrets], 2u);
    EXPECT_EQ(stats.categoryCounts[PatternCategory::Vulnerabilities], 1u);
    ASSERT_EQ(stats.patterns.size(), 3u);
    EXPECT_EQ(stats.patterns[2].id, "c");

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.find("a"), nullptr);
}

TEST(PatternRegistryTest, IsolatedInstances) {
    PatternRegistry first;
    PatternRegistry second;
    ASSERT_TRUE(first.registerPattern(makePattern("only-first", "x")).isSuccess());

    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(second.size(), 0u);
    EXPECT_TRUE(second.registerPattern(makePattern("only-first", "y")).isSuccess());
}

// ============================================================================
// Built-in catalog
// ============================================================================

TEST(PatternCatalogTest, BuiltInPatternsRegisterCleanly) {
    PatternRegistry registry;
    auto result = registerBuiltInPatterns(registry);
    ASSERT_TRUE(result.isSuccess()) << getErrorMessage(result.error());

    auto stats = registry.getStats();
    EXPECT_EQ(stats.totalPatterns, builtInPatterns().size());
    EXPECT_GT(stats.categoryCounts[PatternCategory::Secrets], 0u);
    EXPECT_GT(stats.categoryCounts[PatternCategory::Vulnerabilities], 0u);
    EXPECT_GT(stats.categoryCounts[PatternCategory::Configurations], 0u);

    std::set<std::string> ids;
    for (const auto& summary : stats.patterns) {
        EXPECT_TRUE(ids.insert(summary.id).second) << summary.id;
    }
    EXPECT_NE(registry.find("aws-access-key"), nullptr);
    EXPECT_NE(registry.find("private-key"), nullptr);
}
