/**
 * @file test_config_loader.cpp
 * @brief Unit tests for configuration loading and engine settings
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Tests configuration loading to ensure:
 * - Path traversal and directory escapes are blocked
 * - Size limits are enforced
 * - Sections, comments and whitespace parse as documented
 * - Invalid engine settings are rejected
 */

#include <Argus/Core/Config.hpp>
#include <Argus/Core/Settings.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace Argus;
using namespace Argus::Config;
using namespace Argus::Testing;

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() /
                  ("argus_config_test_" + randomString(10, static_cast<uint32_t>(
                       std::chrono::steady_clock::now().time_since_epoch().count())));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    std::string createTestConfig(const std::string& name, const std::string& content) {
        fs::path path = tempDir / name;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path.string();
    }

    fs::path tempDir;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigLoaderTest, BasicLoad) {
    std::string path = createTestConfig("argus.conf",
        "# Scanner configuration\n"
        "[scan]\n"
        "confidence_threshold = 0.7\n"
        "max_matches=50\n"
        "\n"
        "[dedup]\n"
        "max_time_ms = 5000 ; five seconds\n");

    ConfigLoader loader;
    auto result = loader.load(path);
    ASSERT_TRUE(result.isSuccess());

    ConfigMap config = result.value();
    EXPECT_EQ(config.size(), 3u);
    EXPECT_EQ(config["scan.confidence_threshold"], "0.7");
    EXPECT_EQ(config["scan.max_matches"], "50");
    EXPECT_EQ(config["dedup.max_time_ms"], "5000");
}

TEST_F(ConfigLoaderTest, MissingFile) {
    ConfigLoader loader;
    auto result = loader.load((tempDir / "absent.conf").string());
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::FileNotFound);
}

TEST_F(ConfigLoaderTest, PathTraversalBlocked) {
    ConfigLoader::Options options;
    options.allowed_directory = (tempDir / "allowed").string();
    createTestConfig("allowed/inside.conf", "a=1\n");
    std::string outside = createTestConfig("outside.conf", "a=1\n");

    ConfigLoader loader(options);
    EXPECT_TRUE(loader.load((tempDir / "allowed" / "inside.conf").string()).isSuccess());

    auto result = loader.load((tempDir / "allowed" / ".." / "outside.conf").string());
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::AccessDenied);

    EXPECT_EQ(loader.load(outside).error(), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, SiblingPrefixIsNotInside) {
    ConfigLoader::Options options;
    options.allowed_directory = (tempDir / "conf").string();
    createTestConfig("conf/ok.conf", "a=1\n");
    std::string sibling = createTestConfig("conf-evil/x.conf", "a=1\n");

    ConfigLoader loader(options);
    EXPECT_EQ(loader.load(sibling).error(), ErrorCode::AccessDenied);
}

TEST_F(ConfigLoaderTest, SizeLimit) {
    ConfigLoader::Options options;
    options.max_file_size = 1024;

    std::string path = createTestConfig("large.conf", std::string(2048, '#'));
    ConfigLoader loader(options);

    auto result = loader.load(path);
    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::FileTooLarge);
}

TEST_F(ConfigLoaderTest, DefaultLoaderCapsAtOneMegabyte) {
    std::string fits = createTestConfig("fits.conf", "a=1\n" + std::string(1024 * 1024 - 4, '#'));
    std::string over = createTestConfig("over.conf", "a=1\n" + std::string(1024 * 1024, '#'));

    ConfigLoader loader;
    auto small = loader.load(fits);
    ASSERT_TRUE(small.isSuccess());
    EXPECT_EQ(small.value().at("a"), "1");
    EXPECT_EQ(loader.load(over).error(), ErrorCode::FileTooLarge);
}

TEST_F(ConfigLoaderTest, DirectoryIsNotAFile) {
    ConfigLoader loader;
    auto result = loader.load(tempDir.string());
    ASSERT_TRUE(result.isFailure());
}

TEST_F(ConfigLoaderTest, EmptyConfiguration) {
    ConfigLoader loader;
    auto result = loader.load(createTestConfig("empty.conf", ""));
    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value().empty());
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigLoaderTest, CommentsAndWhitespace) {
    ConfigLoader loader;
    auto result = loader.loadFromString(
        "# comment\n"
        "\n"
        "  key1  =  value1  \n"
        "; another comment\n"
        "key2=value2 # trailing\n"
        "url=http://host/#anchor\n"
        "no equals sign here\n"
        "  \r\n");

    ASSERT_TRUE(result.isSuccess());
    ConfigMap config = result.value();
    EXPECT_EQ(config.size(), 3u);
    EXPECT_EQ(config["key1"], "value1");
    EXPECT_EQ(config["key2"], "value2");
    EXPECT_EQ(config["url"], "http://host/#anchor");
}

TEST_F(ConfigLoaderTest, MalformedSectionHeader) {
    ConfigLoader loader;
    EXPECT_EQ(loader.loadFromString("[scan\nx=1\n").error(), ErrorCode::ConfigInvalid);
    EXPECT_EQ(loader.loadFromString("[]\n").error(), ErrorCode::ConfigInvalid);
}

// ============================================================================
// Engine settings
// ============================================================================

TEST(EngineSettingsTest, DefaultsWhenEmpty) {
    auto result = EngineSettings::fromConfigMap({});
    ASSERT_TRUE(result.isSuccess());

    const auto& settings = result.value();
    EXPECT_DOUBLE_EQ(settings.scan.confidenceThreshold, 0.5);
    EXPECT_EQ(settings.scan.maxMatches, 100u);
    EXPECT_EQ(settings.scan.categories.size(), 3u);
    EXPECT_EQ(settings.dedup.maxCacheSize, 1000u);
    EXPECT_EQ(settings.dedup.maxDeduplicationTime, Milliseconds(30000));
    EXPECT_EQ(settings.logLevel, Core::LogLevel::Info);
}

TEST(EngineSettingsTest, AppliesKnownKeys) {
    ConfigMap config = {
        {"scan.confidence_threshold", "0.65"},
        {"scan.max_matches_per_pattern", "5"},
        {"scan.enable_deduplication", "off"},
        {"scan.categories", "secrets, Configurations"},
        {"dedup.max_cache_size", "10"},
        {"dedup.memory_limit_mb", "64.5"},
        {"dedup.circuit_breaker_enabled", "no"},
        {"dedup.circuit_breaker_reset_ms", "1500"},
        {"log.level", "debug"},
        {"log.file", "/var/log/argus/scan.log"},
        {"unrelated.key", "ignored"},
    };

    auto result = EngineSettings::fromConfigMap(config);
    ASSERT_TRUE(result.isSuccess());

    const auto& settings = result.value();
    EXPECT_DOUBLE_EQ(settings.scan.confidenceThreshold, 0.65);
    EXPECT_EQ(settings.scan.maxMatchesPerPattern, 5u);
    EXPECT_FALSE(settings.scan.enableDeduplication);
    ASSERT_EQ(settings.scan.categories.size(), 2u);
    EXPECT_EQ(settings.scan.categories[0], PatternCategory::Secrets);
    EXPECT_EQ(settings.scan.categories[1], PatternCategory::Configurations);
    EXPECT_EQ(settings.dedup.maxCacheSize, 10u);
    EXPECT_DOUBLE_EQ(settings.dedup.memoryLimitMB, 64.5);
    EXPECT_FALSE(settings.dedup.enableCircuitBreaker);
    EXPECT_EQ(settings.dedup.circuitBreakerResetTime, Milliseconds(1500));
    EXPECT_EQ(settings.logLevel, Core::LogLevel::Debug);
    EXPECT_EQ(settings.logFile, "/var/log/argus/scan.log");
}

TEST(EngineSettingsTest, RejectsInvalidValues) {
    const std::vector<std::pair<std::string, std::string>> invalid = {
        {"scan.confidence_threshold", "1.5"},
        {"scan.confidence_threshold", "high"},
        {"scan.max_matches", "0"},
        {"scan.max_matches", "-4"},
        {"scan.enable_deduplication", "maybe"},
        {"scan.categories", "secrets,credentials"},
        {"scan.categories", " , "},
        {"dedup.max_time_ms", "0"},
        {"dedup.memory_limit_mb", "0"},
        {"dedup.circuit_breaker_threshold", "0"},
        {"log.level", "loud"},
    };

    for (const auto& [key, value] : invalid) {
        auto result = EngineSettings::fromConfigMap({{key, value}});
        ASSERT_TRUE(result.isFailure()) << key << "=" << value;
        EXPECT_EQ(result.error(), ErrorCode::ConfigInvalid) << key << "=" << value;
    }
}

TEST(EngineSettingsTest, ParsesBooleans) {
    EXPECT_EQ(parseBool("TRUE"), true);
    EXPECT_EQ(parseBool("yes"), true);
    EXPECT_EQ(parseBool("1"), true);
    EXPECT_EQ(parseBool("Off"), false);
    EXPECT_EQ(parseBool("0"), false);
    EXPECT_FALSE(parseBool("enabled").has_value());
}

TEST_F(ConfigLoaderTest, LoadsSettingsFromFile) {
    std::string path = createTestConfig("argus.conf",
        "[scan]\n"
        "confidence_threshold = 0.8\n"
        "[dedup]\n"
        "circuit_breaker_threshold = 5\n");

    ConfigLoader loader;
    auto config = loader.load(path);
    ASSERT_TRUE(config.isSuccess());

    auto settings = EngineSettings::fromConfigMap(config.value());
    ASSERT_TRUE(settings.isSuccess());
    EXPECT_DOUBLE_EQ(settings.value().scan.confidenceThreshold, 0.8);
    EXPECT_EQ(settings.value().dedup.circuitBreakerThreshold, 5u);
}
