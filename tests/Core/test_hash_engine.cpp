/**
 * @file test_hash_engine.cpp
 * @brief Unit tests for hashing and hex helpers
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Crypto.hpp>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace Argus;
using namespace Argus::Crypto;

namespace {

constexpr const char* SHA256_EMPTY =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* SHA256_ABC =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

} // anonymous namespace

// ============================================================================
// Known vectors
// ============================================================================

TEST(HashEngine, Sha256Hex_KnownVectors) {
    auto empty = HashEngine::sha256Hex("");
    ASSERT_TRUE(empty.isSuccess());
    EXPECT_EQ(empty.value(), SHA256_EMPTY);

    auto abc = HashEngine::sha256Hex("abc");
    ASSERT_TRUE(abc.isSuccess());
    EXPECT_EQ(abc.value(), SHA256_ABC);
}

TEST(HashEngine, InstanceIsReusable) {
    HashEngine engine;
    auto first = engine.hash(std::string_view("abc"));
    auto second = engine.hash(std::string_view(""));
    auto third = engine.hash(std::string_view("abc"));
    ASSERT_TRUE(first.isSuccess() && second.isSuccess() && third.isSuccess());

    EXPECT_EQ(first.value().size(), 32u);
    EXPECT_EQ(toHex(first.value()), SHA256_ABC);
    EXPECT_EQ(toHex(second.value()), SHA256_EMPTY);
    EXPECT_EQ(third.value(), first.value());
}

TEST(HashEngine, Sha256Array_MatchesHex) {
    const std::string text = "abc";
    ByteSpan bytes(reinterpret_cast<const Byte*>(text.data()), text.size());

    auto digest = HashEngine::sha256(bytes);
    ASSERT_TRUE(digest.isSuccess());
    EXPECT_EQ(toHex(digest.value()), SHA256_ABC);
}

TEST(HashEngine, ConcurrentCalls_AreIndependent) {
    std::vector<std::thread> threads;
    std::vector<std::string> results(8);

    for (size_t i = 0; i < results.size(); i++) {
        threads.emplace_back([&results, i] {
            auto digest = HashEngine::sha256Hex("abc");
            results[i] = digest.isSuccess() ? digest.value() : std::string();
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& r : results) {
        EXPECT_EQ(r, SHA256_ABC);
    }
}

// ============================================================================
// Hex helpers
// ============================================================================

TEST(HexEncoding, LowerCaseDigits) {
    ByteBuffer bytes = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(toHex(bytes), "000fa5ff");
    EXPECT_EQ(toHex(ByteBuffer{}), "");
}
