/**
 * @file test_fingerprint.cpp
 * @brief Unit tests for fingerprint normalization and stability
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Fingerprint.hpp>
#include <Argus/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Argus;
using namespace Argus::Core;
using namespace Argus::Testing;

TEST(FingerprintTest, NormalizesPaths) {
    EXPECT_EQ(normalizePath("src\\Config\\App.js"), "src/config/app.js");
    EXPECT_EQ(normalizePath("./src//app.js"), "src/app.js");
    EXPECT_EQ(normalizePath("/src/app.js/"), "src/app.js");
    EXPECT_EQ(normalizePath("././a.js"), "a.js");
    EXPECT_EQ(normalizePath(""), "");
}

TEST(FingerprintTest, NormalizesValues) {
    EXPECT_EQ(normalizeValue("  SK_Live_ABC \t"), "sk_live_abc");
    EXPECT_EQ(normalizeValue("   "), "");
    EXPECT_EQ(normalizeValue("inner space"), "inner space");
}

TEST(FingerprintTest, IsStableAcrossSpellings) {
    FingerprintGenerator generator;

    auto a = generator.fingerprint("stripe-key", "./Src\\Config.js", " SK_LIVE_X ");
    auto b = generator.fingerprint("stripe-key", "src/config.js", "sk_live_x");
    ASSERT_TRUE(a.isSuccess());
    ASSERT_TRUE(b.isSuccess());
    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(a.value().size(), 64u);
}

TEST(FingerprintTest, DistinguishesComponents) {
    FingerprintGenerator generator;

    auto base = generator.fingerprint("p", "a.js", "v").value();
    EXPECT_NE(base, generator.fingerprint("q", "a.js", "v").value());
    EXPECT_NE(base, generator.fingerprint("p", "b.js", "v").value());
    EXPECT_NE(base, generator.fingerprint("p", "a.js", "w").value());

    // Pattern ids keep their case
    EXPECT_NE(base, generator.fingerprint("P", "a.js", "v").value());
}

TEST(FingerprintTest, MatchesDigestOfLengthPrefixedComponents) {
    FingerprintGenerator generator;
    auto expected = Crypto::HashEngine::sha256Hex("1:p|8:src/a.js|5:token");
    ASSERT_TRUE(expected.isSuccess());
    EXPECT_EQ(generator.fingerprint("p", "SRC/a.js", "Token").value(), expected.value());
}

TEST(FingerprintTest, SeparatorInsideComponentsDoesNotCollide) {
    FingerprintGenerator generator;

    EXPECT_NE(generator.fingerprint("a|b", "c", "v").value(),
              generator.fingerprint("a", "b|c", "v").value());
    EXPECT_NE(generator.fingerprint("p", "a.js|x", "v").value(),
              generator.fingerprint("p", "a.js", "x|v").value());
    EXPECT_NE(generator.fingerprint("p", "", "1:x").value(),
              generator.fingerprint("p", "1:x", "").value());
}

TEST(FingerprintTest, RecordOverloadTreatsMissingAsEmpty) {
    FingerprintGenerator generator;

    FindingRecord record;
    record.value = "token";
    auto fromRecord = generator.fingerprint(record);
    ASSERT_TRUE(fromRecord.isSuccess());
    EXPECT_EQ(fromRecord.value(), generator.fingerprint("", "", "token").value());

    auto full = makeRecord("p", "a.js", "token");
    EXPECT_EQ(generator.fingerprint(full).value(), generator.fingerprint("p", "a.js", "token").value());
}
