/**
 * @file Crypto.hpp
 * @brief Digest primitives used for finding fingerprints
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Thin wrapper over the OpenSSL EVP digest API. Fingerprints are the
 * lower-case hex encoding of a SHA-256 digest.
 */

#pragma once

#ifndef ARGUS_CORE_CRYPTO_HPP
#define ARGUS_CORE_CRYPTO_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace Argus::Crypto {

/**
 * @brief SHA-256 digest engine
 *
 * Holds one reusable EVP context; an instance is not safe to share between
 * threads, the static helpers are.
 *
 * @example
 * ```cpp
 * auto fingerprint = HashEngine::sha256Hex("pattern|src/config.js|value");
 * ```
 */
class HashEngine {
public:
    HashEngine();
    ~HashEngine();

    HashEngine(const HashEngine&) = delete;
    HashEngine& operator=(const HashEngine&) = delete;
    HashEngine(HashEngine&&) noexcept;
    HashEngine& operator=(HashEngine&&) noexcept;

    /**
     * @brief Digest a buffer in one call
     */
    Result<ByteBuffer> hash(ByteSpan data);

    /**
     * @brief Digest the bytes of a string in one call
     */
    Result<ByteBuffer> hash(std::string_view text);

    /**
     * @brief SHA-256 of arbitrary bytes
     */
    static Result<SHA256Hash> sha256(ByteSpan data);

    /**
     * @brief Lower-case hex SHA-256 of a string (64 characters)
     */
    static Result<std::string> sha256Hex(std::string_view text);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Encode bytes as lower-case hex
 */
std::string toHex(ByteSpan data);

} // namespace Argus::Crypto

#endif // ARGUS_CORE_CRYPTO_HPP
