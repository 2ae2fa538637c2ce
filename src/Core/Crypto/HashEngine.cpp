/**
 * @file HashEngine.cpp
 * @brief OpenSSL EVP digest engine
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Crypto.hpp>
#include <Argus/Core/Crypto/OpenSSLRAII.hpp>
#include <Argus/Core/Logger.hpp>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <tuple>

namespace Argus::Crypto {

namespace {

void logOpenSSLFailure(const char* step) {
    unsigned long err = ERR_get_error();
    char buffer[256] = {0};
    if (err != 0) {
        ERR_error_string_n(err, buffer, sizeof(buffer));
    }
    ARGUS_LOG_ERROR_F("%s failed: %s", step, err != 0 ? buffer : "unknown OpenSSL error");
}

constexpr size_t SHA256_SIZE = std::tuple_size<SHA256Hash>::value;

ByteSpan asBytes(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

} // anonymous namespace

// ============================================================================
// HashEngine::Impl
// ============================================================================

class HashEngine::Impl {
public:
    Impl() : m_ctx(EVP_MD_CTX_new()) {}

    Result<void> init() {
        if (!m_ctx) {
            return ErrorCode::CryptoError;
        }
        if (EVP_DigestInit_ex(m_ctx, EVP_sha256(), nullptr) != 1) {
            logOpenSSLFailure("EVP_DigestInit_ex");
            return ErrorCode::HashFailed;
        }
        m_initialized = true;
        return Result<void>::Success();
    }

    Result<void> update(ByteSpan data) {
        if (!m_initialized) {
            return ErrorCode::InvalidState;
        }
        if (data.empty()) {
            return Result<void>::Success();
        }
        if (EVP_DigestUpdate(m_ctx, data.data(), data.size()) != 1) {
            logOpenSSLFailure("EVP_DigestUpdate");
            return ErrorCode::HashFailed;
        }
        return Result<void>::Success();
    }

    Result<ByteBuffer> finalize() {
        if (!m_initialized) {
            return ErrorCode::InvalidState;
        }

        ByteBuffer digest(SHA256_SIZE);
        unsigned int len = 0;
        m_initialized = false;

        if (EVP_DigestFinal_ex(m_ctx, digest.data(), &len) != 1) {
            logOpenSSLFailure("EVP_DigestFinal_ex");
            return ErrorCode::HashFailed;
        }
        if (len != digest.size()) {
            return ErrorCode::HashFailed;
        }
        return digest;
    }

private:
    EVPMDCtxPtr m_ctx;
    bool m_initialized = false;
};

// ============================================================================
// HashEngine - Public API
// ============================================================================

HashEngine::HashEngine()
    : m_impl(std::make_unique<Impl>()) {
}

HashEngine::~HashEngine() = default;
HashEngine::HashEngine(HashEngine&&) noexcept = default;
HashEngine& HashEngine::operator=(HashEngine&&) noexcept = default;

Result<ByteBuffer> HashEngine::hash(ByteSpan data) {
    ARGUS_TRY(m_impl->init());
    ARGUS_TRY(m_impl->update(data));
    return m_impl->finalize();
}

Result<ByteBuffer> HashEngine::hash(std::string_view text) {
    return hash(asBytes(text));
}

Result<SHA256Hash> HashEngine::sha256(ByteSpan data) {
    HashEngine engine;
    auto result = engine.hash(data);
    if (result.isFailure()) {
        return result.error();
    }

    SHA256Hash digest{};
    std::copy_n(result.value().begin(), digest.size(), digest.begin());
    return digest;
}

Result<std::string> HashEngine::sha256Hex(std::string_view text) {
    auto digest = sha256(asBytes(text));
    if (digest.isFailure()) {
        return digest.error();
    }
    return toHex(digest.value());
}

} // namespace Argus::Crypto
