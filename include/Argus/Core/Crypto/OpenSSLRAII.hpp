/**
 * @file OpenSSLRAII.hpp
 * @brief Scoped ownership of OpenSSL handles
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#pragma once

#ifndef ARGUS_CRYPTO_OPENSSL_RAII_HPP
#define ARGUS_CRYPTO_OPENSSL_RAII_HPP

#include <openssl/evp.h>
#include <utility>

namespace Argus::Crypto {

/**
 * @brief Unique owner of an OpenSSL object freed by @p Deleter
 *
 * Converts implicitly to the raw pointer so it can be handed straight to
 * EVP_* calls.
 */
template<typename T, void (*Deleter)(T*)>
class OpenSSLHandle {
public:
    explicit OpenSSLHandle(T* ptr = nullptr) noexcept : m_ptr(ptr) {}
    ~OpenSSLHandle() noexcept { reset(); }

    OpenSSLHandle(const OpenSSLHandle&) = delete;
    OpenSSLHandle& operator=(const OpenSSLHandle&) = delete;

    OpenSSLHandle(OpenSSLHandle&& other) noexcept
        : m_ptr(std::exchange(other.m_ptr, nullptr)) {}

    OpenSSLHandle& operator=(OpenSSLHandle&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.m_ptr, nullptr));
        }
        return *this;
    }

    void reset(T* ptr = nullptr) noexcept {
        if (m_ptr != nullptr) {
            Deleter(m_ptr);
        }
        m_ptr = ptr;
    }

    [[nodiscard]] T* get() const noexcept { return m_ptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return m_ptr != nullptr; }
    operator T*() const noexcept { return m_ptr; }

private:
    T* m_ptr;
};

/// Digest context
using EVPMDCtxPtr = OpenSSLHandle<EVP_MD_CTX, EVP_MD_CTX_free>;

} // namespace Argus::Crypto

#endif // ARGUS_CRYPTO_OPENSSL_RAII_HPP
