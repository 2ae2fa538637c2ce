/**
 * @file Fingerprint.hpp
 * @brief Deterministic identity of a finding
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * fingerprint = sha256hex(len(p) ":" p "|" len(f) ":" f "|" len(v) ":" v)
 * with p = patternId, f = normalizePath(file), v = normalizeValue(value) and
 * len() the decimal byte count.
 */

#pragma once

#ifndef ARGUS_CORE_FINGERPRINT_HPP
#define ARGUS_CORE_FINGERPRINT_HPP

#include <Argus/Core/ErrorCodes.hpp>
#include <Argus/Core/Finding.hpp>
#include <string>
#include <string_view>

namespace Argus::Core {

/**
 * @brief Canonical form of a file path or URL
 *
 * Backslashes become slashes, repeated slashes collapse, leading "./"
 * segments and leading/trailing slashes are removed, and the result is
 * lower-cased. "./src/x.js", "src/x.js" and "src\\x.js" normalize equally.
 */
[[nodiscard]] std::string normalizePath(std::string_view path);

/**
 * @brief Trimmed, lower-cased value
 */
[[nodiscard]] std::string normalizeValue(std::string_view value);

/**
 * @brief Fingerprint strategy
 *
 * The deduplication engine holds one of these so that a different hash, or
 * a failing one, can be substituted.
 */
class IFingerprinter {
public:
    virtual ~IFingerprinter() = default;

    /**
     * @brief Fingerprint raw components (missing parts passed as empty)
     * @return 64-character lower-case hex digest, or FingerprintFailed
     */
    virtual Result<std::string> fingerprint(std::string_view patternId,
                                            std::string_view filePath,
                                            std::string_view value) const = 0;

    /**
     * @brief Fingerprint a record, treating missing fields as empty
     */
    Result<std::string> fingerprint(const FindingRecord& record) const {
        return fingerprint(record.patternId.value_or(""), record.file.value_or(""),
                           record.value.value_or(""));
    }
};

/**
 * @brief SHA-256 fingerprinter backed by the OpenSSL hash engine
 */
class FingerprintGenerator final : public IFingerprinter {
public:
    using IFingerprinter::fingerprint;

    Result<std::string> fingerprint(std::string_view patternId,
                                    std::string_view filePath,
                                    std::string_view value) const override;
};

} // namespace Argus::Core

#endif // ARGUS_CORE_FINGERPRINT_HPP
