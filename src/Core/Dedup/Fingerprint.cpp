/**
 * @file Fingerprint.cpp
 * @brief Path/value normalization and SHA-256 fingerprints
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Fingerprint.hpp>
#include <Argus/Core/Crypto.hpp>
#include <Argus/Core/Logger.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace Argus::Core {

namespace {

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

char lowerChar(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

/**
 * @brief Append "<length>:<component>" so no two component splits collide
 */
void appendComponent(std::string& material, std::string_view component) {
    material.append(std::to_string(component.size()));
    material.push_back(':');
    material.append(component);
}

} // anonymous namespace

std::string normalizePath(std::string_view path) {
    std::string out;
    out.reserve(path.size());

    for (char c : path) {
        char ch = c == '\\' ? '/' : lowerChar(c);
        if (ch == '/' && !out.empty() && out.back() == '/') {
            continue;
        }
        out.push_back(ch);
    }

    // Leading "./" segments, then leading and trailing slashes
    size_t begin = 0;
    while (true) {
        if (out.compare(begin, 2, "./") == 0) {
            begin += 2;
        } else if (begin < out.size() && out[begin] == '/') {
            begin += 1;
        } else {
            break;
        }
    }
    size_t end = out.size();
    while (end > begin && out[end - 1] == '/') {
        --end;
    }
    return out.substr(begin, end - begin);
}

std::string normalizeValue(std::string_view value) {
    auto first = std::find_if_not(value.begin(), value.end(), isSpace);
    auto last = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    std::string out;
    if (first < last) {
        out.assign(first, last);
    }
    std::transform(out.begin(), out.end(), out.begin(), lowerChar);
    return out;
}

Result<std::string> FingerprintGenerator::fingerprint(std::string_view patternId,
                                                      std::string_view filePath,
                                                      std::string_view value) const {
    std::string material;
    material.reserve(patternId.size() + filePath.size() + value.size() + 32);
    appendComponent(material, patternId);
    material.push_back('|');
    appendComponent(material, normalizePath(filePath));
    material.push_back('|');
    appendComponent(material, normalizeValue(value));

    auto digest = Crypto::HashEngine::sha256Hex(material);
    if (digest.isFailure()) {
        ARGUS_LOG_ERROR_F("Fingerprint hashing failed: %s",
                          std::string(getErrorMessage(digest.error())).c_str());
        return ErrorCode::FingerprintFailed;
    }
    return digest;
}

} // namespace Argus::Core
