/**
 * @file CryptoUtils.cpp
 * @brief Hex encoding
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Crypto.hpp>

namespace Argus::Crypto {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789abcdef";
}

std::string toHex(ByteSpan data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

} // namespace Argus::Crypto
