/**
 * @file Types.cpp
 * @brief Parsing helpers for severity and category names
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Types.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace Argus {

namespace {
    bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
    }
}

std::optional<Severity> parseSeverity(std::string_view name) noexcept {
    for (Severity s : {Severity::Critical, Severity::High, Severity::Medium, Severity::Low}) {
        if (equalsIgnoreCase(name, severityToString(s))) {
            return s;
        }
    }
    return std::nullopt;
}

std::optional<PatternCategory> parseCategory(std::string_view name) noexcept {
    for (PatternCategory c : ALL_CATEGORIES) {
        if (equalsIgnoreCase(name, categoryToString(c))) {
            return c;
        }
    }
    return std::nullopt;
}

int64_t toEpochMillis(WallClock::time_point tp) noexcept {
    return std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count();
}

std::string toIso8601(WallClock::time_point tp) {
    const int64_t millis = toEpochMillis(tp);
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(millis % 1000));
    return buffer;
}

} // namespace Argus
