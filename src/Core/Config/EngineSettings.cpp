/**
 * @file EngineSettings.cpp
 * @brief ConfigMap to EngineSettings conversion
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Settings.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <map>
#include <vector>

namespace Argus::Config {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<uint64_t> parseUnsigned(const std::string& text) {
    uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::vector<PatternCategory>> parseCategories(const std::string& text) {
    std::vector<PatternCategory> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        std::string item = text.substr(start, comma - start);
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            auto category = parseCategory(item);
            if (!category) {
                return std::nullopt;
            }
            if (std::find(out.begin(), out.end(), *category) == out.end()) {
                out.push_back(*category);
            }
        }
        start = comma + 1;
    }
    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

using Setter = std::function<bool(EngineSettings&, const std::string&)>;

Setter unsignedField(std::function<void(EngineSettings&, uint64_t)> assign, uint64_t minimum) {
    return [assign = std::move(assign), minimum](EngineSettings& s, const std::string& text) {
        auto value = parseUnsigned(text);
        if (!value || *value < minimum) {
            return false;
        }
        assign(s, *value);
        return true;
    };
}

Setter boolField(std::function<void(EngineSettings&, bool)> assign) {
    return [assign = std::move(assign)](EngineSettings& s, const std::string& text) {
        auto value = parseBool(text);
        if (!value) {
            return false;
        }
        assign(s, *value);
        return true;
    };
}

const std::map<std::string, Setter>& setters() {
    static const std::map<std::string, Setter> table = {
        {"scan.confidence_threshold", [](EngineSettings& s, const std::string& text) {
            auto value = parseNumber(text);
            if (!value || *value < 0.0 || *value > 1.0) {
                return false;
            }
            s.scan.confidenceThreshold = *value;
            return true;
        }},
        {"scan.max_matches",
            unsignedField([](EngineSettings& s, uint64_t v) { s.scan.maxMatches = v; }, 1)},
        {"scan.max_matches_per_pattern",
            unsignedField([](EngineSettings& s, uint64_t v) { s.scan.maxMatchesPerPattern = v; }, 1)},
        {"scan.context_window",
            unsignedField([](EngineSettings& s, uint64_t v) { s.scan.contextWindow = v; }, 0)},
        {"scan.enable_deduplication",
            boolField([](EngineSettings& s, bool v) { s.scan.enableDeduplication = v; })},
        {"scan.categories", [](EngineSettings& s, const std::string& text) {
            auto categories = parseCategories(text);
            if (!categories) {
                return false;
            }
            s.scan.categories = std::move(*categories);
            return true;
        }},
        {"dedup.max_cache_size",
            unsignedField([](EngineSettings& s, uint64_t v) { s.dedup.maxCacheSize = v; }, 0)},
        {"dedup.max_time_ms",
            unsignedField([](EngineSettings& s, uint64_t v) {
                s.dedup.maxDeduplicationTime = Milliseconds(static_cast<int64_t>(v));
            }, 1)},
        {"dedup.memory_limit_mb", [](EngineSettings& s, const std::string& text) {
            auto value = parseNumber(text);
            if (!value || *value <= 0.0) {
                return false;
            }
            s.dedup.memoryLimitMB = *value;
            return true;
        }},
        {"dedup.circuit_breaker_enabled",
            boolField([](EngineSettings& s, bool v) { s.dedup.enableCircuitBreaker = v; })},
        {"dedup.circuit_breaker_threshold",
            unsignedField([](EngineSettings& s, uint64_t v) {
                s.dedup.circuitBreakerThreshold = static_cast<uint32_t>(std::min<uint64_t>(v, UINT32_MAX));
            }, 1)},
        {"dedup.circuit_breaker_reset_ms",
            unsignedField([](EngineSettings& s, uint64_t v) {
                s.dedup.circuitBreakerResetTime = Milliseconds(static_cast<int64_t>(v));
            }, 0)},
        {"log.level", [](EngineSettings& s, const std::string& text) {
            auto level = Core::parseLogLevel(text);
            if (!level) {
                return false;
            }
            s.logLevel = *level;
            return true;
        }},
        {"log.file", [](EngineSettings& s, const std::string& text) {
            s.logFile = text;
            return true;
        }},
    };
    return table;
}

} // anonymous namespace

std::optional<bool> parseBool(std::string_view text) {
    const std::string value = lower(text);
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return std::nullopt;
}

Result<EngineSettings> EngineSettings::fromConfigMap(const ConfigMap& config) {
    EngineSettings settings;
    const auto& table = setters();

    for (const auto& [key, value] : config) {
        auto it = table.find(key);
        if (it == table.end()) {
            ARGUS_LOG_DEBUG_F("Ignoring unknown config key '%s'", key.c_str());
            continue;
        }
        if (!it->second(settings, value)) {
            ARGUS_LOG_ERROR_F("Invalid value '%s' for config key '%s'", value.c_str(), key.c_str());
            return ErrorCode::ConfigInvalid;
        }
    }
    return settings;
}

} // namespace Argus::Config
