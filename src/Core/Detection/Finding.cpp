/**
 * @file Finding.cpp
 * @brief Location helpers and the FindingRecord JSON boundary
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/Finding.hpp>
#include <Argus/Core/Logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace Argus::Core {

using json = nlohmann::json;

// ============================================================================
// Location helpers
// ============================================================================

size_t lineOfIndex(std::string_view content, size_t index) noexcept {
    index = std::min(index, content.size());
    return 1 + static_cast<size_t>(std::count(content.begin(), content.begin() + index, '\n'));
}

size_t columnOfIndex(std::string_view content, size_t index) noexcept {
    index = std::min(index, content.size());
    auto newline = content.substr(0, index).rfind('\n');
    return newline == std::string_view::npos ? index + 1 : index - newline;
}

Location locate(std::string_view content, size_t index, const std::string& file) {
    Location loc;
    loc.file = file;
    loc.line = lineOfIndex(content, index);
    loc.column = columnOfIndex(content, index);
    loc.index = index;
    return loc;
}

// ============================================================================
// JSON field readers
// ============================================================================

namespace {

// Each reader returns false when the key is present with the wrong type.
// A JSON null counts as absent.

bool readString(const json& obj, const char* key, std::optional<std::string>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool readSize(const json& obj, const char* key, std::optional<size_t>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (it->is_number_unsigned()) {
        out = it->get<size_t>();
        return true;
    }
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        if (v < 0) {
            return false;
        }
        out = static_cast<size_t>(v);
        return true;
    }
    return false;
}

bool readInt64(const json& obj, const char* key, std::optional<int64_t>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number_integer()) {
        return false;
    }
    out = it->get<int64_t>();
    return true;
}

bool readDouble(const json& obj, const char* key, std::optional<double>& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

bool readClassification(const json& obj, FindingRecord& record) {
    std::optional<std::string> category;
    std::optional<std::string> severity;
    if (!readString(obj, "category", category) || !readString(obj, "severity", severity)) {
        return false;
    }
    if (category) {
        if (auto parsed = parseCategory(*category)) {
            record.category = parsed;
        } else {
            ARGUS_LOG_DEBUG_F("Ignoring unknown category '%s'", category->c_str());
        }
    }
    if (severity) {
        if (auto parsed = parseSeverity(*severity)) {
            record.severity = parsed;
        } else {
            ARGUS_LOG_DEBUG_F("Ignoring unknown severity '%s'", severity->c_str());
        }
    }
    return true;
}

std::optional<Location> readLocation(const json& obj) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    std::optional<std::string> file;
    std::optional<size_t> line, column, index;
    if (!readString(obj, "file", file) || !readSize(obj, "line", line) ||
        !readSize(obj, "column", column) || !readSize(obj, "index", index)) {
        return std::nullopt;
    }
    Location loc;
    loc.file = file.value_or("");
    loc.line = line.value_or(0);
    loc.column = column.value_or(0);
    loc.index = index.value_or(0);
    return loc;
}

json locationToJson(const Location& loc) {
    return json{{"file", loc.file}, {"line", loc.line}, {"column", loc.column}, {"index", loc.index}};
}

} // anonymous namespace

// ============================================================================
// FindingRecord
// ============================================================================

Location FindingRecord::ownLocation() const {
    Location loc;
    loc.file = file.value_or("");
    loc.line = line.value_or(0);
    loc.column = column.value_or(0);
    loc.index = index.value_or(0);
    return loc;
}

std::optional<FindingRecord> FindingRecord::fromJson(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    FindingRecord record;
    bool ok = readString(j, "patternId", record.patternId) &&
              readString(j, "patternName", record.patternName) &&
              readClassification(j, record) &&
              readString(j, "file", record.file) &&
              readString(j, "value", record.value) &&
              readDouble(j, "confidence", record.confidence) &&
              readSize(j, "line", record.line) &&
              readSize(j, "column", record.column) &&
              readSize(j, "index", record.index) &&
              readSize(j, "occurrenceCount", record.occurrenceCount) &&
              readInt64(j, "firstSeen", record.firstSeen) &&
              readInt64(j, "lastSeen", record.lastSeen) &&
              readString(j, "deduplicationStatus", record.deduplicationStatus) &&
              readString(j, "fallbackReason", record.fallbackReason);
    if (!ok) {
        return std::nullopt;
    }
    if (record.confidence) {
        record.confidence = clampConfidence(*record.confidence);
    }

    // Pipeline-shaped records nest the pattern summary
    if (auto it = j.find("pattern"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::nullopt;
        }
        std::optional<std::string> id, name;
        if (!readString(*it, "id", id) || !readString(*it, "name", name)) {
            return std::nullopt;
        }
        FindingRecord nested;
        if (!readClassification(*it, nested)) {
            return std::nullopt;
        }
        if (!record.patternId) record.patternId = id;
        if (!record.patternName) record.patternName = name;
        if (!record.category) record.category = nested.category;
        if (!record.severity) record.severity = nested.severity;
    }

    if (auto it = j.find("location"); it != j.end() && !it->is_null()) {
        auto loc = readLocation(*it);
        if (!loc) {
            return std::nullopt;
        }
        if (!record.line && loc->line > 0) record.line = loc->line;
        if (!record.column && loc->column > 0) record.column = loc->column;
    }

    if (auto it = j.find("locations"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::nullopt;
        }
        for (const auto& entry : *it) {
            auto loc = readLocation(entry);
            if (!loc) {
                return std::nullopt;
            }
            record.locations.push_back(std::move(*loc));
        }
    }

    return record;
}

json FindingRecord::toJson() const {
    json j = json::object();
    if (patternId) j["patternId"] = *patternId;
    if (patternName) j["patternName"] = *patternName;
    if (category) j["category"] = categoryToString(*category);
    if (severity) j["severity"] = severityToString(*severity);
    if (file) j["file"] = *file;
    if (value) j["value"] = *value;
    if (confidence) j["confidence"] = *confidence;
    if (line) j["line"] = *line;
    if (column) j["column"] = *column;
    if (index) j["index"] = *index;
    if (occurrenceCount) j["occurrenceCount"] = *occurrenceCount;
    if (!locations.empty()) {
        json arr = json::array();
        for (const auto& loc : locations) {
            arr.push_back(locationToJson(loc));
        }
        j["locations"] = std::move(arr);
    }
    if (firstSeen) j["firstSeen"] = *firstSeen;
    if (lastSeen) j["lastSeen"] = *lastSeen;
    if (deduplicationStatus) j["deduplicationStatus"] = *deduplicationStatus;
    if (fallbackReason) j["fallbackReason"] = *fallbackReason;
    return j;
}

FindingRecord FindingRecord::fromFinding(const Finding& finding, const std::string& filePath) {
    FindingRecord record;
    record.patternId = finding.pattern.id;
    record.patternName = finding.pattern.name;
    record.category = finding.pattern.category;
    record.severity = finding.pattern.severity;
    record.value = finding.match.value;
    record.confidence = finding.confidence;
    record.occurrenceCount = finding.occurrenceCount;

    record.locations = finding.locations;
    for (auto& loc : record.locations) {
        if (!filePath.empty()) {
            loc.file = filePath;
        }
    }

    if (!filePath.empty()) {
        record.file = filePath;
    } else if (!record.locations.empty() && !record.locations.front().file.empty()) {
        record.file = record.locations.front().file;
    }

    if (!record.locations.empty()) {
        record.line = record.locations.front().line;
        record.column = record.locations.front().column;
        record.index = record.locations.front().index;
    } else {
        record.index = finding.match.index;
    }
    return record;
}

Result<FindingBatch> parseFindingBatch(const json& j) {
    if (!j.is_array()) {
        return ErrorCode::JsonInvalid;
    }
    FindingBatch batch;
    batch.reserve(j.size());
    for (const auto& entry : j) {
        batch.push_back(FindingRecord::fromJson(entry));
    }
    return batch;
}

} // namespace Argus::Core
