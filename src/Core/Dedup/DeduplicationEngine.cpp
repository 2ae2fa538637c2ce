/**
 * @file DeduplicationEngine.cpp
 * @brief File-level and scan-level finding deduplication
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/DeduplicationEngine.hpp>
#include <Argus/Core/Logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>

namespace Argus::Core {

namespace {

constexpr const char* FILE_LEVEL = "file-level";
constexpr const char* SCAN_LEVEL = "scan-level";

ResilienceConfig toResilienceConfig(const DedupConfig& config) {
    ResilienceConfig out;
    out.maxTime = config.maxDeduplicationTime;
    out.memoryLimitMB = config.memoryLimitMB;
    out.breaker.enabled = config.enableCircuitBreaker;
    out.breaker.threshold = config.circuitBreakerThreshold;
    out.breaker.resetTimeout = config.circuitBreakerResetTime;
    return out;
}

std::vector<Location> locationsOf(const FindingRecord& record) {
    if (!record.locations.empty()) {
        return record.locations;
    }
    return {record.ownLocation()};
}

void addLocation(std::vector<Location>& locations, const Location& location) {
    const bool known = std::any_of(locations.begin(), locations.end(),
                                   [&](const Location& l) { return l.samePlace(location); });
    if (!known) {
        locations.push_back(location);
    }
}

/**
 * @brief Fold @p incoming into @p target
 */
void mergeInto(FindingRecord& target, const FindingRecord& incoming, int64_t now) {
    if (incoming.confidence) {
        const double confidence = clampConfidence(*incoming.confidence);
        target.confidence = target.confidence ? std::max(*target.confidence, confidence) : confidence;
    }
    if (incoming.severity) {
        target.severity = target.severity ? maxSeverity(*target.severity, *incoming.severity)
                                          : *incoming.severity;
    }
    for (const auto& location : locationsOf(incoming)) {
        addLocation(target.locations, location);
    }
    target.occurrenceCount = target.locations.size();
    if (incoming.firstSeen && (!target.firstSeen || *incoming.firstSeen < *target.firstSeen)) {
        target.firstSeen = incoming.firstSeen;
    }
    target.lastSeen = now;
}

/**
 * @brief First record for a fingerprint
 */
FindingRecord seed(const FindingRecord& record, int64_t now) {
    FindingRecord out = record;
    if (out.confidence) {
        out.confidence = clampConfidence(*out.confidence);
    }
    out.locations = locationsOf(record);
    out.occurrenceCount = out.locations.size();
    if (!out.firstSeen) {
        out.firstSeen = now;
    }
    out.lastSeen = now;
    out.deduplicationStatus.reset();
    out.fallbackReason.reset();
    return out;
}

nlohmann::json breakerToJson(const CircuitBreakerSnapshot& snap) {
    nlohmann::json out = {
        {"state", std::string(breakerStateToString(snap.state))},
        {"failureCount", snap.failureCount},
        {"threshold", snap.threshold},
        {"resetTimeoutMs", snap.resetTimeout.count()}
    };
    return out;
}

} // anonymous namespace

std::string formatRate(size_t removed, size_t total) {
    if (total == 0) {
        return "0%";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f%%",
                  100.0 * static_cast<double>(removed) / static_cast<double>(total));
    return buffer;
}

nlohmann::json DedupStats::toJson() const {
    nlohmann::json out = {
        {"totalFindings", totalFindings},
        {"uniqueFindings", uniqueFindings},
        {"duplicatesRemoved", duplicatesRemoved},
        {"deduplicationRate", deduplicationRate},
        {"performance", {
            {"lastDurationMs", lastDuration.count()},
            {"maxDurationMs", maxDuration.count()},
            {"averageDurationMs", averageDurationMs},
            {"operationCount", operationCount}
        }},
        {"cacheSize", cacheSize},
        {"fallbackCount", fallbackCount},
        {"errorCount", errorCount},
        {"skippedFindings", skippedFindings},
        {"circuitBreaker", breakerToJson(circuitBreaker)}
    };
    if (lastError) {
        out["lastError"] = {
            {"code", std::string(getErrorKindName(lastError->code))},
            {"message", lastError->message},
            {"timestamp", lastError->timestamp},
            {"operationType", lastError->operationType}
        };
    }
    return out;
}

// ============================================================================
// DeduplicationEngine
// ============================================================================

DeduplicationEngine::DeduplicationEngine(DedupConfig config,
                                         std::shared_ptr<const IFingerprinter> fingerprinter,
                                         CircuitBreaker::ClockFn clock)
    : m_config(config)
    , m_fingerprinter(fingerprinter ? std::move(fingerprinter)
                                    : std::make_shared<FingerprintGenerator>())
    , m_executor(toResilienceConfig(config), std::move(clock))
{
}

void DeduplicationEngine::remember(const std::string& fingerprint, const FindingRecord& record) {
    if (m_config.maxCacheSize == 0) {
        return;
    }
    auto it = m_cache.find(fingerprint);
    if (it != m_cache.end()) {
        it->second = record;
        return;
    }
    while (m_cache.size() >= m_config.maxCacheSize && !m_cacheOrder.empty()) {
        m_cache.erase(m_cacheOrder.front());
        m_cacheOrder.pop_front();
    }
    m_cache.emplace(fingerprint, record);
    m_cacheOrder.push_back(fingerprint);
}

Result<std::vector<FindingRecord>> DeduplicationEngine::merge(const FindingBatch& findings,
                                                              const Deadline& deadline,
                                                              const std::string* filePath,
                                                              bool seedFromCache,
                                                              MergeCounts& counts) {
    const int64_t now = toEpochMillis(WallClock::now());

    std::vector<FindingRecord> output;
    std::vector<std::string> outputKeys;
    std::unordered_map<std::string, size_t> index;
    counts.skipped = 0;

    for (const auto& entry : findings) {
        if (deadline.expired()) {
            return ErrorCode::Timeout;
        }
        if (!entry || !entry->value) {
            counts.skipped++;
            continue;
        }

        FindingRecord record = *entry;
        if (filePath != nullptr && !record.file) {
            record.file = *filePath;
        }

        auto fingerprint = m_fingerprinter->fingerprint(record);
        if (fingerprint.isFailure()) {
            return fingerprint.error();
        }
        const std::string& key = fingerprint.value();

        auto found = index.find(key);
        if (found != index.end()) {
            mergeInto(output[found->second], record, now);
            continue;
        }

        auto cached = seedFromCache ? m_cache.find(key) : m_cache.end();
        if (cached != m_cache.end()) {
            FindingRecord merged = cached->second;
            mergeInto(merged, record, now);
            output.push_back(std::move(merged));
        } else {
            output.push_back(seed(record, now));
        }
        index.emplace(key, output.size() - 1);
        outputKeys.push_back(key);
    }

    if (seedFromCache) {
        for (size_t i = 0; i < output.size(); ++i) {
            remember(outputKeys[i], output[i]);
        }
    }
    return output;
}

void DeduplicationEngine::recordOutcome(const ExecutionOutcome& outcome, size_t total, size_t skipped,
                                        const char* operationType) {
    m_stats.totalFindings += total;
    m_stats.uniqueFindings += outcome.records.size();
    if (!outcome.usedFallback) {
        m_stats.skippedFindings += skipped;
        m_stats.duplicatesRemoved += total - skipped - outcome.records.size();
    } else {
        m_stats.fallbackCount++;
    }
    m_stats.deduplicationRate = formatRate(m_stats.duplicatesRemoved, m_stats.totalFindings);

    m_stats.operationCount++;
    m_stats.lastDuration = outcome.elapsed;
    m_stats.maxDuration = std::max(m_stats.maxDuration, outcome.elapsed);
    m_totalDuration += outcome.elapsed;
    m_stats.averageDurationMs = static_cast<double>(m_totalDuration.count()) /
                                static_cast<double>(m_stats.operationCount);

    if (outcome.error) {
        m_stats.errorCount++;
        m_stats.lastError = DedupError{*outcome.error, outcome.errorMessage,
                                       toEpochMillis(WallClock::now()), operationType};
    }
}

std::vector<FindingRecord> DeduplicationEngine::deduplicateFileFindings(const FindingBatch& findings,
                                                                        const std::string& filePath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    ARGUS_LOG_DEBUG_F("Starting %s deduplication of %zu findings in '%s'",
                      FILE_LEVEL, findings.size(), filePath.c_str());

    MergeCounts counts;
    auto outcome = m_executor.execute(
        findings,
        [&](const FindingBatch& batch, const Deadline& deadline) {
            return merge(batch, deadline, &filePath, true, counts);
        },
        FILE_LEVEL);
    recordOutcome(outcome, findings.size(), counts.skipped, FILE_LEVEL);

    ARGUS_LOG_DEBUG_F("Finished %s deduplication: %zu -> %zu findings",
                      FILE_LEVEL, findings.size(), outcome.records.size());
    return std::move(outcome.records);
}

ScanDedupResult DeduplicationEngine::deduplicateScanFindings(const FindingBatch& findings) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_cache.clear();
    m_cacheOrder.clear();

    ARGUS_LOG_DEBUG_F("Starting %s deduplication of %zu findings", SCAN_LEVEL, findings.size());

    MergeCounts counts;
    auto outcome = m_executor.execute(
        findings,
        [&](const FindingBatch& batch, const Deadline& deadline) {
            return merge(batch, deadline, nullptr, false, counts);
        },
        SCAN_LEVEL);
    recordOutcome(outcome, findings.size(), counts.skipped, SCAN_LEVEL);

    ScanDedupResult result;
    result.summary.totalFindings = findings.size();
    result.summary.uniqueFindings = outcome.records.size();
    result.summary.duplicatesRemoved =
        outcome.usedFallback ? 0 : findings.size() - counts.skipped - outcome.records.size();
    result.summary.deduplicationRate = formatRate(result.summary.duplicatesRemoved, findings.size());
    result.summary.deduplicationTime = outcome.elapsed;
    result.findings = std::move(outcome.records);

    ARGUS_LOG_INFO_F("Scan deduplication: %zu findings, %zu unique, %zu duplicates removed (%s)",
                     result.summary.totalFindings, result.summary.uniqueFindings,
                     result.summary.duplicatesRemoved, result.summary.deduplicationRate.c_str());
    return result;
}

void DeduplicationEngine::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
    m_cacheOrder.clear();
    m_stats = DedupStats{};
    m_totalDuration = Milliseconds{0};
}

DedupStats DeduplicationEngine::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    DedupStats snapshot = m_stats;
    snapshot.cacheSize = m_cache.size();
    snapshot.circuitBreaker = m_executor.breaker().snapshot();
    return snapshot;
}

std::optional<FindingRecord> DeduplicationEngine::cachedRecord(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cache.find(fingerprint);
    if (it == m_cache.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace Argus::Core
