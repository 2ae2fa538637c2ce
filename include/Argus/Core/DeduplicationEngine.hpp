/**
 * @file DeduplicationEngine.hpp
 * @brief Fingerprint-based merging of findings within a file and across a scan
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Findings with the same fingerprint (pattern, normalized file, normalized
 * value) merge into one record: the highest confidence, the most severe
 * severity and the union of locations. Each public call is wrapped by a
 * ResilientExecutor, so a failing, slow or oversized merge degrades to a
 * tagged pass-through instead of an error.
 */

#pragma once

#ifndef ARGUS_CORE_DEDUPLICATION_ENGINE_HPP
#define ARGUS_CORE_DEDUPLICATION_ENGINE_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <Argus/Core/Finding.hpp>
#include <Argus/Core/Fingerprint.hpp>
#include <Argus/Core/ResilientExecutor.hpp>
#include <nlohmann/json_fwd.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Argus::Core {

struct DedupConfig {
    size_t maxCacheSize = 1000;
    Milliseconds maxDeduplicationTime{30000};
    double memoryLimitMB = 512.0;
    bool enableCircuitBreaker = true;
    uint32_t circuitBreakerThreshold = 3;
    Milliseconds circuitBreakerResetTime{60000};
};

/**
 * @brief Most recent merge failure
 */
struct DedupError {
    ErrorCode code = ErrorCode::Success;
    std::string message;
    int64_t timestamp = 0;        ///< Epoch milliseconds
    std::string operationType;    ///< "file-level" or "scan-level"
};

/**
 * @brief Cumulative statistics since construction or reset()
 */
struct DedupStats {
    size_t totalFindings = 0;
    size_t uniqueFindings = 0;
    size_t duplicatesRemoved = 0;
    std::string deduplicationRate = "0%";   ///< duplicatesRemoved / totalFindings, e.g. "12.34%"
    Milliseconds lastDuration{0};
    Milliseconds maxDuration{0};
    double averageDurationMs = 0.0;
    size_t operationCount = 0;
    size_t cacheSize = 0;
    size_t fallbackCount = 0;
    size_t errorCount = 0;
    size_t skippedFindings = 0;
    CircuitBreakerSnapshot circuitBreaker;
    std::optional<DedupError> lastError;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Figures for a single scan-level call
 */
struct ScanDedupSummary {
    size_t totalFindings = 0;
    size_t uniqueFindings = 0;
    size_t duplicatesRemoved = 0;
    std::string deduplicationRate = "0%";
    Milliseconds deduplicationTime{0};
};

struct ScanDedupResult {
    std::vector<FindingRecord> findings;
    ScanDedupSummary summary;
};

/**
 * @brief "12.34%" style rate; "0%" when @p total is zero
 */
[[nodiscard]] std::string formatRate(size_t removed, size_t total);

class DeduplicationEngine {
public:
    /**
     * @param config Cache size, budgets and breaker settings
     * @param fingerprinter Defaults to FingerprintGenerator
     * @param clock Time source for budgets and the breaker; defaults to the steady clock
     */
    explicit DeduplicationEngine(DedupConfig config = {},
                                 std::shared_ptr<const IFingerprinter> fingerprinter = nullptr,
                                 CircuitBreaker::ClockFn clock = nullptr);

    DeduplicationEngine(const DeduplicationEngine&) = delete;
    DeduplicationEngine& operator=(const DeduplicationEngine&) = delete;

    /**
     * @brief Merge findings from one file
     *
     * Records without a file take @p filePath. Merged records are kept in
     * the cache, so scanning the same file again extends the earlier
     * records rather than starting over.
     */
    std::vector<FindingRecord> deduplicateFileFindings(const FindingBatch& findings,
                                                       const std::string& filePath);

    /**
     * @brief Merge findings across a whole scan
     *
     * Clears the cache first.
     */
    ScanDedupResult deduplicateScanFindings(const FindingBatch& findings);

    /**
     * @brief Clear the cache and statistics; the breaker keeps its state
     */
    void reset();

    [[nodiscard]] DedupStats getStats() const;

    /**
     * @brief Cached record for a fingerprint
     */
    [[nodiscard]] std::optional<FindingRecord> cachedRecord(const std::string& fingerprint) const;

    [[nodiscard]] const CircuitBreaker& circuitBreaker() const noexcept { return m_executor.breaker(); }
    [[nodiscard]] const DedupConfig& config() const noexcept { return m_config; }

private:
    struct MergeCounts {
        size_t skipped = 0;
    };

    Result<std::vector<FindingRecord>> merge(const FindingBatch& findings, const Deadline& deadline,
                                             const std::string* filePath, bool seedFromCache,
                                             MergeCounts& counts);

    void remember(const std::string& fingerprint, const FindingRecord& record);
    void recordOutcome(const ExecutionOutcome& outcome, size_t total, size_t skipped,
                       const char* operationType);

    DedupConfig m_config;
    std::shared_ptr<const IFingerprinter> m_fingerprinter;
    ResilientExecutor m_executor;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, FindingRecord> m_cache;
    std::deque<std::string> m_cacheOrder;
    DedupStats m_stats;
    Milliseconds m_totalDuration{0};
};

} // namespace Argus::Core

#endif // ARGUS_CORE_DEDUPLICATION_ENGINE_HPP
