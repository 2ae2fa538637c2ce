/**
 * @file ResilientExecutor.cpp
 * @brief Guarded execution of the deduplication merge
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/ResilientExecutor.hpp>
#include <Argus/Core/Logger.hpp>
#include <exception>

namespace Argus::Core {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

size_t stringBytes(const std::optional<std::string>& value) noexcept {
    return value ? value->size() : 0;
}

} // anonymous namespace

ResilientExecutor::ResilientExecutor(ResilienceConfig config, CircuitBreaker::ClockFn clock)
    : m_config(config)
    , m_clock(clock ? std::move(clock) : CircuitBreaker::ClockFn([] { return Clock::now(); }))
    , m_breaker(config.breaker, m_clock)
{
}

size_t ResilientExecutor::estimateBatchBytes(const FindingBatch& batch) noexcept {
    size_t total = batch.size() * sizeof(std::optional<FindingRecord>);
    for (const auto& entry : batch) {
        if (!entry) {
            continue;
        }
        total += stringBytes(entry->patternId) + stringBytes(entry->patternName) +
                 stringBytes(entry->file) + stringBytes(entry->value) +
                 stringBytes(entry->deduplicationStatus) + stringBytes(entry->fallbackReason);
        total += entry->locations.size() * sizeof(Location);
        for (const auto& location : entry->locations) {
            total += location.file.size();
        }
    }
    return total;
}

std::vector<FindingRecord> ResilientExecutor::fallback(const FindingBatch& batch, const std::string& reason) {
    std::vector<FindingRecord> out;
    out.reserve(batch.size());

    for (const auto& entry : batch) {
        FindingRecord record = entry.value_or(FindingRecord{});
        if (record.locations.empty()) {
            record.locations.push_back(record.ownLocation());
        }
        if (!record.occurrenceCount) {
            record.occurrenceCount = record.locations.size();
        }
        record.deduplicationStatus = FALLBACK_STATUS;
        record.fallbackReason = reason;
        out.push_back(std::move(record));
    }
    return out;
}

ExecutionOutcome ResilientExecutor::failWith(const FindingBatch& batch, ErrorCode code, std::string message,
                                             const Deadline& deadline, std::string_view operationType) {
    m_breaker.recordFailure();

    ExecutionOutcome outcome;
    outcome.usedFallback = true;
    outcome.fallbackReason = isResourceLimit(code) ? FallbackReason::PerformanceLimit
                                                   : std::string(getErrorKindName(code));
    outcome.error = code;
    outcome.errorMessage = std::move(message);
    outcome.elapsed = deadline.elapsed();
    outcome.records = fallback(batch, outcome.fallbackReason);

    ARGUS_LOG_WARNING_F("%.*s failed after %lld ms (%s), using fallback '%s'",
                        static_cast<int>(operationType.size()), operationType.data(),
                        static_cast<long long>(outcome.elapsed.count()), outcome.errorMessage.c_str(),
                        outcome.fallbackReason.c_str());
    return outcome;
}

ExecutionOutcome ResilientExecutor::execute(const FindingBatch& batch, const MergeFn& merge,
                                            std::string_view operationType) {
    const Deadline deadline(m_clock, m_config.maxTime);

    if (!m_breaker.allowRequest()) {
        ExecutionOutcome outcome;
        outcome.usedFallback = true;
        outcome.fallbackReason = FallbackReason::CircuitOpen;
        outcome.records = fallback(batch, outcome.fallbackReason);
        ARGUS_LOG_WARNING_F("%.*s skipped: circuit breaker is open",
                            static_cast<int>(operationType.size()), operationType.data());
        return outcome;
    }

    const double estimatedMB = static_cast<double>(estimateBatchBytes(batch)) / BYTES_PER_MB;
    if (estimatedMB > m_config.memoryLimitMB) {
        ExecutionOutcome outcome;
        outcome.usedFallback = true;
        outcome.fallbackReason = FallbackReason::PerformanceLimit;
        outcome.records = fallback(batch, outcome.fallbackReason);
        ARGUS_LOG_WARNING_F("%.*s skipped: estimated %.2f MB exceeds the %.2f MB limit",
                            static_cast<int>(operationType.size()), operationType.data(),
                            estimatedMB, m_config.memoryLimitMB);
        return outcome;
    }

    Result<std::vector<FindingRecord>> result = ErrorCode::DeduplicationFailed;
    try {
        result = merge(batch, deadline);
    } catch (const std::exception& e) {
        return failWith(batch, ErrorCode::DeduplicationFailed, e.what(), deadline, operationType);
    } catch (...) {
        return failWith(batch, ErrorCode::DeduplicationFailed, "non-standard exception from merge",
                        deadline, operationType);
    }

    if (result.isFailure()) {
        return failWith(batch, result.error(), std::string(getErrorMessage(result.error())),
                        deadline, operationType);
    }
    if (deadline.expired()) {
        return failWith(batch, ErrorCode::Timeout,
                        "exceeded " + std::to_string(m_config.maxTime.count()) + " ms budget",
                        deadline, operationType);
    }

    m_breaker.recordSuccess();

    ExecutionOutcome outcome;
    outcome.records = std::move(result.value());
    outcome.elapsed = deadline.elapsed();
    if (outcome.elapsed > SLOW_OPERATION) {
        ARGUS_LOG_WARNING_F("Slow %.*s: %lld ms for %zu findings",
                            static_cast<int>(operationType.size()), operationType.data(),
                            static_cast<long long>(outcome.elapsed.count()), batch.size());
    }
    return outcome;
}

} // namespace Argus::Core
