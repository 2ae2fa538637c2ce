/**
 * @file ResilientExecutor.hpp
 * @brief Circuit breaker, time budget, memory guard and fallback around a merge
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * The executor never fails: when the merge cannot run or does not finish,
 * the caller receives every input record back, tagged as a fallback.
 */

#pragma once

#ifndef ARGUS_CORE_RESILIENT_EXECUTOR_HPP
#define ARGUS_CORE_RESILIENT_EXECUTOR_HPP

#include <Argus/Core/Types.hpp>
#include <Argus/Core/ErrorCodes.hpp>
#include <Argus/Core/Finding.hpp>
#include <Argus/Core/CircuitBreaker.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Argus::Core {

/// Fallback reasons other than error kind names
namespace FallbackReason {
    inline constexpr const char* PerformanceLimit = "performance_limit";
    inline constexpr const char* CircuitOpen = "circuit_open";
}

/// Value of deduplicationStatus on fallback output
inline constexpr const char* FALLBACK_STATUS = "fallback";

/**
 * @brief Soft time budget, polled by the merge between findings
 */
class Deadline {
public:
    Deadline(CircuitBreaker::ClockFn clock, Milliseconds budget)
        : m_clock(std::move(clock))
        , m_start(m_clock())
        , m_budget(budget)
    {}

    [[nodiscard]] bool expired() const { return elapsed() > m_budget; }

    [[nodiscard]] Milliseconds elapsed() const {
        return std::chrono::duration_cast<Milliseconds>(m_clock() - m_start);
    }

    [[nodiscard]] Milliseconds budget() const noexcept { return m_budget; }

private:
    CircuitBreaker::ClockFn m_clock;
    TimePoint m_start;
    Milliseconds m_budget;
};

struct ResilienceConfig {
    Milliseconds maxTime{30000};
    double memoryLimitMB = 512.0;
    CircuitBreakerConfig breaker;
};

/**
 * @brief Result of one guarded execution
 */
struct ExecutionOutcome {
    std::vector<FindingRecord> records;
    bool usedFallback = false;
    std::string fallbackReason;
    std::optional<ErrorCode> error;       ///< Set when the merge failed or timed out
    std::string errorMessage;
    Milliseconds elapsed{0};
};

class ResilientExecutor {
public:
    using MergeFn = std::function<Result<std::vector<FindingRecord>>(const FindingBatch&, const Deadline&)>;

    /// Operations slower than this are logged
    static constexpr Milliseconds SLOW_OPERATION{1000};

    explicit ResilientExecutor(ResilienceConfig config = {}, CircuitBreaker::ClockFn clock = nullptr);

    /**
     * @brief Run @p merge over @p batch under the breaker, budget and memory guard
     *
     * - breaker OPEN: fallback "circuit_open", not counted as a failure
     * - estimated memory over the limit: fallback "performance_limit",
     *   merge not run, not counted
     * - merge returns Timeout or exceeds the budget: fallback
     *   "performance_limit", counted
     * - merge returns another error or throws: fallback named after the
     *   error kind (e.g. "DeduplicationError"), counted
     */
    ExecutionOutcome execute(const FindingBatch& batch, const MergeFn& merge,
                             std::string_view operationType);

    /**
     * @brief Pass-through output for @p batch
     *
     * Same length as the input. Null entries become empty records. Each
     * record is tagged and gets occurrenceCount and locations when missing.
     */
    [[nodiscard]] static std::vector<FindingRecord> fallback(const FindingBatch& batch,
                                                             const std::string& reason);

    /**
     * @brief Rough heap footprint of a batch in bytes
     */
    [[nodiscard]] static size_t estimateBatchBytes(const FindingBatch& batch) noexcept;

    [[nodiscard]] CircuitBreaker& breaker() noexcept { return m_breaker; }
    [[nodiscard]] const CircuitBreaker& breaker() const noexcept { return m_breaker; }
    [[nodiscard]] const ResilienceConfig& config() const noexcept { return m_config; }

private:
    ExecutionOutcome failWith(const FindingBatch& batch, ErrorCode code, std::string message,
                              const Deadline& deadline, std::string_view operationType);

    ResilienceConfig m_config;
    CircuitBreaker::ClockFn m_clock;
    CircuitBreaker m_breaker;
};

} // namespace Argus::Core

#endif // ARGUS_CORE_RESILIENT_EXECUTOR_HPP
