/**
 * @file CircuitBreaker.hpp
 * @brief Three-state circuit breaker with an injectable clock
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * CLOSED -> OPEN after `threshold` consecutive failures. OPEN rejects calls
 * until `resetTimeout` has elapsed since it opened; the next call is a
 * HALF_OPEN trial whose success closes the breaker and whose failure opens
 * it again.
 */

#pragma once

#ifndef ARGUS_CORE_CIRCUIT_BREAKER_HPP
#define ARGUS_CORE_CIRCUIT_BREAKER_HPP

#include <Argus/Core/Types.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>

namespace Argus::Core {

enum class BreakerState : uint8_t {
    Closed,
    Open,
    HalfOpen
};

/**
 * @brief "CLOSED", "OPEN" or "HALF_OPEN"
 */
[[nodiscard]] std::string_view breakerStateToString(BreakerState state) noexcept;

struct CircuitBreakerConfig {
    bool enabled = true;                  ///< A disabled breaker never opens
    uint32_t threshold = 3;               ///< Consecutive failures before opening
    Milliseconds resetTimeout{60000};
};

/**
 * @brief Point-in-time view of a breaker
 */
struct CircuitBreakerSnapshot {
    BreakerState state = BreakerState::Closed;
    uint32_t failureCount = 0;
    std::optional<TimePoint> lastFailureTime;
    std::optional<TimePoint> nextAttemptTime;   ///< Set while OPEN
    uint32_t threshold = 0;
    Milliseconds resetTimeout{0};
};

class CircuitBreaker {
public:
    using ClockFn = std::function<TimePoint()>;

    /**
     * @param config Threshold and reset timeout
     * @param clock Time source; defaults to the steady clock
     */
    explicit CircuitBreaker(CircuitBreakerConfig config = {}, ClockFn clock = nullptr);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Ask whether a call may proceed
     *
     * Moves OPEN to HALF_OPEN once the reset timeout has elapsed.
     * @return false while OPEN
     */
    bool allowRequest();

    void recordSuccess();
    void recordFailure();

    [[nodiscard]] BreakerState state() const;
    [[nodiscard]] CircuitBreakerSnapshot snapshot() const;

    /**
     * @brief Force CLOSED with no failures
     */
    void reset();

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return m_config; }

private:
    CircuitBreakerConfig m_config;
    ClockFn m_clock;

    mutable std::mutex m_mutex;
    BreakerState m_state = BreakerState::Closed;
    uint32_t m_failureCount = 0;
    std::optional<TimePoint> m_lastFailureTime;
    std::optional<TimePoint> m_nextAttemptTime;
};

} // namespace Argus::Core

#endif // ARGUS_CORE_CIRCUIT_BREAKER_HPP
