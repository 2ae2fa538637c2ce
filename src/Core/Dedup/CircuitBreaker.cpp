/**
 * @file CircuitBreaker.cpp
 * @brief Circuit breaker state machine
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 */

#include <Argus/Core/CircuitBreaker.hpp>
#include <Argus/Core/Logger.hpp>

namespace Argus::Core {

std::string_view breakerStateToString(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::Closed:   return "CLOSED";
        case BreakerState::Open:     return "OPEN";
        case BreakerState::HalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, ClockFn clock)
    : m_config(config)
    , m_clock(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
{
}

bool CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state != BreakerState::Open) {
        return true;
    }
    if (m_nextAttemptTime && m_clock() >= *m_nextAttemptTime) {
        m_state = BreakerState::HalfOpen;
        ARGUS_LOG_INFO("Circuit breaker HALF_OPEN, allowing a trial call");
        return true;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state == BreakerState::HalfOpen) {
        ARGUS_LOG_INFO("Circuit breaker CLOSED after successful trial");
    }
    m_state = BreakerState::Closed;
    m_failureCount = 0;
    m_nextAttemptTime.reset();
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);

    const TimePoint now = m_clock();
    m_failureCount++;
    m_lastFailureTime = now;

    if (!m_config.enabled) {
        return;
    }

    if (m_state == BreakerState::HalfOpen || m_failureCount >= m_config.threshold) {
        const bool reopening = m_state == BreakerState::HalfOpen;
        m_state = BreakerState::Open;
        m_nextAttemptTime = now + m_config.resetTimeout;
        ARGUS_LOG_WARNING_F("Circuit breaker OPEN%s after %u failures (reset in %lld ms)",
                            reopening ? " again" : "", m_failureCount,
                            static_cast<long long>(m_config.resetTimeout.count()));
    }
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

CircuitBreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CircuitBreakerSnapshot snap;
    snap.state = m_state;
    snap.failureCount = m_failureCount;
    snap.lastFailureTime = m_lastFailureTime;
    snap.nextAttemptTime = m_nextAttemptTime;
    snap.threshold = m_config.threshold;
    snap.resetTimeout = m_config.resetTimeout;
    return snap;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = BreakerState::Closed;
    m_failureCount = 0;
    m_lastFailureTime.reset();
    m_nextAttemptTime.reset();
}

} // namespace Argus::Core
