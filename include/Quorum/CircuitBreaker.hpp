// =================================================================
// include/Quorum/CircuitBreaker.hpp
// =================================================================
// Per-endpoint failure-counting circuit breaker.

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace Quorum {

/**
 * @brief Circuit breaker states
 */
enum class CircuitState {
    CLOSED,     ///< Calls flow normally
    OPEN,       ///< Calls rejected until the timeout window elapses
    HALF_OPEN   ///< One trial call admitted
};

std::string circuitStateToString(CircuitState state);

/**
 * @brief Circuit breaker thresholds
 */
struct CircuitBreakerConfig {
    size_t failure_threshold = 5;                     ///< Failures that open the circuit
    std::chrono::milliseconds timeout_window{60000};  ///< Time spent open before a trial
};

/**
 * @brief Result of asking the breaker for permission to call
 */
enum class CircuitAdmission {
    REJECTED,   ///< Call not allowed
    ADMITTED,   ///< Normal call in the closed state
    TRIAL       ///< The single half-open trial call
};

/**
 * @brief Failure-counting state machine guarding one endpoint
 *
 * closed -> open after failure_threshold failures; open -> half_open once
 * timeout_window has passed since the last failure; half_open admits one
 * trial, whose success closes the circuit and whose failure reopens it.
 */
class CircuitBreaker {
public:
    explicit CircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig());

    /**
     * @brief Check whether a call would be admitted now, without reserving it
     * @return True if tryAcquire() would currently succeed
     */
    bool isAvailable() const;

    /**
     * @brief Ask permission for one call
     * @return Admission kind; TRIAL reserves the half-open slot
     */
    CircuitAdmission tryAcquire();

    /**
     * @brief Record a successful call, closing the circuit
     */
    void recordSuccess();

    /**
     * @brief Record a failed call
     */
    void recordFailure();

    /**
     * @brief Return an unused half-open trial slot
     *
     * Called when a trial call ends without an outcome, e.g. on cancellation.
     */
    void releaseTrial();

    /**
     * @brief Get the effective state
     *
     * An open circuit whose window has elapsed reports HALF_OPEN.
     */
    CircuitState getState() const;

    size_t getFailureCount() const;
    std::optional<std::chrono::system_clock::time_point> getLastFailureTime() const;
    CircuitBreakerConfig getConfig() const;

    /**
     * @brief Force the circuit closed and clear the failure count
     */
    void reset();

private:
    bool windowElapsed(std::chrono::steady_clock::time_point now) const;

    CircuitBreakerConfig m_config;
    CircuitState m_state = CircuitState::CLOSED;
    size_t m_failure_count = 0;
    bool m_trial_in_flight = false;
    std::chrono::steady_clock::time_point m_last_failure;
    std::optional<std::chrono::system_clock::time_point> m_last_failure_wall;

    mutable std::mutex m_mutex;
};

} // namespace Quorum
