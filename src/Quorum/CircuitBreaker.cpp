// =================================================================
// src/Quorum/CircuitBreaker.cpp
// =================================================================
// Implementation of the circuit breaker state machine.

#include "Quorum/CircuitBreaker.hpp"

namespace Quorum {

std::string circuitStateToString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "closed";
        case CircuitState::OPEN: return "open";
        case CircuitState::HALF_OPEN: return "half_open";
    }
    return "closed";
}

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config) : m_config(config) {}

bool CircuitBreaker::windowElapsed(std::chrono::steady_clock::time_point now) const {
    return now - m_last_failure > m_config.timeout_window;
}

bool CircuitBreaker::isAvailable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (m_state) {
        case CircuitState::CLOSED:
            return true;
        case CircuitState::OPEN:
            return windowElapsed(std::chrono::steady_clock::now());
        case CircuitState::HALF_OPEN:
            return !m_trial_in_flight;
    }
    return false;
}

CircuitAdmission CircuitBreaker::tryAcquire() {
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (m_state) {
        case CircuitState::CLOSED:
            return CircuitAdmission::ADMITTED;
        case CircuitState::OPEN:
            if (!windowElapsed(std::chrono::steady_clock::now())) {
                return CircuitAdmission::REJECTED;
            }
            m_state = CircuitState::HALF_OPEN;
            m_trial_in_flight = true;
            return CircuitAdmission::TRIAL;
        case CircuitState::HALF_OPEN:
            if (m_trial_in_flight) {
                return CircuitAdmission::REJECTED;
            }
            m_trial_in_flight = true;
            return CircuitAdmission::TRIAL;
    }
    return CircuitAdmission::REJECTED;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = CircuitState::CLOSED;
    m_failure_count = 0;
    m_trial_in_flight = false;
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failure_count++;
    m_last_failure = std::chrono::steady_clock::now();
    m_last_failure_wall = std::chrono::system_clock::now();

    if (m_state == CircuitState::HALF_OPEN) {
        m_state = CircuitState::OPEN;
        m_trial_in_flight = false;
    } else if (m_state == CircuitState::CLOSED && m_failure_count >= m_config.failure_threshold) {
        m_state = CircuitState::OPEN;
    }
}

void CircuitBreaker::releaseTrial() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == CircuitState::HALF_OPEN) {
        m_trial_in_flight = false;
    }
}

CircuitState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == CircuitState::OPEN && windowElapsed(std::chrono::steady_clock::now())) {
        return CircuitState::HALF_OPEN;
    }
    return m_state;
}

size_t CircuitBreaker::getFailureCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failure_count;
}

std::optional<std::chrono::system_clock::time_point> CircuitBreaker::getLastFailureTime() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_failure_wall;
}

CircuitBreakerConfig CircuitBreaker::getConfig() const {
    return m_config;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = CircuitState::CLOSED;
    m_failure_count = 0;
    m_trial_in_flight = false;
}

} // namespace Quorum
