// =================================================================
// include/Quorum/Endpoint.hpp
// =================================================================
// LLM service endpoint with health state, counters and circuit breaker.

#pragma once

#include "Quorum/CircuitBreaker.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/LlmInteraction.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Quorum {

/**
 * @brief Endpoint health status
 */
enum class EndpointStatus {
    HEALTHY,    ///< Answered the last probe within budget
    DEGRADED,   ///< Answered the last probe slowly
    UNHEALTHY,  ///< Failed the last probe
    UNKNOWN     ///< Not probed yet
};

std::string endpointStatusToString(EndpointStatus status);

/**
 * @brief Static endpoint configuration
 */
struct EndpointConfig {
    std::string endpoint_id;                      ///< Unique identifier within the manager
    std::string base_url;                         ///< Service base URL
    std::string model_name;                       ///< Model served by this endpoint
    int priority = 5;                             ///< 1-10, higher is preferred
    size_t max_concurrent = 5;                    ///< Concurrent call limit
    std::chrono::milliseconds timeout{60000};     ///< Per-request deadline
    bool enabled = true;                          ///< Administrative switch
};

/**
 * @brief Rolling request metrics
 */
struct EndpointMetrics {
    size_t total_requests = 0;
    size_t successful_requests = 0;
    size_t failed_requests = 0;
    size_t connection_errors = 0;
    size_t timeout_errors = 0;
    double avg_response_time_ms = 0.0;            ///< Exponential moving average
    bool has_response_sample = false;             ///< False until the first success
    std::optional<std::chrono::system_clock::time_point> last_request_time;
    std::optional<std::chrono::system_clock::time_point> last_health_check;
    std::chrono::system_clock::time_point created_at;

    /**
     * @brief Success rate in percent, 0 when no requests were made
     */
    double successRate() const;
};

/**
 * @brief Consistent copy of an endpoint's state
 */
struct EndpointSnapshot {
    EndpointConfig config;
    EndpointStatus status = EndpointStatus::UNKNOWN;
    size_t active_connections = 0;
    EndpointMetrics metrics;
    CircuitState circuit_state = CircuitState::CLOSED;
    size_t circuit_failure_count = 0;
    bool circuit_available = true;
    size_t registration_index = 0;                ///< Position in the pool's registration order
};

/**
 * @brief One LLM service endpoint
 *
 * All mutable state sits behind a per-endpoint mutex; the circuit breaker
 * carries its own lock.
 */
class Endpoint {
public:
    /// Smoothing factor of the response time moving average
    static constexpr double RESPONSE_TIME_ALPHA = 0.1;

    Endpoint(const EndpointConfig& config, std::shared_ptr<LlmInteraction> client,
             const CircuitBreakerConfig& breaker_config, size_t registration_index);

    const std::string& getId() const { return m_config.endpoint_id; }
    EndpointConfig getConfig() const;
    std::shared_ptr<LlmInteraction> getClient() const { return m_client; }
    CircuitBreaker& getCircuitBreaker() { return m_breaker; }
    const CircuitBreaker& getCircuitBreaker() const { return m_breaker; }
    size_t getRegistrationIndex() const { return m_registration_index; }

    EndpointSnapshot snapshot() const;

    /**
     * @brief Check the selection filter
     * @return True if enabled, healthy or degraded, below capacity and admitted by the breaker
     */
    bool isEligible() const;

    /**
     * @brief Take one connection slot if capacity remains
     * @return True if a slot was taken
     */
    bool tryReserve();

    /**
     * @brief Give back one connection slot, never going below zero
     */
    void release();

    /**
     * @brief Count a request attempt against this endpoint
     */
    void recordAttempt();

    /**
     * @brief Record a successful request
     * @param response_time_ms Observed latency
     */
    void recordSuccess(double response_time_ms);

    /**
     * @brief Record a failed request
     * @param type Classified failure, drives the timeout and connection counters
     */
    void recordFailure(ErrorType type);

    /**
     * @brief Store the result of a health probe
     * @param status New status
     */
    void recordHealthCheck(EndpointStatus status);

    /**
     * @brief Treat the endpoint as healthy without probing it
     *
     * Used for pools whose health checks are disabled; the status of such
     * endpoints never changes afterwards.
     */
    void assumeHealthy();

    void setEnabled(bool enabled);
    bool isEnabled() const;
    EndpointStatus getStatus() const;
    size_t getActiveConnections() const;

private:
    EndpointConfig m_config;
    std::shared_ptr<LlmInteraction> m_client;
    CircuitBreaker m_breaker;
    size_t m_registration_index;

    EndpointStatus m_status = EndpointStatus::UNKNOWN;
    size_t m_active_connections = 0;
    EndpointMetrics m_metrics;

    mutable std::mutex m_mutex;
};

} // namespace Quorum
