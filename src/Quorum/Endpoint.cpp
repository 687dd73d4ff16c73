// =================================================================
// src/Quorum/Endpoint.cpp
// =================================================================
// Implementation of endpoint state tracking.

#include "Quorum/Endpoint.hpp"

namespace Quorum {

std::string endpointStatusToString(EndpointStatus status) {
    switch (status) {
        case EndpointStatus::HEALTHY: return "healthy";
        case EndpointStatus::DEGRADED: return "degraded";
        case EndpointStatus::UNHEALTHY: return "unhealthy";
        case EndpointStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

double EndpointMetrics::successRate() const {
    if (total_requests == 0) {
        return 0.0;
    }
    return static_cast<double>(successful_requests) / static_cast<double>(total_requests) * 100.0;
}

Endpoint::Endpoint(const EndpointConfig& config, std::shared_ptr<LlmInteraction> client,
                   const CircuitBreakerConfig& breaker_config, size_t registration_index)
    : m_config(config), m_client(std::move(client)), m_breaker(breaker_config),
      m_registration_index(registration_index) {
    m_metrics.created_at = std::chrono::system_clock::now();
}

EndpointConfig Endpoint::getConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

EndpointSnapshot Endpoint::snapshot() const {
    EndpointSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snap.config = m_config;
        snap.status = m_status;
        snap.active_connections = m_active_connections;
        snap.metrics = m_metrics;
    }
    snap.circuit_state = m_breaker.getState();
    snap.circuit_failure_count = m_breaker.getFailureCount();
    snap.circuit_available = m_breaker.isAvailable();
    snap.registration_index = m_registration_index;
    return snap;
}

bool Endpoint::isEligible() const {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_config.enabled) return false;
        if (m_status != EndpointStatus::HEALTHY && m_status != EndpointStatus::DEGRADED) return false;
        if (m_active_connections >= m_config.max_concurrent) return false;
    }
    return m_breaker.isAvailable();
}

bool Endpoint::tryReserve() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active_connections >= m_config.max_concurrent) {
        return false;
    }
    m_active_connections++;
    return true;
}

void Endpoint::release() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_active_connections > 0) {
        m_active_connections--;
    }
}

void Endpoint::recordAttempt() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_metrics.total_requests++;
    m_metrics.last_request_time = std::chrono::system_clock::now();
}

void Endpoint::recordSuccess(double response_time_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_metrics.successful_requests++;

    if (!m_metrics.has_response_sample) {
        m_metrics.avg_response_time_ms = response_time_ms;
        m_metrics.has_response_sample = true;
    } else {
        m_metrics.avg_response_time_ms = RESPONSE_TIME_ALPHA * response_time_ms +
                                         (1.0 - RESPONSE_TIME_ALPHA) * m_metrics.avg_response_time_ms;
    }
}

void Endpoint::recordFailure(ErrorType type) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_metrics.failed_requests++;

    if (type == ErrorType::TIMEOUT) {
        m_metrics.timeout_errors++;
    } else if (type == ErrorType::NETWORK) {
        m_metrics.connection_errors++;
    }
}

void Endpoint::recordHealthCheck(EndpointStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = status;
    m_metrics.last_health_check = std::chrono::system_clock::now();
}

void Endpoint::assumeHealthy() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_status = EndpointStatus::HEALTHY;
}

void Endpoint::setEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.enabled = enabled;
}

bool Endpoint::isEnabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config.enabled;
}

EndpointStatus Endpoint::getStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

size_t Endpoint::getActiveConnections() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active_connections;
}

} // namespace Quorum
