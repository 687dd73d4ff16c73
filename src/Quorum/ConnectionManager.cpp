// =================================================================
// src/Quorum/ConnectionManager.cpp
// =================================================================
// Implementation of endpoint pools, failover and health checking.

#include "Quorum/ConnectionManager.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/Logger.hpp"
#include "Quorum/OllamaInteraction.hpp"
#include "Quorum/TimeFormat.hpp"
#include <algorithm>
#include <future>

namespace Quorum {

namespace {

nlohmann::json optionalTime(const std::optional<std::chrono::system_clock::time_point>& time_point) {
    if (!time_point) {
        return nullptr;
    }
    return formatIsoTimestamp(*time_point);
}

nlohmann::json snapshotToJson(const EndpointSnapshot& snap) {
    const auto& metrics = snap.metrics;
    return {
        {"endpoint_id", snap.config.endpoint_id},
        {"base_url", snap.config.base_url},
        {"model_name", snap.config.model_name},
        {"status", endpointStatusToString(snap.status)},
        {"enabled", snap.config.enabled},
        {"priority", snap.config.priority},
        {"active_connections", snap.active_connections},
        {"max_concurrent", snap.config.max_concurrent},
        {"timeout_ms", snap.config.timeout.count()},
        {"metrics", {
            {"total_requests", metrics.total_requests},
            {"successful_requests", metrics.successful_requests},
            {"failed_requests", metrics.failed_requests},
            {"connection_errors", metrics.connection_errors},
            {"timeout_errors", metrics.timeout_errors},
            {"success_rate", metrics.successRate()},
            {"avg_response_time_ms", metrics.avg_response_time_ms},
            {"last_request_time", optionalTime(metrics.last_request_time)},
            {"last_health_check", optionalTime(metrics.last_health_check)},
            {"created_at", formatIsoTimestamp(metrics.created_at)}
        }},
        {"circuit_breaker", {
            {"state", circuitStateToString(snap.circuit_state)},
            {"failure_count", snap.circuit_failure_count},
            {"available", snap.circuit_available}
        }}
    };
}

std::shared_ptr<LlmInteraction> createOllamaClient(const EndpointConfig& config) {
    return std::make_shared<OllamaInteraction>(config.base_url, config.model_name);
}

} // namespace

// =================================================================
// ConnectionStats
// =================================================================

nlohmann::json ConnectionStats::toJson() const {
    nlohmann::json pools_json = nlohmann::json::object();

    for (const auto& [pool_id, stats] : pools) {
        nlohmann::json endpoints_json = nlohmann::json::array();
        for (const auto& snap : stats.endpoints) {
            endpoints_json.push_back(snapshotToJson(snap));
        }

        pools_json[pool_id] = {
            {"strategy", loadBalancingStrategyToString(stats.strategy)},
            {"total_endpoints", stats.total_endpoints},
            {"healthy_endpoints", stats.healthy_endpoints},
            {"degraded_endpoints", stats.degraded_endpoints},
            {"unhealthy_endpoints", stats.unhealthy_endpoints},
            {"unknown_endpoints", stats.unknown_endpoints},
            {"active_connections", stats.active_connections},
            {"endpoints", endpoints_json}
        };
    }

    return {
        {"current_pool", current_pool},
        {"pools", pools_json}
    };
}

// =================================================================
// EndpointLease
// =================================================================

EndpointLease::EndpointLease(std::shared_ptr<Endpoint> endpoint, bool trial)
    : m_endpoint(std::move(endpoint)), m_trial(trial) {}

EndpointLease::~EndpointLease() {
    release();
}

EndpointLease::EndpointLease(EndpointLease&& other) noexcept
    : m_endpoint(std::move(other.m_endpoint)), m_trial(other.m_trial),
      m_outcome_recorded(other.m_outcome_recorded), m_released(other.m_released) {
    other.m_released = true;
}

EndpointLease& EndpointLease::operator=(EndpointLease&& other) noexcept {
    if (this != &other) {
        release();
        m_endpoint = std::move(other.m_endpoint);
        m_trial = other.m_trial;
        m_outcome_recorded = other.m_outcome_recorded;
        m_released = other.m_released;
        other.m_released = true;
    }
    return *this;
}

void EndpointLease::recordSuccess(double response_time_ms) {
    m_endpoint->recordSuccess(response_time_ms);
    m_endpoint->getCircuitBreaker().recordSuccess();
    m_outcome_recorded = true;
}

void EndpointLease::recordFailure(ErrorType type) {
    m_endpoint->recordFailure(type);
    m_endpoint->getCircuitBreaker().recordFailure();
    m_outcome_recorded = true;
}

void EndpointLease::release() {
    if (m_released || !m_endpoint) {
        return;
    }
    m_released = true;

    if (m_trial && !m_outcome_recorded) {
        m_endpoint->getCircuitBreaker().releaseTrial();
    }
    m_endpoint->release();
}

// =================================================================
// ConnectionManager Implementation
// =================================================================

ConnectionManager::ConnectionManager(const HealthCheckConfig& health_config, ClientFactory client_factory)
    : m_health_config(health_config),
      m_client_factory(client_factory ? std::move(client_factory) : ClientFactory(createOllamaClient)),
      m_current_pool(DEFAULT_POOL) {
    PoolConfig default_pool;
    default_pool.pool_id = DEFAULT_POOL;
    m_pools[DEFAULT_POOL] = std::make_shared<Pool>(default_pool);
}

ConnectionManager::~ConnectionManager() {
    stop();
}

void ConnectionManager::addPool(const PoolConfig& config) {
    if (config.pool_id.empty()) {
        throw ValidationError("Pool id must not be empty");
    }
    if (config.max_retries == 0) {
        throw ValidationError("Pool " + config.pool_id + ": max_retries must be at least 1");
    }
    if (config.circuit_breaker.failure_threshold == 0) {
        throw ValidationError("Pool " + config.pool_id + ": circuit breaker threshold must be at least 1");
    }

    std::lock_guard<std::mutex> lock(m_pools_mutex);
    auto it = m_pools.find(config.pool_id);
    if (it == m_pools.end()) {
        m_pools[config.pool_id] = std::make_shared<Pool>(config);
        Logger::getInstance().info("ConnectionManager", "Created pool " + config.pool_id,
                                   "Strategy: " + loadBalancingStrategyToString(config.strategy));
        return;
    }

    // Existing endpoints keep their breakers; the new breaker settings apply to later registrations
    auto& pool = it->second;
    std::lock_guard<std::mutex> pool_lock(pool->mutex);
    pool->config = config;
    pool->balancer.setStrategy(config.strategy);
    Logger::getInstance().info("ConnectionManager", "Updated pool " + config.pool_id);
}

bool ConnectionManager::hasPool(const std::string& pool_id) const {
    std::lock_guard<std::mutex> lock(m_pools_mutex);
    return m_pools.count(pool_id) > 0;
}

std::vector<std::string> ConnectionManager::getPoolIds() const {
    std::lock_guard<std::mutex> lock(m_pools_mutex);
    std::vector<std::string> ids;
    for (const auto& [pool_id, _] : m_pools) {
        ids.push_back(pool_id);
    }
    return ids;
}

void ConnectionManager::setCurrentPool(const std::string& pool_id) {
    std::lock_guard<std::mutex> lock(m_pools_mutex);
    if (m_pools.find(pool_id) == m_pools.end()) {
        throw ValidationError("Unknown pool: " + pool_id);
    }
    m_current_pool = pool_id;
}

std::string ConnectionManager::getCurrentPool() const {
    std::lock_guard<std::mutex> lock(m_pools_mutex);
    return m_current_pool;
}

void ConnectionManager::addEndpoint(const EndpointConfig& config, const std::string& pool_id) {
    if (config.endpoint_id.empty()) {
        throw ValidationError("Endpoint id must not be empty");
    }
    if (config.base_url.empty()) {
        throw ValidationError("Endpoint " + config.endpoint_id + ": base_url must not be empty");
    }
    if (config.priority < 1 || config.priority > 10) {
        throw ValidationError("Endpoint " + config.endpoint_id + ": priority must be between 1 and 10");
    }
    if (config.max_concurrent == 0) {
        throw ValidationError("Endpoint " + config.endpoint_id + ": max_concurrent must be at least 1");
    }
    if (config.timeout.count() <= 0) {
        throw ValidationError("Endpoint " + config.endpoint_id + ": timeout must be positive");
    }

    std::string resolved = resolvePoolId(pool_id);
    auto pool = findPool(resolved);
    if (!pool) {
        throw ValidationError("Unknown pool: " + resolved);
    }

    auto client = m_client_factory(config);
    if (!client) {
        throw ValidationError("Endpoint " + config.endpoint_id + ": client factory returned no client");
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    if (findEndpoint(*pool, config.endpoint_id)) {
        throw ValidationError("Endpoint already registered in pool " + resolved + ": " + config.endpoint_id);
    }

    auto endpoint = std::make_shared<Endpoint>(
        config, std::move(client), pool->config.circuit_breaker, pool->next_registration_index++);
    if (!pool->config.health_check_enabled) {
        endpoint->assumeHealthy();
    }
    pool->endpoints.push_back(std::move(endpoint));

    Logger::getInstance().info("ConnectionManager",
        "Added endpoint " + config.endpoint_id + " to pool " + resolved,
        config.base_url + " (" + config.model_name + ", priority " + std::to_string(config.priority) + ")");
}

bool ConnectionManager::removeEndpoint(const std::string& endpoint_id, const std::string& pool_id) {
    auto pool = findPool(resolvePoolId(pool_id));
    if (!pool) {
        return false;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    auto& endpoints = pool->endpoints;
    auto it = std::find_if(endpoints.begin(), endpoints.end(),
        [&endpoint_id](const std::shared_ptr<Endpoint>& endpoint) {
            return endpoint->getId() == endpoint_id;
        });
    if (it == endpoints.end()) {
        return false;
    }

    endpoints.erase(it);
    Logger::getInstance().info("ConnectionManager", "Removed endpoint " + endpoint_id);
    return true;
}

bool ConnectionManager::enableEndpoint(const std::string& endpoint_id, const std::string& pool_id) {
    auto pool = findPool(resolvePoolId(pool_id));
    if (!pool) {
        return false;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    auto endpoint = findEndpoint(*pool, endpoint_id);
    if (!endpoint) {
        return false;
    }
    endpoint->setEnabled(true);
    Logger::getInstance().info("ConnectionManager", "Enabled endpoint " + endpoint_id);
    return true;
}

bool ConnectionManager::disableEndpoint(const std::string& endpoint_id, const std::string& pool_id) {
    auto pool = findPool(resolvePoolId(pool_id));
    if (!pool) {
        return false;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    auto endpoint = findEndpoint(*pool, endpoint_id);
    if (!endpoint) {
        return false;
    }
    endpoint->setEnabled(false);
    Logger::getInstance().info("ConnectionManager", "Disabled endpoint " + endpoint_id);
    return true;
}

void ConnectionManager::setLoadBalancingStrategy(LoadBalancingStrategy strategy, const std::string& pool_id) {
    std::string resolved = resolvePoolId(pool_id);
    auto pool = findPool(resolved);
    if (!pool) {
        throw ValidationError("Unknown pool: " + resolved);
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    pool->config.strategy = strategy;
    pool->balancer.setStrategy(strategy);
    Logger::getInstance().info("ConnectionManager",
        "Pool " + resolved + " strategy set to " + loadBalancingStrategyToString(strategy));
}

EndpointLease ConnectionManager::acquireEndpoint(const std::string& pool_id) {
    std::string resolved = resolvePoolId(pool_id);
    auto pool = findPool(resolved);
    if (!pool) {
        throw NoHealthyEndpointError(resolved);
    }

    // Selection and reservation happen under the pool lock so two callers
    // cannot both take the last slot of an endpoint
    std::lock_guard<std::mutex> lock(pool->mutex);

    std::vector<std::shared_ptr<Endpoint>> eligible;
    std::vector<EndpointSnapshot> candidates;
    for (const auto& endpoint : pool->endpoints) {
        if (endpoint->isEligible()) {
            eligible.push_back(endpoint);
            candidates.push_back(endpoint->snapshot());
        }
    }

    while (!eligible.empty()) {
        size_t index = pool->balancer.select(candidates);
        auto endpoint = eligible[index];

        if (endpoint->tryReserve()) {
            CircuitAdmission admission = endpoint->getCircuitBreaker().tryAcquire();
            if (admission != CircuitAdmission::REJECTED) {
                Logger::getInstance().debug("ConnectionManager",
                    "Selected endpoint " + endpoint->getId() + " in pool " + resolved,
                    "Strategy: " + pool->balancer.getStrategyName() +
                    (admission == CircuitAdmission::TRIAL ? ", half-open trial" : ""));
                return EndpointLease(endpoint, admission == CircuitAdmission::TRIAL);
            }
            endpoint->release();
        }

        // Lost a race with a concurrent failure or release; drop and reselect
        eligible.erase(eligible.begin() + static_cast<std::ptrdiff_t>(index));
        candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(index));
    }

    throw NoHealthyEndpointError(resolved);
}

GenerationResponse ConnectionManager::callWithFailover(const GenerationRequest& request,
                                                       const std::string& pool_id,
                                                       const CancellationToken& token) {
    std::string resolved = resolvePoolId(pool_id);
    auto pool = findPool(resolved);
    if (!pool) {
        throw NoHealthyEndpointError(resolved);
    }

    size_t max_retries;
    std::chrono::milliseconds delay_step;
    {
        std::lock_guard<std::mutex> lock(pool->mutex);
        max_retries = pool->config.max_retries;
        delay_step = pool->config.failover_delay_step;
    }

    std::exception_ptr last_error;

    for (size_t attempt = 1; attempt <= max_retries; ++attempt) {
        token.throwIfCancelled("failover call");

        try {
            EndpointLease lease = acquireEndpoint(resolved);
            Endpoint& endpoint = lease.endpoint();
            EndpointConfig endpoint_config = endpoint.getConfig();

            GenerationRequest routed = request;
            if (routed.model.empty()) {
                routed.model = endpoint_config.model_name;
            }

            endpoint.recordAttempt();
            auto start_time = std::chrono::steady_clock::now();

            try {
                GenerationResponse response = endpoint.getClient()->generate(routed, endpoint_config.timeout);
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time);

                lease.recordSuccess(static_cast<double>(elapsed.count()));
                Logger::getInstance().logEndpointCall(endpoint.getId(), static_cast<long>(elapsed.count()), true);
                return response;

            } catch (const QuorumError& e) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time);
                lease.recordFailure(e.getType());
                Logger::getInstance().logEndpointCall(endpoint.getId(), static_cast<long>(elapsed.count()),
                                                      false, e.what());
                throw;
            } catch (const std::exception& e) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time);
                lease.recordFailure(ErrorType::UNKNOWN);
                Logger::getInstance().logEndpointCall(endpoint.getId(), static_cast<long>(elapsed.count()),
                                                      false, e.what());
                throw;
            }

        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            last_error = std::current_exception();
            Logger::getInstance().warning("ConnectionManager",
                "Attempt " + std::to_string(attempt) + "/" + std::to_string(max_retries) +
                " on pool " + resolved + " failed", e.what());
        }

        if (attempt < max_retries) {
            if (token.waitFor(delay_step * static_cast<long>(attempt))) {
                throw CancelledError("Operation cancelled during failover delay");
            }
        }
    }

    Logger::getInstance().error("ConnectionManager",
        "All " + std::to_string(max_retries) + " attempts failed on pool " + resolved);
    std::rethrow_exception(last_error);
}

size_t ConnectionManager::checkAllEndpointsHealth() {
    std::vector<std::shared_ptr<Endpoint>> targets;
    {
        std::lock_guard<std::mutex> lock(m_pools_mutex);
        for (const auto& [pool_id, pool] : m_pools) {
            std::lock_guard<std::mutex> pool_lock(pool->mutex);
            if (!pool->config.health_check_enabled) {
                continue;
            }
            for (const auto& endpoint : pool->endpoints) {
                if (endpoint->isEnabled()) {
                    targets.push_back(endpoint);
                }
            }
        }
    }

    std::vector<std::future<EndpointStatus>> futures;
    futures.reserve(targets.size());
    for (const auto& endpoint : targets) {
        futures.push_back(std::async(std::launch::async, [this, endpoint]() {
            return probeEndpoint(*endpoint);
        }));
    }

    size_t healthy_count = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            if (futures[i].get() == EndpointStatus::HEALTHY) {
                healthy_count++;
            }
        } catch (const std::exception& e) {
            Logger::getInstance().error("ConnectionManager",
                "Health check task failed for " + targets[i]->getId(), e.what());
        }
    }

    Logger::getInstance().debug("ConnectionManager",
        "Health check complete: " + std::to_string(healthy_count) + "/" +
        std::to_string(targets.size()) + " endpoints healthy");

    return healthy_count;
}

EndpointStatus ConnectionManager::probeEndpoint(Endpoint& endpoint) {
    auto start_time = std::chrono::steady_clock::now();
    EndpointStatus status = EndpointStatus::UNHEALTHY;

    try {
        bool alive = endpoint.getClient()->healthCheck(m_health_config.probe_timeout);
        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (alive) {
            status = elapsed < m_health_config.healthy_response_budget ? EndpointStatus::HEALTHY
                                                                     : EndpointStatus::DEGRADED;
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warning("HealthCheck", "Probe of " + endpoint.getId() + " raised", e.what());
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    endpoint.recordHealthCheck(status);
    Logger::getInstance().logHealthCheck(endpoint.getId(), endpointStatusToString(status),
                                         static_cast<long>(elapsed_ms.count()));
    return status;
}

std::optional<EndpointSnapshot> ConnectionManager::getEndpointSnapshot(const std::string& endpoint_id,
                                                                      const std::string& pool_id) const {
    auto pool = findPool(resolvePoolId(pool_id));
    if (!pool) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    auto endpoint = findEndpoint(*pool, endpoint_id);
    if (!endpoint) {
        return std::nullopt;
    }
    return endpoint->snapshot();
}

ConnectionStats ConnectionManager::getConnectionStats() const {
    ConnectionStats stats;

    std::lock_guard<std::mutex> lock(m_pools_mutex);
    stats.current_pool = m_current_pool;

    for (const auto& [pool_id, pool] : m_pools) {
        PoolStats pool_stats;
        pool_stats.pool_id = pool_id;

        std::lock_guard<std::mutex> pool_lock(pool->mutex);
        pool_stats.strategy = pool->config.strategy;
        pool_stats.total_endpoints = pool->endpoints.size();

        for (const auto& endpoint : pool->endpoints) {
            EndpointSnapshot snap = endpoint->snapshot();
            switch (snap.status) {
                case EndpointStatus::HEALTHY: pool_stats.healthy_endpoints++; break;
                case EndpointStatus::DEGRADED: pool_stats.degraded_endpoints++; break;
                case EndpointStatus::UNHEALTHY: pool_stats.unhealthy_endpoints++; break;
                case EndpointStatus::UNKNOWN: pool_stats.unknown_endpoints++; break;
            }
            pool_stats.active_connections += snap.active_connections;
            pool_stats.endpoints.push_back(std::move(snap));
        }

        stats.pools[pool_id] = std::move(pool_stats);
    }

    return stats;
}

void ConnectionManager::start() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_health_check_thread) {
        return;
    }

    m_stop_health_checks.store(false);
    m_health_check_thread = std::make_unique<std::thread>(&ConnectionManager::healthCheckLoop, this);
    Logger::getInstance().info("ConnectionManager", "Started health check thread",
        "Interval: " + std::to_string(m_health_config.interval.count()) + "ms");
}

void ConnectionManager::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!m_health_check_thread) {
        return;
    }

    {
        std::lock_guard<std::mutex> health_lock(m_health_mutex);
        m_stop_health_checks.store(true);
    }
    m_health_cv.notify_all();

    if (m_health_check_thread->joinable()) {
        m_health_check_thread->join();
    }
    m_health_check_thread.reset();
    Logger::getInstance().info("ConnectionManager", "Stopped health check thread");
}

bool ConnectionManager::isRunning() const {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    return m_health_check_thread != nullptr && !m_stop_health_checks.load();
}

void ConnectionManager::healthCheckLoop() {
    while (!m_stop_health_checks.load()) {
        try {
            checkAllEndpointsHealth();
        } catch (const std::exception& e) {
            Logger::getInstance().error("ConnectionManager",
                "Health check loop error: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(m_health_mutex);
        if (m_health_cv.wait_for(lock, m_health_config.interval,
                                 [this] { return m_stop_health_checks.load(); })) {
            break;
        }
    }
}

std::shared_ptr<ConnectionManager::Pool> ConnectionManager::findPool(const std::string& pool_id) const {
    std::lock_guard<std::mutex> lock(m_pools_mutex);
    auto it = m_pools.find(pool_id);
    return it != m_pools.end() ? it->second : nullptr;
}

std::string ConnectionManager::resolvePoolId(const std::string& pool_id) const {
    if (!pool_id.empty()) {
        return pool_id;
    }
    std::lock_guard<std::mutex> lock(m_pools_mutex);
    return m_current_pool;
}

std::shared_ptr<Endpoint> ConnectionManager::findEndpoint(const Pool& pool, const std::string& endpoint_id) const {
    for (const auto& endpoint : pool.endpoints) {
        if (endpoint->getId() == endpoint_id) {
            return endpoint;
        }
    }
    return nullptr;
}

} // namespace Quorum
