// =================================================================
// include/Quorum/ConnectionManager.hpp
// =================================================================
// Connection pools of LLM endpoints with failover and health checks.

#pragma once

#include "Quorum/CancellationToken.hpp"
#include "Quorum/CircuitBreaker.hpp"
#include "Quorum/Endpoint.hpp"
#include "Quorum/LlmInteraction.hpp"
#include "Quorum/LoadBalancer.hpp"
#include "nlohmann/json.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Quorum {

/**
 * @brief Pool policy
 */
struct PoolConfig {
    std::string pool_id;
    LoadBalancingStrategy strategy = LoadBalancingStrategy::HEALTH_BASED;
    size_t max_retries = 3;                           ///< Failover attempts per call
    CircuitBreakerConfig circuit_breaker;             ///< Applied to every endpoint of the pool
    bool health_check_enabled = true;
    std::chrono::milliseconds failover_delay_step{500}; ///< Sleep is step * attempt between attempts
};

/**
 * @brief Background health checker settings
 */
struct HealthCheckConfig {
    std::chrono::milliseconds interval{30000};        ///< Time between passes
    std::chrono::milliseconds probe_timeout{5000};    ///< Deadline of one probe
    std::chrono::milliseconds healthy_response_budget{5000}; ///< Slower answers mark the endpoint degraded
};

/**
 * @brief Statistics of one pool
 */
struct PoolStats {
    std::string pool_id;
    LoadBalancingStrategy strategy = LoadBalancingStrategy::HEALTH_BASED;
    size_t total_endpoints = 0;
    size_t healthy_endpoints = 0;
    size_t degraded_endpoints = 0;
    size_t unhealthy_endpoints = 0;
    size_t unknown_endpoints = 0;
    size_t active_connections = 0;
    std::vector<EndpointSnapshot> endpoints;      ///< Registration order
};

/**
 * @brief Statistics of every pool
 */
struct ConnectionStats {
    std::string current_pool;
    std::map<std::string, PoolStats> pools;

    nlohmann::json toJson() const;
};

/**
 * @brief Creates the client used to talk to an endpoint
 */
using ClientFactory = std::function<std::shared_ptr<LlmInteraction>(const EndpointConfig&)>;

/**
 * @brief Scoped reservation of one endpoint connection slot
 *
 * The slot is returned when the lease is destroyed or release() is called,
 * whatever the outcome of the call. A half-open trial that ends without a
 * recorded outcome gives the trial slot back to the breaker.
 */
class EndpointLease {
public:
    EndpointLease(std::shared_ptr<Endpoint> endpoint, bool trial);
    ~EndpointLease();

    EndpointLease(EndpointLease&& other) noexcept;
    EndpointLease& operator=(EndpointLease&& other) noexcept;
    EndpointLease(const EndpointLease&) = delete;
    EndpointLease& operator=(const EndpointLease&) = delete;

    Endpoint& endpoint() const { return *m_endpoint; }
    const std::string& getEndpointId() const { return m_endpoint->getId(); }
    bool isTrial() const { return m_trial; }

    /**
     * @brief Record a successful call on the endpoint and its breaker
     * @param response_time_ms Observed latency
     */
    void recordSuccess(double response_time_ms);

    /**
     * @brief Record a failed call on the endpoint and its breaker
     * @param type Classified failure
     */
    void recordFailure(ErrorType type);

    /**
     * @brief Return the slot now; later calls are no-ops
     */
    void release();

private:
    std::shared_ptr<Endpoint> m_endpoint;
    bool m_trial = false;
    bool m_outcome_recorded = false;
    bool m_released = false;
};

/**
 * @brief Registry of endpoint pools with selection, failover and health checks
 *
 * A "default" pool exists from construction and is current until changed.
 * Health checks run only between start() and stop().
 */
class ConnectionManager {
public:
    static constexpr const char* DEFAULT_POOL = "default";

    /**
     * @brief Constructor
     * @param health_config Health checker settings
     * @param client_factory Client factory, defaults to OllamaInteraction
     */
    explicit ConnectionManager(const HealthCheckConfig& health_config = HealthCheckConfig(),
                               ClientFactory client_factory = nullptr);

    /**
     * @brief Destructor, stops the health checker
     */
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Create a pool, or update the policy of an existing one
     * @param config Pool policy
     * @throws ValidationError on an empty id or zero max_retries
     */
    void addPool(const PoolConfig& config);

    bool hasPool(const std::string& pool_id) const;
    std::vector<std::string> getPoolIds() const;

    /**
     * @brief Make a pool current
     * @param pool_id Existing pool
     * @throws ValidationError if the pool does not exist
     */
    void setCurrentPool(const std::string& pool_id);
    std::string getCurrentPool() const;

    /**
     * @brief Register an endpoint
     * @param config Endpoint configuration
     * @param pool_id Target pool, empty for the current pool
     * @throws ValidationError on duplicate id, unknown pool or invalid settings
     */
    void addEndpoint(const EndpointConfig& config, const std::string& pool_id = "");

    /**
     * @brief Remove an endpoint and its breaker
     * @return True if the endpoint existed
     */
    bool removeEndpoint(const std::string& endpoint_id, const std::string& pool_id = "");

    bool enableEndpoint(const std::string& endpoint_id, const std::string& pool_id = "");
    bool disableEndpoint(const std::string& endpoint_id, const std::string& pool_id = "");

    /**
     * @brief Change a pool's selection policy
     * @throws ValidationError if the pool does not exist
     */
    void setLoadBalancingStrategy(LoadBalancingStrategy strategy, const std::string& pool_id = "");

    /**
     * @brief Reserve an eligible endpoint
     * @param pool_id Pool to select from, empty for the current pool
     * @return Lease holding the connection slot
     * @throws NoHealthyEndpointError if nothing is eligible or the pool is unknown
     */
    EndpointLease acquireEndpoint(const std::string& pool_id = "");

    /**
     * @brief Issue a request, failing over between endpoints
     * @param request Generation request; an empty model uses the endpoint's model
     * @param pool_id Pool to use, empty for the current pool
     * @param token Cancels the failover sleep between attempts
     * @return Response of the first successful attempt
     * @throws The last attempt's error once max_retries attempts failed
     */
    GenerationResponse callWithFailover(const GenerationRequest& request,
                                        const std::string& pool_id = "",
                                        const CancellationToken& token = CancellationToken());

    /**
     * @brief Probe every enabled endpoint of every health-checked pool concurrently
     * @return Number of endpoints found healthy
     */
    size_t checkAllEndpointsHealth();

    /**
     * @brief Snapshot of one endpoint
     * @return Snapshot, or std::nullopt if not found
     */
    std::optional<EndpointSnapshot> getEndpointSnapshot(const std::string& endpoint_id,
                                                       const std::string& pool_id = "") const;

    /**
     * @brief Collect statistics without side effects
     */
    ConnectionStats getConnectionStats() const;

    /**
     * @brief Start the background health checker; runs one pass immediately
     */
    void start();

    /**
     * @brief Stop the background health checker and wait for it
     */
    void stop();

    bool isRunning() const;

    HealthCheckConfig getHealthCheckConfig() const { return m_health_config; }

private:
    struct Pool {
        explicit Pool(const PoolConfig& pool_config)
            : config(pool_config), balancer(pool_config.strategy) {}

        PoolConfig config;
        std::vector<std::shared_ptr<Endpoint>> endpoints;
        LoadBalancer balancer;
        size_t next_registration_index = 0;
        mutable std::mutex mutex;             ///< Guards endpoints and selection
    };

    std::shared_ptr<Pool> findPool(const std::string& pool_id) const;
    std::string resolvePoolId(const std::string& pool_id) const;
    std::shared_ptr<Endpoint> findEndpoint(const Pool& pool, const std::string& endpoint_id) const;
    EndpointStatus probeEndpoint(Endpoint& endpoint);
    void healthCheckLoop();

    HealthCheckConfig m_health_config;
    ClientFactory m_client_factory;

    std::map<std::string, std::shared_ptr<Pool>> m_pools;
    std::string m_current_pool;
    mutable std::mutex m_pools_mutex;

    std::unique_ptr<std::thread> m_health_check_thread;
    std::atomic<bool> m_stop_health_checks{false};
    std::mutex m_health_mutex;
    std::condition_variable m_health_cv;
    mutable std::mutex m_lifecycle_mutex;
};

} // namespace Quorum
