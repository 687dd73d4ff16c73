// =================================================================
// include/Quorum/LoadBalancer.hpp
// =================================================================
// Endpoint selection policies for a connection pool.

#pragma once

#include "Quorum/Endpoint.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Quorum {

/**
 * @brief Load balancing strategy type
 */
enum class LoadBalancingStrategy {
    ROUND_ROBIN,        ///< Rotate through eligible endpoints
    RANDOM,             ///< Uniform random choice
    LEAST_CONNECTIONS,  ///< Fewest active connections
    RESPONSE_TIME,      ///< Lowest average response time
    HEALTH_BASED        ///< Highest priority among healthy endpoints
};

std::string loadBalancingStrategyToString(LoadBalancingStrategy strategy);

/**
 * @brief Parse a strategy name such as "round_robin"
 * @param name Strategy name
 * @return Strategy, or std::nullopt if unknown
 */
std::optional<LoadBalancingStrategy> parseLoadBalancingStrategy(const std::string& name);

/**
 * @brief Load balancing strategy base class
 */
class BalancingStrategy {
public:
    virtual ~BalancingStrategy() = default;

    /**
     * @brief Select an endpoint
     * @param candidates Eligible endpoints in registration order, never empty
     * @return Index into candidates
     */
    virtual size_t selectEndpoint(const std::vector<EndpointSnapshot>& candidates) = 0;

    /**
     * @brief Get strategy name
     * @return Strategy identifier
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Per-pool endpoint selector
 *
 * Holds the active strategy instance, so per-pool state such as the
 * round-robin counter lives as long as the strategy stays selected.
 */
class LoadBalancer {
public:
    explicit LoadBalancer(LoadBalancingStrategy strategy = LoadBalancingStrategy::HEALTH_BASED);
    ~LoadBalancer();

    /**
     * @brief Select an endpoint from the eligible set
     * @param candidates Eligible endpoints in registration order
     * @return Index into candidates
     * @throws std::invalid_argument if candidates is empty
     */
    size_t select(const std::vector<EndpointSnapshot>& candidates);

    /**
     * @brief Set active load balancing strategy
     * @param strategy Strategy to use
     */
    void setStrategy(LoadBalancingStrategy strategy);

    /**
     * @brief Replace the strategy with a custom implementation
     * @param strategy Strategy type reported by getStrategy()
     * @param implementation Strategy implementation
     */
    void setStrategy(LoadBalancingStrategy strategy, std::unique_ptr<BalancingStrategy> implementation);

    LoadBalancingStrategy getStrategy() const;
    std::string getStrategyName() const;

    /**
     * @brief Create a built-in strategy
     * @param strategy Strategy type
     * @return New strategy instance
     */
    static std::unique_ptr<BalancingStrategy> createStrategy(LoadBalancingStrategy strategy);

private:
    LoadBalancingStrategy m_strategy;
    std::unique_ptr<BalancingStrategy> m_implementation;
    mutable std::mutex m_mutex;

    // Built-in strategy classes
    class RoundRobinStrategy;
    class RandomStrategy;
    class LeastConnectionsStrategy;
    class ResponseTimeStrategy;
    class HealthBasedStrategy;
};

} // namespace Quorum
