// =================================================================
// src/Quorum/LoadBalancer.cpp
// =================================================================
// Implementation of endpoint selection policies.

#include "Quorum/LoadBalancer.hpp"
#include "Quorum/Logger.hpp"
#include <algorithm>
#include <limits>
#include <random>
#include <stdexcept>

namespace Quorum {

std::string loadBalancingStrategyToString(LoadBalancingStrategy strategy) {
    switch (strategy) {
        case LoadBalancingStrategy::ROUND_ROBIN: return "round_robin";
        case LoadBalancingStrategy::RANDOM: return "random";
        case LoadBalancingStrategy::LEAST_CONNECTIONS: return "least_connections";
        case LoadBalancingStrategy::RESPONSE_TIME: return "response_time";
        case LoadBalancingStrategy::HEALTH_BASED: return "health_based";
    }
    return "health_based";
}

std::optional<LoadBalancingStrategy> parseLoadBalancingStrategy(const std::string& name) {
    if (name == "round_robin") return LoadBalancingStrategy::ROUND_ROBIN;
    if (name == "random") return LoadBalancingStrategy::RANDOM;
    if (name == "least_connections") return LoadBalancingStrategy::LEAST_CONNECTIONS;
    if (name == "response_time") return LoadBalancingStrategy::RESPONSE_TIME;
    if (name == "health_based") return LoadBalancingStrategy::HEALTH_BASED;
    return std::nullopt;
}

// =================================================================
// Built-in Load Balancing Strategies
// =================================================================

/**
 * @brief Round-robin over the eligible set
 */
class LoadBalancer::RoundRobinStrategy : public BalancingStrategy {
private:
    size_t m_counter = 0;

public:
    size_t selectEndpoint(const std::vector<EndpointSnapshot>& candidates) override {
        size_t selected_index = m_counter % candidates.size();
        m_counter++;
        return selected_index;
    }

    std::string getName() const override {
        return "round_robin";
    }
};

/**
 * @brief Uniform random choice
 */
class LoadBalancer::RandomStrategy : public BalancingStrategy {
private:
    std::mt19937 m_generator{std::random_device{}()};

public:
    size_t selectEndpoint(const std::vector<EndpointSnapshot>& candidates) override {
        std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
        return dist(m_generator);
    }

    std::string getName() const override {
        return "random";
    }
};

/**
 * @brief Fewest active connections, ties to registration order
 */
class LoadBalancer::LeastConnectionsStrategy : public BalancingStrategy {
public:
    size_t selectEndpoint(const std::vector<EndpointSnapshot>& candidates) override {
        // min_element keeps the first of equal elements
        auto min_it = std::min_element(candidates.begin(), candidates.end(),
            [](const EndpointSnapshot& a, const EndpointSnapshot& b) {
                return a.active_connections < b.active_connections;
            });
        return static_cast<size_t>(std::distance(candidates.begin(), min_it));
    }

    std::string getName() const override {
        return "least_connections";
    }
};

/**
 * @brief Lowest average response time; endpoints without samples rank last
 */
class LoadBalancer::ResponseTimeStrategy : public BalancingStrategy {
public:
    size_t selectEndpoint(const std::vector<EndpointSnapshot>& candidates) override {
        auto effective_time = [](const EndpointSnapshot& snap) {
            return snap.metrics.has_response_sample ? snap.metrics.avg_response_time_ms
                                                    : std::numeric_limits<double>::infinity();
        };

        auto best_it = std::min_element(candidates.begin(), candidates.end(),
            [&effective_time](const EndpointSnapshot& a, const EndpointSnapshot& b) {
                return effective_time(a) < effective_time(b);
            });
        return static_cast<size_t>(std::distance(candidates.begin(), best_it));
    }

    std::string getName() const override {
        return "response_time";
    }
};

/**
 * @brief Highest priority among healthy endpoints, else among all candidates
 */
class LoadBalancer::HealthBasedStrategy : public BalancingStrategy {
public:
    size_t selectEndpoint(const std::vector<EndpointSnapshot>& candidates) override {
        std::optional<size_t> best_healthy;
        size_t best_any = 0;

        for (size_t i = 0; i < candidates.size(); ++i) {
            const auto& snap = candidates[i];
            if (snap.config.priority > candidates[best_any].config.priority) {
                best_any = i;
            }
            if (snap.status == EndpointStatus::HEALTHY &&
                (!best_healthy || snap.config.priority > candidates[*best_healthy].config.priority)) {
                best_healthy = i;
            }
        }

        return best_healthy ? *best_healthy : best_any;
    }

    std::string getName() const override {
        return "health_based";
    }
};

// =================================================================
// LoadBalancer Implementation
// =================================================================

LoadBalancer::LoadBalancer(LoadBalancingStrategy strategy)
    : m_strategy(strategy), m_implementation(createStrategy(strategy)) {}

LoadBalancer::~LoadBalancer() = default;

std::unique_ptr<BalancingStrategy> LoadBalancer::createStrategy(LoadBalancingStrategy strategy) {
    switch (strategy) {
        case LoadBalancingStrategy::ROUND_ROBIN:
            return std::make_unique<RoundRobinStrategy>();
        case LoadBalancingStrategy::RANDOM:
            return std::make_unique<RandomStrategy>();
        case LoadBalancingStrategy::LEAST_CONNECTIONS:
            return std::make_unique<LeastConnectionsStrategy>();
        case LoadBalancingStrategy::RESPONSE_TIME:
            return std::make_unique<ResponseTimeStrategy>();
        case LoadBalancingStrategy::HEALTH_BASED:
            return std::make_unique<HealthBasedStrategy>();
    }
    throw std::invalid_argument("Unsupported load balancing strategy");
}

size_t LoadBalancer::select(const std::vector<EndpointSnapshot>& candidates) {
    if (candidates.empty()) {
        throw std::invalid_argument("Cannot select from an empty endpoint set");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    size_t index = m_implementation->selectEndpoint(candidates);
    if (index >= candidates.size()) {
        Logger::getInstance().warning("LoadBalancer",
            "Strategy " + m_implementation->getName() + " returned out-of-range index, using first endpoint");
        return 0;
    }
    return index;
}

void LoadBalancer::setStrategy(LoadBalancingStrategy strategy) {
    setStrategy(strategy, createStrategy(strategy));
}

void LoadBalancer::setStrategy(LoadBalancingStrategy strategy, std::unique_ptr<BalancingStrategy> implementation) {
    if (!implementation) {
        throw std::invalid_argument("Strategy implementation must not be null");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_strategy = strategy;
    m_implementation = std::move(implementation);
}

LoadBalancingStrategy LoadBalancer::getStrategy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_strategy;
}

std::string LoadBalancer::getStrategyName() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_implementation->getName();
}

} // namespace Quorum
