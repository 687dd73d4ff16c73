// =================================================================
// src/Quorum/MinutesService.cpp
// =================================================================

#include "Quorum/MinutesService.hpp"
#include "Quorum/Logger.hpp"

namespace Quorum {

MinutesService::MinutesService(const ServiceConfig& config,
                               ClientFactory client_factory,
                               std::shared_ptr<TextPreprocessor> preprocessor)
    : m_config(config),
      m_connections(std::make_unique<ConnectionManager>(config.health_check, std::move(client_factory))),
      m_recovery(std::make_unique<ErrorRecoveryManager>()),
      m_preprocessor(preprocessor ? std::move(preprocessor) : std::make_shared<RegexTextPreprocessor>()) {

    for (const auto& pool : m_config.pools) {
        m_connections->addPool(pool.policy);
        for (const auto& endpoint : pool.endpoints) {
            m_connections->addEndpoint(endpoint, pool.policy.pool_id);
        }
    }
    m_connections->setCurrentPool(m_config.current_pool);

    m_extractor = std::make_unique<MeetingExtractor>(*m_connections, *m_recovery, m_preprocessor,
                                                     m_config.extraction);
    registerRecoveryActions();

    Logger::getInstance().info("MinutesService", "Service initialized",
                               std::to_string(m_config.pools.size()) + " pool(s), current=" + m_config.current_pool);
}

MinutesService::~MinutesService() {
    shutdown();
}

void MinutesService::start() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_shutdown) {
        throw UserError("Cannot start a service that was shut down");
    }
    // Endpoints are ineligible until probed; make the first call see real statuses
    m_connections->checkAllEndpointsHealth();
    m_connections->start();
}

void MinutesService::shutdown() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_shutdown) {
        return;
    }
    m_shutdown = true;
    m_connections->stop();
    Logger::getInstance().info("MinutesService", "Service shut down");
}

ExtractionResult MinutesService::extractMeetingMinutes(const std::string& text,
                                                       const PreprocessingOptions& preprocessing,
                                                       const ExtractionOptions& options) {
    return m_extractor->extract(text, preprocessing, options);
}

void MinutesService::addEndpoint(const EndpointConfig& config, const std::string& pool_id) {
    m_connections->addEndpoint(config, pool_id);
}

bool MinutesService::removeEndpoint(const std::string& endpoint_id, const std::string& pool_id) {
    return m_connections->removeEndpoint(endpoint_id, pool_id);
}

bool MinutesService::enableEndpoint(const std::string& endpoint_id, const std::string& pool_id) {
    return m_connections->enableEndpoint(endpoint_id, pool_id);
}

bool MinutesService::disableEndpoint(const std::string& endpoint_id, const std::string& pool_id) {
    return m_connections->disableEndpoint(endpoint_id, pool_id);
}

void MinutesService::setLoadBalancingStrategy(LoadBalancingStrategy strategy, const std::string& pool_id) {
    m_connections->setLoadBalancingStrategy(strategy, pool_id);
}

ConnectionStats MinutesService::getConnectionStats() const {
    return m_connections->getConnectionStats();
}

size_t MinutesService::checkHealth() {
    return m_connections->checkAllEndpointsHealth();
}

// =================================================================
// Pool-aware recovery actions
// =================================================================

bool MinutesService::hasUsableEndpoint(const PoolStats& pool) {
    for (const auto& endpoint : pool.endpoints) {
        if (endpoint.config.enabled &&
            endpoint.status == EndpointStatus::HEALTHY &&
            endpoint.circuit_available &&
            endpoint.active_connections < endpoint.config.max_concurrent) {
            return true;
        }
    }
    return false;
}

void MinutesService::registerRecoveryActions() {
    ConnectionManager* connections = m_connections.get();

    auto poolFor = [connections](const ErrorInfo& info) {
        auto it = info.context.find("pool_id");
        return (it != info.context.end() && !it->second.empty()) ? it->second : connections->getCurrentPool();
    };

    // A probe only helps when it leaves the failing pool with a usable endpoint
    auto poolUsable = [connections, poolFor](const ErrorInfo& info) {
        ConnectionStats stats = connections->getConnectionStats();
        auto it = stats.pools.find(poolFor(info));
        return it != stats.pools.end() && hasUsableEndpoint(it->second);
    };

    RecoveryAction check_connection;
    check_connection.action_id = "check_connection";
    check_connection.description = "Probe every endpoint and retry if the pool has a usable one";
    check_connection.priority = 9;
    check_connection.handler = [connections, poolFor, poolUsable](const ErrorInfo& info) {
        size_t healthy = connections->checkAllEndpointsHealth();
        if (healthy == 0) {
            return RecoveryOutcome::failed("No endpoint answered the health probe");
        }
        if (!poolUsable(info)) {
            return RecoveryOutcome::failed("Probe left no usable endpoint in pool " + poolFor(info));
        }
        return RecoveryOutcome::succeeded(std::to_string(healthy) + " healthy endpoint(s)");
    };
    m_recovery->registerRecoveryAction(ErrorType::NETWORK, check_connection);

    RecoveryAction fallback_endpoint;
    fallback_endpoint.action_id = "fallback_endpoint";
    fallback_endpoint.description = "Retry if the pool still has a usable endpoint";
    fallback_endpoint.priority = 7;
    fallback_endpoint.handler = [poolFor, poolUsable](const ErrorInfo& info) {
        if (!poolUsable(info)) {
            return RecoveryOutcome::failed("No usable endpoint in pool " + poolFor(info));
        }
        return RecoveryOutcome::succeeded("Usable endpoint available in pool " + poolFor(info));
    };
    m_recovery->registerRecoveryAction(ErrorType::NETWORK, fallback_endpoint);

    RecoveryAction check_ai_service;
    check_ai_service.action_id = "check_ai_service";
    check_ai_service.description = "Run a health pass over the inference endpoints";
    check_ai_service.priority = 10;
    check_ai_service.handler = [connections](const ErrorInfo&) {
        size_t healthy = connections->checkAllEndpointsHealth();
        if (healthy == 0) {
            return RecoveryOutcome::failed("Inference service is not healthy");
        }
        return RecoveryOutcome::succeeded(std::to_string(healthy) + " healthy endpoint(s)");
    };
    m_recovery->registerRecoveryAction(ErrorType::AI_SERVICE, check_ai_service);
}

} // namespace Quorum
