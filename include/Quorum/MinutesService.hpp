// =================================================================
// include/Quorum/MinutesService.hpp
// =================================================================
// Facade wiring the connection pools, retry engine and extractor.

#pragma once

#include "Quorum/ConnectionManager.hpp"
#include "Quorum/ErrorRecovery.hpp"
#include "Quorum/MeetingExtractor.hpp"
#include "Quorum/ServiceConfig.hpp"
#include "Quorum/TextPreprocessor.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace Quorum {

/**
 * @brief Owns every component of a minutes extraction service
 */
class MinutesService {
public:
    /**
     * @brief Build the service from configuration
     * @param config Service configuration
     * @param client_factory Client factory, defaults to OllamaInteraction
     * @param preprocessor Preprocessor, defaults to RegexTextPreprocessor
     * @throws ValidationError if a pool or endpoint is invalid
     */
    explicit MinutesService(const ServiceConfig& config,
                            ClientFactory client_factory = nullptr,
                            std::shared_ptr<TextPreprocessor> preprocessor = nullptr);

    /**
     * @brief Destructor, calls shutdown()
     */
    ~MinutesService();

    MinutesService(const MinutesService&) = delete;
    MinutesService& operator=(const MinutesService&) = delete;

    /**
     * @brief Start background health checks
     */
    void start();

    /**
     * @brief Stop background health checks; safe to call more than once
     */
    void shutdown();

    ExtractionResult extractMeetingMinutes(const std::string& text,
                                           const PreprocessingOptions& preprocessing = PreprocessingOptions(),
                                           const ExtractionOptions& options = ExtractionOptions());

    void addEndpoint(const EndpointConfig& config, const std::string& pool_id = "");
    bool removeEndpoint(const std::string& endpoint_id, const std::string& pool_id = "");
    bool enableEndpoint(const std::string& endpoint_id, const std::string& pool_id = "");
    bool disableEndpoint(const std::string& endpoint_id, const std::string& pool_id = "");
    void setLoadBalancingStrategy(LoadBalancingStrategy strategy, const std::string& pool_id = "");

    ConnectionStats getConnectionStats() const;

    /**
     * @brief Run one health pass immediately
     * @return Number of healthy endpoints
     */
    size_t checkHealth();

    ConnectionManager& getConnectionManager() { return *m_connections; }
    ErrorRecoveryManager& getErrorRecovery() { return *m_recovery; }
    const ServiceConfig& getConfig() const { return m_config; }

private:
    void registerRecoveryActions();
    static bool hasUsableEndpoint(const PoolStats& pool);

    ServiceConfig m_config;
    std::unique_ptr<ConnectionManager> m_connections;
    std::unique_ptr<ErrorRecoveryManager> m_recovery;
    std::shared_ptr<TextPreprocessor> m_preprocessor;
    std::unique_ptr<MeetingExtractor> m_extractor;

    std::mutex m_lifecycle_mutex;
    bool m_shutdown = false;
};

} // namespace Quorum
