// =================================================================
// include/Quorum/ServiceConfig.hpp
// =================================================================
// Service configuration and its YAML loader.

#pragma once

#include "Quorum/ConnectionManager.hpp"
#include "Quorum/Endpoint.hpp"
#include "Quorum/Logger.hpp"
#include "Quorum/MeetingExtractor.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Quorum {

/**
 * @brief Single inference service settings, used when no pools are configured
 */
struct OllamaSettings {
    std::string host = "http://localhost:11434";
    std::string model = "llama3.1:8b";
    std::chrono::milliseconds timeout{60000};
    size_t max_concurrent = 5;
    std::vector<std::string> fallback_urls;
};

/**
 * @brief A pool policy with its endpoints
 */
struct PoolDefinition {
    PoolConfig policy;
    std::vector<EndpointConfig> endpoints;
};

struct LoggingSettings {
    std::string directory = ".quorum/logs";
    LogLevel console_level = LogLevel::INFO;
    LogLevel file_level = LogLevel::DEBUG;
    bool console = true;
};

struct ServiceConfig {
    OllamaSettings ollama;
    std::vector<PoolDefinition> pools;            ///< Built from ollama when the file has none
    std::string current_pool = ConnectionManager::DEFAULT_POOL;
    HealthCheckConfig health_check;
    ExtractorConfig extraction;
    LoggingSettings logging;
};

/**
 * @brief Loads ServiceConfig from YAML and the environment
 *
 * Environment variables OLLAMA_HOST, OLLAMA_MODEL, OLLAMA_TIMEOUT (seconds)
 * and LOG_LEVEL override the file.
 */
class ConfigLoader {
public:
    using EnvironmentLookup = std::function<const char*(const char*)>;

    /**
     * @brief Load a configuration file
     * @param path YAML file
     * @param env Environment lookup, std::getenv when empty
     * @throws FileSystemError if the file cannot be read
     * @throws ValidationError on invalid values, naming the key
     */
    static ServiceConfig loadFile(const std::string& path, EnvironmentLookup env = nullptr);

    /**
     * @brief Load configuration from YAML text
     */
    static ServiceConfig loadString(const std::string& yaml, EnvironmentLookup env = nullptr);

    /**
     * @brief Built-in defaults with environment overrides applied
     */
    static ServiceConfig defaults(EnvironmentLookup env = nullptr);

    /**
     * @brief Build the default pool from single-service settings
     *
     * The primary endpoint gets priority 10; fallback i gets 5 - i
     * (at least 1) and a concurrency limit of 3.
     */
    static PoolDefinition buildDefaultPool(const OllamaSettings& ollama);

    /**
     * @brief Add a scheme to a bare host such as "localhost:11434"
     */
    static std::string normalizeUrl(const std::string& url);

private:
    static ServiceConfig fromNode(const YAML::Node& root);
    static void applyEnvironment(ServiceConfig& config, const EnvironmentLookup& env);
    static void finalize(ServiceConfig& config, const EnvironmentLookup& env);
};

} // namespace Quorum
