// =================================================================
// src/Quorum/ServiceConfig.cpp
// =================================================================

#include "Quorum/ServiceConfig.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/LoadBalancer.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Quorum {

namespace {

template<typename T>
T readValue(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ValidationError("Invalid value for '" + key + "': " + e.what());
    }
}

template<typename T>
void readIfPresent(const YAML::Node& parent, const char* name, const std::string& path, T& target) {
    if (parent[name]) {
        target = readValue<T>(parent[name], path + "." + name);
    }
}

std::chrono::milliseconds readSeconds(const YAML::Node& parent, const char* name, const std::string& path,
                                      std::chrono::milliseconds fallback) {
    if (!parent[name]) {
        return fallback;
    }
    double seconds = readValue<double>(parent[name], path + "." + name);
    if (seconds <= 0.0) {
        throw ValidationError("Invalid value for '" + path + "." + name + "': must be positive");
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

size_t readCount(const YAML::Node& parent, const char* name, const std::string& path, size_t fallback) {
    if (!parent[name]) {
        return fallback;
    }
    long long value = readValue<long long>(parent[name], path + "." + name);
    if (value < 1) {
        throw ValidationError("Invalid value for '" + path + "." + name + "': must be at least 1");
    }
    return static_cast<size_t>(value);
}

LogLevel readLogLevel(const YAML::Node& parent, const char* name, const std::string& path, LogLevel fallback) {
    if (!parent[name]) {
        return fallback;
    }
    std::string text = readValue<std::string>(parent[name], path + "." + name);
    auto level = Logger::parseLevel(text);
    if (!level) {
        throw ValidationError("Invalid value for '" + path + "." + name + "': unknown log level " + text);
    }
    return *level;
}

EndpointConfig parseEndpoint(const YAML::Node& node, const std::string& path, const OllamaSettings& ollama) {
    if (!node.IsMap()) {
        throw ValidationError("Invalid value for '" + path + "': expected a mapping");
    }

    EndpointConfig config;
    config.model_name = ollama.model;
    config.timeout = ollama.timeout;

    readIfPresent(node, "id", path, config.endpoint_id);
    readIfPresent(node, "url", path, config.base_url);
    readIfPresent(node, "model", path, config.model_name);
    readIfPresent(node, "priority", path, config.priority);
    readIfPresent(node, "enabled", path, config.enabled);
    config.max_concurrent = readCount(node, "max_concurrent", path, config.max_concurrent);
    config.timeout = readSeconds(node, "timeout_seconds", path, config.timeout);

    if (config.endpoint_id.empty()) {
        throw ValidationError("Missing value for '" + path + ".id'");
    }
    if (config.base_url.empty()) {
        throw ValidationError("Missing value for '" + path + ".url'");
    }
    if (config.priority < 1 || config.priority > 10) {
        throw ValidationError("Invalid value for '" + path + ".priority': must be between 1 and 10");
    }

    config.base_url = ConfigLoader::normalizeUrl(config.base_url);
    return config;
}

PoolDefinition parsePool(const std::string& pool_id, const YAML::Node& node, const OllamaSettings& ollama) {
    const std::string path = "pools." + pool_id;
    PoolDefinition definition;
    definition.policy.pool_id = pool_id;

    if (node["strategy"]) {
        std::string name = readValue<std::string>(node["strategy"], path + ".strategy");
        auto strategy = parseLoadBalancingStrategy(name);
        if (!strategy) {
            throw ValidationError("Invalid value for '" + path + ".strategy': unknown strategy " + name);
        }
        definition.policy.strategy = *strategy;
    }

    definition.policy.max_retries = readCount(node, "max_retries", path, definition.policy.max_retries);
    definition.policy.circuit_breaker.failure_threshold =
        readCount(node, "circuit_breaker_threshold", path, definition.policy.circuit_breaker.failure_threshold);
    definition.policy.circuit_breaker.timeout_window =
        readSeconds(node, "circuit_breaker_timeout_seconds", path, definition.policy.circuit_breaker.timeout_window);
    definition.policy.failover_delay_step =
        readSeconds(node, "failover_delay_seconds", path, definition.policy.failover_delay_step);
    readIfPresent(node, "health_check_enabled", path, definition.policy.health_check_enabled);

    if (node["endpoints"]) {
        const YAML::Node endpoints = node["endpoints"];
        if (!endpoints.IsSequence()) {
            throw ValidationError("Invalid value for '" + path + ".endpoints': expected a list");
        }
        for (size_t i = 0; i < endpoints.size(); ++i) {
            definition.endpoints.push_back(
                parseEndpoint(endpoints[i], path + ".endpoints[" + std::to_string(i) + "]", ollama));
        }
    }

    return definition;
}

} // anonymous namespace

// =================================================================
// ConfigLoader
// =================================================================

ServiceConfig ConfigLoader::loadFile(const std::string& path, EnvironmentLookup env) {
    if (!std::filesystem::exists(path)) {
        throw FileSystemError("Configuration file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw FileSystemError("Cannot open configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    ServiceConfig config = loadString(buffer.str(), env);
    Logger::getInstance().info("ConfigLoader", "Loaded configuration", path);
    return config;
}

ServiceConfig ConfigLoader::loadString(const std::string& yaml, EnvironmentLookup env) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ValidationError("Invalid configuration YAML: " + std::string(e.what()));
    }

    ServiceConfig config = (root && root.IsMap()) ? fromNode(root) : ServiceConfig();
    finalize(config, env);
    return config;
}

ServiceConfig ConfigLoader::defaults(EnvironmentLookup env) {
    ServiceConfig config;
    finalize(config, env);
    return config;
}

ServiceConfig ConfigLoader::fromNode(const YAML::Node& root) {
    ServiceConfig config;

    if (const YAML::Node ollama = root["ollama"]) {
        readIfPresent(ollama, "host", "ollama", config.ollama.host);
        readIfPresent(ollama, "model", "ollama", config.ollama.model);
        config.ollama.timeout = readSeconds(ollama, "timeout_seconds", "ollama", config.ollama.timeout);
        config.ollama.max_concurrent = readCount(ollama, "max_concurrent", "ollama", config.ollama.max_concurrent);
        readIfPresent(ollama, "fallback_urls", "ollama", config.ollama.fallback_urls);
    }

    if (const YAML::Node pools = root["pools"]) {
        if (!pools.IsMap()) {
            throw ValidationError("Invalid value for 'pools': expected a mapping");
        }
        for (YAML::const_iterator it = pools.begin(); it != pools.end(); ++it) {
            std::string pool_id = readValue<std::string>(it->first, "pools");
            config.pools.push_back(parsePool(pool_id, it->second, config.ollama));
        }
    }

    if (root["current_pool"]) {
        config.current_pool = readValue<std::string>(root["current_pool"], "current_pool");
    }

    if (const YAML::Node health = root["health_check"]) {
        config.health_check.interval =
            readSeconds(health, "interval_seconds", "health_check", config.health_check.interval);
        config.health_check.probe_timeout =
            readSeconds(health, "probe_timeout_seconds", "health_check", config.health_check.probe_timeout);
        config.health_check.healthy_response_budget =
            readSeconds(health, "healthy_response_budget_seconds", "health_check",
                        config.health_check.healthy_response_budget);
    }

    if (const YAML::Node extraction = root["extraction"]) {
        config.extraction.worker_threads =
            readCount(extraction, "worker_threads", "extraction", config.extraction.worker_threads);
        config.extraction.context_window_chars =
            readCount(extraction, "context_window_chars", "extraction", config.extraction.context_window_chars);
    }

    if (const YAML::Node logging = root["logging"]) {
        readIfPresent(logging, "directory", "logging", config.logging.directory);
        readIfPresent(logging, "console", "logging", config.logging.console);
        config.logging.console_level = readLogLevel(logging, "console_level", "logging", config.logging.console_level);
        config.logging.file_level = readLogLevel(logging, "file_level", "logging", config.logging.file_level);
    }

    return config;
}

void ConfigLoader::applyEnvironment(ServiceConfig& config, const EnvironmentLookup& env) {
    if (const char* host = env("OLLAMA_HOST")) {
        if (*host != '\0') {
            config.ollama.host = host;
        }
    }

    if (const char* model = env("OLLAMA_MODEL")) {
        if (*model != '\0') {
            config.ollama.model = model;
        }
    }

    if (const char* timeout = env("OLLAMA_TIMEOUT")) {
        try {
            size_t consumed = 0;
            double seconds = std::stod(timeout, &consumed);
            if (consumed != std::string(timeout).size() || seconds <= 0.0) {
                throw std::invalid_argument(timeout);
            }
            config.ollama.timeout = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
        } catch (const std::logic_error&) {
            throw ValidationError("Invalid value for 'OLLAMA_TIMEOUT': " + std::string(timeout));
        }
    }

    if (const char* level_name = env("LOG_LEVEL")) {
        auto level = Logger::parseLevel(level_name);
        if (!level) {
            throw ValidationError("Invalid value for 'LOG_LEVEL': " + std::string(level_name));
        }
        config.logging.console_level = *level;
    }
}

void ConfigLoader::finalize(ServiceConfig& config, const EnvironmentLookup& env) {
    EnvironmentLookup lookup = env ? env : EnvironmentLookup([](const char* name) { return std::getenv(name); });
    applyEnvironment(config, lookup);

    config.ollama.host = normalizeUrl(config.ollama.host);

    if (config.pools.empty()) {
        config.pools.push_back(buildDefaultPool(config.ollama));
    }

    bool current_found = std::any_of(config.pools.begin(), config.pools.end(),
        [&config](const PoolDefinition& pool) { return pool.policy.pool_id == config.current_pool; });
    if (!current_found) {
        throw ValidationError("Invalid value for 'current_pool': no pool named " + config.current_pool);
    }
}

PoolDefinition ConfigLoader::buildDefaultPool(const OllamaSettings& ollama) {
    PoolDefinition definition;
    definition.policy.pool_id = ConnectionManager::DEFAULT_POOL;

    EndpointConfig primary;
    primary.endpoint_id = "primary";
    primary.base_url = normalizeUrl(ollama.host);
    primary.model_name = ollama.model;
    primary.priority = 10;
    primary.max_concurrent = ollama.max_concurrent;
    primary.timeout = ollama.timeout;
    definition.endpoints.push_back(primary);

    for (size_t i = 0; i < ollama.fallback_urls.size(); ++i) {
        EndpointConfig fallback;
        fallback.endpoint_id = "fallback_" + std::to_string(i);
        fallback.base_url = normalizeUrl(ollama.fallback_urls[i]);
        fallback.model_name = ollama.model;
        fallback.priority = std::max(1, 5 - static_cast<int>(i));
        fallback.max_concurrent = 3;
        fallback.timeout = ollama.timeout;
        definition.endpoints.push_back(fallback);
    }

    return definition;
}

std::string ConfigLoader::normalizeUrl(const std::string& url) {
    std::string result = url;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (result.find("://") == std::string::npos) {
        result = "http://" + result;
    }
    return result;
}

} // namespace Quorum
