// =================================================================
// src/Quorum/Core.cpp
// =================================================================
// Implementation of the core application logic.

#include "Quorum/Core.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/LoadBalancer.hpp"
#include "Quorum/Logger.hpp"
#include "Quorum/MinutesService.hpp"
#include "Quorum/ServiceConfig.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Quorum {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FileSystemError("Cannot open transcript: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw FileSystemError("Cannot write output file: " + path);
    }
    file << content << std::endl;
}

int exitCodeFor(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatus::COMPLETED: return 0;
        case ExtractionStatus::VALIDATION_FAILED: return 2;
        case ExtractionStatus::FAILED: return 1;
    }
    return 1;
}

} // anonymous namespace

Core::Core(const Commands& commands) : m_commands(commands) {}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command.empty()) {
        return 0;
    }

    auto started = std::chrono::steady_clock::now();
    initializeService();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.input_file);

    int exit_code = 1;
    if (m_commands.active_command == "extract") {
        exit_code = handleExtract();
    } else if (m_commands.active_command == "stats") {
        exit_code = handleStats();
    } else if (m_commands.active_command == "health") {
        exit_code = handleHealth();
    } else {
        std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    }

    m_service->shutdown();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(elapsed.count()));
    return exit_code;
}

void Core::initializeService() {
    m_config = std::make_unique<ServiceConfig>(
        m_commands.config_path.empty() ? ConfigLoader::defaults() : ConfigLoader::loadFile(m_commands.config_path));

    if (!m_commands.log_level.empty()) {
        auto level = Logger::parseLevel(m_commands.log_level);
        if (level) {
            m_config->logging.console_level = *level;
        }
    }

    Logger& logger = Logger::getInstance();
    logger.initialize(m_config->logging.directory);
    logger.setConsoleLogging(m_config->logging.console);
    logger.setConsoleLogLevel(m_config->logging.console_level);
    logger.setFileLogLevel(m_config->logging.file_level);

    m_service = std::make_unique<MinutesService>(*m_config);
}

// =================================================================
// Command handlers
// =================================================================

int Core::handleExtract() {
    std::string transcript = readFile(m_commands.input_file);

    if (!m_commands.strategy.empty()) {
        auto strategy = parseLoadBalancingStrategy(m_commands.strategy);
        if (!strategy) {
            throw UserError("Unknown load balancing strategy: " + m_commands.strategy);
        }
        m_service->setLoadBalancingStrategy(*strategy, m_commands.pool_id);
    }

    PreprocessingOptions preprocessing;
    preprocessing.remove_fillers = !m_commands.keep_fillers;
    preprocessing.remove_speaker_labels = m_commands.remove_speaker_labels;
    preprocessing.segment_by = parseSegmentationMode(m_commands.segment_by);

    ExtractionOptions options;
    options.pool_id = m_commands.pool_id;
    options.model = m_commands.model;

    m_service->start();
    ExtractionResult result = m_service->extractMeetingMinutes(transcript, preprocessing, options);

    nlohmann::json output = m_commands.summary_only ? result.getSummary() : result.toJson();
    if (m_commands.output_file.empty()) {
        std::cout << output.dump(2) << std::endl;
    } else {
        writeFile(m_commands.output_file, output.dump(2));
        std::cerr << "Result written to " << m_commands.output_file
                  << " (status: " << extractionStatusToString(result.status)
                  << ", confidence: " << std::fixed << std::setprecision(2) << result.confidence_score << ")"
                  << std::endl;
    }

    return exitCodeFor(result.status);
}

int Core::handleStats() {
    m_service->checkHealth();
    std::cout << m_service->getConnectionStats().toJson().dump(2) << std::endl;
    return 0;
}

int Core::handleHealth() {
    size_t healthy = m_service->checkHealth();
    ConnectionStats stats = m_service->getConnectionStats();

    for (const auto& [pool_id, pool] : stats.pools) {
        std::cout << "Pool " << pool_id << " (" << loadBalancingStrategyToString(pool.strategy) << ")"
                  << (pool_id == stats.current_pool ? " [current]" : "") << std::endl;

        for (const auto& endpoint : pool.endpoints) {
            std::cout << "  " << std::left << std::setw(16) << endpoint.config.endpoint_id
                      << std::setw(10) << endpointStatusToString(endpoint.status)
                      << std::setw(11) << circuitStateToString(endpoint.circuit_state)
                      << endpoint.config.base_url
                      << (endpoint.config.enabled ? "" : " (disabled)") << std::endl;
        }
    }

    std::cout << healthy << " healthy endpoint(s)" << std::endl;
    return healthy > 0 ? 0 : 1;
}

} // namespace Quorum
