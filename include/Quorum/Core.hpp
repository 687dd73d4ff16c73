// =================================================================
// include/Quorum/Core.hpp
// =================================================================
// Runs one quorum subcommand against a MinutesService.

#pragma once

#include "Quorum/CliParser.hpp"
#include <memory>
#include <string>

namespace Quorum {

class MinutesService;
struct ServiceConfig;

class Core {
public:
    /**
     * @param commands Parsed command line; must outlive the Core
     */
    explicit Core(const Commands& commands);

    ~Core();

    /**
     * @brief Load configuration, build the service and dispatch the subcommand
     * @return 0 on completed extraction or success, 2 when validation failed, 1 otherwise.
     */
    int run();

private:
    int handleExtract();
    int handleStats();
    int handleHealth();

    void initializeService();

    const Commands& m_commands;
    std::unique_ptr<ServiceConfig> m_config;
    std::unique_ptr<MinutesService> m_service;
};

} // namespace Quorum
