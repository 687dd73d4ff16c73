// =================================================================
// include/Quorum/CliParser.hpp
// =================================================================
// Command-line definition of the quorum tool; the only file that knows CLI11.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Quorum {

/**
 * @brief Subcommand and option values after parsing
 */
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path;     // YAML configuration, built-in defaults when empty
    std::string log_level;       // Console log level override

    // Options for 'extract'
    std::string input_file;
    std::string output_file;     // Print to stdout when empty
    std::string pool_id;
    std::string model;
    std::string strategy;        // Load balancing override for the selected pool
    std::string segment_by = "paragraph";
    bool keep_fillers = false;
    bool remove_speaker_labels = false;
    bool summary_only = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Build the app with the extract, stats and health subcommands
     * @return App whose callbacks fill getCommands() during parse
     */
    std::shared_ptr<CLI::App> setupCli();

    /// Values captured by the last parse
    const Commands& getCommands() const;

private:
    void setupExtractCommand(CLI::App& app);
    void setupStatsCommand(CLI::App& app);
    void setupHealthCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Quorum
