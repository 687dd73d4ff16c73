// =================================================================
// src/Quorum/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Quorum/CliParser.hpp"

namespace Quorum {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Quorum: resilient meeting-minutes extraction over a pool of LLM endpoints.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file.")
        ->check(CLI::ExistingFile);
    m_app->add_option("--log-level", m_commands.log_level, "Console log level (debug, info, warning, error, critical).")
        ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}));

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupExtractCommand(*m_app);
    setupStatsCommand(*m_app);
    setupHealthCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupExtractCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("extract", "Extracts structured meeting minutes from a transcript file.");
    sub->add_option("file", m_commands.input_file, "The transcript to process.")->required()->check(CLI::ExistingFile);
    sub->add_option("-o,--output", m_commands.output_file, "Write the result JSON to this file instead of stdout.");
    sub->add_option("--pool", m_commands.pool_id, "Endpoint pool to use (default: the configured current pool).");
    sub->add_option("--model", m_commands.model, "Model to request instead of each endpoint's own model.");
    sub->add_option("--strategy", m_commands.strategy, "Load balancing strategy for the pool.")
        ->check(CLI::IsMember({"round_robin", "random", "least_connections", "response_time", "health_based"}));
    sub->add_option("--segment-by", m_commands.segment_by, "Transcript segmentation (default: paragraph).")
        ->check(CLI::IsMember({"paragraph", "sentence", "topic"}));
    sub->add_flag("--keep-fillers", m_commands.keep_fillers, "Keep filler words such as 'um' and 'you know'.");
    sub->add_flag("--strip-speakers", m_commands.remove_speaker_labels, "Remove 'Name:' speaker labels.");
    sub->add_flag("--summary", m_commands.summary_only, "Print only the extraction summary.");
}

void CliParser::setupStatsCommand(CLI::App& app) {
    app.add_subcommand("stats", "Runs one health pass and prints connection statistics as JSON.");
}

void CliParser::setupHealthCommand(CLI::App& app) {
    app.add_subcommand("health", "Probes every endpoint and prints its status.");
}

} // namespace Quorum
