// =================================================================
// include/Tandem/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Tandem {

// Parsed command line.
struct Commands {
    std::string active_command;     // Name of the subcommand triggered
    std::string config_path = ".tandem/config.yml";
    bool verbose = false;

    // Per-role tier overrides for 'analyze' and 'config save': role id -> small|medium|large|off
    std::map<std::string, std::string> role_tiers;
    double ram_gb = 0.0;            // Host RAM override, 0 = use configuration

    // Options for 'config'
    std::string config_subcommand;  // show, save, reset

    // Options for 'run' and 'agent'
    std::string prompt;
    std::vector<std::string> agents;
    std::string preset;
    std::string directory = ".";
    int max_loops = 0;              // 0 = use configuration
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    const Commands& getCommands() const;

private:
    void setupTiersCommand(CLI::App& app);
    void setupAnalyzeCommand(CLI::App& app);
    void setupConfigCommand(CLI::App& app);
    void setupRunCommand(CLI::App& app);
    void setupAgentCommand(CLI::App& app);

    void addRoleTierOptions(CLI::App& sub);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Tandem
