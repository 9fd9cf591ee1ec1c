// =================================================================
// src/Tandem/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Tandem/CliParser.hpp"
#include "Tandem/AgentCapabilities.hpp"

namespace Tandem {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Tandem: local multi-model orchestration under a memory budget.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Configuration file (default: .tandem/config.yml)");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Print debug logs to the console");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupTiersCommand(*m_app);
    setupAnalyzeCommand(*m_app);
    setupConfigCommand(*m_app);
    setupRunCommand(*m_app);
    setupAgentCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::addRoleTierOptions(CLI::App& sub) {
    for (AgentRole role : AgentCapabilityUtils::allRoles()) {
        std::string id = AgentCapabilityUtils::roleToString(role);
        sub.add_option("--" + id, m_commands.role_tiers[id], "Tier for the " + id + " model, or 'off'")
            ->check(CLI::IsMember({"small", "medium", "large", "off"}));
    }
}

void CliParser::setupTiersCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("tiers", "Shows detected memory and the model tier comparison.");
    sub->add_option("--ram", m_commands.ram_gb, "Pretend the host has this much RAM (GB)")->check(CLI::PositiveNumber);
}

void CliParser::setupAnalyzeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("analyze", "Checks whether a model configuration fits in memory.");
    addRoleTierOptions(*sub);
    sub->add_option("--ram", m_commands.ram_gb, "Pretend the host has this much RAM (GB)")->check(CLI::PositiveNumber);
}

void CliParser::setupConfigCommand(CLI::App& app) {
    auto* config_cmd = app.add_subcommand("config", "Shows or changes the saved model configuration.");
    config_cmd->require_subcommand(1);

    auto* show_cmd = config_cmd->add_subcommand("show", "Print engine settings and the active model configuration");
    show_cmd->callback([this]() { m_commands.config_subcommand = "show"; });

    auto* save_cmd = config_cmd->add_subcommand("save", "Apply tier overrides and save the model configuration");
    addRoleTierOptions(*save_cmd);
    save_cmd->callback([this]() { m_commands.config_subcommand = "save"; });

    auto* reset_cmd = config_cmd->add_subcommand("reset", "Restore and save the recommended configuration");
    reset_cmd->callback([this]() { m_commands.config_subcommand = "reset"; });
}

void CliParser::setupRunCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("run", "Runs a task through the agent pool.");
    sub->add_option("prompt", m_commands.prompt, "The task to perform.")->required();
    sub->add_option("-a,--agents", m_commands.agents, "Comma-separated pipeline order (e.g. researcher,coder)")
        ->delimiter(',');
    sub->add_option("-p,--preset", m_commands.preset, "Quality preset: fast, balanced or thorough")
        ->check(CLI::IsMember({"fast", "balanced", "thorough"}, CLI::ignore_case));
    sub->add_option("-d,--dir", m_commands.directory, "Working directory (default: current)")
        ->check(CLI::ExistingDirectory);
}

void CliParser::setupAgentCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("agent", "Runs the autonomous agent until the task is complete.");
    sub->add_option("prompt", m_commands.prompt, "The task to perform.")->required();
    sub->add_option("-d,--dir", m_commands.directory, "Working directory (default: current)")
        ->check(CLI::ExistingDirectory);
    sub->add_option("--max-loops", m_commands.max_loops, "Iteration budget (default: from configuration)")
        ->check(CLI::PositiveNumber);
    sub->add_option("-p,--preset", m_commands.preset, "Quality preset: fast, balanced or thorough")
        ->check(CLI::IsMember({"fast", "balanced", "thorough"}, CLI::ignore_case));
}

} // namespace Tandem
