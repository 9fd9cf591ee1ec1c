// =================================================================
// include/Tandem/Core.hpp
// =================================================================
// Defines the command line application object.

#pragma once

#include "Tandem/CliParser.hpp"
#include "Tandem/EngineConfig.hpp"
#include "Tandem/ModelTierManager.hpp"
#include <memory>
#include <string>

namespace Tandem {

class ConfigParser;
class OllamaInvoker;

class Core {
public:
    /**
     * @brief Load configuration and set up logging for a command
     * @param commands The parsed command-line arguments.
     *
     * Throws ConfigurationError when the configuration file is invalid.
     */
    explicit Core(const Commands& commands);

    ~Core();

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    int handleTiers();
    int handleAnalyze();
    int handleConfig();
    int handleRun();
    int handleAgent();

    /**
     * @brief Apply --<role> tier overrides to a configuration
     */
    CustomConfiguration applyRoleOverrides(CustomConfiguration config) const;

    /**
     * @brief Check that every enabled model is installed on the server
     * @return False, after naming the models to pull, when some are missing
     *
     * Throws ModelInvocationError when the server cannot be queried.
     */
    bool checkInstalledModels(OllamaInvoker& invoker) const;

    void printAnalysis(const ConfigurationAnalysis& analysis) const;
    void printConfiguration(const CustomConfiguration& config) const;

    const Commands& m_commands;
    std::unique_ptr<ConfigParser> m_config;
    EngineConfig m_engine_config;
    std::unique_ptr<ModelTierManager> m_tier_manager;
};

} // namespace Tandem
