// =================================================================
// include/Tandem/EngineConfig.hpp
// =================================================================
// Engine settings read from .tandem/config.yml.

#pragma once

#include "Tandem/AgentExecutor.hpp"
#include "Tandem/CycleAgentManager.hpp"
#include "Tandem/ModelTierManager.hpp"
#include "Tandem/OllamaInvoker.hpp"
#include "Tandem/QualityPolicy.hpp"
#include <string>
#include <utility>
#include <vector>

namespace Tandem {

class ConfigurationStore;

/**
 * @brief Settings for every engine component
 *
 * Missing keys keep their defaults. Values that are present but cannot
 * be parsed raise ConfigurationError.
 */
struct EngineConfig {
    // Inference runtime
    std::string ollama_server_url = "http://localhost:11434";
    int ollama_timeout_seconds = 300;

    // Memory model
    double system_ram_gb = 0.0;                 // 0 = detect
    double overhead_factor = 1.2;
    double safety_factor = 0.85;
    double parallel_ram_threshold_gb = 64.0;
    size_t max_parallel_agents = 4;

    // Execution
    int agent_max_loops = 100;
    QualityPreset quality_preset = QualityPreset::BALANCED;
    std::string classifier_rules_file;          // Optional YAML keyword rules

    // Logging
    std::string log_directory = ".tandem/logs";
    std::string console_log_level = "warning";  // "off" silences the console
    std::string file_log_level = "debug";

    /**
     * @brief Load values from a configuration store
     * @param store Store holding dotted keys ("engine.safety_factor")
     */
    void loadFromConfig(const ConfigurationStore& store);

    /**
     * @brief Check value ranges
     *
     * Throws ConfigurationError naming the first invalid setting.
     */
    void validate() const;

    TierManagerConfig toTierManagerConfig() const;
    OllamaConfig toOllamaConfig() const;
    OrchestratorConfig toOrchestratorConfig() const;
    AgentExecutorConfig toAgentExecutorConfig() const;

    /**
     * @brief Key/value listing of the effective settings
     */
    std::vector<std::pair<std::string, std::string>> describe() const;

    static std::string getDefaultConfigPath() { return ".tandem/config.yml"; }
};

} // namespace Tandem
