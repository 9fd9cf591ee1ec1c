// =================================================================
// src/Tandem/EngineConfig.cpp
// =================================================================
// Implementation for engine configuration loading.

#include "Tandem/EngineConfig.hpp"
#include "Tandem/ConfigurationStore.hpp"
#include "Tandem/Errors.hpp"
#include <sstream>
#include <stdexcept>

namespace Tandem {

namespace {

double readDouble(const ConfigurationStore& store, const std::string& key, double current) {
    std::string value = store.getStringValue(key);
    if (value.empty()) {
        return current;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid number for " + key + ": " + value);
    }
}

long readInteger(const ConfigurationStore& store, const std::string& key, long current) {
    std::string value = store.getStringValue(key);
    if (value.empty()) {
        return current;
    }
    try {
        size_t consumed = 0;
        long parsed = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid integer for " + key + ": " + value);
    }
}

std::string readString(const ConfigurationStore& store, const std::string& key, const std::string& current) {
    std::string value = store.getStringValue(key);
    return value.empty() ? current : value;
}

std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // anonymous namespace

void EngineConfig::loadFromConfig(const ConfigurationStore& store) {
    ollama_server_url = readString(store, "ollama.server_url", ollama_server_url);
    ollama_timeout_seconds = static_cast<int>(readInteger(store, "ollama.timeout_seconds", ollama_timeout_seconds));

    system_ram_gb = readDouble(store, "engine.system_ram_gb", system_ram_gb);
    overhead_factor = readDouble(store, "engine.overhead_factor", overhead_factor);
    safety_factor = readDouble(store, "engine.safety_factor", safety_factor);
    parallel_ram_threshold_gb = readDouble(store, "engine.parallel_ram_threshold_gb", parallel_ram_threshold_gb);

    long parallel_agents = readInteger(store, "engine.max_parallel_agents", static_cast<long>(max_parallel_agents));
    if (parallel_agents < 1) {
        throw ConfigurationError("engine.max_parallel_agents must be at least 1");
    }
    max_parallel_agents = static_cast<size_t>(parallel_agents);

    agent_max_loops = static_cast<int>(readInteger(store, "agent.max_loops", agent_max_loops));

    std::string preset = store.getStringValue("quality.preset");
    if (!preset.empty()) {
        try {
            quality_preset = QualityPolicy::stringToPreset(preset);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(std::string("Invalid quality.preset: ") + e.what());
        }
    }
    classifier_rules_file = readString(store, "classifier.rules_file", classifier_rules_file);

    log_directory = readString(store, "logging.directory", log_directory);
    console_log_level = readString(store, "logging.console_level", console_log_level);
    file_log_level = readString(store, "logging.file_level", file_log_level);
}

void EngineConfig::validate() const {
    if (ollama_server_url.empty()) {
        throw ConfigurationError("ollama.server_url must not be empty");
    }
    if (ollama_timeout_seconds <= 0) {
        throw ConfigurationError("ollama.timeout_seconds must be positive");
    }
    if (system_ram_gb < 0.0) {
        throw ConfigurationError("engine.system_ram_gb must not be negative");
    }
    if (overhead_factor < 1.0) {
        throw ConfigurationError("engine.overhead_factor must be at least 1.0");
    }
    if (safety_factor <= 0.0 || safety_factor > 1.0) {
        throw ConfigurationError("engine.safety_factor must be in (0, 1]");
    }
    if (parallel_ram_threshold_gb <= 0.0) {
        throw ConfigurationError("engine.parallel_ram_threshold_gb must be positive");
    }
    if (agent_max_loops <= 0) {
        throw ConfigurationError("agent.max_loops must be positive");
    }
}

TierManagerConfig EngineConfig::toTierManagerConfig() const {
    TierManagerConfig config;
    config.system_ram_gb = system_ram_gb;
    config.overhead_factor = overhead_factor;
    config.safety_factor = safety_factor;
    return config;
}

OllamaConfig EngineConfig::toOllamaConfig() const {
    OllamaConfig config;
    config.server_url = ollama_server_url;
    config.read_timeout_seconds = ollama_timeout_seconds;
    return config;
}

OrchestratorConfig EngineConfig::toOrchestratorConfig() const {
    OrchestratorConfig config;
    config.parallel_ram_threshold_gb = parallel_ram_threshold_gb;
    config.max_parallel_agents = max_parallel_agents;
    config.preset = quality_preset;
    return config;
}

AgentExecutorConfig EngineConfig::toAgentExecutorConfig() const {
    AgentExecutorConfig config;
    config.max_loops = agent_max_loops;
    config.preset = quality_preset;
    return config;
}

std::vector<std::pair<std::string, std::string>> EngineConfig::describe() const {
    return {
        {"ollama.server_url", ollama_server_url},
        {"ollama.timeout_seconds", std::to_string(ollama_timeout_seconds)},
        {"engine.system_ram_gb", system_ram_gb > 0.0 ? formatNumber(system_ram_gb) : "auto"},
        {"engine.overhead_factor", formatNumber(overhead_factor)},
        {"engine.safety_factor", formatNumber(safety_factor)},
        {"engine.parallel_ram_threshold_gb", formatNumber(parallel_ram_threshold_gb)},
        {"engine.max_parallel_agents", std::to_string(max_parallel_agents)},
        {"agent.max_loops", std::to_string(agent_max_loops)},
        {"quality.preset", QualityPolicy::presetToString(quality_preset)},
        {"classifier.rules_file", classifier_rules_file.empty() ? "(built-in)" : classifier_rules_file},
        {"logging.directory", log_directory},
        {"logging.console_level", console_log_level},
        {"logging.file_level", file_log_level},
    };
}

} // namespace Tandem
