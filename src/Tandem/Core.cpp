// =================================================================
// src/Tandem/Core.cpp
// =================================================================
// Implementation for the command line application logic.

#include "Tandem/Core.hpp"
#include "Tandem/AgentExecutor.hpp"
#include "Tandem/CapabilityClassifier.hpp"
#include "Tandem/ConfigParser.hpp"
#include "Tandem/CycleAgentManager.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/EventChannel.hpp"
#include "Tandem/Logger.hpp"
#include "Tandem/OllamaInvoker.hpp"
#include "Tandem/WorkspaceScanner.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Tandem {

namespace {

void printEvent(const ProgressEvent& event) {
    std::cout << "[" << std::setw(3) << static_cast<int>(event.progress * 100) << "%] "
              << event.message << std::endl;
}

std::string formatGb(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << " GB";
    return out.str();
}

} // anonymous namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(std::make_unique<ConfigParser>(commands.config_path)) {

    m_engine_config.loadFromConfig(*m_config);
    if (m_commands.ram_gb > 0.0) {
        m_engine_config.system_ram_gb = m_commands.ram_gb;
    }
    if (m_commands.max_loops > 0) {
        m_engine_config.agent_max_loops = m_commands.max_loops;
    }
    if (!m_commands.preset.empty()) {
        m_engine_config.quality_preset = QualityPolicy::stringToPreset(m_commands.preset);
    }
    m_engine_config.validate();

    Logger& logger = Logger::getInstance();
    logger.initialize(m_engine_config.log_directory);
    logger.setConsoleLogLevel(m_commands.verbose
        ? LogLevel::DEBUG
        : Logger::parseLevel(m_engine_config.console_log_level, LogLevel::WARNING));
    logger.setConsoleLogging(m_commands.verbose || m_engine_config.console_log_level != "off");
    logger.setFileLogLevel(Logger::parseLevel(m_engine_config.file_log_level, LogLevel::DEBUG));

    m_tier_manager = std::make_unique<ModelTierManager>(m_engine_config.toTierManagerConfig());
    if (m_tier_manager->loadConfiguration(*m_config)) {
        logger.info("Core", "Loaded saved model configuration", m_config->getPath());
    }
}

Core::~Core() = default;

int Core::run() {
    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command, m_commands.prompt);

    int exit_code = 1;
    if (m_commands.active_command == "tiers") {
        exit_code = handleTiers();
    } else if (m_commands.active_command == "analyze") {
        exit_code = handleAnalyze();
    } else if (m_commands.active_command == "config") {
        exit_code = handleConfig();
    } else if (m_commands.active_command == "run") {
        exit_code = handleRun();
    } else if (m_commands.active_command == "agent") {
        exit_code = handleAgent();
    } else {
        std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, duration.count());
    Logger::getInstance().flush();
    return exit_code;
}

int Core::handleTiers() {
    std::cout << "System RAM: " << formatGb(m_tier_manager->getSystemRAM());
    if (m_tier_manager->usedFallbackRAM()) {
        std::cout << " (detection failed, assumed)";
    }
    std::cout << "\nUsable for models: " << formatGb(m_tier_manager->getUsableRAM()) << "\n";
    std::cout << "Recommended tier: " << ModelCatalog::tierToString(m_tier_manager->getRecommendedTier()) << "\n\n";

    std::cout << std::left << std::setw(8) << "Tier" << std::setw(10) << "Min RAM" << std::setw(10) << "Disk"
              << std::setw(9) << "Quality" << std::setw(7) << "Speed" << "\n";
    for (const auto& row : m_tier_manager->getTierComparisons()) {
        std::cout << std::left << std::setw(8) << ModelCatalog::tierToString(row.tier)
                  << std::setw(10) << formatGb(row.minimum_ram_gb)
                  << std::setw(10) << formatGb(row.total_disk_gb)
                  << std::setw(9) << row.quality
                  << std::setw(7) << row.speed;
        if (row.recommended) {
            std::cout << " <- recommended";
        } else if (!row.available) {
            std::cout << " (needs more RAM)";
        }
        std::cout << "\n";
    }

    std::cout << "\nModel options per role:\n";
    for (AgentRole role : AgentCapabilityUtils::allRoles()) {
        std::cout << "  " << AgentCapabilityUtils::profile(role).display_name << ":\n";
        for (const auto& option : m_tier_manager->getModelOptions(role)) {
            std::cout << "    " << std::left << std::setw(8) << ModelCatalog::tierToString(option.first)
                      << std::setw(24) << option.second.tag
                      << formatGb(option.second.disk_size_gb) << " disk, "
                      << formatGb(option.second.estimated_ram_gb) << " RAM\n";
        }
    }
    return 0;
}

int Core::handleAnalyze() {
    CustomConfiguration config = applyRoleOverrides(m_tier_manager->getActiveConfiguration());
    ConfigurationAnalysis analysis = m_tier_manager->analyzeConfiguration(config);

    printConfiguration(config);
    printAnalysis(analysis);
    return analysis.can_fit ? 0 : 2;
}

int Core::handleConfig() {
    if (m_commands.config_subcommand == "show") {
        std::cout << "Configuration file: " << m_config->getPath()
                  << (m_config->isLoaded() ? "" : " (not found, using defaults)") << "\n\n";
        for (const auto& entry : m_engine_config.describe()) {
            std::cout << "  " << std::left << std::setw(34) << entry.first << entry.second << "\n";
        }
        std::cout << "\n";
        printConfiguration(m_tier_manager->getActiveConfiguration());
        printAnalysis(m_tier_manager->getActiveAnalysis());

        MemorySettings memory = m_tier_manager->getMemorySettings();
        std::cout << "\nRuntime settings: context " << memory.context_window << " tokens, max output "
                  << memory.max_tokens << " tokens, keep_alive " << memory.keep_alive
                  << ", threads " << memory.num_thread << "\n";

        OllamaInvoker invoker(*m_tier_manager, m_engine_config.toOllamaConfig());
        try {
            if (checkInstalledModels(invoker)) {
                std::cout << "All enabled models are installed on " << invoker.getServerUrl() << "\n";
            }
        } catch (const ModelInvocationError& e) {
            std::cout << "Installed models unknown: " << e.what() << "\n";
        }
        return 0;
    }

    if (m_commands.config_subcommand == "save" || m_commands.config_subcommand == "reset") {
        CustomConfiguration config = m_commands.config_subcommand == "reset"
            ? m_tier_manager->createDefaultConfiguration()
            : applyRoleOverrides(m_tier_manager->getActiveConfiguration());

        try {
            m_tier_manager->updateConfiguration(config);
        } catch (const ConfigurationError& e) {
            std::cerr << "Configuration rejected: " << e.what() << std::endl;
            printAnalysis(m_tier_manager->analyzeConfiguration(config));
            return 1;
        }

        if (!m_tier_manager->saveConfiguration(*m_config)) {
            std::cerr << "Failed to write " << m_config->getPath() << std::endl;
            return 1;
        }
        std::cout << "Saved model configuration to " << m_config->getPath() << "\n";
        printConfiguration(config);
        return 0;
    }

    std::cerr << "Unknown config subcommand: " << m_commands.config_subcommand << std::endl;
    return 1;
}

int Core::handleRun() {
    OllamaInvoker invoker(*m_tier_manager, m_engine_config.toOllamaConfig());
    if (!invoker.performHealthCheck()) {
        std::cerr << "Ollama is not reachable at " << invoker.getServerUrl() << std::endl;
        return 1;
    }
    if (!checkInstalledModels(invoker)) {
        return 1;
    }

    KeywordCapabilityClassifier classifier;
    if (!m_engine_config.classifier_rules_file.empty() &&
        !classifier.loadRulesFromFile(m_engine_config.classifier_rules_file)) {
        std::cerr << "Warning: could not load classifier rules from "
                  << m_engine_config.classifier_rules_file << ", using built-in rules" << std::endl;
    }

    EventChannel events;
    auto subscription = events.subscribe();
    CycleAgentManager manager(*m_tier_manager, invoker, classifier, events,
                              m_engine_config.toOrchestratorConfig());

    TaskContext context;
    WorkspaceScanner scanner(m_commands.directory);
    size_t loaded = scanner.populate(context);
    TANDEM_LOG_DEBUG("Core", "Workspace context has " + std::to_string(context.files.size()) + " file(s)");
    std::cout << "Loaded " << loaded << " file(s) from " << scanner.getRootPath() << "\n";
    std::cout << "Preset: " << QualityPolicy::presetToString(m_engine_config.quality_preset) << "\n";

    std::future<OrchestrationResult> pending;
    try {
        pending = manager.planAndExecuteAsync(m_commands.prompt, context, m_commands.agents);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    ProgressEvent event;
    while (pending.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        if (subscription->waitFor(event, std::chrono::milliseconds(200))) {
            printEvent(event);
        }
    }
    for (const auto& remaining : subscription->drain()) {
        printEvent(remaining);
    }

    OrchestrationResult result;
    try {
        result = pending.get();
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        TANDEM_LOG_ERROR("Core", std::string("Run aborted: ") + e.what());
        std::cerr << "Run aborted: " << e.what() << std::endl;
        return 1;
    }

    if (!result.plan.empty()) {
        std::cout << "\n--- Plan ---\n" << result.plan << "\n";
    }
    for (const auto& step : result.results) {
        std::cout << "\n--- " << step.agent_id << " (" << std::fixed << std::setprecision(1)
                  << step.execution_time << "s, " << step.attempts << " attempt(s)"
                  << (step.verified ? ", verified" : "") << ") ---\n" << step.output << "\n";
    }

    OrchestrationStatistics stats = manager.getStatistics();
    std::cout << "\nStrategy: " << CycleAgentManager::strategyToString(result.strategy)
              << " | model switches: " << stats.model_switch_count
              << " | avg switch: " << std::fixed << std::setprecision(2) << stats.average_switch_time << "s"
              << " | warm: " << (stats.warm_agent.empty() ? "none" : stats.warm_agent)
              << " | planning/review loads: " << stats.auxiliary_loads << "\n";

    if (!result.success) {
        std::cerr << (result.cancelled ? "Run cancelled"
                                       : "Run failed at " + result.failed_agent + ": " + result.error_message)
                  << std::endl;
        return 1;
    }
    return 0;
}

int Core::handleAgent() {
    OllamaInvoker invoker(*m_tier_manager, m_engine_config.toOllamaConfig());
    if (!invoker.performHealthCheck()) {
        std::cerr << "Ollama is not reachable at " << invoker.getServerUrl() << std::endl;
        return 1;
    }
    if (!m_tier_manager->isRoleEnabled(AgentRole::ORCHESTRATOR)) {
        std::cerr << "The autonomous agent needs the orchestrator model to be enabled" << std::endl;
        return 1;
    }
    if (!checkInstalledModels(invoker)) {
        return 1;
    }

    EventChannel events;
    auto subscription = events.subscribe();
    AgentExecutor agent(invoker, events, m_engine_config.toAgentExecutorConfig());

    if (!agent.start(m_commands.prompt, m_commands.directory)) {
        std::cerr << "Agent is already running" << std::endl;
        return 1;
    }

    size_t printed = 0;
    while (true) {
        ProgressEvent event;
        subscription->waitFor(event, std::chrono::milliseconds(200));
        subscription->drain();

        std::vector<AgentStep> steps = agent.getSteps();
        for (; printed < steps.size(); ++printed) {
            const AgentStep& step = steps[printed];
            std::cout << "[" << AgentExecutor::stepTypeToString(step.type) << "] ";
            if (step.type == AgentStepType::TOOL) {
                std::cout << step.tool_name << " " << step.tool_input << "\n" << step.tool_output;
            } else {
                std::cout << step.content;
            }
            std::cout << std::endl;
        }

        if (!agent.isRunning()) {
            break;
        }
        if (agent.isWaitingForUser()) {
            std::cout << agent.getUserPrompt() << "\n> " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer)) {
                agent.stop();
                continue;
            }
            agent.provideUserInput(answer);
        }
    }

    agent.waitForCompletion(std::chrono::milliseconds(1000));
    std::cout << "\nAgent finished: " << AgentExecutor::stateToString(agent.getState())
              << " after " << agent.getLoopCount() << " iteration(s)" << std::endl;
    return agent.getState() == AgentExecutorState::COMPLETE ? 0 : 1;
}

bool Core::checkInstalledModels(OllamaInvoker& invoker) const {
    std::vector<std::string> missing = m_tier_manager->findMissingModels(invoker.listInstalledModels());
    if (missing.empty()) {
        return true;
    }

    Logger::getInstance().warning("Core", "Models not installed", std::to_string(missing.size()) + " missing");
    std::cerr << "These models are not installed on " << invoker.getServerUrl() << ":\n";
    for (const auto& tag : missing) {
        std::cerr << "  ollama pull " << tag << "\n";
    }
    std::cerr << std::flush;
    return false;
}

CustomConfiguration Core::applyRoleOverrides(CustomConfiguration config) const {
    for (const auto& entry : m_commands.role_tiers) {
        if (entry.second.empty()) {
            continue;
        }
        AgentRole role = AgentCapabilityUtils::stringToRole(entry.first);

        auto it = std::find_if(config.begin(), config.end(),
                               [role](const ModelSelection& selection) { return selection.role == role; });
        if (it == config.end()) {
            config.push_back({role, ModelTier::SMALL, false});
            it = config.end() - 1;
        }

        if (entry.second == "off") {
            it->enabled = false;
        } else {
            it->tier = ModelCatalog::stringToTier(entry.second);
            it->enabled = true;
        }
    }
    return config;
}

void Core::printConfiguration(const CustomConfiguration& config) const {
    std::cout << "Model configuration:\n";
    for (const auto& selection : config) {
        std::cout << "  " << std::left << std::setw(14) << AgentCapabilityUtils::roleToString(selection.role);
        if (!selection.enabled) {
            std::cout << "off\n";
            continue;
        }
        const ModelVariant& variant = ModelCatalog::getVariant(selection.role, selection.tier);
        std::cout << std::setw(8) << ModelCatalog::tierToString(selection.tier) << variant.tag << "\n";
    }
}

void Core::printAnalysis(const ConfigurationAnalysis& analysis) const {
    std::cout << "\nEstimated RAM: " << formatGb(analysis.estimated_ram_gb)
              << " of " << formatGb(m_tier_manager->getUsableRAM()) << " usable"
              << (analysis.can_fit ? " (fits)" : " (does NOT fit)") << "\n";
    std::cout << "Disk: " << formatGb(analysis.total_disk_gb) << "\n";
    std::cout << "Quality: " << std::fixed << std::setprecision(1) << analysis.quality_rating
              << "/10, speed: " << analysis.speed_rating << "/10\n";
    for (const auto& description : analysis.model_descriptions) {
        std::cout << "  - " << description << "\n";
    }
    std::cout << analysis.recommendation << std::endl;
}

} // namespace Tandem
