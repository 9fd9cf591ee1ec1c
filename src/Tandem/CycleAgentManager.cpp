// =================================================================
// src/Tandem/CycleAgentManager.cpp
// =================================================================
// Implementation of multi-agent orchestration.

#include "Tandem/CycleAgentManager.hpp"
#include "Tandem/ActionParser.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/Logger.hpp"
#include "Tandem/TextUtils.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace Tandem {

namespace {

/**
 * @brief Clears the running flag when a run leaves planAndExecute
 */
class RunGuard {
public:
    explicit RunGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~RunGuard() { m_flag.store(false); }

    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

private:
    std::atomic<bool>& m_flag;
};

double secondsSince(const std::chrono::steady_clock::time_point& start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string formatSeconds(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << seconds << "s";
    return out.str();
}

bool isApproved(const std::string& review) {
    std::string upper = TextUtils::toUpper(review);
    return upper.find("APPROVED") != std::string::npos &&
           upper.find("NOT APPROVED") == std::string::npos;
}

std::string trimLine(const std::string& line) {
    size_t start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = line.find_last_not_of(" \t\r");
    return line.substr(start, end - start + 1);
}

} // anonymous namespace

CycleAgentManager::CycleAgentManager(const ModelTierManager& tier_manager,
                                     ModelInvoker& invoker,
                                     CapabilityClassifier& classifier,
                                     EventChannel& events,
                                     const OrchestratorConfig& config)
    : m_tier_manager(tier_manager),
      m_invoker(invoker),
      m_classifier(classifier),
      m_events(events),
      m_config(config) {

    if (m_config.max_parallel_agents == 0) {
        throw ConfigurationError("max_parallel_agents must be at least 1");
    }

    buildAgentPool();

    m_can_run_parallel = m_tier_manager.getSystemRAM() >= m_config.parallel_ram_threshold_gb;
    m_cache.setCapacity(m_can_run_parallel ? m_config.max_parallel_agents : 1);

    Logger::getInstance().info("CycleAgentManager",
        "Agent pool ready: " + std::to_string(m_agents.size()) + " agents",
        std::string("parallel=") + (m_can_run_parallel ? "yes" : "no") +
        ", preset=" + QualityPolicy::presetToString(m_config.preset));
}

void CycleAgentManager::buildAgentPool() {
    for (const auto& selection : m_tier_manager.getActiveConfiguration()) {
        if (!selection.enabled) {
            continue;
        }
        const RoleProfile& profile = AgentCapabilityUtils::profile(selection.role);

        AgentDefinition agent;
        agent.id = profile.id;
        agent.role = selection.role;
        agent.model = ModelCatalog::getVariant(selection.role, selection.tier);
        agent.capabilities = profile.capabilities;
        agent.priority = profile.priority;
        m_agents.push_back(agent);
    }

    if (m_agents.empty()) {
        throw ConfigurationError("No agents enabled in the active configuration");
    }
}

OrchestrationResult CycleAgentManager::planAndExecute(const std::string& task,
                                                      TaskContext& context,
                                                      const std::vector<std::string>& selected_agents) {
    OrchestrationResult result;
    result.strategy = selected_agents.empty() ? ExecutionStrategy::AUTO : ExecutionStrategy::PIPELINE;

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        result.error_kind = OrchestrationErrorKind::BUSY;
        result.error_message = "Another orchestration run is in progress";
        Logger::getInstance().warning("CycleAgentManager", "Rejected concurrent run", task);
        return result;
    }
    RunGuard guard(m_running);

    // Resolve and validate before touching any state
    std::vector<const AgentDefinition*> agents;
    if (result.strategy == ExecutionStrategy::PIPELINE) {
        agents = resolveAgents(selected_agents);
    } else {
        CapabilityClassification classification = m_classifier.classify(task, context.filePaths());
        const AgentDefinition& best = selectBestAgent(classification.capabilities);
        Logger::getInstance().info("CycleAgentManager", "Selected agent " + best.id,
            "capabilities=" + std::to_string(classification.capabilities.size()) +
            ", confidence=" + std::to_string(classification.confidence));
        agents.push_back(&best);
    }
    for (const auto* agent : agents) {
        checkAgentFits(*agent);
    }

    m_cancel_requested.store(false);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_results.clear();
        m_progress = 0.0;
        m_status_message = "Starting";
    }

    auto run_start = std::chrono::steady_clock::now();
    publish(ProgressEventType::RUN_STARTED, "",
            strategyToString(result.strategy) + " run with " + std::to_string(agents.size()) + " agent(s)");

    for (const auto* agent : agents) {
        result.agents.push_back(agent->id);
    }

    try {
        if (result.strategy == ExecutionStrategy::PIPELINE) {
            runPipeline(task, context, agents, result);
        } else {
            runAuto(task, context, *agents.front(), result);
        }
    } catch (const ModelInvocationError& e) {
        result.success = false;
        result.error_kind = OrchestrationErrorKind::INVOCATION_FAILED;
        result.error_message = ModelInvocationError::kindToString(e.kind()) + ": " + e.what();
        result.results = getResults();
        setState(OrchestrationState::FAILED, "Failed: " + result.error_message);
        publish(ProgressEventType::RUN_FAILED, result.failed_agent, result.error_message);
        Logger::getInstance().error("CycleAgentManager", "Run failed at " + result.failed_agent, result.error_message);
        return result;
    } catch (const std::exception& e) {
        setState(OrchestrationState::FAILED, std::string("Failed: ") + e.what());
        publish(ProgressEventType::RUN_FAILED, result.failed_agent, e.what());
        Logger::getInstance().error("CycleAgentManager", "Run aborted at " + result.failed_agent, e.what());
        throw;
    }

    result.results = getResults();
    if (result.cancelled) {
        setState(OrchestrationState::CANCELLED, "Cancelled after " + std::to_string(result.results.size()) + " step(s)");
        publish(ProgressEventType::RUN_CANCELLED, "", "Run cancelled");
        Logger::getInstance().info("CycleAgentManager", "Run cancelled",
                                   std::to_string(result.results.size()) + " step(s) completed");
        return result;
    }

    result.success = true;
    if (!result.results.empty()) {
        result.output = result.results.back().output;
    }
    updateProgress(1.0, "Completed in " + formatSeconds(secondsSince(run_start)));
    setState(OrchestrationState::COMPLETED, getStatusMessage());
    publish(ProgressEventType::RUN_COMPLETED, "", getStatusMessage());
    return result;
}

std::future<OrchestrationResult> CycleAgentManager::planAndExecuteAsync(const std::string& task,
                                                                        TaskContext context,
                                                                        const std::vector<std::string>& selected_agents) {
    return std::async(std::launch::async, [this, task, context, selected_agents]() mutable {
        return planAndExecute(task, context, selected_agents);
    });
}

std::string CycleAgentManager::execute(const std::string& task,
                                       TaskContext& context,
                                       const std::vector<std::string>& selected_agents) {
    OrchestrationResult result = planAndExecute(task, context, selected_agents);
    if (result.cancelled) {
        throw TaskExecutionError("", "Run cancelled");
    }
    if (!result.success) {
        throw TaskExecutionError(result.failed_agent, result.error_message);
    }
    return result.output;
}

void CycleAgentManager::cancel() {
    m_cancel_requested.store(true);
    TANDEM_LOG_INFO("CycleAgentManager", "Cancellation requested");
}

void CycleAgentManager::runPipeline(const std::string& task, TaskContext& context,
                                    const std::vector<const AgentDefinition*>& agents,
                                    OrchestrationResult& result) {
    setState(OrchestrationState::EXECUTING, "Executing pipeline");

    std::string prior_output;
    for (size_t i = 0; i < agents.size(); ++i) {
        if (m_cancel_requested.load()) {
            result.cancelled = true;
            return;
        }

        const AgentDefinition& agent = *agents[i];
        std::string input = i == 0 ? task : task + "\n\nPrevious result:\n" + prior_output;

        updateProgress(static_cast<double>(i) / agents.size(),
                       "Step " + std::to_string(i + 1) + "/" + std::to_string(agents.size()) + ": " + agent.id);
        publish(ProgressEventType::STEP_STARTED, agent.id, getStatusMessage());

        result.failed_agent = agent.id;
        TaskResult step = runStep(agent, input, context.render(m_config.max_context_chars));
        result.failed_agent.clear();
        prior_output = step.output;
        context.previous_results.push_back(step.output);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_results.push_back(step);
        }

        updateProgress(static_cast<double>(i + 1) / agents.size(),
                       "Completed step " + std::to_string(i + 1) + "/" + std::to_string(agents.size()) +
                       " (" + agent.id + ")");
        publish(ProgressEventType::STEP_COMPLETED, agent.id, getStatusMessage());
    }
}

void CycleAgentManager::runAuto(const std::string& task, TaskContext& context,
                                const AgentDefinition& agent, OrchestrationResult& result) {
    const ExecutionPolicy& policy = getPolicy();
    std::string context_text = context.render(m_config.max_context_chars);

    std::string input = task;
    if (policy.requires_planning && findAgent("orchestrator") != nullptr) {
        setState(OrchestrationState::PLANNING, "Planning");
        updateProgress(0.0, "Planning with orchestrator");

        result.failed_agent = "orchestrator";
        result.plan = createPlan(task, context_text);
        result.failed_agent.clear();
        std::vector<std::string> steps = parsePlan(result.plan);
        if (!steps.empty()) {
            std::ostringstream plan_text;
            for (size_t i = 0; i < steps.size(); ++i) {
                plan_text << (i + 1) << ". " << steps[i] << "\n";
            }
            input += "\n\nPlan:\n" + plan_text.str();
        }
        updateProgress(0.5, "Plan ready (" + std::to_string(steps.size()) + " steps)");

        if (m_cancel_requested.load()) {
            result.cancelled = true;
            return;
        }
    }

    setState(OrchestrationState::EXECUTING, "Executing with " + agent.id);
    publish(ProgressEventType::STEP_STARTED, agent.id, getStatusMessage());

    result.failed_agent = agent.id;
    TaskResult step = runStep(agent, input, context_text);
    result.failed_agent.clear();
    context.previous_results.push_back(step.output);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_results.push_back(step);
    }
    publish(ProgressEventType::STEP_COMPLETED, agent.id, "Completed step (" + agent.id + ")");
}

TaskResult CycleAgentManager::runStep(const AgentDefinition& agent, const std::string& input,
                                      const std::string& context_text) {
    const ExecutionPolicy& policy = getPolicy();

    TaskResult result;
    result.agent_id = agent.id;
    result.input = input;
    result.attempts = 0;

    std::string prompt = input;
    auto step_start = std::chrono::steady_clock::now();

    for (int attempt = 0; attempt <= policy.retry_limit; ++attempt) {
        bool last_attempt = attempt == policy.retry_limit;
        result.attempts++;

        std::string output;
        try {
            output = invokeStep(agent.role, prompt, context_text, result.model_switch_time);
        } catch (const ModelInvocationError& e) {
            Logger::getInstance().warning("CycleAgentManager",
                "Attempt " + std::to_string(attempt + 1) + " failed for " + agent.id, e.what());
            if (last_attempt) {
                throw;
            }
            publish(ProgressEventType::STEP_RETRY, agent.id,
                    "Retrying " + agent.id + " after error: " + std::string(e.what()));
            continue;
        }

        result.output = output;
        if (policy.verification_level == VerificationLevel::NONE) {
            break;
        }

        std::string feedback;
        result.verified = verifyOutput(agent, input, output, feedback, result.model_switch_time);
        if (result.verified || last_attempt) {
            break;
        }

        publish(ProgressEventType::STEP_RETRY, agent.id, "Output of " + agent.id + " rejected by review");
        prompt = input + "\n\nA reviewer rejected your previous answer:\n" + output +
                 "\n\nReviewer feedback:\n" + feedback + "\n\nProvide an improved answer.";
    }

    result.execution_time = std::max(0.0, secondsSince(step_start) - result.model_switch_time);
    result.tokens_used = estimateTokens(result.output);
    result.completed_at = std::chrono::system_clock::now();
    return result;
}

std::string CycleAgentManager::invokeStep(AgentRole role, const std::string& prompt,
                                          const std::string& context_text, double& switch_time) {
    std::string previous = m_cache.currentId();
    std::string role_id = AgentCapabilityUtils::roleToString(role);

    if (m_cache.contains(role)) {
        m_cache.touch(role);
    } else {
        // Only a completed load counts as a switch
        auto load_start = std::chrono::steady_clock::now();
        m_invoker.warmUp(role);
        double elapsed = secondsSince(load_start);
        m_cache.touch(role);
        m_cache.recordSwitchTime(elapsed);
        switch_time += elapsed;

        Logger::getInstance().logModelSwitch(previous.empty() ? "none" : previous, role_id,
                                             static_cast<long>(elapsed * 1000));
        publish(ProgressEventType::MODEL_SWITCH, role_id,
                "Switched model " + (previous.empty() ? std::string("none") : previous) + " -> " + role_id +
                " in " + formatSeconds(elapsed));
    }

    try {
        return m_invoker.invoke(role, prompt, context_text);
    } catch (const ModelInvocationError& e) {
        if (e.kind() == InvocationErrorKind::MODEL_UNAVAILABLE) {
            // The runtime could not keep the model loaded
            m_cache.evict(role);
        }
        throw;
    }
}

std::string CycleAgentManager::invokeAuxiliary(AgentRole role, const std::string& prompt,
                                               const std::string& context_text, double& load_time) {
    if (!m_cache.contains(role)) {
        auto load_start = std::chrono::steady_clock::now();
        m_invoker.warmUp(role);
        double elapsed = secondsSince(load_start);
        load_time += elapsed;
        m_auxiliary_loads++;
        Logger::getInstance().debug("CycleAgentManager",
            "Loaded " + AgentCapabilityUtils::roleToString(role) + " for planning or review",
            formatSeconds(elapsed));
    }
    return m_invoker.invoke(role, prompt, context_text);
}

bool CycleAgentManager::verifyOutput(const AgentDefinition& agent, const std::string& input,
                                     const std::string& output, std::string& feedback, double& switch_time) {
    std::vector<AgentRole> reviewers;
    if (findAgent("orchestrator") != nullptr) {
        reviewers.push_back(AgentRole::ORCHESTRATOR);
    }
    if (getPolicy().verification_level == VerificationLevel::EXPERT_JUDGE &&
        agent.role != AgentRole::ORCHESTRATOR) {
        reviewers.push_back(agent.role);
    }
    if (reviewers.empty()) {
        return false;
    }

    std::string review_prompt =
        "Review the answer below for the given task. Reply with APPROVED if it is correct and complete. "
        "Otherwise reply with NOT APPROVED followed by what must change.\n\nTask:\n" + input +
        "\n\nAnswer:\n" + output;

    for (AgentRole reviewer : reviewers) {
        std::string review;
        try {
            review = invokeAuxiliary(reviewer, review_prompt, "", switch_time);
        } catch (const ModelInvocationError& e) {
            Logger::getInstance().warning("CycleAgentManager",
                "Review by " + AgentCapabilityUtils::roleToString(reviewer) + " failed, output left unverified",
                e.what());
            feedback = e.what();
            return false;
        }
        if (!isApproved(review)) {
            feedback = review;
            return false;
        }
    }
    return true;
}

std::string CycleAgentManager::createPlan(const std::string& task, const std::string& context_text) {
    std::string prompt =
        "Break the following task into a short ordered list of concrete steps. "
        "Reply with JSON of the form {\"steps\": [\"...\"]}.\n\nTask:\n" + task;

    const ExecutionPolicy& policy = getPolicy();
    double load_time = 0.0;
    for (int attempt = 0; ; ++attempt) {
        try {
            return invokeAuxiliary(AgentRole::ORCHESTRATOR, prompt, context_text, load_time);
        } catch (const ModelInvocationError& e) {
            if (attempt >= policy.retry_limit) {
                throw;
            }
            publish(ProgressEventType::STEP_RETRY, "orchestrator", "Retrying planning: " + std::string(e.what()));
        }
    }
}

std::vector<std::string> CycleAgentManager::parsePlan(const std::string& plan_text) {
    std::vector<std::string> steps;

    std::string json_text;
    if (ActionParser::extractJsonObject(plan_text, json_text)) {
        try {
            auto parsed = nlohmann::json::parse(json_text);
            auto it = parsed.find("steps");
            if (it != parsed.end() && it->is_array()) {
                for (const auto& step : *it) {
                    if (step.is_string() && !step.get<std::string>().empty()) {
                        steps.push_back(step.get<std::string>());
                    }
                }
                return steps;
            }
        } catch (const nlohmann::json::exception& e) {
            Logger::getInstance().debug("CycleAgentManager", "Plan is not JSON, reading as list", e.what());
        }
    }

    std::istringstream stream(plan_text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trimLine(line);
        if (line.empty() || line.rfind("```", 0) == 0) {
            continue;
        }
        // Strip "1." / "1)" / "-" / "*" markers
        size_t pos = 0;
        while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) {
            pos++;
        }
        if (pos > 0 && pos < line.size() && (line[pos] == '.' || line[pos] == ')')) {
            line = trimLine(line.substr(pos + 1));
        } else if (line[0] == '-' || line[0] == '*') {
            line = trimLine(line.substr(1));
        }
        if (!line.empty()) {
            steps.push_back(line);
        }
    }
    return steps;
}

std::vector<const AgentDefinition*> CycleAgentManager::resolveAgents(const std::vector<std::string>& ids) const {
    std::vector<const AgentDefinition*> agents;
    for (const auto& id : ids) {
        try {
            AgentCapabilityUtils::stringToRole(id);
        } catch (const std::invalid_argument&) {
            throw ConfigurationError("Unknown agent: " + id);
        }
        const AgentDefinition* agent = findAgent(id);
        if (agent == nullptr) {
            throw ConfigurationError("Agent is not enabled: " + id);
        }
        agents.push_back(agent);
    }
    return agents;
}

void CycleAgentManager::checkAgentFits(const AgentDefinition& agent) const {
    CustomConfiguration single = {{agent.role, agent.model.tier, true}};
    ConfigurationAnalysis analysis = m_tier_manager.analyzeConfiguration(single);
    if (!analysis.can_fit) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1)
            << "Model " << agent.model.name << " for " << agent.id << " needs "
            << analysis.estimated_ram_gb << " GB but only " << m_tier_manager.getUsableRAM()
            << " GB is usable";
        throw ConfigurationError(msg.str());
    }
}

const AgentDefinition* CycleAgentManager::findAgent(const std::string& id) const {
    for (const auto& agent : m_agents) {
        if (agent.id == id) {
            return &agent;
        }
    }
    return nullptr;
}

const AgentDefinition& CycleAgentManager::selectBestAgent(const CapabilitySet& required) const {
    const AgentDefinition* fallback = findAgent("orchestrator");
    if (fallback == nullptr) {
        fallback = &*std::max_element(m_agents.begin(), m_agents.end(),
            [](const AgentDefinition& a, const AgentDefinition& b) { return a.priority < b.priority; });
    }
    if (required.empty()) {
        return *fallback;
    }

    const AgentDefinition* best = nullptr;
    int best_score = 0;
    for (const auto& agent : m_agents) {
        int matches = 0;
        for (TaskCapability capability : required) {
            if (agent.capabilities.count(capability) > 0) {
                matches++;
            }
        }
        int score = matches * 100 / static_cast<int>(required.size());
        if (score == 0) {
            continue;
        }
        if (best == nullptr || score > best_score ||
            (score == best_score && agent.priority > best->priority)) {
            best = &agent;
            best_score = score;
        }
    }
    return best != nullptr ? *best : *fallback;
}

OrchestrationStatistics CycleAgentManager::getStatistics() const {
    OrchestrationStatistics stats;
    stats.available_ram_gb = m_tier_manager.getSystemRAM();
    stats.can_run_parallel = m_can_run_parallel;
    stats.model_switch_count = m_cache.getSwitchCount();
    stats.total_switch_time = m_cache.getTotalSwitchTime();
    stats.average_switch_time = m_cache.getAverageSwitchTime();
    stats.warm_agent = m_cache.currentId();
    stats.registered_agents = m_agents.size();
    stats.cache_hits = m_cache.getHitCount();
    stats.cache_misses = m_cache.getMissCount();
    stats.auxiliary_loads = m_auxiliary_loads.load();
    return stats;
}

std::vector<TaskResult> CycleAgentManager::getResults() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_results;
}

double CycleAgentManager::getProgress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_progress;
}

std::string CycleAgentManager::getStatusMessage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status_message;
}

void CycleAgentManager::setState(OrchestrationState state, const std::string& message) {
    m_state.store(state);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_status_message = message;
    }
    publish(ProgressEventType::STATE_CHANGED, "", stateToString(state) + ": " + message);
}

void CycleAgentManager::updateProgress(double progress, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_progress = std::min(1.0, std::max(0.0, progress));
    m_status_message = message;
}

void CycleAgentManager::publish(ProgressEventType type, const std::string& agent_id, const std::string& message) {
    ProgressEvent event;
    event.type = type;
    event.source = "CycleAgentManager";
    event.agent_id = agent_id;
    event.progress = getProgress();
    event.message = message;
    m_events.publish(event);
}

std::string CycleAgentManager::strategyToString(ExecutionStrategy strategy) {
    switch (strategy) {
        case ExecutionStrategy::AUTO: return "auto";
        case ExecutionStrategy::PIPELINE: return "pipeline";
    }
    return "unknown";
}

std::string CycleAgentManager::stateToString(OrchestrationState state) {
    switch (state) {
        case OrchestrationState::IDLE: return "idle";
        case OrchestrationState::PLANNING: return "planning";
        case OrchestrationState::EXECUTING: return "executing";
        case OrchestrationState::COMPLETED: return "completed";
        case OrchestrationState::FAILED: return "failed";
        case OrchestrationState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string CycleAgentManager::errorKindToString(OrchestrationErrorKind kind) {
    switch (kind) {
        case OrchestrationErrorKind::NONE: return "none";
        case OrchestrationErrorKind::BUSY: return "busy";
        case OrchestrationErrorKind::INVOCATION_FAILED: return "invocation_failed";
    }
    return "unknown";
}

} // namespace Tandem
