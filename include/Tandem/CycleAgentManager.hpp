// =================================================================
// include/Tandem/CycleAgentManager.hpp
// =================================================================
// Multi-agent orchestration under a single warm-model memory budget.

#pragma once

#include "Tandem/AgentCapabilities.hpp"
#include "Tandem/CapabilityClassifier.hpp"
#include "Tandem/EventChannel.hpp"
#include "Tandem/ModelCatalog.hpp"
#include "Tandem/ModelInvoker.hpp"
#include "Tandem/ModelTierManager.hpp"
#include "Tandem/QualityPolicy.hpp"
#include "Tandem/TaskContext.hpp"
#include "Tandem/WarmModelCache.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace Tandem {

/**
 * @brief One agent of the pool, fixed for the manager's lifetime
 */
struct AgentDefinition {
    std::string id;                 ///< Role id ("coder")
    AgentRole role = AgentRole::ORCHESTRATOR;
    ModelVariant model;             ///< Variant from the active configuration
    CapabilitySet capabilities;
    int priority = 0;
};

enum class ExecutionStrategy {
    AUTO,       ///< Engine picks one agent
    PIPELINE    ///< Caller-ordered agents, each fed the previous output
};

enum class OrchestrationState {
    IDLE,
    PLANNING,
    EXECUTING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class OrchestrationErrorKind {
    NONE,
    BUSY,               ///< Another run is in progress
    INVOCATION_FAILED   ///< A step failed after all retries
};

/**
 * @brief Outcome of planAndExecute
 */
struct OrchestrationResult {
    bool success = false;
    bool cancelled = false;
    std::string output;                 ///< Final output, last step's output for pipelines
    ExecutionStrategy strategy = ExecutionStrategy::AUTO;
    std::vector<TaskResult> results;    ///< Completed steps in execution order
    std::string plan;                   ///< Planning pre-step output, empty if none
    std::vector<std::string> agents;    ///< Agent ids in execution order
    std::string failed_agent;           ///< Agent whose invocation ended the run
    OrchestrationErrorKind error_kind = OrchestrationErrorKind::NONE;
    std::string error_message;
};

/**
 * @brief Orchestration counters
 *
 * model_switch_count and warm_agent follow step-level role transitions
 * only. Planning and review invocations that need a model which is not
 * resident are counted in auxiliary_loads and leave step residency as is.
 */
struct OrchestrationStatistics {
    double available_ram_gb = 0.0;
    bool can_run_parallel = false;
    size_t model_switch_count = 0;
    double total_switch_time = 0.0;     ///< Seconds
    double average_switch_time = 0.0;   ///< Seconds
    std::string warm_agent;             ///< Empty when no model is resident
    size_t registered_agents = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    size_t auxiliary_loads = 0;         ///< Planning and review loads
};

struct OrchestratorConfig {
    double parallel_ram_threshold_gb = 64.0;   ///< RAM needed to keep several models resident
    size_t max_parallel_agents = 4;            ///< Warm cache capacity when parallel-capable
    QualityPreset preset = QualityPreset::BALANCED;
    size_t max_context_chars = 32000;          ///< Rendered TaskContext limit
};

/**
 * @brief Runs tasks through the agent pool
 *
 * The pool is built once from the tier manager's active configuration.
 * Each run is either AUTO (one agent chosen from the task's inferred
 * capabilities) or PIPELINE (explicit agent order). Step residency is
 * tracked by a WarmModelCache; a miss is a model switch whose load time
 * is measured through ModelInvoker::warmUp(). A load that fails is not
 * a switch.
 *
 * One run at a time: a second call while a run is active returns
 * immediately with error_kind BUSY. Progress is published on the
 * EventChannel and can also be polled.
 */
class CycleAgentManager {
public:
    /**
     * @brief Construct the manager
     * @param tier_manager Source of the active configuration and RAM budget
     * @param invoker Inference backend
     * @param classifier Capability inference for AUTO runs
     * @param events Progress event sink
     * @param config Orchestration settings
     */
    CycleAgentManager(const ModelTierManager& tier_manager,
                      ModelInvoker& invoker,
                      CapabilityClassifier& classifier,
                      EventChannel& events,
                      const OrchestratorConfig& config = OrchestratorConfig());

    /**
     * @brief Run a task to completion
     * @param task Task text
     * @param context Working context; each step's output is appended to previous_results
     * @param selected_agents Agent ids for a pipeline run, empty for AUTO
     * @return Run outcome; invocation failures are reported here
     *
     * Throws ConfigurationError, before any state changes, for unknown or
     * disabled agents and for agents whose model alone exceeds the RAM budget.
     * Any other error raised while the run executes leaves the manager
     * FAILED, publishes RUN_FAILED and is rethrown.
     */
    OrchestrationResult planAndExecute(const std::string& task,
                                       TaskContext& context,
                                       const std::vector<std::string>& selected_agents = {});

    /**
     * @brief Run planAndExecute on a background thread
     */
    std::future<OrchestrationResult> planAndExecuteAsync(const std::string& task,
                                                         TaskContext context,
                                                         const std::vector<std::string>& selected_agents = {});

    /**
     * @brief Run a task and return only its output
     *
     * Throws TaskExecutionError when the run fails, is cancelled or is
     * rejected as busy.
     */
    std::string execute(const std::string& task,
                        TaskContext& context,
                        const std::vector<std::string>& selected_agents = {});

    /**
     * @brief Request cancellation; honored before the next step starts
     */
    void cancel();

    OrchestrationStatistics getStatistics() const;

    /**
     * @brief Results of the current or last run
     */
    std::vector<TaskResult> getResults() const;

    const std::vector<AgentDefinition>& getAgents() const { return m_agents; }

    /**
     * @brief Find an agent by id
     * @return nullptr if no such agent is enabled
     */
    const AgentDefinition* findAgent(const std::string& id) const;

    /**
     * @brief Pick the agent whose capabilities best cover a set
     *
     * Score is the share of required capabilities the agent covers; ties
     * go to the higher priority. An empty set or no overlap selects the
     * orchestrator, or the highest-priority agent if it is disabled.
     */
    const AgentDefinition& selectBestAgent(const CapabilitySet& required) const;

    OrchestrationState getState() const { return m_state.load(); }
    bool isRunning() const { return m_running.load(); }
    double getProgress() const;
    std::string getStatusMessage() const;

    const ExecutionPolicy& getPolicy() const { return QualityPolicy::forPreset(m_config.preset); }
    const OrchestratorConfig& getConfig() const { return m_config; }

    /**
     * @brief Parse a planning reply into ordered steps
     *
     * Accepts {"steps": [...]} JSON or a numbered/bulleted list; falls
     * back to the non-empty lines of the reply.
     */
    static std::vector<std::string> parsePlan(const std::string& plan_text);

    static std::string strategyToString(ExecutionStrategy strategy);
    static std::string stateToString(OrchestrationState state);
    static std::string errorKindToString(OrchestrationErrorKind kind);

private:
    const ModelTierManager& m_tier_manager;
    ModelInvoker& m_invoker;
    CapabilityClassifier& m_classifier;
    EventChannel& m_events;
    OrchestratorConfig m_config;

    std::vector<AgentDefinition> m_agents;
    WarmModelCache m_cache;
    bool m_can_run_parallel = false;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_cancel_requested{false};
    std::atomic<OrchestrationState> m_state{OrchestrationState::IDLE};

    mutable std::mutex m_mutex;         // guards the fields below
    std::vector<TaskResult> m_results;
    double m_progress = 0.0;
    std::string m_status_message = "Idle";

    void buildAgentPool();
    std::vector<const AgentDefinition*> resolveAgents(const std::vector<std::string>& ids) const;
    void checkAgentFits(const AgentDefinition& agent) const;

    void runPipeline(const std::string& task, TaskContext& context,
                     const std::vector<const AgentDefinition*>& agents, OrchestrationResult& result);
    void runAuto(const std::string& task, TaskContext& context,
                 const AgentDefinition& agent, OrchestrationResult& result);

    /**
     * @brief Run one step with the policy's retries and verification
     *
     * Throws ModelInvocationError when every attempt failed.
     */
    TaskResult runStep(const AgentDefinition& agent, const std::string& input, const std::string& context_text);

    std::atomic<size_t> m_auxiliary_loads{0};

    /**
     * @brief Invoke a step's role, switching models on a cache miss
     * @param switch_time Incremented by the load time
     */
    std::string invokeStep(AgentRole role, const std::string& prompt, const std::string& context_text,
                           double& switch_time);

    /**
     * @brief Invoke a planning or review role without changing step residency
     * @param load_time Incremented by the load time when the model was not resident
     */
    std::string invokeAuxiliary(AgentRole role, const std::string& prompt, const std::string& context_text,
                                double& load_time);

    /**
     * @brief Review an output according to the policy
     * @param feedback Receives the rejecting reviewer's reply
     * @return True if every reviewer approved
     */
    bool verifyOutput(const AgentDefinition& agent, const std::string& input, const std::string& output,
                      std::string& feedback, double& switch_time);

    std::string createPlan(const std::string& task, const std::string& context_text);

    void setState(OrchestrationState state, const std::string& message);
    void updateProgress(double progress, const std::string& message);
    void publish(ProgressEventType type, const std::string& agent_id, const std::string& message);
};

} // namespace Tandem
