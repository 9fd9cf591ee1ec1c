// =================================================================
// include/Tandem/AgentExecutor.hpp
// =================================================================
// Autonomous single-agent loop with tool dispatch (infinite mode).

#pragma once

#include "Tandem/ActionParser.hpp"
#include "Tandem/EventChannel.hpp"
#include "Tandem/ModelInvoker.hpp"
#include "Tandem/QualityPolicy.hpp"
#include "Tandem/ToolExecutor.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Tandem {

enum class AgentStepType {
    SYSTEM,         ///< Lifecycle notice from the executor
    THINKING,       ///< Model reasoning
    TOOL,           ///< Tool call with its input and output
    USER_INPUT,     ///< Text supplied by the user
    ERROR,          ///< Fatal failure
    COMPLETE        ///< Model declared the task done
};

/**
 * @brief Entry of the append-only step log
 */
struct AgentStep {
    AgentStepType type = AgentStepType::SYSTEM;
    std::string content;
    std::string tool_name;      ///< TOOL only
    std::string tool_input;     ///< TOOL only, JSON text
    std::string tool_output;    ///< TOOL only
    bool terminal = false;      ///< Last step of a run
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

enum class AgentExecutorState {
    IDLE,
    THINKING,
    TOOL_CALL,
    OBSERVING,
    WAITING_FOR_USER,
    COMPLETE,
    ERROR,
    STOPPED
};

struct AgentExecutorConfig {
    int max_loops = 100;                        ///< Iteration budget per run
    QualityPreset preset = QualityPreset::BALANCED; ///< Supplies the invocation retry limit
    bool scan_workspace = true;                 ///< Load working-directory files as context
    size_t max_context_chars = 16000;           ///< File context limit
    size_t max_history_chars = 24000;           ///< Step history limit, newest kept
};

/**
 * @brief Creates the tool executor for a run's working directory
 */
using ToolExecutorFactory = std::function<std::unique_ptr<ToolExecutor>(const std::string& working_directory)>;

/**
 * @brief Runs one orchestrator-driven agent until it completes
 *
 * Each iteration sends the task, the step history and the file context
 * to the orchestrator model and acts on the parsed reply. Tool failures
 * are recorded as observations; only a model invocation failure that
 * survives the retries, or running out of iterations, ends the run with
 * an error. stop() is honored between iterations and while waiting for
 * user input, and always leaves exactly one terminal step.
 */
class AgentExecutor {
public:
    /**
     * @brief Construct an executor
     * @param invoker Inference backend
     * @param events Receives an AGENT_STEP event per appended step
     * @param config Loop settings
     * @param tool_factory Tool executor per run, DefaultToolExecutor if empty
     */
    AgentExecutor(ModelInvoker& invoker, EventChannel& events,
                  const AgentExecutorConfig& config = AgentExecutorConfig(),
                  ToolExecutorFactory tool_factory = ToolExecutorFactory());

    ~AgentExecutor();

    AgentExecutor(const AgentExecutor&) = delete;
    AgentExecutor& operator=(const AgentExecutor&) = delete;

    /**
     * @brief Start a run on a background thread
     * @param task Task description
     * @param working_directory Directory the tools operate in
     * @return False if a run is already active
     *
     * Throws std::invalid_argument if the directory does not exist.
     */
    bool start(const std::string& task, const std::string& working_directory);

    /**
     * @brief Request the run to stop at the next iteration boundary
     */
    void stop();

    /**
     * @brief Answer the agent's pending question
     * @return False unless the agent is waiting for input
     */
    bool provideUserInput(const std::string& text);

    /**
     * @brief Block until the run ends
     * @return False on timeout
     */
    bool waitForCompletion(std::chrono::milliseconds timeout);

    std::vector<AgentStep> getSteps() const;
    int getLoopCount() const { return m_loop_count.load(); }
    AgentExecutorState getState() const { return m_state.load(); }
    bool isRunning() const { return m_running.load(); }
    bool isWaitingForUser() const { return m_state.load() == AgentExecutorState::WAITING_FOR_USER; }

    /**
     * @brief Question the agent is waiting on, empty otherwise
     */
    std::string getUserPrompt() const;

    const AgentExecutorConfig& getConfig() const { return m_config; }

    static std::string stepTypeToString(AgentStepType type);
    static std::string stateToString(AgentExecutorState state);

private:
    ModelInvoker& m_invoker;
    EventChannel& m_events;
    AgentExecutorConfig m_config;
    ToolExecutorFactory m_tool_factory;
    ActionParser m_parser;

    std::unique_ptr<std::thread> m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stop_requested{false};
    std::atomic<int> m_loop_count{0};
    std::atomic<AgentExecutorState> m_state{AgentExecutorState::IDLE};

    mutable std::mutex m_mutex;         // guards steps, user input and completion
    std::condition_variable m_input_cv;
    std::condition_variable m_done_cv;
    std::vector<AgentStep> m_steps;
    std::string m_user_prompt;
    std::string m_pending_input;
    bool m_has_input = false;

    void runLoop(std::string task, std::string working_directory);

    /**
     * @brief Iterate until a terminal step has been appended
     */
    void iterate(const std::string& task, const std::string& working_directory,
                 const std::string& context_text, ToolExecutor& tools);

    /**
     * @brief Ask the orchestrator for the next action, retrying per policy
     * @param reply Receives the model output
     * @param error Receives the last error message on failure
     * @return False if every attempt failed or a stop was requested
     */
    bool requestNextAction(const std::string& prompt, const std::string& context_text,
                           std::string& reply, std::string& error);

    /**
     * @brief Suspend until the user answers or stop() is called
     * @return False if stopped
     */
    bool waitForUserInput(const std::string& question);

    std::string composePrompt(const std::string& task, const std::string& working_directory,
                              const ToolExecutor& tools) const;
    std::string renderHistory() const;

    void addStep(const AgentStep& step);
    void addStep(AgentStepType type, const std::string& content, bool terminal = false);
    void finish(AgentExecutorState state);
};

} // namespace Tandem
