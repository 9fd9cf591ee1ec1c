// =================================================================
// src/Tandem/AgentExecutor.cpp
// =================================================================
// Implementation of the autonomous agent loop.

#include "Tandem/AgentExecutor.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/Logger.hpp"
#include "Tandem/TaskContext.hpp"
#include "Tandem/TextUtils.hpp"
#include "Tandem/WorkspaceScanner.hpp"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace Tandem {

namespace {

const size_t MAX_STEP_CHARS_IN_HISTORY = 4000;

std::string clip(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    return TextUtils::truncateUtf8(text, max_chars) + "\n[truncated]";
}

} // anonymous namespace

AgentExecutor::AgentExecutor(ModelInvoker& invoker, EventChannel& events,
                             const AgentExecutorConfig& config, ToolExecutorFactory tool_factory)
    : m_invoker(invoker), m_events(events), m_config(config), m_tool_factory(std::move(tool_factory)) {
    if (m_config.max_loops <= 0) {
        throw ConfigurationError("max_loops must be positive");
    }
    if (!m_tool_factory) {
        m_tool_factory = [this](const std::string& working_directory) -> std::unique_ptr<ToolExecutor> {
            return std::make_unique<DefaultToolExecutor>(working_directory, m_invoker);
        };
    }
}

AgentExecutor::~AgentExecutor() {
    stop();
    if (m_thread && m_thread->joinable()) {
        m_thread->join();
    }
}

bool AgentExecutor::start(const std::string& task, const std::string& working_directory) {
    if (!std::filesystem::is_directory(working_directory)) {
        throw std::invalid_argument("Working directory does not exist: " + working_directory);
    }

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        TANDEM_LOG_WARNING("AgentExecutor", "Start ignored, agent already running");
        return false;
    }

    // The previous run has finished; reclaim its thread
    if (m_thread && m_thread->joinable()) {
        m_thread->join();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_steps.clear();
        m_user_prompt.clear();
        m_pending_input.clear();
        m_has_input = false;
    }
    m_stop_requested.store(false);
    m_loop_count.store(0);
    m_state.store(AgentExecutorState::THINKING);
    m_parser.resetStats();

    Logger::getInstance().info("AgentExecutor", "Starting agent", task);
    m_thread = std::make_unique<std::thread>(&AgentExecutor::runLoop, this, task, working_directory);
    return true;
}

void AgentExecutor::stop() {
    if (!m_running.load()) {
        return;
    }
    m_stop_requested.store(true);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_input_cv.notify_all();
}

bool AgentExecutor::provideUserInput(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.load() != AgentExecutorState::WAITING_FOR_USER || m_has_input) {
        return false;
    }
    m_pending_input = text;
    m_has_input = true;
    m_input_cv.notify_all();
    return true;
}

bool AgentExecutor::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_done_cv.wait_for(lock, timeout, [this]() { return !m_running.load(); });
}

std::vector<AgentStep> AgentExecutor::getSteps() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_steps;
}

std::string AgentExecutor::getUserPrompt() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_user_prompt;
}

void AgentExecutor::runLoop(std::string task, std::string working_directory) {
    std::unique_ptr<ToolExecutor> tools;
    std::string context_text;
    try {
        tools = m_tool_factory(working_directory);
        if (!tools) {
            throw std::runtime_error("No tool executor for " + working_directory);
        }
        if (m_config.scan_workspace) {
            TaskContext context;
            WorkspaceScanner scanner(working_directory);
            scanner.populate(context);
            context_text = context.render(m_config.max_context_chars);
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error("AgentExecutor", "Failed to prepare workspace", e.what());
        addStep(AgentStepType::ERROR, std::string("Failed to prepare workspace: ") + e.what(), true);
        finish(AgentExecutorState::ERROR);
        return;
    }

    addStep(AgentStepType::SYSTEM, "Working in " + working_directory);

    try {
        iterate(task, working_directory, context_text, *tools);
    } catch (const std::exception& e) {
        Logger::getInstance().error("AgentExecutor", "Agent loop aborted", e.what());
        addStep(AgentStepType::ERROR, std::string("Agent loop aborted: ") + e.what(), true);
        finish(AgentExecutorState::ERROR);
    }
}

void AgentExecutor::iterate(const std::string& task, const std::string& working_directory,
                            const std::string& context_text, ToolExecutor& tools) {
    while (true) {
        if (m_stop_requested.load()) {
            addStep(AgentStepType::SYSTEM, "Agent stopped by user", true);
            finish(AgentExecutorState::STOPPED);
            return;
        }
        if (m_loop_count.load() >= m_config.max_loops) {
            addStep(AgentStepType::ERROR, "Max loops exceeded (" + std::to_string(m_config.max_loops) + ")", true);
            finish(AgentExecutorState::ERROR);
            return;
        }
        m_loop_count++;
        m_state.store(AgentExecutorState::THINKING);

        std::string reply;
        std::string error;
        if (!requestNextAction(composePrompt(task, working_directory, tools), context_text, reply, error)) {
            if (m_stop_requested.load()) {
                continue;
            }
            addStep(AgentStepType::ERROR, "Model invocation failed: " + error, true);
            finish(AgentExecutorState::ERROR);
            return;
        }
        if (m_stop_requested.load()) {
            continue;
        }

        AgentAction action = m_parser.parse(reply);
        switch (action.type) {
            case AgentActionType::THINK:
                addStep(AgentStepType::THINKING, action.content);
                break;

            case AgentActionType::TOOL: {
                m_state.store(AgentExecutorState::TOOL_CALL);
                AgentStep step;
                step.type = AgentStepType::TOOL;
                step.tool_name = action.tool_name;
                step.tool_input = action.tool_input;
                try {
                    step.tool_output = tools.execute(action.tool_name, action.tool_input);
                } catch (const ToolExecutionError& e) {
                    step.tool_output = std::string("Error: ") + e.what();
                    Logger::getInstance().warning("AgentExecutor", "Tool failed", e.what());
                } catch (const std::runtime_error& e) {
                    step.tool_output = "Error: " + action.tool_name + ": " + e.what();
                    Logger::getInstance().warning("AgentExecutor", "Tool failed", e.what());
                }
                // Observations come from files and commands; keep the prompt valid UTF-8
                step.tool_output = TextUtils::sanitizeUtf8(step.tool_output);
                step.content = action.tool_name;
                addStep(step);
                m_state.store(AgentExecutorState::OBSERVING);
                break;
            }

            case AgentActionType::ASK_USER:
                if (!waitForUserInput(action.content)) {
                    continue;
                }
                break;

            case AgentActionType::COMPLETE:
                addStep(AgentStepType::COMPLETE, action.content, true);
                finish(AgentExecutorState::COMPLETE);
                return;
        }
    }
}

bool AgentExecutor::requestNextAction(const std::string& prompt, const std::string& context_text,
                                      std::string& reply, std::string& error) {
    int retry_limit = QualityPolicy::forPreset(m_config.preset).retry_limit;

    for (int attempt = 0; attempt <= retry_limit; ++attempt) {
        if (m_stop_requested.load()) {
            return false;
        }
        try {
            reply = m_invoker.invoke(AgentRole::ORCHESTRATOR, prompt, context_text);
            return true;
        } catch (const ModelInvocationError& e) {
            error = ModelInvocationError::kindToString(e.kind()) + ": " + e.what();
            Logger::getInstance().warning("AgentExecutor",
                "Invocation attempt " + std::to_string(attempt + 1) + " failed", error);
        }
    }
    return false;
}

bool AgentExecutor::waitForUserInput(const std::string& question) {
    addStep(AgentStepType::SYSTEM, "Waiting for user: " + question);

    std::string answer;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_user_prompt = question;
        m_state.store(AgentExecutorState::WAITING_FOR_USER);
        m_input_cv.wait(lock, [this]() { return m_has_input || m_stop_requested.load(); });

        m_user_prompt.clear();
        if (!m_has_input) {
            return false;
        }
        answer = m_pending_input;
        m_pending_input.clear();
        m_has_input = false;
        m_state.store(AgentExecutorState::THINKING);
    }

    addStep(AgentStepType::USER_INPUT, answer);
    return true;
}

std::string AgentExecutor::composePrompt(const std::string& task, const std::string& working_directory,
                                         const ToolExecutor& tools) const {
    std::ostringstream prompt;
    prompt << "You are working autonomously in " << working_directory << ".\n\n";
    prompt << "Task:\n" << task << "\n\n";

    prompt << "Available tools:\n";
    for (const auto& tool : tools.describeTools()) {
        prompt << "- " << tool.name << "(";
        for (size_t i = 0; i < tool.parameters.size(); ++i) {
            prompt << (i > 0 ? ", " : "") << tool.parameters[i];
        }
        prompt << "): " << tool.description << "\n";
    }
    prompt << "\n" << ActionParser::formatInstructions() << "\n";

    std::string history = renderHistory();
    if (!history.empty()) {
        prompt << "History so far:\n" << history << "\n";
    }
    prompt << "Decide the next action.";
    return prompt.str();
}

std::string AgentExecutor::renderHistory() const {
    std::vector<AgentStep> steps = getSteps();

    std::ostringstream out;
    for (const auto& step : steps) {
        switch (step.type) {
            case AgentStepType::TOOL:
                out << "[tool " << step.tool_name << " " << step.tool_input << "]\n"
                    << clip(step.tool_output, MAX_STEP_CHARS_IN_HISTORY) << "\n";
                break;
            default:
                out << "[" << stepTypeToString(step.type) << "] "
                    << clip(step.content, MAX_STEP_CHARS_IN_HISTORY) << "\n";
                break;
        }
    }

    std::string history = out.str();
    if (history.size() > m_config.max_history_chars) {
        history = "[earlier steps omitted]\n" + TextUtils::tailUtf8(history, m_config.max_history_chars);
    }
    return history;
}

void AgentExecutor::addStep(const AgentStep& step) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_steps.push_back(step);
    }

    ProgressEvent event;
    event.type = ProgressEventType::AGENT_STEP;
    event.source = "AgentExecutor";
    event.agent_id = "orchestrator";
    event.progress = static_cast<double>(m_loop_count.load()) / m_config.max_loops;
    event.message = stepTypeToString(step.type) + ": " +
                    (step.type == AgentStepType::TOOL ? step.tool_name : clip(step.content, 200));
    m_events.publish(event);

    Logger::getInstance().debug("AgentExecutor", "Step " + stepTypeToString(step.type),
                                step.type == AgentStepType::TOOL ? step.tool_name : clip(step.content, 200));
}

void AgentExecutor::addStep(AgentStepType type, const std::string& content, bool terminal) {
    AgentStep step;
    step.type = type;
    step.content = content;
    step.terminal = terminal;
    addStep(step);
}

void AgentExecutor::finish(AgentExecutorState state) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.store(state);
        m_running.store(false);
    }
    m_done_cv.notify_all();

    Logger::getInstance().info("AgentExecutor", "Agent finished: " + stateToString(state),
                               std::to_string(m_loop_count.load()) + " iteration(s)");
}

std::string AgentExecutor::stepTypeToString(AgentStepType type) {
    switch (type) {
        case AgentStepType::SYSTEM: return "system";
        case AgentStepType::THINKING: return "thinking";
        case AgentStepType::TOOL: return "tool";
        case AgentStepType::USER_INPUT: return "userInput";
        case AgentStepType::ERROR: return "error";
        case AgentStepType::COMPLETE: return "complete";
    }
    return "unknown";
}

std::string AgentExecutor::stateToString(AgentExecutorState state) {
    switch (state) {
        case AgentExecutorState::IDLE: return "idle";
        case AgentExecutorState::THINKING: return "thinking";
        case AgentExecutorState::TOOL_CALL: return "tool_call";
        case AgentExecutorState::OBSERVING: return "observing";
        case AgentExecutorState::WAITING_FOR_USER: return "waiting_for_user";
        case AgentExecutorState::COMPLETE: return "complete";
        case AgentExecutorState::ERROR: return "error";
        case AgentExecutorState::STOPPED: return "stopped";
    }
    return "unknown";
}

} // namespace Tandem
