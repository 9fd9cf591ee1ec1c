// =================================================================
// tests/AgentExecutorTest.cpp
// =================================================================
// Unit tests for the autonomous agent loop with scripted replies
// and in-memory tools.

#include "Tandem/AgentExecutor.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/SysInteraction.hpp"
#include "Tandem/TextUtils.hpp"
#include "nlohmann/json.hpp"
#include <cassert>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

using namespace Tandem;

namespace fs = std::filesystem;

namespace {

const std::string COMPLETE_REPLY = R"({"action": "complete", "summary": "done"})";
const std::string THINK_REPLY = R"({"action": "think", "thought": "still thinking"})";

/**
 * @brief Orchestrator stand-in that replays a fixed list of replies
 */
class ScriptedAgentInvoker : public ModelInvoker {
public:
    explicit ScriptedAgentInvoker(std::deque<std::string> replies, std::string fallback = COMPLETE_REPLY)
        : m_replies(std::move(replies)), m_fallback(std::move(fallback)) {}

    std::string invoke(AgentRole, const std::string& prompt, const std::string& context) override {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_prompts.push_back(prompt);
        m_contexts.push_back(context);
        if (failures_remaining > 0) {
            failures_remaining--;
            throw ModelInvocationError(InvocationErrorKind::NETWORK_ERROR, "server unreachable");
        }
        if (m_replies.empty()) {
            return m_fallback;
        }
        std::string reply = m_replies.front();
        m_replies.pop_front();
        return reply;
    }

    void warmUp(AgentRole) override {}

    std::vector<std::string> getPrompts() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_prompts;
    }

    std::vector<std::string> getContexts() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_contexts;
    }

    int failures_remaining = 0;
    std::chrono::milliseconds delay{0};

private:
    std::mutex m_mutex;
    std::deque<std::string> m_replies;
    std::string m_fallback;
    std::vector<std::string> m_prompts;
    std::vector<std::string> m_contexts;
};

/**
 * @brief Scripted orchestrator that encodes each request as JSON the way
 *        an HTTP backend does, so invalid UTF-8 in a prompt throws
 */
class JsonEncodingInvoker : public ModelInvoker {
public:
    explicit JsonEncodingInvoker(std::deque<std::string> replies) : m_replies(std::move(replies)) {}

    std::string invoke(AgentRole, const std::string& prompt, const std::string& context) override {
        nlohmann::json request = {{"prompt", context + "\n\n" + prompt}};
        std::string encoded = request.dump();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.push_back(encoded);
        if (m_replies.empty()) {
            return COMPLETE_REPLY;
        }
        std::string reply = m_replies.front();
        m_replies.pop_front();
        return reply;
    }

    void warmUp(AgentRole) override {}

    std::vector<std::string> getRequests() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

private:
    std::mutex m_mutex;
    std::deque<std::string> m_replies;
    std::vector<std::string> m_requests;
};

/**
 * @brief Two tools: "echo" returns its input, "fail" always throws
 */
class MockToolExecutor : public ToolExecutor {
public:
    std::string execute(const std::string& name, const std::string& input_json) override {
        if (name == "echo") {
            return "echo:" + input_json;
        }
        if (name == "fail") {
            throw ToolExecutionError(name, "disk full");
        }
        throw ToolExecutionError(name, "Unknown tool");
    }

    std::vector<ToolDescription> describeTools() const override {
        return {{"echo", "Echo the input", {"text"}}, {"fail", "Always fails", {}}};
    }
};

ToolExecutorFactory mockTools() {
    return [](const std::string&) -> std::unique_ptr<ToolExecutor> {
        return std::make_unique<MockToolExecutor>();
    };
}

AgentExecutorConfig quietConfig(int max_loops = 100) {
    AgentExecutorConfig config;
    config.max_loops = max_loops;
    config.preset = QualityPreset::FAST;
    config.scan_workspace = false;
    return config;
}

size_t countTerminal(const std::vector<AgentStep>& steps) {
    size_t count = 0;
    for (const auto& step : steps) {
        if (step.terminal) {
            count++;
        }
    }
    return count;
}

bool waitUntil(const std::function<bool()>& condition) {
    for (int i = 0; i < 500; ++i) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // namespace

class AgentExecutorTest {
private:
    fs::path m_dir;

public:
    AgentExecutorTest() {
        m_dir = fs::temp_directory_path() / "tandem_agent_executor_test";
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);
        SysInteraction::writeFile((m_dir / "notes.md").string(), "remember the release checklist\n");
    }

    ~AgentExecutorTest() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    void testRunsToCompletion() {
        std::cout << "Testing run to completion..." << std::endl;

        ScriptedAgentInvoker invoker({
            THINK_REPLY,
            R"({"action": "tool", "tool": "echo", "input": {"text": "hi"}})",
            R"({"action": "complete", "summary": "Echoed the greeting"})"
        });
        EventChannel events;
        auto subscription = events.subscribe();
        AgentExecutor agent(invoker, events, quietConfig(), mockTools());

        assert(agent.start("Say hi", m_dir.string()));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(steps.size() == 4);
        assert(steps[0].type == AgentStepType::SYSTEM);
        assert(steps[1].type == AgentStepType::THINKING && steps[1].content == "still thinking");
        assert(steps[2].type == AgentStepType::TOOL);
        assert(steps[2].tool_name == "echo");
        assert(steps[2].tool_output.find("echo:") == 0);
        assert(steps[3].type == AgentStepType::COMPLETE);
        assert(steps[3].content == "Echoed the greeting");
        assert(countTerminal(steps) == 1 && steps.back().terminal);

        assert(agent.getState() == AgentExecutorState::COMPLETE);
        assert(agent.getLoopCount() == 3);
        assert(!agent.isRunning());

        auto prompts = invoker.getPrompts();
        assert(prompts.size() == 3);
        assert(prompts[0].find("- echo(text): Echo the input") != std::string::npos);
        assert(prompts[2].find("History so far:") != std::string::npos);
        assert(prompts[2].find("[tool echo") != std::string::npos);

        assert(subscription->pending() == 4 && "One event per step");

        std::cout << "✓ Run to completion test passed" << std::endl;
    }

    void testToolErrorsAreObserved() {
        std::cout << "Testing tool error recovery..." << std::endl;

        ScriptedAgentInvoker invoker({
            R"({"action": "tool", "tool": "fail", "input": {}})",
            R"({"action": "tool", "tool": "nonexistent"})",
            COMPLETE_REPLY
        });
        EventChannel events;
        AgentExecutor agent(invoker, events, quietConfig(), mockTools());

        assert(agent.start("Try the tools", m_dir.string()));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(steps[1].type == AgentStepType::TOOL);
        assert(steps[1].tool_output.find("Error: ") == 0);
        assert(steps[1].tool_output.find("disk full") != std::string::npos);
        assert(steps[2].tool_output.find("Unknown tool") != std::string::npos);
        assert(agent.getState() == AgentExecutorState::COMPLETE && "Tool failures do not end the run");

        auto prompts = invoker.getPrompts();
        assert(prompts[1].find("disk full") != std::string::npos && "The model sees the failure");

        std::cout << "✓ Tool error recovery test passed" << std::endl;
    }

    void testMaxLoops() {
        std::cout << "Testing loop budget..." << std::endl;

        ScriptedAgentInvoker invoker({}, THINK_REPLY);
        EventChannel events;
        AgentExecutor agent(invoker, events, quietConfig(3), mockTools());

        assert(agent.start("Think forever", m_dir.string()));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(agent.getLoopCount() == 3);
        assert(agent.getState() == AgentExecutorState::ERROR);
        assert(steps.back().type == AgentStepType::ERROR);
        assert(steps.back().content == "Max loops exceeded (3)");
        assert(countTerminal(steps) == 1);

        bool threw = false;
        try {
            AgentExecutor invalid(invoker, events, quietConfig(0), mockTools());
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Non-positive loop budget is rejected");

        std::cout << "✓ Loop budget test passed" << std::endl;
    }

    void testInvocationFailures() {
        std::cout << "Testing invocation failures..." << std::endl;

        ScriptedAgentInvoker broken({});
        broken.failures_remaining = 100;
        EventChannel events;
        AgentExecutor agent(broken, events, quietConfig(), mockTools());

        assert(agent.start("Anything", m_dir.string()));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(agent.getState() == AgentExecutorState::ERROR);
        assert(steps.back().type == AgentStepType::ERROR);
        assert(steps.back().content.find("Model invocation failed: network_error") == 0);
        assert(countTerminal(steps) == 1);

        // One failure is absorbed by the balanced preset's retry
        ScriptedAgentInvoker flaky({COMPLETE_REPLY});
        flaky.failures_remaining = 1;
        AgentExecutorConfig config = quietConfig();
        config.preset = QualityPreset::BALANCED;
        AgentExecutor retrying(flaky, events, config, mockTools());

        assert(retrying.start("Anything", m_dir.string()));
        assert(retrying.waitForCompletion(std::chrono::milliseconds(5000)));
        assert(retrying.getState() == AgentExecutorState::COMPLETE);
        assert(flaky.getPrompts().size() == 2);

        std::cout << "✓ Invocation failure test passed" << std::endl;
    }

    void testStop() {
        std::cout << "Testing stop..." << std::endl;

        ScriptedAgentInvoker invoker({}, THINK_REPLY);
        invoker.delay = std::chrono::milliseconds(5);
        EventChannel events;
        AgentExecutor agent(invoker, events, quietConfig(100000), mockTools());

        assert(agent.start("Keep going", m_dir.string()));
        assert(waitUntil([&agent]() { return agent.getLoopCount() >= 2; }));
        agent.stop();
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(agent.getState() == AgentExecutorState::STOPPED);
        assert(steps.back().type == AgentStepType::SYSTEM);
        assert(steps.back().content == "Agent stopped by user");
        assert(countTerminal(steps) == 1 && "Exactly one terminal step");

        std::cout << "✓ Stop test passed" << std::endl;
    }

    void testAskUser() {
        std::cout << "Testing user questions..." << std::endl;

        ScriptedAgentInvoker invoker({
            R"({"action": "ask_user", "question": "Which file?"})",
            COMPLETE_REPLY
        });
        EventChannel events;
        AgentExecutor agent(invoker, events, quietConfig(), mockTools());

        assert(!agent.provideUserInput("too early") && "No question pending yet");
        assert(agent.start("Edit a file", m_dir.string()));
        assert(waitUntil([&agent]() { return agent.isWaitingForUser(); }));
        assert(agent.getUserPrompt() == "Which file?");
        assert(!agent.start("Another task", m_dir.string()) && "Only one run at a time");

        assert(agent.provideUserInput("main.cpp"));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(steps[1].type == AgentStepType::SYSTEM);
        assert(steps[1].content == "Waiting for user: Which file?");
        assert(steps[2].type == AgentStepType::USER_INPUT);
        assert(steps[2].content == "main.cpp");
        assert(agent.getState() == AgentExecutorState::COMPLETE);
        assert(invoker.getPrompts().back().find("[userInput] main.cpp") != std::string::npos);

        std::cout << "✓ User question test passed" << std::endl;
    }

    void testStopWhileWaitingForUser() {
        std::cout << "Testing stop while waiting for user..." << std::endl;

        ScriptedAgentInvoker invoker({R"({"action": "ask_user", "question": "Proceed?"})"});
        EventChannel events;
        AgentExecutor agent(invoker, events, quietConfig(), mockTools());

        assert(agent.start("Risky change", m_dir.string()));
        assert(waitUntil([&agent]() { return agent.isWaitingForUser(); }));
        agent.stop();
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(agent.getState() == AgentExecutorState::STOPPED);
        assert(countTerminal(steps) == 1);
        assert(steps.back().content == "Agent stopped by user");

        std::cout << "✓ Stop while waiting test passed" << std::endl;
    }

    void testNonUtf8Observations() {
        std::cout << "Testing non-UTF-8 observations..." << std::endl;

        SysInteraction::writeFile((m_dir / "legacy.txt").string(), "caf\xE9 cr\xE8me\n");
        SysInteraction::writeFile((m_dir / "accent.txt").string(), "caf\xC3\xA9!");

        // 4001 bytes of thought: the history clip lands inside an "é"
        std::string thought = "a";
        for (int i = 0; i < 2000; ++i) {
            thought += "\xC3\xA9";
        }

        JsonEncodingInvoker invoker({
            R"({"action": "tool", "tool": "read_file", "input": {"path": "legacy.txt"}})",
            R"({"action": "tool", "tool": "read_file", "input": {"path": "accent.txt"}})",
            R"({"action": "think", "thought": ")" + thought + R"("})",
            R"({"action": "complete", "summary": "Read both files"})"
        });
        EventChannel events;
        AgentExecutorConfig config = quietConfig();
        config.scan_workspace = true;
        AgentExecutor agent(invoker, events, config,
            [&invoker](const std::string& working_directory) -> std::unique_ptr<ToolExecutor> {
                ToolExecutorConfig tool_config;
                tool_config.max_read_bytes = 4;
                return std::make_unique<DefaultToolExecutor>(working_directory, invoker, tool_config);
            });

        assert(agent.start("Summarize the legacy notes", m_dir.string()));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));

        auto steps = agent.getSteps();
        assert(agent.getState() == AgentExecutorState::COMPLETE && "Encoding never aborts the loop");
        assert(steps.back().type == AgentStepType::COMPLETE);
        assert(steps[1].type == AgentStepType::TOOL);
        assert(TextUtils::isValidUtf8(steps[1].tool_output));
        assert(steps[1].tool_output.find("caf\xEF\xBF\xBD") == 0);
        assert(steps[2].tool_output == "caf\n[truncated]");
        auto requests = invoker.getRequests();
        assert(requests.size() == 4);
        assert(requests[0].find("caf\xEF\xBF\xBD cr\xEF\xBF\xBDme") != std::string::npos
               && "Workspace context is cleaned before it reaches the prompt");

        std::cout << "✓ Non-UTF-8 observations test passed" << std::endl;
    }

    void testWorkspaceContextAndRestart() {
        std::cout << "Testing workspace context and restart..." << std::endl;

        ScriptedAgentInvoker invoker({COMPLETE_REPLY, COMPLETE_REPLY});
        EventChannel events;
        AgentExecutorConfig config = quietConfig();
        config.scan_workspace = true;
        AgentExecutor agent(invoker, events, config, mockTools());

        bool threw = false;
        try {
            agent.start("Task", (m_dir / "missing").string());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Missing working directory is rejected");

        assert(agent.start("Read the notes", m_dir.string()));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));
        assert(invoker.getContexts()[0].find("release checklist") != std::string::npos);

        assert(agent.start("Read the notes again", m_dir.string()));
        assert(agent.waitForCompletion(std::chrono::milliseconds(5000)));
        assert(agent.getSteps().size() == 2 && "Steps reset between runs");
        assert(agent.getLoopCount() == 1);

        assert(AgentExecutor::stepTypeToString(AgentStepType::USER_INPUT) == "userInput");
        assert(AgentExecutor::stateToString(AgentExecutorState::WAITING_FOR_USER) == "waiting_for_user");

        std::cout << "✓ Workspace context and restart test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running AgentExecutor tests...\n" << std::endl;

        testRunsToCompletion();
        testToolErrorsAreObserved();
        testMaxLoops();
        testInvocationFailures();
        testStop();
        testAskUser();
        testStopWhileWaitingForUser();
        testNonUtf8Observations();
        testWorkspaceContextAndRestart();

        std::cout << "\nAll AgentExecutor tests passed!" << std::endl;
    }
};

int main() {
    try {
        AgentExecutorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
