// =================================================================
// tests/ToolExecutorTest.cpp
// =================================================================
// Unit tests for the default agent tools.

#include "Tandem/ToolExecutor.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/SysInteraction.hpp"
#include "Tandem/TextUtils.hpp"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <vector>

using namespace Tandem;

namespace fs = std::filesystem;

/**
 * @brief Invoker that records delegations and answers from a script
 */
class RecordingInvoker : public ModelInvoker {
public:
    std::vector<std::pair<AgentRole, std::string>> calls;
    bool fail = false;

    std::string invoke(AgentRole role, const std::string& prompt, const std::string&) override {
        if (fail) {
            throw ModelInvocationError(InvocationErrorKind::MODEL_UNAVAILABLE, "model not installed");
        }
        calls.emplace_back(role, prompt);
        return "answer from " + AgentCapabilityUtils::roleToString(role);
    }

    void warmUp(AgentRole) override {}
};

class ToolExecutorTest {
private:
    fs::path m_dir;

    bool throwsToolError(DefaultToolExecutor& tools, const std::string& name, const std::string& input) {
        try {
            tools.execute(name, input);
        } catch (const ToolExecutionError&) {
            return true;
        }
        return false;
    }

public:
    ToolExecutorTest() {
        m_dir = fs::temp_directory_path() / "tandem_tool_executor_test";
        fs::remove_all(m_dir);
        fs::create_directories(m_dir / "src");
        SysInteraction::writeFile((m_dir / "src" / "main.cpp").string(),
                                  "int main() {\n    return compute_answer();\n}\n");
        SysInteraction::writeFile((m_dir / "README.md").string(), "# Demo project\n");
    }

    ~ToolExecutorTest() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    void testDefaultTools() {
        std::cout << "Testing default tool set..." << std::endl;

        RecordingInvoker invoker;
        DefaultToolExecutor tools(m_dir.string(), invoker);

        for (const char* name : {"read_file", "write_file", "list_directory", "run_shell",
                                 "search_codebase", "take_screenshot", "delegate_to_coder",
                                 "delegate_to_researcher", "delegate_to_vision"}) {
            assert(tools.hasTool(name));
        }
        assert(!tools.hasTool("delegate_to_orchestrator"));
        assert(tools.describeTools().size() == 9);

        std::cout << "✓ Default tool set test passed" << std::endl;
    }

    void testFileTools() {
        std::cout << "Testing file tools..." << std::endl;

        RecordingInvoker invoker;
        DefaultToolExecutor tools(m_dir.string(), invoker);

        std::string content = tools.execute("read_file", R"({"path": "src/main.cpp"})");
        assert(content.find("compute_answer") != std::string::npos);

        std::string written = tools.execute("write_file",
            R"({"path": "notes/todo.txt", "content": "ship it"})");
        assert(written.find("7 bytes") != std::string::npos);
        assert(SysInteraction::readFile((m_dir / "notes" / "todo.txt").string()) == "ship it");

        std::string listing = tools.execute("list_directory", "{}");
        assert(listing.find("README.md") != std::string::npos);
        assert(listing.find("src/") != std::string::npos);

        assert(throwsToolError(tools, "read_file", R"({"path": "missing.txt"})"));
        assert(throwsToolError(tools, "read_file", "{}") && "Missing path argument");
        assert(throwsToolError(tools, "list_directory", R"({"path": "README.md"})") && "Not a directory");

        std::cout << "✓ File tools test passed" << std::endl;
    }

    void testNonUtf8Content() {
        std::cout << "Testing non-UTF-8 tool output..." << std::endl;

        SysInteraction::writeFile((m_dir / "legacy.txt").string(), "caf\xE9\n");
        SysInteraction::writeFile((m_dir / "accent.txt").string(), "caf\xC3\xA9!");

        RecordingInvoker invoker;
        ToolExecutorConfig config;
        config.max_read_bytes = 4;
        DefaultToolExecutor tools(m_dir.string(), invoker, config);

        std::string legacy = tools.execute("read_file", R"({"path": "legacy.txt"})");
        assert(TextUtils::isValidUtf8(legacy) && "Latin-1 bytes are replaced");
        assert(legacy.find("caf\xEF\xBF\xBD") == 0);

        std::string accent = tools.execute("read_file", R"({"path": "accent.txt"})");
        assert(accent == "caf\n[truncated]" && "Truncation does not split a character");

        std::string shell = tools.execute("run_shell", R"({"command": "printf 'caf\\351'"})");
        assert(shell.find("exit code: 0") == 0);
        assert(TextUtils::isValidUtf8(shell));
        assert(shell.find("caf\xEF\xBF\xBD") != std::string::npos);

        std::cout << "✓ Non-UTF-8 tool output test passed" << std::endl;
    }

    void testSandboxEscape() {
        std::cout << "Testing working directory confinement..." << std::endl;

        RecordingInvoker invoker;
        DefaultToolExecutor tools(m_dir.string(), invoker);

        assert(throwsToolError(tools, "read_file", R"({"path": "../../etc/passwd"})"));
        assert(throwsToolError(tools, "write_file", R"({"path": "../escape.txt", "content": "x"})"));
        assert(!fs::exists(m_dir.parent_path() / "escape.txt"));
        assert(throwsToolError(tools, "list_directory", R"({"path": "/"})"));

        std::cout << "✓ Confinement test passed" << std::endl;
    }

    void testShellAndSearch() {
        std::cout << "Testing shell and search tools..." << std::endl;

        RecordingInvoker invoker;
        DefaultToolExecutor tools(m_dir.string(), invoker);

        std::string output = tools.execute("run_shell", R"({"command": "echo hello"})");
        assert(output.find("exit code: 0") == 0);
        assert(output.find("hello") != std::string::npos);

        std::string failing = tools.execute("run_shell", R"({"command": "exit 3"})");
        assert(failing.find("exit code: 3") == 0 && "Non-zero exit is reported, not thrown");

        std::string found = tools.execute("search_codebase", R"({"query": "COMPUTE_ANSWER"})");
        assert(found.find("src/main.cpp:2:") != std::string::npos);

        std::string none = tools.execute("search_codebase", R"({"query": "no such symbol"})");
        assert(none.find("No matches") == 0);

        ToolExecutorConfig locked;
        locked.allow_shell = false;
        DefaultToolExecutor restricted(m_dir.string(), invoker, locked);
        assert(throwsToolError(restricted, "run_shell", R"({"command": "echo hi"})"));

        std::cout << "✓ Shell and search test passed" << std::endl;
    }

    void testDelegation() {
        std::cout << "Testing delegation tools..." << std::endl;

        RecordingInvoker invoker;
        DefaultToolExecutor tools(m_dir.string(), invoker);

        std::string answer = tools.execute("delegate_to_researcher",
            R"({"task": "Summarize the README", "context": "short"})");
        assert(answer == "answer from researcher");
        assert(invoker.calls.size() == 1);
        assert(invoker.calls[0].first == AgentRole::RESEARCHER);
        assert(invoker.calls[0].second == "Summarize the README");

        invoker.fail = true;
        assert(throwsToolError(tools, "delegate_to_coder", R"({"task": "Write a parser"})")
               && "Invocation failures become tool errors");

        std::cout << "✓ Delegation test passed" << std::endl;
    }

    void testErrorsAndArguments() {
        std::cout << "Testing tool errors and argument parsing..." << std::endl;

        RecordingInvoker invoker;
        DefaultToolExecutor tools(m_dir.string(), invoker);

        assert(throwsToolError(tools, "launch_rocket", "{}"));
        assert(throwsToolError(tools, "take_screenshot", "{}"));
        assert(throwsToolError(tools, "read_file", "[1, 2]"));
        assert(throwsToolError(tools, "read_file", "{not json"));

        ToolArguments args = DefaultToolExecutor::parseArguments("any", R"({"path": "a.txt", "limit": 10})");
        assert(args["path"] == "a.txt");
        assert(args["limit"] == "10");
        assert(DefaultToolExecutor::parseArguments("any", "").empty());

        tools.registerTool({"echo", "Echo the text argument", {"text"}},
            [](const ToolArguments& a) { return a.at("text"); });
        assert(tools.execute("echo", R"({"text": "ping"})") == "ping");

        std::cout << "✓ Tool errors and arguments test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ToolExecutor tests...\n" << std::endl;

        testDefaultTools();
        testFileTools();
        testNonUtf8Content();
        testSandboxEscape();
        testShellAndSearch();
        testDelegation();
        testErrorsAndArguments();

        std::cout << "\nAll ToolExecutor tests passed!" << std::endl;
    }
};

int main() {
    try {
        ToolExecutorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
