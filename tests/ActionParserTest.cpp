// =================================================================
// tests/ActionParserTest.cpp
// =================================================================
// Unit tests for parsing agent replies into actions.

#include "Tandem/ActionParser.hpp"
#include "nlohmann/json.hpp"
#include <cassert>
#include <iostream>

using namespace Tandem;

class ActionParserTest {
public:
    void testToolCall() {
        std::cout << "Testing tool call parsing..." << std::endl;

        ActionParser parser;
        AgentAction action = parser.parse(
            R"({"action": "tool", "tool": "read_file", "input": {"path": "src/main.cpp"}})");

        assert(action.type == AgentActionType::TOOL);
        assert(action.tool_name == "read_file");
        auto input = nlohmann::json::parse(action.tool_input);
        assert(input["path"] == "src/main.cpp");

        // Alternate key names
        AgentAction alt = parser.parse(R"({"name": "list_directory", "arguments": {"path": "."}})");
        assert(alt.type == AgentActionType::TOOL);
        assert(alt.tool_name == "list_directory");

        std::cout << "✓ Tool call parsing test passed" << std::endl;
    }

    void testFencedReply() {
        std::cout << "Testing fenced JSON extraction..." << std::endl;

        ActionParser parser;
        std::string reply =
            "I will look at the build file first.\n"
            "```json\n"
            "{\"action\": \"tool\", \"tool\": \"run_shell\", \"input\": {\"command\": \"echo {braces}\"}}\n"
            "```\n";

        AgentAction action = parser.parse(reply);
        assert(action.type == AgentActionType::TOOL);
        assert(action.tool_name == "run_shell");
        assert(nlohmann::json::parse(action.tool_input)["command"] == "echo {braces}");

        std::cout << "✓ Fenced JSON extraction test passed" << std::endl;
    }

    void testControlActions() {
        std::cout << "Testing control actions..." << std::endl;

        ActionParser parser;

        AgentAction done = parser.parse(R"({"action": "complete", "summary": "Added the flag"})");
        assert(done.type == AgentActionType::COMPLETE);
        assert(done.content == "Added the flag");

        AgentAction ask = parser.parse(R"({"action": "ask_user", "question": "Which branch?"})");
        assert(ask.type == AgentActionType::ASK_USER);
        assert(ask.content == "Which branch?");

        // A control action phrased as a tool call
        AgentAction as_tool = parser.parse(
            R"({"action": "tool", "tool": "complete", "input": {"summary": "All tests pass"}})");
        assert(as_tool.type == AgentActionType::COMPLETE);
        assert(as_tool.content == "All tests pass");

        AgentAction thought = parser.parse(R"({"action": "think", "thought": "Need the header first"})");
        assert(thought.type == AgentActionType::THINK);
        assert(thought.content == "Need the header first");

        std::cout << "✓ Control actions test passed" << std::endl;
    }

    void testPlainAndMalformed() {
        std::cout << "Testing plain text and malformed replies..." << std::endl;

        ActionParser parser;

        AgentAction plain = parser.parse("  Let me think about this.  ");
        assert(plain.type == AgentActionType::THINK);
        assert(plain.content == "Let me think about this.");

        AgentAction broken = parser.parse(R"({"action": "tool", "tool": )");
        assert(broken.type == AgentActionType::THINK);

        AgentAction unknown = parser.parse(R"({"action": "dance"})");
        assert(unknown.type == AgentActionType::THINK);

        const ActionParseStats& stats = parser.getStats();
        assert(stats.total_parsed == 3);
        assert(stats.plain_text == 3);
        assert(stats.malformed_json == 1);
        assert(stats.json_actions == 0);

        parser.resetStats();
        assert(parser.getStats().total_parsed == 0);

        std::cout << "✓ Plain and malformed reply test passed" << std::endl;
    }

    void testExtractJsonObject() {
        std::cout << "Testing JSON object extraction..." << std::endl;

        std::string json_text;
        assert(!ActionParser::extractJsonObject("no braces here", json_text));
        assert(ActionParser::extractJsonObject(R"(prefix {"a": "}"} suffix)", json_text));
        assert(json_text == R"({"a": "}"})");

        assert(ActionParser::formatInstructions().find("\"action\"") != std::string::npos);
        assert(ActionParser::actionTypeToString(AgentActionType::ASK_USER) == "ask_user");

        std::cout << "✓ JSON object extraction test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ActionParser tests...\n" << std::endl;

        testToolCall();
        testFencedReply();
        testControlActions();
        testPlainAndMalformed();
        testExtractJsonObject();

        std::cout << "\nAll ActionParser tests passed!" << std::endl;
    }
};

int main() {
    try {
        ActionParserTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
