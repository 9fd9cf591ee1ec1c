// =================================================================
// include/Tandem/ActionParser.hpp
// =================================================================
// Header for parsing reasoning model replies into agent actions.

#pragma once

#include <string>
#include <vector>

namespace Tandem {

/**
 * @brief Kind of action the reasoning model asked for
 */
enum class AgentActionType {
    TOOL,       ///< Call a named tool
    ASK_USER,   ///< Pause and ask the user a question
    COMPLETE,   ///< Task finished
    THINK       ///< Reasoning only, no side effect
};

/**
 * @brief One parsed action
 */
struct AgentAction {
    AgentActionType type = AgentActionType::THINK;
    std::string tool_name;     ///< Set for TOOL
    std::string tool_input;    ///< JSON object text, set for TOOL
    std::string content;       ///< Question, summary or thought
};

/**
 * @brief Statistics about parsing
 */
struct ActionParseStats {
    size_t total_parsed = 0;
    size_t json_actions = 0;        ///< Replies that carried a JSON action
    size_t plain_text = 0;          ///< Replies treated as thinking
    size_t malformed_json = 0;      ///< JSON-looking replies that failed to parse
};

/**
 * @brief Turns free-form model output into an AgentAction
 *
 * The model is asked to answer with one JSON object, optionally inside a
 * ```json fence:
 *
 *   {"action": "tool", "tool": "read_file", "input": {"path": "main.cpp"}}
 *   {"action": "ask_user", "question": "..."}
 *   {"action": "complete", "summary": "..."}
 *   {"action": "think", "thought": "..."}
 *
 * A tool call named "complete" or "ask_user" is treated as the
 * corresponding action. Anything that is not a recognizable action is
 * returned as THINK with the raw text.
 */
class ActionParser {
public:
    AgentAction parse(const std::string& response);

    const ActionParseStats& getStats() const { return m_stats; }

    void resetStats() { m_stats = ActionParseStats(); }

    /**
     * @brief Locate the JSON object in a reply
     * @param response Model reply
     * @param json_text Receives the candidate object text
     * @return True if a candidate was found
     */
    static bool extractJsonObject(const std::string& response, std::string& json_text);

    /**
     * @brief Instructions describing the reply format, appended to agent prompts
     */
    static std::string formatInstructions();

    static std::string actionTypeToString(AgentActionType type);

private:
    ActionParseStats m_stats;
};

} // namespace Tandem
