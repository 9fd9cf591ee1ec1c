// =================================================================
// src/Tandem/ActionParser.cpp
// =================================================================
// Implementation of the agent action parser.

#include "Tandem/ActionParser.hpp"
#include "Tandem/Logger.hpp"
#include "Tandem/TextUtils.hpp"
#include "nlohmann/json.hpp"
#include <vector>

namespace Tandem {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string stringField(const nlohmann::json& object, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

} // anonymous namespace

AgentAction ActionParser::parse(const std::string& response) {
    m_stats.total_parsed++;

    AgentAction action;
    action.type = AgentActionType::THINK;
    action.content = trim(response);

    std::string json_text;
    if (!extractJsonObject(response, json_text)) {
        m_stats.plain_text++;
        return action;
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        m_stats.malformed_json++;
        m_stats.plain_text++;
        Logger::getInstance().debug("ActionParser", "Reply contained malformed JSON", e.what());
        return action;
    }

    if (!parsed.is_object()) {
        m_stats.plain_text++;
        return action;
    }

    std::string kind = TextUtils::toLower(stringField(parsed, {"action", "type"}));
    std::string tool = stringField(parsed, {"tool", "name"});
    if (kind.empty() && !tool.empty()) {
        kind = "tool";
    }

    nlohmann::json input = nlohmann::json::object();
    auto input_it = parsed.find("input");
    if (input_it == parsed.end()) {
        input_it = parsed.find("arguments");
    }
    if (input_it != parsed.end() && input_it->is_object()) {
        input = *input_it;
    }

    // Tool calls that name a control action are the action itself
    if (kind == "tool" && (tool == "complete" || tool == "ask_user")) {
        kind = tool;
        parsed.update(input);
    }

    if (kind == "tool" && !tool.empty()) {
        action.type = AgentActionType::TOOL;
        action.tool_name = tool;
        action.tool_input = input.dump();
        action.content.clear();
    } else if (kind == "complete") {
        action.type = AgentActionType::COMPLETE;
        action.content = stringField(parsed, {"summary", "result", "content", "message"});
    } else if (kind == "ask_user") {
        action.type = AgentActionType::ASK_USER;
        action.content = stringField(parsed, {"question", "content", "message"});
    } else if (kind == "think") {
        action.type = AgentActionType::THINK;
        action.content = stringField(parsed, {"thought", "content", "message"});
    } else {
        m_stats.plain_text++;
        return action;
    }

    m_stats.json_actions++;
    return action;
}

bool ActionParser::extractJsonObject(const std::string& response, std::string& json_text) {
    size_t search_from = 0;
    size_t search_to = response.size();

    size_t fence = response.find("```");
    if (fence != std::string::npos) {
        size_t body = response.find('\n', fence);
        size_t close = body == std::string::npos ? std::string::npos : response.find("```", body);
        if (close != std::string::npos) {
            search_from = body + 1;
            search_to = close;
        }
    }

    size_t open = response.find('{', search_from);
    if (open == std::string::npos || open >= search_to) {
        return false;
    }

    // Match braces, ignoring those inside string literals
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (size_t i = open; i < search_to; ++i) {
        char c = response[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth == 0) {
                json_text = response.substr(open, i - open + 1);
                return true;
            }
        }
    }

    // Unbalanced: hand the remainder to the JSON parser so it is counted as malformed
    json_text = response.substr(open, search_to - open);
    return true;
}

std::string ActionParser::formatInstructions() {
    return "Reply with exactly one JSON object and nothing else. Choose one of:\n"
           "{\"action\": \"tool\", \"tool\": \"<tool name>\", \"input\": {<arguments>}}\n"
           "{\"action\": \"ask_user\", \"question\": \"<question for the user>\"}\n"
           "{\"action\": \"complete\", \"summary\": \"<what was done>\"}\n"
           "{\"action\": \"think\", \"thought\": \"<your reasoning>\"}\n";
}

std::string ActionParser::actionTypeToString(AgentActionType type) {
    switch (type) {
        case AgentActionType::TOOL: return "tool";
        case AgentActionType::ASK_USER: return "ask_user";
        case AgentActionType::COMPLETE: return "complete";
        case AgentActionType::THINK: return "think";
    }
    return "unknown";
}

} // namespace Tandem
