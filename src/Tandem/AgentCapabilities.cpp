// =================================================================
// src/Tandem/AgentCapabilities.cpp
// =================================================================
// Role table and capability conversion utilities.

#include "Tandem/AgentCapabilities.hpp"
#include <stdexcept>
#include <unordered_map>

namespace Tandem {

namespace {

const std::vector<RoleProfile>& roleTable() {
    static const std::vector<RoleProfile> table = {
        {
            AgentRole::ORCHESTRATOR,
            "orchestrator",
            "Orchestrator",
            "You are the Orchestrator agent. Your role is to:\n"
            "1. Analyze complex tasks and break them into subtasks\n"
            "2. Decide which specialist agent should handle each subtask\n"
            "3. Synthesize results from specialists into coherent output\n"
            "4. Maintain context across the entire task lifecycle\n\n"
            "Available specialists: Coder (code tasks), Researcher (information gathering), "
            "Vision (image analysis)",
            {TaskCapability::PLANNING, TaskCapability::SYNTHESIS},
            100,
            ""
        },
        {
            AgentRole::CODER,
            "coder",
            "Coder",
            "You are the Coder agent. You excel at:\n"
            "- Writing clean, efficient, well-documented code\n"
            "- Debugging and fixing issues\n"
            "- Code review and optimization\n"
            "- Understanding codebases and suggesting improvements\n\n"
            "Focus only on coding tasks. Be precise and provide working code.",
            {TaskCapability::CODE_GENERATION, TaskCapability::CODE_REVIEW, TaskCapability::DEBUGGING},
            80,
            "delegate_to_coder"
        },
        {
            AgentRole::RESEARCHER,
            "researcher",
            "Researcher",
            "You are the Researcher agent. You excel at:\n"
            "- Gathering and synthesizing information\n"
            "- Explaining complex concepts clearly\n"
            "- Comparing alternatives and making recommendations\n"
            "- Finding relevant documentation and examples\n\n"
            "Provide thorough, well-sourced information.",
            {TaskCapability::RESEARCH, TaskCapability::DOCUMENTATION},
            60,
            "delegate_to_researcher"
        },
        {
            AgentRole::VISION,
            "vision",
            "Vision",
            "You are the Vision agent. You excel at:\n"
            "- Analyzing images and screenshots\n"
            "- Describing visual content accurately\n"
            "- Identifying UI elements and layouts\n"
            "- Extracting text and data from images\n\n"
            "Be detailed and precise in visual descriptions.",
            {TaskCapability::IMAGE_ANALYSIS},
            40,
            "delegate_to_vision"
        }
    };
    return table;
}

} // namespace

const RoleProfile& AgentCapabilityUtils::profile(AgentRole role) {
    for (const auto& entry : roleTable()) {
        if (entry.role == role) {
            return entry;
        }
    }
    throw std::invalid_argument("Unknown AgentRole value");
}

const std::vector<AgentRole>& AgentCapabilityUtils::allRoles() {
    static const std::vector<AgentRole> roles = [] {
        std::vector<AgentRole> result;
        for (const auto& entry : roleTable()) {
            result.push_back(entry.role);
        }
        return result;
    }();
    return roles;
}

std::string AgentCapabilityUtils::roleToString(AgentRole role) {
    return profile(role).id;
}

AgentRole AgentCapabilityUtils::stringToRole(const std::string& str) {
    for (const auto& entry : roleTable()) {
        if (entry.id == str) {
            return entry.role;
        }
    }
    throw std::invalid_argument("Unknown role: " + str);
}

bool AgentCapabilityUtils::roleForDelegateTool(const std::string& tool_name, AgentRole& role) {
    for (const auto& entry : roleTable()) {
        if (!entry.delegate_tool.empty() && entry.delegate_tool == tool_name) {
            role = entry.role;
            return true;
        }
    }
    return false;
}

std::string AgentCapabilityUtils::capabilityToString(TaskCapability capability) {
    switch (capability) {
        case TaskCapability::CODE_GENERATION:
            return "codeGeneration";
        case TaskCapability::CODE_REVIEW:
            return "codeReview";
        case TaskCapability::DEBUGGING:
            return "debugging";
        case TaskCapability::RESEARCH:
            return "research";
        case TaskCapability::DOCUMENTATION:
            return "documentation";
        case TaskCapability::IMAGE_ANALYSIS:
            return "imageAnalysis";
        case TaskCapability::PLANNING:
            return "planning";
        case TaskCapability::SYNTHESIS:
            return "synthesis";
        default:
            throw std::invalid_argument("Unknown TaskCapability value");
    }
}

TaskCapability AgentCapabilityUtils::stringToCapability(const std::string& str) {
    static const std::unordered_map<std::string, TaskCapability> capability_map = {
        {"codeGeneration", TaskCapability::CODE_GENERATION},
        {"codeReview", TaskCapability::CODE_REVIEW},
        {"debugging", TaskCapability::DEBUGGING},
        {"research", TaskCapability::RESEARCH},
        {"documentation", TaskCapability::DOCUMENTATION},
        {"imageAnalysis", TaskCapability::IMAGE_ANALYSIS},
        {"planning", TaskCapability::PLANNING},
        {"synthesis", TaskCapability::SYNTHESIS}
    };

    auto it = capability_map.find(str);
    if (it != capability_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown capability string: " + str);
}

std::vector<TaskCapability> AgentCapabilityUtils::getAllCapabilities() {
    return {
        TaskCapability::CODE_GENERATION,
        TaskCapability::CODE_REVIEW,
        TaskCapability::DEBUGGING,
        TaskCapability::RESEARCH,
        TaskCapability::DOCUMENTATION,
        TaskCapability::IMAGE_ANALYSIS,
        TaskCapability::PLANNING,
        TaskCapability::SYNTHESIS
    };
}

std::vector<std::string> AgentCapabilityUtils::capabilitiesToStrings(const CapabilitySet& capabilities) {
    std::vector<std::string> result;
    result.reserve(capabilities.size());

    for (const auto& capability : capabilities) {
        result.push_back(capabilityToString(capability));
    }

    return result;
}

} // namespace Tandem
