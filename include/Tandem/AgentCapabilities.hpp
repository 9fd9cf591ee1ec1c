// =================================================================
// include/Tandem/AgentCapabilities.hpp
// =================================================================
// Agent roles, task capabilities and the role dispatch table.

#pragma once

#include <string>
#include <vector>
#include <set>

namespace Tandem {

/**
 * @brief Specialist roles an agent can fill
 */
enum class AgentRole {
    ORCHESTRATOR,   ///< Plans, delegates and synthesizes
    CODER,          ///< Writes, reviews and debugs code
    RESEARCHER,     ///< Gathers and explains information
    VISION          ///< Analyzes images and screenshots
};

/**
 * @brief Kinds of work a task may require
 */
enum class TaskCapability {
    CODE_GENERATION,
    CODE_REVIEW,
    DEBUGGING,
    RESEARCH,
    DOCUMENTATION,
    IMAGE_ANALYSIS,
    PLANNING,
    SYNTHESIS
};

using CapabilitySet = std::set<TaskCapability>;

/**
 * @brief Static description of a role
 *
 * One entry per role in a closed table; adding a role means adding an
 * enum value and a table row.
 */
struct RoleProfile {
    AgentRole role;
    std::string id;                       ///< Stable identifier ("coder")
    std::string display_name;             ///< Human-readable name ("Coder")
    std::string system_prompt;            ///< Prompt prepended to every invocation
    CapabilitySet capabilities;           ///< Capabilities the role covers
    int priority = 0;                     ///< Tie-breaker when matching tasks
    std::string delegate_tool;            ///< Tool name used to delegate to the role, empty if none
};

/**
 * @brief Utility functions for roles and capabilities
 */
class AgentCapabilityUtils {
public:
    /**
     * @brief Look up the profile for a role
     */
    static const RoleProfile& profile(AgentRole role);

    /**
     * @brief All roles in table order
     */
    static const std::vector<AgentRole>& allRoles();

    static std::string roleToString(AgentRole role);

    /**
     * @brief Convert a role id to the enum
     * @return AgentRole or throws std::invalid_argument if unknown
     */
    static AgentRole stringToRole(const std::string& str);

    /**
     * @brief Find the role whose delegation tool has the given name
     * @param tool_name Tool name such as "delegate_to_coder"
     * @param role Receives the role when found
     * @return True when a role owns the tool
     */
    static bool roleForDelegateTool(const std::string& tool_name, AgentRole& role);

    static std::string capabilityToString(TaskCapability capability);

    /**
     * @brief Convert string to capability enum
     * @return TaskCapability or throws std::invalid_argument if invalid
     */
    static TaskCapability stringToCapability(const std::string& str);

    static std::vector<TaskCapability> getAllCapabilities();

    /**
     * @brief Get capabilities as string list for logging/display
     */
    static std::vector<std::string> capabilitiesToStrings(const CapabilitySet& capabilities);
};

} // namespace Tandem
