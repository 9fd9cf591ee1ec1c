// =================================================================
// include/Tandem/ToolExecutor.hpp
// =================================================================
// Named tools the autonomous agent can call.

#pragma once

#include "Tandem/ModelInvoker.hpp"
#include "Tandem/WorkspaceScanner.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace Tandem {

/**
 * @brief Tool arguments by name; non-string JSON values are serialized
 */
using ToolArguments = std::map<std::string, std::string>;

struct ToolDescription {
    std::string name;
    std::string description;
    std::vector<std::string> parameters;   ///< Argument names, optional ones end with '?'
};

/**
 * @brief Dispatches tool calls by name
 *
 * Implementations throw ToolExecutionError on failure; callers feed the
 * error back to the agent instead of aborting.
 */
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;

    /**
     * @brief Run a tool
     * @param name Tool name
     * @param input_json JSON object with the tool arguments
     * @return Tool output shown to the agent
     */
    virtual std::string execute(const std::string& name, const std::string& input_json) = 0;

    virtual std::vector<ToolDescription> describeTools() const = 0;
};

struct ToolExecutorConfig {
    bool allow_shell = true;
    size_t max_read_bytes = 64 * 1024;      ///< read_file truncates beyond this
    size_t max_shell_output = 16 * 1024;
    size_t max_search_matches = 50;
};

/**
 * @brief File, shell, search and delegation tools for one working directory
 *
 * Every path argument is resolved against the working directory and
 * rejected when it escapes it.
 */
class DefaultToolExecutor : public ToolExecutor {
public:
    using ToolHandler = std::function<std::string(const ToolArguments&)>;

    /**
     * @brief Construct the executor
     * @param working_dir Sandbox root
     * @param invoker Used by the delegate_to_* tools
     * @param config Limits
     */
    DefaultToolExecutor(const std::string& working_dir, ModelInvoker& invoker,
                        const ToolExecutorConfig& config = ToolExecutorConfig());

    std::string execute(const std::string& name, const std::string& input_json) override;

    std::vector<ToolDescription> describeTools() const override;

    /**
     * @brief Add or replace a tool
     */
    void registerTool(const ToolDescription& description, ToolHandler handler);

    bool hasTool(const std::string& name) const;

    /**
     * @brief Parse a JSON object into tool arguments
     *
     * Throws ToolExecutionError when the input is not a JSON object. An
     * empty input yields no arguments.
     */
    static ToolArguments parseArguments(const std::string& tool_name, const std::string& input_json);

private:
    struct RegisteredTool {
        ToolDescription description;
        ToolHandler handler;
    };

    WorkspaceScanner m_scanner;
    ModelInvoker& m_invoker;
    ToolExecutorConfig m_config;
    std::map<std::string, RegisteredTool> m_tools;

    void registerDefaultTools();

    std::string readFile(const ToolArguments& args);
    std::string writeFile(const ToolArguments& args);
    std::string listDirectory(const ToolArguments& args);
    std::string runShell(const ToolArguments& args);
    std::string searchCodebase(const ToolArguments& args);
    std::string takeScreenshot(const ToolArguments& args);
    std::string delegate(AgentRole role, const std::string& tool_name, const ToolArguments& args);

    static const std::string& requireArgument(const std::string& tool_name, const ToolArguments& args,
                                              const std::string& key);
};

} // namespace Tandem
