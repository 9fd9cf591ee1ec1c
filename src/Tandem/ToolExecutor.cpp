// =================================================================
// src/Tandem/ToolExecutor.cpp
// =================================================================
// Implementation of the default agent tools.

#include "Tandem/ToolExecutor.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/Logger.hpp"
#include "Tandem/SysInteraction.hpp"
#include "Tandem/TextUtils.hpp"
#include "nlohmann/json.hpp"
#include <sstream>
#include <stdexcept>

namespace Tandem {

DefaultToolExecutor::DefaultToolExecutor(const std::string& working_dir, ModelInvoker& invoker,
                                         const ToolExecutorConfig& config)
    : m_scanner(working_dir), m_invoker(invoker), m_config(config) {
    registerDefaultTools();
}

std::string DefaultToolExecutor::execute(const std::string& name, const std::string& input_json) {
    auto it = m_tools.find(name);
    if (it == m_tools.end()) {
        throw ToolExecutionError(name, "Unknown tool");
    }

    ToolArguments args = parseArguments(name, input_json);
    Logger::getInstance().debug("ToolExecutor", "Executing tool: " + name, input_json);

    try {
        return it->second.handler(args);
    } catch (const ToolExecutionError&) {
        throw;
    } catch (const std::invalid_argument& e) {
        throw ToolExecutionError(name, e.what());
    } catch (const std::runtime_error& e) {
        throw ToolExecutionError(name, e.what());
    }
}

std::vector<ToolDescription> DefaultToolExecutor::describeTools() const {
    std::vector<ToolDescription> descriptions;
    for (const auto& entry : m_tools) {
        descriptions.push_back(entry.second.description);
    }
    return descriptions;
}

void DefaultToolExecutor::registerTool(const ToolDescription& description, ToolHandler handler) {
    m_tools[description.name] = {description, std::move(handler)};
}

bool DefaultToolExecutor::hasTool(const std::string& name) const {
    return m_tools.count(name) > 0;
}

ToolArguments DefaultToolExecutor::parseArguments(const std::string& tool_name, const std::string& input_json) {
    ToolArguments args;
    if (input_json.empty()) {
        return args;
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(input_json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ToolExecutionError(tool_name, "Arguments are not valid JSON: " + std::string(e.what()));
    }

    if (parsed.is_null()) {
        return args;
    }
    if (!parsed.is_object()) {
        throw ToolExecutionError(tool_name, "Arguments must be a JSON object");
    }

    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        args[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return args;
}

void DefaultToolExecutor::registerDefaultTools() {
    registerTool({"read_file", "Read a file in the working directory", {"path"}},
        [this](const ToolArguments& args) { return readFile(args); });
    registerTool({"write_file", "Create or overwrite a file in the working directory", {"path", "content"}},
        [this](const ToolArguments& args) { return writeFile(args); });
    registerTool({"list_directory", "List a directory in the working directory", {"path?"}},
        [this](const ToolArguments& args) { return listDirectory(args); });
    registerTool({"run_shell", "Run a shell command in the working directory", {"command"}},
        [this](const ToolArguments& args) { return runShell(args); });
    registerTool({"search_codebase", "Find lines containing text in the working directory", {"query"}},
        [this](const ToolArguments& args) { return searchCodebase(args); });
    registerTool({"take_screenshot", "Capture the screen for the vision agent", {}},
        [this](const ToolArguments& args) { return takeScreenshot(args); });

    for (AgentRole role : AgentCapabilityUtils::allRoles()) {
        const RoleProfile& profile = AgentCapabilityUtils::profile(role);
        if (profile.delegate_tool.empty()) {
            continue;
        }
        std::string tool_name = profile.delegate_tool;
        registerTool({tool_name, "Hand a subtask to the " + profile.display_name + " agent", {"task", "context?"}},
            [this, role, tool_name](const ToolArguments& args) { return delegate(role, tool_name, args); });
    }
}

std::string DefaultToolExecutor::readFile(const ToolArguments& args) {
    const std::string& path = requireArgument("read_file", args, "path");

    std::filesystem::path resolved;
    if (!m_scanner.resolveInside(path, resolved)) {
        throw ToolExecutionError("read_file", "Path escapes the working directory: " + path);
    }
    if (!SysInteraction::fileExists(resolved.string())) {
        throw ToolExecutionError("read_file", "File not found: " + path);
    }

    std::string content = SysInteraction::readFile(resolved.string());
    if (content.size() > m_config.max_read_bytes) {
        content = TextUtils::truncateUtf8(content, m_config.max_read_bytes) + "\n[truncated]";
    }
    return TextUtils::sanitizeUtf8(content);
}

std::string DefaultToolExecutor::writeFile(const ToolArguments& args) {
    const std::string& path = requireArgument("write_file", args, "path");
    auto content_it = args.find("content");
    if (content_it == args.end()) {
        throw ToolExecutionError("write_file", "Missing argument: content");
    }

    std::filesystem::path resolved;
    if (!m_scanner.resolveInside(path, resolved)) {
        throw ToolExecutionError("write_file", "Path escapes the working directory: " + path);
    }
    if (!SysInteraction::writeFile(resolved.string(), content_it->second)) {
        throw ToolExecutionError("write_file", "Failed to write " + path);
    }

    Logger::getInstance().info("ToolExecutor", "File written", path);
    return "Wrote " + std::to_string(content_it->second.size()) + " bytes to " + path;
}

std::string DefaultToolExecutor::listDirectory(const ToolArguments& args) {
    auto it = args.find("path");
    std::string path = it == args.end() ? "" : it->second;

    std::ostringstream out;
    for (const auto& entry : m_scanner.listDirectory(path)) {
        out << entry << "\n";
    }
    std::string listing = out.str();
    return listing.empty() ? "(empty directory)" : listing;
}

std::string DefaultToolExecutor::runShell(const ToolArguments& args) {
    const std::string& command = requireArgument("run_shell", args, "command");
    if (!m_config.allow_shell) {
        throw ToolExecutionError("run_shell", "Shell commands are disabled");
    }

    Logger::getInstance().info("ToolExecutor", "Running shell command", command);
    auto [output, exit_code] = SysInteraction::executeShell(command, m_scanner.getRootPath(),
                                                            m_config.max_shell_output);

    std::ostringstream result;
    result << "exit code: " << exit_code << "\n" << TextUtils::sanitizeUtf8(output);
    return result.str();
}

std::string DefaultToolExecutor::searchCodebase(const ToolArguments& args) {
    const std::string& query = requireArgument("search_codebase", args, "query");

    auto matches = m_scanner.search(query, m_config.max_search_matches);
    if (matches.empty()) {
        return "No matches for \"" + query + "\"";
    }

    std::ostringstream out;
    for (const auto& match : matches) {
        out << match << "\n";
    }
    return out.str();
}

std::string DefaultToolExecutor::takeScreenshot(const ToolArguments&) {
    throw ToolExecutionError("take_screenshot", "Screen capture is not available in this environment");
}

std::string DefaultToolExecutor::delegate(AgentRole role, const std::string& tool_name, const ToolArguments& args) {
    const std::string& task = requireArgument(tool_name, args, "task");
    auto context_it = args.find("context");
    std::string context = context_it == args.end() ? "" : context_it->second;

    try {
        return m_invoker.invoke(role, task, context);
    } catch (const ModelInvocationError& e) {
        throw ToolExecutionError(tool_name, std::string("Delegation failed: ") + e.what());
    } catch (const ConfigurationError& e) {
        throw ToolExecutionError(tool_name, e.what());
    }
}

const std::string& DefaultToolExecutor::requireArgument(const std::string& tool_name, const ToolArguments& args,
                                                        const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || it->second.empty()) {
        throw ToolExecutionError(tool_name, "Missing argument: " + key);
    }
    return it->second;
}

} // namespace Tandem
