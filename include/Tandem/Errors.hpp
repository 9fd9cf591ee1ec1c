// =================================================================
// include/Tandem/Errors.hpp
// =================================================================
// Exception types raised by the orchestration engine.

#pragma once

#include <stdexcept>
#include <string>

namespace Tandem {

/**
 * @brief Base class for all engine errors
 */
class TandemError : public std::runtime_error {
public:
    explicit TandemError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid or unfittable model configuration
 *
 * Raised before any execution starts; nothing has been mutated when it
 * is thrown.
 */
class ConfigurationError : public TandemError {
public:
    explicit ConfigurationError(const std::string& message) : TandemError(message) {}
};

/**
 * @brief Failure categories reported by the inference runtime
 */
enum class InvocationErrorKind {
    NETWORK_ERROR,      ///< Runtime unreachable or timed out
    MODEL_UNAVAILABLE,  ///< Requested model is not installed or failed to load
    MALFORMED_RESPONSE  ///< Runtime answered with something unparseable
};

/**
 * @brief A model invocation failed
 */
class ModelInvocationError : public TandemError {
public:
    ModelInvocationError(InvocationErrorKind kind, const std::string& message)
        : TandemError(message), m_kind(kind) {}

    InvocationErrorKind kind() const { return m_kind; }

    static std::string kindToString(InvocationErrorKind kind) {
        switch (kind) {
            case InvocationErrorKind::NETWORK_ERROR: return "network_error";
            case InvocationErrorKind::MODEL_UNAVAILABLE: return "model_unavailable";
            case InvocationErrorKind::MALFORMED_RESPONSE: return "malformed_response";
        }
        return "unknown";
    }

private:
    InvocationErrorKind m_kind;
};

/**
 * @brief A tool call failed; recoverable inside the agent loop
 */
class ToolExecutionError : public TandemError {
public:
    ToolExecutionError(const std::string& tool_name, const std::string& message)
        : TandemError(tool_name + ": " + message), m_tool_name(tool_name) {}

    const std::string& toolName() const { return m_tool_name; }

private:
    std::string m_tool_name;
};

/**
 * @brief An orchestration step could not be completed
 */
class TaskExecutionError : public TandemError {
public:
    TaskExecutionError(const std::string& agent_id, const std::string& message)
        : TandemError(message), m_agent_id(agent_id) {}

    const std::string& agentId() const { return m_agent_id; }

private:
    std::string m_agent_id;
};

} // namespace Tandem
