// =================================================================
// include/Tandem/ModelInvoker.hpp
// =================================================================
// Abstraction over the local inference runtime.

#pragma once

#include "Tandem/AgentCapabilities.hpp"
#include <string>

namespace Tandem {

/**
 * @brief Sole entry point for running a role's model
 *
 * Implementations throw ModelInvocationError with the failure kind.
 */
class ModelInvoker {
public:
    virtual ~ModelInvoker() = default;

    /**
     * @brief Run the model serving a role
     * @param role Role to invoke; its system prompt is applied
     * @param prompt Task prompt
     * @param context Additional context placed before the prompt, may be empty
     * @return Generated text
     */
    virtual std::string invoke(AgentRole role, const std::string& prompt, const std::string& context) = 0;

    /**
     * @brief Load the role's model into memory ahead of use
     *
     * Throws ModelInvocationError when the model cannot be loaded.
     */
    virtual void warmUp(AgentRole role) = 0;
};

} // namespace Tandem
