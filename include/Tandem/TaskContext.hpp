// =================================================================
// include/Tandem/TaskContext.hpp
// =================================================================
// Task input context and per-step results.

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace Tandem {

/**
 * @brief Working context handed to every step of a run
 *
 * Pipeline runs append each step's output to previous_results.
 */
struct TaskContext {
    std::string working_directory;
    std::map<std::string, std::string> files;   ///< Relative path -> content
    std::vector<std::string> previous_results;

    /**
     * @brief Render files and previous results as prompt context
     * @param max_chars Truncate the rendering at this many characters
     */
    std::string render(size_t max_chars = 32000) const;

    std::vector<std::string> filePaths() const;
};

/**
 * @brief Outcome of one completed step
 */
struct TaskResult {
    std::string output;
    std::string agent_id;
    std::string input;                  ///< Prompt the agent received
    double execution_time = 0.0;        ///< Seconds spent in the step, switch excluded
    double model_switch_time = 0.0;     ///< Seconds spent loading the model, 0 when warm
    size_t tokens_used = 0;             ///< Estimated output tokens
    int attempts = 1;                   ///< Invocations needed, retries included
    bool verified = false;              ///< Output passed the policy's review
    std::chrono::system_clock::time_point completed_at = std::chrono::system_clock::now();
};

/**
 * @brief Rough token estimate used throughout the engine (4 chars per token)
 */
inline size_t estimateTokens(const std::string& text) {
    return text.size() / 4;
}

} // namespace Tandem
