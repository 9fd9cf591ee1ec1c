// =================================================================
// include/Tandem/OllamaInvoker.hpp
// =================================================================
// ModelInvoker backed by an Ollama server.

#pragma once

#include "Tandem/Errors.hpp"
#include "Tandem/ModelInvoker.hpp"
#include "Tandem/ModelTierManager.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace Tandem {

struct OllamaConfig {
    std::string server_url = "http://localhost:11434";
    int connection_timeout_seconds = 30;
    int read_timeout_seconds = 300;     ///< Generation can be slow on large tiers
};

/**
 * @brief Talks to Ollama's /api/generate endpoint
 *
 * Model tags come from the tier manager's active configuration and the
 * runtime options from its memory settings, so configuration changes
 * apply to the next invocation.
 */
class OllamaInvoker : public ModelInvoker {
public:
    /**
     * @brief Construct the client
     * @param tier_manager Source of model tags and memory settings
     * @param config Server address and timeouts
     */
    OllamaInvoker(const ModelTierManager& tier_manager, const OllamaConfig& config = OllamaConfig());

    std::string invoke(AgentRole role, const std::string& prompt, const std::string& context) override;

    void warmUp(AgentRole role) override;

    /**
     * @brief Check that the server answers
     * @return True if /api/tags responds with 200
     */
    bool performHealthCheck();

    /**
     * @brief Tags of the models installed on the server
     *
     * Throws ModelInvocationError when the server cannot be queried.
     */
    std::vector<std::string> listInstalledModels();

    /**
     * @brief Extract the generated text from a /api/generate body
     *
     * Throws ModelInvocationError(MALFORMED_RESPONSE) when the body is not
     * JSON or has no "response" string, and MODEL_UNAVAILABLE when the
     * body carries an "error" field.
     */
    static std::string parseGenerateResponse(const std::string& body);

    /**
     * @brief Extract model tags from a /api/tags body
     */
    static std::vector<std::string> parseTagsResponse(const std::string& body);

    /**
     * @brief Map a failed HTTP status to an error kind
     */
    static InvocationErrorKind classifyHttpFailure(int status, const std::string& body);

    const std::string& getServerUrl() const { return m_config.server_url; }

    size_t getInvocationCount() const { return m_invocation_count.load(); }

private:
    const ModelTierManager& m_tier_manager;
    OllamaConfig m_config;
    std::atomic<size_t> m_invocation_count{0};

    std::string post(const std::string& endpoint, const std::string& payload) const;
};

} // namespace Tandem
