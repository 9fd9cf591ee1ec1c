// =================================================================
// src/Tandem/OllamaInvoker.cpp
// =================================================================
// Implementation of the Ollama inference adapter.

#include "Tandem/OllamaInvoker.hpp"
#include "Tandem/Errors.hpp"
#include "Tandem/Logger.hpp"
#include "Tandem/TextUtils.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <chrono>

namespace Tandem {

namespace {

/**
 * @brief Serialize a request body
 *
 * Prompts carry file contents and command output, so invalid UTF-8 is
 * replaced with U+FFFD instead of failing the request.
 */
std::string serializeRequest(const nlohmann::json& body) {
    try {
        return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        throw ModelInvocationError(InvocationErrorKind::MALFORMED_RESPONSE,
            "Cannot encode request: " + std::string(e.what()));
    }
}

} // namespace

OllamaInvoker::OllamaInvoker(const ModelTierManager& tier_manager, const OllamaConfig& config)
    : m_tier_manager(tier_manager), m_config(config) {
    Logger::getInstance().info("OllamaInvoker", "Configured Ollama client", m_config.server_url);
}

std::string OllamaInvoker::invoke(AgentRole role, const std::string& prompt, const std::string& context) {
    auto start_time = std::chrono::steady_clock::now();

    ModelVariant variant = m_tier_manager.getActiveVariant(role);
    MemorySettings settings = m_tier_manager.getMemorySettings();

    std::string full_prompt = context.empty() ? prompt : context + "\n\n" + prompt;

    nlohmann::json request_body = {
        {"model", variant.tag},
        {"system", AgentCapabilityUtils::profile(role).system_prompt},
        {"prompt", full_prompt},
        {"stream", false},
        {"keep_alive", settings.keep_alive},
        {"options", {
            {"num_ctx", settings.context_window},
            {"num_predict", settings.max_tokens},
            {"num_gpu", settings.num_gpu},
            {"num_thread", settings.num_thread}
        }}
    };

    std::string output;
    try {
        output = parseGenerateResponse(post("/api/generate", serializeRequest(request_body)));
    } catch (const ModelInvocationError&) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        Logger::getInstance().logModelInvocation(AgentCapabilityUtils::roleToString(role),
            full_prompt.size(), 0, duration, false);
        throw;
    }

    m_invocation_count++;
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    Logger::getInstance().logModelInvocation(AgentCapabilityUtils::roleToString(role),
        full_prompt.size(), output.size(), duration, true);

    return output;
}

void OllamaInvoker::warmUp(AgentRole role) {
    ModelVariant variant = m_tier_manager.getActiveVariant(role);
    MemorySettings settings = m_tier_manager.getMemorySettings();

    // An empty prompt makes the server load the model without generating
    nlohmann::json request_body = {
        {"model", variant.tag},
        {"prompt", ""},
        {"stream", false},
        {"keep_alive", settings.keep_alive}
    };

    post("/api/generate", serializeRequest(request_body));
    Logger::getInstance().debug("OllamaInvoker", "Model loaded", variant.tag);
}

bool OllamaInvoker::performHealthCheck() {
    httplib::Client client(m_config.server_url.c_str());
    client.set_connection_timeout(10);

    auto res = client.Get("/api/tags");
    if (!res) {
        Logger::getInstance().warning("OllamaInvoker", "Cannot connect to Ollama server", m_config.server_url);
        return false;
    }
    if (res->status != 200) {
        Logger::getInstance().warning("OllamaInvoker", "Health check failed",
            "HTTP " + std::to_string(res->status));
        return false;
    }
    return true;
}

std::vector<std::string> OllamaInvoker::listInstalledModels() {
    httplib::Client client(m_config.server_url.c_str());
    client.set_connection_timeout(m_config.connection_timeout_seconds);

    auto res = client.Get("/api/tags");
    if (!res) {
        throw ModelInvocationError(InvocationErrorKind::NETWORK_ERROR,
            "Failed to connect to Ollama server at " + m_config.server_url);
    }
    if (res->status != 200) {
        throw ModelInvocationError(classifyHttpFailure(res->status, res->body),
            "Ollama server returned status " + std::to_string(res->status));
    }
    return parseTagsResponse(res->body);
}

std::string OllamaInvoker::parseGenerateResponse(const std::string& body) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ModelInvocationError(InvocationErrorKind::MALFORMED_RESPONSE,
            "Response is not valid JSON: " + std::string(e.what()));
    }

    if (!parsed.is_object()) {
        throw ModelInvocationError(InvocationErrorKind::MALFORMED_RESPONSE, "Response is not a JSON object");
    }
    if (parsed.contains("error") && parsed["error"].is_string()) {
        throw ModelInvocationError(InvocationErrorKind::MODEL_UNAVAILABLE,
            parsed["error"].get<std::string>());
    }
    if (!parsed.contains("response") || !parsed["response"].is_string()) {
        throw ModelInvocationError(InvocationErrorKind::MALFORMED_RESPONSE,
            "Response has no \"response\" text");
    }

    return parsed["response"].get<std::string>();
}

std::vector<std::string> OllamaInvoker::parseTagsResponse(const std::string& body) {
    std::vector<std::string> tags;
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ModelInvocationError(InvocationErrorKind::MALFORMED_RESPONSE,
            "Tag list is not valid JSON: " + std::string(e.what()));
    }

    if (!parsed.contains("models") || !parsed["models"].is_array()) {
        return tags;
    }
    for (const auto& model : parsed["models"]) {
        if (model.contains("name") && model["name"].is_string()) {
            tags.push_back(model["name"].get<std::string>());
        }
    }
    return tags;
}

InvocationErrorKind OllamaInvoker::classifyHttpFailure(int status, const std::string& body) {
    std::string lower = TextUtils::toLower(body);
    if (status == 404) {
        return InvocationErrorKind::MODEL_UNAVAILABLE;
    }
    if (lower.find("not found") != std::string::npos ||
        lower.find("failed to load") != std::string::npos ||
        lower.find("pull") != std::string::npos) {
        return InvocationErrorKind::MODEL_UNAVAILABLE;
    }
    return InvocationErrorKind::NETWORK_ERROR;
}

std::string OllamaInvoker::post(const std::string& endpoint, const std::string& payload) const {
    httplib::Client client(m_config.server_url.c_str());
    client.set_connection_timeout(m_config.connection_timeout_seconds);
    client.set_read_timeout(m_config.read_timeout_seconds);

    auto res = client.Post(endpoint.c_str(), payload, "application/json");
    if (!res) {
        throw ModelInvocationError(InvocationErrorKind::NETWORK_ERROR,
            "Failed to connect to Ollama server at " + m_config.server_url +
            " (" + httplib::to_string(res.error()) + ")");
    }

    if (res->status != 200) {
        throw ModelInvocationError(classifyHttpFailure(res->status, res->body),
            "Ollama server returned status " + std::to_string(res->status) + ": " + res->body);
    }

    return res->body;
}

} // namespace Tandem
