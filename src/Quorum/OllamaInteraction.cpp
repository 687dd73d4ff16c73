// =================================================================
// src/Quorum/OllamaInteraction.cpp
// =================================================================
// Ollama API interaction over cpp-httplib.

#include "Quorum/OllamaInteraction.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/Logger.hpp"
#include "httplib.h"
#include <stdexcept>

namespace Quorum {

namespace {

long long readInteger(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_number()) {
        return 0;
    }
    return it->get<long long>();
}

// Connect and read deadlines share the caller's timeout
void applyTimeouts(httplib::Client& client, std::chrono::milliseconds timeout) {
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
}

} // namespace

OllamaInteraction::OllamaInteraction(const std::string& base_url, const std::string& model_name)
    : m_base_url(base_url), m_model_name(model_name) {
    Logger::getInstance().debug("Ollama", "Configured client for " + base_url, "Model: " + model_name);
}

GenerationResponse OllamaInteraction::generate(const GenerationRequest& request,
                                               std::chrono::milliseconds timeout) {
    httplib::Client client(m_base_url);
    applyTimeouts(client, timeout);

    nlohmann::json request_body = buildRequestBody(request, m_model_name);
    httplib::Headers headers = {{"Accept", "application/json"}};

    auto start_time = std::chrono::steady_clock::now();
    auto res = client.Post("/api/generate", headers, request_body.dump(), "application/json");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (!res) {
        std::string reason = httplib::to_string(res.error());
        if (elapsed >= timeout) {
            throw TimeoutError("Ollama request to " + m_base_url + " timed out after " +
                               std::to_string(elapsed.count()) + "ms");
        }
        throw NetworkError("Failed to connect to Ollama server at " + m_base_url + ": " + reason);
    }

    if (res->status != 200) {
        throw AiServiceError("Ollama server returned error status: " +
                             std::to_string(res->status) + " - " + res->body, res->status);
    }

    GenerationResponse response = parseResponseBody(res->body);
    response.response_time = elapsed;
    return response;
}

bool OllamaInteraction::healthCheck(std::chrono::milliseconds timeout) {
    httplib::Client client(m_base_url);
    applyTimeouts(client, timeout);

    auto res = client.Get("/api/version");
    if (!res) {
        Logger::getInstance().debug("Ollama", "Health probe failed for " + m_base_url,
                                    httplib::to_string(res.error()));
        return false;
    }
    return res->status == 200;
}

std::vector<std::string> OllamaInteraction::listModels(std::chrono::milliseconds timeout) {
    httplib::Client client(m_base_url);
    applyTimeouts(client, timeout);

    auto res = client.Get("/api/tags");
    if (!res) {
        throw NetworkError("Failed to list models on " + m_base_url + ": " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw AiServiceError("Ollama server returned error status: " + std::to_string(res->status), res->status);
    }

    std::vector<std::string> models;
    try {
        auto body = nlohmann::json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& model : body["models"]) {
                if (model.contains("name") && model["name"].is_string()) {
                    models.push_back(model["name"].get<std::string>());
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProcessingError("Malformed model list from " + m_base_url + ": " + e.what());
    }
    return models;
}

std::string OllamaInteraction::getModelName() const {
    return m_model_name;
}

std::string OllamaInteraction::getBaseUrl() const {
    return m_base_url;
}

nlohmann::json OllamaInteraction::buildRequestBody(const GenerationRequest& request,
                                                   const std::string& default_model) {
    nlohmann::json body = {
        {"model", request.model.empty() ? default_model : request.model},
        {"prompt", request.prompt},
        {"stream", false}
    };

    if (!request.system.empty()) {
        body["system"] = request.system;
    }
    if (!request.format_hint.empty()) {
        body["format"] = request.format_hint;
    }
    if (request.options.is_object() && !request.options.empty()) {
        body["options"] = request.options;
    }
    return body;
}

GenerationResponse OllamaInteraction::parseResponseBody(const std::string& body) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw ProcessingError("Malformed Ollama response: " + std::string(e.what()));
    }

    if (!parsed.is_object()) {
        throw ProcessingError("Unexpected Ollama response, expected a JSON object");
    }

    GenerationResponse response;
    try {
        response.content = parsed.value("response", "");
        response.model = parsed.value("model", "");
        response.done = parsed.value("done", false);
    } catch (const nlohmann::json::exception& e) {
        throw ProcessingError("Unexpected field type in Ollama response: " + std::string(e.what()));
    }
    response.total_duration = readInteger(parsed, "total_duration");
    response.load_duration = readInteger(parsed, "load_duration");
    response.prompt_eval_count = readInteger(parsed, "prompt_eval_count");
    response.prompt_eval_duration = readInteger(parsed, "prompt_eval_duration");
    response.eval_count = readInteger(parsed, "eval_count");
    response.eval_duration = readInteger(parsed, "eval_duration");

    if (parsed.contains("context") && parsed["context"].is_array()) {
        for (const auto& token : parsed["context"]) {
            if (token.is_number_integer()) {
                response.context.push_back(token.get<long long>());
            }
        }
    }
    return response;
}

} // namespace Quorum
