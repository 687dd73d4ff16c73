// =================================================================
// include/Quorum/OllamaInteraction.hpp
// =================================================================
// Client for the Ollama HTTP API.

#pragma once

#include "Quorum/LlmInteraction.hpp"
#include <chrono>

namespace Quorum {

class OllamaInteraction : public LlmInteraction {
public:
    /**
     * @brief Constructs the Ollama client.
     * @param base_url The base URL of the Ollama server (e.g., http://localhost:11434).
     * @param model_name The default model (e.g., llama3.1:8b).
     */
    OllamaInteraction(const std::string& base_url, const std::string& model_name);

    GenerationResponse generate(const GenerationRequest& request,
                                std::chrono::milliseconds timeout) override;
    bool healthCheck(std::chrono::milliseconds timeout) override;
    std::vector<std::string> listModels(std::chrono::milliseconds timeout) override;
    std::string getModelName() const override;
    std::string getBaseUrl() const override;

    /**
     * @brief Build the /api/generate request body
     * @param request Generation request
     * @param default_model Model used when the request names none
     * @return JSON body
     */
    static nlohmann::json buildRequestBody(const GenerationRequest& request, const std::string& default_model);

    /**
     * @brief Map an /api/generate reply to a response
     * @param body Raw response body
     * @return Parsed response
     * @throws ProcessingError if the body is not a JSON object
     */
    static GenerationResponse parseResponseBody(const std::string& body);

private:
    std::string m_base_url;
    std::string m_model_name;
};

} // namespace Quorum
