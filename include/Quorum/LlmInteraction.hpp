// =================================================================
// include/Quorum/LlmInteraction.hpp
// =================================================================
// Abstract interface for clients of an LLM inference service.

#pragma once

#include "nlohmann/json.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Quorum {

/**
 * @brief One generation request
 */
struct GenerationRequest {
    std::string prompt;                           ///< Full prompt text
    std::string model;                            ///< Model name, empty to use the endpoint's model
    std::string system;                           ///< Optional system prompt
    std::string format_hint;                      ///< Output format hint, e.g. "json"
    nlohmann::json options = nlohmann::json::object(); ///< Sampling options (temperature, top_p, ...)
};

/**
 * @brief Generation result with the service's timing fields
 */
struct GenerationResponse {
    std::string content;                          ///< Generated text
    std::string model;                            ///< Model that produced the text
    bool done = false;                            ///< Whether generation finished
    long long total_duration = 0;                 ///< Nanoseconds, as reported by the service
    long long load_duration = 0;
    long long prompt_eval_count = 0;
    long long prompt_eval_duration = 0;
    long long eval_count = 0;
    long long eval_duration = 0;
    std::vector<long long> context;               ///< Conversation context tokens
    std::chrono::milliseconds response_time{0};   ///< Wall-clock time measured by the client
};

/**
 * @brief Client of a single inference service endpoint
 *
 * Implementations raise Quorum errors: NetworkError for transport failures,
 * TimeoutError when the deadline elapses, AiServiceError for error statuses
 * and ProcessingError for malformed replies.
 */
class LlmInteraction {
public:
    virtual ~LlmInteraction() = default;

    /**
     * @brief Generate a completion
     * @param request Generation request
     * @param timeout Deadline for the whole call
     * @return Parsed response
     */
    virtual GenerationResponse generate(const GenerationRequest& request,
                                        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Probe service liveness
     * @param timeout Probe deadline
     * @return True if the service answered successfully
     */
    virtual bool healthCheck(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief List models available on the service
     * @param timeout Request deadline
     * @return Model names
     */
    virtual std::vector<std::string> listModels(std::chrono::milliseconds timeout) {
        (void)timeout;
        return {};
    }

    virtual std::string getModelName() const = 0;
    virtual std::string getBaseUrl() const = 0;
};

} // namespace Quorum
