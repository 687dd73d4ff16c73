// =================================================================
// tests/MockLlmInteraction.hpp
// =================================================================
// Scriptable LLM client and client factory shared by the unit tests.

#pragma once

#include "Quorum/ConnectionManager.hpp"
#include "Quorum/LlmInteraction.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace QuorumTest {

/**
 * @brief LLM client whose replies, latency and health are set by the test
 *
 * The responder receives every request and returns the reply text or
 * throws. It also tracks how many calls overlap in time.
 */
class MockLlmInteraction : public Quorum::LlmInteraction {
public:
    using Responder = std::function<std::string(const Quorum::GenerationRequest&)>;

    MockLlmInteraction(const std::string& model_name, const std::string& base_url)
        : m_model_name(model_name), m_base_url(base_url),
          m_responder([](const Quorum::GenerationRequest&) { return std::string("{}"); }) {}

    Quorum::GenerationResponse generate(const Quorum::GenerationRequest& request,
                                        std::chrono::milliseconds timeout) override {
        (void)timeout;
        m_calls++;

        size_t active = ++m_active;
        size_t observed = m_max_active.load();
        while (active > observed && !m_max_active.compare_exchange_weak(observed, active)) {
        }

        struct ActiveGuard {
            std::atomic<size_t>& counter;
            ~ActiveGuard() { --counter; }
        } guard{m_active};

        auto started = std::chrono::steady_clock::now();
        if (m_delay.count() > 0) {
            std::this_thread::sleep_for(m_delay);
        }

        Responder responder;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            responder = m_responder;
            m_last_request = request;
        }

        Quorum::GenerationResponse response;
        response.content = responder(request);
        response.model = request.model.empty() ? m_model_name : request.model;
        response.done = true;
        response.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return response;
    }

    bool healthCheck(std::chrono::milliseconds timeout) override {
        (void)timeout;
        m_health_checks++;
        if (m_health_delay.count() > 0) {
            std::this_thread::sleep_for(m_health_delay);
        }
        return m_healthy.load();
    }

    std::string getModelName() const override { return m_model_name; }
    std::string getBaseUrl() const override { return m_base_url; }

    void setResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_responder = std::move(responder);
    }

    void setResponse(const std::string& content) {
        setResponder([content](const Quorum::GenerationRequest&) { return content; });
    }

    void setDelay(std::chrono::milliseconds delay) { m_delay = delay; }
    void setHealthy(bool healthy) { m_healthy = healthy; }
    void setHealthDelay(std::chrono::milliseconds delay) { m_health_delay = delay; }

    size_t getCallCount() const { return m_calls.load(); }
    size_t getHealthCheckCount() const { return m_health_checks.load(); }
    size_t getMaxConcurrentCalls() const { return m_max_active.load(); }

    Quorum::GenerationRequest getLastRequest() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_request;
    }

private:
    std::string m_model_name;
    std::string m_base_url;
    Responder m_responder;
    Quorum::GenerationRequest m_last_request;
    mutable std::mutex m_mutex;

    std::chrono::milliseconds m_delay{0};
    std::chrono::milliseconds m_health_delay{0};
    std::atomic<bool> m_healthy{true};
    std::atomic<size_t> m_calls{0};
    std::atomic<size_t> m_health_checks{0};
    std::atomic<size_t> m_active{0};
    std::atomic<size_t> m_max_active{0};
};

/**
 * @brief Hands out one MockLlmInteraction per endpoint id
 *
 * The factory keeps the mocks so a test can script an endpoint after
 * registering it.
 */
class MockClientRegistry {
public:
    Quorum::ClientFactory factory() {
        return [this](const Quorum::EndpointConfig& config) -> std::shared_ptr<Quorum::LlmInteraction> {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto& mock = m_clients[config.endpoint_id];
            if (!mock) {
                mock = std::make_shared<MockLlmInteraction>(config.model_name, config.base_url);
            }
            return mock;
        };
    }

    std::shared_ptr<MockLlmInteraction> get(const std::string& endpoint_id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& mock = m_clients[endpoint_id];
        if (!mock) {
            mock = std::make_shared<MockLlmInteraction>("mock-model", "http://" + endpoint_id);
        }
        return mock;
    }

private:
    std::map<std::string, std::shared_ptr<MockLlmInteraction>> m_clients;
    std::mutex m_mutex;
};

/**
 * @brief Endpoint configuration with short test timeouts
 */
inline Quorum::EndpointConfig makeEndpointConfig(const std::string& id, int priority = 5,
                                                 size_t max_concurrent = 5) {
    Quorum::EndpointConfig config;
    config.endpoint_id = id;
    config.base_url = "http://" + id + ":11434";
    config.model_name = "mock-model";
    config.priority = priority;
    config.max_concurrent = max_concurrent;
    config.timeout = std::chrono::milliseconds(2000);
    return config;
}

} // namespace QuorumTest
