// =================================================================
// include/OpenBerl/OpenAiAdapter.hpp
// =================================================================
// Adapter for OpenAI-compatible chat completion servers.

#pragma once

#include "OpenBerl/AdapterRuntime.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <utility>

namespace OpenBerl {

/**
 * @brief Per-token prices used to compute response cost
 */
struct OpenAiPricing {
    double input_per_token = 0.00003;    ///< Prompt token price
    double output_per_token = 0.00006;   ///< Completion token price
};

/**
 * @brief Chat completions adapter (OpenAI API or any compatible server)
 *
 * Serves code generation, text generation and analysis. Simple requests go to
 * the fallback model; complex or high-priority ones to the primary model,
 * which falls back to the cheaper model once its retries are exhausted.
 */
class OpenAiAdapter : public AdapterRuntime {
public:
    /**
     * @param api_key Bearer token for the server
     * @param config Adapter settings; base_url, model and fallback_model default to
     *        https://api.openai.com/v1, gpt-4 and gpt-3.5-turbo
     * @param name Adapter name
     * @throws ValidationError if the API key is malformed
     */
    explicit OpenAiAdapter(const std::string& api_key,
                           const AdapterConfig& config = AdapterConfig(),
                           const std::string& name = "gpt-4-enterprise");

    nlohmann::json translateRequest(const UmfRequest& request) const override;
    UmfResponse translateResponse(const nlohmann::json& native_response,
                                  const UmfRequest& request) const override;

    /**
     * @brief GET <base_url>/models; the result is cached for the health check interval
     */
    bool healthCheck() override;

    /**
     * @brief Pick the backend model for a request
     *
     * Complexity is the payload length plus 100 per context entry. The primary
     * model serves complexity above 1000, priority above 5, or metadata
     * "force_primary": true; everything else goes to the fallback model.
     */
    std::string selectModel(const UmfRequest& request) const;

    std::string getSystemPrompt(TaskType task_type) const;

    /**
     * @brief Wrap the payload in the task type's prompt template, if it has one
     */
    std::string buildPrompt(const std::string& payload, TaskType task_type) const;

    /**
     * @brief Heuristic confidence in [0, 1] for a completion
     */
    double calculateQualityScore(const std::string& content, const UmfRequest& request) const;

    /**
     * @brief Map an HTTP status to a retry classification
     */
    static ErrorKind classifyStatus(int status);

    /**
     * @brief Split "https://host:port/v1" into ("https://host:port", "/v1")
     */
    static std::pair<std::string, std::string> splitBaseUrl(const std::string& base_url);

    const std::string& getBaseUrl() const { return m_base_url; }
    const std::string& getPrimaryModel() const { return m_primary_model; }
    const std::string& getFallbackModel() const { return m_fallback_model; }
    const OpenAiPricing& getPricing() const { return m_pricing; }

protected:
    std::vector<TaskType> defaultCapabilities() const override;
    UmfResponse executeRequest(const UmfRequest& request, const AttemptOptions& options) override;
    bool hasFallbackFor(const UmfRequest& request) const override;

private:
    std::string m_base_url;
    std::string m_primary_model;
    std::string m_fallback_model;
    OpenAiPricing m_pricing;
    size_t m_max_context_tokens = 2000;

    std::chrono::seconds m_health_check_interval{30};
    std::chrono::steady_clock::time_point m_last_health_check;
    bool m_health_checked = false;
    bool m_is_healthy = false;
    std::mutex m_health_mutex;

    /**
     * @brief Select context entries newest-first within the token budget, returned oldest-first
     */
    std::vector<nlohmann::json> selectContext(const UmfRequest& request) const;
};

} // namespace OpenBerl
