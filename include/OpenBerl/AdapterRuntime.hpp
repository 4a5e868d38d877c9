// =================================================================
// include/OpenBerl/AdapterRuntime.hpp
// =================================================================
// Shared adapter runtime: credentials, counters and the resilience wrapper.

#pragma once

#include "OpenBerl/Adapter.hpp"
#include "OpenBerl/RateLimiter.hpp"
#include "OpenBerl/CircuitBreaker.hpp"
#include "OpenBerl/ResponseCache.hpp"
#include "OpenBerl/RetryExecutor.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <unordered_map>

namespace OpenBerl {

/**
 * @brief Settings shared by all adapters built on AdapterRuntime
 */
struct AdapterConfig {
    std::string base_url;                       ///< Backend endpoint, adapter-specific default when empty
    std::string model;                          ///< Primary backend model, adapter-specific default when empty
    std::string fallback_model;                 ///< Model used after the primary exhausts its retries
    bool enable_caching = true;                 ///< Serve repeated requests from the response cache
    size_t max_cache_size = 1000;               ///< Cache capacity
    size_t rate_limit = 0;                      ///< Requests per window, 0 means unlimited
    std::chrono::milliseconds rate_window{60000}; ///< Rate limit window
    CircuitBreakerConfig circuit_breaker;       ///< Breaker thresholds
    std::vector<TaskType> capabilities;         ///< Overrides the adapter's own capabilities when non-empty
    std::unordered_map<std::string, std::string> custom_attributes; ///< Adapter-specific settings
};

/**
 * @brief Base class implementing execute() on top of a protected backend call
 *
 * execute() counts the request, then applies in order: circuit breaker, rate
 * limiter, context validation, response cache, and the retry loop around
 * executeRequest(). Any failure is recorded on the breaker and returned as an
 * error response.
 */
class AdapterRuntime : public Adapter {
public:
    /**
     * @param model_name Adapter name
     * @param api_key Backend credential, may be empty for local adapters
     * @param config Shared adapter settings
     * @throws ValidationError if the API key is malformed
     */
    AdapterRuntime(const std::string& model_name,
                   const std::string& api_key,
                   const AdapterConfig& config = AdapterConfig());

    std::string getAdapterName() const override;
    std::vector<TaskType> getCapabilities() const override;
    UmfResponse execute(const UmfRequest& request) override;
    size_t getRequestCount() const override;

    size_t getErrorCount() const;
    const AdapterConfig& getConfig() const;

    bool isCircuitOpen() const;

    /**
     * @brief Close the circuit breaker after the backend has recovered
     */
    void resetCircuit();

    ResponseCache& getResponseCache();
    RateLimiter& getRateLimiter();

    /**
     * @brief Replace the sleeper used between retries
     */
    void setRetrySleeper(RetryExecutor::Sleeper sleeper);

    /**
     * @brief Reject malformed credentials
     *
     * A non-empty key other than "demo-key" or "test-key" must be at least
     * 10 characters long once surrounding whitespace is removed.
     * @throws ValidationError("Invalid API key format for <model_name>")
     */
    static void validateApiKey(const std::string& model_name, const std::string& api_key);

protected:
    /**
     * @brief Task types served when the configuration does not override them
     */
    virtual std::vector<TaskType> defaultCapabilities() const = 0;

    /**
     * @brief Perform one backend attempt
     * @throws AdapterError classified for the retry loop
     */
    virtual UmfResponse executeRequest(const UmfRequest& request, const AttemptOptions& options) = 0;

    /**
     * @brief Whether a fallback attempt is possible once retries are exhausted
     */
    virtual bool hasFallbackFor(const UmfRequest& request) const;

    const std::string& getApiKey() const { return m_api_key; }

    std::string m_model_name;
    AdapterConfig m_config;

private:
    std::string m_api_key;
    std::atomic<size_t> m_request_count{0};
    std::atomic<size_t> m_error_count{0};

    RateLimiter m_rate_limiter;
    CircuitBreaker m_circuit_breaker;
    ResponseCache m_cache;
    RetryExecutor m_retry_executor;

    UmfResponse fail(const UmfRequest& request, const std::string& message);
};

} // namespace OpenBerl
