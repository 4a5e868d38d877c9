// =================================================================
// src/OpenBerl/AdapterRuntime.cpp
// =================================================================
// Implementation of the shared adapter runtime.

#include "OpenBerl/AdapterRuntime.hpp"
#include "OpenBerl/Errors.hpp"
#include "OpenBerl/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace OpenBerl {

namespace {

std::string trim(const std::string& str) {
    auto begin = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

AdapterRuntime::AdapterRuntime(const std::string& model_name,
                               const std::string& api_key,
                               const AdapterConfig& config)
    : m_model_name(model_name),
      m_config(config),
      m_api_key(api_key),
      m_rate_limiter(config.rate_limit, config.rate_window),
      m_circuit_breaker(config.circuit_breaker),
      m_cache(config.max_cache_size) {
    validateApiKey(model_name, api_key);
}

std::string AdapterRuntime::getAdapterName() const {
    return m_model_name;
}

std::vector<TaskType> AdapterRuntime::getCapabilities() const {
    if (!m_config.capabilities.empty()) {
        return m_config.capabilities;
    }
    return defaultCapabilities();
}

UmfResponse AdapterRuntime::execute(const UmfRequest& request) {
    auto start_time = std::chrono::steady_clock::now();

    m_request_count++;
    m_circuit_breaker.recordRequest();

    if (m_circuit_breaker.isOpen()) {
        LOG_WARNING(m_model_name, "Circuit breaker open, rejecting request " + request.request_id);
        return UmfResponse::makeError(request, "Error: Circuit breaker open for " + m_model_name);
    }

    if (!m_rate_limiter.tryAcquire()) {
        LOG_WARNING(m_model_name, "Rate limit exceeded, rejecting request " + request.request_id);
        return UmfResponse::makeError(request, "Error: Rate limit exceeded for " + m_model_name);
    }

    try {
        validateContext(request);
    } catch (const ValidationError& e) {
        return fail(request, e.what());
    }

    std::string cache_key;
    if (m_config.enable_caching) {
        cache_key = ResponseCache::makeKey(request);
        auto cached = m_cache.get(cache_key);
        if (cached) {
            LOG_INFO(m_model_name, "Cache hit for request " + request.request_id);
            UmfResponse response = *cached;
            response.request_id = request.request_id;
            response.metadata["cache_hit"] = true;
            return response;
        }
    }

    try {
        UmfResponse response = m_retry_executor.run(
            request.retry_policy,
            hasFallbackFor(request),
            [this, &request](const AttemptOptions& options) {
                return executeRequest(request, options);
            },
            m_model_name);

        if (response.execution_time.count() == 0) {
            response.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
        }

        if (m_config.enable_caching && !response.isError()) {
            m_cache.put(cache_key, response);
        }
        return response;
    } catch (const std::exception& e) {
        return fail(request, e.what());
    }
}

size_t AdapterRuntime::getRequestCount() const {
    return m_request_count.load();
}

size_t AdapterRuntime::getErrorCount() const {
    return m_error_count.load();
}

const AdapterConfig& AdapterRuntime::getConfig() const {
    return m_config;
}

bool AdapterRuntime::isCircuitOpen() const {
    return m_circuit_breaker.isOpen();
}

void AdapterRuntime::resetCircuit() {
    m_circuit_breaker.reset();
    LOG_INFO(m_model_name, "Circuit breaker reset");
}

ResponseCache& AdapterRuntime::getResponseCache() {
    return m_cache;
}

RateLimiter& AdapterRuntime::getRateLimiter() {
    return m_rate_limiter;
}

void AdapterRuntime::setRetrySleeper(RetryExecutor::Sleeper sleeper) {
    m_retry_executor.setSleeper(std::move(sleeper));
}

void AdapterRuntime::validateApiKey(const std::string& model_name, const std::string& api_key) {
    if (api_key.empty() || api_key == "demo-key" || api_key == "test-key") {
        return;
    }

    if (trim(api_key).length() < 10) {
        throw ValidationError("Invalid API key format for " + model_name);
    }
}

bool AdapterRuntime::hasFallbackFor(const UmfRequest&) const {
    return false;
}

UmfResponse AdapterRuntime::fail(const UmfRequest& request, const std::string& message) {
    m_error_count++;
    m_circuit_breaker.recordFailure();
    if (m_circuit_breaker.isOpen()) {
        LOG_ERROR(m_model_name, "Circuit breaker opened after repeated failures");
    }

    Logger::getInstance().error(m_model_name, "Request " + request.request_id + " failed", message);
    return UmfResponse::makeError(request, "Error: " + message);
}

} // namespace OpenBerl
