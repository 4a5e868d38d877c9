// =================================================================
// include/OpenBerl/UmfMessage.hpp
// =================================================================
// Universal Message Format: request and response envelopes exchanged with adapters.

#pragma once

#include "OpenBerl/TaskTypes.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <chrono>

namespace OpenBerl {

/**
 * @brief Retry settings carried by a request and consumed by the adapter runtime
 */
struct RetryPolicy {
    size_t max_retries = 3;        ///< Retries after the first attempt
    double backoff_factor = 2.0;   ///< Wait is backoff_factor^attempt seconds
};

/**
 * @brief Request envelope sent to an adapter
 *
 * The request id is generated once at construction. Context entries must be
 * objects holding both "role" and "content"; adapters reject the whole request
 * otherwise (see validateContext).
 */
struct UmfRequest {
    TaskType task_type = TaskType::TEXT_GENERATION;  ///< Routing capability
    nlohmann::json payload;                          ///< Content forwarded to the backend
    std::string request_id;                          ///< Correlates the response
    std::vector<nlohmann::json> context;             ///< Conversation history entries
    nlohmann::json metadata = nlohmann::json::object(); ///< Step parameters and pipeline ids
    int priority = 0;                                ///< Higher means more important
    std::chrono::milliseconds timeout{300000};       ///< Bound on a single adapter call
    RetryPolicy retry_policy;                        ///< Transient failure handling
    std::chrono::steady_clock::time_point timestamp; ///< Creation time

    UmfRequest();
    UmfRequest(TaskType type, nlohmann::json request_payload);
};

/**
 * @brief Cost accounting attached to every response
 */
struct CostInfo {
    double estimated_cost = 0.0;   ///< Total cost of the call
    double input_cost = 0.0;       ///< Prompt token cost
    double output_cost = 0.0;      ///< Completion token cost
    bool error = false;            ///< Response wraps a failure
    std::string error_message;     ///< Failure description when error is set
};

/**
 * @brief Response envelope returned by an adapter
 */
struct UmfResponse {
    TaskType task_type = TaskType::TEXT_GENERATION;  ///< Echo of the request task type
    nlohmann::json result;                           ///< Becomes the next step's payload
    std::string request_id;                          ///< Id of the originating request
    CostInfo cost_info;
    std::chrono::milliseconds execution_time{0};
    nlohmann::json metadata = nlohmann::json::object();
    std::unordered_map<std::string, std::string> model_info;
    std::unordered_map<std::string, double> quality_metrics;

    /**
     * @brief Build an error-flagged response for a failed request
     * @param request The request that failed
     * @param message Human-readable failure, stored as the result
     */
    static UmfResponse makeError(const UmfRequest& request, const std::string& message);

    bool isError() const { return cost_info.error; }
};

/**
 * @brief Generate a random RFC 4122 version 4 UUID string
 */
std::string generateRequestId();

/**
 * @brief Validate all context entries of a request
 * @throws ValidationError naming the first entry lacking "role" or "content"
 */
void validateContext(const UmfRequest& request);

/**
 * @brief Render a payload as text: strings as-is, everything else as compact JSON
 */
std::string payloadToString(const nlohmann::json& payload);

/**
 * @brief Build a well-formed context entry
 */
nlohmann::json makeContextEntry(const std::string& role, const std::string& content);

} // namespace OpenBerl
