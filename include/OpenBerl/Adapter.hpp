// =================================================================
// include/OpenBerl/Adapter.hpp
// =================================================================
// Abstract contract every AI backend adapter implements.

#pragma once

#include "OpenBerl/TaskTypes.hpp"
#include "OpenBerl/UmfMessage.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace OpenBerl {

/**
 * @brief Abstract interface for AI backend adapters
 *
 * An adapter translates between the Universal Message Format and one backend's
 * native API. The translate functions are pure; execute() performs the backend
 * call and never throws: failures come back as error-flagged responses.
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    /**
     * @brief Get the adapter's name (used in logs, routing tables and model_info)
     */
    virtual std::string getAdapterName() const = 0;

    /**
     * @brief Task types this adapter can serve
     */
    virtual std::vector<TaskType> getCapabilities() const = 0;

    /**
     * @brief Convert a request into the backend's native request body
     * @throws ValidationError if the request context is malformed
     */
    virtual nlohmann::json translateRequest(const UmfRequest& request) const = 0;

    /**
     * @brief Convert a native backend response into a response envelope
     * @param native_response Body returned by the backend
     * @param request The originating request
     */
    virtual UmfResponse translateResponse(const nlohmann::json& native_response,
                                          const UmfRequest& request) const = 0;

    /**
     * @brief Execute a request against the backend
     * @return Response envelope; error-flagged on failure
     */
    virtual UmfResponse execute(const UmfRequest& request) = 0;

    /**
     * @brief Check whether the backend is reachable
     */
    virtual bool healthCheck() { return true; }

    /**
     * @brief Number of execute() calls so far, used for load balancing
     */
    virtual size_t getRequestCount() const = 0;

    bool supports(TaskType task_type) const {
        auto capabilities = getCapabilities();
        return std::find(capabilities.begin(), capabilities.end(), task_type) != capabilities.end();
    }
};

} // namespace OpenBerl
