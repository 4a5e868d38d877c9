// =================================================================
// include/OpenBerl/CodeOptimizerAdapter.hpp
// =================================================================
// Local reference adapter for code optimization.

#pragma once

#include "OpenBerl/AdapterRuntime.hpp"

namespace OpenBerl {

/**
 * @brief Reference adapter serving CODE_OPTIMIZATION without any backend
 *
 * The payload is HTML-escaped and wrapped in an optimization report. Calls are
 * free and never touch the network.
 */
class CodeOptimizerAdapter : public AdapterRuntime {
public:
    explicit CodeOptimizerAdapter(const AdapterConfig& config = AdapterConfig(),
                                  const std::string& name = "mock-optimizer");

    nlohmann::json translateRequest(const UmfRequest& request) const override;
    UmfResponse translateResponse(const nlohmann::json& native_response,
                                  const UmfRequest& request) const override;

    /**
     * @brief Escape &, < and > (ampersand first, so entities are not double-escaped)
     */
    static std::string escapeCode(const std::string& code);

    /**
     * @brief Wrap escaped code in the optimization report
     */
    static std::string buildReport(const std::string& escaped_code);

protected:
    std::vector<TaskType> defaultCapabilities() const override;
    UmfResponse executeRequest(const UmfRequest& request, const AttemptOptions& options) override;
};

} // namespace OpenBerl
