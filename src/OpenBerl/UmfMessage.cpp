// =================================================================
// src/OpenBerl/UmfMessage.cpp
// =================================================================
// Implementation of envelope helpers.

#include "OpenBerl/UmfMessage.hpp"
#include "OpenBerl/Errors.hpp"
#include <cstdint>
#include <random>
#include <sstream>
#include <iomanip>
#include <mutex>

namespace OpenBerl {

UmfRequest::UmfRequest()
    : request_id(generateRequestId()), timestamp(std::chrono::steady_clock::now()) {}

UmfRequest::UmfRequest(TaskType type, nlohmann::json request_payload)
    : task_type(type), payload(std::move(request_payload)),
      request_id(generateRequestId()), timestamp(std::chrono::steady_clock::now()) {}

UmfResponse UmfResponse::makeError(const UmfRequest& request, const std::string& message) {
    UmfResponse response;
    response.task_type = request.task_type;
    response.result = message;
    response.request_id = request.request_id;
    response.cost_info.error = true;
    response.cost_info.estimated_cost = 0.0;
    response.cost_info.error_message = message;
    response.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - request.timestamp);
    return response;
}

std::string generateRequestId() {
    static std::mutex generator_mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        high = dis(gen);
        low = dis(gen);
    }

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (high >> 32) << '-'
       << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (high & 0xFFFF) << '-'
       << std::setw(4) << (low >> 48) << '-'
       << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

void validateContext(const UmfRequest& request) {
    for (const auto& entry : request.context) {
        if (entry.is_object() && entry.contains("role") && entry.contains("content")) {
            continue;
        }
        throw ValidationError("Invalid context format: " + entry.dump());
    }
}

std::string payloadToString(const nlohmann::json& payload) {
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    if (payload.is_null()) {
        return "";
    }
    return payload.dump();
}

nlohmann::json makeContextEntry(const std::string& role, const std::string& content) {
    return {{"role", role}, {"content", content}};
}

} // namespace OpenBerl
