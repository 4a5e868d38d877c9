// =================================================================
// src/OpenBerl/TaskTypes.cpp
// =================================================================
// Task type names and conversions.

#include "OpenBerl/TaskTypes.hpp"
#include <stdexcept>
#include <unordered_map>

namespace OpenBerl {

std::string taskTypeToString(TaskType task_type) {
    switch (task_type) {
        case TaskType::CODE_GENERATION:
            return "code_generation";
        case TaskType::CODE_OPTIMIZATION:
            return "code_optimization";
        case TaskType::CODE_DEPLOYMENT:
            return "code_deployment";
        case TaskType::TEXT_GENERATION:
            return "text_generation";
        case TaskType::IMAGE_GENERATION:
            return "image_generation";
        case TaskType::ANALYSIS:
            return "analysis";
        default:
            throw std::invalid_argument("Unknown TaskType value");
    }
}

TaskType stringToTaskType(const std::string& str) {
    static const std::unordered_map<std::string, TaskType> task_type_map = {
        {"code_generation", TaskType::CODE_GENERATION},
        {"code_optimization", TaskType::CODE_OPTIMIZATION},
        {"code_deployment", TaskType::CODE_DEPLOYMENT},
        {"text_generation", TaskType::TEXT_GENERATION},
        {"image_generation", TaskType::IMAGE_GENERATION},
        {"analysis", TaskType::ANALYSIS}
    };

    auto it = task_type_map.find(str);
    if (it != task_type_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown task type: " + str);
}

bool isKnownTaskType(const std::string& str) {
    for (const auto& task_type : getAllTaskTypes()) {
        if (taskTypeToString(task_type) == str) {
            return true;
        }
    }
    return false;
}

std::vector<TaskType> getAllTaskTypes() {
    return {
        TaskType::CODE_GENERATION,
        TaskType::CODE_OPTIMIZATION,
        TaskType::CODE_DEPLOYMENT,
        TaskType::TEXT_GENERATION,
        TaskType::IMAGE_GENERATION,
        TaskType::ANALYSIS
    };
}

std::string taskTypesToString(const std::vector<TaskType>& task_types) {
    std::string joined;
    for (size_t i = 0; i < task_types.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += taskTypeToString(task_types[i]);
    }
    return joined;
}

} // namespace OpenBerl
