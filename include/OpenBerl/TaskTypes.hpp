// =================================================================
// include/OpenBerl/TaskTypes.hpp
// =================================================================
// Closed set of task types used for capability routing.

#pragma once

#include <string>
#include <vector>

namespace OpenBerl {

/**
 * @brief Task types an adapter can declare and a pipeline step can request
 *
 * The set is closed: adding a task type means adding an enumerator here and
 * its wire name in TaskTypes.cpp.
 */
enum class TaskType {
    CODE_GENERATION,    ///< Produce new code from a description
    CODE_OPTIMIZATION,  ///< Improve existing code
    CODE_DEPLOYMENT,    ///< Package or deploy code
    TEXT_GENERATION,    ///< Free-form text
    IMAGE_GENERATION,   ///< Image synthesis
    ANALYSIS            ///< Analysis and reporting
};

/**
 * @brief Convert a task type to its wire name (e.g. "code_generation")
 */
std::string taskTypeToString(TaskType task_type);

/**
 * @brief Convert a wire name to a task type
 * @throws std::invalid_argument if the name is not a known task type
 */
TaskType stringToTaskType(const std::string& str);

/**
 * @brief Check whether a string names a known task type
 */
bool isKnownTaskType(const std::string& str);

/**
 * @brief All task types in declaration order
 */
std::vector<TaskType> getAllTaskTypes();

/**
 * @brief Join task type names for logging/display
 */
std::string taskTypesToString(const std::vector<TaskType>& task_types);

} // namespace OpenBerl
