// =================================================================
// src/OpenBerl/AdapterSelector.cpp
// =================================================================
// Implementation of least-loaded adapter selection.

#include "OpenBerl/AdapterSelector.hpp"
#include "OpenBerl/Errors.hpp"
#include "OpenBerl/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace OpenBerl {

AdapterSelector::AdapterSelector(const AdapterRegistry& registry, const SelectorConfig& config)
    : m_registry(registry), m_config(config) {}

std::shared_ptr<Adapter> AdapterSelector::select(const std::string& task_type) const {
    bool blank = std::all_of(task_type.begin(), task_type.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        throw ConfigurationError("Invalid task type: '" + task_type + "'");
    }

    if (!isKnownTaskType(task_type)) {
        throw RoutingError("No adapter found for task type: " + task_type);
    }

    return select(stringToTaskType(task_type));
}

std::shared_ptr<Adapter> AdapterSelector::select(TaskType task_type) const {
    auto candidates = m_registry.getAdapters(task_type);
    if (candidates.empty()) {
        throw RoutingError("No adapter found for task type: " + taskTypeToString(task_type));
    }

    std::vector<std::shared_ptr<Adapter>> authorized;
    for (const auto& adapter : candidates) {
        if (isAuthorized(adapter, task_type)) {
            authorized.push_back(adapter);
        }
    }

    if (authorized.empty()) {
        throw RoutingError("No authorized adapter found for task type: " + taskTypeToString(task_type));
    }

    // First minimum wins, so ties resolve to registration order
    auto selected = std::min_element(authorized.begin(), authorized.end(),
        [](const std::shared_ptr<Adapter>& a, const std::shared_ptr<Adapter>& b) {
            return a->getRequestCount() < b->getRequestCount();
        });

    Logger::getInstance().debug("AdapterSelector",
        "Selected " + (*selected)->getAdapterName() + " for " + taskTypeToString(task_type),
        "Requests so far: " + std::to_string((*selected)->getRequestCount()) +
        ", Candidates: " + std::to_string(authorized.size()));

    return *selected;
}

bool AdapterSelector::isAuthorized(const std::shared_ptr<Adapter>& adapter, TaskType task_type) const {
    try {
        if (!adapter->supports(task_type)) {
            return false;
        }
    } catch (const std::exception& e) {
        Logger::getInstance().warning("AdapterSelector",
            "Capability query failed for " + adapter->getAdapterName(), e.what());
        return false;
    }

    if (m_config.check_health) {
        try {
            if (!adapter->healthCheck()) {
                Logger::getInstance().warning("AdapterSelector",
                    "Skipping unhealthy adapter " + adapter->getAdapterName());
                return false;
            }
        } catch (const std::exception& e) {
            Logger::getInstance().warning("AdapterSelector",
                "Health check failed for " + adapter->getAdapterName(), e.what());
            return false;
        }
    }

    return true;
}

} // namespace OpenBerl
