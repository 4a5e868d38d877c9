// =================================================================
// src/OpenBerl/AdapterRegistry.cpp
// =================================================================
// Implementation of the adapter capability index.

#include "OpenBerl/AdapterRegistry.hpp"
#include "OpenBerl/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace OpenBerl {

void AdapterRegistry::registerAdapter(std::shared_ptr<Adapter> adapter) {
    if (!adapter) {
        throw std::invalid_argument("Cannot register a null adapter");
    }

    auto capabilities = adapter->getCapabilities();

    std::lock_guard<std::mutex> lock(m_mutex);

    bool added = false;
    for (const auto& task_type : capabilities) {
        auto& adapters = m_adapters[task_type];
        if (std::find(adapters.begin(), adapters.end(), adapter) == adapters.end()) {
            adapters.push_back(adapter);
            added = true;
        }
    }

    if (std::find(m_registration_order.begin(), m_registration_order.end(), adapter) ==
        m_registration_order.end()) {
        m_registration_order.push_back(adapter);
    }

    if (added) {
        Logger::getInstance().info("AdapterRegistry",
            "Registered adapter " + adapter->getAdapterName(),
            "Capabilities: " + taskTypesToString(capabilities));
    } else {
        Logger::getInstance().debug("AdapterRegistry",
            "Adapter already registered: " + adapter->getAdapterName());
    }
}

std::vector<std::shared_ptr<Adapter>> AdapterRegistry::getAdapters(TaskType task_type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_adapters.find(task_type);
    if (it == m_adapters.end()) {
        return {};
    }
    return it->second;
}

std::vector<TaskType> AdapterRegistry::getRegisteredTaskTypes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TaskType> task_types;
    for (const auto& [task_type, adapters] : m_adapters) {
        if (!adapters.empty()) {
            task_types.push_back(task_type);
        }
    }
    return task_types;
}

std::vector<std::shared_ptr<Adapter>> AdapterRegistry::getAllAdapters() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registration_order;
}

size_t AdapterRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_adapters.size();
}

size_t AdapterRegistry::getAdapterCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_registration_order.size();
}

} // namespace OpenBerl
