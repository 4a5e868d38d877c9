// =================================================================
// include/OpenBerl/AdapterRegistry.hpp
// =================================================================
// Capability index mapping task types to registered adapters.

#pragma once

#include "OpenBerl/Adapter.hpp"
#include "OpenBerl/TaskTypes.hpp"
#include <memory>
#include <vector>
#include <map>
#include <mutex>

namespace OpenBerl {

/**
 * @brief Append-only index from task type to adapters
 *
 * Adapters are kept per task type in registration order. Registering the same
 * adapter twice is a no-op.
 */
class AdapterRegistry {
public:
    AdapterRegistry() = default;
    virtual ~AdapterRegistry() = default;

    /**
     * @brief Index an adapter under each of its capabilities
     * @param adapter Adapter to register
     * @throws std::invalid_argument if adapter is null
     */
    virtual void registerAdapter(std::shared_ptr<Adapter> adapter);

    /**
     * @brief Adapters registered for a task type, in registration order
     * @return Copy of the list; empty when nothing serves the task type
     */
    virtual std::vector<std::shared_ptr<Adapter>> getAdapters(TaskType task_type) const;

    /**
     * @brief Task types with at least one adapter
     */
    std::vector<TaskType> getRegisteredTaskTypes() const;

    /**
     * @brief Distinct adapters in first-registration order
     */
    std::vector<std::shared_ptr<Adapter>> getAllAdapters() const;

    /**
     * @brief Number of task types with at least one adapter
     */
    size_t size() const;

    /**
     * @brief Number of distinct adapters registered
     */
    size_t getAdapterCount() const;

private:
    std::map<TaskType, std::vector<std::shared_ptr<Adapter>>> m_adapters;
    std::vector<std::shared_ptr<Adapter>> m_registration_order;
    mutable std::mutex m_mutex;
};

} // namespace OpenBerl
