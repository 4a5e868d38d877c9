// =================================================================
// include/OpenBerl/AdapterSelector.hpp
// =================================================================
// Least-loaded adapter selection over the capability index.

#pragma once

#include "OpenBerl/AdapterRegistry.hpp"
#include <memory>
#include <string>

namespace OpenBerl {

/**
 * @brief Selector configuration
 */
struct SelectorConfig {
    bool check_health = true;   ///< Skip adapters whose healthCheck() fails
};

/**
 * @brief Picks the adapter that should serve a task type
 *
 * Candidates are the adapters registered for the task type that still declare
 * the capability (and pass their health check when enabled). The one with the
 * fewest requests so far wins; ties go to the earliest registered.
 */
class AdapterSelector {
public:
    explicit AdapterSelector(const AdapterRegistry& registry,
                             const SelectorConfig& config = SelectorConfig());

    /**
     * @brief Select an adapter for a task type given by name
     * @throws ConfigurationError if the name is empty or blank
     * @throws RoutingError if no adapter is registered, or none is authorized
     */
    std::shared_ptr<Adapter> select(const std::string& task_type) const;

    /**
     * @brief Select an adapter for a task type
     * @throws RoutingError if no adapter is registered, or none is authorized
     */
    std::shared_ptr<Adapter> select(TaskType task_type) const;

    const SelectorConfig& getConfig() const { return m_config; }

private:
    const AdapterRegistry& m_registry;
    SelectorConfig m_config;

    /**
     * @brief Check whether an adapter may serve a task type right now
     */
    bool isAuthorized(const std::shared_ptr<Adapter>& adapter, TaskType task_type) const;
};

} // namespace OpenBerl
