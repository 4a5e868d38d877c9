// =================================================================
// include/OpenBerl/CostLedger.hpp
// =================================================================
// Per-pipeline cost and timing accumulator.

#pragma once

#include <string>
#include <vector>
#include <utility>
#include <chrono>
#include <mutex>

namespace OpenBerl {

/**
 * @brief Snapshot of the ledger plus derived figures
 */
struct CostAnalysis {
    double total_cost = 0.0;                                   ///< Sum of every recorded cost
    std::vector<std::pair<std::string, double>> cost_by_step;  ///< Accumulated cost per step, first-seen order
    size_t execution_count = 0;                                ///< Completed pipeline executions
    double average_cost_per_execution = 0.0;                   ///< total_cost / execution_count
    std::vector<std::pair<std::string, std::chrono::milliseconds>> step_timings; ///< Last duration per step
    std::string highest_cost_step;                             ///< Empty when no step has a positive cost
    std::vector<std::string> suggestions;                      ///< Cost optimization hints

    /**
     * @brief Accumulated cost of one step, 0.0 if never recorded
     */
    double getStepCost(const std::string& step_name) const;
};

/**
 * @brief Thread-safe cost ledger owned by one pipeline
 *
 * Step costs accumulate across executions so the total always equals the sum
 * of the per-step entries.
 */
class CostLedger {
public:
    CostLedger() = default;

    /**
     * @brief Add a step's cost and record its duration
     */
    void recordStep(const std::string& step_name, double cost, std::chrono::milliseconds duration);

    /**
     * @brief Count one completed pipeline execution
     */
    void recordExecution();

    double getTotalCost() const;
    size_t getExecutionCount() const;

    /**
     * @brief Build the cost analysis from the current ledger contents
     */
    CostAnalysis analyze() const;

    /**
     * @brief Clear all recorded costs, timings and executions
     */
    void reset();

private:
    double m_total_cost = 0.0;
    std::vector<std::pair<std::string, double>> m_cost_by_step;
    std::vector<std::pair<std::string, std::chrono::milliseconds>> m_step_timings;
    size_t m_execution_count = 0;
    mutable std::mutex m_mutex;
};

} // namespace OpenBerl
