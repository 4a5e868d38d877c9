// =================================================================
// src/OpenBerl/CostLedger.cpp
// =================================================================
// Implementation of the cost ledger and cost analysis.

#include "OpenBerl/CostLedger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace OpenBerl {

double CostAnalysis::getStepCost(const std::string& step_name) const {
    for (const auto& [name, cost] : cost_by_step) {
        if (name == step_name) {
            return cost;
        }
    }
    return 0.0;
}

void CostLedger::recordStep(const std::string& step_name, double cost, std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_total_cost += cost;

    auto cost_it = std::find_if(m_cost_by_step.begin(), m_cost_by_step.end(),
        [&step_name](const std::pair<std::string, double>& entry) { return entry.first == step_name; });
    if (cost_it != m_cost_by_step.end()) {
        cost_it->second += cost;
    } else {
        m_cost_by_step.emplace_back(step_name, cost);
    }

    auto timing_it = std::find_if(m_step_timings.begin(), m_step_timings.end(),
        [&step_name](const std::pair<std::string, std::chrono::milliseconds>& entry) {
            return entry.first == step_name;
        });
    if (timing_it != m_step_timings.end()) {
        timing_it->second = duration;
    } else {
        m_step_timings.emplace_back(step_name, duration);
    }
}

void CostLedger::recordExecution() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_execution_count++;
}

double CostLedger::getTotalCost() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total_cost;
}

size_t CostLedger::getExecutionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_execution_count;
}

CostAnalysis CostLedger::analyze() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    CostAnalysis analysis;
    analysis.total_cost = m_total_cost;
    analysis.cost_by_step = m_cost_by_step;
    analysis.step_timings = m_step_timings;
    analysis.execution_count = m_execution_count;
    analysis.average_cost_per_execution =
        m_execution_count > 0 ? m_total_cost / static_cast<double>(m_execution_count) : 0.0;

    auto highest = std::max_element(m_cost_by_step.begin(), m_cost_by_step.end(),
        [](const std::pair<std::string, double>& a, const std::pair<std::string, double>& b) {
            return a.second < b.second;
        });

    if (highest != m_cost_by_step.end() && highest->second > 0.0) {
        analysis.highest_cost_step = highest->first;

        if (m_cost_by_step.size() > 1) {
            std::ostringstream suggestion;
            suggestion << "Consider optimizing step '" << highest->first
                       << "' (cost: $" << std::fixed << std::setprecision(4) << highest->second << ")";
            analysis.suggestions.push_back(suggestion.str());
        }
    }

    return analysis;
}

void CostLedger::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_total_cost = 0.0;
    m_cost_by_step.clear();
    m_step_timings.clear();
    m_execution_count = 0;
}

} // namespace OpenBerl
