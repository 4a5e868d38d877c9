// =================================================================
// tests/CostLedgerTest.cpp
// =================================================================
// Unit tests for CostLedger component.

#include "OpenBerl/CostLedger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <vector>

namespace {

bool nearlyEqual(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

class CostLedgerTest {
public:
    void testEmptyLedger() {
        std::cout << "Testing empty ledger..." << std::endl;

        OpenBerl::CostLedger ledger;
        auto analysis = ledger.analyze();

        assert(analysis.total_cost == 0.0);
        assert(analysis.cost_by_step.empty());
        assert(analysis.execution_count == 0);
        assert(analysis.average_cost_per_execution == 0.0 && "No division by zero executions");
        assert(analysis.highest_cost_step.empty());
        assert(analysis.suggestions.empty());
        assert(analysis.getStepCost("anything") == 0.0);

        std::cout << "✓ Empty ledger test passed" << std::endl;
    }

    void testAccumulation() {
        std::cout << "Testing cost accumulation..." << std::endl;

        OpenBerl::CostLedger ledger;
        ledger.recordStep("generate", 0.02, std::chrono::milliseconds(120));
        ledger.recordStep("optimize", 0.0, std::chrono::milliseconds(5));
        ledger.recordExecution();
        ledger.recordStep("generate", 0.03, std::chrono::milliseconds(80));
        ledger.recordStep("optimize", 0.0, std::chrono::milliseconds(4));
        ledger.recordExecution();

        auto analysis = ledger.analyze();
        assert(nearlyEqual(analysis.total_cost, 0.05));
        assert(nearlyEqual(analysis.getStepCost("generate"), 0.05) && "Step costs accumulate across runs");
        assert(analysis.cost_by_step.size() == 2);
        assert(analysis.cost_by_step[0].first == "generate" && "Steps keep first-seen order");

        double sum = 0.0;
        for (const auto& [name, cost] : analysis.cost_by_step) {
            sum += cost;
        }
        assert(nearlyEqual(sum, analysis.total_cost) && "Total equals the sum of step costs");

        assert(analysis.execution_count == 2);
        assert(nearlyEqual(analysis.average_cost_per_execution, 0.025));
        assert(analysis.step_timings[0].second == std::chrono::milliseconds(80) && "Latest timing is kept");

        std::cout << "✓ Cost accumulation test passed" << std::endl;
    }

    void testSuggestions() {
        std::cout << "Testing optimization suggestions..." << std::endl;

        OpenBerl::CostLedger single;
        single.recordStep("only", 0.5, std::chrono::milliseconds(1));
        auto single_analysis = single.analyze();
        assert(single_analysis.highest_cost_step == "only");
        assert(single_analysis.suggestions.empty() && "No suggestion for a single-step pipeline");

        OpenBerl::CostLedger free;
        free.recordStep("a", 0.0, std::chrono::milliseconds(1));
        free.recordStep("b", 0.0, std::chrono::milliseconds(1));
        assert(free.analyze().highest_cost_step.empty() && "Free steps have no highest cost");
        assert(free.analyze().suggestions.empty());

        OpenBerl::CostLedger mixed;
        mixed.recordStep("draft", 0.001, std::chrono::milliseconds(1));
        mixed.recordStep("review", 0.0125, std::chrono::milliseconds(1));
        auto analysis = mixed.analyze();
        assert(analysis.highest_cost_step == "review");
        assert(analysis.suggestions.size() == 1);
        assert(analysis.suggestions[0] == "Consider optimizing step 'review' (cost: $0.0125)");

        std::cout << "✓ Optimization suggestions test passed" << std::endl;
    }

    void testConcurrentRecording() {
        std::cout << "Testing concurrent recording..." << std::endl;

        OpenBerl::CostLedger ledger;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&ledger, t]() {
                for (int i = 0; i < 250; ++i) {
                    ledger.recordStep("step" + std::to_string(t), 0.5, std::chrono::milliseconds(1));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        auto analysis = ledger.analyze();
        assert(nearlyEqual(analysis.total_cost, 500.0) && "No update is lost");
        assert(analysis.cost_by_step.size() == 4);
        for (const auto& [name, cost] : analysis.cost_by_step) {
            assert(nearlyEqual(cost, 125.0));
        }

        std::cout << "✓ Concurrent recording test passed" << std::endl;
    }

    void testReset() {
        std::cout << "Testing ledger reset..." << std::endl;

        OpenBerl::CostLedger ledger;
        ledger.recordStep("a", 1.0, std::chrono::milliseconds(1));
        ledger.recordExecution();
        ledger.reset();

        assert(ledger.getTotalCost() == 0.0);
        assert(ledger.getExecutionCount() == 0);
        assert(ledger.analyze().cost_by_step.empty());
        assert(ledger.analyze().step_timings.empty());

        std::cout << "✓ Ledger reset test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== Running CostLedger Tests ===" << std::endl;

        testEmptyLedger();
        testAccumulation();
        testSuggestions();
        testConcurrentRecording();
        testReset();

        std::cout << "=== All CostLedger Tests Passed ===" << std::endl;
    }
};

int main() {
    try {
        CostLedgerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All CostLedger component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
