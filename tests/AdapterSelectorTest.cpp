// =================================================================
// tests/AdapterSelectorTest.cpp
// =================================================================
// Unit tests for the adapter registry and least-loaded selection.

#include "OpenBerl/AdapterRegistry.hpp"
#include "OpenBerl/AdapterSelector.hpp"
#include "OpenBerl/Errors.hpp"
#include "OpenBerl/Logger.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <map>

/**
 * @brief Mock adapter for routing tests
 */
class MockAdapter : public OpenBerl::Adapter {
public:
    MockAdapter(const std::string& name, std::vector<OpenBerl::TaskType> capabilities)
        : m_name(name), m_capabilities(std::move(capabilities)) {}

    std::string getAdapterName() const override { return m_name; }

    std::vector<OpenBerl::TaskType> getCapabilities() const override {
        if (m_throw_on_capabilities) {
            throw std::runtime_error("capability lookup failed");
        }
        return m_capabilities;
    }

    nlohmann::json translateRequest(const OpenBerl::UmfRequest& request) const override {
        return request.payload;
    }

    OpenBerl::UmfResponse translateResponse(const nlohmann::json& native_response,
                                            const OpenBerl::UmfRequest& request) const override {
        OpenBerl::UmfResponse response;
        response.task_type = request.task_type;
        response.request_id = request.request_id;
        response.result = native_response;
        return response;
    }

    OpenBerl::UmfResponse execute(const OpenBerl::UmfRequest& request) override {
        m_request_count++;
        return translateResponse(translateRequest(request), request);
    }

    bool healthCheck() override { return m_healthy; }

    size_t getRequestCount() const override { return m_request_count; }

    void setHealthy(bool healthy) { m_healthy = healthy; }
    void setCapabilities(std::vector<OpenBerl::TaskType> capabilities) { m_capabilities = std::move(capabilities); }
    void setThrowOnCapabilities(bool value) { m_throw_on_capabilities = value; }

private:
    std::string m_name;
    std::vector<OpenBerl::TaskType> m_capabilities;
    bool m_healthy = true;
    bool m_throw_on_capabilities = false;
    std::atomic<size_t> m_request_count{0};
};

class AdapterSelectorTest {
public:
    void testRegistryIndexing() {
        std::cout << "Testing registry indexing..." << std::endl;

        OpenBerl::AdapterRegistry registry;
        auto coder = std::make_shared<MockAdapter>("coder", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::CODE_GENERATION, OpenBerl::TaskType::ANALYSIS});
        auto writer = std::make_shared<MockAdapter>("writer", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::TEXT_GENERATION, OpenBerl::TaskType::ANALYSIS});

        registry.registerAdapter(coder);
        registry.registerAdapter(writer);

        assert(registry.getAdapters(OpenBerl::TaskType::CODE_GENERATION).size() == 1);
        assert(registry.getAdapters(OpenBerl::TaskType::TEXT_GENERATION).size() == 1);

        auto analysts = registry.getAdapters(OpenBerl::TaskType::ANALYSIS);
        assert(analysts.size() == 2 && "Adapter is indexed under every capability");
        assert(analysts[0] == coder && analysts[1] == writer && "Registration order is kept");

        assert(registry.getAdapters(OpenBerl::TaskType::IMAGE_GENERATION).empty() &&
               "Unserved task type yields an empty list");
        assert(registry.size() == 3 && "Three task types are served");
        assert(registry.getAdapterCount() == 2);

        auto all = registry.getAllAdapters();
        assert(all.size() == 2 && all[0] == coder && all[1] == writer);

        std::cout << "✓ Registry indexing test passed" << std::endl;
    }

    void testRegistryIdempotent() {
        std::cout << "Testing idempotent registration..." << std::endl;

        OpenBerl::AdapterRegistry registry;
        auto adapter = std::make_shared<MockAdapter>("coder", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::CODE_GENERATION});

        registry.registerAdapter(adapter);
        registry.registerAdapter(adapter);

        assert(registry.getAdapters(OpenBerl::TaskType::CODE_GENERATION).size() == 1 &&
               "Registering twice does not duplicate the adapter");
        assert(registry.getAdapterCount() == 1);

        auto twin = std::make_shared<MockAdapter>("coder", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::CODE_GENERATION});
        registry.registerAdapter(twin);
        assert(registry.getAdapters(OpenBerl::TaskType::CODE_GENERATION).size() == 2 &&
               "A distinct instance with the same name is a separate adapter");

        bool threw = false;
        try {
            registry.registerAdapter(nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Null adapter should be rejected");

        std::cout << "✓ Idempotent registration test passed" << std::endl;
    }

    void testInvalidTaskTypeNames() {
        std::cout << "Testing invalid task type names..." << std::endl;

        OpenBerl::AdapterRegistry registry;
        OpenBerl::AdapterSelector selector(registry);

        for (const std::string name : {"", "   "}) {
            bool threw = false;
            try {
                selector.select(name);
            } catch (const OpenBerl::ConfigurationError& e) {
                threw = true;
                assert(std::string(e.what()).find("Invalid task type") == 0);
            }
            assert(threw && "Blank task type is a configuration error");
        }

        bool threw = false;
        try {
            selector.select("summarization");
        } catch (const OpenBerl::RoutingError& e) {
            threw = true;
            assert(std::string(e.what()) == "No adapter found for task type: summarization");
        }
        assert(threw && "Unknown task type is a routing error");

        std::cout << "✓ Invalid task type names test passed" << std::endl;
    }

    void testNoAdapterRegistered() {
        std::cout << "Testing selection without adapters..." << std::endl;

        OpenBerl::AdapterRegistry registry;
        registry.registerAdapter(std::make_shared<MockAdapter>("coder", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::CODE_GENERATION}));
        OpenBerl::AdapterSelector selector(registry);

        bool threw = false;
        try {
            selector.select(OpenBerl::TaskType::IMAGE_GENERATION);
        } catch (const OpenBerl::RoutingError& e) {
            threw = true;
            assert(std::string(e.what()) == "No adapter found for task type: image_generation");
        }
        assert(threw && "Task type without adapters is a routing error");

        assert(selector.select("code_generation")->getAdapterName() == "coder" &&
               "Name lookup routes to the registered adapter");

        std::cout << "✓ No adapter test passed" << std::endl;
    }

    void testAuthorizationFilter() {
        std::cout << "Testing capability and health filtering..." << std::endl;

        OpenBerl::AdapterRegistry registry;
        auto drifting = std::make_shared<MockAdapter>("drifting", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::ANALYSIS});
        registry.registerAdapter(drifting);

        // Capability withdrawn after registration
        drifting->setCapabilities({OpenBerl::TaskType::TEXT_GENERATION});

        OpenBerl::AdapterSelector selector(registry);
        bool threw = false;
        try {
            selector.select(OpenBerl::TaskType::ANALYSIS);
        } catch (const OpenBerl::RoutingError& e) {
            threw = true;
            assert(std::string(e.what()) == "No authorized adapter found for task type: analysis");
        }
        assert(threw && "Adapter no longer declaring the capability is skipped");

        auto healthy = std::make_shared<MockAdapter>("healthy", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::ANALYSIS});
        auto sick = std::make_shared<MockAdapter>("sick", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::ANALYSIS});
        auto broken = std::make_shared<MockAdapter>("broken", std::vector<OpenBerl::TaskType>{
            OpenBerl::TaskType::ANALYSIS});

        OpenBerl::AdapterRegistry second_registry;
        second_registry.registerAdapter(sick);
        second_registry.registerAdapter(broken);
        second_registry.registerAdapter(healthy);
        sick->setHealthy(false);
        broken->setThrowOnCapabilities(true);

        OpenBerl::AdapterSelector checking(second_registry);
        assert(checking.select(OpenBerl::TaskType::ANALYSIS) == healthy &&
               "Unhealthy and failing adapters are skipped");

        OpenBerl::AdapterSelector unchecked(second_registry, OpenBerl::SelectorConfig{false});
        assert(unchecked.select(OpenBerl::TaskType::ANALYSIS) == sick &&
               "Health is ignored when checking is disabled");

        std::cout << "✓ Authorization filter test passed" << std::endl;
    }

    void testLeastLoadedSelection() {
        std::cout << "Testing least-loaded selection..." << std::endl;

        OpenBerl::AdapterRegistry registry;
        std::vector<std::shared_ptr<MockAdapter>> adapters;
        for (const std::string name : {"alpha", "beta", "gamma"}) {
            auto adapter = std::make_shared<MockAdapter>(name, std::vector<OpenBerl::TaskType>{
                OpenBerl::TaskType::TEXT_GENERATION});
            adapters.push_back(adapter);
            registry.registerAdapter(adapter);
        }

        OpenBerl::AdapterSelector selector(registry);
        assert(selector.select(OpenBerl::TaskType::TEXT_GENERATION) == adapters[0] &&
               "Ties resolve to the earliest registered adapter");

        // Pre-load alpha so the others catch up first
        for (int i = 0; i < 3; ++i) {
            adapters[0]->execute(OpenBerl::UmfRequest(OpenBerl::TaskType::TEXT_GENERATION, "warm"));
        }

        std::map<std::string, int> selections;
        for (int i = 0; i < 30; ++i) {
            auto chosen = selector.select(OpenBerl::TaskType::TEXT_GENERATION);
            selections[chosen->getAdapterName()]++;
            chosen->execute(OpenBerl::UmfRequest(OpenBerl::TaskType::TEXT_GENERATION, "work"));
        }

        assert(selections["alpha"] == 8 && selections["beta"] == 11 && selections["gamma"] == 11 &&
               "Selection drives request counts towards each other");

        size_t lowest = adapters[0]->getRequestCount();
        size_t highest = lowest;
        for (const auto& adapter : adapters) {
            lowest = std::min(lowest, adapter->getRequestCount());
            highest = std::max(highest, adapter->getRequestCount());
        }
        assert(highest - lowest <= 1 && "Request counts stay within one of each other");

        std::cout << "✓ Least-loaded selection test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== Running AdapterSelector Tests ===" << std::endl;

        testRegistryIndexing();
        testRegistryIdempotent();
        testInvalidTaskTypeNames();
        testNoAdapterRegistered();
        testAuthorizationFilter();
        testLeastLoadedSelection();

        std::cout << "=== All AdapterSelector Tests Passed ===" << std::endl;
    }
};

int main() {
    try {
        OpenBerl::Logger::getInstance().setConsoleLogLevel(OpenBerl::LogLevel::CRITICAL);

        AdapterSelectorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All AdapterSelector component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
