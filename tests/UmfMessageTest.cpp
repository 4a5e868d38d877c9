// =================================================================
// tests/UmfMessageTest.cpp
// =================================================================
// Unit tests for task types and the message envelopes.

#include "OpenBerl/UmfMessage.hpp"
#include "OpenBerl/TaskTypes.hpp"
#include "OpenBerl/Errors.hpp"
#include <iostream>
#include <cassert>
#include <unordered_set>

class UmfMessageTest {
public:
    void testTaskTypeNames() {
        std::cout << "Testing task type names..." << std::endl;

        for (auto task_type : OpenBerl::getAllTaskTypes()) {
            std::string name = OpenBerl::taskTypeToString(task_type);
            assert(OpenBerl::isKnownTaskType(name) && "Every task type name should be known");
            assert(OpenBerl::stringToTaskType(name) == task_type && "Name should map back to the same task type");
        }

        assert(OpenBerl::getAllTaskTypes().size() == 6 && "There should be six task types");
        assert(OpenBerl::taskTypeToString(OpenBerl::TaskType::CODE_GENERATION) == "code_generation");
        assert(OpenBerl::taskTypeToString(OpenBerl::TaskType::ANALYSIS) == "analysis");

        assert(!OpenBerl::isKnownTaskType("") && "Empty name is not a task type");
        assert(!OpenBerl::isKnownTaskType("CODE_GENERATION") && "Names are case sensitive");

        bool threw = false;
        try {
            OpenBerl::stringToTaskType("summarization");
        } catch (const std::invalid_argument& e) {
            threw = true;
            assert(std::string(e.what()).find("summarization") != std::string::npos);
        }
        assert(threw && "Unknown task type should throw");

        std::string joined = OpenBerl::taskTypesToString(
            {OpenBerl::TaskType::CODE_GENERATION, OpenBerl::TaskType::ANALYSIS});
        assert(joined == "code_generation, analysis" && "Task types should be joined with commas");

        std::cout << "✓ Task type names test passed" << std::endl;
    }

    void testRequestIds() {
        std::cout << "Testing request id generation..." << std::endl;

        std::unordered_set<std::string> ids;
        for (int i = 0; i < 1000; ++i) {
            OpenBerl::UmfRequest request(OpenBerl::TaskType::TEXT_GENERATION, "hello");
            assert(request.request_id.length() == 36 && "Request id should be a UUID string");
            assert(request.request_id[8] == '-' && request.request_id[13] == '-');
            assert(request.request_id[14] == '4' && "Request id should be a version 4 UUID");
            char variant = request.request_id[19];
            assert((variant == '8' || variant == '9' || variant == 'a' || variant == 'b') &&
                   "Request id should carry the RFC 4122 variant");
            ids.insert(request.request_id);
        }
        assert(ids.size() == 1000 && "Request ids should be unique");

        OpenBerl::UmfRequest request;
        std::string original_id = request.request_id;
        request.payload = "changed";
        assert(request.request_id == original_id && "Request id should be stable");

        std::cout << "✓ Request id test passed" << std::endl;
    }

    void testRequestDefaults() {
        std::cout << "Testing request defaults..." << std::endl;

        OpenBerl::UmfRequest request(OpenBerl::TaskType::ANALYSIS, {{"text", "data"}});
        assert(request.task_type == OpenBerl::TaskType::ANALYSIS);
        assert(request.payload["text"] == "data");
        assert(request.metadata.is_object() && request.metadata.empty());
        assert(request.context.empty());
        assert(request.priority == 0);
        assert(request.timeout == std::chrono::milliseconds(300000) && "Default timeout is 300 seconds");
        assert(request.retry_policy.max_retries == 3);
        assert(request.retry_policy.backoff_factor == 2.0);

        std::cout << "✓ Request defaults test passed" << std::endl;
    }

    void testValidateContext() {
        std::cout << "Testing context validation..." << std::endl;

        OpenBerl::UmfRequest request(OpenBerl::TaskType::TEXT_GENERATION, "hi");
        OpenBerl::validateContext(request);

        request.context.push_back(OpenBerl::makeContextEntry("user", "first"));
        request.context.push_back({{"role", "assistant"}, {"content", "second"}, {"name", "bot"}});
        OpenBerl::validateContext(request);

        request.context.push_back({{"role", "user"}});
        bool threw = false;
        try {
            OpenBerl::validateContext(request);
        } catch (const OpenBerl::ValidationError& e) {
            threw = true;
            assert(std::string(e.what()).find("Invalid context format") == 0 &&
                   "Message should describe the invalid context");
        }
        assert(threw && "Entry without content should be rejected");

        OpenBerl::UmfRequest not_object(OpenBerl::TaskType::TEXT_GENERATION, "hi");
        not_object.context.push_back("just a string");
        threw = false;
        try {
            OpenBerl::validateContext(not_object);
        } catch (const OpenBerl::ValidationError&) {
            threw = true;
        }
        assert(threw && "Non-object entry should be rejected");

        std::cout << "✓ Context validation test passed" << std::endl;
    }

    void testPayloadToString() {
        std::cout << "Testing payload rendering..." << std::endl;

        assert(OpenBerl::payloadToString("def f(): pass") == "def f(): pass" && "Strings are returned raw");
        assert(OpenBerl::payloadToString(nullptr).empty() && "Null renders as empty");
        assert(OpenBerl::payloadToString(42) == "42");
        assert(OpenBerl::payloadToString({{"a", 1}}) == "{\"a\":1}" && "Objects render as compact JSON");

        std::cout << "✓ Payload rendering test passed" << std::endl;
    }

    void testMakeError() {
        std::cout << "Testing error envelopes..." << std::endl;

        OpenBerl::UmfRequest request(OpenBerl::TaskType::CODE_GENERATION, "x");
        auto response = OpenBerl::UmfResponse::makeError(request, "Error: backend down");

        assert(response.isError() && "Error envelope should be flagged");
        assert(response.result == "Error: backend down");
        assert(response.request_id == request.request_id && "Error envelope links to the request");
        assert(response.task_type == OpenBerl::TaskType::CODE_GENERATION);
        assert(response.cost_info.estimated_cost == 0.0 && "Failures cost nothing");

        OpenBerl::UmfResponse ok;
        assert(!ok.isError() && "Default response is not an error");

        std::cout << "✓ Error envelope test passed" << std::endl;
    }

    void testAdapterErrorKinds() {
        std::cout << "Testing adapter error classification..." << std::endl;

        assert(OpenBerl::AdapterError(OpenBerl::ErrorKind::TRANSIENT, "x").isRetryable());
        assert(OpenBerl::AdapterError(OpenBerl::ErrorKind::RATE_LIMITED, "x").isRetryable());
        assert(OpenBerl::AdapterError(OpenBerl::ErrorKind::TIMEOUT, "x").isRetryable());
        assert(!OpenBerl::AdapterError(OpenBerl::ErrorKind::TERMINAL, "x").isRetryable());
        assert(OpenBerl::errorKindToString(OpenBerl::ErrorKind::RATE_LIMITED) == "rate_limited");

        std::cout << "✓ Adapter error classification test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== Running UmfMessage Tests ===" << std::endl;

        testTaskTypeNames();
        testRequestIds();
        testRequestDefaults();
        testValidateContext();
        testPayloadToString();
        testMakeError();
        testAdapterErrorKinds();

        std::cout << "=== All UmfMessage Tests Passed ===" << std::endl;
    }
};

int main() {
    try {
        UmfMessageTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All UmfMessage component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
