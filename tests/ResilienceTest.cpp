// =================================================================
// tests/ResilienceTest.cpp
// =================================================================
// Unit tests for the rate limiter, circuit breaker, response cache and retry loop.

#include "OpenBerl/RateLimiter.hpp"
#include "OpenBerl/CircuitBreaker.hpp"
#include "OpenBerl/ResponseCache.hpp"
#include "OpenBerl/RetryExecutor.hpp"
#include "OpenBerl/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ResilienceTest {
public:
    void testRateLimiterWindow() {
        std::cout << "Testing rate limiter window..." << std::endl;

        OpenBerl::RateLimiter limiter(2, 100ms);
        assert(limiter.tryAcquire() && "First request admitted");
        assert(limiter.tryAcquire() && "Second request admitted");
        assert(!limiter.tryAcquire() && "Third request within the window rejected");
        assert(limiter.currentCount() == 2 && "Rejected requests are not recorded");

        std::this_thread::sleep_for(150ms);
        assert(limiter.currentCount() == 0 && "Old requests leave the window");
        assert(limiter.tryAcquire() && "Requests admitted again after the window slides");

        std::cout << "✓ Rate limiter window test passed" << std::endl;
    }

    void testRateLimiterUnlimited() {
        std::cout << "Testing unlimited rate limiter..." << std::endl;

        OpenBerl::RateLimiter limiter(0);
        for (int i = 0; i < 1000; ++i) {
            assert(limiter.tryAcquire() && "A zero ceiling never rejects");
        }

        limiter.setLimit(1);
        assert(limiter.getLimit() == 1);
        assert(limiter.tryAcquire());
        assert(!limiter.tryAcquire() && "New ceiling applies immediately");

        std::cout << "✓ Unlimited rate limiter test passed" << std::endl;
    }

    void testCircuitBreakerThresholds() {
        std::cout << "Testing circuit breaker thresholds..." << std::endl;

        OpenBerl::CircuitBreaker breaker;
        for (int i = 0; i < 10; ++i) {
            breaker.recordRequest();
            breaker.recordFailure();
        }
        assert(!breaker.isOpen() && "Ten requests are not enough to open the circuit");

        breaker.recordRequest();
        breaker.recordFailure();
        assert(breaker.isOpen() && "Eleven failing requests open the circuit");
        assert(breaker.getRequestCount() == 11 && breaker.getErrorCount() == 11);

        breaker.recordRequest();
        assert(breaker.isOpen() && "The circuit stays open without a reset");

        breaker.reset();
        assert(!breaker.isOpen() && "Reset closes the circuit");
        assert(breaker.getRequestCount() == 0 && breaker.getErrorCount() == 0 && "Reset clears counts");

        std::cout << "✓ Circuit breaker thresholds test passed" << std::endl;
    }

    void testCircuitBreakerRatio() {
        std::cout << "Testing circuit breaker error ratio..." << std::endl;

        OpenBerl::CircuitBreaker breaker;
        for (int i = 0; i < 12; ++i) {
            breaker.recordRequest();
        }
        for (int i = 0; i < 6; ++i) {
            breaker.recordFailure();
        }
        assert(!breaker.isOpen() && "Exactly half failing does not open the circuit");

        breaker.recordFailure();
        assert(breaker.isOpen() && "More than half failing opens the circuit");

        std::cout << "✓ Circuit breaker ratio test passed" << std::endl;
    }

    void testCacheFifoEviction() {
        std::cout << "Testing FIFO cache eviction..." << std::endl;

        OpenBerl::ResponseCache cache(2);
        OpenBerl::UmfResponse response;
        response.result = "a";
        cache.put("a", response);
        response.result = "b";
        cache.put("b", response);

        // Reading "a" must not protect it from eviction
        assert(cache.get("a").has_value());

        response.result = "c";
        cache.put("c", response);

        assert(cache.size() == 2 && "Cache stays within capacity");
        assert(!cache.contains("a") && "Oldest inserted entry is evicted");
        assert(cache.contains("b") && cache.contains("c"));
        assert(cache.keys() == std::vector<std::string>({"b", "c"}) && "Insertion order is kept");

        response.result = "b2";
        cache.put("b", response);
        assert(cache.size() == 2 && "Overwriting does not grow the cache");
        assert(cache.get("b")->result == "b2" && "Overwrite replaces the stored response");

        cache.clear();
        assert(cache.size() == 0 && !cache.get("c").has_value());

        std::cout << "✓ FIFO cache eviction test passed" << std::endl;
    }

    void testCacheKey() {
        std::cout << "Testing cache key derivation..." << std::endl;

        OpenBerl::UmfRequest first(OpenBerl::TaskType::ANALYSIS, "report");
        first.metadata = {{"max_tokens", 100}, {"step_name", "a"}};
        OpenBerl::UmfRequest second(OpenBerl::TaskType::ANALYSIS, "report");
        second.metadata = {{"step_name", "a"}, {"max_tokens", 100}};

        assert(first.request_id != second.request_id);
        assert(OpenBerl::ResponseCache::makeKey(first) == OpenBerl::ResponseCache::makeKey(second) &&
               "Key ignores request id and metadata key order");

        second.metadata["max_tokens"] = 200;
        assert(OpenBerl::ResponseCache::makeKey(first) != OpenBerl::ResponseCache::makeKey(second) &&
               "Metadata is part of the key");

        OpenBerl::UmfRequest other_type(OpenBerl::TaskType::TEXT_GENERATION, "report");
        other_type.metadata = first.metadata;
        assert(OpenBerl::ResponseCache::makeKey(first) != OpenBerl::ResponseCache::makeKey(other_type) &&
               "Task type is part of the key");

        std::cout << "✓ Cache key test passed" << std::endl;
    }

    void testRetryBackoff() {
        std::cout << "Testing retry backoff schedule..." << std::endl;

        std::vector<std::chrono::milliseconds> delays;
        OpenBerl::RetryExecutor executor([&delays](std::chrono::milliseconds d) { delays.push_back(d); });

        int calls = 0;
        OpenBerl::RetryPolicy policy;
        auto response = executor.run(policy, false, [&calls](const OpenBerl::AttemptOptions& options) {
            calls++;
            if (options.attempt < 2) {
                throw OpenBerl::AdapterError(OpenBerl::ErrorKind::TRANSIENT, "server error");
            }
            OpenBerl::UmfResponse ok;
            ok.result = "done";
            return ok;
        });

        assert(response.result == "done");
        assert(calls == 3 && "Two failures then a success");
        assert(delays.size() == 2);
        assert(delays[0] == 1000ms && "First wait is backoff^0 seconds");
        assert(delays[1] == 2000ms && "Second wait is backoff^1 seconds");

        assert(OpenBerl::RetryExecutor::computeBackoff(policy, 2, OpenBerl::ErrorKind::TIMEOUT) == 4000ms);
        assert(OpenBerl::RetryExecutor::computeBackoff(policy, 1, OpenBerl::ErrorKind::RATE_LIMITED) == 4000ms &&
               "Rate limited waits are doubled");

        OpenBerl::RetryPolicy steep;
        steep.backoff_factor = 1e10;
        assert(OpenBerl::RetryExecutor::computeBackoff(steep, 2, OpenBerl::ErrorKind::TRANSIENT) ==
               OpenBerl::RetryExecutor::MAX_BACKOFF && "Huge waits are clamped instead of overflowing");
        assert(OpenBerl::RetryExecutor::computeBackoff(steep, 40, OpenBerl::ErrorKind::RATE_LIMITED) ==
               OpenBerl::RetryExecutor::MAX_BACKOFF && "Infinite waits are clamped");

        OpenBerl::RetryPolicy broken;
        broken.backoff_factor = std::nan("");
        assert(OpenBerl::RetryExecutor::computeBackoff(broken, 1, OpenBerl::ErrorKind::TRANSIENT) == 0ms);
        broken.backoff_factor = -3.0;
        assert(OpenBerl::RetryExecutor::computeBackoff(broken, 1, OpenBerl::ErrorKind::TRANSIENT) == 0ms &&
               "Negative waits become no wait");

        std::cout << "✓ Retry backoff test passed" << std::endl;
    }

    void testRetryTerminal() {
        std::cout << "Testing terminal errors are not retried..." << std::endl;

        int calls = 0;
        OpenBerl::RetryExecutor executor([](std::chrono::milliseconds) {});
        bool threw = false;
        try {
            executor.run(OpenBerl::RetryPolicy(), true, [&calls](const OpenBerl::AttemptOptions&) -> OpenBerl::UmfResponse {
                calls++;
                throw OpenBerl::AdapterError(OpenBerl::ErrorKind::TERMINAL, "unauthorized");
            });
        } catch (const OpenBerl::AdapterError& e) {
            threw = true;
            assert(e.kind() == OpenBerl::ErrorKind::TERMINAL);
        }
        assert(threw && "Terminal error propagates");
        assert(calls == 1 && "Terminal error is not retried, and no fallback is attempted");

        calls = 0;
        threw = false;
        try {
            executor.run(OpenBerl::RetryPolicy(), false, [&calls](const OpenBerl::AttemptOptions&) -> OpenBerl::UmfResponse {
                calls++;
                throw std::runtime_error("unexpected");
            });
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && calls == 1 && "Unclassified exceptions propagate at once");

        std::cout << "✓ Terminal error test passed" << std::endl;
    }

    void testRetryExhaustionAndFallback() {
        std::cout << "Testing retry exhaustion and fallback..." << std::endl;

        OpenBerl::RetryExecutor executor([](std::chrono::milliseconds) {});
        OpenBerl::RetryPolicy policy;
        policy.max_retries = 2;

        int calls = 0;
        bool threw = false;
        try {
            executor.run(policy, false, [&calls](const OpenBerl::AttemptOptions&) -> OpenBerl::UmfResponse {
                calls++;
                throw OpenBerl::AdapterError(OpenBerl::ErrorKind::TIMEOUT, "timed out");
            });
        } catch (const OpenBerl::AdapterError& e) {
            threw = true;
            assert(e.kind() == OpenBerl::ErrorKind::TIMEOUT);
        }
        assert(threw && "Exhausted retries rethrow the last error");
        assert(calls == 3 && "First attempt plus max_retries");

        calls = 0;
        bool fallback_used = false;
        auto response = executor.run(policy, true, [&](const OpenBerl::AttemptOptions& options) {
            calls++;
            if (!options.use_fallback) {
                throw OpenBerl::AdapterError(OpenBerl::ErrorKind::TRANSIENT, "overloaded");
            }
            fallback_used = true;
            OpenBerl::UmfResponse ok;
            ok.result = "from fallback";
            return ok;
        });
        assert(fallback_used && response.result == "from fallback");
        assert(calls == 4 && "One fallback attempt after the retries");

        std::cout << "✓ Retry exhaustion and fallback test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== Running Resilience Tests ===" << std::endl;

        testRateLimiterWindow();
        testRateLimiterUnlimited();
        testCircuitBreakerThresholds();
        testCircuitBreakerRatio();
        testCacheFifoEviction();
        testCacheKey();
        testRetryBackoff();
        testRetryTerminal();
        testRetryExhaustionAndFallback();

        std::cout << "=== All Resilience Tests Passed ===" << std::endl;
    }
};

int main() {
    try {
        OpenBerl::Logger::getInstance().setConsoleLogLevel(OpenBerl::LogLevel::ERROR);

        ResilienceTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Resilience component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
