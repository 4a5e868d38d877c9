// =================================================================
// include/OpenBerl/CircuitBreaker.hpp
// =================================================================
// Error-rate circuit breaker that makes a failing adapter fail fast.

#pragma once

#include <mutex>
#include <cstddef>

namespace OpenBerl {

/**
 * @brief Circuit breaker thresholds
 */
struct CircuitBreakerConfig {
    double failure_ratio = 0.5;   ///< Opens when errors/requests exceeds this
    size_t min_requests = 10;     ///< ...and more than this many requests were seen
};

/**
 * @brief Binary open/closed breaker driven by request and error counts
 *
 * Once open it stays open until reset() is called.
 */
class CircuitBreaker {
public:
    explicit CircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig());

    void recordRequest();

    /**
     * @brief Count a failed request and open the circuit if thresholds are crossed
     */
    void recordFailure();

    bool isOpen() const;

    /**
     * @brief Close the circuit and clear the counts
     */
    void reset();

    size_t getRequestCount() const;
    size_t getErrorCount() const;

private:
    CircuitBreakerConfig m_config;
    size_t m_request_count = 0;
    size_t m_error_count = 0;
    bool m_open = false;
    mutable std::mutex m_mutex;
};

} // namespace OpenBerl
