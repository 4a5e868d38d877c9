// =================================================================
// src/OpenBerl/CircuitBreaker.cpp
// =================================================================
// Implementation of the circuit breaker.

#include "OpenBerl/CircuitBreaker.hpp"
#include <algorithm>

namespace OpenBerl {

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config)
    : m_config(config) {}

void CircuitBreaker::recordRequest() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_request_count++;
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_error_count++;

    double ratio = static_cast<double>(m_error_count) /
                   static_cast<double>(std::max<size_t>(m_request_count, 1));
    if (ratio > m_config.failure_ratio && m_request_count > m_config.min_requests) {
        m_open = true;
    }
}

bool CircuitBreaker::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = false;
    m_request_count = 0;
    m_error_count = 0;
}

size_t CircuitBreaker::getRequestCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_request_count;
}

size_t CircuitBreaker::getErrorCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error_count;
}

} // namespace OpenBerl
