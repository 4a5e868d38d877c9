// =================================================================
// src/OpenBerl/RateLimiter.cpp
// =================================================================
// Implementation of the sliding-window rate limiter.

#include "OpenBerl/RateLimiter.hpp"

namespace OpenBerl {

RateLimiter::RateLimiter(size_t requests_per_window, std::chrono::milliseconds window)
    : m_limit(requests_per_window), m_window(window) {}

bool RateLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto now = std::chrono::steady_clock::now();

    if (m_limit == 0) {
        return true;
    }

    evictExpired(now);
    if (m_accepted.size() >= m_limit) {
        return false;
    }

    m_accepted.push_back(now);
    return true;
}

size_t RateLimiter::currentCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    evictExpired(std::chrono::steady_clock::now());
    return m_accepted.size();
}

void RateLimiter::setLimit(size_t requests_per_window) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_limit = requests_per_window;
}

size_t RateLimiter::getLimit() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_limit;
}

void RateLimiter::evictExpired(std::chrono::steady_clock::time_point now) const {
    while (!m_accepted.empty() && now - m_accepted.front() >= m_window) {
        m_accepted.pop_front();
    }
}

} // namespace OpenBerl
