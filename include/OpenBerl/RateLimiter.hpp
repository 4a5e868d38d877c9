// =================================================================
// include/OpenBerl/RateLimiter.hpp
// =================================================================
// Sliding-window request rate limiter shared by adapters.

#pragma once

#include <chrono>
#include <deque>
#include <mutex>

namespace OpenBerl {

/**
 * @brief Sliding-window limiter over accepted request timestamps
 *
 * A request is rejected when the number of requests accepted within the
 * window already meets the ceiling. A ceiling of zero disables limiting.
 */
class RateLimiter {
public:
    explicit RateLimiter(size_t requests_per_window = 0,
                         std::chrono::milliseconds window = std::chrono::seconds(60));

    /**
     * @brief Try to admit one request
     * @return True if admitted (and recorded), false if the window is full
     */
    bool tryAcquire();

    /**
     * @brief Number of accepted requests still inside the window
     */
    size_t currentCount() const;

    void setLimit(size_t requests_per_window);
    size_t getLimit() const;

private:
    size_t m_limit;
    std::chrono::milliseconds m_window;
    mutable std::deque<std::chrono::steady_clock::time_point> m_accepted;
    mutable std::mutex m_mutex;

    void evictExpired(std::chrono::steady_clock::time_point now) const;
};

} // namespace OpenBerl
