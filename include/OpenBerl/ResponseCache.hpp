// =================================================================
// include/OpenBerl/ResponseCache.hpp
// =================================================================
// Bounded FIFO cache of adapter responses.

#pragma once

#include "OpenBerl/UmfMessage.hpp"
#include <string>
#include <deque>
#include <unordered_map>
#include <mutex>
#include <optional>

namespace OpenBerl {

/**
 * @brief Bounded response cache with first-in-first-out eviction
 *
 * Insertion order is kept in a deque next to the lookup map. When the cache is
 * full the oldest inserted key is evicted, regardless of how recently it was read.
 */
class ResponseCache {
public:
    explicit ResponseCache(size_t max_size = 1000);

    /**
     * @brief Build the cache key for a request
     *
     * Hash over the canonical JSON of task type, payload and metadata.
     */
    static std::string makeKey(const UmfRequest& request);

    std::optional<UmfResponse> get(const std::string& key) const;

    /**
     * @brief Insert or overwrite an entry, evicting the oldest one at capacity
     */
    void put(const std::string& key, const UmfResponse& response);

    bool contains(const std::string& key) const;
    size_t size() const;
    size_t capacity() const;
    void clear();

    /**
     * @brief Keys in insertion order, oldest first
     */
    std::vector<std::string> keys() const;

private:
    size_t m_max_size;
    std::deque<std::string> m_order;
    std::unordered_map<std::string, UmfResponse> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace OpenBerl
