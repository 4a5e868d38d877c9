// =================================================================
// src/OpenBerl/ResponseCache.cpp
// =================================================================
// Implementation of the FIFO response cache.

#include "OpenBerl/ResponseCache.hpp"
#include <functional>

namespace OpenBerl {

ResponseCache::ResponseCache(size_t max_size)
    : m_max_size(max_size) {}

std::string ResponseCache::makeKey(const UmfRequest& request) {
    nlohmann::json key_data = {
        {"task_type", taskTypeToString(request.task_type)},
        {"payload", request.payload},
        {"metadata", request.metadata}
    };

    // Object keys are sorted by nlohmann::json, so the dump is canonical
    std::hash<std::string> hasher;
    return std::to_string(hasher(key_data.dump()));
}

std::optional<UmfResponse> ResponseCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ResponseCache::put(const std::string& key, const UmfResponse& response) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_max_size == 0) {
        return;
    }

    auto existing = m_entries.find(key);
    if (existing != m_entries.end()) {
        existing->second = response;
        return;
    }

    while (m_entries.size() >= m_max_size && !m_order.empty()) {
        m_entries.erase(m_order.front());
        m_order.pop_front();
    }

    m_order.push_back(key);
    m_entries.emplace(key, response);
}

bool ResponseCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.find(key) != m_entries.end();
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

size_t ResponseCache::capacity() const {
    return m_max_size;
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_order.clear();
}

std::vector<std::string> ResponseCache::keys() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<std::string>(m_order.begin(), m_order.end());
}

} // namespace OpenBerl
