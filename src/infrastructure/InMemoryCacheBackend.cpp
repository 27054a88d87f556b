/**
 * @file InMemoryCacheBackend.cpp
 * @brief Implementation of InMemoryCacheBackend.
 */

#include "infrastructure/InMemoryCacheBackend.hpp"
#include <mutex>

namespace ideasnapshot::infrastructure {

InMemoryCacheBackend::InMemoryCacheBackend(Clock clock) : m_clock(std::move(clock)) {}

std::chrono::system_clock::time_point InMemoryCacheBackend::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

domain::CacheResult<void> InMemoryCacheBackend::setCache(const std::string& key,
                                                         const std::string& value,
                                                         std::chrono::seconds ttl) {
    auto expiresAt = now() + ttl;
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_entries[key] = Entry{value, expiresAt};
    return {};
}

domain::CacheResult<std::optional<std::string>> InMemoryCacheBackend::getCache(const std::string& key) {
    auto current = now();
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end() || it->second.expiresAt <= current) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>(it->second.value);
}

domain::CacheResult<std::vector<std::string>> InMemoryCacheBackend::scanKeys(const std::string& pattern) {
    auto current = now();
    std::vector<std::string> keys;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    for (const auto& [key, entry] : m_entries) {
        if (entry.expiresAt > current && GlobMatch(pattern, key)) {
            keys.push_back(key);
        }
    }
    return keys;
}

domain::CacheResult<bool> InMemoryCacheBackend::remove(const std::string& key) {
    auto current = now();
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return false;
    }
    bool wasLive = it->second.expiresAt > current;
    m_entries.erase(it);
    return wasLive;
}

size_t InMemoryCacheBackend::purgeExpired() {
    auto current = now();
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    size_t dropped = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.expiresAt <= current) {
            it = m_entries.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t InMemoryCacheBackend::physicalSize() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

bool InMemoryCacheBackend::GlobMatch(const std::string& pattern, const std::string& text) {
    size_t p = 0, t = 0;
    size_t starP = std::string::npos, starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace ideasnapshot::infrastructure
