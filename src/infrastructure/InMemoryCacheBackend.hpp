/**
 * @file InMemoryCacheBackend.hpp
 * @brief Process-local TTL key-value store implementing domain::CacheBackend.
 */

#pragma once
#include <chrono>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "domain/CacheBackend.hpp"

namespace ideasnapshot::infrastructure {

/**
 * @class InMemoryCacheBackend
 * @brief Thread-safe map with per-key expiry.
 *
 * Expired entries stay in memory until purgeExpired() runs, but every read,
 * scan and remove treats them as absent.
 */
class InMemoryCacheBackend : public domain::CacheBackend {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /** @param clock Time source; defaults to the system clock. */
    explicit InMemoryCacheBackend(Clock clock = nullptr);

    domain::CacheResult<void> setCache(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    domain::CacheResult<std::optional<std::string>> getCache(const std::string& key) override;
    domain::CacheResult<std::vector<std::string>> scanKeys(const std::string& pattern) override;
    domain::CacheResult<bool> remove(const std::string& key) override;

    /** @brief Physically drops expired entries. Returns how many were dropped. */
    size_t purgeExpired();

    /** @brief Number of physically stored entries, expired ones included. */
    size_t physicalSize() const;

    /** @brief Glob match supporting '*' and '?'. */
    static bool GlobMatch(const std::string& pattern, const std::string& text);

private:
    struct Entry {
        std::string value;
        std::chrono::system_clock::time_point expiresAt;
    };

    std::chrono::system_clock::time_point now() const;

    Clock m_clock;
    std::unordered_map<std::string, Entry> m_entries;
    mutable std::shared_mutex m_mutex;
};

} // namespace ideasnapshot::infrastructure
