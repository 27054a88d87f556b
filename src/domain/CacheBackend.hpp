/**
 * @file CacheBackend.hpp
 * @brief Interface for the key-value store with TTL behind the snapshot cache.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ideasnapshot::domain {

/**
 * @struct CacheError
 * @brief A cache I/O fault. Callers treat it as a miss or a no-op.
 */
struct CacheError {
    enum class Kind { Unavailable, Corrupt, Io };
    Kind kind = Kind::Io;
    std::string message;
};

/**
 * @class CacheResult
 * @brief Either a value or a CacheError.
 */
template <typename T>
class CacheResult {
public:
    CacheResult(T value) : m_data(std::move(value)) {}
    CacheResult(CacheError error) : m_data(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(m_data); }
    T& value() { return std::get<T>(m_data); }
    const CacheError& error() const { return std::get<CacheError>(m_data); }

    /** @brief Returns the value, or @p fallback when the operation failed. */
    T valueOr(T fallback) const { return ok() ? value() : std::move(fallback); }

private:
    std::variant<T, CacheError> m_data;
};

template <>
class CacheResult<void> {
public:
    CacheResult() = default;
    CacheResult(CacheError error) : m_error(std::move(error)) {}

    bool ok() const { return !m_error.has_value(); }
    explicit operator bool() const { return ok(); }
    const CacheError& error() const { return *m_error; }

private:
    std::optional<CacheError> m_error;
};

/**
 * @class CacheBackend
 * @brief Abstract key-value store. Expired keys are invisible to every operation.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /** @brief Stores @p value under @p key for @p ttl. Overwrites (last write wins). */
    virtual CacheResult<void> setCache(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;

    /** @brief Returns the live value for @p key, or an empty optional. */
    virtual CacheResult<std::optional<std::string>> getCache(const std::string& key) = 0;

    /** @brief Lists live keys matching a glob pattern ('*' and '?'). */
    virtual CacheResult<std::vector<std::string>> scanKeys(const std::string& pattern) = 0;

    /** @brief Removes @p key. Returns whether a live key was removed. */
    virtual CacheResult<bool> remove(const std::string& key) = 0;
};

} // namespace ideasnapshot::domain
