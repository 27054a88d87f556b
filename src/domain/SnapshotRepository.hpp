/**
 * @file SnapshotRepository.hpp
 * @brief Interface for persistence of snapshots and performance logs.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "PerformanceLog.hpp"
#include "Snapshot.hpp"

namespace ideasnapshot::domain {

/**
 * @class SnapshotRepository
 * @brief Abstract interface for persistent storage. Write failures throw PersistenceError.
 */
class SnapshotRepository {
public:
    virtual ~SnapshotRepository() = default;

    /** @brief Stores (or replaces) a snapshot. */
    virtual void saveSnapshot(const Snapshot& snapshot) = 0;

    /** @brief Fetches a snapshot by id. */
    virtual std::optional<Snapshot> findSnapshot(const std::string& id) = 0;

    /**
     * @brief Lists a user's snapshots created at or after @p since, newest first.
     */
    virtual std::vector<Snapshot> findByUser(const std::string& userId,
                                             std::chrono::system_clock::time_point since) = 0;

    /**
     * @brief Lists completed snapshots created at or after @p since, newest first.
     * @param limit Maximum number of rows.
     */
    virtual std::vector<Snapshot> findRecentCompleted(std::chrono::system_clock::time_point since,
                                                      size_t limit) = 0;

    /** @brief Appends one performance row. */
    virtual void appendPerformanceLog(const PerformanceLog& log) = 0;

    /** @brief Fetches all performance rows in insertion order. */
    virtual std::vector<PerformanceLog> fetchPerformanceLogs() = 0;
};

} // namespace ideasnapshot::domain
