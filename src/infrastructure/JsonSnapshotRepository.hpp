/**
 * @file JsonSnapshotRepository.hpp
 * @brief Filesystem-based implementation of the SnapshotRepository.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/SnapshotRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ideasnapshot::infrastructure {

/**
 * @class JsonSnapshotRepository
 * @brief Stores each snapshot as `<root>/snapshots/<id>.json` and performance
 * rows as JSON lines in `<root>/performance.jsonl`.
 *
 * Writes go through the shared PersistenceService and are awaited, so a
 * returning save means the data is on disk.
 */
class JsonSnapshotRepository : public domain::SnapshotRepository {
public:
    /**
     * @param rootPath Data directory. Created if missing.
     * @param persistence Serialized writer shared with the rest of the process.
     */
    JsonSnapshotRepository(const std::string& rootPath, std::shared_ptr<PersistenceService> persistence);

    void saveSnapshot(const domain::Snapshot& snapshot) override;
    std::optional<domain::Snapshot> findSnapshot(const std::string& id) override;
    std::vector<domain::Snapshot> findByUser(const std::string& userId,
                                             std::chrono::system_clock::time_point since) override;
    std::vector<domain::Snapshot> findRecentCompleted(std::chrono::system_clock::time_point since,
                                                      size_t limit) override;
    void appendPerformanceLog(const domain::PerformanceLog& log) override;
    std::vector<domain::PerformanceLog> fetchPerformanceLogs() override;

private:
    std::vector<domain::Snapshot> loadAll();
    std::string snapshotPath(const std::string& id) const;

    std::string m_snapshotsPath; ///< Directory holding one JSON file per snapshot.
    std::string m_performancePath; ///< JSON-lines performance log.
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace ideasnapshot::infrastructure
