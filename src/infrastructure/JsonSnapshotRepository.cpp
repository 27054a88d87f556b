/**
 * @file JsonSnapshotRepository.cpp
 * @brief Implementation of the JsonSnapshotRepository class.
 */
#include "infrastructure/JsonSnapshotRepository.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/SnapshotJson.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ideasnapshot::infrastructure {

namespace {

bool IsSafeId(const std::string& id) {
    if (id.empty()) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

void NewestFirst(std::vector<domain::Snapshot>& snapshots) {
    std::sort(snapshots.begin(), snapshots.end(), [](const domain::Snapshot& a, const domain::Snapshot& b) {
        return a.createdAt > b.createdAt;
    });
}

} // namespace

JsonSnapshotRepository::JsonSnapshotRepository(const std::string& rootPath,
                                               std::shared_ptr<PersistenceService> persistence)
    : m_snapshotsPath((fs::path(rootPath) / "snapshots").string()),
      m_performancePath((fs::path(rootPath) / "performance.jsonl").string()),
      m_persistence(std::move(persistence)) {
    std::error_code ec;
    fs::create_directories(m_snapshotsPath, ec);
    if (ec) {
        std::cerr << "[JsonSnapshotRepository] Cannot create " << m_snapshotsPath << ": " << ec.message() << std::endl;
    }
}

std::string JsonSnapshotRepository::snapshotPath(const std::string& id) const {
    return (fs::path(m_snapshotsPath) / (id + ".json")).string();
}

void JsonSnapshotRepository::saveSnapshot(const domain::Snapshot& snapshot) {
    if (!IsSafeId(snapshot.id)) {
        throw domain::PersistenceError("invalid snapshot id '" + snapshot.id + "'");
    }

    json j = snapshot;
    auto written = m_persistence->saveTextAsync(snapshotPath(snapshot.id), j.dump(2));
    if (!written.get()) {
        throw domain::PersistenceError("failed to write snapshot " + snapshot.id);
    }
}

std::optional<domain::Snapshot> JsonSnapshotRepository::findSnapshot(const std::string& id) {
    if (!IsSafeId(id)) return std::nullopt;

    fs::path path = snapshotPath(id);
    if (!fs::exists(path)) return std::nullopt;

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return j.get<domain::Snapshot>();
    } catch (const std::exception& e) {
        std::cerr << "[JsonSnapshotRepository] Corrupt snapshot " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<domain::Snapshot> JsonSnapshotRepository::loadAll() {
    std::vector<domain::Snapshot> snapshots;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_snapshotsPath, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        try {
            std::ifstream f(entry.path());
            json j;
            f >> j;
            snapshots.push_back(j.get<domain::Snapshot>());
        } catch (const std::exception& e) {
            std::cerr << "[JsonSnapshotRepository] Skipping " << entry.path() << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[JsonSnapshotRepository] Cannot list " << m_snapshotsPath << ": " << ec.message() << std::endl;
    }
    return snapshots;
}

std::vector<domain::Snapshot> JsonSnapshotRepository::findByUser(const std::string& userId,
                                                                 std::chrono::system_clock::time_point since) {
    auto all = loadAll();
    std::vector<domain::Snapshot> result;
    for (auto& snapshot : all) {
        if (snapshot.userId == userId && snapshot.createdAt >= since) {
            result.push_back(std::move(snapshot));
        }
    }
    NewestFirst(result);
    return result;
}

std::vector<domain::Snapshot> JsonSnapshotRepository::findRecentCompleted(std::chrono::system_clock::time_point since,
                                                                          size_t limit) {
    auto all = loadAll();
    std::vector<domain::Snapshot> result;
    for (auto& snapshot : all) {
        if (snapshot.status == domain::SnapshotStatus::Completed && snapshot.createdAt >= since) {
            result.push_back(std::move(snapshot));
        }
    }
    NewestFirst(result);
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

void JsonSnapshotRepository::appendPerformanceLog(const domain::PerformanceLog& log) {
    json j = log;
    auto written = m_persistence->appendTextAsync(m_performancePath, j.dump() + "\n");
    if (!written.get()) {
        throw domain::PersistenceError("failed to append performance log for " + log.snapshotId);
    }
}

std::vector<domain::PerformanceLog> JsonSnapshotRepository::fetchPerformanceLogs() {
    std::vector<domain::PerformanceLog> logs;
    std::ifstream f(m_performancePath);
    if (!f.is_open()) return logs;

    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        try {
            logs.push_back(json::parse(line).get<domain::PerformanceLog>());
        } catch (const std::exception& e) {
            std::cerr << "[JsonSnapshotRepository] Skipping malformed performance row: " << e.what() << std::endl;
        }
    }
    return logs;
}

} // namespace ideasnapshot::infrastructure
