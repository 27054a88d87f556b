/**
 * @file PerformanceLog.hpp
 * @brief Timing and resource record written once per generation attempt.
 */

#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace ideasnapshot::domain {

/**
 * @struct PerformanceLog
 * @brief Append-only row; written for successes, cache hits and failures alike.
 */
struct PerformanceLog {
    std::string snapshotId;
    long long totalTimeMs = 0;
    long long researchTimeMs = 0;
    long long analysisTimeMs = 0;
    long long cacheLookupTimeMs = 0;
    std::map<std::string, int> apiCalls; ///< service -> call count.
    int cacheHits = 0;
    int cacheMisses = 0;
    bool usedCache = false;
    bool parallelResearch = true;
    bool hadErrors = false;
    std::vector<std::string> errorDetails;
    std::chrono::system_clock::time_point createdAt{};

    void countCall(const std::string& service, int count = 1) {
        apiCalls[service] += count;
    }
};

} // namespace ideasnapshot::domain
