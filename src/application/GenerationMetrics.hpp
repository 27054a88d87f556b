/**
 * @file GenerationMetrics.hpp
 * @brief Service-level counters over every generation attempt.
 */

#pragma once
#include <mutex>

namespace ideasnapshot::application {

struct PerformanceMetrics {
    long long totalGenerations = 0;
    double averageTimeMs = 0.0;
    double cacheHitRate = 0.0;   ///< Share of attempts served (fully or partly) from cache.
    double successRate = 0.0;    ///< Share of attempts that did not end in a failure record.
    double withinTargetRate = 0.0;
    long long targetTimeMs = 0;
};

/**
 * @class GenerationMetrics
 * @brief Running averages and rates, updated once per attempt. Thread-safe.
 */
class GenerationMetrics {
public:
    explicit GenerationMetrics(long long targetTimeMs = 60000) : m_targetTimeMs(targetTimeMs) {}

    void record(long long totalTimeMs, bool usedCache, bool failed);
    PerformanceMetrics snapshot() const;

private:
    long long m_targetTimeMs;
    long long m_total = 0;
    double m_averageTimeMs = 0.0;
    long long m_cacheHits = 0;
    long long m_successes = 0;
    long long m_withinTarget = 0;
    mutable std::mutex m_mutex;
};

} // namespace ideasnapshot::application
