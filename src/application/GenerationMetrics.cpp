#include "application/GenerationMetrics.hpp"

namespace ideasnapshot::application {

void GenerationMetrics::record(long long totalTimeMs, bool usedCache, bool failed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_total;
    m_averageTimeMs += (static_cast<double>(totalTimeMs) - m_averageTimeMs) / static_cast<double>(m_total);
    if (usedCache) ++m_cacheHits;
    if (!failed) ++m_successes;
    if (totalTimeMs <= m_targetTimeMs) ++m_withinTarget;
}

PerformanceMetrics GenerationMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PerformanceMetrics metrics;
    metrics.totalGenerations = m_total;
    metrics.averageTimeMs = m_averageTimeMs;
    metrics.targetTimeMs = m_targetTimeMs;
    if (m_total > 0) {
        double total = static_cast<double>(m_total);
        metrics.cacheHitRate = m_cacheHits / total;
        metrics.successRate = m_successes / total;
        metrics.withinTargetRate = m_withinTarget / total;
    }
    return metrics;
}

} // namespace ideasnapshot::application
