/**
 * @file SnapshotExporter.hpp
 * @brief Renders snapshots and service statistics for output.
 */

#pragma once

#include <string>
#include "application/GenerationMetrics.hpp"
#include "application/SnapshotCache.hpp"
#include "domain/Snapshot.hpp"

namespace ideasnapshot::application {

class SnapshotExporter {
public:
    /**
     * @brief Markdown report: title, score, lean tiles, competitors with [[ref]] links,
     * price band and numbered next steps.
     */
    static std::string ToMarkdown(const domain::Snapshot& snapshot);

    /** @brief Pretty-printed JSON document of the snapshot. */
    static std::string ToJson(const domain::Snapshot& snapshot);

    static std::string StatisticsToJson(const CacheStatistics& cache, const PerformanceMetrics& metrics);

    /** @brief "$25-$150", or "Not determined" when either bound is unknown. */
    static std::string FormatPriceBand(const domain::PriceBand& band);
};

} // namespace ideasnapshot::application
