#include "application/SnapshotExporter.hpp"

#include <cmath>
#include <sstream>
#include <nlohmann/json.hpp>
#include "infrastructure/SnapshotJson.hpp"

namespace ideasnapshot::application {

using json = nlohmann::json;

namespace {

std::string JoinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

std::string OrNotAvailable(const std::string& value) {
    return value.empty() ? "N/A" : value;
}

} // namespace

std::string SnapshotExporter::FormatPriceBand(const domain::PriceBand& band) {
    if (!band.min || !band.max) {
        return "Not determined";
    }
    std::stringstream ss;
    ss << "$" << static_cast<long long>(std::llround(*band.min))
       << "-$" << static_cast<long long>(std::llround(*band.max));
    return ss.str();
}

std::string SnapshotExporter::ToMarkdown(const domain::Snapshot& snapshot) {
    std::stringstream ss;
    ss << "# " << snapshot.ideaName << "\n\n";
    ss << "**Viability Score:** " << snapshot.viabilityScore << "/100 - " << snapshot.scoreRationale << "\n\n";

    const auto& tiles = snapshot.leanTiles;
    ss << "## Lean Plan Tiles\n";
    ss << "- **Problem:** " << OrNotAvailable(tiles.problem) << "\n";
    ss << "- **Solution:** " << OrNotAvailable(tiles.solution) << "\n";
    ss << "- **Target Audience:** " << OrNotAvailable(tiles.audience) << "\n";
    ss << "- **Channels:** " << JoinList(tiles.channels) << "\n";
    ss << "- **Differentiators:** " << JoinList(tiles.differentiators) << "\n";
    ss << "- **Key Risks:** " << JoinList(tiles.risks) << "\n";
    ss << "- **Key Assumptions:** " << JoinList(tiles.assumptions) << "\n\n";

    ss << "## Top Competitors\n";
    for (const auto& competitor : snapshot.competitors) {
        ss << "- **" << competitor.name << ":** " << competitor.angle;
        for (const auto& ref : competitor.evidenceRefs) {
            ss << " [[" << ref << "]]";
        }
        ss << "\n";
    }
    ss << "\n";

    ss << "## Likely Price Band\n";
    ss << FormatPriceBand(snapshot.priceBand);
    if (snapshot.priceBand.isAssumption) {
        ss << " (Assumption - limited evidence)";
    }
    ss << "\n\n";

    ss << "## Next 5 Steps\n";
    for (size_t i = 0; i < snapshot.nextSteps.size(); ++i) {
        ss << (i + 1) << ". " << snapshot.nextSteps[i] << "\n";
    }
    return ss.str();
}

std::string SnapshotExporter::ToJson(const domain::Snapshot& snapshot) {
    json j = snapshot;
    return j.dump(2);
}

std::string SnapshotExporter::StatisticsToJson(const CacheStatistics& cache, const PerformanceMetrics& metrics) {
    json j;
    j["cache"] = {
        {"hits", cache.hits},
        {"misses", cache.misses},
        {"similarity_hits", cache.similarityHits},
        {"partial_hits", cache.partialHits},
        {"evictions", cache.evictions},
        {"preload_queued", cache.preloadQueued},
        {"preload_dropped", cache.preloadDropped},
        {"hit_rate", cache.hitRate},
        {"hot_cache_size", cache.hotCacheSize},
        {"research_cache_size", cache.researchCacheSize},
        {"max_cache_size", cache.maxCacheSize},
        {"cache_ttl_seconds", cache.cacheTtlSeconds},
        {"similarity_threshold", cache.similarityThreshold}
    };
    j["performance"] = {
        {"total_generations", metrics.totalGenerations},
        {"average_time_ms", metrics.averageTimeMs},
        {"cache_hit_rate", metrics.cacheHitRate},
        {"success_rate", metrics.successRate},
        {"within_target_rate", metrics.withinTargetRate},
        {"target_time_ms", metrics.targetTimeMs}
    };
    return j.dump(2);
}

} // namespace ideasnapshot::application
