/**
 * @file SnapshotJson.cpp
 * @brief Implementation of the domain JSON mapping.
 */

#include "infrastructure/SnapshotJson.hpp"
#include <ctime>

using json = nlohmann::json;

namespace ideasnapshot::infrastructure {

long long ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace ideasnapshot::infrastructure

namespace ideasnapshot::domain {

using infrastructure::FromEpochMillis;
using infrastructure::ToEpochMillis;
using infrastructure::ToIsoString;

void to_json(json& j, const IdeaProfile& profile) {
    j = json{
        {"experience", ToString(profile.experience)},
        {"budget_band", ToString(profile.budgetBand)},
        {"timeline_months", profile.timelineMonths}
    };
}

void from_json(const json& j, IdeaProfile& profile) {
    profile.experience = ParseExperience(j.value("experience", "none")).value_or(ExperienceLevel::None);
    profile.budgetBand = ParseBudgetBand(j.value("budget_band", "<5k")).value_or(BudgetBand::Under5k);
    profile.timelineMonths = j.value("timeline_months", 6);
}

void to_json(json& j, const Evidence& evidence) {
    j = json{
        {"id", evidence.id},
        {"title", evidence.title},
        {"date", evidence.date},
        {"snippet", evidence.snippet},
        {"url", evidence.url},
        {"source_type", evidence.sourceType}
    };
}

void from_json(const json& j, Evidence& evidence) {
    evidence.id = j.value("id", "");
    evidence.title = j.value("title", "");
    evidence.date = j.value("date", "");
    evidence.snippet = j.value("snippet", "");
    evidence.url = j.value("url", "");
    evidence.sourceType = j.value("source_type", "web");
}

void to_json(json& j, const Competitor& competitor) {
    j = json{
        {"name", competitor.name},
        {"angle", competitor.angle},
        {"evidence_refs", competitor.evidenceRefs},
        {"dates", competitor.dates}
    };
}

void from_json(const json& j, Competitor& competitor) {
    competitor.name = j.value("name", "");
    competitor.angle = j.value("angle", "");
    competitor.evidenceRefs = j.value("evidence_refs", std::vector<std::string>{});
    competitor.dates = j.value("dates", std::vector<std::string>{});
}

void to_json(json& j, const Risk& risk) {
    j = json{{"type", ToString(risk.type)}, {"description", risk.description}};
}

void from_json(const json& j, Risk& risk) {
    risk.type = ParseRiskType(j.value("type", "market"));
    risk.description = j.value("description", "");
}

void to_json(json& j, const PriceBand& band) {
    j = json{
        {"min", band.min ? json(*band.min) : json(nullptr)},
        {"max", band.max ? json(*band.max) : json(nullptr)},
        {"currency", band.currency},
        {"is_assumption", band.isAssumption}
    };
}

void from_json(const json& j, PriceBand& band) {
    band.min.reset();
    band.max.reset();
    if (j.contains("min") && j["min"].is_number()) band.min = j["min"].get<double>();
    if (j.contains("max") && j["max"].is_number()) band.max = j["max"].get<double>();
    band.currency = j.value("currency", "USD");
    band.isAssumption = j.value("is_assumption", true);
}

void to_json(json& j, const ResearchBundle& bundle) {
    json failed = json::array();
    for (auto facet : bundle.failedFacets) failed.push_back(ToString(facet));

    j = json{
        {"demand", {{"signal", ToString(bundle.demand.signal)}, {"evidence", bundle.demand.evidence}}},
        {"competitors", bundle.competitors},
        {"trends", {{"signal", ToString(bundle.trends.signal)}, {"evidence", bundle.trends.evidence}}},
        {"risks", bundle.risks},
        {"pricing", bundle.pricing},
        {"failed_facets", failed},
        {"fetch_time_ms", bundle.fetchTimeMs}
    };
}

void from_json(const json& j, ResearchBundle& bundle) {
    json demand = j.value("demand", json::object());
    bundle.demand.signal = ParseDemandSignal(demand.value("signal", "unknown"));
    bundle.demand.evidence = demand.value("evidence", std::vector<Evidence>{});

    json trends = j.value("trends", json::object());
    bundle.trends.signal = ParseTrendSignal(trends.value("signal", "unknown"));
    bundle.trends.evidence = trends.value("evidence", std::vector<Evidence>{});

    bundle.competitors = j.value("competitors", std::vector<Competitor>{});
    bundle.risks = j.value("risks", std::vector<Risk>{});
    bundle.pricing = j.value("pricing", PriceBand{});

    bundle.failedFacets.clear();
    for (const auto& name : j.value("failed_facets", std::vector<std::string>{})) {
        for (auto facet : {Facet::Demand, Facet::Competitors, Facet::Trends, Facet::Risks, Facet::Pricing}) {
            if (ToString(facet) == name) bundle.failedFacets.insert(facet);
        }
    }
    bundle.fetchTimeMs = j.value("fetch_time_ms", 0LL);
}

void to_json(json& j, const LeanTiles& tiles) {
    j = json{
        {"problem", tiles.problem},
        {"solution", tiles.solution},
        {"audience", tiles.audience},
        {"channels", tiles.channels},
        {"differentiators", tiles.differentiators},
        {"risks", tiles.risks},
        {"assumptions", tiles.assumptions}
    };
}

void from_json(const json& j, LeanTiles& tiles) {
    tiles.problem = j.value("problem", "");
    tiles.solution = j.value("solution", "");
    tiles.audience = j.value("audience", "");
    tiles.channels = j.value("channels", std::vector<std::string>{});
    tiles.differentiators = j.value("differentiators", std::vector<std::string>{});
    tiles.risks = j.value("risks", std::vector<std::string>{});
    tiles.assumptions = j.value("assumptions", std::vector<std::string>{});
}

void to_json(json& j, const Signals& signals) {
    j = json{
        {"demand", ToString(signals.demand)},
        {"trend", ToString(signals.trend)},
        {"risk", ToString(signals.risk)}
    };
}

void from_json(const json& j, Signals& signals) {
    signals.demand = ParseDemandSignal(j.value("demand", "unknown"));
    signals.trend = ParseTrendSignal(j.value("trend", "unknown"));
    signals.risk = ParseRiskLevel(j.value("risk", "low"));
}

void to_json(json& j, const Snapshot& snapshot) {
    j = json{
        {"id", snapshot.id},
        {"user_id", snapshot.userId},
        {"idea_name", snapshot.ideaName},
        {"idea_summary", snapshot.ideaSummary},
        {"user_profile", snapshot.userProfile},
        {"viability_score", snapshot.viabilityScore},
        {"score_range", ToString(snapshot.scoreRange)},
        {"score_rationale", snapshot.scoreRationale},
        {"lean_tiles", snapshot.leanTiles},
        {"competitors", snapshot.competitors},
        {"price_band", snapshot.priceBand},
        {"next_steps", snapshot.nextSteps},
        {"evidence", snapshot.evidence},
        {"signals", snapshot.signals},
        {"generation_time_ms", snapshot.generationTimeMs},
        {"research_time_ms", snapshot.researchTimeMs},
        {"analysis_time_ms", snapshot.analysisTimeMs},
        {"word_count", snapshot.wordCount},
        {"created_at", ToIsoString(snapshot.createdAt)},
        {"created_at_ms", ToEpochMillis(snapshot.createdAt)},
        {"status", ToString(snapshot.status)}
    };
}

void from_json(const json& j, Snapshot& snapshot) {
    snapshot.id = j.value("id", "");
    snapshot.userId = j.value("user_id", "");
    snapshot.ideaName = j.value("idea_name", "");
    snapshot.ideaSummary = j.value("idea_summary", "");
    snapshot.userProfile = j.value("user_profile", IdeaProfile{});
    // Stored records always satisfy the score invariant.
    snapshot.viabilityScore = ClampScore(j.value("viability_score", 0));
    snapshot.scoreRange = ScoreRangeFor(snapshot.viabilityScore);
    snapshot.scoreRationale = j.value("score_rationale", "");
    snapshot.leanTiles = j.value("lean_tiles", LeanTiles{});
    snapshot.competitors = j.value("competitors", std::vector<Competitor>{});
    snapshot.priceBand = j.value("price_band", PriceBand{});
    snapshot.nextSteps = j.value("next_steps", std::vector<std::string>{});
    snapshot.evidence = j.value("evidence", std::vector<Evidence>{});
    snapshot.signals = j.value("signals", Signals{});
    snapshot.generationTimeMs = j.value("generation_time_ms", 0LL);
    snapshot.researchTimeMs = j.value("research_time_ms", 0LL);
    snapshot.analysisTimeMs = j.value("analysis_time_ms", 0LL);
    snapshot.wordCount = j.value("word_count", 0);
    snapshot.createdAt = FromEpochMillis(j.value("created_at_ms", 0LL));
    snapshot.status = ParseSnapshotStatus(j.value("status", "pending"));
}

void to_json(json& j, const PerformanceLog& log) {
    j = json{
        {"snapshot_id", log.snapshotId},
        {"total_time_ms", log.totalTimeMs},
        {"research_time_ms", log.researchTimeMs},
        {"analysis_time_ms", log.analysisTimeMs},
        {"cache_lookup_time_ms", log.cacheLookupTimeMs},
        {"api_calls", log.apiCalls},
        {"cache_hits", log.cacheHits},
        {"cache_misses", log.cacheMisses},
        {"used_cache", log.usedCache},
        {"parallel_research", log.parallelResearch},
        {"had_errors", log.hadErrors},
        {"error_details", log.errorDetails},
        {"created_at_ms", ToEpochMillis(log.createdAt)}
    };
}

void from_json(const json& j, PerformanceLog& log) {
    log.snapshotId = j.value("snapshot_id", "");
    log.totalTimeMs = j.value("total_time_ms", 0LL);
    log.researchTimeMs = j.value("research_time_ms", 0LL);
    log.analysisTimeMs = j.value("analysis_time_ms", 0LL);
    log.cacheLookupTimeMs = j.value("cache_lookup_time_ms", 0LL);
    log.apiCalls = j.value("api_calls", std::map<std::string, int>{});
    log.cacheHits = j.value("cache_hits", 0);
    log.cacheMisses = j.value("cache_misses", 0);
    log.usedCache = j.value("used_cache", false);
    log.parallelResearch = j.value("parallel_research", true);
    log.hadErrors = j.value("had_errors", false);
    log.errorDetails = j.value("error_details", std::vector<std::string>{});
    log.createdAt = FromEpochMillis(j.value("created_at_ms", 0LL));
}

} // namespace ideasnapshot::domain
