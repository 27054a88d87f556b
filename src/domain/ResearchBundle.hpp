/**
 * @file ResearchBundle.hpp
 * @brief Evidence and derived signals gathered before synthesis.
 */

#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ideasnapshot::domain {

/**
 * @struct Evidence
 * @brief One search result used to support a claim.
 */
struct Evidence {
    std::string id; ///< "ref_NNN" once numbered by the synthesizer, collaborator id before.
    std::string title;
    std::string date; ///< YYYY-MM-DD.
    std::string snippet;
    std::string url;
    std::string sourceType; ///< web, industry or academic.
};

/** @brief The five independent research topics. */
enum class Facet {
    Demand,
    Competitors,
    Trends,
    Risks,
    Pricing
};

enum class DemandSignal { Unknown, Low, Moderate, High };
enum class TrendSignal { Unknown, Declining, Stable, Growing };
enum class RiskLevel { Low, Moderate, High };
enum class RiskType { Execution, Financial, Market };

inline std::string ToString(Facet facet) {
    switch (facet) {
        case Facet::Demand: return "demand";
        case Facet::Competitors: return "competitors";
        case Facet::Trends: return "trends";
        case Facet::Risks: return "risks";
        case Facet::Pricing: return "pricing";
    }
    return "unknown";
}

inline std::string ToString(DemandSignal signal) {
    switch (signal) {
        case DemandSignal::Unknown: return "unknown";
        case DemandSignal::Low: return "low";
        case DemandSignal::Moderate: return "moderate";
        case DemandSignal::High: return "high";
    }
    return "unknown";
}

inline std::string ToString(TrendSignal signal) {
    switch (signal) {
        case TrendSignal::Unknown: return "unknown";
        case TrendSignal::Declining: return "declining";
        case TrendSignal::Stable: return "stable";
        case TrendSignal::Growing: return "growing";
    }
    return "unknown";
}

inline std::string ToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Moderate: return "moderate";
        case RiskLevel::High: return "high";
    }
    return "low";
}

inline std::string ToString(RiskType type) {
    switch (type) {
        case RiskType::Execution: return "execution";
        case RiskType::Financial: return "financial";
        case RiskType::Market: return "market";
    }
    return "market";
}

inline DemandSignal ParseDemandSignal(const std::string& value) {
    if (value == "low") return DemandSignal::Low;
    if (value == "moderate") return DemandSignal::Moderate;
    if (value == "high") return DemandSignal::High;
    return DemandSignal::Unknown;
}

inline TrendSignal ParseTrendSignal(const std::string& value) {
    if (value == "declining") return TrendSignal::Declining;
    if (value == "stable") return TrendSignal::Stable;
    if (value == "growing") return TrendSignal::Growing;
    return TrendSignal::Unknown;
}

inline RiskLevel ParseRiskLevel(const std::string& value) {
    if (value == "moderate") return RiskLevel::Moderate;
    if (value == "high") return RiskLevel::High;
    return RiskLevel::Low;
}

inline RiskType ParseRiskType(const std::string& value) {
    if (value == "execution") return RiskType::Execution;
    if (value == "financial") return RiskType::Financial;
    return RiskType::Market;
}

struct DemandFacet {
    DemandSignal signal = DemandSignal::Unknown;
    std::vector<Evidence> evidence;
};

struct TrendFacet {
    TrendSignal signal = TrendSignal::Unknown;
    std::vector<Evidence> evidence;
};

struct Competitor {
    std::string name;
    std::string angle; ///< Positioning, taken from the evidence snippet.
    std::vector<std::string> evidenceRefs;
    std::vector<std::string> dates;
};

struct Risk {
    RiskType type = RiskType::Market;
    std::string description;
};

/**
 * @struct PriceBand
 * @brief Price range; an assumption when no priced evidence was found.
 */
struct PriceBand {
    std::optional<double> min;
    std::optional<double> max;
    std::string currency = "USD";
    bool isAssumption = true;
};

/**
 * @struct ResearchBundle
 * @brief Aggregated facet results. Never modified after the orchestrator returns it.
 */
struct ResearchBundle {
    DemandFacet demand;
    std::vector<Competitor> competitors;
    TrendFacet trends;
    std::vector<Risk> risks;
    PriceBand pricing;
    std::set<Facet> failedFacets; ///< Facets that fell back to their defaults.
    long long fetchTimeMs = 0;
};

} // namespace ideasnapshot::domain
