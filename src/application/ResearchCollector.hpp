/**
 * @file ResearchCollector.hpp
 * @brief Per-facet evidence queries and the heuristics that turn results into signals.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/EvidenceSearchService.hpp"
#include "domain/IdeaProfile.hpp"
#include "domain/ResearchBundle.hpp"

namespace ideasnapshot::application {

/**
 * @struct FacetQuery
 * @brief Query template for one research facet.
 */
struct FacetQuery {
    std::string prefix; ///< Prepended to the idea summary.
    int limit;
    std::vector<std::string> sourceTypes;
};

/**
 * @class ResearchCollector
 * @brief Thin wrapper over the evidence-search collaborator.
 *
 * Each research method issues exactly one query and throws
 * domain::ResearchFacetError if the collaborator fails.
 */
class ResearchCollector {
public:
    explicit ResearchCollector(domain::EvidenceSearchService& search);

    domain::DemandFacet researchDemand(const std::string& idea);
    std::vector<domain::Competitor> researchCompetitors(const std::string& idea);
    domain::TrendFacet researchTrends(const std::string& idea);
    std::vector<domain::Risk> researchRisks(const std::string& idea, const domain::IdeaProfile& profile);
    domain::PriceBand researchPricing(const std::string& idea);

    /** @brief Query template used for @p facet. */
    static const FacetQuery& QueryFor(domain::Facet facet);

    // Signal heuristics, exposed for reuse by the synthesizer and tests.
    static domain::DemandSignal DemandSignalFor(size_t evidenceCount);
    static domain::TrendSignal TrendSignalFor(const std::vector<domain::Evidence>& evidence);
    static domain::RiskLevel RiskLevelFor(size_t riskCount);
    static domain::PriceBand ExtractPriceBand(const std::vector<domain::Evidence>& evidence);
    static std::vector<domain::Competitor> ExtractCompetitors(const std::vector<domain::Evidence>& evidence);
    static std::vector<domain::Risk> CategorizeRisks(const std::vector<domain::Evidence>& evidence,
                                                     const domain::IdeaProfile& profile);

private:
    std::vector<domain::Evidence> runQuery(domain::Facet facet, const std::string& idea);

    domain::EvidenceSearchService& m_search;
};

} // namespace ideasnapshot::application
