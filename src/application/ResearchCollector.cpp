/**
 * @file ResearchCollector.cpp
 * @brief Implementation of ResearchCollector.
 */

#include "application/ResearchCollector.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <set>

namespace ideasnapshot::application {

namespace {

constexpr size_t kMaxCompetitors = 3;
constexpr size_t kMaxRisks = 5;
constexpr size_t kRiskEvidenceCount = 3;
constexpr size_t kSnippetPreview = 100;

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string Trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool ContainsAny(const std::string& text, const std::vector<std::string>& keywords) {
    return std::any_of(keywords.begin(), keywords.end(), [&](const std::string& keyword) {
        return text.find(keyword) != std::string::npos;
    });
}

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * Linear scan for "$1,234.56"-style amounts: digits, optional ",ddd" groups,
 * optional ".dd" cents. Returns the amounts with separators removed.
 */
std::vector<std::string> PriceTokens(const std::string& text) {
    std::vector<std::string> tokens;
    size_t pos = text.find('$');
    while (pos != std::string::npos) {
        size_t i = pos + 1;
        std::string digits;
        while (i < text.size() && IsDigit(text[i])) digits += text[i++];
        if (!digits.empty()) {
            while (i + 3 < text.size() && text[i] == ',' &&
                   IsDigit(text[i + 1]) && IsDigit(text[i + 2]) && IsDigit(text[i + 3])) {
                digits.append(text, i + 1, 3);
                i += 4;
            }
            if (i + 2 < text.size() && text[i] == '.' && IsDigit(text[i + 1]) && IsDigit(text[i + 2])) {
                digits.append(text, i, 3);
                i += 3;
            }
            tokens.push_back(std::move(digits));
        }
        pos = text.find('$', i);
    }
    return tokens;
}

} // namespace

ResearchCollector::ResearchCollector(domain::EvidenceSearchService& search) : m_search(search) {}

const FacetQuery& ResearchCollector::QueryFor(domain::Facet facet) {
    static const FacetQuery demand{"market demand", 5, {"web", "industry"}};
    static const FacetQuery competitors{"competitors alternatives", 10, {"web", "industry"}};
    static const FacetQuery trends{"market trends growth", 5, {"web", "academic", "industry"}};
    static const FacetQuery risks{"risks challenges problems", 5, {"web", "industry"}};
    static const FacetQuery pricing{"pricing cost price range", 5, {"web", "industry"}};

    switch (facet) {
        case domain::Facet::Demand: return demand;
        case domain::Facet::Competitors: return competitors;
        case domain::Facet::Trends: return trends;
        case domain::Facet::Risks: return risks;
        case domain::Facet::Pricing: return pricing;
    }
    return demand;
}

std::vector<domain::Evidence> ResearchCollector::runQuery(domain::Facet facet, const std::string& idea) {
    const auto& query = QueryFor(facet);
    try {
        return m_search.search(query.prefix + " " + idea, query.limit, query.sourceTypes);
    } catch (const domain::ResearchFacetError&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::ResearchFacetError(facet, e.what());
    }
}

domain::DemandFacet ResearchCollector::researchDemand(const std::string& idea) {
    domain::DemandFacet facet;
    facet.evidence = runQuery(domain::Facet::Demand, idea);
    facet.signal = DemandSignalFor(facet.evidence.size());
    return facet;
}

std::vector<domain::Competitor> ResearchCollector::researchCompetitors(const std::string& idea) {
    return ExtractCompetitors(runQuery(domain::Facet::Competitors, idea));
}

domain::TrendFacet ResearchCollector::researchTrends(const std::string& idea) {
    domain::TrendFacet facet;
    facet.evidence = runQuery(domain::Facet::Trends, idea);
    facet.signal = TrendSignalFor(facet.evidence);
    return facet;
}

std::vector<domain::Risk> ResearchCollector::researchRisks(const std::string& idea,
                                                           const domain::IdeaProfile& profile) {
    return CategorizeRisks(runQuery(domain::Facet::Risks, idea), profile);
}

domain::PriceBand ResearchCollector::researchPricing(const std::string& idea) {
    return ExtractPriceBand(runQuery(domain::Facet::Pricing, idea));
}

domain::DemandSignal ResearchCollector::DemandSignalFor(size_t evidenceCount) {
    if (evidenceCount >= 4) return domain::DemandSignal::High;
    if (evidenceCount >= 2) return domain::DemandSignal::Moderate;
    return domain::DemandSignal::Low;
}

domain::TrendSignal ResearchCollector::TrendSignalFor(const std::vector<domain::Evidence>& evidence) {
    static const std::vector<std::string> positive = {"growing", "increasing", "rising", "expanding", "boom"};
    static const std::vector<std::string> negative = {"declining", "decreasing", "falling", "shrinking", "bust"};

    int up = 0;
    int down = 0;
    for (const auto& item : evidence) {
        std::string snippet = ToLower(item.snippet);
        if (ContainsAny(snippet, positive)) ++up;
        if (ContainsAny(snippet, negative)) ++down;
    }

    if (up > down) return domain::TrendSignal::Growing;
    if (down > up) return domain::TrendSignal::Declining;
    return domain::TrendSignal::Stable;
}

domain::RiskLevel ResearchCollector::RiskLevelFor(size_t riskCount) {
    if (riskCount == 0) return domain::RiskLevel::Low;
    if (riskCount <= 2) return domain::RiskLevel::Moderate;
    return domain::RiskLevel::High;
}

domain::PriceBand ResearchCollector::ExtractPriceBand(const std::vector<domain::Evidence>& evidence) {
    std::vector<double> prices;
    for (const auto& item : evidence) {
        for (const auto& digits : PriceTokens(item.snippet)) {
            try {
                prices.push_back(std::stod(digits));
            } catch (const std::out_of_range&) {
                std::cerr << "[ResearchCollector] Ignoring out-of-range price in " << item.id << std::endl;
            }
        }
    }

    domain::PriceBand band;
    if (!prices.empty()) {
        auto [lo, hi] = std::minmax_element(prices.begin(), prices.end());
        band.min = *lo;
        band.max = *hi;
        band.isAssumption = false;
    }
    return band;
}

std::vector<domain::Competitor> ResearchCollector::ExtractCompetitors(const std::vector<domain::Evidence>& evidence) {
    std::vector<domain::Competitor> competitors;
    std::set<std::string> seen;

    for (const auto& item : evidence) {
        domain::Competitor competitor;
        competitor.name = Trim(item.title.substr(0, item.title.find('-')));
        if (competitor.name.empty() || seen.count(competitor.name)) continue;

        competitor.angle = item.snippet.substr(0, kSnippetPreview);
        if (!item.id.empty()) competitor.evidenceRefs.push_back(item.id);
        if (!item.date.empty()) competitor.dates.push_back(item.date);

        seen.insert(competitor.name);
        competitors.push_back(std::move(competitor));
        if (competitors.size() >= kMaxCompetitors) break;
    }
    return competitors;
}

std::vector<domain::Risk> ResearchCollector::CategorizeRisks(const std::vector<domain::Evidence>& evidence,
                                                             const domain::IdeaProfile& profile) {
    std::vector<domain::Risk> risks;
    if (profile.experience == domain::ExperienceLevel::None) {
        risks.push_back({domain::RiskType::Execution, "Limited industry experience"});
    }
    if (profile.budgetBand == domain::BudgetBand::Under5k) {
        risks.push_back({domain::RiskType::Financial, "Limited initial capital"});
    }

    size_t count = std::min(evidence.size(), kRiskEvidenceCount);
    for (size_t i = 0; i < count; ++i) {
        risks.push_back({domain::RiskType::Market, evidence[i].snippet.substr(0, kSnippetPreview)});
    }

    if (risks.size() > kMaxRisks) {
        risks.resize(kMaxRisks);
    }
    return risks;
}

} // namespace ideasnapshot::application
