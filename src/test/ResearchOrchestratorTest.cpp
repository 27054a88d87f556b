#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "application/ResearchCollector.hpp"
#include "application/ResearchOrchestrator.hpp"
#include "infrastructure/HttpEvidenceSearch.hpp"
#include "TestDoubles.hpp"

using namespace ideasnapshot;
using namespace ideasnapshot::application;
using ideasnapshot::infrastructure::HttpEvidenceSearch;
using ideasnapshot::test::MakeEvidence;
using ideasnapshot::test::ScriptedEvidenceSearch;

namespace {

std::shared_ptr<ScriptedEvidenceSearch> FullScript() {
    auto search = std::make_shared<ScriptedEvidenceSearch>();
    search->respond(domain::Facet::Demand, {
        MakeEvidence("d1", "Crafts demand report", "Demand for handmade goods keeps rising"),
        MakeEvidence("d2", "Etsy sellers survey", "Buyers prefer unique items"),
        MakeEvidence("d3", "Gift market", "Handmade gifts are popular"),
        MakeEvidence("d4", "Consumer study", "Artisan goods gain share")
    });
    search->respond(domain::Facet::Competitors, {
        MakeEvidence("c1", "Etsy - Marketplace for crafts", "Global marketplace for handmade items"),
        MakeEvidence("c2", "Amazon Handmade - Artisan store", "Curated handmade section"),
        MakeEvidence("c3", "Etsy - Seller handbook", "Duplicate of the first competitor"),
        MakeEvidence("c4", "Folksy - UK crafts", "UK based craft marketplace"),
        MakeEvidence("c5", "Zibbet - Multi channel", "Fourth competitor beyond the cap")
    });
    search->respond(domain::Facet::Trends, {
        MakeEvidence("t1", "Trend 2025", "The handmade market is growing fast"),
        MakeEvidence("t2", "Analyst note", "Spending is increasing year over year"),
        MakeEvidence("t3", "Outlier", "Some segments are declining")
    });
    search->respond(domain::Facet::Risks, {
        MakeEvidence("r1", "Risk", "Platform fees squeeze margins"),
        MakeEvidence("r2", "Risk", "Shipping costs are volatile")
    });
    search->respond(domain::Facet::Pricing, {
        MakeEvidence("p1", "Pricing", "Most items sell between $25 and $150."),
        MakeEvidence("p2", "Premium", "Custom furniture can reach $1,200.00 per piece")
    });
    return search;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Research Orchestrator Test..." << std::endl;

    domain::IdeaProfile beginner{domain::ExperienceLevel::None, domain::BudgetBand::Under5k, 6};
    const std::string idea = "An online marketplace for handmade crafts";

    // All five facets succeed
    {
        auto search = FullScript();
        ResearchOrchestrator orchestrator(search, std::chrono::milliseconds(2000));
        domain::PerformanceLog run;
        auto bundle = orchestrator.gather(idea, beginner, run);

        assert(bundle.failedFacets.empty());
        assert(run.errorDetails.empty());
        assert(run.apiCalls["evidence_search"] == 5);
        assert(search->callCount() == 5);

        assert(bundle.demand.signal == domain::DemandSignal::High);
        assert(bundle.trends.signal == domain::TrendSignal::Growing);

        assert(bundle.competitors.size() == 3);
        assert(bundle.competitors[0].name == "Etsy");
        assert(bundle.competitors[1].name == "Amazon Handmade");
        assert(bundle.competitors[2].name == "Folksy");
        assert(bundle.competitors[0].evidenceRefs.size() == 1 && bundle.competitors[0].evidenceRefs[0] == "c1");

        // Two profile risks plus two market risks
        assert(bundle.risks.size() == 4);
        assert(bundle.risks[0].type == domain::RiskType::Execution);
        assert(bundle.risks[1].type == domain::RiskType::Financial);
        assert(bundle.risks[2].description == "Platform fees squeeze margins");

        assert(bundle.pricing.min && *bundle.pricing.min == 25.0);
        assert(bundle.pricing.max && *bundle.pricing.max == 1200.0);
        assert(!bundle.pricing.isAssumption);
        std::cout << "[PASS] Full research bundle assembled." << std::endl;
    }

    // Two of five facets fail; the run still completes with defaults
    {
        auto search = FullScript();
        search->fail(domain::Facet::Competitors, "search service returned 503");
        search->fail(domain::Facet::Pricing, "connection reset");
        ResearchOrchestrator orchestrator(search, std::chrono::milliseconds(2000));
        domain::PerformanceLog run;
        auto bundle = orchestrator.gather(idea, beginner, run);

        assert(bundle.failedFacets.size() == 2);
        assert(bundle.failedFacets.count(domain::Facet::Competitors) == 1);
        assert(bundle.failedFacets.count(domain::Facet::Pricing) == 1);
        assert(run.errorDetails.size() == 2);
        assert(run.errorDetails[0].find("Research task competitors failed") == 0);
        assert(run.errorDetails[1].find("connection reset") != std::string::npos);
        assert(!run.hadErrors);

        assert(bundle.competitors.empty());
        assert(!bundle.pricing.min && !bundle.pricing.max);
        assert(bundle.pricing.isAssumption);
        assert(bundle.demand.signal == domain::DemandSignal::High);
        std::cout << "[PASS] Facet failures isolated and recorded." << std::endl;
    }

    // A facet that overruns the budget is abandoned
    {
        auto search = FullScript();
        search->delay(domain::Facet::Trends, std::chrono::milliseconds(600));
        ResearchOrchestrator orchestrator(search, std::chrono::milliseconds(150));
        domain::PerformanceLog run;

        auto start = std::chrono::steady_clock::now();
        auto bundle = orchestrator.gather(idea, beginner, run);
        auto elapsed = std::chrono::steady_clock::now() - start;

        assert(elapsed < std::chrono::milliseconds(550));
        assert(bundle.failedFacets.size() == 1);
        assert(bundle.failedFacets.count(domain::Facet::Trends) == 1);
        assert(bundle.trends.signal == domain::TrendSignal::Unknown);
        assert(bundle.trends.evidence.empty());
        assert(run.errorDetails.size() == 1);
        assert(run.errorDetails[0].find("timed out") != std::string::npos);
        std::cout << "[PASS] Slow facet replaced by its default." << std::endl;

        // Let the abandoned facet thread finish before the process exits.
        std::this_thread::sleep_for(std::chrono::milliseconds(700));
    }

    // Signal heuristics
    assert(ResearchCollector::DemandSignalFor(0) == domain::DemandSignal::Low);
    assert(ResearchCollector::DemandSignalFor(1) == domain::DemandSignal::Low);
    assert(ResearchCollector::DemandSignalFor(2) == domain::DemandSignal::Moderate);
    assert(ResearchCollector::DemandSignalFor(3) == domain::DemandSignal::Moderate);
    assert(ResearchCollector::DemandSignalFor(4) == domain::DemandSignal::High);

    assert(ResearchCollector::TrendSignalFor({}) == domain::TrendSignal::Stable);
    assert(ResearchCollector::TrendSignalFor({MakeEvidence("a", "t", "Sales are Declining"),
                                              MakeEvidence("b", "t", "a shrinking niche")}) ==
           domain::TrendSignal::Declining);

    assert(ResearchCollector::RiskLevelFor(0) == domain::RiskLevel::Low);
    assert(ResearchCollector::RiskLevelFor(2) == domain::RiskLevel::Moderate);
    assert(ResearchCollector::RiskLevelFor(3) == domain::RiskLevel::High);

    domain::IdeaProfile seasoned{domain::ExperienceLevel::Experienced, domain::BudgetBand::Over100k, 12};
    assert(ResearchCollector::CategorizeRisks({}, seasoned).empty());
    std::vector<domain::Evidence> many = {
        MakeEvidence("1", "t", "one"), MakeEvidence("2", "t", "two"),
        MakeEvidence("3", "t", "three"), MakeEvidence("4", "t", "four")
    };
    assert(ResearchCollector::CategorizeRisks(many, seasoned).size() == 3);
    assert(ResearchCollector::CategorizeRisks(many, beginner).size() == 5);

    auto noPrice = ResearchCollector::ExtractPriceBand({MakeEvidence("x", "t", "prices vary widely")});
    assert(!noPrice.min && noPrice.isAssumption);
    std::cout << "[PASS] Signal heuristics." << std::endl;

    // Price amounts: separators, cents and oversized amounts
    auto grouped = ResearchCollector::ExtractPriceBand({
        MakeEvidence("p1", "t", "Kits from $1,250.50 up to $12,000, starter packs $40."),
        MakeEvidence("p2", "t", "A lone $ sign and $,100 carry no price")
    });
    assert(grouped.min && *grouped.min == 40.0);
    assert(grouped.max && *grouped.max == 12000.0);
    assert(!grouped.isAssumption);

    std::string huge = "$1";
    for (int i = 0; i < 20000; ++i) huge += ",000";
    auto overflow = ResearchCollector::ExtractPriceBand({MakeEvidence("h", "t", huge)});
    assert(!overflow.min && overflow.isAssumption);
    auto mixed = ResearchCollector::ExtractPriceBand({MakeEvidence("h", "t", huge + " or $25")});
    assert(mixed.min && *mixed.min == 25.0 && *mixed.max == 25.0);
    std::cout << "[PASS] Price extraction." << std::endl;

    // Evidence-search response decoding
    {
        auto results = HttpEvidenceSearch::ParseResults(R"({"results": [
            {"id": "e1", "title": "Report", "date": "2025-02-01", "snippet": "Demand up", "url": "https://a.example"},
            "not an object",
            {"id": "e2", "title": "Survey", "source_type": "industry"},
            {"id": "e3"}
        ]})", 2);
        assert(results.size() == 2);
        assert(results[0].id == "e1" && results[0].date == "2025-02-01");
        assert(results[0].sourceType == "web");
        assert(results[1].id == "e2" && results[1].sourceType == "industry");
        assert(results[1].snippet.empty());

        assert(HttpEvidenceSearch::ParseResults(R"({"results": []})", 5).empty());

        int rejected = 0;
        for (const char* body : {"{\"items\": []}", "{\"results\": {}}", "[1, 2]", "not json"}) {
            try {
                HttpEvidenceSearch::ParseResults(body, 5);
            } catch (const std::runtime_error&) {
                ++rejected;
            }
        }
        assert(rejected == 4);
        std::cout << "[PASS] Evidence-search responses decoded." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
