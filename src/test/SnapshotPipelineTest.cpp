#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>

#include "application/SnapshotExporter.hpp"
#include "application/SnapshotPipeline.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/InMemoryCacheBackend.hpp"
#include "TestDoubles.hpp"

using namespace ideasnapshot;
using namespace ideasnapshot::application;
using ideasnapshot::test::MakeEvidence;
using ideasnapshot::test::MemorySnapshotRepository;
using ideasnapshot::test::ScriptedEvidenceSearch;
using ideasnapshot::test::ScriptedTextGenerator;

namespace {

const std::string kCraftsIdea =
    "An online marketplace connecting local artisans with customers who want unique handmade crafts.";
const domain::IdeaProfile kBeginner{domain::ExperienceLevel::None, domain::BudgetBand::Under5k, 6};

const std::string kCraftsAnalysis = R"({
  "idea_name": "ArtisanLink",
  "viability_score": 68,
  "score_rationale": "Steady demand for unique goods, but Etsy dominates.",
  "lean_tiles": {
    "problem": "Local artisans struggle to reach buyers",
    "solution": "Curated local marketplace",
    "audience": "Gift shoppers who value unique items",
    "channels": ["Instagram", "Craft fairs"],
    "differentiators": ["Local pickup"],
    "risks": ["Platform fees"],
    "assumptions": ["Artisans will pay a commission"]
  },
  "competitors": [
    {"name": "Etsy", "angle": "Global handmade marketplace", "evidence_refs": ["ref_001"]}
  ],
  "price_band": {"min": 25, "max": 150, "currency": "USD", "is_assumption": false},
  "next_steps": [
    "Interview 15 artisans",
    "Survey gift shoppers",
    "Build a landing page",
    "Run a pop-up market",
    "Model commission revenue"
  ]
})";

std::shared_ptr<ScriptedEvidenceSearch> CraftsSearch() {
    auto search = std::make_shared<ScriptedEvidenceSearch>();
    search->respond(domain::Facet::Demand, {
        MakeEvidence("d1", "Handmade demand 2025", "Demand for handmade goods keeps rising"),
        MakeEvidence("d2", "Gift survey", "Shoppers look for unique gifts"),
        MakeEvidence("d3", "Local buying", "Buyers want to support local makers"),
        MakeEvidence("d4", "Craft economy", "Craft sales reach new highs")
    });
    search->respond(domain::Facet::Competitors, {
        MakeEvidence("c1", "Etsy - Handmade marketplace", "Global marketplace for handmade items"),
        MakeEvidence("c2", "Amazon Handmade - Artisan store", "Curated handmade section")
    });
    search->respond(domain::Facet::Trends, {
        MakeEvidence("t1", "Trend report", "The artisan market is growing"),
        MakeEvidence("t2", "Analyst note", "Spending on crafts is increasing"),
        MakeEvidence("t3", "Regional data", "Foot traffic at craft fairs is stable")
    });
    search->respond(domain::Facet::Risks, {
        MakeEvidence("r1", "Risk", "Platform fees squeeze margins"),
        MakeEvidence("r2", "Risk", "Shipping fragile goods is costly")
    });
    search->respond(domain::Facet::Pricing, {
        MakeEvidence("p1", "Pricing", "Most pieces sell between $25 and $150.")
    });
    return search;
}

struct Harness {
    std::shared_ptr<ScriptedEvidenceSearch> search = CraftsSearch();
    std::shared_ptr<ScriptedTextGenerator> generator;
    std::shared_ptr<MemorySnapshotRepository> repository = std::make_shared<MemorySnapshotRepository>();
    std::shared_ptr<SnapshotCache> cache;
    std::unique_ptr<SnapshotPipeline> pipeline;

    explicit Harness(std::optional<std::string> response)
        : generator(std::make_shared<ScriptedTextGenerator>(std::move(response))) {
        cache = std::make_shared<SnapshotCache>(std::make_shared<infrastructure::InMemoryCacheBackend>());

        PipelineContext context;
        context.repository = repository;
        context.cache = cache;
        context.orchestrator = std::make_shared<ResearchOrchestrator>(search, std::chrono::milliseconds(5000));
        context.synthesizer = std::make_shared<AnalysisSynthesizer>(generator, std::chrono::milliseconds(5000));
        pipeline = std::make_unique<SnapshotPipeline>(context);
    }
};

bool Contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Snapshot Pipeline Test..." << std::endl;

    // Handmade crafts example, then an identical request served from cache
    {
        Harness h(kCraftsAnalysis);
        auto first = h.pipeline->generateSnapshot("user-42", kCraftsIdea, kBeginner, true);

        assert(first.ok());
        assert(!first.fromCache);
        const auto& s = first.snapshot;
        assert(s.status == domain::SnapshotStatus::Completed);
        assert(s.ideaName == "ArtisanLink");
        assert(s.userId == "user-42");
        assert(s.viabilityScore == 68);
        assert(s.scoreRange == domain::ScoreRange::High);
        assert(s.wordCount == 13);
        assert(s.evidence.size() == 7);
        assert(s.evidence[0].id == "ref_001");
        assert(s.evidence[6].id == "ref_007");
        assert(s.signals.demand == domain::DemandSignal::High);
        assert(s.signals.trend == domain::TrendSignal::Growing);
        assert(s.signals.risk == domain::RiskLevel::High);
        assert(s.competitors.size() == 1);
        assert(s.nextSteps.size() == 5);
        assert(!s.priceBand.isAssumption);

        assert(first.performance.cacheMisses == 1);
        assert(first.performance.apiCalls.at("evidence_search") == 5);
        assert(first.performance.apiCalls.at("llm") == 1);
        assert(!first.performance.hadErrors);
        assert(first.performance.snapshotId == s.id);

        auto markdown = SnapshotExporter::ToMarkdown(s);
        assert(markdown.rfind("# ArtisanLink\n", 0) == 0);
        assert(Contains(markdown, "**Viability Score:** 68/100 - Steady demand"));
        assert(Contains(markdown, "- **Etsy:** Global handmade marketplace [[ref_001]]"));
        assert(Contains(markdown, "## Likely Price Band\n$25-$150\n"));
        assert(Contains(markdown, "5. Model commission revenue"));
        std::cout << "[PASS] Handmade crafts snapshot generated." << std::endl;

        auto second = h.pipeline->generateSnapshot("user-42", kCraftsIdea, kBeginner, true);
        assert(second.ok());
        assert(second.fromCache);
        assert(second.snapshot.id == s.id);
        assert(second.snapshot.status == domain::SnapshotStatus::Cached);
        assert(second.snapshot.researchTimeMs == 0);
        assert(second.snapshot.analysisTimeMs == 0);
        assert(second.performance.usedCache);
        assert(second.performance.cacheHits == 1);
        assert(h.generator->callCount() == 1);
        assert(h.search->callCount() == 5);
        assert(h.repository->fetchPerformanceLogs().size() == 2);
        assert(h.repository->snapshotCount() == 1);

        auto metrics = h.pipeline->getPerformanceMetrics();
        assert(metrics.totalGenerations == 2);
        assert(metrics.cacheHitRate == 0.5);
        assert(metrics.successRate == 1.0);
        assert(metrics.withinTargetRate == 1.0);
        assert(h.pipeline->getCacheStatistics().hits == 1);

        assert(h.pipeline->getSnapshot(s.id).has_value());
        assert(h.pipeline->listSnapshots("user-42", std::chrono::system_clock::time_point{}).size() == 1);
        assert(h.pipeline->listSnapshots("someone-else", std::chrono::system_clock::time_point{}).empty());
        std::cout << "[PASS] Repeated request served from cache." << std::endl;

        // Reworded idea with a compatible profile reuses the same analysis
        domain::IdeaProfile someExperience{domain::ExperienceLevel::Some, domain::BudgetBand::Under5k, 9};
        auto similar = h.pipeline->generateSnapshot(
            "user-7",
            "An online marketplace connecting local artisans with customers who want unique, handmade crafts!",
            someExperience, true);
        assert(similar.fromCache);
        assert(similar.snapshot.id == s.id);
        assert(h.generator->callCount() == 1);
        std::cout << "[PASS] Similar idea served from cache." << std::endl;

        // Incompatible profile: research reused, analysis redone
        domain::IdeaProfile wellFunded{domain::ExperienceLevel::Experienced, domain::BudgetBand::From25kTo100k, 12};
        auto partial = h.pipeline->generateSnapshot("user-8", kCraftsIdea, wellFunded, true);
        assert(partial.ok());
        assert(!partial.fromCache);
        assert(partial.snapshot.id != s.id);
        assert(partial.performance.usedCache);
        assert(partial.performance.cacheHits == 1);
        assert(partial.performance.researchTimeMs == 0);
        assert(partial.snapshot.researchTimeMs == 0);
        assert(h.search->callCount() == 5);
        assert(h.generator->callCount() == 2);
        std::cout << "[PASS] Cached research reused for an incompatible profile." << std::endl;
    }

    // useCache=false never hits and writes one performance row per call
    {
        Harness h(kCraftsAnalysis);
        auto first = h.pipeline->generateSnapshot("user-1", kCraftsIdea, kBeginner, false);
        auto second = h.pipeline->generateSnapshot("user-1", kCraftsIdea, kBeginner, false);
        assert(first.ok() && second.ok());
        assert(!first.fromCache && !second.fromCache);
        assert(first.snapshot.id != second.snapshot.id);
        assert(!first.performance.usedCache && !second.performance.usedCache);
        assert(h.generator->callCount() == 2);
        assert(h.repository->fetchPerformanceLogs().size() == 2);

        auto stats = h.pipeline->getCacheStatistics();
        assert(stats.hits == 0 && stats.similarityHits == 0 && stats.partialHits == 0);
        assert(stats.hotCacheSize == 0);
        std::cout << "[PASS] Cache bypass never hits." << std::endl;
    }

    // Model output in prose still yields a completed snapshot
    {
        Harness h(std::string("This idea has a Viability Score of 55.\n1. Talk to ten artisans\n2. Price a pilot\n"));
        auto result = h.pipeline->generateSnapshot("user-1", kCraftsIdea, kBeginner, true);
        assert(result.ok());
        assert(result.snapshot.viabilityScore == 55);
        assert(result.snapshot.scoreRange == domain::ScoreRange::Moderate);
        assert(result.snapshot.ideaName == "An online marketplace connecting local artisans with customers who want unique handmade crafts");
        assert(result.snapshot.nextSteps.size() == 2);
        assert(result.snapshot.competitors.size() == 2);
        std::cout << "[PASS] Prose analysis parsed heuristically." << std::endl;
    }

    // Synthesis failure produces a persisted terminal record
    {
        Harness h(std::nullopt);
        auto result = h.pipeline->generateSnapshot("user-1", kCraftsIdea, kBeginner, true);
        assert(!result.ok());
        assert(result.error->kind == GenerationErrorKind::Synthesis);
        assert(result.error->stage == PipelineStage::Analysis);
        assert(result.snapshot.status == domain::SnapshotStatus::Failed);
        assert(result.snapshot.ideaName == "Failed Analysis");
        assert(result.snapshot.viabilityScore == 0);
        assert(result.snapshot.scoreRange == domain::ScoreRange::VeryLow);
        assert(result.snapshot.scoreRationale.rfind("Analysis failed: ", 0) == 0);
        assert(result.performance.hadErrors);
        assert(result.performance.researchTimeMs >= 0);
        assert(Contains(result.performance.errorDetails.back(), "no response"));

        assert(h.repository->findSnapshot(result.snapshot.id).has_value());
        auto logs = h.repository->fetchPerformanceLogs();
        assert(logs.size() == 1 && logs[0].hadErrors);
        assert(h.pipeline->getCacheStatistics().hotCacheSize == 0);
        assert(h.pipeline->getPerformanceMetrics().successRate == 0.0);

        h.generator->throwOnCall("model overloaded");
        auto thrown = h.pipeline->generateSnapshot("user-1", kCraftsIdea, kBeginner, false);
        assert(thrown.error && thrown.error->kind == GenerationErrorKind::Synthesis);
        assert(Contains(thrown.snapshot.scoreRationale, "model overloaded"));

        auto empty = h.pipeline->generateSnapshot("user-1", "   ", kBeginner, true);
        assert(empty.error && empty.error->kind == GenerationErrorKind::InvalidInput);
        assert(empty.snapshot.status == domain::SnapshotStatus::Failed);
        std::cout << "[PASS] Failures recorded as terminal snapshots." << std::endl;
    }

    // A storage failure that also prevents the failure record propagates
    {
        Harness h(kCraftsAnalysis);
        h.repository->failSnapshotWrites = true;
        bool propagated = false;
        try {
            h.pipeline->generateSnapshot("user-1", kCraftsIdea, kBeginner, true);
        } catch (const domain::PersistenceError& e) {
            propagated = true;
            std::cout << "[Test] Caught expected error: " << e.what() << std::endl;
        }
        assert(propagated);
        assert(h.pipeline->getCacheStatistics().hotCacheSize == 0);
        std::cout << "[PASS] Persistence failure propagates." << std::endl;
    }

    // A lost performance row after the snapshot is stored adds no failure record
    {
        Harness h(kCraftsAnalysis);
        h.repository->failPerformanceWrites = true;
        bool propagated = false;
        try {
            h.pipeline->generateSnapshot("user-7", kCraftsIdea, kBeginner, true);
        } catch (const domain::PersistenceError&) {
            propagated = true;
        }
        assert(propagated);
        assert(h.repository->snapshotCount() == 1);
        auto stored = h.pipeline->listSnapshots("user-7", std::chrono::system_clock::time_point{});
        assert(stored.size() == 1);
        assert(stored[0].status == domain::SnapshotStatus::Completed);
        assert(h.repository->fetchPerformanceLogs().empty());

        h.repository->failPerformanceWrites = false;
        auto fresh = h.pipeline->generateSnapshot("user-7", kCraftsIdea, kBeginner, false);
        assert(fresh.ok());
        assert(h.repository->snapshotCount() == 2);

        h.pipeline->generateSnapshot("user-7", kCraftsIdea, kBeginner, true);
        const size_t before = h.repository->snapshotCount();
        h.repository->failPerformanceWrites = true;
        propagated = false;
        try {
            h.pipeline->generateSnapshot("user-7", kCraftsIdea, kBeginner, true);
        } catch (const domain::PersistenceError&) {
            propagated = true;
        }
        assert(propagated);
        assert(h.repository->snapshotCount() == before);
        for (const auto& snapshot : h.pipeline->listSnapshots("user-7", std::chrono::system_clock::time_point{})) {
            assert(snapshot.status != domain::SnapshotStatus::Failed);
        }
        std::cout << "[PASS] Performance log failure keeps one record per run." << std::endl;
    }

    // Some facets failing still completes the snapshot
    {
        Harness h(kCraftsAnalysis);
        h.search->fail(domain::Facet::Trends, "trend index offline");
        h.search->fail(domain::Facet::Pricing, "pricing feed timeout");
        auto result = h.pipeline->generateSnapshot("user-3", kCraftsIdea, kBeginner, true);
        assert(result.ok());
        assert(result.snapshot.status == domain::SnapshotStatus::Completed);
        assert(result.performance.errorDetails.size() == 2);
        assert(!result.performance.hadErrors);
        assert(h.repository->snapshotCount() == 1);
        assert(h.pipeline->getPerformanceMetrics().successRate == 1.0);
        std::cout << "[PASS] Partial research failure still completes." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
