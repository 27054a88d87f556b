#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <mutex>
#include "application/SnapshotPipeline.hpp"
#include "infrastructure/InMemoryCacheBackend.hpp"
#include "TestDoubles.hpp"

using namespace ideasnapshot;
using namespace ideasnapshot::application;

namespace {

const char* kAnalysis = R"({
  "viability_score": 57,
  "score_rationale": "Mixed signals.",
  "lean_tiles": {"problem": "Unmet need", "solution": "A focused product"},
  "next_steps": ["Talk to customers", "Build a prototype"]
})";

// Disjoint vocabularies so no two ideas are similar.
const std::vector<std::string> kIdeas = {
    "Subscription boxes of rare houseplants",
    "Mobile bicycle repair vans",
    "Tutoring marketplace for chess openings",
    "Drone delivery for rural pharmacies",
    "Coworking cafes with soundproof booths",
    "Refurbished vintage typewriters shop"
};

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    auto search = std::make_shared<test::ScriptedEvidenceSearch>();
    search->respond(domain::Facet::Demand, {test::MakeEvidence("d1", "Demand", "Interest keeps rising")});
    search->delay(domain::Facet::Demand, std::chrono::milliseconds(10));
    auto generator = std::make_shared<test::ScriptedTextGenerator>(std::string(kAnalysis));
    auto repository = std::make_shared<test::MemorySnapshotRepository>();
    auto cache = std::make_shared<SnapshotCache>(std::make_shared<infrastructure::InMemoryCacheBackend>());

    PipelineContext context;
    context.repository = repository;
    context.cache = cache;
    context.orchestrator = std::make_shared<ResearchOrchestrator>(search, std::chrono::milliseconds(5000));
    context.synthesizer = std::make_shared<AnalysisSynthesizer>(generator, std::chrono::milliseconds(5000));
    SnapshotPipeline pipeline(context);

    const domain::IdeaProfile profile{domain::ExperienceLevel::Some, domain::BudgetBand::From5kTo25k, 12};
    const int REQUESTS_PER_IDEA = 4;
    const int NUM_REQUESTS = static_cast<int>(kIdeas.size()) * REQUESTS_PER_IDEA;

    std::vector<std::thread> threads;
    std::vector<GenerationResult> results(NUM_REQUESTS);
    std::atomic<int> completed{0};

    std::cout << "[Test] Spawning " << NUM_REQUESTS << " threads generating snapshots..." << std::endl;

    for (int i = 0; i < NUM_REQUESTS; ++i) {
        threads.emplace_back([&, i]() {
            const auto& idea = kIdeas[i % kIdeas.size()];
            results[i] = pipeline.generateSnapshot("user-" + std::to_string(i), idea, profile, true);
            completed++;
        });
        if (i % 5 == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    assert(completed == NUM_REQUESTS);
    std::cout << "[PASS] All " << NUM_REQUESTS << " generations returned." << std::endl;

    int fromCache = 0;
    for (const auto& result : results) {
        assert(result.ok());
        assert(result.snapshot.viabilityScore == 57);
        if (result.fromCache) {
            ++fromCache;
            assert(result.snapshot.status == domain::SnapshotStatus::Cached);
        } else {
            assert(result.snapshot.status == domain::SnapshotStatus::Completed);
        }
        // Cached results point at a persisted snapshot
        assert(pipeline.getSnapshot(result.snapshot.id).has_value());
    }

    std::cout << "[Test] Served from cache: " << fromCache << ", generated: " << generator->callCount() << std::endl;
    assert(generator->callCount() >= static_cast<int>(kIdeas.size()));
    assert(fromCache + generator->callCount() == NUM_REQUESTS);
    assert(static_cast<int>(repository->snapshotCount()) == generator->callCount());
    assert(static_cast<int>(repository->fetchPerformanceLogs().size()) == NUM_REQUESTS);
    std::cout << "[PASS] Every request accounted for once." << std::endl;

    auto stats = pipeline.getCacheStatistics();
    assert(stats.hits + stats.similarityHits + stats.partialHits + stats.misses == NUM_REQUESTS);
    assert(stats.hits + stats.similarityHits == fromCache);

    auto metrics = pipeline.getPerformanceMetrics();
    assert(metrics.totalGenerations == NUM_REQUESTS);
    assert(metrics.successRate == 1.0);
    std::cout << "[PASS] Cache statistics and metrics consistent." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
