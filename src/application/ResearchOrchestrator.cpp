/**
 * @file ResearchOrchestrator.cpp
 * @brief Implementation of ResearchOrchestrator.
 */

#include "application/ResearchOrchestrator.hpp"
#include "application/ResearchCollector.hpp"
#include <future>
#include <iostream>
#include <thread>

namespace ideasnapshot::application {

namespace {

using SteadyClock = std::chrono::steady_clock;

/**
 * Runs @p fn on a detached thread. The returned future carries its value or
 * the exception it threw.
 */
template <typename T, typename Fn>
std::future<T> LaunchFacet(Fn fn) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();
    std::thread([promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();
    return future;
}

/** Waits for a facet until @p deadline; substitutes @p fallback on timeout or error. */
template <typename T>
T Settle(std::future<T>& future,
         domain::Facet facet,
         SteadyClock::time_point deadline,
         T fallback,
         domain::ResearchBundle& bundle,
         domain::PerformanceLog& run) {
    std::string reason;
    if (future.wait_until(deadline) != std::future_status::ready) {
        reason = "timed out";
    } else {
        try {
            return future.get();
        } catch (const std::exception& e) {
            reason = e.what();
        }
    }

    std::cerr << "[ResearchOrchestrator] Facet " << domain::ToString(facet) << " failed: " << reason << std::endl;
    bundle.failedFacets.insert(facet);
    run.errorDetails.push_back("Research task " + domain::ToString(facet) + " failed: " + reason);
    return fallback;
}

} // namespace

ResearchOrchestrator::ResearchOrchestrator(std::shared_ptr<domain::EvidenceSearchService> search,
                                           std::chrono::milliseconds budget)
    : m_search(std::move(search)), m_budget(budget) {}

domain::ResearchBundle ResearchOrchestrator::gather(const std::string& idea,
                                                    const domain::IdeaProfile& profile,
                                                    domain::PerformanceLog& run) {
    auto start = SteadyClock::now();
    auto deadline = start + m_budget;
    auto search = m_search;

    auto demand = LaunchFacet<domain::DemandFacet>([search, idea] {
        return ResearchCollector(*search).researchDemand(idea);
    });
    auto competitors = LaunchFacet<std::vector<domain::Competitor>>([search, idea] {
        return ResearchCollector(*search).researchCompetitors(idea);
    });
    auto trends = LaunchFacet<domain::TrendFacet>([search, idea] {
        return ResearchCollector(*search).researchTrends(idea);
    });
    auto risks = LaunchFacet<std::vector<domain::Risk>>([search, idea, profile] {
        return ResearchCollector(*search).researchRisks(idea, profile);
    });
    auto pricing = LaunchFacet<domain::PriceBand>([search, idea] {
        return ResearchCollector(*search).researchPricing(idea);
    });
    run.countCall("evidence_search", 5);

    domain::ResearchBundle bundle;
    bundle.demand = Settle(demand, domain::Facet::Demand, deadline, domain::DemandFacet{}, bundle, run);
    bundle.competitors = Settle(competitors, domain::Facet::Competitors, deadline,
                                std::vector<domain::Competitor>{}, bundle, run);
    bundle.trends = Settle(trends, domain::Facet::Trends, deadline, domain::TrendFacet{}, bundle, run);
    bundle.risks = Settle(risks, domain::Facet::Risks, deadline, std::vector<domain::Risk>{}, bundle, run);
    bundle.pricing = Settle(pricing, domain::Facet::Pricing, deadline, domain::PriceBand{}, bundle, run);

    bundle.fetchTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
    std::cout << "[ResearchOrchestrator] Gathered " << (5 - bundle.failedFacets.size())
              << "/5 facets in " << bundle.fetchTimeMs << " ms" << std::endl;
    return bundle;
}

} // namespace ideasnapshot::application
