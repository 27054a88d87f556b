/**
 * @file ResearchOrchestrator.hpp
 * @brief Deadline-bounded fan-out of the five research facets.
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "domain/EvidenceSearchService.hpp"
#include "domain/IdeaProfile.hpp"
#include "domain/PerformanceLog.hpp"
#include "domain/ResearchBundle.hpp"

namespace ideasnapshot::application {

/**
 * @class ResearchOrchestrator
 * @brief Runs every facet on its own worker and assembles a ResearchBundle.
 *
 * A facet that throws, or that has not settled when the shared deadline
 * passes, is replaced by its default (unknown signal, empty list or an
 * assumption price band). Late workers are abandoned; they only hold shared
 * ownership of the search service and write into their own promise.
 */
class ResearchOrchestrator {
public:
    ResearchOrchestrator(std::shared_ptr<domain::EvidenceSearchService> search,
                         std::chrono::milliseconds budget = std::chrono::milliseconds(25000));

    /**
     * @brief Gathers all facets for @p idea.
     * @param run Receives the `evidence_search` call count and one error detail per failed facet.
     * @return A complete bundle; never throws because of a facet failure.
     */
    domain::ResearchBundle gather(const std::string& idea,
                                  const domain::IdeaProfile& profile,
                                  domain::PerformanceLog& run);

    std::chrono::milliseconds budget() const { return m_budget; }

private:
    std::shared_ptr<domain::EvidenceSearchService> m_search;
    std::chrono::milliseconds m_budget;
};

} // namespace ideasnapshot::application
