/**
 * @file EvidenceSearchService.hpp
 * @brief Interface for the evidence-search collaborator.
 */

#pragma once
#include <string>
#include <vector>
#include "ResearchBundle.hpp"

namespace ideasnapshot::domain {

/**
 * @class EvidenceSearchService
 * @brief Searches verified sources for a topic query. Owns its own retry policy.
 */
class EvidenceSearchService {
public:
    virtual ~EvidenceSearchService() = default;

    /**
     * @brief Runs one query.
     * @param query Topic query text.
     * @param limit Maximum number of results.
     * @param sourceTypes Accepted source kinds (web, industry, academic).
     * @return Matching evidence, possibly empty.
     * @throws std::exception on transport or service failure.
     */
    virtual std::vector<Evidence> search(const std::string& query,
                                         int limit,
                                         const std::vector<std::string>& sourceTypes) = 0;
};

} // namespace ideasnapshot::domain
