/**
 * @file HttpEvidenceSearch.hpp
 * @brief EvidenceSearchService backed by a JSON-over-HTTP search endpoint.
 */

#pragma once
#include <string>
#include "domain/EvidenceSearchService.hpp"

namespace ideasnapshot::infrastructure {

/**
 * @class HttpEvidenceSearch
 * @brief Posts `{query, limit, source_types}` and reads `{results: [...]}`.
 *
 * One attempt per call; any transport, status or decoding fault throws
 * std::runtime_error.
 */
class HttpEvidenceSearch : public domain::EvidenceSearchService {
public:
    HttpEvidenceSearch(const std::string& host,
                       int port,
                       const std::string& path = "/api/search",
                       int timeoutSeconds = 10);

    std::vector<domain::Evidence> search(const std::string& query,
                                         int limit,
                                         const std::vector<std::string>& sourceTypes) override;

    /** @brief Decodes a response body. Throws on malformed payloads. */
    static std::vector<domain::Evidence> ParseResults(const std::string& body, int limit);

private:
    std::string m_host;
    int m_port;
    std::string m_path;
    int m_timeoutSeconds;
};

} // namespace ideasnapshot::infrastructure
