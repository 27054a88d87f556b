/**
 * @file HttpEvidenceSearch.cpp
 * @brief Implementation of HttpEvidenceSearch.
 */

#include "infrastructure/HttpEvidenceSearch.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace ideasnapshot::infrastructure {

using json = nlohmann::json;

HttpEvidenceSearch::HttpEvidenceSearch(const std::string& host, int port, const std::string& path, int timeoutSeconds)
    : m_host(host), m_port(port), m_path(path), m_timeoutSeconds(timeoutSeconds) {}

std::vector<domain::Evidence> HttpEvidenceSearch::search(const std::string& query,
                                                         int limit,
                                                         const std::vector<std::string>& sourceTypes) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeoutSeconds);

    json requestData = {
        {"query", query},
        {"limit", limit},
        {"source_types", sourceTypes}
    };

    auto res = cli.Post(m_path.c_str(), requestData.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("evidence search connection failed (code " +
                                 std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status != 200) {
        throw std::runtime_error("evidence search HTTP " + std::to_string(res->status));
    }
    return ParseResults(res->body, limit);
}

std::vector<domain::Evidence> HttpEvidenceSearch::ParseResults(const std::string& body, int limit) {
    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("evidence search returned invalid JSON: ") + e.what());
    }

    if (!payload.is_object() || !payload.contains("results") || !payload["results"].is_array()) {
        throw std::runtime_error("evidence search response missing 'results' array");
    }

    std::vector<domain::Evidence> results;
    for (const auto& item : payload["results"]) {
        if (limit >= 0 && static_cast<int>(results.size()) >= limit) break;
        if (!item.is_object()) continue;

        domain::Evidence evidence;
        evidence.id = item.value("id", "");
        evidence.title = item.value("title", "");
        evidence.date = item.value("date", "");
        evidence.snippet = item.value("snippet", "");
        evidence.url = item.value("url", "");
        evidence.sourceType = item.value("source_type", "web");
        results.push_back(std::move(evidence));
    }
    return results;
}

} // namespace ideasnapshot::infrastructure
