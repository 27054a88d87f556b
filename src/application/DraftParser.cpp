/**
 * @file DraftParser.cpp
 * @brief Implementation of DraftParser.
 */

#include "application/DraftParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ideasnapshot::application {

namespace {

constexpr size_t kMaxCompetitors = 3;
constexpr size_t kMaxNextSteps = 5;
constexpr int kNeutralScore = 50;

std::string Trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string StringField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

/** Accepts plain strings and objects carrying a description or name. */
std::vector<std::string> StringList(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_object()) {
            std::string text = StringField(item, "description");
            if (text.empty()) text = StringField(item, "name");
            if (!text.empty()) out.push_back(text);
        }
    }
    return out;
}

/** Clamps before narrowing so out-of-range values land on 0 or 100. */
std::optional<int> BoundedScore(double value) {
    if (std::isnan(value)) return std::nullopt;
    return static_cast<int>(std::lround(std::max(0.0, std::min(100.0, value))));
}

std::optional<int> ScoreField(const json& j) {
    if (!j.contains("viability_score")) return std::nullopt;
    const auto& value = j["viability_score"];
    if (value.is_number()) {
        return BoundedScore(value.get<double>());
    }
    if (value.is_string()) {
        try {
            return BoundedScore(std::stod(value.get<std::string>()));
        } catch (const std::out_of_range&) {
            // Magnitude beyond double; the sign decides the bound.
            return Trim(value.get<std::string>()).rfind('-', 0) == 0 ? 0 : 100;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/** Body of a numbered list line ("1. text", "2) text"), or nullopt. */
std::optional<std::string> NumberedItem(const std::string& line) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos || !std::isdigit(static_cast<unsigned char>(line[pos]))) return std::nullopt;
    while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) ++pos;
    if (pos >= line.size() || (line[pos] != '.' && line[pos] != ')')) return std::nullopt;
    ++pos;
    if (pos >= line.size() || !std::isspace(static_cast<unsigned char>(line[pos]))) return std::nullopt;
    return Trim(line.substr(pos));
}

std::optional<double> NumberField(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

domain::LeanTiles ReadLeanTiles(const json& j) {
    domain::LeanTiles tiles;
    if (!j.is_object()) return tiles;
    tiles.problem = StringField(j, "problem");
    tiles.solution = StringField(j, "solution");
    tiles.audience = StringField(j, "audience");
    tiles.channels = StringList(j, "channels");
    tiles.differentiators = StringList(j, "differentiators");
    tiles.risks = StringList(j, "risks");
    tiles.assumptions = StringList(j, "assumptions");
    return tiles;
}

std::vector<domain::Competitor> ReadCompetitors(const json& j) {
    std::vector<domain::Competitor> competitors;
    if (!j.is_array()) return competitors;
    for (const auto& item : j) {
        if (!item.is_object()) continue;
        domain::Competitor competitor;
        competitor.name = Trim(StringField(item, "name"));
        if (competitor.name.empty()) continue;
        competitor.angle = StringField(item, "angle");
        competitor.evidenceRefs = StringList(item, "evidence_refs");
        competitor.dates = StringList(item, "dates");
        competitors.push_back(std::move(competitor));
    }
    return competitors;
}

domain::PriceBand ReadPriceBand(const json& j) {
    domain::PriceBand band;
    band.min = NumberField(j, "min");
    band.max = NumberField(j, "max");
    std::string currency = StringField(j, "currency");
    if (!currency.empty()) band.currency = currency;
    if (j.contains("is_assumption") && j["is_assumption"].is_boolean()) {
        band.isAssumption = j["is_assumption"].get<bool>();
    }
    return band;
}

} // namespace

std::optional<std::string> DraftParser::ExtractJsonObject(const std::string& response) {
    size_t fence = response.find("```");
    while (fence != std::string::npos) {
        size_t bodyStart = response.find('\n', fence);
        if (bodyStart == std::string::npos) break;
        size_t close = response.find("```", bodyStart);
        if (close == std::string::npos) break;

        std::string body = Trim(response.substr(bodyStart + 1, close - bodyStart - 1));
        if (!body.empty() && body.front() == '{') return body;
        fence = response.find("```", close + 3);
    }

    size_t first = response.find('{');
    size_t last = response.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last <= first) {
        return std::nullopt;
    }
    return response.substr(first, last - first + 1);
}

std::optional<domain::SnapshotDraft> DraftParser::ParseStrict(const std::string& response,
                                                              const domain::ResearchBundle& bundle) {
    auto text = ExtractJsonObject(response);
    if (!text) return std::nullopt;

    json j = json::parse(*text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    domain::SnapshotDraft draft;
    draft.ideaName = Trim(StringField(j, "idea_name"));
    draft.viabilityScore = ScoreField(j).value_or(kNeutralScore);
    draft.scoreRationale = StringField(j, "score_rationale");
    if (j.contains("lean_tiles")) draft.leanTiles = ReadLeanTiles(j["lean_tiles"]);
    if (j.contains("competitors")) draft.competitors = ReadCompetitors(j["competitors"]);
    if (j.contains("price_band") && j["price_band"].is_object()) {
        draft.priceBand = ReadPriceBand(j["price_band"]);
    } else {
        draft.priceBand = bundle.pricing;
    }
    draft.nextSteps = StringList(j, "next_steps");
    return draft;
}

domain::SnapshotDraft DraftParser::FallbackDraft(const domain::ResearchBundle& bundle) {
    domain::SnapshotDraft draft;
    draft.viabilityScore = kNeutralScore;
    draft.scoreRationale = "Analysis incomplete - manual review recommended";
    draft.leanTiles.problem = "To be determined";
    draft.leanTiles.solution = "To be determined";
    draft.leanTiles.audience = "To be determined";
    for (const auto& risk : bundle.risks) {
        draft.leanTiles.risks.push_back(risk.description);
    }
    draft.leanTiles.assumptions = {"Limited evidence available"};
    draft.competitors = bundle.competitors;
    draft.priceBand = bundle.pricing;
    draft.nextSteps = {
        "Conduct deeper market research",
        "Validate assumptions with potential customers",
        "Analyze competitor offerings in detail",
        "Develop MVP specifications",
        "Create financial projections"
    };
    return draft;
}

domain::SnapshotDraft DraftParser::ParseHeuristic(const std::string& response, const domain::ResearchBundle& bundle) {
    static const std::regex scorePattern(R"(viability\s{0,3}score[^0-9\n]{0,20}(\d{1,3}))", std::regex::icase);

    domain::SnapshotDraft draft = FallbackDraft(bundle);

    std::smatch match;
    if (std::regex_search(response, match, scorePattern)) {
        draft.viabilityScore = std::stoi(match[1].str());
    }

    std::vector<std::string> steps;
    std::istringstream lines(response);
    std::string line;
    while (std::getline(lines, line) && steps.size() < kMaxNextSteps) {
        auto step = NumberedItem(line);
        if (step && !step->empty()) steps.push_back(std::move(*step));
    }
    if (!steps.empty()) {
        draft.nextSteps = std::move(steps);
    }
    return draft;
}

void DraftParser::Complete(domain::SnapshotDraft& draft, const domain::ResearchBundle& bundle) {
    if (draft.competitors.empty()) {
        draft.competitors = bundle.competitors;
    }
    if (draft.competitors.size() > kMaxCompetitors) {
        draft.competitors.resize(kMaxCompetitors);
    }
    draft.viabilityScore = domain::ClampScore(draft.viabilityScore);
    draft.scoreRange = domain::ScoreRangeFor(draft.viabilityScore);
}

domain::SnapshotDraft DraftParser::Parse(const std::string& response, const domain::ResearchBundle& bundle) {
    auto strict = ParseStrict(response, bundle);
    domain::SnapshotDraft draft;
    if (strict) {
        draft = std::move(*strict);
    } else {
        std::cerr << "[DraftParser] Response is not a JSON object, reconstructing from text" << std::endl;
        draft = ParseHeuristic(response, bundle);
    }
    Complete(draft, bundle);
    return draft;
}

} // namespace ideasnapshot::application
