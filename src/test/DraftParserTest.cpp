#include <cassert>
#include <iostream>

#include "application/DraftParser.hpp"
#include "TestDoubles.hpp"

using namespace ideasnapshot;
using namespace ideasnapshot::application;

namespace {

domain::ResearchBundle SampleBundle() {
    domain::ResearchBundle bundle;
    bundle.competitors = {
        {"Etsy", "Global marketplace", {"c1"}, {"2025-01-10"}},
        {"Folksy", "UK crafts", {"c4"}, {}}
    };
    bundle.risks = {{domain::RiskType::Financial, "Limited initial capital"}};
    bundle.pricing.min = 25.0;
    bundle.pricing.max = 150.0;
    bundle.pricing.isAssumption = false;
    return bundle;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Draft Parser Test..." << std::endl;
    auto bundle = SampleBundle();

    // Fenced JSON, with list items given as objects
    {
        const std::string response = R"(Here is the analysis:
```json
{
  "idea_name": "CraftHub",
  "viability_score": 72.6,
  "score_rationale": "Strong demand, crowded market",
  "lean_tiles": {
    "problem": "Artisans lack reach",
    "solution": "Curated marketplace",
    "audience": "Gift buyers",
    "channels": ["Instagram", {"name": "Craft fairs"}],
    "differentiators": ["Local makers"],
    "risks": [{"description": "Platform fees"}],
    "assumptions": ["Makers will list"]
  },
  "competitors": [
    {"name": "A", "angle": "a", "evidence_refs": ["ref_001"]},
    {"name": "B", "angle": "b"},
    {"name": "C", "angle": "c"},
    {"name": "D", "angle": "d"}
  ],
  "next_steps": ["Interview makers", "Build landing page"]
}
```
Hope this helps.)";
        auto draft = DraftParser::Parse(response, bundle);
        assert(draft.ideaName == "CraftHub");
        assert(draft.viabilityScore == 73);
        assert(draft.scoreRange == domain::ScoreRange::High);
        assert(draft.leanTiles.channels.size() == 2 && draft.leanTiles.channels[1] == "Craft fairs");
        assert(draft.leanTiles.risks.size() == 1 && draft.leanTiles.risks[0] == "Platform fees");
        assert(draft.competitors.size() == 3);
        assert(draft.competitors[0].evidenceRefs[0] == "ref_001");
        // No price band in the response: research pricing is used.
        assert(draft.priceBand.min && *draft.priceBand.min == 25.0);
        assert(!draft.priceBand.isAssumption);
        assert(draft.nextSteps.size() == 2);
        std::cout << "[PASS] Fenced JSON decoded." << std::endl;
    }

    // Out-of-range score given as a string is clamped; empty competitors are backfilled
    {
        auto draft = DraftParser::Parse(R"({"viability_score": "150", "competitors": []})", bundle);
        assert(draft.viabilityScore == 100);
        assert(draft.scoreRange == domain::ScoreRange::VeryHigh);
        assert(draft.competitors.size() == 2);
        assert(draft.competitors[0].name == "Etsy");

        auto negative = DraftParser::Parse(R"({"viability_score": -12, "price_band": {"min": 10, "max": 20}})", bundle);
        assert(negative.viabilityScore == 0);
        assert(negative.scoreRange == domain::ScoreRange::VeryLow);
        assert(negative.priceBand.min && *negative.priceBand.min == 10.0);
        assert(negative.priceBand.isAssumption);
        std::cout << "[PASS] Scores clamped and ranges derived." << std::endl;
    }

    // Prose answer: heuristic reconstruction on top of the fallback
    {
        const std::string prose =
            "Overall this looks promising.\n"
            "Viability Score: 64 out of 100\n"
            "Next steps:\n"
            "1. Survey 20 local artisans\n"
            "2) Draft seller terms\n"
            "3. Launch a waitlist\n";
        auto draft = DraftParser::Parse(prose, bundle);
        assert(draft.viabilityScore == 64);
        assert(draft.scoreRange == domain::ScoreRange::High);
        assert(draft.scoreRationale == "Analysis incomplete - manual review recommended");
        assert(draft.nextSteps.size() == 3);
        assert(draft.nextSteps[0] == "Survey 20 local artisans");
        assert(draft.nextSteps[1] == "Draft seller terms");
        assert(draft.leanTiles.problem == "To be determined");
        assert(draft.leanTiles.risks.size() == 1);
        assert(draft.competitors.size() == 2);
        std::cout << "[PASS] Heuristic parse of prose." << std::endl;
    }

    // Nothing usable: conservative fallback
    {
        auto draft = DraftParser::Parse("I cannot help with that.", bundle);
        assert(draft.viabilityScore == 50);
        assert(draft.scoreRange == domain::ScoreRange::Moderate);
        assert(draft.nextSteps.size() == 5);
        assert(draft.nextSteps[0] == "Conduct deeper market research");
        assert(draft.leanTiles.assumptions.size() == 1);
        assert(draft.priceBand.max && *draft.priceBand.max == 150.0);

        auto broken = DraftParser::Parse("{\"viability_score\": 80, \"idea_name\": ", bundle);
        assert(broken.viabilityScore == 50);
        std::cout << "[PASS] Fallback draft for unusable output." << std::endl;
    }

    // Scores beyond the int range still clamp to the nearest bound
    {
        assert(DraftParser::Parse(R"({"viability_score": 3000000000})", bundle).viabilityScore == 100);
        assert(DraftParser::Parse(R"({"viability_score": 1e20})", bundle).viabilityScore == 100);
        assert(DraftParser::Parse(R"({"viability_score": -1e20})", bundle).viabilityScore == 0);
        assert(DraftParser::Parse(R"({"viability_score": "99999999999"})", bundle).viabilityScore == 100);
        assert(DraftParser::Parse(R"({"viability_score": "1e400"})", bundle).viabilityScore == 100);
        assert(DraftParser::Parse(R"({"viability_score": "-1e400"})", bundle).viabilityScore == 0);
        assert(DraftParser::Parse(R"({"viability_score": "high"})", bundle).viabilityScore == 50);
        std::cout << "[PASS] Oversized scores clamped." << std::endl;
    }

    // Very long lines in a prose answer
    {
        std::string longStep(40000, 'x');
        std::string padded(40000, ' ');
        const std::string prose =
            "Viability Score: 41\n"
            "1. " + longStep + "\n"
            "viability" + padded + "score 90\n"
            "2. Call suppliers\r\n";
        auto draft = DraftParser::Parse(prose, bundle);
        assert(draft.viabilityScore == 41);
        assert(draft.nextSteps.size() == 2);
        assert(draft.nextSteps[0].size() == 40000);
        assert(draft.nextSteps[1] == "Call suppliers");
        std::cout << "[PASS] Long prose lines parsed." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
