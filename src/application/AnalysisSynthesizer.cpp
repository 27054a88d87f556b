/**
 * @file AnalysisSynthesizer.cpp
 * @brief Implementation of AnalysisSynthesizer.
 */

#include "application/AnalysisSynthesizer.hpp"
#include "application/DraftParser.hpp"
#include "application/ResearchCollector.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/SnapshotJson.hpp"
#include <cstdio>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ideasnapshot::application {

AnalysisSynthesizer::AnalysisSynthesizer(std::shared_ptr<domain::TextGenerationService> generator,
                                         std::chrono::milliseconds budget)
    : m_generator(std::move(generator)), m_budget(budget) {}

std::vector<domain::Evidence> AnalysisSynthesizer::NumberEvidence(const domain::ResearchBundle& bundle) {
    std::string today = infrastructure::ToIsoString(std::chrono::system_clock::now()).substr(0, 10);

    std::vector<domain::Evidence> numbered;
    for (const auto* source : {&bundle.demand.evidence, &bundle.trends.evidence}) {
        for (const auto& item : *source) {
            if (numbered.size() >= kMaxEvidence) return numbered;

            domain::Evidence copy = item;
            char id[16];
            std::snprintf(id, sizeof(id), "ref_%03zu", numbered.size() + 1);
            copy.id = id;
            if (copy.date.empty()) copy.date = today;
            numbered.push_back(std::move(copy));
        }
    }
    return numbered;
}

domain::Signals AnalysisSynthesizer::SignalsFor(const domain::ResearchBundle& bundle) {
    domain::Signals signals;
    signals.demand = bundle.demand.signal;
    signals.trend = bundle.trends.signal;
    signals.risk = ResearchCollector::RiskLevelFor(bundle.risks.size());
    return signals;
}

std::string AnalysisSynthesizer::BuildPrompt(const std::string& idea,
                                             const domain::IdeaProfile& profile,
                                             const domain::Signals& signals,
                                             const std::vector<domain::Evidence>& evidence) {
    json evidenceJson = json::array();
    for (const auto& item : evidence) {
        evidenceJson.push_back({
            {"id", item.id},
            {"title", item.title},
            {"date", item.date},
            {"snippet", item.snippet},
            {"url", item.url}
        });
    }

    json input = {
        {"idea_summary", idea},
        {"user_profile", profile},
        {"signals", signals},
        {"evidence", evidenceJson},
        {"max_words", kMaxWords}
    };
    return infrastructure::PromptCatalog::GetSnapshotPrompt(input.dump(2), kMaxWords);
}

domain::SnapshotDraft AnalysisSynthesizer::synthesize(const std::string& idea,
                                                      const domain::IdeaProfile& profile,
                                                      const domain::ResearchBundle& bundle,
                                                      domain::PerformanceLog& run) {
    auto start = std::chrono::steady_clock::now();
    auto evidence = NumberEvidence(bundle);
    auto signals = SignalsFor(bundle);
    std::string prompt = BuildPrompt(idea, profile, signals, evidence);

    run.countCall("llm");
    std::optional<std::string> response;
    try {
        response = m_generator->complete(prompt, kMaxTokens, kTemperature);
    } catch (const std::exception& e) {
        throw domain::SynthesisError(std::string("text generation failed: ") + e.what());
    }
    if (!response) {
        throw domain::SynthesisError("text generation returned no response");
    }

    domain::SnapshotDraft draft = DraftParser::Parse(*response, bundle);
    draft.evidence = std::move(evidence);
    draft.signals = signals;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    if (elapsed > m_budget) {
        std::cerr << "[AnalysisSynthesizer] Analysis took " << elapsed.count() << " ms (budget "
                  << m_budget.count() << " ms)" << std::endl;
    }
    return draft;
}

} // namespace ideasnapshot::application
