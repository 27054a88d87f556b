/**
 * @file AnalysisSynthesizer.hpp
 * @brief Turns a ResearchBundle into a SnapshotDraft with one LLM call.
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "domain/IdeaProfile.hpp"
#include "domain/PerformanceLog.hpp"
#include "domain/ResearchBundle.hpp"
#include "domain/Snapshot.hpp"
#include "domain/TextGenerationService.hpp"

namespace ideasnapshot::application {

/**
 * @class AnalysisSynthesizer
 * @brief Builds the prompt, invokes the text generator once and parses the answer.
 */
class AnalysisSynthesizer {
public:
    static constexpr size_t kMaxEvidence = 20;
    static constexpr int kMaxWords = 500;
    static constexpr int kMaxTokens = 2000;
    static constexpr double kTemperature = 0.7;

    AnalysisSynthesizer(std::shared_ptr<domain::TextGenerationService> generator,
                        std::chrono::milliseconds budget = std::chrono::milliseconds(20000));

    /**
     * @brief Produces the analysis for one idea.
     * @param run Receives the `llm` call count.
     * @throws domain::SynthesisError if the generator returns nothing or throws.
     */
    domain::SnapshotDraft synthesize(const std::string& idea,
                                     const domain::IdeaProfile& profile,
                                     const domain::ResearchBundle& bundle,
                                     domain::PerformanceLog& run);

    /** @brief Demand then trend evidence, renumbered ref_001.., at most kMaxEvidence items. */
    static std::vector<domain::Evidence> NumberEvidence(const domain::ResearchBundle& bundle);

    /** @brief Demand, trend and risk-summary signals of a bundle. */
    static domain::Signals SignalsFor(const domain::ResearchBundle& bundle);

    static std::string BuildPrompt(const std::string& idea,
                                   const domain::IdeaProfile& profile,
                                   const domain::Signals& signals,
                                   const std::vector<domain::Evidence>& evidence);

private:
    std::shared_ptr<domain::TextGenerationService> m_generator;
    std::chrono::milliseconds m_budget;
};

} // namespace ideasnapshot::application
