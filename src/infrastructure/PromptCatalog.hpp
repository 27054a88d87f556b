/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the LLM prompt templates.
 */

#pragma once

#include <string>

namespace ideasnapshot::infrastructure {

class PromptCatalog {
public:
    /**
     * @brief Returns the feasibility snapshot prompt.
     * @param inputJson Pretty-printed input block (idea, profile, signals, evidence, word ceiling).
     * @param maxWords Word ceiling repeated in the requirements.
     */
    static std::string GetSnapshotPrompt(const std::string& inputJson, int maxWords);
};

} // namespace ideasnapshot::infrastructure
