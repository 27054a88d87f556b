/**
 * @file ModelSelector.hpp
 * @brief Picks the generation model from what the Ollama server offers.
 */

#pragma once
#include <string>
#include <vector>

namespace ideasnapshot::infrastructure {

/**
 * @class ModelSelector
 * @brief Separates model selection policy from adapter I/O.
 */
class ModelSelector {
public:
    /**
     * @brief Keeps @p preferred if served, else the first model matching a
     * priority family, else the first available one.
     */
    static std::string SelectBest(const std::vector<std::string>& availableModels,
                                  const std::string& preferred) {
        if (availableModels.empty()) {
            return preferred;
        }

        for (const auto& model : availableModels) {
            if (model == preferred) {
                return preferred;
            }
        }

        // Instruction-following families that reliably emit JSON objects.
        const std::vector<std::string> priorities = {
            "qwen2.5",
            "llama3.1",
            "llama3",
            "mistral"
        };

        for (const auto& priority : priorities) {
            for (const auto& model : availableModels) {
                if (model.find(priority) != std::string::npos) {
                    return model;
                }
            }
        }

        return availableModels[0];
    }
};

} // namespace ideasnapshot::infrastructure
