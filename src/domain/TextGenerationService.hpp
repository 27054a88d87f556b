/**
 * @file TextGenerationService.hpp
 * @brief Interface for LLM-backed text completion.
 */

#pragma once
#include <optional>
#include <string>

namespace ideasnapshot::domain {

/**
 * @class TextGenerationService
 * @brief Abstract interface for services that complete a prompt with an LLM.
 */
class TextGenerationService {
public:
    virtual ~TextGenerationService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Completes a prompt.
     * @param prompt Full prompt text.
     * @param maxTokens Upper bound on generated tokens.
     * @param temperature Sampling temperature.
     * @return The generated text, or nullopt if the call failed (timeout, quota, transport).
     */
    virtual std::optional<std::string> complete(const std::string& prompt, int maxTokens, double temperature) = 0;

    /** @brief Gets the name of the model serving requests. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace ideasnapshot::domain
