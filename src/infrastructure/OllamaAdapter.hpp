/**
 * @file OllamaAdapter.hpp
 * @brief Adapter for text completion on a local Ollama server.
 */

#pragma once
#include "domain/TextGenerationService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <mutex>
#include <string>

namespace ideasnapshot::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements TextGenerationService using the Ollama REST API.
 */
class OllamaAdapter : public domain::TextGenerationService {
public:
    /**
     * @brief Constructor for OllamaAdapter.
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Preferred model name.
     * @param readTimeoutSeconds Per-request read timeout.
     */
    OllamaAdapter(const std::string& host = "localhost",
                  int port = 11434,
                  const std::string& model = "qwen2.5:7b",
                  int readTimeoutSeconds = 20);

    /** @brief Detects the best served model. Keeps the preferred one if detection fails. */
    void initialize() override;

    /** @see domain::TextGenerationService::complete */
    std::optional<std::string> complete(const std::string& prompt, int maxTokens, double temperature) override;

    std::string getCurrentModel() const override;

private:
    OllamaClient m_client;
    mutable std::mutex m_modelMutex;
    std::string m_model; ///< Target model name.
};

} // namespace ideasnapshot::infrastructure
