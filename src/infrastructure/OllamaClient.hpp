/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace ideasnapshot::infrastructure {

/**
 * @struct GenerateOptions
 * @brief Sampling options forwarded in the "options" object of /api/generate.
 */
struct GenerateOptions {
    int numPredict = 2000;    ///< Upper bound on generated tokens.
    double temperature = 0.7;
    bool forceJson = false;   ///< Sets "format": "json" on the request.
};

class OllamaClient {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param readTimeoutSeconds Read timeout for generation requests.
     */
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 20);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& prompt,
                                        const GenerateOptions& options);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace ideasnapshot::infrastructure
