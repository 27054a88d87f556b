/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/ModelSelector.hpp"
#include <iostream>

namespace ideasnapshot::infrastructure {

OllamaAdapter::OllamaAdapter(const std::string& host, int port, const std::string& model, int readTimeoutSeconds)
    : m_client(host, port, readTimeoutSeconds), m_model(model) {}

void OllamaAdapter::initialize() {
    auto models = m_client.getAvailableModels();
    if (models.empty()) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Keeping default: "
                  << getCurrentModel() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_modelMutex);
    std::string selected = ModelSelector::SelectBest(models, m_model);
    if (selected != m_model) {
        std::cout << "[OllamaAdapter] Auto-selected model: " << selected << std::endl;
        m_model = selected;
    }
}

std::optional<std::string> OllamaAdapter::complete(const std::string& prompt, int maxTokens, double temperature) {
    GenerateOptions options;
    options.numPredict = maxTokens;
    options.temperature = temperature;

    std::string model = getCurrentModel();
    std::cout << "[OllamaAdapter] Sending request to " << model
              << " PromptSize=" << prompt.size() << " bytes" << std::endl;

    auto response = m_client.generate(model, prompt, options);
    if (response) {
        std::cout << "[OllamaAdapter] Response received (" << response->size() << " bytes)" << std::endl;
    }
    return response;
}

std::string OllamaAdapter::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

} // namespace ideasnapshot::infrastructure
