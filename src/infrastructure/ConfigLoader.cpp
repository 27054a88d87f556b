/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace ideasnapshot::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] " << path << " not found, using defaults" << std::endl;
        return AppConfig{};
    }

    std::ifstream f(configPath);
    std::stringstream buffer;
    buffer << f.rdbuf();

    auto config = Parse(buffer.str());
    if (!config) {
        std::cerr << "[ConfigLoader] Invalid " << path << ", using defaults" << std::endl;
        return AppConfig{};
    }
    return *config;
}

std::optional<AppConfig> ConfigLoader::Parse(const std::string& text) {
    AppConfig config;
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return std::nullopt;
        }

        if (j.contains("ollama")) {
            const auto& s = j["ollama"];
            ReadKey(s, "host", config.ollamaHost);
            ReadKey(s, "port", config.ollamaPort);
            ReadKey(s, "model", config.ollamaModel);
            ReadKey(s, "timeout_seconds", config.ollamaTimeoutSeconds);
        }

        if (j.contains("evidence_search")) {
            const auto& s = j["evidence_search"];
            ReadKey(s, "host", config.searchHost);
            ReadKey(s, "port", config.searchPort);
            ReadKey(s, "path", config.searchPath);
            ReadKey(s, "timeout_seconds", config.searchTimeoutSeconds);
        }

        ReadKey(j, "data_directory", config.dataDirectory);

        if (j.contains("pipeline")) {
            const auto& s = j["pipeline"];
            ReadKey(s, "research_budget_ms", config.researchBudgetMs);
            ReadKey(s, "analysis_budget_ms", config.analysisBudgetMs);
            ReadKey(s, "target_total_ms", config.targetTotalMs);
        }

        if (j.contains("cache")) {
            const auto& s = j["cache"];
            ReadKey(s, "hot_ttl_seconds", config.hotCacheTtlSeconds);
            ReadKey(s, "research_ttl_seconds", config.researchCacheTtlSeconds);
            ReadKey(s, "max_size", config.maxCacheSize);
            ReadKey(s, "similarity_threshold", config.similarityThreshold);
            ReadKey(s, "similarity_enabled", config.similarityEnabled);
            ReadKey(s, "preload_queue_capacity", config.preloadQueueCapacity);
            ReadKey(s, "warm_count", config.warmCount);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings: " << e.what() << std::endl;
        return std::nullopt;
    }
    return config;
}

} // namespace ideasnapshot::infrastructure
