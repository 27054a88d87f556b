/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access collaborator endpoints, time budgets and
 * cache tuning without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <optional>

namespace ideasnapshot::infrastructure {

/**
 * @struct AppConfig
 * @brief Every tunable of the application. Defaults are production values.
 */
struct AppConfig {
    // Text generation (Ollama)
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "qwen2.5:7b";
    int ollamaTimeoutSeconds = 20;

    // Evidence search service
    std::string searchHost = "localhost";
    int searchPort = 8090;
    std::string searchPath = "/api/search";
    int searchTimeoutSeconds = 10;

    // Storage
    std::string dataDirectory = "data";

    // Pipeline budgets
    long long researchBudgetMs = 25000;
    long long analysisBudgetMs = 20000;
    long long targetTotalMs = 60000;

    // Cache
    int hotCacheTtlSeconds = 3600;
    int researchCacheTtlSeconds = 86400;
    size_t maxCacheSize = 1000;
    double similarityThreshold = 0.85;
    bool similarityEnabled = true;
    size_t preloadQueueCapacity = 100;
    size_t warmCount = 20;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json into an AppConfig.
     * @param path Path to the settings file.
     * @return Configuration; keys missing from the file keep their defaults.
     *         A missing or malformed file yields the defaults.
     */
    static AppConfig Load(const std::string& path);

    /**
     * @brief Parses settings from JSON text.
     * @return nullopt if @p text is not a JSON object.
     */
    static std::optional<AppConfig> Parse(const std::string& text);
};

} // namespace ideasnapshot::infrastructure
