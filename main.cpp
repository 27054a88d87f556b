#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "application/AnalysisSynthesizer.hpp"
#include "application/PipelineContext.hpp"
#include "application/ResearchOrchestrator.hpp"
#include "application/SnapshotCache.hpp"
#include "application/SnapshotExporter.hpp"
#include "application/SnapshotPipeline.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpEvidenceSearch.hpp"
#include "infrastructure/InMemoryCacheBackend.hpp"
#include "infrastructure/JsonSnapshotRepository.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fs = std::filesystem;
using namespace ideasnapshot;

// === COMMAND LINE ===
struct CliOptions {
    std::string settingsPath = "settings.json";
    std::string idea;
    std::string userId = "local";
    domain::IdeaProfile profile;
    bool useCache = true;
    bool json = false;
    bool showStats = false;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " --idea \"<summary>\" [options]\n"
              << "  --experience none|some|experienced   (default none)\n"
              << "  --budget <5k|5k-25k|25k-100k|100k+    (default <5k)\n"
              << "  --timeline <months>                  (default 6)\n"
              << "  --user <id>                          (default local)\n"
              << "  --settings <path>                    (default settings.json)\n"
              << "  --no-cache                           skip cache lookup and cache write\n"
              << "  --markdown | --json                  output format (default markdown)\n"
              << "  --stats                              print cache and performance statistics\n";
}

std::optional<CliOptions> ParseArguments(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "[CLI] Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--idea") {
            auto value = next();
            if (!value) return std::nullopt;
            options.idea = *value;
        } else if (arg == "--experience") {
            auto value = next();
            if (!value) return std::nullopt;
            auto level = domain::ParseExperience(*value);
            if (!level) {
                std::cerr << "[CLI] Unknown experience level: " << *value << std::endl;
                return std::nullopt;
            }
            options.profile.experience = *level;
        } else if (arg == "--budget") {
            auto value = next();
            if (!value) return std::nullopt;
            auto band = domain::ParseBudgetBand(*value);
            if (!band) {
                std::cerr << "[CLI] Unknown budget band: " << *value << std::endl;
                return std::nullopt;
            }
            options.profile.budgetBand = *band;
        } else if (arg == "--timeline") {
            auto value = next();
            if (!value) return std::nullopt;
            int months = std::atoi(value->c_str());
            if (months <= 0) {
                std::cerr << "[CLI] Timeline must be a positive number of months" << std::endl;
                return std::nullopt;
            }
            options.profile.timelineMonths = months;
        } else if (arg == "--user") {
            auto value = next();
            if (!value) return std::nullopt;
            options.userId = *value;
        } else if (arg == "--settings") {
            auto value = next();
            if (!value) return std::nullopt;
            options.settingsPath = *value;
        } else if (arg == "--no-cache") {
            options.useCache = false;
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--markdown") {
            options.json = false;
        } else if (arg == "--stats") {
            options.showStats = true;
        } else {
            std::cerr << "[CLI] Unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (options.idea.empty() && !options.showStats) {
        return std::nullopt;
    }
    return options;
}

int main(int argc, char** argv) {
    auto options = ParseArguments(argc, argv);
    if (!options) {
        PrintUsage(argv[0]);
        return 2;
    }

    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(options->settingsPath);
    fs::path root = fs::absolute(config.dataDirectory);
    std::cout << "[Main] Data directory: " << root.string() << std::endl;

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repository = std::make_shared<infrastructure::JsonSnapshotRepository>(root.string(), persistence);

    application::CacheSettings cacheSettings;
    cacheSettings.hotTtl = std::chrono::seconds(config.hotCacheTtlSeconds);
    cacheSettings.researchTtl = std::chrono::seconds(config.researchCacheTtlSeconds);
    cacheSettings.maxCacheSize = config.maxCacheSize;
    cacheSettings.similarityThreshold = config.similarityThreshold;
    cacheSettings.similarityEnabled = config.similarityEnabled;
    cacheSettings.preloadCapacity = config.preloadQueueCapacity;
    cacheSettings.warmCount = config.warmCount;

    auto backend = std::make_shared<infrastructure::InMemoryCacheBackend>();
    auto cache = std::make_shared<application::SnapshotCache>(backend, cacheSettings);
    cache->warm(*repository);
    cache->startPreloadWorker();

    auto search = std::make_shared<infrastructure::HttpEvidenceSearch>(
        config.searchHost, config.searchPort, config.searchPath, config.searchTimeoutSeconds);
    auto generator = std::make_shared<infrastructure::OllamaAdapter>(
        config.ollamaHost, config.ollamaPort, config.ollamaModel, config.ollamaTimeoutSeconds);
    generator->initialize();

    application::PipelineContext context;
    context.repository = repository;
    context.cache = cache;
    context.orchestrator = std::make_shared<application::ResearchOrchestrator>(
        search, std::chrono::milliseconds(config.researchBudgetMs));
    context.synthesizer = std::make_shared<application::AnalysisSynthesizer>(
        generator, std::chrono::milliseconds(config.analysisBudgetMs));
    context.targetTotal = std::chrono::milliseconds(config.targetTotalMs);

    application::SnapshotPipeline pipeline(context);

    int exitCode = 0;
    if (!options->idea.empty()) {
        try {
            auto result = pipeline.generateSnapshot(options->userId, options->idea, options->profile, options->useCache);
            if (options->json) {
                std::cout << application::SnapshotExporter::ToJson(result.snapshot) << std::endl;
            } else {
                std::cout << application::SnapshotExporter::ToMarkdown(result.snapshot) << std::endl;
            }
            if (!result.ok()) {
                exitCode = 1;
            }
        } catch (const domain::PersistenceError& e) {
            std::cerr << "[Main] Could not store the generation record: " << e.what() << std::endl;
            exitCode = 1;
        }
    }

    if (options->showStats) {
        std::cout << application::SnapshotExporter::StatisticsToJson(
                         pipeline.getCacheStatistics(), pipeline.getPerformanceMetrics())
                  << std::endl;
    }

    cache->stopPreloadWorker();
    persistence->stop();
    return exitCode;
}
