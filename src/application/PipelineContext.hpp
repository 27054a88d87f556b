/**
 * @file PipelineContext.hpp
 * @brief Collaborators of the snapshot pipeline, built once in main.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include "application/AnalysisSynthesizer.hpp"
#include "application/ResearchOrchestrator.hpp"
#include "application/SnapshotCache.hpp"
#include "domain/SnapshotRepository.hpp"

namespace ideasnapshot::application {

struct PipelineContext {
    std::shared_ptr<domain::SnapshotRepository> repository;
    std::shared_ptr<SnapshotCache> cache;
    std::shared_ptr<ResearchOrchestrator> orchestrator;
    std::shared_ptr<AnalysisSynthesizer> synthesizer;
    std::chrono::milliseconds targetTotal{60000};
    std::function<std::chrono::system_clock::time_point()> clock; ///< Defaults to the system clock.
};

} // namespace ideasnapshot::application
