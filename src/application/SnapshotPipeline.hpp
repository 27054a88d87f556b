/**
 * @file SnapshotPipeline.hpp
 * @brief Coordinator of one snapshot generation: cache, research, analysis, persistence.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "application/GenerationMetrics.hpp"
#include "application/PipelineContext.hpp"
#include "domain/IdeaProfile.hpp"
#include "domain/PerformanceLog.hpp"
#include "domain/Snapshot.hpp"

namespace ideasnapshot::application {

enum class PipelineStage {
    Start,
    CacheLookup,
    Research,
    Analysis,
    Persist,
    CacheWrite,
    PersistFailure,
    Done
};

std::string ToString(PipelineStage stage);

enum class GenerationErrorKind {
    InvalidInput,
    Synthesis,
    Persistence,
    Internal
};

std::string ToString(GenerationErrorKind kind);

struct GenerationError {
    GenerationErrorKind kind = GenerationErrorKind::Internal;
    PipelineStage stage = PipelineStage::Start;
    std::string message;
};

/**
 * @struct GenerationResult
 * @brief Outcome of generateSnapshot. On failure @c snapshot is the persisted terminal record.
 */
struct GenerationResult {
    domain::Snapshot snapshot;
    bool fromCache = false;
    domain::PerformanceLog performance;
    std::optional<GenerationError> error;

    bool ok() const { return !error.has_value(); }
};

/**
 * @class SnapshotPipeline
 * @brief Runs START -> CACHE_LOOKUP -> RESEARCH -> ANALYSIS -> PERSIST -> CACHE_WRITE -> DONE.
 *
 * Any stage failure moves to PERSIST_FAILURE, which stores a failed snapshot and its
 * performance row. A PersistenceError raised while storing that record propagates, as does
 * one from the performance row of a run whose snapshot is already stored or served from cache.
 * Safe to call concurrently; the cache is the only shared mutable collaborator.
 */
class SnapshotPipeline {
public:
    explicit SnapshotPipeline(const PipelineContext& context);

    GenerationResult generateSnapshot(const std::string& userId,
                                      const std::string& ideaSummary,
                                      const domain::IdeaProfile& profile,
                                      bool useCache = true);

    std::optional<domain::Snapshot> getSnapshot(const std::string& id);
    std::vector<domain::Snapshot> listSnapshots(const std::string& userId,
                                                std::chrono::system_clock::time_point since);
    PerformanceMetrics getPerformanceMetrics() const;
    CacheStatistics getCacheStatistics();

    /** @brief Title of a snapshot without a model-proposed name: first sentence, at most 255 chars. */
    static std::string DefaultIdeaName(const std::string& ideaSummary);
    static int CountWords(const std::string& text);

private:
    using Steady = std::chrono::steady_clock;

    std::chrono::system_clock::time_point now() const;
    static long long ElapsedMs(Steady::time_point since);

    GenerationResult serveCached(domain::Snapshot snapshot,
                                 domain::PerformanceLog& run,
                                 Steady::time_point started);
    domain::Snapshot buildSnapshot(const std::string& userId,
                                   const std::string& ideaSummary,
                                   const domain::IdeaProfile& profile,
                                   domain::SnapshotDraft draft) const;
    void writeCache(const domain::Snapshot& snapshot, const domain::ResearchBundle* bundle);
    GenerationResult persistFailure(const std::string& userId,
                                    const std::string& ideaSummary,
                                    const domain::IdeaProfile& profile,
                                    GenerationError error,
                                    domain::PerformanceLog& run,
                                    Steady::time_point started);

    PipelineContext m_context;
    GenerationMetrics m_metrics;
};

} // namespace ideasnapshot::application
