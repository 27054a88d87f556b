/**
 * @file SnapshotPipeline.cpp
 * @brief Implementation of SnapshotPipeline.
 */

#include "application/SnapshotPipeline.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <variant>
#include "domain/Errors.hpp"
#include "infrastructure/Hashing.hpp"

namespace ideasnapshot::application {

std::string ToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Start: return "start";
        case PipelineStage::CacheLookup: return "cache_lookup";
        case PipelineStage::Research: return "research";
        case PipelineStage::Analysis: return "analysis";
        case PipelineStage::Persist: return "persist";
        case PipelineStage::CacheWrite: return "cache_write";
        case PipelineStage::PersistFailure: return "persist_failure";
        case PipelineStage::Done: return "done";
    }
    return "start";
}

std::string ToString(GenerationErrorKind kind) {
    switch (kind) {
        case GenerationErrorKind::InvalidInput: return "invalid_input";
        case GenerationErrorKind::Synthesis: return "synthesis";
        case GenerationErrorKind::Persistence: return "persistence";
        case GenerationErrorKind::Internal: return "internal";
    }
    return "internal";
}

SnapshotPipeline::SnapshotPipeline(const PipelineContext& context)
    : m_context(context),
      m_metrics(context.targetTotal.count()) {
    if (!m_context.repository || !m_context.orchestrator || !m_context.synthesizer) {
        throw std::invalid_argument("SnapshotPipeline requires a repository, an orchestrator and a synthesizer");
    }
}

std::chrono::system_clock::time_point SnapshotPipeline::now() const {
    return m_context.clock ? m_context.clock() : std::chrono::system_clock::now();
}

long long SnapshotPipeline::ElapsedMs(Steady::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Steady::now() - since).count();
}

std::string SnapshotPipeline::DefaultIdeaName(const std::string& ideaSummary) {
    std::string name = ideaSummary.substr(0, ideaSummary.find('.'));
    size_t first = name.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return ideaSummary.substr(0, 255);
    size_t last = name.find_last_not_of(" \t\r\n");
    name = name.substr(first, last - first + 1);
    if (name.size() > 255) name.resize(255);
    return name;
}

int SnapshotPipeline::CountWords(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    int count = 0;
    while (stream >> word) ++count;
    return count;
}

GenerationResult SnapshotPipeline::generateSnapshot(const std::string& userId,
                                                    const std::string& ideaSummary,
                                                    const domain::IdeaProfile& profile,
                                                    bool useCache) {
    const auto started = Steady::now();
    PipelineStage stage = PipelineStage::Start;

    domain::PerformanceLog run;
    run.createdAt = now();
    bool snapshotStored = false; ///< A record for this request already exists.

    try {
        if (domain::NormalizeIdea(ideaSummary).empty()) {
            throw std::invalid_argument("idea summary is empty");
        }

        std::optional<domain::ResearchBundle> cachedResearch;
        if (useCache && m_context.cache) {
            stage = PipelineStage::CacheLookup;
            const auto lookupStarted = Steady::now();
            CacheLookup lookup = m_context.cache->lookup(ideaSummary, profile);
            run.cacheLookupTimeMs = ElapsedMs(lookupStarted);

            if (auto* exact = std::get_if<ExactHit>(&lookup)) {
                snapshotStored = true;
                return serveCached(std::move(exact->snapshot), run, started);
            }
            if (auto* similar = std::get_if<SimilarHit>(&lookup)) {
                std::cout << "[SnapshotPipeline] Serving similar snapshot " << similar->snapshot.id
                          << " (similarity " << similar->similarity << ")" << std::endl;
                snapshotStored = true;
                return serveCached(std::move(similar->snapshot), run, started);
            }
            if (auto* partial = std::get_if<PartialResearch>(&lookup)) {
                cachedResearch = std::move(partial->bundle);
                run.cacheHits = 1;
                run.usedCache = true;
            } else {
                run.cacheMisses = 1;
            }
        }

        stage = PipelineStage::Research;
        domain::ResearchBundle bundle;
        if (cachedResearch) {
            bundle = std::move(*cachedResearch);
            run.researchTimeMs = 0;
        } else {
            const auto researchStarted = Steady::now();
            bundle = m_context.orchestrator->gather(ideaSummary, profile, run);
            run.researchTimeMs = ElapsedMs(researchStarted);
        }

        stage = PipelineStage::Analysis;
        const auto analysisStarted = Steady::now();
        domain::SnapshotDraft draft = m_context.synthesizer->synthesize(ideaSummary, profile, bundle, run);
        run.analysisTimeMs = ElapsedMs(analysisStarted);

        stage = PipelineStage::Persist;
        domain::Snapshot snapshot = buildSnapshot(userId, ideaSummary, profile, std::move(draft));
        snapshot.researchTimeMs = run.researchTimeMs;
        snapshot.analysisTimeMs = run.analysisTimeMs;
        snapshot.generationTimeMs = ElapsedMs(started);
        m_context.repository->saveSnapshot(snapshot);
        snapshotStored = true;

        run.snapshotId = snapshot.id;
        run.totalTimeMs = ElapsedMs(started);
        m_context.repository->appendPerformanceLog(run);

        if (useCache) {
            stage = PipelineStage::CacheWrite;
            writeCache(snapshot, run.usedCache ? nullptr : &bundle);
        }

        stage = PipelineStage::Done;
        m_metrics.record(run.totalTimeMs, run.usedCache, false);
        if (run.totalTimeMs > m_context.targetTotal.count()) {
            std::cerr << "[SnapshotPipeline] Generation took " << run.totalTimeMs
                      << "ms, above the " << m_context.targetTotal.count() << "ms target" << std::endl;
        }
        std::cout << "[SnapshotPipeline] Snapshot " << snapshot.id << " generated in "
                  << run.totalTimeMs << "ms" << std::endl;

        GenerationResult result;
        result.snapshot = std::move(snapshot);
        result.performance = std::move(run);
        return result;
    } catch (const std::invalid_argument& e) {
        return persistFailure(userId, ideaSummary, profile,
                              GenerationError{GenerationErrorKind::InvalidInput, stage, e.what()}, run, started);
    } catch (const domain::SynthesisError& e) {
        return persistFailure(userId, ideaSummary, profile,
                              GenerationError{GenerationErrorKind::Synthesis, stage, e.what()}, run, started);
    } catch (const domain::PersistenceError& e) {
        if (snapshotStored) {
            // Only the performance row is missing; a failure record would duplicate the run.
            std::cerr << "[SnapshotPipeline] Performance log write failed at stage " << ToString(stage)
                      << ": " << e.what() << std::endl;
            throw;
        }
        return persistFailure(userId, ideaSummary, profile,
                              GenerationError{GenerationErrorKind::Persistence, stage, e.what()}, run, started);
    } catch (const std::exception& e) {
        return persistFailure(userId, ideaSummary, profile,
                              GenerationError{GenerationErrorKind::Internal, stage, e.what()}, run, started);
    }
}

GenerationResult SnapshotPipeline::serveCached(domain::Snapshot snapshot,
                                               domain::PerformanceLog& run,
                                               Steady::time_point started) {
    snapshot.status = domain::SnapshotStatus::Cached;
    snapshot.researchTimeMs = 0;
    snapshot.analysisTimeMs = 0;
    snapshot.generationTimeMs = run.cacheLookupTimeMs;

    run.snapshotId = snapshot.id;
    run.totalTimeMs = run.cacheLookupTimeMs;
    run.cacheHits = 1;
    run.usedCache = true;
    m_context.repository->appendPerformanceLog(run);

    m_metrics.record(run.totalTimeMs, true, false);
    std::cout << "[SnapshotPipeline] Cache hit for snapshot " << snapshot.id
              << " in " << ElapsedMs(started) << "ms" << std::endl;

    GenerationResult result;
    result.snapshot = std::move(snapshot);
    result.fromCache = true;
    result.performance = run;
    return result;
}

domain::Snapshot SnapshotPipeline::buildSnapshot(const std::string& userId,
                                                 const std::string& ideaSummary,
                                                 const domain::IdeaProfile& profile,
                                                 domain::SnapshotDraft draft) const {
    domain::Snapshot snapshot;
    snapshot.id = infrastructure::GenerateId();
    snapshot.userId = userId;
    snapshot.ideaName = draft.ideaName.empty() ? DefaultIdeaName(ideaSummary) : draft.ideaName.substr(0, 255);
    snapshot.ideaSummary = ideaSummary;
    snapshot.userProfile = profile;
    snapshot.viabilityScore = domain::ClampScore(draft.viabilityScore);
    snapshot.scoreRange = domain::ScoreRangeFor(snapshot.viabilityScore);
    snapshot.scoreRationale = std::move(draft.scoreRationale);
    snapshot.leanTiles = std::move(draft.leanTiles);
    snapshot.competitors = std::move(draft.competitors);
    snapshot.priceBand = std::move(draft.priceBand);
    snapshot.nextSteps = std::move(draft.nextSteps);
    snapshot.evidence = std::move(draft.evidence);
    snapshot.signals = draft.signals;
    snapshot.wordCount = CountWords(ideaSummary);
    snapshot.createdAt = now();
    snapshot.status = domain::SnapshotStatus::Completed;
    return snapshot;
}

void SnapshotPipeline::writeCache(const domain::Snapshot& snapshot, const domain::ResearchBundle* bundle) {
    if (!m_context.cache) return;
    try {
        m_context.cache->store(snapshot, bundle);
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotPipeline] Cache write skipped for " << snapshot.id << ": " << e.what() << std::endl;
    }
}

GenerationResult SnapshotPipeline::persistFailure(const std::string& userId,
                                                  const std::string& ideaSummary,
                                                  const domain::IdeaProfile& profile,
                                                  GenerationError error,
                                                  domain::PerformanceLog& run,
                                                  Steady::time_point started) {
    std::cerr << "[SnapshotPipeline] Stage " << ToString(error.stage) << " failed ("
              << ToString(error.kind) << "): " << error.message << std::endl;

    domain::Snapshot failed;
    failed.id = infrastructure::GenerateId();
    failed.userId = userId;
    failed.ideaName = "Failed Analysis";
    failed.ideaSummary = ideaSummary;
    failed.userProfile = profile;
    failed.viabilityScore = 0;
    failed.scoreRange = domain::ScoreRange::VeryLow;
    failed.scoreRationale = "Analysis failed: " + error.message;
    failed.researchTimeMs = run.researchTimeMs;
    failed.analysisTimeMs = run.analysisTimeMs;
    failed.generationTimeMs = ElapsedMs(started);
    failed.createdAt = now();
    failed.status = domain::SnapshotStatus::Failed;

    run.hadErrors = true;
    run.errorDetails.push_back(error.message);
    run.snapshotId = failed.id;
    run.totalTimeMs = failed.generationTimeMs;

    m_metrics.record(run.totalTimeMs, run.usedCache, true);

    // PersistenceError from here on reaches the caller.
    m_context.repository->saveSnapshot(failed);
    m_context.repository->appendPerformanceLog(run);

    GenerationResult result;
    result.snapshot = std::move(failed);
    result.performance = run;
    result.error = std::move(error);
    return result;
}

std::optional<domain::Snapshot> SnapshotPipeline::getSnapshot(const std::string& id) {
    return m_context.repository->findSnapshot(id);
}

std::vector<domain::Snapshot> SnapshotPipeline::listSnapshots(const std::string& userId,
                                                              std::chrono::system_clock::time_point since) {
    return m_context.repository->findByUser(userId, since);
}

PerformanceMetrics SnapshotPipeline::getPerformanceMetrics() const {
    return m_metrics.snapshot();
}

CacheStatistics SnapshotPipeline::getCacheStatistics() {
    if (!m_context.cache) return CacheStatistics{};
    return m_context.cache->statistics();
}

} // namespace ideasnapshot::application
