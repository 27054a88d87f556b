/**
 * @file SnapshotCache.hpp
 * @brief Multi-tier snapshot cache: exact hot entries, similar ideas and reusable research.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include "application/PreloadQueue.hpp"
#include "application/SimilarityIndex.hpp"
#include "domain/CacheBackend.hpp"
#include "domain/IdeaProfile.hpp"
#include "domain/ResearchBundle.hpp"
#include "domain/Snapshot.hpp"
#include "domain/SnapshotRepository.hpp"

namespace ideasnapshot::application {

/**
 * @struct CacheSettings
 * @brief Tunables of the cache tiers.
 */
struct CacheSettings {
    std::chrono::seconds hotTtl{3600};
    std::chrono::seconds researchTtl{86400};
    std::chrono::seconds preloadProcessingTtl{60};
    size_t maxCacheSize = 1000;
    double similarityThreshold = 0.85;
    bool similarityEnabled = true;
    size_t similarityCandidates = 100;
    std::chrono::hours similarityWindow{24};
    size_t preloadCapacity = 100;
    size_t warmCount = 20;
};

struct CacheStatistics {
    long long hits = 0;             ///< Exact hot-cache hits.
    long long misses = 0;           ///< Full misses.
    long long similarityHits = 0;
    long long partialHits = 0;      ///< Research-cache hits.
    long long evictions = 0;
    long long preloadQueued = 0;
    long long preloadDropped = 0;
    double hitRate = 0.0;           ///< (hits + similarityHits) / lookups.
    size_t hotCacheSize = 0;
    size_t researchCacheSize = 0;
    size_t maxCacheSize = 0;
    long long cacheTtlSeconds = 0;
    double similarityThreshold = 0.0;
};

/** @brief The normalized idea and profile were cached verbatim. */
struct ExactHit {
    domain::Snapshot snapshot;
};

/** @brief A recent snapshot of a near-identical idea with a compatible profile. */
struct SimilarHit {
    domain::Snapshot snapshot;
    double similarity = 0.0;
};

/** @brief Research for this idea is cached; synthesis is still required. */
struct PartialResearch {
    domain::ResearchBundle bundle;
};

struct CacheMiss {};

using CacheLookup = std::variant<CacheMiss, ExactHit, SimilarHit, PartialResearch>;

/**
 * @class SnapshotCache
 * @brief Cache facade over a CacheBackend plus the in-memory similarity corpus.
 *
 * Backend faults never escape: they are logged and the affected step behaves
 * as a miss or a no-op. Safe for concurrent use.
 *
 * Key layout (every key embeds sha256 of the normalized idea):
 *   snapshot:hot:<idea>:<entry>   Snapshot JSON
 *   snapshot:meta:<idea>:<entry>  access metadata for LRU ranking
 *   snapshot:idea:<idea>          id of the last stored snapshot
 *   snapshot:research:<idea>      ResearchBundle with hit count and validity
 *   snapshot:preload:<idea>       in-flight marker of the preload worker
 */
class SnapshotCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using PreloadHandler = std::function<void(const PreloadRequest&)>;

    SnapshotCache(std::shared_ptr<domain::CacheBackend> backend,
                  CacheSettings settings = CacheSettings{},
                  Clock clock = nullptr);
    ~SnapshotCache();

    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;

    /** @brief Tries the hot tier, then similarity, then the research tier. */
    CacheLookup lookup(const std::string& idea, const domain::IdeaProfile& profile, bool useSimilarity = true);

    /**
     * @brief Writes a completed snapshot to every tier, then enforces the size budget.
     * @param bundle Research to cache for the idea, or nullptr to leave that tier untouched.
     */
    void store(const domain::Snapshot& snapshot, const domain::ResearchBundle* bundle = nullptr);

    /** @brief Evicts least-recently-accessed hot entries above the budget. Returns the count evicted. */
    size_t manageSize();

    /**
     * @brief Removes every key of @p idea, or of the whole cache when empty.
     * @return Number of backend keys removed.
     */
    size_t invalidate(const std::optional<std::string>& idea = std::nullopt);

    /** @brief Loads the most recent completed snapshots. Returns how many were loaded. */
    size_t warm(domain::SnapshotRepository& repository);

    CacheStatistics statistics();

    /** @brief Starts the background consumer of the preload queue. */
    void startPreloadWorker(PreloadHandler handler = nullptr);
    void stopPreloadWorker();
    size_t pendingPreloads() const { return m_preloadQueue.size(); }

    const CacheSettings& settings() const { return m_settings; }

    static std::string IdeaHash(const std::string& idea);
    static std::string HotKey(const std::string& idea, const domain::IdeaProfile& profile);
    static std::string MetaKey(const std::string& idea, const domain::IdeaProfile& profile);
    static std::string IdeaKey(const std::string& idea);
    static std::string ResearchKey(const std::string& idea);
    static std::string PreloadKey(const std::string& ideaHash);

private:
    std::chrono::system_clock::time_point now() const;

    std::optional<domain::Snapshot> readHot(const std::string& key);
    bool writeHot(const domain::Snapshot& snapshot,
                  const std::string& idea,
                  const domain::IdeaProfile& profile,
                  const std::string& hitType);
    void recordHit(const std::string& metaKey, const std::string& hitType);
    std::optional<domain::ResearchBundle> takeResearch(const std::string& idea);
    void writeResearch(const std::string& idea, const domain::ResearchBundle& bundle);
    void queuePreload(const std::string& idea, const domain::IdeaProfile& profile);
    void preloadLoop();
    void processPreload(const PreloadRequest& request);

    std::shared_ptr<domain::CacheBackend> m_backend;
    CacheSettings m_settings;
    Clock m_clock;
    SimilarityIndex m_index;
    PreloadQueue m_preloadQueue;

    std::thread m_preloadWorker;
    PreloadHandler m_preloadHandler;

    std::mutex m_evictionMutex; ///< Held for the whole of manageSize().
    std::atomic<long long> m_accessSeq{0};
    std::atomic<long long> m_hits{0};
    std::atomic<long long> m_misses{0};
    std::atomic<long long> m_similarityHits{0};
    std::atomic<long long> m_partialHits{0};
    std::atomic<long long> m_evictions{0};
    std::atomic<long long> m_preloadQueued{0};
    std::atomic<long long> m_preloadDropped{0};
};

} // namespace ideasnapshot::application
