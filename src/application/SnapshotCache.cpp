/**
 * @file SnapshotCache.cpp
 * @brief Implementation of SnapshotCache.
 */

#include "application/SnapshotCache.hpp"
#include "infrastructure/Hashing.hpp"
#include "infrastructure/SnapshotJson.hpp"
#include <algorithm>
#include <iostream>
#include <tuple>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ideasnapshot::application {

namespace {

const std::string kPrefix = "snapshot:";
const std::string kHotPrefix = "snapshot:hot:";
const std::string kMetaPrefix = "snapshot:meta:";
const std::string kResearchPrefix = "snapshot:research:";

void LogCacheError(const char* operation, const std::string& key, const domain::CacheError& error) {
    std::cerr << "[SnapshotCache] " << operation << " " << key << " failed: " << error.message << std::endl;
}

std::string EntryHash(const std::string& idea, const domain::IdeaProfile& profile) {
    return infrastructure::Sha256Hex(domain::NormalizeIdea(idea) + ":" + profile.canonical());
}

} // namespace

SnapshotCache::SnapshotCache(std::shared_ptr<domain::CacheBackend> backend, CacheSettings settings, Clock clock)
    : m_backend(std::move(backend)),
      m_settings(settings),
      m_clock(clock),
      m_index(settings.similarityCandidates, settings.similarityWindow, clock),
      m_preloadQueue(settings.preloadCapacity) {}

SnapshotCache::~SnapshotCache() {
    stopPreloadWorker();
}

std::chrono::system_clock::time_point SnapshotCache::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

std::string SnapshotCache::IdeaHash(const std::string& idea) {
    return infrastructure::Sha256Hex(domain::NormalizeIdea(idea));
}

std::string SnapshotCache::HotKey(const std::string& idea, const domain::IdeaProfile& profile) {
    return kHotPrefix + IdeaHash(idea) + ":" + EntryHash(idea, profile);
}

std::string SnapshotCache::MetaKey(const std::string& idea, const domain::IdeaProfile& profile) {
    return kMetaPrefix + IdeaHash(idea) + ":" + EntryHash(idea, profile);
}

std::string SnapshotCache::IdeaKey(const std::string& idea) {
    return kPrefix + "idea:" + IdeaHash(idea);
}

std::string SnapshotCache::ResearchKey(const std::string& idea) {
    return kResearchPrefix + IdeaHash(idea);
}

std::string SnapshotCache::PreloadKey(const std::string& ideaHash) {
    return kPrefix + "preload:" + ideaHash;
}

// --- Lookup ---

CacheLookup SnapshotCache::lookup(const std::string& idea, const domain::IdeaProfile& profile, bool useSimilarity) {
    // 1. Exact match
    std::string hotKey = HotKey(idea, profile);
    if (auto snapshot = readHot(hotKey)) {
        ++m_hits;
        recordHit(MetaKey(idea, profile), "exact");
        return ExactHit{std::move(*snapshot)};
    }

    // 2. Similar idea, compatible profile
    if (useSimilarity && m_settings.similarityEnabled) {
        if (auto match = m_index.findBest(idea, profile, m_settings.similarityThreshold)) {
            ++m_similarityHits;
            if (writeHot(match->snapshot, idea, profile, "similarity")) {
                manageSize();
            }
            return SimilarHit{std::move(match->snapshot), match->similarity};
        }
    }

    // 3. Research only
    if (auto bundle = takeResearch(idea)) {
        ++m_partialHits;
        queuePreload(idea, profile);
        return PartialResearch{std::move(*bundle)};
    }

    ++m_misses;
    queuePreload(idea, profile);
    return CacheMiss{};
}

std::optional<domain::Snapshot> SnapshotCache::readHot(const std::string& key) {
    auto cached = m_backend->getCache(key);
    if (!cached) {
        LogCacheError("get", key, cached.error());
        return std::nullopt;
    }
    if (!cached.value()) return std::nullopt;

    try {
        return json::parse(*cached.value()).get<domain::Snapshot>();
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotCache] Corrupt entry " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

void SnapshotCache::recordHit(const std::string& metaKey, const std::string& hitType) {
    json meta = json::object();
    auto cached = m_backend->getCache(metaKey);
    if (!cached) {
        LogCacheError("get", metaKey, cached.error());
        return;
    }
    if (cached.value()) {
        json parsed = json::parse(*cached.value(), nullptr, false);
        if (parsed.is_object()) meta = parsed;
    }

    meta["access_count"] = meta.value("access_count", 0) + 1;
    meta["last_accessed"] = infrastructure::ToEpochMillis(now());
    meta["access_seq"] = ++m_accessSeq;
    meta["last_hit_type"] = hitType;

    auto written = m_backend->setCache(metaKey, meta.dump(), m_settings.hotTtl);
    if (!written) LogCacheError("set", metaKey, written.error());
}

std::optional<domain::ResearchBundle> SnapshotCache::takeResearch(const std::string& idea) {
    std::string key = ResearchKey(idea);
    auto cached = m_backend->getCache(key);
    if (!cached) {
        LogCacheError("get", key, cached.error());
        return std::nullopt;
    }
    if (!cached.value()) return std::nullopt;

    json entry = json::parse(*cached.value(), nullptr, false);
    if (entry.is_discarded() || !entry.is_object() || !entry.contains("bundle")) {
        std::cerr << "[SnapshotCache] Corrupt research entry " << key << std::endl;
        return std::nullopt;
    }

    long long nowMs = infrastructure::ToEpochMillis(now());
    long long expiresAt = entry.value("expires_at", 0LL);
    if (!entry.value("is_valid", false) || expiresAt <= nowMs) {
        return std::nullopt;
    }

    domain::ResearchBundle bundle;
    try {
        bundle = entry["bundle"].get<domain::ResearchBundle>();
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotCache] Corrupt research bundle " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    entry["hit_count"] = entry.value("hit_count", 0) + 1;
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds(expiresAt - nowMs));
    auto written = m_backend->setCache(key, entry.dump(), std::max(remaining, std::chrono::seconds(1)));
    if (!written) LogCacheError("set", key, written.error());
    return bundle;
}

// --- Store ---

void SnapshotCache::store(const domain::Snapshot& snapshot, const domain::ResearchBundle* bundle) {
    writeHot(snapshot, snapshot.ideaSummary, snapshot.userProfile, "store");

    std::string ideaKey = IdeaKey(snapshot.ideaSummary);
    auto written = m_backend->setCache(ideaKey, snapshot.id, m_settings.hotTtl);
    if (!written) LogCacheError("set", ideaKey, written.error());

    if (bundle) {
        writeResearch(snapshot.ideaSummary, *bundle);
    }

    m_index.add(snapshot);
    manageSize();
}

bool SnapshotCache::writeHot(const domain::Snapshot& snapshot,
                             const std::string& idea,
                             const domain::IdeaProfile& profile,
                             const std::string& hitType) {
    std::string hotKey = HotKey(idea, profile);
    json value = snapshot;
    auto written = m_backend->setCache(hotKey, value.dump(), m_settings.hotTtl);
    if (!written) {
        LogCacheError("set", hotKey, written.error());
        return false;
    }

    long long nowMs = infrastructure::ToEpochMillis(now());
    json meta = {
        {"stored_at", nowMs},
        {"last_accessed", nowMs},
        {"access_seq", ++m_accessSeq},
        {"access_count", 0},
        {"last_hit_type", hitType},
        {"idea_hash", IdeaHash(idea)}
    };
    std::string metaKey = MetaKey(idea, profile);
    auto metaWritten = m_backend->setCache(metaKey, meta.dump(), m_settings.hotTtl);
    if (!metaWritten) LogCacheError("set", metaKey, metaWritten.error());
    return true;
}

void SnapshotCache::writeResearch(const std::string& idea, const domain::ResearchBundle& bundle) {
    std::string key = ResearchKey(idea);
    json entry = {
        {"bundle", bundle},
        {"hit_count", 0},
        {"is_valid", true},
        {"expires_at", infrastructure::ToEpochMillis(now() + m_settings.researchTtl)}
    };
    auto written = m_backend->setCache(key, entry.dump(), m_settings.researchTtl);
    if (!written) LogCacheError("set", key, written.error());
}

size_t SnapshotCache::manageSize() {
    std::lock_guard<std::mutex> lock(m_evictionMutex);

    auto scanned = m_backend->scanKeys(kHotPrefix + "*");
    if (!scanned) {
        LogCacheError("scan", kHotPrefix + "*", scanned.error());
        return 0;
    }
    const auto& hotKeys = scanned.value();
    if (hotKeys.size() <= m_settings.maxCacheSize) return 0;

    // (last_accessed, access_seq, hot key); entries without metadata rank oldest.
    std::vector<std::tuple<long long, long long, std::string>> ranked;
    ranked.reserve(hotKeys.size());
    for (const auto& hotKey : hotKeys) {
        std::string metaKey = kMetaPrefix + hotKey.substr(kHotPrefix.size());
        long long lastAccessed = 0;
        long long seq = 0;
        auto meta = m_backend->getCache(metaKey);
        if (meta && meta.value()) {
            json parsed = json::parse(*meta.value(), nullptr, false);
            if (parsed.is_object()) {
                lastAccessed = parsed.value("last_accessed", 0LL);
                seq = parsed.value("access_seq", 0LL);
            }
        } else if (!meta) {
            LogCacheError("get", metaKey, meta.error());
        }
        ranked.emplace_back(lastAccessed, seq, hotKey);
    }
    std::sort(ranked.begin(), ranked.end());

    size_t excess = hotKeys.size() - m_settings.maxCacheSize;
    size_t evicted = 0;
    for (size_t i = 0; i < excess; ++i) {
        const std::string& hotKey = std::get<2>(ranked[i]);
        auto removed = m_backend->remove(hotKey);
        if (!removed) {
            LogCacheError("remove", hotKey, removed.error());
            continue;
        }
        auto metaRemoved = m_backend->remove(kMetaPrefix + hotKey.substr(kHotPrefix.size()));
        if (!metaRemoved) LogCacheError("remove", hotKey, metaRemoved.error());
        ++evicted;
    }

    m_evictions += static_cast<long long>(evicted);
    std::cout << "[SnapshotCache] Evicted " << evicted << " cache entries" << std::endl;
    return evicted;
}

// --- Maintenance ---

size_t SnapshotCache::invalidate(const std::optional<std::string>& idea) {
    std::string pattern = idea ? kPrefix + "*" + IdeaHash(*idea) + "*" : kPrefix + "*";

    auto scanned = m_backend->scanKeys(pattern);
    if (!scanned) {
        LogCacheError("scan", pattern, scanned.error());
        return 0;
    }

    size_t count = 0;
    for (const auto& key : scanned.value()) {
        auto removed = m_backend->remove(key);
        if (!removed) {
            LogCacheError("remove", key, removed.error());
        } else if (removed.value()) {
            ++count;
        }
    }

    if (idea) {
        m_index.removeIdea(domain::NormalizeIdea(*idea));
    } else {
        m_index.clear();
    }

    std::cout << "[SnapshotCache] Invalidated " << count << " cache entries" << std::endl;
    return count;
}

size_t SnapshotCache::warm(domain::SnapshotRepository& repository) {
    std::vector<domain::Snapshot> recent;
    try {
        recent = repository.findRecentCompleted(std::chrono::system_clock::time_point{}, m_settings.warmCount);
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotCache] Cache warming failed: " << e.what() << std::endl;
        return 0;
    }

    for (const auto& snapshot : recent) {
        writeHot(snapshot, snapshot.ideaSummary, snapshot.userProfile, "warm");
        auto written = m_backend->setCache(IdeaKey(snapshot.ideaSummary), snapshot.id, m_settings.hotTtl);
        if (!written) LogCacheError("set", IdeaKey(snapshot.ideaSummary), written.error());
        m_index.add(snapshot);
    }
    manageSize();

    std::cout << "[SnapshotCache] Warmed cache with " << recent.size() << " snapshots" << std::endl;
    return recent.size();
}

CacheStatistics SnapshotCache::statistics() {
    CacheStatistics stats;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.similarityHits = m_similarityHits;
    stats.partialHits = m_partialHits;
    stats.evictions = m_evictions;
    stats.preloadQueued = m_preloadQueued;
    stats.preloadDropped = m_preloadDropped;

    long long lookups = stats.hits + stats.similarityHits + stats.partialHits + stats.misses;
    stats.hitRate = lookups > 0 ? static_cast<double>(stats.hits + stats.similarityHits) / lookups : 0.0;

    auto hot = m_backend->scanKeys(kHotPrefix + "*");
    if (hot) {
        stats.hotCacheSize = hot.value().size();
    } else {
        LogCacheError("scan", kHotPrefix + "*", hot.error());
    }
    auto research = m_backend->scanKeys(kResearchPrefix + "*");
    if (research) {
        stats.researchCacheSize = research.value().size();
    } else {
        LogCacheError("scan", kResearchPrefix + "*", research.error());
    }

    stats.maxCacheSize = m_settings.maxCacheSize;
    stats.cacheTtlSeconds = m_settings.hotTtl.count();
    stats.similarityThreshold = m_settings.similarityThreshold;
    return stats;
}

// --- Preloading ---

void SnapshotCache::queuePreload(const std::string& idea, const domain::IdeaProfile& profile) {
    PreloadRequest request{idea, profile, IdeaHash(idea), now()};
    if (m_preloadQueue.tryPush(std::move(request))) {
        ++m_preloadQueued;
    } else {
        ++m_preloadDropped;
    }
}

void SnapshotCache::startPreloadWorker(PreloadHandler handler) {
    if (m_preloadWorker.joinable()) return;
    m_preloadHandler = std::move(handler);
    m_preloadWorker = std::thread(&SnapshotCache::preloadLoop, this);
}

void SnapshotCache::stopPreloadWorker() {
    m_preloadQueue.close();
    if (m_preloadWorker.joinable()) {
        m_preloadWorker.join();
    }
}

void SnapshotCache::preloadLoop() {
    while (auto request = m_preloadQueue.waitPop()) {
        processPreload(*request);
    }
}

void SnapshotCache::processPreload(const PreloadRequest& request) {
    std::string key = PreloadKey(request.ideaHash);
    auto inFlight = m_backend->getCache(key);
    if (!inFlight) {
        LogCacheError("get", key, inFlight.error());
        return;
    }
    if (inFlight.value()) {
        return;
    }

    auto marked = m_backend->setCache(key, "processing", m_settings.preloadProcessingTtl);
    if (!marked) {
        LogCacheError("set", key, marked.error());
        return;
    }

    std::cout << "[SnapshotCache] Preloading analysis for idea: " << request.ideaSummary.substr(0, 50) << "..."
              << std::endl;
    if (!m_preloadHandler) return;

    try {
        m_preloadHandler(request);
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotCache] Preload worker error: " << e.what() << std::endl;
    }
}

} // namespace ideasnapshot::application
