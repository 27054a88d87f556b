/**
 * @file SimilarityIndex.hpp
 * @brief Bounded corpus of recent completed snapshots searchable by idea text.
 */

#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/IdeaProfile.hpp"
#include "domain/Snapshot.hpp"

namespace ideasnapshot::application {

/**
 * @class SimilarityIndex
 * @brief Keeps at most @c capacity completed snapshots younger than @c window.
 *
 * Each query refits a TF-IDF vocabulary over the candidates plus the query,
 * so results depend only on the current corpus. Thread-safe.
 */
class SimilarityIndex {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct Match {
        domain::Snapshot snapshot;
        double similarity = 0.0;
    };

    SimilarityIndex(size_t capacity = 100,
                    std::chrono::hours window = std::chrono::hours(24),
                    Clock clock = nullptr);

    /** @brief Adds or replaces (by id) a completed snapshot. Others are ignored. */
    void add(const domain::Snapshot& snapshot);

    /** @brief Drops every snapshot whose normalized summary equals @p normalizedIdea. */
    size_t removeIdea(const std::string& normalizedIdea);

    void clear();
    size_t size() const;

    /**
     * @brief Best candidate for @p idea if it reaches @p threshold and its
     * profile is compatible with @p profile. Ties go to the newest snapshot.
     */
    std::optional<Match> findBest(const std::string& idea,
                                  const domain::IdeaProfile& profile,
                                  double threshold) const;

private:
    std::chrono::system_clock::time_point now() const;
    void pruneLocked();

    size_t m_capacity;
    std::chrono::hours m_window;
    Clock m_clock;
    std::vector<domain::Snapshot> m_entries; ///< Newest first.
    mutable std::mutex m_mutex;
};

} // namespace ideasnapshot::application
