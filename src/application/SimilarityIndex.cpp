/**
 * @file SimilarityIndex.cpp
 * @brief Implementation of SimilarityIndex.
 */

#include "application/SimilarityIndex.hpp"
#include "application/TfidfVectorizer.hpp"
#include <algorithm>
#include <iostream>

namespace ideasnapshot::application {

SimilarityIndex::SimilarityIndex(size_t capacity, std::chrono::hours window, Clock clock)
    : m_capacity(capacity), m_window(window), m_clock(std::move(clock)) {}

std::chrono::system_clock::time_point SimilarityIndex::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

void SimilarityIndex::add(const domain::Snapshot& snapshot) {
    if (snapshot.status != domain::SnapshotStatus::Completed) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                   [&](const domain::Snapshot& s) { return s.id == snapshot.id; }),
                    m_entries.end());

    auto pos = std::find_if(m_entries.begin(), m_entries.end(), [&](const domain::Snapshot& s) {
        return s.createdAt < snapshot.createdAt;
    });
    m_entries.insert(pos, snapshot);
    pruneLocked();
}

void SimilarityIndex::pruneLocked() {
    auto cutoff = now() - m_window;
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                   [&](const domain::Snapshot& s) { return s.createdAt < cutoff; }),
                    m_entries.end());
    if (m_entries.size() > m_capacity) {
        m_entries.resize(m_capacity);
    }
}

size_t SimilarityIndex::removeIdea(const std::string& normalizedIdea) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t before = m_entries.size();
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                   [&](const domain::Snapshot& s) {
                                       return domain::NormalizeIdea(s.ideaSummary) == normalizedIdea;
                                   }),
                    m_entries.end());
    return before - m_entries.size();
}

void SimilarityIndex::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

size_t SimilarityIndex::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::optional<SimilarityIndex::Match> SimilarityIndex::findBest(const std::string& idea,
                                                                const domain::IdeaProfile& profile,
                                                                double threshold) const {
    std::vector<domain::Snapshot> candidates;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto cutoff = now() - m_window;
        for (const auto& snapshot : m_entries) {
            if (snapshot.createdAt >= cutoff) candidates.push_back(snapshot);
        }
    }
    if (candidates.empty()) return std::nullopt;

    std::vector<std::string> documents;
    documents.reserve(candidates.size() + 1);
    for (const auto& snapshot : candidates) {
        documents.push_back(snapshot.ideaSummary);
    }
    documents.push_back(idea);

    TfidfVectorizer vectorizer;
    auto vectors = vectorizer.fitTransform(documents);
    const auto& query = vectors.back();

    // Candidates are newest first; only a strictly better score displaces the current best.
    size_t bestIndex = 0;
    double bestSimilarity = -1.0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        double similarity = TfidfVectorizer::CosineSimilarity(query, vectors[i]);
        if (similarity > bestSimilarity + 1e-12) {
            bestSimilarity = similarity;
            bestIndex = i;
        }
    }

    if (bestSimilarity < threshold) return std::nullopt;
    if (!profile.isCompatibleWith(candidates[bestIndex].userProfile)) {
        std::cout << "[SimilarityIndex] Match " << candidates[bestIndex].id
                  << " rejected: incompatible profile" << std::endl;
        return std::nullopt;
    }

    std::cout << "[SimilarityIndex] Found similar snapshot " << candidates[bestIndex].id
              << " (" << static_cast<int>(bestSimilarity * 100) << "%)" << std::endl;
    return Match{candidates[bestIndex], bestSimilarity};
}

} // namespace ideasnapshot::application
