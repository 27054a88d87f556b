/**
 * @file Snapshot.hpp
 * @brief Domain entity representing a complete feasibility report for one idea and profile.
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
#include "IdeaProfile.hpp"
#include "ResearchBundle.hpp"

namespace ideasnapshot::domain {

enum class ScoreRange {
    VeryLow,
    Low,
    Moderate,
    High,
    VeryHigh
};

enum class SnapshotStatus {
    Pending,
    Analyzing,
    Completed,
    Failed,
    Cached
};

inline std::string ToString(ScoreRange range) {
    switch (range) {
        case ScoreRange::VeryLow: return "very_low";
        case ScoreRange::Low: return "low";
        case ScoreRange::Moderate: return "moderate";
        case ScoreRange::High: return "high";
        case ScoreRange::VeryHigh: return "very_high";
    }
    return "very_low";
}

inline std::string ToString(SnapshotStatus status) {
    switch (status) {
        case SnapshotStatus::Pending: return "pending";
        case SnapshotStatus::Analyzing: return "analyzing";
        case SnapshotStatus::Completed: return "completed";
        case SnapshotStatus::Failed: return "failed";
        case SnapshotStatus::Cached: return "cached";
    }
    return "pending";
}

inline SnapshotStatus ParseSnapshotStatus(const std::string& value) {
    if (value == "analyzing") return SnapshotStatus::Analyzing;
    if (value == "completed") return SnapshotStatus::Completed;
    if (value == "failed") return SnapshotStatus::Failed;
    if (value == "cached") return SnapshotStatus::Cached;
    return SnapshotStatus::Pending;
}

inline int ClampScore(int score) {
    return std::max(0, std::min(100, score));
}

/** @brief Bucket table: <=20, <=40, <=60, <=80, above. */
inline ScoreRange ScoreRangeFor(int score) {
    if (score <= 20) return ScoreRange::VeryLow;
    if (score <= 40) return ScoreRange::Low;
    if (score <= 60) return ScoreRange::Moderate;
    if (score <= 80) return ScoreRange::High;
    return ScoreRange::VeryHigh;
}

/**
 * @struct LeanTiles
 * @brief Lean-canvas style summary of the idea.
 */
struct LeanTiles {
    std::string problem;
    std::string solution;
    std::string audience;
    std::vector<std::string> channels;
    std::vector<std::string> differentiators;
    std::vector<std::string> risks;
    std::vector<std::string> assumptions;
};

struct Signals {
    DemandSignal demand = DemandSignal::Unknown;
    TrendSignal trend = TrendSignal::Unknown;
    RiskLevel risk = RiskLevel::Low;
};

/**
 * @struct SnapshotDraft
 * @brief Canonical analysis produced by the synthesizer, whichever parse path was taken.
 */
struct SnapshotDraft {
    std::string ideaName; ///< Empty when the model did not propose one.
    int viabilityScore = 50;
    ScoreRange scoreRange = ScoreRange::Moderate;
    std::string scoreRationale;
    LeanTiles leanTiles;
    std::vector<Competitor> competitors;
    PriceBand priceBand;
    std::vector<std::string> nextSteps;
    std::vector<Evidence> evidence;
    Signals signals;
};

/**
 * @struct Snapshot
 * @brief Persisted feasibility report. Immutable once completed or failed.
 */
struct Snapshot {
    std::string id;
    std::string userId;
    std::string ideaName;
    std::string ideaSummary;
    IdeaProfile userProfile;
    int viabilityScore = 0;
    ScoreRange scoreRange = ScoreRange::VeryLow;
    std::string scoreRationale;
    LeanTiles leanTiles;
    std::vector<Competitor> competitors;
    PriceBand priceBand;
    std::vector<std::string> nextSteps;
    std::vector<Evidence> evidence;
    Signals signals;
    long long generationTimeMs = 0;
    long long researchTimeMs = 0;
    long long analysisTimeMs = 0;
    int wordCount = 0;
    std::chrono::system_clock::time_point createdAt{};
    SnapshotStatus status = SnapshotStatus::Pending;
};

} // namespace ideasnapshot::domain
