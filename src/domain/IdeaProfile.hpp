/**
 * @file IdeaProfile.hpp
 * @brief Submitter profile attached to a business idea.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace ideasnapshot::domain {

/**
 * @enum ExperienceLevel
 * @brief Ordered scale: None < Some < Experienced.
 */
enum class ExperienceLevel {
    None,
    Some,
    Experienced
};

/**
 * @enum BudgetBand
 * @brief Ordered scale of starting capital.
 */
enum class BudgetBand {
    Under5k,
    From5kTo25k,
    From25kTo100k,
    Over100k
};

inline std::string ToString(ExperienceLevel level) {
    switch (level) {
        case ExperienceLevel::None: return "none";
        case ExperienceLevel::Some: return "some";
        case ExperienceLevel::Experienced: return "experienced";
    }
    return "none";
}

inline std::string ToString(BudgetBand band) {
    switch (band) {
        case BudgetBand::Under5k: return "<5k";
        case BudgetBand::From5kTo25k: return "5k-25k";
        case BudgetBand::From25kTo100k: return "25k-100k";
        case BudgetBand::Over100k: return "100k+";
    }
    return "<5k";
}

inline std::optional<ExperienceLevel> ParseExperience(const std::string& value) {
    if (value == "none") return ExperienceLevel::None;
    if (value == "some") return ExperienceLevel::Some;
    if (value == "experienced") return ExperienceLevel::Experienced;
    return std::nullopt;
}

inline std::optional<BudgetBand> ParseBudgetBand(const std::string& value) {
    if (value == "<5k") return BudgetBand::Under5k;
    if (value == "5k-25k") return BudgetBand::From5kTo25k;
    if (value == "25k-100k") return BudgetBand::From25kTo100k;
    if (value == "100k+") return BudgetBand::Over100k;
    return std::nullopt;
}

/**
 * @struct IdeaProfile
 * @brief Experience, budget and timeline of the person submitting an idea.
 */
struct IdeaProfile {
    ExperienceLevel experience = ExperienceLevel::None; ///< Industry experience.
    BudgetBand budgetBand = BudgetBand::Under5k; ///< Available starting capital.
    int timelineMonths = 6; ///< Planned time to launch.

    bool operator==(const IdeaProfile& other) const {
        return experience == other.experience &&
               budgetBand == other.budgetBand &&
               timelineMonths == other.timelineMonths;
    }
    bool operator!=(const IdeaProfile& other) const { return !(*this == other); }

    /**
     * @brief Stable textual form used in cache keys (keys sorted alphabetically).
     */
    std::string canonical() const {
        return "{\"budget_band\":\"" + ToString(budgetBand) +
               "\",\"experience\":\"" + ToString(experience) +
               "\",\"timeline_months\":" + std::to_string(timelineMonths) + "}";
    }

    /**
     * @brief Two profiles may share an analysis when budget and experience are equal or adjacent.
     */
    bool isCompatibleWith(const IdeaProfile& other) const {
        int budgetDistance = std::abs(static_cast<int>(budgetBand) - static_cast<int>(other.budgetBand));
        int experienceDistance = std::abs(static_cast<int>(experience) - static_cast<int>(other.experience));
        return budgetDistance <= 1 && experienceDistance <= 1;
    }
};

/** @brief Lowercases and trims an idea summary. Basis of every idea identity. */
inline std::string NormalizeIdea(const std::string& idea) {
    auto begin = std::find_if_not(idea.begin(), idea.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(idea.rbegin(), idea.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return "";

    std::string out(begin, end);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace ideasnapshot::domain
