/**
 * @file SnapshotJson.hpp
 * @brief nlohmann::json mapping for the domain records.
 *
 * The to_json/from_json overloads live in the domain namespace so that
 * `json j = snapshot;` and `j.get<domain::Snapshot>()` resolve by ADL.
 */

#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/IdeaProfile.hpp"
#include "domain/PerformanceLog.hpp"
#include "domain/ResearchBundle.hpp"
#include "domain/Snapshot.hpp"

namespace ideasnapshot::domain {

void to_json(nlohmann::json& j, const IdeaProfile& profile);
void from_json(const nlohmann::json& j, IdeaProfile& profile);

void to_json(nlohmann::json& j, const Evidence& evidence);
void from_json(const nlohmann::json& j, Evidence& evidence);

void to_json(nlohmann::json& j, const Competitor& competitor);
void from_json(const nlohmann::json& j, Competitor& competitor);

void to_json(nlohmann::json& j, const Risk& risk);
void from_json(const nlohmann::json& j, Risk& risk);

void to_json(nlohmann::json& j, const PriceBand& band);
void from_json(const nlohmann::json& j, PriceBand& band);

void to_json(nlohmann::json& j, const ResearchBundle& bundle);
void from_json(const nlohmann::json& j, ResearchBundle& bundle);

void to_json(nlohmann::json& j, const LeanTiles& tiles);
void from_json(const nlohmann::json& j, LeanTiles& tiles);

void to_json(nlohmann::json& j, const Signals& signals);
void from_json(const nlohmann::json& j, Signals& signals);

void to_json(nlohmann::json& j, const Snapshot& snapshot);
void from_json(const nlohmann::json& j, Snapshot& snapshot);

void to_json(nlohmann::json& j, const PerformanceLog& log);
void from_json(const nlohmann::json& j, PerformanceLog& log);

} // namespace ideasnapshot::domain

namespace ideasnapshot::infrastructure {

/** @brief Milliseconds since the Unix epoch. */
long long ToEpochMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromEpochMillis(long long ms);

/** @brief UTC ISO-8601 representation ("2025-01-15T10:00:00Z"). */
std::string ToIsoString(std::chrono::system_clock::time_point tp);

} // namespace ideasnapshot::infrastructure
