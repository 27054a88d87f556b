/**
 * @file DraftParser.hpp
 * @brief Two-stage parser turning raw LLM output into a canonical SnapshotDraft.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/ResearchBundle.hpp"
#include "domain/Snapshot.hpp"

namespace ideasnapshot::application {

/**
 * @class DraftParser
 * @brief Strict JSON decoding first, free-text reconstruction second.
 *
 * Both stages yield the same struct and both are finished by Complete(), so
 * callers never see which path was taken. Parsing never throws.
 */
class DraftParser {
public:
    /** @brief Runs both stages and post-processing. */
    static domain::SnapshotDraft Parse(const std::string& response, const domain::ResearchBundle& bundle);

    /**
     * @brief Decodes a JSON object, bare or inside a ```json fence.
     * @return nullopt when no JSON object can be decoded.
     */
    static std::optional<domain::SnapshotDraft> ParseStrict(const std::string& response,
                                                            const domain::ResearchBundle& bundle);

    /** @brief Best-effort reconstruction from prose on top of FallbackDraft(). */
    static domain::SnapshotDraft ParseHeuristic(const std::string& response, const domain::ResearchBundle& bundle);

    /** @brief Conservative draft built only from research data. */
    static domain::SnapshotDraft FallbackDraft(const domain::ResearchBundle& bundle);

    /** @brief Backfills from the bundle, truncates competitors, clamps the score and derives its range. */
    static void Complete(domain::SnapshotDraft& draft, const domain::ResearchBundle& bundle);

    /** @brief Locates the JSON object text inside @p response. */
    static std::optional<std::string> ExtractJsonObject(const std::string& response);
};

} // namespace ideasnapshot::application
