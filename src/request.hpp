#pragma once

#include "cursor.hpp"
#include "models.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace osu_rankings {

enum class ResourceKind {
    Rankings,
    News,
};

/// Logical request handed to a Transport. Page numbers and opaque tokens
/// live in separate slots; a request carries at most one of them.
struct Request {
    ResourceKind                kind = ResourceKind::Rankings;
    std::optional<GameMode>     mode;
    std::optional<RankingType>  rankingType;
    std::optional<uint32_t>     page;        // page-number cursor
    std::optional<OpaqueCursor> cursor;      // opaque token
    std::optional<uint32_t>     spotlight;   // chart rankings only

    /// GET /rankings/{mode}/{type}, optionally at a page.
    static Request rankings(GameMode mode, RankingType type,
                            std::optional<uint32_t> page = std::nullopt);

    /// GET /rankings/{mode}/charts, optionally for one spotlight.
    static Request chartRankings(GameMode mode,
                                 std::optional<uint32_t> spotlight = std::nullopt);

    /// GET /news, optionally continuing from a token.
    static Request news(std::optional<OpaqueCursor> cursor = std::nullopt);

    bool operator==(const Request& other) const;
    bool operator!=(const Request& other) const { return !(*this == other); }
};

/// Map a logical request to an HTTP target relative to the API base URL,
/// e.g. "/rankings/osu/performance?cursor[page]=3".
std::string routeRequest(const Request& request);

} // namespace osu_rankings
