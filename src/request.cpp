#include "request.hpp"
#include "util.hpp"

#include <tuple>
#include <utility>
#include <vector>

namespace osu_rankings {

Request Request::rankings(GameMode mode, RankingType type,
                          std::optional<uint32_t> page) {
    Request req;
    req.kind        = ResourceKind::Rankings;
    req.mode        = mode;
    req.rankingType = type;
    req.page        = page;
    return req;
}

Request Request::chartRankings(GameMode mode, std::optional<uint32_t> spotlight) {
    Request req;
    req.kind        = ResourceKind::Rankings;
    req.mode        = mode;
    req.rankingType = RankingType::Charts;
    req.spotlight   = spotlight;
    return req;
}

Request Request::news(std::optional<OpaqueCursor> cursor) {
    Request req;
    req.kind   = ResourceKind::News;
    req.cursor = std::move(cursor);
    return req;
}

bool Request::operator==(const Request& other) const {
    return std::tie(kind, mode, rankingType, page, cursor, spotlight)
        == std::tie(other.kind, other.mode, other.rankingType, other.page,
                    other.cursor, other.spotlight);
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------

namespace {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string scalarToString(const Json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

// An object token is spread over cursor[key]=value pairs, with the key
// percent-encoded inside the brackets; anything else is sent whole as
// cursor_string.
void appendOpaqueCursor(QueryParams& query, const OpaqueCursor& cursor) {
    const Json& token = cursor.token();
    if (token.is_object()) {
        for (const auto& item : token.items()) {
            query.emplace_back("cursor[" + urlEncode(item.key()) + "]",
                               scalarToString(item.value()));
        }
    } else {
        query.emplace_back("cursor_string", scalarToString(token));
    }
}

} // namespace

std::string routeRequest(const Request& request) {
    std::string path;
    QueryParams query;

    switch (request.kind) {
        case ResourceKind::Rankings: {
            const GameMode mode    = request.mode.value_or(GameMode::Osu);
            const RankingType type = request.rankingType.value_or(RankingType::Performance);
            path = "/rankings/" + toString(mode) + "/" + toString(type);
            if (request.spotlight) {
                query.emplace_back("spotlight", std::to_string(*request.spotlight));
            }
            break;
        }
        case ResourceKind::News:
            path = "/news";
            break;
    }

    if (request.page) {
        query.emplace_back("cursor[page]", std::to_string(*request.page));
    }
    if (request.cursor) {
        appendOpaqueCursor(query, *request.cursor);
    }

    return buildTarget(path, query);
}

} // namespace osu_rankings
