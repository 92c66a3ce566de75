#include "pages.hpp"
#include "entry_codec.hpp"
#include "errors.hpp"
#include "mapping.hpp"

namespace osu_rankings {

namespace {

void requireObject(const Json& body, const char* what) {
    if (!body.is_object()) {
        throw TypeMismatchError(std::string("expected ") + what
                                + " object, got " + body.type_name());
    }
}

void putCursor(Json& out, const PageCursor& cursor) {
    if (cursor.hasMore()) {
        out["cursor"] = pageCursorToJson(cursor);
    }
}

void putCursor(Json& out, const std::optional<OpaqueCursor>& cursor) {
    if (cursor.has_value()) {
        out["cursor"] = cursor->token();
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

Rankings parseRankings(const Json& body, const LeaderboardContext& context) {
    requireObject(body, "a rankings");

    return Rankings(parseRankingEntries(requireField(body, "ranking")),
                    parsePageCursorField(body, "cursor"),
                    context,
                    requireValue<uint32_t>(body, "total"));
}

CountryRankings parseCountryRankings(const Json& body,
                                     const CountryContext& context) {
    requireObject(body, "a country rankings");

    return CountryRankings(
        requireField(body, "ranking").get<std::vector<CountryRanking>>(),
        parsePageCursorField(body, "cursor"),
        context,
        requireValue<uint32_t>(body, "total"));
}

News parseNews(const Json& body) {
    requireObject(body, "a news");

    const auto& search = requireField(body, "search");
    NewsSearch newsSearch;
    newsSearch.cursor = parseOpaqueCursorField(search, "cursor");
    newsSearch.limit  = requireValue<uint32_t>(search, "limit");

    const auto& sidebar = requireField(body, "news_sidebar");
    NewsSidebar newsSidebar;
    newsSidebar.currentYear = requireValue<uint32_t>(sidebar, "current_year");
    newsSidebar.posts = requireField(sidebar, "news_posts").get<std::vector<NewsPost>>();
    newsSidebar.years = requireValue<std::vector<uint32_t>>(sidebar, "years");

    return News(requireField(body, "news_posts").get<std::vector<NewsPost>>(),
                parseOpaqueCursorField(body, "cursor"),
                std::move(newsSearch),
                std::move(newsSidebar));
}

ChartRankings parseChartRankings(const Json& body) {
    requireObject(body, "a chart rankings");

    ChartRankings chart;
    chart.mapsets   = requireField(body, "beatmapsets").get<std::vector<Beatmapset>>();
    chart.ranking   = parseRankingEntries(requireField(body, "ranking"));
    chart.spotlight = requireField(body, "spotlight").get<Spotlight>();
    return chart;
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

Json toJson(const Rankings& page) {
    Json out = Json::object();
    putCursor(out, page.cursor());
    out["ranking"] = rankingEntriesToJson(page.items());
    out["total"]   = page.total();
    return out;
}

Json toJson(const CountryRankings& page) {
    Json out = Json::object();
    putCursor(out, page.cursor());
    out["ranking"] = page.items();
    out["total"]   = page.total();
    return out;
}

Json toJson(const News& page) {
    Json out = Json::object();
    putCursor(out, page.cursor());
    out["news_posts"] = page.items();

    Json search = Json::object();
    putCursor(search, page.search().cursor);
    search["limit"] = page.search().limit;
    out["search"] = std::move(search);

    out["news_sidebar"] = Json{{"current_year", page.sidebar().currentYear},
                               {"news_posts", page.sidebar().posts},
                               {"years", page.sidebar().years}};
    return out;
}

Json toJson(const ChartRankings& page) {
    Json out = Json::object();
    out["beatmapsets"] = page.mapsets;
    out["ranking"]     = rankingEntriesToJson(page.ranking);
    out["spotlight"]   = page.spotlight;
    return out;
}

} // namespace osu_rankings
