#pragma once

#include "cursor.hpp"
#include "json_types.hpp"
#include "models.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace osu_rankings {

/// What a performance or score ranking page needs to request its successor.
/// Chart and country rankings cannot be expressed here: the ranking kind is
/// a DispatchableRanking, not a RankingType.
struct LeaderboardContext {
    LeaderboardContext(GameMode m, DispatchableRanking k) : mode(m), kind(k) {}

    GameMode            mode;
    DispatchableRanking kind;

    bool operator==(const LeaderboardContext& other) const {
        return mode == other.mode && kind == other.kind;
    }
};

/// Country rankings are followed by mode alone.
struct CountryContext {
    explicit CountryContext(GameMode m) : mode(m) {}

    GameMode mode;

    bool operator==(const CountryContext& other) const { return mode == other.mode; }
};

/// One fetched page: items in response order, the cursor towards the next
/// page and whatever is needed to rebuild the follow-up request.
/// Immutable once constructed.
template <typename Item, typename Cursor, typename Context>
class ResultPage {
public:
    ResultPage(std::vector<Item> items, Cursor cursor, Context context)
        : mItems(std::move(items))
        , mCursor(std::move(cursor))
        , mContext(std::move(context)) {}

    const std::vector<Item>& items() const { return mItems; }
    const Cursor&            cursor() const { return mCursor; }
    const Context&           context() const { return mContext; }

protected:
    bool samePage(const ResultPage& other) const {
        return mItems == other.mItems && mCursor == other.mCursor
            && mContext == other.mContext;
    }

private:
    std::vector<Item> mItems;
    Cursor            mCursor;
    Context           mContext;
};

/// Performance or score leaderboard.
class Rankings : public ResultPage<UserCompact, PageCursor, LeaderboardContext> {
public:
    Rankings(std::vector<UserCompact> users, PageCursor cursor,
             LeaderboardContext context, uint32_t total)
        : ResultPage(std::move(users), cursor, context)
        , mTotal(total) {}

    bool     hasMore() const { return cursor().hasMore(); }
    uint32_t total() const { return mTotal; }

    bool operator==(const Rankings& other) const {
        return samePage(other) && mTotal == other.mTotal;
    }

private:
    uint32_t mTotal;
};

class CountryRankings
    : public ResultPage<CountryRanking, PageCursor, CountryContext> {
public:
    CountryRankings(std::vector<CountryRanking> countries, PageCursor cursor,
                    CountryContext context, uint32_t total)
        : ResultPage(std::move(countries), cursor, context)
        , mTotal(total) {}

    bool     hasMore() const { return cursor().hasMore(); }
    uint32_t total() const { return mTotal; }

    bool operator==(const CountryRankings& other) const {
        return samePage(other) && mTotal == other.mTotal;
    }

private:
    uint32_t mTotal;
};

struct NewsSearch {
    std::optional<OpaqueCursor> cursor;
    uint32_t                    limit = 0;

    bool operator==(const NewsSearch& other) const {
        return cursor == other.cursor && limit == other.limit;
    }
};

struct NewsSidebar {
    uint32_t              currentYear = 0;
    std::vector<NewsPost> posts;
    std::vector<uint32_t> years;

    bool operator==(const NewsSidebar& other) const {
        return currentYear == other.currentYear && posts == other.posts
            && years == other.years;
    }
};

/// News listing. The next page is requested by replaying the stored token,
/// so no further context is kept.
class News
    : public ResultPage<NewsPost, std::optional<OpaqueCursor>, std::monostate> {
public:
    News(std::vector<NewsPost> posts, std::optional<OpaqueCursor> cursor,
         NewsSearch search, NewsSidebar sidebar)
        : ResultPage(std::move(posts), std::move(cursor), std::monostate{})
        , mSearch(std::move(search))
        , mSidebar(std::move(sidebar)) {}

    bool hasMore() const { return cursor().has_value(); }

    const NewsSearch&  search() const { return mSearch; }
    const NewsSidebar& sidebar() const { return mSidebar; }

    bool operator==(const News& other) const {
        return samePage(other) && mSearch == other.mSearch
            && mSidebar == other.mSidebar;
    }

private:
    NewsSearch  mSearch;
    NewsSidebar mSidebar;
};

/// Spotlight chart. Not paginated.
struct ChartRankings {
    std::vector<Beatmapset>  mapsets;   // beatmapsets
    std::vector<UserCompact> ranking;   // ordered by score, descending
    Spotlight                spotlight;
};

// ---------------------------------------------------------------------------
// Decoding. The context always comes from the request that produced the
// body; ranking-type hints inside the body are ignored.
// ---------------------------------------------------------------------------

Rankings        parseRankings(const Json& body, const LeaderboardContext& context);
CountryRankings parseCountryRankings(const Json& body, const CountryContext& context);
News            parseNews(const Json& body);
ChartRankings   parseChartRankings(const Json& body);

// ---------------------------------------------------------------------------
// Encoding. Exhausted or absent cursors are left out.
// ---------------------------------------------------------------------------

Json toJson(const Rankings& page);
Json toJson(const CountryRankings& page);
Json toJson(const News& page);
Json toJson(const ChartRankings& page);

} // namespace osu_rankings
