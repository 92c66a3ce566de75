#include "osu_client.hpp"

#include <iostream>

namespace osu_rankings {

OsuClient::OsuClient(Transport& transport, bool verbose)
    : mTransport(transport)
    , mVerbose(verbose) {}

Pending<Rankings> OsuClient::performanceRankings(GameMode mode,
                                                 std::optional<uint32_t> page)
{
    return rankings(mode, DispatchableRanking::Performance, page);
}

Pending<Rankings> OsuClient::scoreRankings(GameMode mode,
                                           std::optional<uint32_t> page)
{
    return rankings(mode, DispatchableRanking::Score, page);
}

Pending<Rankings> OsuClient::rankings(GameMode mode, DispatchableRanking kind,
                                      std::optional<uint32_t> page)
{
    auto request = Request::rankings(mode, toRankingType(kind), page);

    if (mVerbose) {
        std::cerr << "[OsuClient] " << routeRequest(request) << "\n";
    }

    const LeaderboardContext context(mode, kind);
    return fetch<Rankings>(std::move(request), [context](const Json& body) {
        return parseRankings(body, context);
    });
}

Pending<CountryRankings> OsuClient::countryRankings(GameMode mode,
                                                    std::optional<uint32_t> page)
{
    auto request = Request::rankings(mode, RankingType::Country, page);

    if (mVerbose) {
        std::cerr << "[OsuClient] " << routeRequest(request) << "\n";
    }

    const CountryContext context(mode);
    return fetch<CountryRankings>(std::move(request), [context](const Json& body) {
        return parseCountryRankings(body, context);
    });
}

Pending<ChartRankings> OsuClient::chartRankings(GameMode mode,
                                                std::optional<uint32_t> spotlight)
{
    auto request = Request::chartRankings(mode, spotlight);

    if (mVerbose) {
        std::cerr << "[OsuClient] " << routeRequest(request) << "\n";
    }

    return fetch<ChartRankings>(std::move(request), [](const Json& body) {
        return parseChartRankings(body);
    });
}

Pending<News> OsuClient::news(std::optional<OpaqueCursor> cursor)
{
    auto request = Request::news(std::move(cursor));

    if (mVerbose) {
        std::cerr << "[OsuClient] " << routeRequest(request) << "\n";
    }

    return fetch<News>(std::move(request), [](const Json& body) {
        return parseNews(body);
    });
}

} // namespace osu_rankings
