#include "next_page.hpp"

namespace osu_rankings {

NextPageDispatcher::NextPageDispatcher(OsuClient& client)
    : mClient(client) {}

std::optional<Pending<Rankings>>
NextPageDispatcher::next(const Rankings& page) const
{
    const auto nextPage = page.cursor().nextPage();
    if (!nextPage) {
        return std::nullopt;
    }

    const LeaderboardContext& context = page.context();
    return mClient.rankings(context.mode, context.kind, *nextPage);
}

std::optional<Pending<CountryRankings>>
NextPageDispatcher::next(const CountryRankings& page) const
{
    const auto nextPage = page.cursor().nextPage();
    if (!nextPage) {
        return std::nullopt;
    }
    return mClient.countryRankings(page.context().mode, *nextPage);
}

std::optional<Pending<News>>
NextPageDispatcher::next(const News& page) const
{
    if (!page.cursor()) {
        return std::nullopt;
    }
    return mClient.news(*page.cursor());
}

} // namespace osu_rankings
