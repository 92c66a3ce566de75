#pragma once

#include "osu_client.hpp"
#include "pages.hpp"
#include "transport.hpp"

#include <optional>

namespace osu_rankings {

/// Requests the page following an already fetched one, using only what the
/// page stored about its own request.
///
/// Each next() returns std::nullopt when the page was the last one; no
/// request is made in that case. Otherwise the result is a deferred Pending
/// page that performs exactly one round trip when waited on. The page passed
/// in is never modified, so a failed advance leaves it usable.
class NextPageDispatcher {
public:
    explicit NextPageDispatcher(OsuClient& client);

    std::optional<Pending<Rankings>>        next(const Rankings& page) const;
    std::optional<Pending<CountryRankings>> next(const CountryRankings& page) const;
    std::optional<Pending<News>>            next(const News& page) const;

private:
    OsuClient& mClient;
};

} // namespace osu_rankings
