#pragma once

#include "pages.hpp"
#include "request.hpp"
#include "transport.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace osu_rankings {

/// Builds ranking and news requests and decodes their responses.
///
/// Every method returns a deferred Pending value: the request is submitted
/// to the transport and decoded only when the caller waits on it. The
/// transport must outlive all pending values handed out.
class OsuClient {
public:
    explicit OsuClient(Transport& transport, bool verbose = false);

    Pending<Rankings> performanceRankings(GameMode mode,
                                          std::optional<uint32_t> page = std::nullopt);
    Pending<Rankings> scoreRankings(GameMode mode,
                                    std::optional<uint32_t> page = std::nullopt);

    /// Performance or score rankings, selected by @p kind.
    Pending<Rankings> rankings(GameMode mode, DispatchableRanking kind,
                               std::optional<uint32_t> page = std::nullopt);

    Pending<CountryRankings> countryRankings(GameMode mode,
                                             std::optional<uint32_t> page = std::nullopt);

    /// Spotlight charts; without @p spotlight the API picks the latest one.
    Pending<ChartRankings> chartRankings(GameMode mode,
                                         std::optional<uint32_t> spotlight = std::nullopt);

    /// News listing, continuing from @p cursor when given.
    Pending<News> news(std::optional<OpaqueCursor> cursor = std::nullopt);

private:
    Transport& mTransport;
    bool       mVerbose;

    template <typename Page, typename Decode>
    Pending<Page> fetch(Request request, Decode decode);
};

template <typename Page, typename Decode>
Pending<Page> OsuClient::fetch(Request request, Decode decode)
{
    return std::async(std::launch::deferred,
                      [&transport = mTransport, request = std::move(request),
                       decode = std::move(decode)] {
                          return decode(transport.submit(request).get());
                      });
}

} // namespace osu_rankings
