/// @file test_next_page.cpp
/// Unit tests for next_page.hpp — following cursors through OsuClient with a
/// recording transport.

#include "errors.hpp"
#include "next_page.hpp"
#include "osu_client.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace osu_rankings;
using osu_rankings::test::FakeTransport;
using osu_rankings::test::newsBody;
using osu_rankings::test::rankingsBody;

namespace {

Rankings performancePage(const Json& cursor) {
    return parseRankings(rankingsBody(cursor),
                         LeaderboardContext(GameMode::Osu,
                                            DispatchableRanking::Performance));
}

Json countryBody(const Json& cursor) {
    Json body = Json::object();
    body["cursor"]  = cursor;
    body["ranking"] = Json::array({Json{{"active_users", 10},
                                        {"code", "FI"},
                                        {"country", "Finland"},
                                        {"play_count", 100},
                                        {"performance", 50.5},
                                        {"ranked_score", 1000}}});
    body["total"]   = 250;
    return body;
}

} // namespace

class NextPageTest : public ::testing::Test {
protected:
    FakeTransport      transport;
    OsuClient          client{transport};
    NextPageDispatcher dispatcher{client};
};

// ============================================================================
// Exhausted pages
// ============================================================================

TEST_F(NextPageTest, ExhaustedRankingsMakeNoRequest) {
    auto page = performancePage(nullptr);

    EXPECT_FALSE(dispatcher.next(page).has_value());
    EXPECT_TRUE(transport.requests().empty());
}

TEST_F(NextPageTest, ExhaustedNewsMakesNoRequest) {
    auto page = parseNews(newsBody(nullptr));

    EXPECT_FALSE(dispatcher.next(page).has_value());
    EXPECT_TRUE(transport.requests().empty());
}

// ============================================================================
// Rankings
// ============================================================================

TEST_F(NextPageTest, PerformancePageRequestsTheCursorPage) {
    auto page = performancePage(Json{{"page", 3}});
    transport.respondWith(rankingsBody(nullptr));

    auto pending = dispatcher.next(page);
    ASSERT_TRUE(pending.has_value());
    auto nextPage = pending->get();

    const auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0],
              Request::rankings(GameMode::Osu, RankingType::Performance, 3));
    EXPECT_EQ(routeRequest(requests[0]),
              "/rankings/osu/performance?cursor[page]=3");

    EXPECT_FALSE(nextPage.hasMore());
    EXPECT_EQ(nextPage.context(), page.context());
}

TEST_F(NextPageTest, ScorePageStaysOnScore) {
    auto page = parseRankings(rankingsBody(Json(2)),
                              LeaderboardContext(GameMode::Catch,
                                                 DispatchableRanking::Score));
    transport.respondWith(rankingsBody(Json{{"page", 3}}));

    auto nextPage = dispatcher.next(page)->get();

    const auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], Request::rankings(GameMode::Catch, RankingType::Score, 2));
    EXPECT_EQ(nextPage.context().kind, DispatchableRanking::Score);
    EXPECT_EQ(nextPage.context().mode, GameMode::Catch);
    EXPECT_EQ(nextPage.cursor().nextPage(), 3u);
}

TEST_F(NextPageTest, WalksUntilExhausted) {
    transport.respondWith(rankingsBody(Json{{"page", 2}}));
    transport.respondWith(rankingsBody(Json{{"page", 3}}));
    transport.respondWith(rankingsBody(nullptr));

    auto page = client.performanceRankings(GameMode::Mania).get();
    int pages = 1;
    while (auto pending = dispatcher.next(page)) {
        page = pending->get();
        ++pages;
    }

    EXPECT_EQ(pages, 3);
    const auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_FALSE(requests[0].page.has_value());
    EXPECT_EQ(requests[1].page, 2u);
    EXPECT_EQ(requests[2].page, 3u);
}

// ============================================================================
// Country rankings and news
// ============================================================================

TEST_F(NextPageTest, CountryPageRequestsByModeAndPage) {
    auto page = parseCountryRankings(countryBody(Json{{"page", 4}}),
                                     CountryContext(GameMode::Taiko));
    transport.respondWith(countryBody(nullptr));

    auto nextPage = dispatcher.next(page)->get();

    const auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0], Request::rankings(GameMode::Taiko, RankingType::Country, 4));
    EXPECT_FALSE(nextPage.hasMore());
    EXPECT_EQ(nextPage.items()[0].country, "Finland");
}

TEST_F(NextPageTest, NewsReplaysTheStoredToken) {
    const Json token = {{"published_at", "2024-04-01T12:00:00+00:00"}, {"id", 1}};
    auto page = parseNews(newsBody(token));
    transport.respondWith(newsBody(nullptr));

    auto nextPage = dispatcher.next(page)->get();

    const auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].kind, ResourceKind::News);
    ASSERT_TRUE(requests[0].cursor.has_value());
    EXPECT_EQ(requests[0].cursor->token(), token);
    EXPECT_FALSE(requests[0].page.has_value());
    EXPECT_FALSE(nextPage.hasMore());
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(NextPageTest, TransportErrorIsSurfacedAndPageKept) {
    auto page = performancePage(Json{{"page", 3}});
    const auto before = page;
    transport.failWith(std::make_exception_ptr(ApiError(503, "busy")));

    auto pending = dispatcher.next(page);
    ASSERT_TRUE(pending.has_value());
    try {
        pending->get();
        FAIL() << "expected ApiError";
    } catch (const ApiError& e) {
        EXPECT_EQ(e.status(), 503u);
    }

    // The same page can be advanced again.
    EXPECT_TRUE(page == before);
    transport.respondWith(rankingsBody(nullptr));
    auto retried = dispatcher.next(page)->get();
    EXPECT_FALSE(retried.hasMore());
    EXPECT_EQ(transport.requests().size(), 2u);
}

TEST_F(NextPageTest, MalformedNextPageIsADecodeError) {
    auto page = performancePage(Json{{"page", 2}});

    auto body = rankingsBody(nullptr);
    body["ranking"][0].erase("user");
    transport.respondWith(body);

    try {
        dispatcher.next(page)->get();
        FAIL() << "expected MissingFieldError";
    } catch (const MissingFieldError& e) {
        EXPECT_EQ(e.field(), "user");
    }
}

TEST_F(NextPageTest, DroppedPendingNeverSubmits) {
    auto page = performancePage(Json{{"page", 3}});
    {
        auto pending = dispatcher.next(page);
        ASSERT_TRUE(pending.has_value());
    }
    EXPECT_TRUE(transport.requests().empty());
}

TEST_F(NextPageTest, ConcurrentAdvancesFromOnePage) {
    auto page = performancePage(Json{{"page", 5}});
    constexpr int kThreads = 4;
    for (int i = 0; i < kThreads; ++i) {
        transport.respondWith(rankingsBody(nullptr));
    }

    std::vector<std::thread> threads;
    std::vector<int> done(kThreads, 0);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto result = dispatcher.next(page)->get();
            done[i] = result.items().size() == 1 ? 1 : 0;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int d : done) {
        EXPECT_EQ(d, 1);
    }
    for (const auto& request : transport.requests()) {
        EXPECT_EQ(request.page, 5u);
    }
    EXPECT_EQ(transport.requests().size(), static_cast<size_t>(kThreads));
}
