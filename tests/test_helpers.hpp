#pragma once

#include "json_types.hpp"
#include "request.hpp"
#include "transport.hpp"

#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace osu_rankings {
namespace test {

/// A complete ranking entry as sent by the API.
inline Json sampleEntry() {
    return Json::parse(R"({
        "hit_accuracy": 98.5,
        "country_rank": 1,
        "global_rank": 2,
        "grade_counts": {"ss": 10, "ssh": 2, "s": 300, "sh": 40, "a": 500},
        "is_ranked": true,
        "level": {"current": 100, "progress": 42},
        "maximum_combo": 1000,
        "play_count": 5000,
        "play_time": 100000,
        "pp": 7000.0,
        "ranked_score": 123456,
        "replays_watched_by_others": 10,
        "total_hits": 99999,
        "total_score": 987654,
        "user": {
            "avatar_url": "https://a.ppy.sh/2",
            "country_code": "AU",
            "default_group": "default",
            "id": 2,
            "is_active": true,
            "is_bot": false,
            "is_deleted": false,
            "is_online": false,
            "is_supporter": true,
            "last_visit": "2024-05-01T10:00:00+00:00",
            "pm_friends_only": false,
            "profile_colour": null,
            "username": "x",
            "country": {"code": "AU", "name": "Australia"},
            "cover": {
                "custom_url": null,
                "url": "https://assets.ppy.sh/user-cover.jpg",
                "id": "3"
            }
        }
    })");
}

/// A performance ranking body with one entry and the given cursor value.
inline Json rankingsBody(const Json& cursor) {
    Json body = Json::object();
    body["cursor"]  = cursor;
    body["ranking"] = Json::array({sampleEntry()});
    body["total"]   = 50;
    return body;
}

inline Json newsPost(uint32_t id, const char* publishedAt) {
    return Json{{"id", id},
                {"author", "peppy"},
                {"edit_url", "https://github.com/ppy/osu-wiki/blob/master/news/post.md"},
                {"first_image", "https://osu.ppy.sh/help/wiki/shared/news/banner.jpg"},
                {"published_at", publishedAt},
                {"updated_at", publishedAt},
                {"slug", "post-" + std::to_string(id)},
                {"title", "Post " + std::to_string(id)},
                {"preview", "First paragraph."}};
}

inline Json newsBody(const Json& cursor) {
    Json body = Json::object();
    if (!cursor.is_null()) {
        body["cursor"] = cursor;
    }
    body["news_posts"]   = Json::array({newsPost(1, "2024-04-01T12:00:00+00:00")});
    body["search"]       = Json{{"limit", 12}};
    body["news_sidebar"] = Json{{"current_year", 2024},
                                {"news_posts", Json::array()},
                                {"years", Json::array({2024, 2023})}};
    return body;
}

/// Transport double that records every submitted request and answers with
/// canned bodies or errors in FIFO order.
class FakeTransport : public Transport {
public:
    void respondWith(Json body) {
        std::lock_guard<std::mutex> lock(mMutex);
        mResponses.push_back(Canned{std::move(body), nullptr});
    }

    void failWith(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mMutex);
        mResponses.push_back(Canned{Json(), std::move(error)});
    }

    Pending<Json> submit(const Request& request) override {
        std::lock_guard<std::mutex> lock(mMutex);
        mRequests.push_back(request);

        std::promise<Json> promise;
        if (mResponses.empty()) {
            promise.set_exception(std::make_exception_ptr(
                std::runtime_error("FakeTransport: no canned response")));
        } else {
            Canned next = std::move(mResponses.front());
            mResponses.pop_front();
            if (next.error) {
                promise.set_exception(next.error);
            } else {
                promise.set_value(std::move(next.body));
            }
        }
        return promise.get_future();
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests;
    }

private:
    struct Canned {
        Json               body;
        std::exception_ptr error;
    };

    mutable std::mutex   mMutex;
    std::deque<Canned>   mResponses;
    std::vector<Request> mRequests;
};

} // namespace test
} // namespace osu_rankings
