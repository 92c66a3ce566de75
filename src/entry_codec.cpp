#include "entry_codec.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <stdexcept>
#include <utility>

namespace osu_rankings {

namespace {

template <typename T>
std::optional<T> nullable(const Json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    return decodeValue<T>(value);
}

template <typename T>
T take(const std::optional<T>& slot, const char* field) {
    if (!slot.has_value()) {
        throw MissingFieldError(field);
    }
    return *slot;
}

template <typename T, T UserCompact::*Member>
UserFieldRule requiredField(const char* wireName) {
    return UserFieldRule{
        wireName,
        EmitPolicy::Always,
        [](const UserCompact& user) { return Json(user.*Member); },
        [](const Json& obj, UserCompact& user, const char* name) {
            user.*Member = requireValue<T>(obj, name);
        }};
}

template <typename T, std::optional<T> UserCompact::*Member>
UserFieldRule optionalField(const char* wireName) {
    return UserFieldRule{
        wireName,
        EmitPolicy::OmitIfEmpty,
        [](const UserCompact& user) {
            const auto& value = user.*Member;
            return value ? Json(*value) : Json();
        },
        [](const Json& obj, UserCompact& user, const char* name) {
            user.*Member = optionalValue<T>(obj, name);
        }};
}

// The profile endpoint sends {"code": .., "name": ..}; only the name is kept.
UserFieldRule countryField() {
    return UserFieldRule{
        "country",
        EmitPolicy::OmitIfEmpty,
        [](const UserCompact& user) {
            return user.country ? Json(*user.country) : Json();
        },
        [](const Json& obj, UserCompact& user, const char* name) {
            const auto it = obj.find(name);
            if (it == obj.end() || it->is_null()) {
                user.country.reset();
            } else if (it->is_object()) {
                user.country = requireValue<std::string>(*it, "name");
            } else {
                user.country = it->get<std::string>();
            }
        }};
}

} // namespace

// ---------------------------------------------------------------------------
// StatisticsBuilder
// ---------------------------------------------------------------------------

bool StatisticsBuilder::accept(const std::string& key, const Json& value) {
    if (key == "hit_accuracy") {
        mAccuracy = value.get<float>();
    } else if (key == "country_rank") {
        mCountryRank = nullable<uint32_t>(value);
    } else if (key == "global_rank") {
        mGlobalRank = nullable<uint32_t>(value);
    } else if (key == "grade_counts") {
        mGradeCounts = value.get<GradeCounts>();
    } else if (key == "is_ranked") {
        mIsRanked = value.get<bool>();
    } else if (key == "level") {
        mLevel = value.get<UserLevel>();
    } else if (key == "maximum_combo") {
        mMaxCombo = checkedInteger<uint32_t>(value);
    } else if (key == "play_count") {
        mPlaycount = checkedInteger<uint32_t>(value);
    } else if (key == "play_time") {
        // null is sent for users that never played; only absence is an error.
        mPlaytime = nullable<uint32_t>(value).value_or(0);
    } else if (key == "pp") {
        mPp = nullable<float>(value).value_or(0.0f);
    } else if (key == "ranked_score") {
        mRankedScore = checkedInteger<uint64_t>(value);
    } else if (key == "replays_watched_by_others") {
        mReplaysWatched = checkedInteger<uint32_t>(value);
    } else if (key == "total_hits") {
        mTotalHits = checkedInteger<uint32_t>(value);
    } else if (key == "total_score") {
        mTotalScore = checkedInteger<uint64_t>(value);
    } else {
        return false;
    }
    return true;
}

Statistics StatisticsBuilder::build() const {
    Statistics stats;
    stats.accuracy       = take(mAccuracy, "hit_accuracy");
    stats.countryRank    = mCountryRank;
    stats.globalRank     = mGlobalRank;
    stats.gradeCounts    = take(mGradeCounts, "grade_counts");
    stats.isRanked       = take(mIsRanked, "is_ranked");
    stats.level          = take(mLevel, "level");
    stats.maxCombo       = take(mMaxCombo, "maximum_combo");
    stats.playcount      = take(mPlaycount, "play_count");
    stats.playtime       = take(mPlaytime, "play_time");
    stats.pp             = take(mPp, "pp");
    stats.rankedScore    = take(mRankedScore, "ranked_score");
    stats.replaysWatched = take(mReplaysWatched, "replays_watched_by_others");
    stats.totalHits      = take(mTotalHits, "total_hits");
    stats.totalScore     = take(mTotalScore, "total_score");
    return stats;
}

// ---------------------------------------------------------------------------
// User field table
// ---------------------------------------------------------------------------

const std::vector<UserFieldRule>& userFieldRules() {
    using U = UserCompact;

    static const std::vector<UserFieldRule> rules = {
        requiredField<std::string, &U::avatarUrl>("avatar_url"),
        requiredField<std::string, &U::countryCode>("country_code"),
        requiredField<std::string, &U::defaultGroup>("default_group"),
        requiredField<bool, &U::isActive>("is_active"),
        requiredField<bool, &U::isBot>("is_bot"),
        requiredField<bool, &U::isDeleted>("is_deleted"),
        requiredField<bool, &U::isOnline>("is_online"),
        requiredField<bool, &U::isSupporter>("is_supporter"),
        optionalField<std::string, &U::lastVisit>("last_visit"),
        requiredField<bool, &U::pmFriendsOnly>("pm_friends_only"),
        optionalField<std::string, &U::profileColor>("profile_colour"),
        requiredField<uint32_t, &U::userId>("id"),
        requiredField<std::string, &U::username>("username"),

        optionalField<std::vector<AccountHistory>, &U::accountHistory>("account_history"),
        optionalField<std::vector<Badge>, &U::badges>("badges"),
        optionalField<uint32_t, &U::beatmapPlaycountsCount>("beatmap_playcounts_count"),
        countryField(),
        optionalField<UserCover, &U::cover>("cover"),
        optionalField<uint32_t, &U::favouriteMapsetCount>("favourite_beatmapset_count"),
        optionalField<uint32_t, &U::followerCount>("follower_count"),
        optionalField<uint32_t, &U::graveyardMapsetCount>("graveyard_beatmapset_count"),
        optionalField<std::vector<Group>, &U::groups>("groups"),
        optionalField<bool, &U::isAdmin>("is_admin"),
        optionalField<bool, &U::isBng>("is_bng"),
        optionalField<bool, &U::isFullBn>("is_full_bn"),
        optionalField<bool, &U::isGmt>("is_gmt"),
        optionalField<bool, &U::isLimitedBn>("is_limited_bn"),
        optionalField<bool, &U::isModerator>("is_moderator"),
        optionalField<bool, &U::isNat>("is_nat"),
        optionalField<bool, &U::isSilenced>("is_silenced"),
        optionalField<uint32_t, &U::lovedMapsetCount>("loved_beatmapset_count"),
        optionalField<std::vector<MedalCompact>, &U::medals>("user_achievements"),
        optionalField<std::vector<MonthlyCount>, &U::monthlyPlaycounts>("monthly_playcounts"),
        optionalField<UserPage, &U::page>("page"),
        optionalField<std::vector<std::string>, &U::previousUsernames>("previous_usernames"),
        optionalField<std::vector<uint32_t>, &U::rankHistory>("rank_history"),
        optionalField<uint32_t, &U::rankedMapsetCount>("ranked_beatmapset_count"),
        optionalField<std::vector<MonthlyCount>, &U::replaysWatchedCounts>("replays_watched_counts"),
        optionalField<uint32_t, &U::scoresBestCount>("scores_best_count"),
        optionalField<uint32_t, &U::scoresFirstCount>("scores_first_count"),
        optionalField<uint32_t, &U::scoresRecentCount>("scores_recent_count"),
        optionalField<uint8_t, &U::supportLevel>("support_level"),
        optionalField<uint32_t, &U::pendingMapsetCount>("pending_beatmapset_count"),
    };
    return rules;
}

UserCompact parseUserCompact(const Json& obj) {
    if (!obj.is_object()) {
        throw TypeMismatchError(std::string("expected a user object, got ")
                                + obj.type_name());
    }

    UserCompact user;
    for (const auto& rule : userFieldRules()) {
        rule.decode(obj, user, rule.wireName);
    }
    return user;
}

Json userCompactToJson(const UserCompact& user) {
    Json out = Json::object();
    for (const auto& rule : userFieldRules()) {
        Json value = rule.encode(user);
        if (rule.emit == EmitPolicy::OmitIfEmpty && value.is_null()) {
            continue;
        }
        out[rule.wireName] = std::move(value);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Ranking entries
// ---------------------------------------------------------------------------

UserCompact parseRankingEntry(const Json& entry) {
    if (!entry.is_object()) {
        throw TypeMismatchError(std::string("expected a ranking entry object, got ")
                                + entry.type_name());
    }

    // Stage 1: sort every key into the statistics builder or the user slot.
    StatisticsBuilder statistics;
    const Json* userObj = nullptr;
    for (const auto& item : entry.items()) {
        if (item.key() == "user") {
            // A null user counts as absent.
            userObj = item.value().is_null() ? nullptr : &item.value();
        } else {
            statistics.accept(item.key(), item.value());
        }
    }

    // Stage 2: validate and assemble.
    Statistics stats = statistics.build();
    if (userObj == nullptr) {
        throw MissingFieldError("user");
    }

    UserCompact user = parseUserCompact(*userObj);
    user.statistics = stats;
    return user;
}

std::vector<UserCompact> parseRankingEntries(const Json& entries) {
    if (!entries.is_array()) {
        throw TypeMismatchError(std::string("expected an array of ranking entries, got ")
                                + entries.type_name());
    }

    std::vector<UserCompact> users;
    users.reserve(entries.size());
    for (const auto& entry : entries) {
        users.push_back(parseRankingEntry(entry));
    }
    return users;
}

Json rankingEntryToJson(const UserCompact& user) {
    if (!user.statistics.has_value()) {
        throw std::logic_error("ranking entry for user "
                               + std::to_string(user.userId)
                               + " has no statistics");
    }
    const Statistics& stats = *user.statistics;

    Json out = Json::object();
    out["hit_accuracy"] = stats.accuracy;
    putOptional(out, "country_rank", stats.countryRank);
    putOptional(out, "global_rank", stats.globalRank);
    out["grade_counts"]              = stats.gradeCounts;
    out["is_ranked"]                 = stats.isRanked;
    out["level"]                     = stats.level;
    out["maximum_combo"]             = stats.maxCombo;
    out["play_count"]                = stats.playcount;
    out["play_time"]                 = stats.playtime;
    out["pp"]                        = stats.pp;
    out["ranked_score"]              = stats.rankedScore;
    out["replays_watched_by_others"] = stats.replaysWatched;
    out["total_hits"]                = stats.totalHits;
    out["total_score"]               = stats.totalScore;
    out["user"]                      = userCompactToJson(user);
    return out;
}

Json rankingEntriesToJson(const std::vector<UserCompact>& users) {
    Json out = Json::array();
    for (const auto& user : users) {
        out.push_back(rankingEntryToJson(user));
    }
    return out;
}

} // namespace osu_rankings
