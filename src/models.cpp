#include "models.hpp"

#include <stdexcept>
#include <tuple>

namespace osu_rankings {

// ---------------------------------------------------------------------------
// Equality
// ---------------------------------------------------------------------------

bool operator==(const GradeCounts& lhs, const GradeCounts& rhs) {
    return std::tie(lhs.ss, lhs.ssh, lhs.s, lhs.sh, lhs.a)
        == std::tie(rhs.ss, rhs.ssh, rhs.s, rhs.sh, rhs.a);
}

bool operator==(const UserLevel& lhs, const UserLevel& rhs) {
    return lhs.current == rhs.current && lhs.progress == rhs.progress;
}

bool operator==(const Statistics& lhs, const Statistics& rhs) {
    return std::tie(lhs.accuracy, lhs.countryRank, lhs.globalRank,
                    lhs.gradeCounts, lhs.isRanked, lhs.level, lhs.maxCombo,
                    lhs.playcount, lhs.playtime, lhs.pp, lhs.rankedScore,
                    lhs.replaysWatched, lhs.totalHits, lhs.totalScore)
        == std::tie(rhs.accuracy, rhs.countryRank, rhs.globalRank,
                    rhs.gradeCounts, rhs.isRanked, rhs.level, rhs.maxCombo,
                    rhs.playcount, rhs.playtime, rhs.pp, rhs.rankedScore,
                    rhs.replaysWatched, rhs.totalHits, rhs.totalScore);
}

bool operator==(const AccountHistory& lhs, const AccountHistory& rhs) {
    return std::tie(lhs.description, lhs.id, lhs.length, lhs.timestamp, lhs.type)
        == std::tie(rhs.description, rhs.id, rhs.length, rhs.timestamp, rhs.type);
}

bool operator==(const Badge& lhs, const Badge& rhs) {
    return std::tie(lhs.awardedAt, lhs.description, lhs.imageUrl, lhs.url)
        == std::tie(rhs.awardedAt, rhs.description, rhs.imageUrl, rhs.url);
}

bool operator==(const Group& lhs, const Group& rhs) {
    return std::tie(lhs.colour, lhs.description, lhs.hasListing,
                    lhs.hasPlaymodes, lhs.id, lhs.identifier,
                    lhs.isProbationary, lhs.name, lhs.shortName, lhs.playmodes)
        == std::tie(rhs.colour, rhs.description, rhs.hasListing,
                    rhs.hasPlaymodes, rhs.id, rhs.identifier,
                    rhs.isProbationary, rhs.name, rhs.shortName, rhs.playmodes);
}

bool operator==(const MedalCompact& lhs, const MedalCompact& rhs) {
    return lhs.achievedAt == rhs.achievedAt && lhs.medalId == rhs.medalId;
}

bool operator==(const MonthlyCount& lhs, const MonthlyCount& rhs) {
    return lhs.startDate == rhs.startDate && lhs.count == rhs.count;
}

bool operator==(const UserCover& lhs, const UserCover& rhs) {
    return std::tie(lhs.customUrl, lhs.url, lhs.id)
        == std::tie(rhs.customUrl, rhs.url, rhs.id);
}

bool operator==(const UserPage& lhs, const UserPage& rhs) {
    return lhs.html == rhs.html && lhs.raw == rhs.raw;
}

bool operator==(const UserCompact& lhs, const UserCompact& rhs) {
    const auto head = [](const UserCompact& u) {
        return std::tie(u.avatarUrl, u.countryCode, u.defaultGroup,
                        u.isActive, u.isBot, u.isDeleted, u.isOnline,
                        u.isSupporter, u.lastVisit, u.pmFriendsOnly,
                        u.profileColor, u.userId, u.username);
    };
    const auto profile = [](const UserCompact& u) {
        return std::tie(u.accountHistory, u.badges, u.beatmapPlaycountsCount,
                        u.country, u.cover, u.favouriteMapsetCount,
                        u.followerCount, u.graveyardMapsetCount, u.groups,
                        u.isAdmin, u.isBng, u.isFullBn, u.isGmt,
                        u.isLimitedBn, u.isModerator, u.isNat, u.isSilenced);
    };
    const auto history = [](const UserCompact& u) {
        return std::tie(u.lovedMapsetCount, u.medals, u.monthlyPlaycounts,
                        u.page, u.previousUsernames, u.rankHistory,
                        u.rankedMapsetCount, u.replaysWatchedCounts,
                        u.scoresBestCount, u.scoresFirstCount,
                        u.scoresRecentCount, u.statistics, u.supportLevel,
                        u.pendingMapsetCount);
    };
    return head(lhs) == head(rhs)
        && profile(lhs) == profile(rhs)
        && history(lhs) == history(rhs);
}

bool operator==(const CountryRanking& lhs, const CountryRanking& rhs) {
    return std::tie(lhs.activeUsers, lhs.country, lhs.countryCode,
                    lhs.playcount, lhs.pp, lhs.rankedScore)
        == std::tie(rhs.activeUsers, rhs.country, rhs.countryCode,
                    rhs.playcount, rhs.pp, rhs.rankedScore);
}

bool operator==(const Spotlight& lhs, const Spotlight& rhs) {
    return lhs.spotlightId == rhs.spotlightId
        && lhs.startDate == rhs.startDate
        && lhs.endDate == rhs.endDate;
}

bool operator==(const Beatmapset& lhs, const Beatmapset& rhs) {
    return std::tie(lhs.mapsetId, lhs.artist, lhs.title, lhs.creator,
                    lhs.creatorId, lhs.status, lhs.playcount, lhs.favouriteCount)
        == std::tie(rhs.mapsetId, rhs.artist, rhs.title, rhs.creator,
                    rhs.creatorId, rhs.status, rhs.playcount, rhs.favouriteCount);
}

bool operator==(const NewsPost& lhs, const NewsPost& rhs) {
    return lhs.postId == rhs.postId && lhs.updatedAt == rhs.updatedAt;
}

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

std::string toString(GameMode mode) {
    switch (mode) {
        case GameMode::Osu:   return "osu";
        case GameMode::Taiko: return "taiko";
        case GameMode::Catch: return "fruits";
        case GameMode::Mania: return "mania";
    }
    return "osu";
}

std::string toString(RankingType type) {
    switch (type) {
        case RankingType::Charts:      return "charts";
        case RankingType::Country:     return "country";
        case RankingType::Performance: return "performance";
        case RankingType::Score:       return "score";
    }
    return "performance";
}

GameMode parseGameMode(const std::string& name) {
    if (name == "osu")    return GameMode::Osu;
    if (name == "taiko")  return GameMode::Taiko;
    if (name == "fruits") return GameMode::Catch;
    if (name == "mania")  return GameMode::Mania;
    throw std::invalid_argument("Unknown game mode: " + name);
}

RankingType parseRankingType(const std::string& name) {
    if (name == "charts")      return RankingType::Charts;
    if (name == "country")     return RankingType::Country;
    if (name == "performance") return RankingType::Performance;
    if (name == "score")       return RankingType::Score;
    throw std::invalid_argument("Unknown ranking type: " + name);
}

RankingType toRankingType(DispatchableRanking kind) {
    return kind == DispatchableRanking::Score ? RankingType::Score
                                              : RankingType::Performance;
}

std::optional<DispatchableRanking> toDispatchable(RankingType type) {
    switch (type) {
        case RankingType::Performance: return DispatchableRanking::Performance;
        case RankingType::Score:       return DispatchableRanking::Score;
        case RankingType::Charts:
        case RankingType::Country:     break;
    }
    return std::nullopt;
}

} // namespace osu_rankings
