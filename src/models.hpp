#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace osu_rankings {

/// Ruleset of a ranking. Wire names: "osu", "taiko", "fruits", "mania".
enum class GameMode {
    Osu,
    Taiko,
    Catch,
    Mania,
};

/// Every ranking type the API knows about.
enum class RankingType {
    Charts,
    Country,
    Performance,
    Score,
};

/// The ranking types whose pages can be followed with a plain page number.
/// Charts and country rankings are deliberately not representable here.
enum class DispatchableRanking {
    Performance,
    Score,
};

struct GradeCounts {
    int32_t ss  = 0;
    int32_t ssh = 0;
    int32_t s   = 0;
    int32_t sh  = 0;
    int32_t a   = 0;
};

struct UserLevel {
    uint32_t current  = 0;
    uint32_t progress = 0;   // percent towards the next level
};

/// Per-ruleset statistics of a ranked user.
struct Statistics {
    float                   accuracy       = 0.0f;   // hit_accuracy
    std::optional<uint32_t> countryRank;
    std::optional<uint32_t> globalRank;
    GradeCounts             gradeCounts;
    bool                    isRanked       = false;
    UserLevel               level;
    uint32_t                maxCombo       = 0;      // maximum_combo
    uint32_t                playcount      = 0;      // play_count
    uint32_t                playtime       = 0;      // play_time, seconds
    float                   pp             = 0.0f;
    uint64_t                rankedScore    = 0;
    uint32_t                replaysWatched = 0;      // replays_watched_by_others
    uint32_t                totalHits      = 0;
    uint64_t                totalScore     = 0;
};

struct AccountHistory {
    std::optional<std::string> description;
    std::optional<uint32_t>    id;
    uint32_t                   length = 0;   // seconds
    std::string                timestamp;    // ISO-8601
    std::string                type;         // "note", "restriction", "silence"
};

struct Badge {
    std::string awardedAt;   // ISO-8601
    std::string description;
    std::string imageUrl;
    std::string url;
};

struct Group {
    std::optional<std::string>              colour;
    std::optional<std::string>              description;
    bool                                    hasListing     = false;
    bool                                    hasPlaymodes   = false;
    uint32_t                                id             = 0;
    std::string                             identifier;
    bool                                    isProbationary = false;
    std::string                             name;
    std::string                             shortName;
    std::optional<std::vector<std::string>> playmodes;
};

struct MedalCompact {
    std::string achievedAt;   // ISO-8601
    uint32_t    medalId = 0;  // achievement_id
};

struct MonthlyCount {
    std::string startDate;    // YYYY-MM-DD
    int32_t     count = 0;
};

struct UserCover {
    std::optional<std::string> customUrl;
    std::string                url;
    std::optional<std::string> id;
};

struct UserPage {
    std::string html;
    std::string raw;
};

/// A user as embedded in a ranking entry. The statistics are only
/// populated by the ranking entry decoder.
struct UserCompact {
    std::string                avatarUrl;
    std::string                countryCode;
    std::string                defaultGroup;
    bool                       isActive      = false;
    bool                       isBot         = false;
    bool                       isDeleted     = false;
    bool                       isOnline      = false;
    bool                       isSupporter   = false;
    std::optional<std::string> lastVisit;                 // ISO-8601
    bool                       pmFriendsOnly = false;
    std::optional<std::string> profileColor;              // profile_colour
    uint32_t                   userId        = 0;         // id
    std::string                username;

    std::optional<std::vector<AccountHistory>> accountHistory;
    std::optional<std::vector<Badge>>          badges;
    std::optional<uint32_t>                    beatmapPlaycountsCount;
    std::optional<std::string>                 country;
    std::optional<UserCover>                   cover;
    std::optional<uint32_t>                    favouriteMapsetCount;
    std::optional<uint32_t>                    followerCount;
    std::optional<uint32_t>                    graveyardMapsetCount;
    std::optional<std::vector<Group>>          groups;
    std::optional<bool>                        isAdmin;
    std::optional<bool>                        isBng;
    std::optional<bool>                        isFullBn;
    std::optional<bool>                        isGmt;
    std::optional<bool>                        isLimitedBn;
    std::optional<bool>                        isModerator;
    std::optional<bool>                        isNat;
    std::optional<bool>                        isSilenced;
    std::optional<uint32_t>                    lovedMapsetCount;
    std::optional<std::vector<MedalCompact>>   medals;    // user_achievements
    std::optional<std::vector<MonthlyCount>>   monthlyPlaycounts;
    std::optional<UserPage>                    page;
    std::optional<std::vector<std::string>>    previousUsernames;
    std::optional<std::vector<uint32_t>>       rankHistory;
    std::optional<uint32_t>                    rankedMapsetCount;
    std::optional<std::vector<MonthlyCount>>   replaysWatchedCounts;
    std::optional<uint32_t>                    scoresBestCount;
    std::optional<uint32_t>                    scoresFirstCount;
    std::optional<uint32_t>                    scoresRecentCount;
    std::optional<Statistics>                  statistics;
    std::optional<uint8_t>                     supportLevel;
    std::optional<uint32_t>                    pendingMapsetCount;
};

/// Aggregated statistics of one country.
struct CountryRanking {
    uint32_t    activeUsers = 0;
    std::string country;       // display name
    std::string countryCode;   // code
    uint64_t    playcount   = 0;
    float       pp          = 0.0f;   // performance
    uint64_t    rankedScore = 0;
};

struct Spotlight {
    std::string             endDate;     // ISO-8601
    bool                    modeSpecific = false;
    std::string             name;
    std::optional<uint32_t> participantCount;
    uint32_t                spotlightId  = 0;   // id
    std::string             spotlightType;      // type
    std::string             startDate;   // ISO-8601
};

/// Subset of a beatmapset as listed in chart rankings.
struct Beatmapset {
    uint32_t    mapsetId       = 0;   // id
    std::string artist;
    std::string title;
    std::string creator;
    uint32_t    creatorId      = 0;   // user_id
    std::string status;
    uint32_t    playcount      = 0;   // play_count
    uint32_t    favouriteCount = 0;
};

struct NewsPost {
    uint32_t                   postId = 0;   // id
    std::string                author;
    std::string                editUrl;      // link to the file view on GitHub
    std::string                firstImage;
    std::string                publishedAt;  // ISO-8601
    std::optional<std::string> updatedAt;
    std::string                slug;         // file name without extension
    std::string                title;
    std::optional<std::string> preview;      // first paragraph, markup stripped
};

bool operator==(const GradeCounts& lhs, const GradeCounts& rhs);
bool operator==(const UserLevel& lhs, const UserLevel& rhs);
bool operator==(const Statistics& lhs, const Statistics& rhs);
bool operator==(const AccountHistory& lhs, const AccountHistory& rhs);
bool operator==(const Badge& lhs, const Badge& rhs);
bool operator==(const Group& lhs, const Group& rhs);
bool operator==(const MedalCompact& lhs, const MedalCompact& rhs);
bool operator==(const MonthlyCount& lhs, const MonthlyCount& rhs);
bool operator==(const UserCover& lhs, const UserCover& rhs);
bool operator==(const UserPage& lhs, const UserPage& rhs);
bool operator==(const UserCompact& lhs, const UserCompact& rhs);
bool operator==(const CountryRanking& lhs, const CountryRanking& rhs);
bool operator==(const Beatmapset& lhs, const Beatmapset& rhs);

/// Spotlights are identified by id and date range.
bool operator==(const Spotlight& lhs, const Spotlight& rhs);

/// News posts are identified by id and last update.
bool operator==(const NewsPost& lhs, const NewsPost& rhs);

/// Wire name of a mode, e.g. GameMode::Catch -> "fruits".
std::string toString(GameMode mode);

/// Wire name of a ranking type, e.g. RankingType::Charts -> "charts".
std::string toString(RankingType type);

/// Parse a wire mode name.
/// Throws std::invalid_argument on unknown names.
GameMode parseGameMode(const std::string& name);

/// Parse a wire ranking type name.
/// Throws std::invalid_argument on unknown names.
RankingType parseRankingType(const std::string& name);

RankingType toRankingType(DispatchableRanking kind);

/// Narrow a ranking type to one whose pages can be followed.
/// Returns std::nullopt for charts and country rankings.
std::optional<DispatchableRanking> toDispatchable(RankingType type);

} // namespace osu_rankings
