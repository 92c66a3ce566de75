#pragma once

#include "json_types.hpp"
#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace osu_rankings {

/// Collects the flat statistics keys of one ranking entry.
///
/// Ranking entries carry the statistics as siblings of the nested `user`
/// object. Keys are fed in one at a time; build() then checks that every
/// required field was seen.
class StatisticsBuilder {
public:
    /// Store @p value if @p key is a statistics field.
    /// @returns false for keys that are not statistics fields.
    bool accept(const std::string& key, const Json& value);

    /// @throws MissingFieldError naming the first absent required key.
    Statistics build() const;

private:
    std::optional<float>       mAccuracy;
    std::optional<uint32_t>    mCountryRank;
    std::optional<uint32_t>    mGlobalRank;
    std::optional<GradeCounts> mGradeCounts;
    std::optional<bool>        mIsRanked;
    std::optional<UserLevel>   mLevel;
    std::optional<uint32_t>    mMaxCombo;
    std::optional<uint32_t>    mPlaycount;
    std::optional<uint32_t>    mPlaytime;
    std::optional<float>       mPp;
    std::optional<uint64_t>    mRankedScore;
    std::optional<uint32_t>    mReplaysWatched;
    std::optional<uint32_t>    mTotalHits;
    std::optional<uint64_t>    mTotalScore;
};

/// When an optional user field is written.
enum class EmitPolicy {
    Always,
    OmitIfEmpty,
};

/// One entry of the user field table consulted by both directions of the
/// user codec.
struct UserFieldRule {
    const char* wireName;
    EmitPolicy  emit;
    /// Returns null for an empty optional field.
    Json (*encode)(const UserCompact& user);
    void (*decode)(const Json& obj, UserCompact& user, const char* wireName);
};

/// Every UserCompact field except `statistics`, in wire order.
const std::vector<UserFieldRule>& userFieldRules();

/// Decode the nested `user` object. Unknown keys are ignored.
UserCompact parseUserCompact(const Json& obj);

/// Encode every field except `statistics`.
Json userCompactToJson(const UserCompact& user);

/// Decode one ranking entry into a user with statistics populated.
/// @throws MissingFieldError for a missing required statistics key or `user`.
UserCompact parseRankingEntry(const Json& entry);

/// Decode a JSON array of ranking entries, preserving order.
std::vector<UserCompact> parseRankingEntries(const Json& entries);

/// Split a user back into flat statistics keys plus a nested `user` object.
/// @throws std::logic_error if @p user carries no statistics.
Json rankingEntryToJson(const UserCompact& user);

Json rankingEntriesToJson(const std::vector<UserCompact>& users);

} // namespace osu_rankings
