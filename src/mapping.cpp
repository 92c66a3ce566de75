#include "mapping.hpp"

namespace osu_rankings {

const Json& requireField(const Json& obj, const char* key) {
    if (!obj.is_object()) {
        throw TypeMismatchError(std::string("expected an object holding `")
                                + key + "`, got " + obj.type_name());
    }
    const auto it = obj.find(key);
    if (it == obj.end()) {
        throw MissingFieldError(key);
    }
    return *it;
}

// ---------------------------------------------------------------------------
// Statistics building blocks
// ---------------------------------------------------------------------------

void to_json(Json& j, const GradeCounts& v) {
    j = Json{{"ss", v.ss}, {"ssh", v.ssh}, {"s", v.s}, {"sh", v.sh}, {"a", v.a}};
}

void from_json(const Json& j, GradeCounts& v) {
    v.ss  = requireValue<int32_t>(j, "ss");
    v.ssh = requireValue<int32_t>(j, "ssh");
    v.s   = requireValue<int32_t>(j, "s");
    v.sh  = requireValue<int32_t>(j, "sh");
    v.a   = requireValue<int32_t>(j, "a");
}

void to_json(Json& j, const UserLevel& v) {
    j = Json{{"current", v.current}, {"progress", v.progress}};
}

void from_json(const Json& j, UserLevel& v) {
    v.current  = requireValue<uint32_t>(j, "current");
    v.progress = requireValue<uint32_t>(j, "progress");
}

// ---------------------------------------------------------------------------
// User profile records
// ---------------------------------------------------------------------------

void to_json(Json& j, const AccountHistory& v) {
    j = Json::object();
    putOptional(j, "description", v.description);
    putOptional(j, "id", v.id);
    j["length"]    = v.length;
    j["timestamp"] = v.timestamp;
    j["type"]      = v.type;
}

void from_json(const Json& j, AccountHistory& v) {
    v.description = optionalValue<std::string>(j, "description");
    v.id          = optionalValue<uint32_t>(j, "id");
    v.length      = requireValue<uint32_t>(j, "length");
    v.timestamp   = requireValue<std::string>(j, "timestamp");
    v.type        = requireValue<std::string>(j, "type");
}

void to_json(Json& j, const Badge& v) {
    j = Json{{"awarded_at", v.awardedAt},
             {"description", v.description},
             {"image_url", v.imageUrl},
             {"url", v.url}};
}

void from_json(const Json& j, Badge& v) {
    v.awardedAt   = requireValue<std::string>(j, "awarded_at");
    v.description = requireValue<std::string>(j, "description");
    v.imageUrl    = requireValue<std::string>(j, "image_url");
    v.url         = requireValue<std::string>(j, "url");
}

void to_json(Json& j, const Group& v) {
    j = Json::object();
    putOptional(j, "colour", v.colour);
    putOptional(j, "description", v.description);
    j["has_listing"]     = v.hasListing;
    j["has_playmodes"]   = v.hasPlaymodes;
    j["id"]              = v.id;
    j["identifier"]      = v.identifier;
    j["is_probationary"] = v.isProbationary;
    j["name"]            = v.name;
    j["short_name"]      = v.shortName;
    putOptional(j, "playmodes", v.playmodes);
}

void from_json(const Json& j, Group& v) {
    v.colour         = optionalValue<std::string>(j, "colour");
    v.description    = optionalValue<std::string>(j, "description");
    v.hasListing     = requireValue<bool>(j, "has_listing");
    v.hasPlaymodes   = requireValue<bool>(j, "has_playmodes");
    v.id             = requireValue<uint32_t>(j, "id");
    v.identifier     = requireValue<std::string>(j, "identifier");
    v.isProbationary = requireValue<bool>(j, "is_probationary");
    v.name           = requireValue<std::string>(j, "name");
    v.shortName      = requireValue<std::string>(j, "short_name");
    v.playmodes      = optionalValue<std::vector<std::string>>(j, "playmodes");
}

void to_json(Json& j, const MedalCompact& v) {
    j = Json{{"achieved_at", v.achievedAt}, {"achievement_id", v.medalId}};
}

void from_json(const Json& j, MedalCompact& v) {
    v.achievedAt = requireValue<std::string>(j, "achieved_at");
    v.medalId    = requireValue<uint32_t>(j, "achievement_id");
}

void to_json(Json& j, const MonthlyCount& v) {
    j = Json{{"start_date", v.startDate}, {"count", v.count}};
}

void from_json(const Json& j, MonthlyCount& v) {
    v.startDate = requireValue<std::string>(j, "start_date");
    v.count     = requireValue<int32_t>(j, "count");
}

void to_json(Json& j, const UserCover& v) {
    j = Json::object();
    putOptional(j, "custom_url", v.customUrl);
    j["url"] = v.url;
    putOptional(j, "id", v.id);
}

void from_json(const Json& j, UserCover& v) {
    v.customUrl = optionalValue<std::string>(j, "custom_url");
    v.url       = requireValue<std::string>(j, "url");
    v.id        = optionalValue<std::string>(j, "id");
}

void to_json(Json& j, const UserPage& v) {
    j = Json{{"html", v.html}, {"raw", v.raw}};
}

void from_json(const Json& j, UserPage& v) {
    v.html = requireValue<std::string>(j, "html");
    v.raw  = requireValue<std::string>(j, "raw");
}

// ---------------------------------------------------------------------------
// Ranking and news records
// ---------------------------------------------------------------------------

void to_json(Json& j, const CountryRanking& v) {
    j = Json{{"active_users", v.activeUsers},
             {"country", v.country},
             {"code", v.countryCode},
             {"play_count", v.playcount},
             {"performance", v.pp},
             {"ranked_score", v.rankedScore}};
}

void from_json(const Json& j, CountryRanking& v) {
    v.activeUsers = requireValue<uint32_t>(j, "active_users");

    // The API sends {"code": .., "name": ..} here while older dumps carry
    // the plain name.
    const auto& country = requireField(j, "country");
    v.country = country.is_object() ? requireValue<std::string>(country, "name")
                                    : country.get<std::string>();

    v.countryCode = requireValue<std::string>(j, "code");
    v.playcount   = requireValue<uint64_t>(j, "play_count");
    v.pp          = requireValue<float>(j, "performance");
    v.rankedScore = requireValue<uint64_t>(j, "ranked_score");
}

void to_json(Json& j, const Spotlight& v) {
    j = Json::object();
    j["end_date"]      = v.endDate;
    j["mode_specific"] = v.modeSpecific;
    j["name"]          = v.name;
    putOptional(j, "participant_count", v.participantCount);
    j["id"]            = v.spotlightId;
    j["type"]          = v.spotlightType;
    j["start_date"]    = v.startDate;
}

void from_json(const Json& j, Spotlight& v) {
    v.endDate          = requireValue<std::string>(j, "end_date");
    v.modeSpecific     = requireValue<bool>(j, "mode_specific");
    v.name             = requireValue<std::string>(j, "name");
    v.participantCount = optionalValue<uint32_t>(j, "participant_count");
    v.spotlightId      = requireValue<uint32_t>(j, "id");
    v.spotlightType    = requireValue<std::string>(j, "type");
    v.startDate        = requireValue<std::string>(j, "start_date");
}

void to_json(Json& j, const Beatmapset& v) {
    j = Json{{"id", v.mapsetId},
             {"artist", v.artist},
             {"title", v.title},
             {"creator", v.creator},
             {"user_id", v.creatorId},
             {"status", v.status},
             {"play_count", v.playcount},
             {"favourite_count", v.favouriteCount}};
}

void from_json(const Json& j, Beatmapset& v) {
    v.mapsetId       = requireValue<uint32_t>(j, "id");
    v.artist         = j.value("artist", "");
    v.title          = j.value("title", "");
    v.creator        = j.value("creator", "");
    v.creatorId      = optionalValue<uint32_t>(j, "user_id").value_or(0);
    v.status         = j.value("status", "");
    v.playcount      = optionalValue<uint32_t>(j, "play_count").value_or(0);
    v.favouriteCount = optionalValue<uint32_t>(j, "favourite_count").value_or(0);
}

void to_json(Json& j, const NewsPost& v) {
    j = Json::object();
    j["id"]          = v.postId;
    j["author"]      = v.author;
    j["edit_url"]    = v.editUrl;
    j["first_image"] = v.firstImage;
    j["published_at"] = v.publishedAt;
    putOptional(j, "updated_at", v.updatedAt);
    j["slug"]        = v.slug;
    j["title"]       = v.title;
    putOptional(j, "preview", v.preview);
}

void from_json(const Json& j, NewsPost& v) {
    v.postId      = requireValue<uint32_t>(j, "id");
    v.author      = requireValue<std::string>(j, "author");
    v.editUrl     = requireValue<std::string>(j, "edit_url");
    v.firstImage  = requireValue<std::string>(j, "first_image");
    v.publishedAt = requireValue<std::string>(j, "published_at");
    v.updatedAt   = optionalValue<std::string>(j, "updated_at");
    v.slug        = requireValue<std::string>(j, "slug");
    v.title       = requireValue<std::string>(j, "title");
    v.preview     = optionalValue<std::string>(j, "preview");
}

} // namespace osu_rankings
