#pragma once

#include "errors.hpp"
#include "json_types.hpp"
#include "models.hpp"

#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace osu_rankings {

// ---------------------------------------------------------------------------
// Field access helpers shared by every decoder.
// ---------------------------------------------------------------------------

/// Return the value stored under @p key.
/// Throws TypeMismatchError if @p obj is not an object and
/// MissingFieldError if the key is absent.
const Json& requireField(const Json& obj, const char* key);

/// Read an integer of type T.
/// Booleans, fractional numbers and values outside the range of T throw
/// TypeMismatchError. Non-numeric kinds are left to nlohmann::json, which
/// raises its own type_error.
template <typename T>
T checkedInteger(const Json& value) {
    static_assert(std::is_integral<T>::value, "checkedInteger needs an integer type");

    if (value.is_boolean() || value.is_number_float()) {
        throw TypeMismatchError(std::string("expected an integer, got ")
                                + value.type_name() + " " + value.dump());
    }
    if (!value.is_number()) {
        return value.get<T>();
    }

    if (value.is_number_unsigned()) {
        const auto n = value.get<uint64_t>();
        if (n > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw TypeMismatchError("integer out of range: " + value.dump());
        }
        return static_cast<T>(n);
    }

    const auto n = value.get<int64_t>();
    const bool tooSmall = std::is_unsigned<T>::value
        ? n < 0
        : n < static_cast<int64_t>(std::numeric_limits<T>::min());
    const bool tooLarge = n > 0
        && static_cast<uint64_t>(n) > static_cast<uint64_t>(std::numeric_limits<T>::max());
    if (tooSmall || tooLarge) {
        throw TypeMismatchError("integer out of range: " + value.dump());
    }
    return static_cast<T>(n);
}

template <typename T>
struct IsIntegerList : std::false_type {};

template <typename U>
struct IsIntegerList<std::vector<U>>
    : std::integral_constant<bool, std::is_integral<U>::value
                                       && !std::is_same<U, bool>::value> {};

/// get<T>() with integers, and lists of integers, range-checked.
template <typename T>
T decodeValue(const Json& value) {
    if constexpr (std::is_integral<T>::value && !std::is_same<T, bool>::value) {
        return checkedInteger<T>(value);
    } else if constexpr (IsIntegerList<T>::value) {
        if (!value.is_array()) {
            return value.get<T>();
        }
        T out;
        out.reserve(value.size());
        for (const auto& item : value) {
            out.push_back(checkedInteger<typename T::value_type>(item));
        }
        return out;
    } else {
        return value.get<T>();
    }
}

template <typename T>
T requireValue(const Json& obj, const char* key) {
    return decodeValue<T>(requireField(obj, key));
}

/// Absent and null both map to std::nullopt.
template <typename T>
std::optional<T> optionalValue(const Json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    return decodeValue<T>(*it);
}

/// Write @p value under @p key only when it is set.
template <typename T>
void putOptional(Json& obj, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        obj[key] = *value;
    }
}

// ---------------------------------------------------------------------------
// One-to-one records. Found by nlohmann::json through ADL, so containers of
// these types convert with get<std::vector<T>>() and plain assignment.
// ---------------------------------------------------------------------------

void to_json(Json& j, const GradeCounts& v);
void from_json(const Json& j, GradeCounts& v);

void to_json(Json& j, const UserLevel& v);
void from_json(const Json& j, UserLevel& v);

void to_json(Json& j, const AccountHistory& v);
void from_json(const Json& j, AccountHistory& v);

void to_json(Json& j, const Badge& v);
void from_json(const Json& j, Badge& v);

void to_json(Json& j, const Group& v);
void from_json(const Json& j, Group& v);

void to_json(Json& j, const MedalCompact& v);
void from_json(const Json& j, MedalCompact& v);

void to_json(Json& j, const MonthlyCount& v);
void from_json(const Json& j, MonthlyCount& v);

void to_json(Json& j, const UserCover& v);
void from_json(const Json& j, UserCover& v);

void to_json(Json& j, const UserPage& v);
void from_json(const Json& j, UserPage& v);

/// `country` is accepted either as a name or as an object carrying `name`.
void to_json(Json& j, const CountryRanking& v);
void from_json(const Json& j, CountryRanking& v);

void to_json(Json& j, const Spotlight& v);
void from_json(const Json& j, Spotlight& v);

/// Only `id` is required; the remaining fields default when absent.
void to_json(Json& j, const Beatmapset& v);
void from_json(const Json& j, Beatmapset& v);

void to_json(Json& j, const NewsPost& v);
void from_json(const Json& j, NewsPost& v);

} // namespace osu_rankings
