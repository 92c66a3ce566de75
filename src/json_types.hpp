#pragma once

#include <nlohmann/json.hpp>

namespace osu_rankings {

/// JSON value used throughout the project. Insertion order is kept so that
/// encoders emit their keys in a fixed, documented order.
using Json = nlohmann::ordered_json;

} // namespace osu_rankings
