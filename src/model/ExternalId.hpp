#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace model {

using json = nlohmann::json;

/**
 * Identifier assigned by the originating store (database id, file-declared id)
 *
 * Integer and string ids are kept apart so that a round trip through a
 * format that stores ids as JSON values restores the original type.
 */
using ExternalId = std::variant<int64_t, std::string>;

/**
 * Text form of an id, as used for JSON object keys ("5", "a")
 */
std::string toString(const ExternalId& id);

/**
 * Convert an id to a JSON value (number or string)
 */
json idToJson(const ExternalId& id);

/**
 * Read an id from a JSON number or string
 * Throws std::invalid_argument for any other JSON type or an integer beyond int64_t
 */
ExternalId idFromJson(const json& j);

/**
 * Parse the text form back into an id: digits become an integer, anything else a string
 */
ExternalId parseId(const std::string& text);

} // namespace model
