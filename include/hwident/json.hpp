#pragma once

/**
 * @file json.hpp
 * @brief JSON rendering of resolved identifiers
 *
 * Uses nlohmann/json.
 */

#include "hwident/hwident.hpp"

#include <nlohmann/json.hpp>

namespace hwident {
namespace json {

using nlohmann::json;

/// Render an identifier mapping as a flat JSON object
[[nodiscard]] inline json identifiers_to_json(const Identifiers& identifiers) {
    json j = json::object();
    for (const auto& [key, value] : identifiers) {
        j[key] = value;
    }
    return j;
}

/**
 * @brief Render a resolved result
 *
 * Shape: {"identifiers": {...}, "fallback": {...}, "containerized": bool}
 */
[[nodiscard]] inline json to_json(const IdentifierResult& result) {
    json j;
    j["identifiers"] = identifiers_to_json(result.identifiers);
    j["fallback"] = identifiers_to_json(result.fallback);
    j["containerized"] = result.containerized;
    return j;
}

}  // namespace json
}  // namespace hwident
