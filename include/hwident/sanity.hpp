#pragma once

/**
 * @file sanity.hpp
 * @brief Placeholder and garbage value filtering for identifier values
 *
 * Many vendors ship unconfigured DMI tables. Values such as
 * "To be filled by O.E.M." or an all-zero UUID would collide across
 * unrelated machines and must never be reported as identifiers.
 */

#include <optional>
#include <string>

namespace hwident {

/// Strip leading/trailing whitespace and NUL bytes
[[nodiscard]] std::string trim(const std::string& value);

/// Check a (trimmed) value against the known vendor placeholder strings, case-insensitive
[[nodiscard]] bool is_placeholder(const std::string& value);

/// Check for values made only of '0', only of 'F', or only of separators (dashes, spaces)
[[nodiscard]] bool is_degenerate(const std::string& value);

/**
 * @brief Filter a raw identifier value
 *
 * @param raw Value as read from the source
 * @return The trimmed value, or std::nullopt if it is empty, degenerate or a placeholder
 */
[[nodiscard]] std::optional<std::string> sanitize(const std::string& raw);

}  // namespace hwident
