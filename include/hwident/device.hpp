#pragma once

/**
 * @file device.hpp
 * @brief Device helpers: platform name, host name and fingerprint
 */

#include "hwident/hwident.hpp"

#include <string>

namespace hwident {
namespace device {

/**
 * @brief Derive a stable device fingerprint from resolved identifiers
 *
 * Hashes the primary identifiers (or, when there are none, the fallback
 * identifiers) with SHA-256 so raw serial numbers need not leave the host.
 *
 * @param result Resolved identifiers
 * @return 32 lowercase hex chars (128 bits), or empty string if the result is empty
 */
[[nodiscard]] std::string fingerprint(const IdentifierResult& result);

/**
 * @brief Get the platform name
 *
 * @return "macos", "linux", "windows", or "unknown"
 */
[[nodiscard]] std::string get_platform_name();

/**
 * @brief Get a human-readable hostname
 *
 * @return The system hostname or "unknown" on failure
 */
[[nodiscard]] std::string get_hostname();

}  // namespace device
}  // namespace hwident
