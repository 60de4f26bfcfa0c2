#pragma once

/**
 * @file fallback.hpp
 * @brief Fallback identifiers used when no hardware UUID is available
 *
 * Fallback identifiers are weaker than hardware identifiers: the machine id
 * changes on OS reinstall and host names are neither unique nor stable.
 */

#include "hwident/hwident.hpp"

#include <string>
#include <vector>

namespace hwident {

/**
 * @brief Fallback source interface
 */
class FallbackInterface {
  public:
    virtual ~FallbackInterface() = default;

    /// Collect fallback identifiers; missing sources leave their key absent
    [[nodiscard]] virtual Identifiers collect() = 0;
};

/**
 * @brief OS-provided fallback identifiers
 *
 * - machine_id: first usable candidate file (Linux, macOS) or the
 *   Cryptography MachineGuid registry value (Windows)
 * - hostname: the network host name, unless it is "localhost"
 */
class SystemFallback : public FallbackInterface {
  public:
    explicit SystemFallback(std::vector<std::string> machine_id_paths = {
                                "/etc/machine-id", "/var/lib/dbus/machine-id"});

    [[nodiscard]] Identifiers collect() override;

    /// Read the machine id; empty when no source is usable
    [[nodiscard]] std::string read_machine_id() const;

  private:
    std::vector<std::string> machine_id_paths_;
};

}  // namespace hwident
