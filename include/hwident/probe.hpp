#pragma once

/**
 * @file probe.hpp
 * @brief Platform probes reading raw hardware identifier fields
 *
 * One probe variant per supported OS, behind ProbeInterface:
 * - Linux: DMI files under /sys/class/dmi/id
 * - Windows: WMI hardware classes, bounded by a timeout
 * - macOS: system_profiler SPHardwareDataType output
 *
 * Probes never throw. Every failure is reported per field.
 */

#include "hwident/hwident.hpp"
#include "hwident/process.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hwident {

/// Per-field probe status
enum class ProbeStatus {
    Value,        // Source was read
    Unavailable,  // Source missing, failed or timed out
    Denied        // Source exists but needs elevated privileges
};

/**
 * @brief Result of probing a single field
 */
struct ProbeOutcome {
    ProbeStatus status = ProbeStatus::Unavailable;
    std::string value;                              // Raw value when status == Value
    ErrorCode reason = ErrorCode::SourceUnavailable;  // Diagnostic reason otherwise

    static ProbeOutcome of(std::string value) {
        return ProbeOutcome{ProbeStatus::Value, std::move(value), ErrorCode::Success};
    }

    static ProbeOutcome unavailable(ErrorCode reason = ErrorCode::SourceUnavailable) {
        return ProbeOutcome{ProbeStatus::Unavailable, "", reason};
    }

    static ProbeOutcome denied() {
        return ProbeOutcome{ProbeStatus::Denied, "", ErrorCode::PermissionDenied};
    }

    [[nodiscard]] bool has_value() const noexcept { return status == ProbeStatus::Value; }
};

/// Probe outcomes keyed by identifier key
using ProbeReport = std::map<std::string, ProbeOutcome>;

/// Build a report marking every field unavailable for the same reason
[[nodiscard]] ProbeReport unavailable_report(const std::vector<std::string>& fields,
                                             ErrorCode reason);

/**
 * @brief Probe interface
 *
 * Abstract interface for platform probes. Can be mocked for testing.
 */
class ProbeInterface {
  public:
    virtual ~ProbeInterface() = default;

    /// Read every field this probe knows about
    [[nodiscard]] virtual ProbeReport probe() = 0;

    /// Identifier keys reported by probe()
    [[nodiscard]] virtual std::vector<std::string> fields() const = 0;

    /// Short probe name for diagnostics
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Linux DMI probe
 *
 * Reads one file per field from the DMI class directory. Serial numbers and
 * the product UUID are usually root-only; those fields come back Denied.
 */
class LinuxProbe : public ProbeInterface {
  public:
    explicit LinuxProbe(std::string dmi_path = "/sys/class/dmi/id");

    [[nodiscard]] ProbeReport probe() override;
    [[nodiscard]] std::vector<std::string> fields() const override;
    [[nodiscard]] std::string name() const override { return "linux-dmi"; }

    /// DMI file name backing an identifier key (empty if unknown)
    [[nodiscard]] static std::string file_for(const std::string& key);

  private:
    std::string dmi_path_;
};

/**
 * @brief macOS hardware profiler probe
 *
 * Runs `system_profiler SPHardwareDataType -json` and reads the first
 * hardware entry.
 */
class MacosProbe : public ProbeInterface {
  public:
    MacosProbe(std::string command, std::chrono::milliseconds timeout,
               CommandRunner runner = run_command);

    [[nodiscard]] ProbeReport probe() override;
    [[nodiscard]] std::vector<std::string> fields() const override;
    [[nodiscard]] std::string name() const override { return "macos-system-profiler"; }

  private:
    std::string command_;
    std::chrono::milliseconds timeout_;
    CommandRunner runner_;
};

/**
 * @brief Parse system_profiler JSON output
 *
 * @param output Raw standard output of `system_profiler SPHardwareDataType -json`
 * @return Raw (unfiltered) identifier values, or ParseError
 */
[[nodiscard]] Result<Identifiers> parse_system_profiler(const std::string& output);

/**
 * @brief Bounds another probe by a wall-clock timeout
 *
 * The inner probe runs on a worker thread. If it does not finish in time
 * the worker is abandoned and every field is reported Unavailable with
 * reason Timeout.
 */
class TimedProbe : public ProbeInterface {
  public:
    TimedProbe(std::shared_ptr<ProbeInterface> inner, std::chrono::milliseconds timeout);

    [[nodiscard]] ProbeReport probe() override;
    [[nodiscard]] std::vector<std::string> fields() const override { return inner_->fields(); }
    [[nodiscard]] std::string name() const override { return inner_->name(); }

  private:
    std::shared_ptr<ProbeInterface> inner_;
    std::chrono::milliseconds timeout_;
};

#if defined(_WIN32) || defined(_WIN64)
/**
 * @brief Windows WMI probe
 *
 * Queries Win32_ComputerSystemProduct, Win32_BaseBoard,
 * Win32_SystemEnclosure and Win32_BIOS in ROOT\\CIMV2. Enumeration waits
 * use the time left of the query timeout. Wrap in TimedProbe to bound connection
 * setup as well.
 */
class WmiProbe : public ProbeInterface {
  public:
    explicit WmiProbe(std::chrono::milliseconds timeout);

    [[nodiscard]] ProbeReport probe() override;
    [[nodiscard]] std::vector<std::string> fields() const override;
    [[nodiscard]] std::string name() const override { return "windows-wmi"; }

  private:
    std::chrono::milliseconds timeout_;
};
#endif

/**
 * @brief Create the probe for the current operating system
 *
 * @param options Resolver options (paths and timeouts)
 * @return The platform probe, or UnsupportedPlatform
 */
[[nodiscard]] Result<std::unique_ptr<ProbeInterface>> make_platform_probe(const Options& options);

}  // namespace hwident
