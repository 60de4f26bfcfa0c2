#pragma once

/**
 * @file hwident.hpp
 * @brief hwident core types
 *
 * Hardware identifier resolution without elevated privileges.
 * Shared types: error codes, the Result type, identifier keys and the
 * resolved identifier mapping.
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hwident {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Identifier mapping (key -> value)
using Identifiers = std::map<std::string, std::string>;

/// Error codes used by probes and resolution
enum class ErrorCode {
    Success = 0,

    // Per-field source failures (absorbed, field omitted)
    SourceUnavailable,
    PermissionDenied,
    Timeout,
    ParseError,

    // Resolution failures (propagated to the caller)
    UnsupportedPlatform,

    InvalidParameter,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::SourceUnavailable:
            return "Source unavailable";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::UnsupportedPlatform:
            return "Unsupported platform";
        case ErrorCode::InvalidParameter:
            return "Invalid parameter";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

// Identifier keys
namespace keys {
constexpr const char* SYSTEM_UUID = "system_uuid";
constexpr const char* BOARD_SERIAL = "board_serial";
constexpr const char* PRODUCT_SERIAL = "product_serial";
constexpr const char* CHASSIS_SERIAL = "chassis_serial";
constexpr const char* BIOS_SERIAL = "bios_serial";
constexpr const char* PRODUCT_NAME = "product_name";
constexpr const char* MANUFACTURER = "manufacturer";
constexpr const char* MACHINE_ID = "machine_id";
constexpr const char* HOSTNAME = "hostname";
}  // namespace keys

/**
 * @brief Resolved hardware identifiers
 *
 * Primary identifiers come from the platform probe and passed the sanity
 * filter. Fallback identifiers (machine id, host name) are weaker and kept
 * in their own mapping so their provenance is never hidden.
 */
struct IdentifierResult {
    Identifiers identifiers;     // Primary hardware identifiers
    Identifiers fallback;        // Fallback-provenance identifiers
    bool containerized = false;  // Process runs inside a container runtime

    /// True when neither primary nor fallback identifiers were resolved
    [[nodiscard]] bool empty() const noexcept { return identifiers.empty() && fallback.empty(); }

    /// Check for a primary identifier
    [[nodiscard]] bool has(const std::string& key) const {
        return identifiers.find(key) != identifiers.end();
    }

    /// Primary identifier value, if resolved
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        auto it = identifiers.find(key);
        if (it == identifiers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool operator==(const IdentifierResult& other) const {
        return identifiers == other.identifiers && fallback == other.fallback &&
               containerized == other.containerized;
    }
    bool operator!=(const IdentifierResult& other) const { return !(*this == other); }
};

/**
 * @brief Per-call resolver configuration
 */
struct ResolverConfig {
    /// Collect machine id / host name when the system UUID is unavailable
    bool include_fallback = true;
};

/**
 * @brief Construction-time settings for a resolver
 */
struct Options {
    /// Directory exposing DMI fields as text files (Linux)
    std::string dmi_path = "/sys/class/dmi/id";

    /// Candidate files holding the OS machine identifier
    std::vector<std::string> machine_id_paths = {"/etc/machine-id", "/var/lib/dbus/machine-id"};

    /// Upper bound for the WMI query in milliseconds (Windows)
    int query_timeout_ms = 5000;

    /// Upper bound for the hardware profiler command in milliseconds (macOS)
    int command_timeout_ms = 3000;

    /// Hardware profiler command (macOS)
    std::string profiler_command = "system_profiler";
};

}  // namespace hwident
