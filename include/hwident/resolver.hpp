#pragma once

/**
 * @file resolver.hpp
 * @brief Identifier resolution pipeline
 *
 * probe -> sanity filter -> fallback (when the system UUID is missing) ->
 * container annotation -> cache.
 */

#include "hwident/fallback.hpp"
#include "hwident/hwident.hpp"
#include "hwident/probe.hpp"

#include <functional>
#include <memory>

namespace hwident {

/// Container check used to annotate results
using ContainerCheck = std::function<bool()>;

/**
 * @brief Resolves hardware identifiers for this host
 *
 * The OS is probed at most once per resolver; each ResolverConfig result is
 * computed at most once and cached for the resolver's lifetime.
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * ## Process-wide resolver
 *
 * Resolver::instance() owns the process-wide cache. It is created with
 * default Options on first use and lives until process exit:
 * ```cpp
 * auto result = hwident::get_dmi_info();
 * if (result.is_ok()) {
 *     auto uuid = result.value().get(hwident::keys::SYSTEM_UUID);
 * }
 * ```
 */
class Resolver {
  public:
    /// Construct with the probe for the current OS
    explicit Resolver(Options options = {});

    /// Construct with explicit collaborators (testing, embedding)
    /// @param probe Platform probe; nullptr makes resolve() fail with UnsupportedPlatform
    /// @param fallback Fallback source; nullptr disables fallback identifiers
    /// @param container_check Container annotation; empty means "not containerized"
    Resolver(std::unique_ptr<ProbeInterface> probe, std::unique_ptr<FallbackInterface> fallback,
             ContainerCheck container_check);

    ~Resolver();

    // Non-copyable, non-movable (owns the cache and its mutexes)
    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    /**
     * @brief Resolve identifiers
     *
     * Never fails for missing, denied or timed-out sources: those fields are
     * omitted. Fails only with UnsupportedPlatform.
     */
    [[nodiscard]] Result<IdentifierResult> resolve(const ResolverConfig& config = {});

    /// Check whether a result for @p config is cached
    [[nodiscard]] bool is_cached(const ResolverConfig& config) const;

    /// The process-wide resolver
    [[nodiscard]] static Resolver& instance();

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Resolve this host's hardware identifiers through the process-wide resolver
 *
 * @param include_fallback Add machine id / host name when the system UUID is unavailable
 * @return Identifiers, or UnsupportedPlatform when no probe exists for this OS
 */
[[nodiscard]] Result<IdentifierResult> get_dmi_info(bool include_fallback = true);

}  // namespace hwident
