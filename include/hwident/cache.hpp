#pragma once

/**
 * @file cache.hpp
 * @brief Resolution cache keyed by resolver configuration
 */

#include "hwident/hwident.hpp"

#include <array>
#include <functional>
#include <mutex>
#include <optional>

namespace hwident {

/**
 * @brief Populate-once cache of resolved identifiers
 *
 * Holds one entry per ResolverConfig (one per include_fallback value).
 * Entries never expire: hardware identifiers are static for a running host.
 * There is no invalidation.
 *
 * Thread Safety: each entry has its own mutex, held across
 * check-compute-store. Concurrent callers for the same config wait for the
 * first computation and receive its stored value. Failed computations are
 * not stored.
 */
class ResolutionCache {
  public:
    using ComputeFn = std::function<Result<IdentifierResult>()>;

    ResolutionCache() = default;

    // Not copyable or movable (contains mutexes)
    ResolutionCache(const ResolutionCache&) = delete;
    ResolutionCache& operator=(const ResolutionCache&) = delete;

    /**
     * @brief Return the cached result for @p config, computing it on a miss
     *
     * @param config Configuration selecting the entry
     * @param compute Invoked at most once per config until it succeeds
     */
    [[nodiscard]] Result<IdentifierResult> get_or_compute(const ResolverConfig& config,
                                                          const ComputeFn& compute);

    /// Cached entry for @p config, if populated
    [[nodiscard]] std::optional<IdentifierResult> peek(const ResolverConfig& config) const;

  private:
    struct Entry {
        mutable std::mutex mutex;
        std::optional<IdentifierResult> value;
    };

    [[nodiscard]] Entry& entry_for(const ResolverConfig& config);
    [[nodiscard]] const Entry& entry_for(const ResolverConfig& config) const;

    std::array<Entry, 2> entries_;
};

}  // namespace hwident
