#include "hwident/cache.hpp"

namespace hwident {

ResolutionCache::Entry& ResolutionCache::entry_for(const ResolverConfig& config) {
    return entries_[config.include_fallback ? 1 : 0];
}

const ResolutionCache::Entry& ResolutionCache::entry_for(const ResolverConfig& config) const {
    return entries_[config.include_fallback ? 1 : 0];
}

Result<IdentifierResult> ResolutionCache::get_or_compute(const ResolverConfig& config,
                                                         const ComputeFn& compute) {
    Entry& entry = entry_for(config);
    std::lock_guard<std::mutex> lock(entry.mutex);

    if (entry.value) {
        return Result<IdentifierResult>::ok(*entry.value);
    }

    auto result = compute();
    if (result.is_ok()) {
        entry.value = result.value();
    }
    return result;
}

std::optional<IdentifierResult> ResolutionCache::peek(const ResolverConfig& config) const {
    const Entry& entry = entry_for(config);
    std::lock_guard<std::mutex> lock(entry.mutex);
    return entry.value;
}

}  // namespace hwident
