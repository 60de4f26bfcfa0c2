#include "hwident/resolver.hpp"
#include "hwident/cache.hpp"
#include "hwident/container.hpp"
#include "hwident/device.hpp"
#include "hwident/sanity.hpp"

#include "logging.hpp"

#include <mutex>
#include <optional>

namespace hwident {

// PIMPL implementation
class Resolver::Impl {
  public:
    Impl(std::unique_ptr<ProbeInterface> probe, std::unique_ptr<FallbackInterface> fallback,
         ContainerCheck container_check, std::string unsupported_reason = "")
        : probe_(std::move(probe)),
          fallback_(std::move(fallback)),
          container_check_(std::move(container_check)),
          unsupported_reason_(std::move(unsupported_reason)) {}

    Result<IdentifierResult> resolve(const ResolverConfig& config) {
        if (!probe_) {
            return Result<IdentifierResult>::error(
                ErrorCode::UnsupportedPlatform,
                unsupported_reason_.empty() ? "No hardware probe configured" : unsupported_reason_);
        }

        return cache_.get_or_compute(config, [this, &config]() { return compute(config); });
    }

    bool is_cached(const ResolverConfig& config) const {
        return cache_.peek(config).has_value();
    }

  private:
    Result<IdentifierResult> compute(const ResolverConfig& config) {
        IdentifierResult result;
        result.identifiers = primary_identifiers();

        // A missing system UUID is what triggers fallback
        if (config.include_fallback && !result.has(keys::SYSTEM_UUID)) {
            result.fallback = fallback_identifiers();
        }

        result.containerized = container_check_ ? container_check_() : false;

        LOG_DBG << "Resolved " << result.identifiers.size() << " primary and "
                << result.fallback.size() << " fallback identifiers"
                << (result.containerized ? " (containerized)" : "");

        return Result<IdentifierResult>::ok(std::move(result));
    }

    // Probe and filter once; shared by every config
    Identifiers primary_identifiers() {
        std::lock_guard<std::mutex> lock(probe_mutex_);
        if (primary_) {
            return *primary_;
        }

        ProbeReport report;
        try {
            report = probe_->probe();
        } catch (const std::exception& e) {
            LOG_WAR << probe_->name() << " probe failed: " << e.what();
        }

        Identifiers identifiers;
        for (const auto& [key, outcome] : report) {
            switch (outcome.status) {
                case ProbeStatus::Value: {
                    auto value = sanitize(outcome.value);
                    if (value) {
                        identifiers[key] = std::move(*value);
                    } else {
                        LOG_DBG << "Discarded placeholder value for " << key;
                    }
                    break;
                }
                case ProbeStatus::Denied:
                    LOG_DBG << key << " requires elevated privileges, omitted";
                    break;
                case ProbeStatus::Unavailable:
                    LOG_DBG << key << " unavailable: " << error_code_to_string(outcome.reason);
                    break;
            }
        }

        primary_ = identifiers;
        return identifiers;
    }

    Identifiers fallback_identifiers() {
        Identifiers result;
        if (!fallback_) {
            return result;
        }

        Identifiers collected;
        try {
            collected = fallback_->collect();
        } catch (const std::exception& e) {
            LOG_WAR << "Fallback identifiers unavailable: " << e.what();
            return result;
        }

        for (auto& [key, value] : collected) {
            std::string trimmed = trim(value);
            if (!trimmed.empty()) {
                result[key] = std::move(trimmed);
            }
        }
        return result;
    }

    std::unique_ptr<ProbeInterface> probe_;
    std::unique_ptr<FallbackInterface> fallback_;
    ContainerCheck container_check_;
    std::string unsupported_reason_;

    ResolutionCache cache_;

    std::mutex probe_mutex_;
    std::optional<Identifiers> primary_;
};

// ==================== Resolver ====================

Resolver::Resolver(Options options) {
    auto probe = make_platform_probe(options);
    if (probe.is_error()) {
        LOG_ERR << "Hardware identifiers unavailable on " << device::get_platform_name() << ": "
                << probe.error_message();
        impl_ = std::make_unique<Impl>(nullptr, nullptr, nullptr, probe.error_message());
        return;
    }

    impl_ = std::make_unique<Impl>(std::move(probe).value(),
                                   std::make_unique<SystemFallback>(options.machine_id_paths),
                                   is_containerized);
}

Resolver::Resolver(std::unique_ptr<ProbeInterface> probe,
                   std::unique_ptr<FallbackInterface> fallback, ContainerCheck container_check)
    : impl_(std::make_unique<Impl>(std::move(probe), std::move(fallback),
                                   std::move(container_check))) {}

Resolver::~Resolver() = default;

Result<IdentifierResult> Resolver::resolve(const ResolverConfig& config) {
    return impl_->resolve(config);
}

bool Resolver::is_cached(const ResolverConfig& config) const {
    return impl_->is_cached(config);
}

Resolver& Resolver::instance() {
    static Resolver resolver;
    return resolver;
}

Result<IdentifierResult> get_dmi_info(bool include_fallback) {
    ResolverConfig config;
    config.include_fallback = include_fallback;
    return Resolver::instance().resolve(config);
}

}  // namespace hwident
