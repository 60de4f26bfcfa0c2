/**
 * @file basic_usage.cpp
 * @brief Basic usage example for hwident
 *
 * This example demonstrates how to:
 * - Resolve identifiers through the process-wide resolver
 * - Tell primary identifiers from fallback identifiers
 * - Build a resolver with custom options
 * - Derive a device fingerprint
 */

#include <hwident/device.hpp>
#include <hwident/resolver.hpp>

#include <iostream>

int main() {
    // Example 1: process-wide resolver (cached after the first call)
    std::cout << "=== Hardware identifiers ===\n";
    auto result = hwident::get_dmi_info();
    if (result.is_error()) {
        std::cerr << "Error: " << result.error_message() << "\n";
        return 1;
    }

    const auto& info = result.value();
    for (const auto& [key, value] : info.identifiers) {
        std::cout << "  " << key << ": " << value << "\n";
    }

    // Example 2: fallback identifiers are kept apart from hardware identifiers
    if (!info.has(hwident::keys::SYSTEM_UUID)) {
        std::cout << "\nNo system UUID; fallback identifiers:\n";
        for (const auto& [key, value] : info.fallback) {
            std::cout << "  " << key << ": " << value << "\n";
        }
    }

    if (info.containerized) {
        std::cout << "\nRunning in a container: identifiers may be shared with other containers\n";
    }

    // Example 3: a dedicated resolver with a shorter probe timeout
    hwident::Options options;
    options.query_timeout_ms = 2000;
    options.command_timeout_ms = 2000;

    hwident::Resolver resolver(options);
    hwident::ResolverConfig config;
    config.include_fallback = false;

    auto strict = resolver.resolve(config);
    if (strict.is_ok()) {
        std::cout << "\nHardware-only identifiers: " << strict.value().identifiers.size() << "\n";
    }

    // Example 4: fingerprint for storage or transmission instead of raw serials
    std::cout << "\nFingerprint: " << hwident::device::fingerprint(info) << "\n";
    std::cout << "Platform: " << hwident::device::get_platform_name() << "\n";

    return 0;
}
