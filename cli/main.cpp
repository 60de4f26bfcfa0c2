/**
 * @file main.cpp
 * @brief hwident command-line tool
 *
 * Prints this host's hardware identifiers as JSON.
 * Exit codes: 0 success, 1 invalid command line, 2 unsupported platform.
 */

#include <hwident/device.hpp>
#include <hwident/json.hpp>
#include <hwident/resolver.hpp>

#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace po = boost::program_options;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitUnsupported = 2;

}  // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Print hardware identifiers\nUsage: hwident [options]");
    desc.add_options()
        ("help,h", "Show this help")
        ("version", "Show version")
        ("no-fallback", "Do not add machine id / host name when the system UUID is unavailable")
        ("fingerprint,f", "Add a hashed device fingerprint")
        ("platform,p", "Add the platform name")
        ("verbose,v", "Log probe diagnostics to stderr");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "hwident: " << e.what() << "\n" << desc << "\n";
        return kExitUsage;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }
    if (vm.count("version")) {
        std::cout << "hwident " << hwident::VERSION << "\n";
        return 0;
    }

    // Diagnostics go to stderr so stdout stays valid JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("hwident"));
    spdlog::set_level(vm.count("verbose") ? spdlog::level::debug : spdlog::level::warn);

    auto result = hwident::get_dmi_info(vm.count("no-fallback") == 0);
    if (result.is_error()) {
        std::cerr << "hwident: " << hwident::error_code_to_string(result.error_code()) << ": "
                  << result.error_message() << "\n";
        return kExitUnsupported;
    }

    auto output = hwident::json::to_json(result.value());
    if (vm.count("fingerprint")) {
        output["fingerprint"] = hwident::device::fingerprint(result.value());
    }
    if (vm.count("platform")) {
        output["platform"] = hwident::device::get_platform_name();
    }

    std::cout << output.dump(2) << "\n";
    return 0;
}
