#include "hwident/probe.hpp"

#include "logging.hpp"
#include "platform.hpp"

#include <future>
#include <system_error>
#include <thread>

namespace hwident {

ProbeReport unavailable_report(const std::vector<std::string>& fields, ErrorCode reason) {
    ProbeReport report;
    for (const auto& key : fields) {
        report[key] = ProbeOutcome::unavailable(reason);
    }
    return report;
}

// ==================== TimedProbe ====================

TimedProbe::TimedProbe(std::shared_ptr<ProbeInterface> inner, std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout) {}

ProbeReport TimedProbe::probe() {
    // Shared with the worker so an abandoned worker never touches freed state
    auto promise = std::make_shared<std::promise<ProbeReport>>();
    auto future = promise->get_future();

    std::thread worker;
    try {
        worker = std::thread([inner = inner_, promise]() {
            try {
                promise->set_value(inner->probe());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    } catch (const std::system_error& e) {
        LOG_WAR << "Could not start " << inner_->name() << " probe worker: " << e.what();
        return unavailable_report(inner_->fields(), ErrorCode::SourceUnavailable);
    }

    if (future.wait_for(timeout_) != std::future_status::ready) {
        worker.detach();
        LOG_WAR << inner_->name() << " probe exceeded " << timeout_.count()
                << " ms, treating all fields as unavailable";
        return unavailable_report(inner_->fields(), ErrorCode::Timeout);
    }

    worker.join();
    try {
        return future.get();
    } catch (const std::exception& e) {
        LOG_WAR << inner_->name() << " probe failed: " << e.what();
        return unavailable_report(inner_->fields(), ErrorCode::Unknown);
    }
}

// ==================== Platform selection ====================

Result<std::unique_ptr<ProbeInterface>> make_platform_probe(const Options& options) {
    using ProbePtr = std::unique_ptr<ProbeInterface>;

#if defined(HWIDENT_PLATFORM_LINUX)
    return Result<ProbePtr>::ok(std::make_unique<LinuxProbe>(options.dmi_path));
#elif defined(HWIDENT_PLATFORM_WINDOWS)
    auto timeout = std::chrono::milliseconds(options.query_timeout_ms);
    return Result<ProbePtr>::ok(
        std::make_unique<TimedProbe>(std::make_shared<WmiProbe>(timeout), timeout));
#elif defined(HWIDENT_PLATFORM_MACOS)
    return Result<ProbePtr>::ok(std::make_unique<MacosProbe>(
        options.profiler_command, std::chrono::milliseconds(options.command_timeout_ms)));
#else
    (void)options;
    return Result<ProbePtr>::error(ErrorCode::UnsupportedPlatform,
                                   "No hardware probe for this operating system");
#endif
}

}  // namespace hwident
