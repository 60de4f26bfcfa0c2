#include "hwident/probe.hpp"

#include "logging.hpp"

#include <nlohmann/json.hpp>

namespace hwident {

namespace {

constexpr const char* kDataType = "SPHardwareDataType";

const std::vector<std::string>& macos_fields() {
    static const std::vector<std::string> fields = {keys::SYSTEM_UUID, keys::PRODUCT_SERIAL,
                                                    keys::PRODUCT_NAME, keys::MANUFACTURER};
    return fields;
}

}  // namespace

Result<Identifiers> parse_system_profiler(const std::string& output) {
    if (output.empty()) {
        return Result<Identifiers>::error(ErrorCode::ParseError, "Empty profiler output");
    }

    try {
        auto j = nlohmann::json::parse(output);

        if (!j.is_object() || !j.contains(kDataType) || !j[kDataType].is_array() ||
            j[kDataType].empty()) {
            return Result<Identifiers>::error(ErrorCode::ParseError,
                                              "Missing SPHardwareDataType entries");
        }

        const auto& hw = j[kDataType].front();
        if (!hw.is_object()) {
            return Result<Identifiers>::error(ErrorCode::ParseError,
                                              "Hardware entry is not an object");
        }

        Identifiers result;
        if (hw.contains("platform_UUID") && hw["platform_UUID"].is_string()) {
            result[keys::SYSTEM_UUID] = hw["platform_UUID"].get<std::string>();
        }
        if (hw.contains("serial_number") && hw["serial_number"].is_string()) {
            result[keys::PRODUCT_SERIAL] = hw["serial_number"].get<std::string>();
        }
        if (hw.contains("machine_model") && hw["machine_model"].is_string()) {
            result[keys::PRODUCT_NAME] = hw["machine_model"].get<std::string>();
        }
        result[keys::MANUFACTURER] = "Apple Inc.";

        return Result<Identifiers>::ok(std::move(result));
    } catch (const nlohmann::json::exception& e) {
        return Result<Identifiers>::error(ErrorCode::ParseError,
                                          std::string("Failed to parse profiler output: ") +
                                              e.what());
    }
}

MacosProbe::MacosProbe(std::string command, std::chrono::milliseconds timeout,
                       CommandRunner runner)
    : command_(std::move(command)), timeout_(timeout), runner_(std::move(runner)) {}

std::vector<std::string> MacosProbe::fields() const {
    return macos_fields();
}

ProbeReport MacosProbe::probe() {
    CommandResult run;
    try {
        run = runner_({command_, kDataType, "-json"}, timeout_);
    } catch (const std::exception& e) {
        LOG_WAR << "Hardware profiler invocation failed: " << e.what();
        return unavailable_report(fields(), ErrorCode::SourceUnavailable);
    }

    if (run.timed_out) {
        LOG_WAR << command_ << " did not finish within " << timeout_.count() << " ms";
        return unavailable_report(fields(), ErrorCode::Timeout);
    }
    if (!run.started || run.exit_code != 0) {
        LOG_DBG << command_ << " failed (started=" << run.started << ", exit=" << run.exit_code
                << ")";
        return unavailable_report(fields(), ErrorCode::SourceUnavailable);
    }

    auto parsed = parse_system_profiler(run.output);
    if (parsed.is_error()) {
        LOG_DBG << parsed.error_message();
        return unavailable_report(fields(), ErrorCode::ParseError);
    }

    ProbeReport report = unavailable_report(fields(), ErrorCode::SourceUnavailable);
    for (auto& [key, value] : parsed.value()) {
        report[key] = ProbeOutcome::of(value);
    }
    return report;
}

}  // namespace hwident
