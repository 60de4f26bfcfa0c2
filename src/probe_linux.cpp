#include "hwident/probe.hpp"

#include "logging.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

namespace hwident {

namespace {

// Identifier key -> DMI file
constexpr std::array<std::pair<const char*, const char*>, 6> kDmiFields = {{
    {keys::SYSTEM_UUID, "product_uuid"},
    {keys::BOARD_SERIAL, "board_serial"},
    {keys::PRODUCT_SERIAL, "product_serial"},
    {keys::CHASSIS_SERIAL, "chassis_serial"},
    {keys::PRODUCT_NAME, "product_name"},
    {keys::MANUFACTURER, "sys_vendor"},
}};

// DMI attributes are a single short line; anything past this is not an identifier
constexpr size_t kMaxValueSize = 4096;

ProbeOutcome read_dmi_file(const std::string& path) {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            LOG_DBG << "DMI field " << path << " requires elevated privileges";
            return ProbeOutcome::denied();
        }
        LOG_DBG << "DMI field " << path << " unavailable: " << std::strerror(err);
        return ProbeOutcome::unavailable();
    }

    std::string content;
    std::array<char, 256> buffer{};
    size_t n = 0;
    while (content.size() < kMaxValueSize &&
           (n = std::fread(buffer.data(), 1, buffer.size(), file)) > 0) {
        content.append(buffer.data(), n);
    }

    // Some kernels defer the permission check to read()
    bool failed = std::ferror(file) != 0;
    int err = errno;
    std::fclose(file);

    if (failed) {
        if (err == EACCES || err == EPERM) {
            return ProbeOutcome::denied();
        }
        LOG_DBG << "Failed to read DMI field " << path << ": " << std::strerror(err);
        return ProbeOutcome::unavailable();
    }

    // Trailing newline and NUL padding are stripped by the sanity filter
    return ProbeOutcome::of(std::move(content));
}

}  // namespace

LinuxProbe::LinuxProbe(std::string dmi_path) : dmi_path_(std::move(dmi_path)) {}

std::string LinuxProbe::file_for(const std::string& key) {
    for (const auto& [field_key, file] : kDmiFields) {
        if (key == field_key) {
            return file;
        }
    }
    return "";
}

std::vector<std::string> LinuxProbe::fields() const {
    std::vector<std::string> result;
    result.reserve(kDmiFields.size());
    for (const auto& entry : kDmiFields) {
        result.emplace_back(entry.first);
    }
    return result;
}

ProbeReport LinuxProbe::probe() {
    ProbeReport report;
    for (const auto& [key, file] : kDmiFields) {
        report[key] = read_dmi_file(dmi_path_ + "/" + file);
    }
    return report;
}

}  // namespace hwident
