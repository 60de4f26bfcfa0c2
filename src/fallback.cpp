#include "hwident/fallback.hpp"
#include "hwident/device.hpp"
#include "hwident/sanity.hpp"

#include "logging.hpp"
#include "platform.hpp"

#include <fstream>

#if defined(HWIDENT_PLATFORM_WINDOWS)
#include <windows.h>
#endif

namespace hwident {

namespace {

// Written by systemd when the id has not been committed yet
bool is_unusable_machine_id(const std::string& id) {
    return id == "unavailable" || id == "uninitialized";
}

#if defined(HWIDENT_PLATFORM_WINDOWS)

std::string get_windows_machine_guid() {
    HKEY hKey;
    LONG result = RegOpenKeyExA(HKEY_LOCAL_MACHINE, "SOFTWARE\\Microsoft\\Cryptography", 0,
                                KEY_READ | KEY_WOW64_64KEY, &hKey);

    if (result != ERROR_SUCCESS) {
        LOG_DBG << "Cryptography registry key unavailable, error " << result;
        return "";
    }

    char guid[256] = {0};
    DWORD size = sizeof(guid) - 1;
    DWORD type = REG_SZ;

    result = RegQueryValueExA(hKey, "MachineGuid", nullptr, &type,
                              reinterpret_cast<LPBYTE>(guid), &size);

    RegCloseKey(hKey);

    if (result != ERROR_SUCCESS || type != REG_SZ) {
        LOG_DBG << "MachineGuid unavailable, error " << result;
        return "";
    }

    return std::string(guid);
}

#endif

}  // namespace

SystemFallback::SystemFallback(std::vector<std::string> machine_id_paths)
    : machine_id_paths_(std::move(machine_id_paths)) {}

std::string SystemFallback::read_machine_id() const {
#if defined(HWIDENT_PLATFORM_WINDOWS)
    std::string guid = trim(get_windows_machine_guid());
    if (!guid.empty()) {
        return guid;
    }
#endif

    for (const auto& path : machine_id_paths_) {
        std::ifstream file(path);
        if (!file.is_open()) {
            continue;
        }
        std::string machine_id;
        std::getline(file, machine_id);
        machine_id = trim(machine_id);
        if (!machine_id.empty() && !is_unusable_machine_id(machine_id) &&
            !is_degenerate(machine_id)) {
            return machine_id;
        }
        LOG_DBG << "Ignoring unusable machine id in " << path;
    }

    return "";
}

Identifiers SystemFallback::collect() {
    Identifiers result;

    std::string machine_id = read_machine_id();
    if (!machine_id.empty()) {
        result[keys::MACHINE_ID] = machine_id;
    }

    std::string hostname = trim(device::get_hostname());
    if (!hostname.empty() && hostname != "localhost" && hostname != "unknown") {
        result[keys::HOSTNAME] = hostname;
    }

    return result;
}

}  // namespace hwident
