#include "hwident/container.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace hwident {

bool ContainerDetector::has_marker_file() const {
    return std::any_of(paths_.marker_files.begin(), paths_.marker_files.end(),
                       [](const std::string& path) {
                           std::error_code ec;
                           bool found = std::filesystem::exists(path, ec);
                           if (found) {
                               LOG_DBG << "Container marker file present: " << path;
                           }
                           return found;
                       });
}

bool ContainerDetector::has_container_cgroup() const {
    std::ifstream file(paths_.cgroup_file);
    if (!file.is_open()) {
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    for (const auto& marker : paths_.cgroup_markers) {
        if (content.find(marker) != std::string::npos) {
            LOG_DBG << "Container cgroup membership: " << marker;
            return true;
        }
    }
    return false;
}

bool ContainerDetector::has_env_marker() const {
    for (const auto& name : paths_.env_markers) {
#if defined(_MSC_VER)
        char* value = nullptr;
        size_t len = 0;
        bool set = _dupenv_s(&value, &len, name.c_str()) == 0 && value != nullptr &&
                   value[0] != '\0';
        free(value);
#else
        const char* value = std::getenv(name.c_str());
        bool set = value != nullptr && value[0] != '\0';
#endif
        if (set) {
            LOG_DBG << "Container environment marker set: " << name;
            return true;
        }
    }
    return false;
}

bool ContainerDetector::detect() const {
    return has_marker_file() || has_container_cgroup() || has_env_marker();
}

bool is_containerized() {
    static const bool containerized = ContainerDetector().detect();
    return containerized;
}

}  // namespace hwident
