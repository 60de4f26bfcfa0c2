#pragma once

/**
 * @file container.hpp
 * @brief Container runtime detection
 *
 * DMI tables inside containers are often virtualized or shared by every
 * container on the same host. Detection only annotates a result; it never
 * changes which identifiers are returned.
 */

#include <string>
#include <utility>
#include <vector>

namespace hwident {

/**
 * @brief Heuristic container detector
 *
 * Checks, in order: runtime marker files, cgroup membership strings and
 * environment markers.
 */
class ContainerDetector {
  public:
    /// Locations inspected by the detector
    struct Paths {
        std::vector<std::string> marker_files = {"/.dockerenv", "/run/.containerenv"};
        std::string cgroup_file = "/proc/self/cgroup";
        std::vector<std::string> cgroup_markers = {"docker", "containerd", "kubepods", "lxc",
                                                   "podman"};
        std::vector<std::string> env_markers = {"container"};
    };

    ContainerDetector() = default;
    explicit ContainerDetector(Paths paths) : paths_(std::move(paths)) {}

    /// Run every check; true on the first match
    [[nodiscard]] bool detect() const;

    [[nodiscard]] bool has_marker_file() const;
    [[nodiscard]] bool has_container_cgroup() const;
    [[nodiscard]] bool has_env_marker() const;

    [[nodiscard]] const Paths& paths() const noexcept { return paths_; }

  private:
    Paths paths_;
};

/**
 * @brief Process-wide container check
 *
 * Computed once with the default paths on first use; thread-safe.
 */
[[nodiscard]] bool is_containerized();

}  // namespace hwident
