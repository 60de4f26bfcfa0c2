#include <gtest/gtest.h>
#include <hwident/container.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <cstdlib>

namespace hwident {
namespace {

using testing_support::TempDirectory;

// Paths that point only into a scratch directory
ContainerDetector::Paths isolated_paths(const TempDirectory& dir) {
    ContainerDetector::Paths paths;
    paths.marker_files = {dir.file(".dockerenv"), dir.file(".containerenv")};
    paths.cgroup_file = dir.file("cgroup");
    paths.env_markers = {"HWIDENT_TEST_CONTAINER_MARKER_UNSET"};
    return paths;
}

// ==================== Marker files ====================

TEST(ContainerDetectorTest, CleanHostIsNotContainerized) {
    TempDirectory dir;
    dir.write("cgroup", "0::/user.slice/user-1000.slice/session-2.scope\n");

    ContainerDetector detector(isolated_paths(dir));
    EXPECT_FALSE(detector.has_marker_file());
    EXPECT_FALSE(detector.has_container_cgroup());
    EXPECT_FALSE(detector.has_env_marker());
    EXPECT_FALSE(detector.detect());
}

TEST(ContainerDetectorTest, DockerEnvFileDetected) {
    TempDirectory dir;
    dir.write(".dockerenv", "");

    ContainerDetector detector(isolated_paths(dir));
    EXPECT_TRUE(detector.has_marker_file());
    EXPECT_TRUE(detector.detect());
}

TEST(ContainerDetectorTest, PodmanContainerEnvFileDetected) {
    TempDirectory dir;
    dir.write(".containerenv", "engine=\"podman-4.9.3\"\n");

    ContainerDetector detector(isolated_paths(dir));
    EXPECT_TRUE(detector.detect());
}

// ==================== cgroup membership ====================

TEST(ContainerDetectorTest, DockerCgroupDetected) {
    TempDirectory dir;
    dir.write("cgroup",
              "12:pids:/docker/3f9a1c0e7b2d4a5f8e6c1b0a9d8e7f6a5b4c3d2e1f0a9b8c7d6e5f4a3b2c1d0e\n"
              "0::/docker/3f9a1c0e7b2d4a5f8e6c1b0a9d8e7f6a5b4c3d2e1f0a9b8c7d6e5f4a3b2c1d0e\n");

    ContainerDetector detector(isolated_paths(dir));
    EXPECT_TRUE(detector.has_container_cgroup());
    EXPECT_TRUE(detector.detect());
}

TEST(ContainerDetectorTest, KubernetesCgroupDetected) {
    TempDirectory dir;
    dir.write("cgroup", "0::/kubepods/burstable/pod1234/abcdef\n");

    ContainerDetector detector(isolated_paths(dir));
    EXPECT_TRUE(detector.has_container_cgroup());
}

TEST(ContainerDetectorTest, MissingCgroupFileIsNotAMatch) {
    TempDirectory dir;

    ContainerDetector detector(isolated_paths(dir));
    EXPECT_FALSE(detector.has_container_cgroup());
}

// ==================== Environment markers ====================

#if !defined(_WIN32)
TEST(ContainerDetectorTest, EnvironmentMarkerDetected) {
    TempDirectory dir;
    auto paths = isolated_paths(dir);
    paths.env_markers = {"HWIDENT_TEST_CONTAINER_MARKER"};

    ::setenv("HWIDENT_TEST_CONTAINER_MARKER", "oci", 1);
    ContainerDetector detector(paths);
    bool detected = detector.has_env_marker();
    ::unsetenv("HWIDENT_TEST_CONTAINER_MARKER");

    EXPECT_TRUE(detected);
}

TEST(ContainerDetectorTest, EmptyEnvironmentMarkerIgnored) {
    TempDirectory dir;
    auto paths = isolated_paths(dir);
    paths.env_markers = {"HWIDENT_TEST_CONTAINER_MARKER_EMPTY"};

    ::setenv("HWIDENT_TEST_CONTAINER_MARKER_EMPTY", "", 1);
    ContainerDetector detector(paths);
    bool detected = detector.has_env_marker();
    ::unsetenv("HWIDENT_TEST_CONTAINER_MARKER_EMPTY");

    EXPECT_FALSE(detected);
}
#endif

TEST(ContainerDetectorTest, DefaultPathsCoverKnownRuntimes) {
    ContainerDetector detector;
    const auto& markers = detector.paths().cgroup_markers;

    for (const char* runtime : {"docker", "containerd", "kubepods", "lxc", "podman"}) {
        EXPECT_NE(std::find(markers.begin(), markers.end(), runtime), markers.end()) << runtime;
    }
    EXPECT_EQ(detector.paths().cgroup_file, "/proc/self/cgroup");
}

TEST(ContainerDetectorTest, ProcessWideCheckIsStable) {
    EXPECT_EQ(is_containerized(), is_containerized());
}

}  // namespace
}  // namespace hwident
