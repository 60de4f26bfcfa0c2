#include <gtest/gtest.h>
#include <hwident/device.hpp>
#include <hwident/fallback.hpp>

#include "test_support.hpp"

namespace hwident {
namespace {

using testing_support::TempDirectory;

#if !defined(_WIN32)

// ==================== Machine id Tests ====================

class MachineIdTest : public ::testing::Test {
  protected:
    TempDirectory dir;
};

TEST_F(MachineIdTest, ReadsFirstUsableFile) {
    dir.write("machine-id", "4c4c4544003957108052b4c04f384833\n");

    SystemFallback fallback({dir.file("machine-id")});
    EXPECT_EQ(fallback.read_machine_id(), "4c4c4544003957108052b4c04f384833");
}

TEST_F(MachineIdTest, SkipsUninitializedAndMissingFiles) {
    dir.write("etc-machine-id", "uninitialized\n");
    dir.write("dbus-machine-id", "a1b2c3d4e5f60718293a4b5c6d7e8f90\n");

    SystemFallback fallback(
        {dir.file("absent"), dir.file("etc-machine-id"), dir.file("dbus-machine-id")});
    EXPECT_EQ(fallback.read_machine_id(), "a1b2c3d4e5f60718293a4b5c6d7e8f90");
}

TEST_F(MachineIdTest, SkipsEmptyAndDegenerateIds) {
    dir.write("empty", "\n");
    dir.write("zeros", "00000000000000000000000000000000\n");

    SystemFallback fallback({dir.file("empty"), dir.file("zeros")});
    EXPECT_EQ(fallback.read_machine_id(), "");

    auto ids = fallback.collect();
    EXPECT_EQ(ids.count(keys::MACHINE_ID), 0u);
}

TEST_F(MachineIdTest, NoCandidatesYieldsNoMachineId) {
    SystemFallback fallback(std::vector<std::string>{});
    EXPECT_EQ(fallback.read_machine_id(), "");
}

#endif

// ==================== Host name Tests ====================

TEST(FallbackHostnameTest, HostnameIsUsableOrAbsent) {
    SystemFallback fallback(std::vector<std::string>{});
    auto ids = fallback.collect();

    auto it = ids.find(keys::HOSTNAME);
    if (it == ids.end()) {
        SUCCEED() << "host has no usable name";
        return;
    }
    EXPECT_FALSE(it->second.empty());
    EXPECT_NE(it->second, "localhost");
    EXPECT_EQ(it->second, device::get_hostname());
}

TEST(FallbackHostnameTest, CollectOnlyProducesKnownKeys) {
    SystemFallback fallback;
    auto ids = fallback.collect();

    for (const auto& [key, value] : ids) {
        EXPECT_TRUE(key == keys::MACHINE_ID || key == keys::HOSTNAME) << key;
        EXPECT_FALSE(value.empty()) << key;
    }
}

}  // namespace
}  // namespace hwident
