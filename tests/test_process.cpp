#include <gtest/gtest.h>
#include <hwident/process.hpp>

#include <chrono>

namespace hwident {
namespace {

#if !defined(_WIN32)

// ==================== run_command Tests ====================

TEST(RunCommandTest, CapturesStandardOutput) {
    auto result = run_command({"echo", "hello"}, std::chrono::milliseconds(2000));

    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "hello\n");
}

TEST(RunCommandTest, ReportsExitCode) {
    auto result = run_command({"sh", "-c", "exit 3"}, std::chrono::milliseconds(2000));

    EXPECT_TRUE(result.started);
    EXPECT_EQ(result.exit_code, 3);
}

TEST(RunCommandTest, DiscardsStandardError) {
    auto result = run_command({"sh", "-c", "echo out; echo err 1>&2"},
                              std::chrono::milliseconds(2000));

    EXPECT_EQ(result.output, "out\n");
}

TEST(RunCommandTest, MissingCommandDoesNotStart) {
    auto result =
        run_command({"hwident-no-such-command-xyz"}, std::chrono::milliseconds(2000));

    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.timed_out);
    EXPECT_TRUE(result.output.empty());
}

TEST(RunCommandTest, EmptyArgvDoesNotStart) {
    auto result = run_command({}, std::chrono::milliseconds(100));

    EXPECT_FALSE(result.started);
}

TEST(RunCommandTest, SlowCommandIsKilledAtTimeout) {
    auto start = std::chrono::steady_clock::now();
    auto result = run_command({"sleep", "5"}, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(RunCommandTest, ChildHoldingNoOutputStillBounded) {
    // Closes stdout early, then keeps running
    auto start = std::chrono::steady_clock::now();
    auto result = run_command({"sh", "-c", "exec >&-; sleep 5"}, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

#endif

}  // namespace
}  // namespace hwident
