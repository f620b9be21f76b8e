#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <thread>
#include <vector>

TEST(RunShell, CapturesOutputAndExitCode) {
    auto r = platform::run_shell("echo out; echo err >&2; exit 3", 10);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
}

TEST(RunShell, StdinIsEmpty) {
    auto r = platform::run_shell("cat", 10);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.stdout_data.empty());
}

TEST(RunShell, TimeoutKillsCommand) {
    auto r = platform::run_shell("echo started; sleep 10", 1);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.stdout_data, "started\n");
    EXPECT_NE(r.stderr_data.find("timed out"), std::string::npos);
}

// Fast commands must see EOF as soon as they exit, even while slow
// siblings started from other threads are still running.
TEST(RunShell, ConcurrentCommandsDoNotShareOutputPipes) {
    constexpr int N = 16;
    std::vector<CommandResult> results(N);
    std::vector<std::thread> threads;
    for (int i = 0; i < N; i++) {
        threads.emplace_back([&results, i]() {
            const char* cmd = (i % 2 == 0) ? "sleep 4; echo i-slow" : "echo i-fast";
            results[i] = platform::run_shell(cmd, 2);
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 1; i < N; i += 2) {
        EXPECT_EQ(results[i].exit_code, 0) << "command " << i << ": " << results[i].stderr_data;
        EXPECT_EQ(results[i].stdout_data, "i-fast\n");
    }
}

TEST(Spawn, WaitReturnsExitCode) {
    auto proc = platform::spawn("sh", {"-c", "exit 4"});
    ASSERT_TRUE(proc.valid());
    EXPECT_EQ(proc.wait(), 4);
    // Already reaped
    EXPECT_EQ(proc.wait(), -1);
}

TEST(Spawn, MissingProgramExits127) {
    auto proc = platform::spawn("cumulus-no-such-program", {});
    ASSERT_TRUE(proc.valid());
    EXPECT_EQ(proc.wait(), 127);
}
