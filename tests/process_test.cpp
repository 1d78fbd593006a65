#include "simdbuild/build/process.hpp"
#include "test_support.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <sys/types.h>
#include <thread>
#include <unistd.h>

using namespace simdbuild::build;
using simdbuild::test::TempDir;
using simdbuild::test::write_script;

namespace {

/// True once `pid` no longer runs: gone, or a zombie awaiting its new parent.
bool process_gone(pid_t pid) {
    if (kill(pid, 0) != 0) {
        return true;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string field;
    stat >> field >> field >> field;
    return field == "Z";
}

} // namespace

// ============================================================================
// run_process
// ============================================================================

TEST(ProcessTest, CapturesStdoutAndExitCode) {
    auto result = run_process("/bin/sh", {"-c", "echo hello; exit 0"});
    EXPECT_TRUE(result.launched);
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_TRUE(result.stderr_output.empty());
}

TEST(ProcessTest, CapturesStderrSeparately) {
    auto result = run_process("/bin/sh", {"-c", "echo out; echo 'kernel.ispc:3: error' >&2; exit 2"});
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "kernel.ispc:3: error\n");
}

TEST(ProcessTest, LargeOutputDoesNotBlock) {
    auto result = run_process("/bin/sh", {"-c", "i=0; while [ $i -lt 20000 ]; do echo "
                                                "line-$i; echo err-$i >&2; i=$((i+1)); done"});
    ASSERT_TRUE(result.success());
    EXPECT_GT(result.stdout_output.size(), 100000u);
    EXPECT_GT(result.stderr_output.size(), 100000u);
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    TempDir dir;
    auto result = run_process("/bin/sh", {"-c", "pwd"}, dir.path());
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.stdout_output, dir.path().string() + "\n");
}

TEST(ProcessTest, MissingExecutableIsNotLaunched) {
    TempDir dir;
    auto result = run_process(dir.path() / "no-such-tool", {});
    EXPECT_FALSE(result.launched);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(live_child_count(), 0u);
}

TEST(ProcessTest, SignalIsReported) {
    auto result = run_process("/bin/sh", {"-c", "kill -TERM $$"});
    EXPECT_TRUE(result.launched);
    EXPECT_FALSE(result.success());
    EXPECT_NE(result.term_signal, 0);
}

// ============================================================================
// Interrupts
// ============================================================================

TEST(InterruptTest, TermStopsRunningChild) {
    TempDir dir;
    auto pid_file = dir.path() / "child.pid";

    EXPECT_EXIT(
        {
            install_interrupt_handlers();
            std::thread interrupter([&pid_file] {
                while (live_child_count() == 0 || !fs::exists(pid_file)) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                kill(getpid(), SIGTERM);
            });
            interrupter.detach();
            run_process("/bin/sh", {"-c", "echo $$ > '" + pid_file.string() +
                                              ".tmp'; mv '" + pid_file.string() + ".tmp' '" +
                                              pid_file.string() + "'; exec sleep 30"});
            std::exit(0);
        },
        ::testing::KilledBySignal(SIGTERM), "");

    ASSERT_TRUE(fs::exists(pid_file));
    pid_t child = static_cast<pid_t>(std::stol(simdbuild::test::read_file(pid_file)));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!process_gone(child) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(process_gone(child)) << "child " << child << " outlived the interrupt";
    if (!process_gone(child)) {
        kill(child, SIGKILL);
    }
}

// ============================================================================
// find_executable
// ============================================================================

TEST(FindExecutableTest, SearchesDirectoriesInOrder) {
    TempDir dir;
    auto first = dir.path() / "first";
    auto second = dir.path() / "second";
    write_script(second / "ispc", "#!/bin/sh\n");
    write_script(first / "ispc", "#!/bin/sh\n");

    auto found = find_executable("ispc", {first, second});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, first / "ispc");
}

TEST(FindExecutableTest, SkipsNonExecutableFiles) {
    TempDir dir;
    simdbuild::test::write_file(dir.path() / "a" / "ispc", "not a program");
    write_script(dir.path() / "b" / "ispc", "#!/bin/sh\n");

    auto found = find_executable("ispc", {dir.path() / "a", dir.path() / "b"});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, dir.path() / "b" / "ispc");
}

TEST(FindExecutableTest, PathWithSeparatorIsCheckedAsGiven) {
    TempDir dir;
    auto tool = dir.path() / "tools" / "ispc";
    write_script(tool, "#!/bin/sh\n");

    EXPECT_EQ(find_executable(tool.string(), {}), tool);
    EXPECT_FALSE(find_executable((dir.path() / "tools" / "clang").string(), {}).has_value());
    EXPECT_FALSE(find_executable("", {dir.path()}).has_value());
}

TEST(FormatCommandTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(format_command("/usr/bin/ispc", {"-O2", "my kernel.ispc"}),
              "/usr/bin/ispc -O2 \"my kernel.ispc\"");
}
