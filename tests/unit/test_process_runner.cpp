/**
 * @file test_process_runner.cpp
 * @brief Unit tests for ProcessRunner and TempWorkspace.
 */

#include "executor/process_runner.hpp"
#include "executor/temp_workspace.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace cloudlet;
using namespace std::chrono_literals;

namespace {

SteadyTime in(std::chrono::milliseconds ms) {
    return std::chrono::steady_clock::now() + ms;
}

ProcessSpec shell(std::string script) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", std::move(script)};
    return spec;
}

}  // namespace

// ─────────────────────────────────────────────
// ProcessRunner
// ─────────────────────────────────────────────

TEST(ProcessRunner, CapturesExitCodeAndOutput) {
    ProcessRunner runner;
    auto outcome = runner.run(shell("printf out; printf err >&2; exit 7"), in(5000ms), {});
    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 7);
    EXPECT_EQ(to_text(outcome.stdout_data), "out");
    EXPECT_EQ(outcome.stderr_text, "err");
}

TEST(ProcessRunner, FeedsStdin) {
    ProcessRunner runner;
    auto spec = shell("tr a-z A-Z");
    spec.stdin_data = to_bytes("hello edge");
    auto outcome = runner.run(spec, in(5000ms), {});
    ASSERT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(to_text(outcome.stdout_data), "HELLO EDGE");
}

TEST(ProcessRunner, ChildIgnoringStdinDoesNotBreakHost) {
    ProcessRunner runner;
    auto spec = shell("exit 0");
    spec.stdin_data = Bytes(1 << 20, 'x');
    auto outcome = runner.run(spec, in(5000ms), {});
    EXPECT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.exit_code, 0);
}

TEST(ProcessRunner, PassesEnvironmentAndWorkingDir) {
    ProcessRunner runner;
    auto dir = std::filesystem::temp_directory_path();
    auto spec = shell("printf '%s|' \"$CLOUDLET_TEST_VALUE\"; pwd");
    spec.extra_env = {"CLOUDLET_TEST_VALUE=42"};
    spec.working_dir = dir;

    auto outcome = runner.run(spec, in(5000ms), {});
    ASSERT_EQ(outcome.status, ProcessStatus::Exited);
    auto text = to_text(outcome.stdout_data);
    EXPECT_EQ(text.substr(0, 3), "42|");
    EXPECT_NE(text.find(std::filesystem::canonical(dir).string()), std::string::npos);
}

TEST(ProcessRunner, DeadlineKillsProcessGroup) {
    ProcessRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto outcome = runner.run(shell("sleep 30 & sleep 30; wait"), in(200ms), {});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.status, ProcessStatus::TimedOut);
    EXPECT_LT(elapsed, 5s);
}

TEST(ProcessRunner, StopTokenCancels) {
    ProcessRunner runner;
    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    auto outcome = runner.run(shell("sleep 30"), in(30000ms), stop.get_token());
    EXPECT_EQ(outcome.status, ProcessStatus::Cancelled);
}

TEST(ProcessRunner, AlreadyStoppedNeverSpawns) {
    ProcessRunner runner;
    std::stop_source stop;
    stop.request_stop();
    auto outcome = runner.run(shell("exit 0"), in(5000ms), stop.get_token());
    EXPECT_EQ(outcome.status, ProcessStatus::Cancelled);
}

TEST(ProcessRunner, MissingProgramReportsSpawnFailure) {
    ProcessRunner runner;
    ProcessSpec spec;
    spec.argv = {"/nonexistent/cloudlet-no-such-binary"};
    auto outcome = runner.run(spec, in(5000ms), {});
    EXPECT_EQ(outcome.status, ProcessStatus::SpawnFailed);
    EXPECT_FALSE(outcome.error.empty());
}

TEST(ProcessRunner, OutputIsCappedAndFlagged) {
    ProcessRunner runner(16);
    auto outcome = runner.run(shell("printf 0123456789abcdefXYZ"), in(5000ms), {});
    ASSERT_EQ(outcome.status, ProcessStatus::Exited);
    EXPECT_EQ(outcome.stdout_data.size(), 16u);
    EXPECT_TRUE(outcome.output_truncated);
}

TEST(ProcessRunner, FindExecutableOnPath) {
    EXPECT_FALSE(find_executable("sh").empty());
    EXPECT_TRUE(find_executable("cloudlet-no-such-binary").empty());
    EXPECT_EQ(find_executable("/bin/sh"), std::filesystem::path{"/bin/sh"});
}

// ─────────────────────────────────────────────
// TempWorkspace
// ─────────────────────────────────────────────

class TempWorkspaceTest : public cloudlet::testing::TempDirTest {};

TEST_F(TempWorkspaceTest, CreatesPrefixedDirectoryAndRemovesOnDestruction) {
    std::filesystem::path created;
    {
        auto workspace = TempWorkspace::create(temp_dir_, "blob42");
        ASSERT_TRUE(workspace.has_value());
        created = workspace->path();
        EXPECT_TRUE(std::filesystem::is_directory(created));
        EXPECT_EQ(created.filename().string().rfind("cloudlet_fn_blob42_", 0), 0u);

        auto file = workspace->write_file("run.sh", to_bytes("#!/bin/sh\n"), 0700);
        ASSERT_TRUE(file.has_value());
        EXPECT_TRUE(std::filesystem::exists(*file));
        auto perms = std::filesystem::status(*file).permissions();
        EXPECT_NE(perms & std::filesystem::perms::owner_exec, std::filesystem::perms::none);
    }
    EXPECT_FALSE(std::filesystem::exists(created));
}

TEST_F(TempWorkspaceTest, ExplicitRemove) {
    auto workspace = TempWorkspace::create(temp_dir_, "b");
    ASSERT_TRUE(workspace.has_value());
    auto path = workspace->path();
    ASSERT_TRUE(workspace->remove().has_value());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(TempWorkspaceTest, MovedWorkspaceOwnsDirectory) {
    auto workspace = TempWorkspace::create(temp_dir_, "m");
    ASSERT_TRUE(workspace.has_value());
    auto path = workspace->path();
    {
        TempWorkspace moved = std::move(*workspace);
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}
