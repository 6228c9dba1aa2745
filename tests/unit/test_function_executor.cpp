/**
 * @file test_function_executor.cpp
 * @brief Unit tests for FunctionExecutor and the built-in runtimes.
 */

#include "blob/memory_blob_store.hpp"
#include "core/file_util.hpp"
#include "executor/function_executor.hpp"
#include "executor/runtimes.hpp"
#include "executor/temp_workspace.hpp"
#include "telemetry/json_sink.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace cloudlet;
using namespace std::chrono_literals;
using cloudlet::testing::ScriptedRuntime;
using cloudlet::testing::completed;

namespace {

size_t count_workspaces(const std::filesystem::path& root) {
    size_t n = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().starts_with(kWorkspacePrefix)) ++n;
    }
    return n;
}

}  // namespace

class FunctionExecutorTest : public cloudlet::testing::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_.temp_dir = temp_dir_ / "work";
        config_.execution_timeout_seconds = 30;
        config_.max_concurrent_executions = 2;
        config_.shim_path = CLOUDLET_SHIM_PATH;
    }

    FunctionExecutor& executor() {
        if (!executor_) {
            executor_ = std::make_unique<FunctionExecutor>(config_, store_, registry_, logger_);
            executor_->register_builtin_runtimes();
        }
        return *executor_;
    }

    BlobId put_code(std::string_view body, std::string file_name = "main") {
        auto info = store_.put(to_bytes(body), {.file_name = std::move(file_name)});
        EXPECT_TRUE(info.has_value());
        return info ? info->id : BlobId{};
    }

    FunctionId register_fake(ScriptedRuntime::Behaviour behaviour) {
        executor().register_runtime(std::make_unique<ScriptedRuntime>(std::move(behaviour)));
        auto registered = executor().register_function(put_code("code"), "fake-fn", "fake", "", "");
        EXPECT_TRUE(registered.has_value());
        return registered ? registered->id : FunctionId{};
    }

    FunctionId register_script(std::string_view body, std::string entrypoint = "") {
        auto registered = executor().register_function(put_code(body, "run.sh"), "script-fn",
                                                       std::string{kScriptRuntime},
                                                       entrypoint, "/bin/sh");
        EXPECT_TRUE(registered.has_value());
        return registered ? registered->id : FunctionId{};
    }

    ExecutorConfig config_;
    InMemoryBlobStore store_;
    FunctionRegistry registry_{store_};
    Logger logger_{std::make_unique<NullSink>()};
    std::unique_ptr<FunctionExecutor> executor_;
};

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

TEST_F(FunctionExecutorTest, BuiltinRuntimesInstalled) {
    EXPECT_TRUE(executor().has_runtime(kNativeRuntime));
    EXPECT_TRUE(executor().has_runtime(kScriptRuntime));
    EXPECT_TRUE(executor().has_runtime(kSharedLibraryRuntime));
    EXPECT_FALSE(executor().has_runtime("cobol"));
}

TEST_F(FunctionExecutorTest, InvalidRegistrationStoresNothing) {
    auto result = executor().register_function("", "", "cobol", "", "");
    ASSERT_FALSE(result.has_value());
    const auto& error = result.error();
    EXPECT_TRUE(error.is(ErrorKind::ValidationFailed));
    EXPECT_TRUE(error.field_errors.contains("blob_id"));
    EXPECT_TRUE(error.field_errors.contains("function_name"));
    EXPECT_TRUE(error.field_errors.contains("runtime"));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(FunctionExecutorTest, MissingBlobStoredUnverified) {
    auto result = executor().register_function("absent", "later", std::string{kScriptRuntime},
                                               "", "/bin/sh");
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->verified);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(FunctionExecutorTest, ScriptVerificationChecksInterpreter) {
    auto ok = executor().register_function(put_code("true"), "ok", std::string{kScriptRuntime},
                                           "", "sh");
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(ok->verified);

    auto missing = executor().register_function(put_code("true"), "missing",
                                                std::string{kScriptRuntime}, "",
                                                "cloudlet-no-such-interpreter");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing->verified);
}

TEST_F(FunctionExecutorTest, NativeVerificationChecksImage) {
    auto script = executor().register_function(put_code("#!/bin/sh\necho native\n"), "native-ok",
                                               std::string{kNativeRuntime}, "", "");
    ASSERT_TRUE(script.has_value());
    EXPECT_TRUE(script->verified);

    auto junk = executor().register_function(put_code("plain text"), "native-bad",
                                             std::string{kNativeRuntime}, "", "");
    ASSERT_TRUE(junk.has_value());
    EXPECT_FALSE(junk->verified);
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

TEST_F(FunctionExecutorTest, UnknownFunctionFailsValidation) {
    auto result = executor().execute("ghost", {});
    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_TRUE(result.error->is(ErrorKind::ValidationFailed));
}

TEST_F(FunctionExecutorTest, MissingBlobSurfacesBlobNotFound) {
    auto registered = executor().register_function("absent", "later", std::string{kScriptRuntime},
                                                   "", "/bin/sh");
    ASSERT_TRUE(registered.has_value());

    auto result = executor().execute(registered->id, {});
    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_TRUE(result.error->is(ErrorKind::BlobNotFound));
}

TEST_F(FunctionExecutorTest, ScriptReceivesInputEntrypointAndEnvironment) {
    auto id = register_script("printf '%s|%s|' \"$CLOUDLET_FUNCTION_NAME\" \"$1\"; cat", "handler");
    auto result = executor().execute(id, to_bytes("payload"));

    ASSERT_TRUE(result.succeeded()) << (result.error ? result.error->message : "");
    EXPECT_EQ(to_text(result.output), "script-fn|handler|payload");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_GT(result.duration.count(), 0);
}

TEST_F(FunctionExecutorTest, NonZeroExitIsExecutionFailure) {
    auto id = register_script("echo broken >&2; exit 4");
    auto result = executor().execute(id, {});

    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    EXPECT_EQ(result.exit_code, 4);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_TRUE(result.error->is(ErrorKind::FunctionExecutionFailed));
    EXPECT_EQ(result.error->function_name, "script-fn");
    EXPECT_NE(result.error->message.find("broken"), std::string::npos);
}

TEST_F(FunctionExecutorTest, TimeoutKillsAndCleansWorkspace) {
    config_.execution_timeout_seconds = 1;
    auto id = register_script("sleep 30");

    auto start = std::chrono::steady_clock::now();
    auto result = executor().execute(id, {});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_TRUE(result.error->is(ErrorKind::FunctionExecutionFailed));
    EXPECT_NE(result.error->message.find("timed out after 1s"), std::string::npos);
    EXPECT_LT(elapsed, 10s);
    EXPECT_EQ(count_workspaces(executor().temp_root()), 0u);
}

TEST_F(FunctionExecutorTest, StopTokenCancelsRunningFunction) {
    auto id = register_script("sleep 30");
    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    auto result = executor().execute(id, {}, stop.get_token());
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(count_workspaces(executor().temp_root()), 0u);
}

TEST_F(FunctionExecutorTest, StopWhileWaitingForSlotCancels) {
    config_.max_concurrent_executions = 1;
    auto id = register_fake([](const InvocationRequest&, std::stop_token) {
        return completed({});
    });

    auto held = executor().gate().try_acquire();
    ASSERT_TRUE(held.has_value());

    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(50ms);
        stop.request_stop();
    });
    auto result = executor().execute(id, {}, stop.get_token());
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
}

TEST_F(FunctionExecutorTest, RuntimeExceptionBecomesExecutionFailure) {
    auto id = register_fake([](const InvocationRequest&, std::stop_token) -> InvocationOutcome {
        throw std::runtime_error("strategy exploded");
    });

    auto result = executor().execute(id, {});
    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_TRUE(result.error->is(ErrorKind::FunctionExecutionFailed));
    EXPECT_NE(result.error->message.find("strategy exploded"), std::string::npos);
    EXPECT_EQ(count_workspaces(executor().temp_root()), 0u);
}

TEST_F(FunctionExecutorTest, ConcurrencyNeverExceedsCap) {
    std::atomic<int> inside{0};
    std::atomic<int> worst{0};
    auto id = register_fake([&](const InvocationRequest& request, std::stop_token) {
        int now = ++inside;
        int prev = worst.load();
        while (now > prev && !worst.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(50ms);
        --inside;
        return completed(request.input);
    });

    const size_t callers = config_.max_concurrent_executions + 5;
    std::atomic<size_t> succeeded{0};
    {
        std::vector<std::jthread> threads;
        for (size_t i = 0; i < callers; ++i) {
            threads.emplace_back([&] {
                if (executor().execute(id, to_bytes("x")).succeeded()) ++succeeded;
            });
        }
    }

    EXPECT_EQ(succeeded.load(), callers);
    EXPECT_LE(worst.load(), static_cast<int>(config_.max_concurrent_executions));
    EXPECT_EQ(executor().gate().peak(), config_.max_concurrent_executions);
}

TEST_F(FunctionExecutorTest, SequentialModeRunsOneAtATime) {
    config_.enable_parallel_execution = false;
    config_.max_concurrent_executions = 8;
    EXPECT_EQ(executor().gate().capacity(), 1u);
}

// ─────────────────────────────────────────────
// Shared-library runtime (through cloudlet_shim)
// ─────────────────────────────────────────────

class SharedLibraryRuntimeTest : public FunctionExecutorTest {
protected:
    FunctionId register_symbol(const std::string& symbol, bool expect_verified = true) {
        auto library = read_file(CLOUDLET_ECHO_FUNCTION_PATH);
        EXPECT_TRUE(library.has_value());
        if (!library) return {};

        auto info = store_.put(std::move(*library), {.file_name = "libecho.so"});
        EXPECT_TRUE(info.has_value());
        auto registered = executor().register_function(info->id, symbol,
                                                       std::string{kSharedLibraryRuntime},
                                                       symbol, "");
        EXPECT_TRUE(registered.has_value());
        if (!registered) return {};
        EXPECT_EQ(registered->verified, expect_verified);
        return registered->id;
    }
};

TEST_F(SharedLibraryRuntimeTest, InvokesExportedSymbol) {
    auto id = register_symbol("cloudlet_upper");
    auto result = executor().execute(id, to_bytes("edge"));
    ASSERT_TRUE(result.succeeded()) << (result.error ? result.error->message : "");
    EXPECT_EQ(to_text(result.output), "EDGE");
}

TEST_F(SharedLibraryRuntimeTest, FailingSymbolReportsItsMessage) {
    auto id = register_symbol("cloudlet_fail");
    auto result = executor().execute(id, {});
    EXPECT_EQ(result.status, ExecutionStatus::Failed);
    EXPECT_EQ(result.exit_code, 3);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->message.find("boom"), std::string::npos);
}

TEST_F(SharedLibraryRuntimeTest, MissingSymbolStoredUnverified) {
    register_symbol("cloudlet_does_not_exist", false);
}
