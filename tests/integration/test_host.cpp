/**
 * @file test_host.cpp
 * @brief Integration tests driving FunctionHost end to end with real scripts.
 */

#include "blob/file_blob_store.hpp"
#include "executor/runtimes.hpp"
#include "host/function_host.hpp"
#include "telemetry/json_sink.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <thread>

using namespace cloudlet;
using namespace std::chrono_literals;
using cloudlet::testing::CapturingSink;
using cloudlet::testing::count_containing;
using cloudlet::testing::wait_until;

// ═══════════════════════════════════════════════
// Host Pipeline Tests
// ═══════════════════════════════════════════════

class HostIntegration : public cloudlet::testing::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_ = default_config();
        config_.queue.root = temp_dir_ / "queues";
        config_.blob_store.root = temp_dir_ / "blobs";
        config_.executor.temp_dir = temp_dir_ / "work";
        config_.executor.execution_timeout_seconds = 10;
        config_.dispatcher.poll_interval_ms = 50;
        config_.dispatcher.initial_backoff_ms = 20;
        config_.dispatcher.max_backoff_ms = 40;
        config_.dispatcher.drain_timeout_ms = 2000;
        config_.cleanup.enabled = false;

        store_ = std::make_unique<FileBlobStore>(config_.blob_store);
        ASSERT_TRUE(store_->open().has_value());
        output_ = temp_dir_ / "output.txt";
    }

    void TearDown() override {
        host_.reset();
        store_.reset();
        TempDirTest::TearDown();
    }

    FunctionHost& start_host() {
        host_.reset();
        host_ = std::make_unique<FunctionHost>(config_, *store_, logger_,
                                               std::make_unique<CapturingSink>(events_));
        auto started = host_->start();
        EXPECT_TRUE(started.has_value()) << (started ? "" : started.error().message);
        return *host_;
    }

    /// Script that appends its input, one line per invocation, to output_.
    FunctionId register_appender(const std::string& name) {
        std::string body = "cat >> '" + output_.string() + "'; echo >> '" + output_.string() + "'\n";
        auto code = store_->put(to_bytes(body), {.file_name = "append.sh"});
        EXPECT_TRUE(code.has_value());
        auto registered = host_->register_function(code->id, name, std::string{kScriptRuntime},
                                                   "", "/bin/sh");
        EXPECT_TRUE(registered.has_value());
        EXPECT_TRUE(registered && registered->verified);
        return registered ? registered->id : FunctionId{};
    }

    std::vector<std::string> output_lines() {
        std::vector<std::string> lines;
        std::ifstream in(output_);
        for (std::string line; std::getline(in, line);) lines.push_back(line);
        return lines;
    }

    Config config_;
    Logger logger_{std::make_unique<NullSink>()};
    std::unique_ptr<FileBlobStore> store_;
    std::unique_ptr<FunctionHost> host_;
    std::shared_ptr<CapturingSink::Lines> events_ = std::make_shared<CapturingSink::Lines>();
    std::filesystem::path output_;
};

TEST_F(HostIntegration, QueueTriggeredFunctionConsumesMessages) {
    auto& host = start_host();
    auto id = register_appender("appender");

    auto bound = host.bind_queue_trigger(id, "events");
    ASSERT_TRUE(bound.has_value());
    EXPECT_EQ(bound->trigger, TriggerBinding::queue("events"));

    for (const char* text : {"alpha", "beta", "gamma"}) {
        ASSERT_TRUE(host.enqueue("events", to_bytes(text)).has_value());
    }

    ASSERT_TRUE(wait_until([this] { return output_lines().size() >= 3; }, 10s));
    EXPECT_EQ(output_lines(), (std::vector<std::string>{"alpha", "beta", "gamma"}));
    EXPECT_TRUE(wait_until([&] { return host.queue_stats().front().message_count == 0; }));

    host.stop();
    EXPECT_GE(count_containing(*events_, R"("event":"function_execution")"), 3u);
    EXPECT_GE(count_containing(*events_, R"("event":"queue_enqueued")"), 3u);
}

TEST_F(HostIntegration, TriggersAndBacklogSurviveRestart) {
    FunctionId id;
    {
        auto& host = start_host();
        id = register_appender("durable");
        ASSERT_TRUE(host.bind_queue_trigger(id, "inbox").has_value());
        host.dispatcher().deactivate(id);       // leave the binding persisted but idle
        ASSERT_TRUE(host.enqueue("inbox", to_bytes("queued before restart")).has_value());
        host.stop();
    }

    auto& host = start_host();
    ASSERT_TRUE(host.get_function(id).has_value());
    EXPECT_TRUE(host.dispatcher().state(id).has_value());

    ASSERT_TRUE(wait_until([this] { return !output_lines().empty(); }, 10s));
    EXPECT_EQ(output_lines().front(), "queued before restart");
}

TEST_F(HostIntegration, ScheduledFunctionReceivesTimerInput) {
    auto& host = start_host();
    auto id = register_appender("ticker");

    auto scheduled = host.set_schedule(id, "* * * * * ?");
    ASSERT_TRUE(scheduled.has_value());

    ASSERT_TRUE(wait_until([this] { return !output_lines().empty(); }, 5s));
    auto first = output_lines().front();
    EXPECT_NE(first.find(R"("trigger":"timer")"), std::string::npos);
    EXPECT_NE(first.find(R"("scheduledAt":")"), std::string::npos);

    ASSERT_TRUE(host.clear_schedule(id).has_value());
    EXPECT_FALSE(host.schedules().is_scheduled(id));
}

TEST_F(HostIntegration, OneTriggerPerFunction) {
    auto& host = start_host();
    auto timed = register_appender("timed");
    ASSERT_TRUE(host.set_schedule(timed, "0 0 * * * ?").has_value());

    auto bind = host.bind_queue_trigger(timed, "jobs");
    ASSERT_FALSE(bind.has_value());
    EXPECT_TRUE(bind.error().is(ErrorKind::ValidationFailed));

    auto queued = register_appender("queued");
    ASSERT_TRUE(host.bind_queue_trigger(queued, "jobs").has_value());
    EXPECT_TRUE(host.bind_queue_trigger(queued, "jobs").has_value());

    auto rebind = host.bind_queue_trigger(queued, "other");
    ASSERT_FALSE(rebind.has_value());
    EXPECT_TRUE(rebind.error().is(ErrorKind::QueueOperationFailed));

    auto schedule = host.set_schedule(queued, "0 0 * * * ?");
    ASSERT_FALSE(schedule.has_value());
    EXPECT_TRUE(schedule.error().is(ErrorKind::ValidationFailed));

    auto unbound = host.unbind_queue_trigger(queued);
    ASSERT_TRUE(unbound.has_value());
    EXPECT_EQ(unbound->trigger.kind, TriggerKind::None);
    EXPECT_FALSE(host.dispatcher().state(queued).has_value());
}

TEST_F(HostIntegration, ConcurrentBindAndScheduleLeaveOneTrigger) {
    auto& host = start_host();

    for (int round = 0; round < 20; ++round) {
        auto id = register_appender("racer-" + std::to_string(round));
        auto queue = "race-" + std::to_string(round);

        Result<FunctionRegistration> bound = Error{ErrorKind::ValidationFailed, "not run"};
        Result<FunctionRegistration> scheduled = Error{ErrorKind::ValidationFailed, "not run"};
        {
            std::jthread binder([&] { bound = host.bind_queue_trigger(id, queue); });
            std::jthread scheduler([&] { scheduled = host.set_schedule(id, "0 0 0 1 1 ?"); });
        }

        ASSERT_NE(bound.has_value(), scheduled.has_value()) << "round " << round;
        EXPECT_NE(host.dispatcher().state(id).has_value(), host.schedules().is_scheduled(id))
            << "round " << round;

        auto stored = host.get_function(id);
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(stored->trigger.kind, bound ? TriggerKind::Queue : TriggerKind::Timer)
            << "round " << round;
    }
}

TEST_F(HostIntegration, RegisterManySchedulesEveryName) {
    auto& host = start_host();
    auto code = store_->put(to_bytes("cat > /dev/null\n"), {.file_name = "many.sh"});
    ASSERT_TRUE(code.has_value());

    auto registered = host.register_many(code->id, {"alpha", "beta", "gamma"},
                                         std::string{kScriptRuntime}, "0 0 * * *");
    ASSERT_TRUE(registered.has_value()) << registered.error().message;
    ASSERT_EQ(registered->size(), 3u);

    for (const auto& registration : *registered) {
        EXPECT_EQ(registration.source_blob_id, code->id);
        EXPECT_TRUE(registration.verified);
        EXPECT_EQ(registration.trigger.kind, TriggerKind::Timer);
        EXPECT_EQ(registration.trigger.target, "0 0 0 * * ?");
        EXPECT_TRUE(host.schedules().is_scheduled(registration.id));
    }
    EXPECT_EQ(host.registry().by_source(code->id).size(), 3u);

    // Names already registered from the same blob are refused as a whole
    auto again = host.register_many(code->id, {"delta", "Beta"}, std::string{kScriptRuntime});
    ASSERT_FALSE(again.has_value());
    EXPECT_TRUE(again.error().is(ErrorKind::ValidationFailed));
    EXPECT_TRUE(again.error().field_errors.contains("names"));
    EXPECT_EQ(host.list_functions().size(), 3u);
}

TEST_F(HostIntegration, RegisterManyStoresNothingOnInvalidInput) {
    auto& host = start_host();
    auto code = store_->put(to_bytes("cat > /dev/null\n"), {.file_name = "many.sh"});
    ASSERT_TRUE(code.has_value());
    const std::string runtime{kScriptRuntime};

    auto bad_name = host.register_many(code->id, {"fine", ""}, runtime);
    ASSERT_FALSE(bad_name.has_value());
    EXPECT_TRUE(bad_name.error().field_errors.contains("names"));

    auto duplicate = host.register_many(code->id, {"twice", "TWICE"}, runtime);
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_TRUE(duplicate.error().field_errors.contains("names"));

    auto bad_cron = host.register_many(code->id, {"fine"}, runtime, "not a cron");
    ASSERT_FALSE(bad_cron.has_value());
    EXPECT_TRUE(bad_cron.error().field_errors.contains("cron"));

    auto bad_runtime = host.register_many(code->id, {"fine"}, "cobol");
    ASSERT_FALSE(bad_runtime.has_value());
    EXPECT_TRUE(bad_runtime.error().field_errors.contains("runtime"));

    auto no_names = host.register_many(code->id, {}, runtime);
    ASSERT_FALSE(no_names.has_value());

    EXPECT_TRUE(host.list_functions().empty());
    EXPECT_EQ(host.schedules().active_count(), 0u);
}

TEST_F(HostIntegration, RemoveFunctionStopsTriggers) {
    auto& host = start_host();
    auto id = register_appender("temporary");
    ASSERT_TRUE(host.bind_queue_trigger(id, "scratch").has_value());

    ASSERT_TRUE(host.remove_function(id).has_value());
    EXPECT_FALSE(host.get_function(id).has_value());
    EXPECT_FALSE(host.dispatcher().state(id).has_value());
    EXPECT_TRUE(host.list_functions().empty());

    auto again = host.remove_function(id);
    ASSERT_FALSE(again.has_value());
    EXPECT_TRUE(again.error().is(ErrorKind::ValidationFailed));
}

TEST_F(HostIntegration, DirectInvokeAndPreview) {
    auto& host = start_host();
    auto code = store_->put(to_bytes("tr a-z A-Z"), {.file_name = "upper.sh"});
    ASSERT_TRUE(code.has_value());
    auto registered = host.register_function(code->id, "upper", std::string{kScriptRuntime});
    ASSERT_TRUE(registered.has_value());

    auto result = host.invoke(registered->id, to_bytes("quiet"));
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(to_text(result.output), "QUIET");

    auto preview = host.preview_schedule("*/10 * * * *", 3);
    ASSERT_TRUE(preview.has_value());
    ASSERT_EQ(preview->size(), 3u);
    EXPECT_EQ((*preview)[1] - (*preview)[0], std::chrono::minutes{10});
}

TEST_F(HostIntegration, QueueHealthReflectsQuota) {
    auto& host = start_host();
    ASSERT_TRUE(host.queues().create_queue("tight", {.max_bytes = 100, .max_messages = 0,
                                                     .overflow = OverflowPolicy::Reject})
                    .has_value());
    ASSERT_TRUE(host.enqueue("tight", Bytes(96, 'x')).has_value());

    auto health = host.queue_health();
    ASSERT_EQ(health.queues.size(), 1u);
    EXPECT_EQ(health.queues[0].status, HealthStatus::Critical);
    EXPECT_EQ(health.overall, HealthStatus::Critical);

    auto rejected = host.enqueue("tight", Bytes(10, 'y'));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_TRUE(rejected.error().is(ErrorKind::QueueQuotaExceeded));
}

TEST_F(HostIntegration, StopIsIdempotentAndClean) {
    auto& host = start_host();
    auto id = register_appender("idle");
    ASSERT_TRUE(host.bind_queue_trigger(id, "quiet").has_value());

    auto report = host.stop();
    EXPECT_TRUE(report.clean());
    EXPECT_TRUE(host.stop().clean());
}
