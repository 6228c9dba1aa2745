/**
 * @file function_host.hpp
 * @brief In-process administrative facade over the Cloudlet subsystems.
 *
 * Owns the queue server, registry, executor, thread pool, schedule engine,
 * dispatcher and cleaner, wires them together and restores persisted
 * triggers on start. Member order is the construction order; destruction
 * runs in reverse, so timers stop before the pool and the pool drains
 * before the executor goes away.
 */

#pragma once

#include "blob/blob_store.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "dispatch/queue_trigger_dispatcher.hpp"
#include "executor/function_executor.hpp"
#include "executor/temp_file_cleaner.hpp"
#include "executor/thread_pool.hpp"
#include "functions/function_registry.hpp"
#include "health/saturation.hpp"
#include "queue/queue_server.hpp"
#include "scheduler/schedule_engine.hpp"
#include "telemetry/metrics_collector.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace cloudlet {

class FunctionHost {
public:
    /// @param metrics_sink Destination of telemetry events; nullptr discards them.
    FunctionHost(Config config,
                 IBlobStore& store,
                 Logger& logger,
                 std::unique_ptr<ILogSink> metrics_sink = nullptr);
    ~FunctionHost();

    FunctionHost(const FunctionHost&) = delete;
    FunctionHost& operator=(const FunctionHost&) = delete;

    /**
     * @brief Open the queues, reload registrations and restore their triggers.
     *
     * Triggers that cannot be restored are logged and skipped.
     */
    Result<void> start();

    /**
     * @brief Ordered shutdown: cleaner, timers, queue workers, then the pool.
     *
     * Queue workers get dispatcher.drain_timeout_ms to finish; the report
     * names any that had to be aborted. Idempotent.
     */
    ShutdownReport stop();

    // ── Functions ─────────────────────────────

    Result<FunctionRegistration> register_function(const BlobId& blob_id,
                                                   const std::string& name,
                                                   const std::string& runtime,
                                                   const std::string& entrypoint = {},
                                                   const std::string& declaring_type = {});

    /**
     * @brief Register several functions backed by one code blob.
     *
     * Every name, the runtime and the optional cron are checked before
     * anything is stored: duplicates within @p names, and names already
     * registered from @p blob_id, fail with ValidationFailed. With a cron each
     * new function is scheduled. If a later write fails the functions created
     * so far are removed again.
     */
    Result<std::vector<FunctionRegistration>> register_many(
        const BlobId& blob_id,
        const std::vector<std::string>& names,
        const std::string& runtime,
        const std::optional<std::string>& cron = std::nullopt);

    /// Stop any trigger of @p function_id and delete its registration.
    Result<void> remove_function(const FunctionId& function_id);

    [[nodiscard]] std::optional<FunctionRegistration> get_function(const FunctionId& function_id) const;
    [[nodiscard]] std::vector<FunctionRegistration> list_functions() const;

    /// Run a function directly, outside any trigger.
    ExecutionResult invoke(const FunctionId& function_id, const Bytes& input,
                           std::stop_token stop = {});

    // ── Triggers ──────────────────────────────

    Result<FunctionRegistration> bind_queue_trigger(const FunctionId& function_id,
                                                    const QueueName& queue_name);
    Result<FunctionRegistration> unbind_queue_trigger(const FunctionId& function_id);

    Result<FunctionRegistration> set_schedule(const FunctionId& function_id,
                                              const std::string& cron);
    Result<void> clear_schedule(const FunctionId& function_id);

    /// Next @p count fire times of @p cron after now.
    Result<std::vector<Timestamp>> preview_schedule(const std::string& cron, size_t count) const;

    // ── Queues ────────────────────────────────

    Result<MessageId> enqueue(const QueueName& queue_name,
                              Bytes payload,
                              std::string content_type = std::string{kDefaultContentType});

    [[nodiscard]] std::vector<QueueStats> queue_stats() const;
    [[nodiscard]] HealthReport queue_health() const;

    // ── Subsystems ────────────────────────────

    [[nodiscard]] QueueServer& queues() noexcept { return queues_; }
    [[nodiscard]] FunctionRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] FunctionExecutor& executor() noexcept { return executor_; }
    [[nodiscard]] ScheduleEngine& schedules() noexcept { return schedules_; }
    [[nodiscard]] QueueTriggerDispatcher& dispatcher() noexcept { return dispatcher_; }
    [[nodiscard]] TempFileCleaner& cleaner() noexcept { return cleaner_; }
    [[nodiscard]] MetricsCollector& metrics() noexcept { return metrics_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    Result<FunctionRegistration> require_function(const FunctionId& function_id) const;
    void roll_back(const std::vector<FunctionRegistration>& created);
    void restore_queue_triggers();

    Config config_;
    IBlobStore& store_;
    Logger& logger_;

    MetricsCollector metrics_;
    QueueServer queues_;
    FunctionRegistry registry_;
    FunctionExecutor executor_;
    ThreadPool pool_;
    ScheduleEngine schedules_;
    QueueTriggerDispatcher dispatcher_;
    TempFileCleaner cleaner_;

    std::mutex register_mutex_;         ///< Serializes register_many's check-then-store
    bool started_{false};
    bool stopped_{false};
};

}  // namespace cloudlet
