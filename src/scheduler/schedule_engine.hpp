/**
 * @file schedule_engine.hpp
 * @brief Cron-driven invocation of timer-bound functions.
 *
 * Each schedule owns one std::jthread that sleeps until the next fire time
 * and hands the invocation to the shared ThreadPool. A fire is skipped while
 * the previous fire of the same function is still running, and the next fire
 * is always computed from the current time, so missed fires are not replayed.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/function_executor.hpp"
#include "executor/thread_pool.hpp"
#include "functions/function_registry.hpp"
#include "scheduler/cron.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace cloudlet {

class MetricsCollector;

struct ScheduleStatus {
    FunctionId function_id;
    std::string cron;                           ///< Normalized expression
    std::optional<Timestamp> next_fire;
    uint64_t fired{0};
    uint64_t skipped{0};
};

class ScheduleEngine {
public:
    ScheduleEngine(FunctionRegistry& registry,
                   FunctionExecutor& executor,
                   ThreadPool& pool,
                   Logger& logger,
                   MetricsCollector* metrics = nullptr);
    ~ScheduleEngine();

    ScheduleEngine(const ScheduleEngine&) = delete;
    ScheduleEngine& operator=(const ScheduleEngine&) = delete;

    /**
     * @brief Bind @p function_id to @p cron, replacing any previous schedule.
     *
     * Fails with ValidationFailed for an unknown function, a bad expression or
     * a function already bound to a queue; nothing changes in those cases.
     */
    Result<FunctionRegistration> set_schedule(const FunctionId& function_id,
                                              const std::string& cron);

    /// Stop the timer and drop the persisted trigger. A no-op without a schedule.
    Result<void> clear_schedule(const FunctionId& function_id);

    /// Start timers for every timer-bound registration; returns how many started.
    size_t restore();

    /// Stop the timer of @p function_id without touching the registration.
    void cancel(const FunctionId& function_id);

    /// Stop every timer. In-flight invocations are left to the ThreadPool.
    void stop();

    [[nodiscard]] bool is_scheduled(const FunctionId& function_id) const;
    [[nodiscard]] std::optional<ScheduleStatus> status(const FunctionId& function_id) const;
    [[nodiscard]] size_t active_count() const;

private:
    struct TimerState;
    struct Timer;

    void start_timer(const FunctionId& function_id, CronExpression cron);
    void run_timer(std::shared_ptr<TimerState> state, std::stop_token stop);
    void fire(const std::shared_ptr<TimerState>& state, Timestamp scheduled_at);

    FunctionRegistry& registry_;
    FunctionExecutor& executor_;
    ThreadPool& pool_;
    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex timers_mutex_;
    std::unordered_map<FunctionId, std::unique_ptr<Timer>> timers_;
};

}  // namespace cloudlet
