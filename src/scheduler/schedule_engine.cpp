/**
 * @file schedule_engine.cpp
 * @brief ScheduleEngine implementation.
 */

#include "scheduler/schedule_engine.hpp"

#include "core/validation.hpp"
#include "telemetry/metrics_collector.hpp"

#include <vector>

namespace cloudlet {

struct ScheduleEngine::TimerState {
    TimerState(FunctionId id, CronExpression expression)
        : function_id(std::move(id)), cron(std::move(expression)) {}

    const FunctionId function_id;
    const CronExpression cron;

    std::atomic<bool> in_flight{false};
    std::atomic<uint64_t> fired{0};
    std::atomic<uint64_t> skipped{0};

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::optional<Timestamp> next_fire;     ///< Guarded by mutex
};

struct ScheduleEngine::Timer {
    std::shared_ptr<TimerState> state;
    std::jthread thread;
};

namespace {

Bytes timer_input(Timestamp scheduled_at) {
    return to_bytes(R"({"trigger":"timer","scheduledAt":")" + format_iso8601(scheduled_at)
                    + "\"}");
}

}  // namespace

ScheduleEngine::ScheduleEngine(FunctionRegistry& registry,
                               FunctionExecutor& executor,
                               ThreadPool& pool,
                               Logger& logger,
                               MetricsCollector* metrics)
    : registry_(registry)
    , executor_(executor)
    , pool_(pool)
    , logger_(logger)
    , metrics_(metrics) {}

ScheduleEngine::~ScheduleEngine() {
    stop();
}

// ─────────────────────────────────────────────
// Schedule management
// ─────────────────────────────────────────────

Result<FunctionRegistration> ScheduleEngine::set_schedule(const FunctionId& function_id,
                                                          const std::string& cron) {
    if (auto valid = validate_identifier("function_id", function_id); !valid) {
        return valid.error();
    }
    auto registration = registry_.get(function_id);
    if (!registration) {
        return Error::validation_failed("function_id", "unknown function '" + function_id + "'");
    }
    if (registration->trigger.kind == TriggerKind::Queue) {
        return Error::validation_failed("trigger", "function is bound to queue '"
                                                       + registration->trigger.target + "'");
    }

    auto parsed = CronExpression::parse_schedule(cron);
    if (!parsed) return parsed.error();

    auto updated = registry_.set_trigger(function_id, TriggerBinding::timer(normalize_cron(cron)),
                                         TriggerKind::Timer);
    if (!updated) return updated.error();

    logger_.info("Scheduled function '" + updated->name + "' with '" + parsed->expression() + "'");
    start_timer(function_id, std::move(*parsed));
    return updated;
}

Result<void> ScheduleEngine::clear_schedule(const FunctionId& function_id) {
    auto registration = registry_.get(function_id);
    if (!registration) {
        return Error::validation_failed("function_id", "unknown function '" + function_id + "'");
    }

    cancel(function_id);
    if (registration->trigger.kind != TriggerKind::Timer) return Result<void>{};

    auto updated = registry_.set_trigger(function_id, TriggerBinding::none(), TriggerKind::Timer);
    if (!updated) return updated.error();
    logger_.info("Cleared schedule of function '" + registration->name + "'");
    return Result<void>{};
}

size_t ScheduleEngine::restore() {
    size_t started = 0;
    for (const auto& registration : registry_.list()) {
        if (registration.trigger.kind != TriggerKind::Timer) continue;
        if (!registration.verified) {
            logger_.warn("Not restoring schedule of '" + registration.name
                         + "': function failed verification");
            continue;
        }

        auto parsed = CronExpression::parse_schedule(registration.trigger.target);
        if (!parsed) {
            logger_.warn("Not restoring schedule of '" + registration.name + "': "
                         + parsed.error().message);
            continue;
        }
        start_timer(registration.id, std::move(*parsed));
        ++started;
    }
    if (started > 0) {
        logger_.info("Restored " + std::to_string(started) + " schedule(s)");
    }
    return started;
}

void ScheduleEngine::cancel(const FunctionId& function_id) {
    std::unique_ptr<Timer> timer;
    {
        std::lock_guard lock(timers_mutex_);
        auto it = timers_.find(function_id);
        if (it == timers_.end()) return;
        timer = std::move(it->second);
        timers_.erase(it);
    }
    timer->thread.request_stop();
    timer->state->cv.notify_all();
    timer->thread.join();
}

void ScheduleEngine::stop() {
    std::vector<std::unique_ptr<Timer>> stopping;
    {
        std::lock_guard lock(timers_mutex_);
        for (auto& [id, timer] : timers_) stopping.push_back(std::move(timer));
        timers_.clear();
    }
    for (auto& timer : stopping) {
        timer->thread.request_stop();
        timer->state->cv.notify_all();
    }
    for (auto& timer : stopping) {
        if (timer->thread.joinable()) timer->thread.join();
    }
}

bool ScheduleEngine::is_scheduled(const FunctionId& function_id) const {
    std::lock_guard lock(timers_mutex_);
    return timers_.contains(function_id);
}

std::optional<ScheduleStatus> ScheduleEngine::status(const FunctionId& function_id) const {
    std::shared_ptr<TimerState> state;
    {
        std::lock_guard lock(timers_mutex_);
        auto it = timers_.find(function_id);
        if (it == timers_.end()) return std::nullopt;
        state = it->second->state;
    }

    ScheduleStatus out;
    out.function_id = function_id;
    out.cron = state->cron.expression();
    out.fired = state->fired.load();
    out.skipped = state->skipped.load();
    std::lock_guard lock(state->mutex);
    out.next_fire = state->next_fire;
    return out;
}

size_t ScheduleEngine::active_count() const {
    std::lock_guard lock(timers_mutex_);
    return timers_.size();
}

// ─────────────────────────────────────────────
// Timer threads
// ─────────────────────────────────────────────

void ScheduleEngine::start_timer(const FunctionId& function_id, CronExpression cron) {
    cancel(function_id);

    auto timer = std::make_unique<Timer>();
    timer->state = std::make_shared<TimerState>(function_id, std::move(cron));
    timer->thread = std::jthread([this, state = timer->state](std::stop_token stop) {
        run_timer(state, stop);
    });

    std::lock_guard lock(timers_mutex_);
    timers_[function_id] = std::move(timer);
}

void ScheduleEngine::run_timer(std::shared_ptr<TimerState> state, std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto next = state->cron.next_after(std::chrono::system_clock::now());

        std::unique_lock lock(state->mutex);
        state->next_fire = next;
        if (!next) {
            logger_.warn("Schedule '" + state->cron.expression() + "' of function "
                         + state->function_id + " has no further fire times");
            return;
        }

        state->cv.wait_until(lock, stop, *next, [] { return false; });
        lock.unlock();
        if (stop.stop_requested()) return;

        fire(state, *next);
    }
}

void ScheduleEngine::fire(const std::shared_ptr<TimerState>& state, Timestamp scheduled_at) {
    if (state->in_flight.exchange(true)) {
        state->skipped.fetch_add(1);
        logger_.info("Skipping fire of function " + state->function_id
                     + ": previous invocation still running");
        if (metrics_ != nullptr) {
            metrics_->record_schedule_fire(state->function_id, scheduled_at, true);
        }
        return;
    }

    state->fired.fetch_add(1);
    if (metrics_ != nullptr) {
        metrics_->record_schedule_fire(state->function_id, scheduled_at, false);
    }

    auto& executor = executor_;
    pool_.submit_cancellable([&executor, state, input = timer_input(scheduled_at)](std::stop_token stop) {
        auto result = executor.execute(state->function_id, input, stop);
        state->in_flight.store(false);
        return result.status;
    });
}

}  // namespace cloudlet
