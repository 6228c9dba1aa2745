/**
 * @file queue_trigger_dispatcher.cpp
 * @brief QueueTriggerDispatcher implementation.
 */

#include "dispatch/queue_trigger_dispatcher.hpp"

#include "core/validation.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>

namespace cloudlet {

struct QueueTriggerDispatcher::Worker {
    Worker(FunctionId id, QueueName q) : function_id(std::move(id)), queue(std::move(q)) {}

    const FunctionId function_id;
    const QueueName queue;

    std::atomic<WorkerState> state{WorkerState::Idle};
    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> attempts{0};

    std::stop_source abort;                 ///< Cancels the in-flight execution
    bool draining{false};                   ///< Guarded by workers_mutex_; set once

    std::mutex mutex;
    std::condition_variable_any cv;         ///< Backoff waits and exit notification
    bool exited{false};                     ///< Guarded by mutex

    std::jthread thread;
};

QueueTriggerDispatcher::QueueTriggerDispatcher(QueueServer& queues,
                                               FunctionExecutor& executor,
                                               FunctionRegistry& registry,
                                               DispatcherConfig config,
                                               Logger& logger,
                                               MetricsCollector* metrics)
    : queues_(queues)
    , executor_(executor)
    , registry_(registry)
    , config_(config)
    , logger_(logger)
    , metrics_(metrics) {}

QueueTriggerDispatcher::~QueueTriggerDispatcher() {
    shutdown(std::chrono::milliseconds{config_.drain_timeout_ms});
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> QueueTriggerDispatcher::activate(const FunctionId& function_id,
                                              const QueueName& queue_name) {
    FieldErrors errors;
    if (auto v = validate_identifier("function_id", function_id); !v) {
        errors.insert(v.error().field_errors.begin(), v.error().field_errors.end());
    }
    if (auto v = validate_queue_name(queue_name); !v) {
        errors.insert(v.error().field_errors.begin(), v.error().field_errors.end());
    }
    if (!errors.empty()) return Error::validation_failed(std::move(errors));

    if (!registry_.get(function_id)) {
        return Error::validation_failed("function_id", "unknown function '" + function_id + "'");
    }

    std::lock_guard lock(workers_mutex_);
    if (shut_down_) {
        return Error::queue_operation_failed(queue_name, "dispatcher has been shut down");
    }
    if (auto it = workers_.find(function_id); it != workers_.end()) {
        if (it->second->draining) {
            return Error::queue_operation_failed(
                queue_name, "function " + function_id + " is still draining from queue '"
                                + it->second->queue + "'");
        }
        if (it->second->queue == queue_name) return Result<void>{};
        return Error::queue_operation_failed(
            queue_name, "function " + function_id + " is already active on queue '"
                            + it->second->queue + "'");
    }

    if (auto ensured = queues_.ensure_queue(queue_name); !ensured) {
        return ensured.error();
    }

    auto worker = std::make_shared<Worker>(function_id, queue_name);
    Worker* raw = worker.get();
    worker->thread = std::jthread([this, raw](std::stop_token stop) { run(*raw, stop); });
    workers_.emplace(function_id, std::move(worker));

    logger_.info("Activated function " + function_id + " on queue '" + queue_name + "'");
    return Result<void>{};
}

void QueueTriggerDispatcher::deactivate(const FunctionId& function_id) {
    std::shared_ptr<Worker> worker;
    {
        std::unique_lock lock(workers_mutex_);
        auto it = workers_.find(function_id);
        if (it == workers_.end()) return;
        worker = it->second;
        if (worker->draining) {
            drained_cv_.wait(lock, [this, &function_id, &worker] {
                auto current = workers_.find(function_id);
                return current == workers_.end() || current->second != worker;
            });
            return;
        }
        worker->draining = true;
    }

    begin_drain(*worker);
    worker->thread.join();

    {
        std::lock_guard lock(workers_mutex_);
        workers_.erase(function_id);
    }
    drained_cv_.notify_all();

    logger_.info("Deactivated function " + function_id + " on queue '" + worker->queue + "'");
}

ShutdownReport QueueTriggerDispatcher::shutdown(std::chrono::milliseconds timeout) {
    std::vector<std::shared_ptr<Worker>> owned;       // joined here
    std::vector<std::shared_ptr<Worker>> borrowed;    // joined by a concurrent deactivate()
    {
        std::lock_guard lock(workers_mutex_);
        shut_down_ = true;
        for (auto& [id, worker] : workers_) {
            if (worker->draining) {
                borrowed.push_back(worker);
            } else {
                worker->draining = true;
                owned.push_back(worker);
            }
        }
    }

    ShutdownReport report;
    if (owned.empty() && borrowed.empty()) return report;

    for (auto& worker : owned) begin_drain(*worker);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto await_exit = [&](const std::shared_ptr<Worker>& worker) {
        std::unique_lock lock(worker->mutex);
        bool exited = worker->cv.wait_until(lock, deadline, [&worker] { return worker->exited; });
        if (!exited) {
            report.timed_out.push_back(worker->function_id);
            worker->abort.request_stop();
        }
    };
    for (auto& worker : owned) await_exit(worker);
    for (auto& worker : borrowed) await_exit(worker);

    for (auto& worker : owned) {
        if (worker->thread.joinable()) worker->thread.join();
    }
    {
        std::unique_lock lock(workers_mutex_);
        for (auto& worker : owned) workers_.erase(worker->function_id);
        drained_cv_.wait(lock, [this] { return workers_.empty(); });
    }
    drained_cv_.notify_all();

    if (report.clean()) {
        logger_.info("Dispatcher stopped " + std::to_string(owned.size() + borrowed.size())
                     + " worker(s)");
    } else {
        logger_.warn("Dispatcher aborted " + std::to_string(report.timed_out.size())
                     + " worker(s) after the drain timeout");
    }
    return report;
}

// ─────────────────────────────────────────────
// Introspection
// ─────────────────────────────────────────────

std::optional<WorkerState> QueueTriggerDispatcher::state(const FunctionId& function_id) const {
    std::lock_guard lock(workers_mutex_);
    auto it = workers_.find(function_id);
    if (it == workers_.end()) return std::nullopt;
    return it->second->state.load();
}

std::optional<WorkerStats> QueueTriggerDispatcher::stats(const FunctionId& function_id) const {
    std::lock_guard lock(workers_mutex_);
    auto it = workers_.find(function_id);
    if (it == workers_.end()) return std::nullopt;
    return snapshot(*it->second);
}

std::vector<WorkerStats> QueueTriggerDispatcher::workers() const {
    std::vector<WorkerStats> out;
    {
        std::lock_guard lock(workers_mutex_);
        out.reserve(workers_.size());
        for (const auto& [id, worker] : workers_) out.push_back(snapshot(*worker));
    }
    std::sort(out.begin(), out.end(), [](const WorkerStats& a, const WorkerStats& b) {
        return a.function_id < b.function_id;
    });
    return out;
}

size_t QueueTriggerDispatcher::active_workers() const {
    std::lock_guard lock(workers_mutex_);
    return workers_.size();
}

WorkerStats QueueTriggerDispatcher::snapshot(const Worker& worker) {
    WorkerStats s;
    s.function_id = worker.function_id;
    s.queue = worker.queue;
    s.state = worker.state.load();
    s.processed = worker.processed.load();
    s.failed = worker.failed.load();
    s.attempts = worker.attempts.load();
    return s;
}

// ─────────────────────────────────────────────
// Worker loop
// ─────────────────────────────────────────────

void QueueTriggerDispatcher::run(Worker& worker, std::stop_token stop) {
    const auto poll = std::chrono::milliseconds{config_.poll_interval_ms};
    const auto error_backoff = std::chrono::milliseconds{config_.initial_backoff_ms};

    while (!stop.stop_requested()) {
        set_state(worker, WorkerState::Idle);

        auto message = queues_.dequeue(worker.queue, poll, stop);
        if (!message) {
            logger_.warn("Worker for function " + worker.function_id + " failed to dequeue: "
                         + message.error().message);
            wait_backoff(worker, error_backoff, stop);
            continue;
        }
        if (!message->has_value()) continue;

        set_state(worker, WorkerState::Running);
        if (stop.stop_requested()) transition(worker, WorkerState::Running, WorkerState::Draining);
        process(worker, **message, stop);
    }

    set_state(worker, WorkerState::Stopped);
    {
        std::lock_guard lock(worker.mutex);
        worker.exited = true;
    }
    worker.cv.notify_all();
}

void QueueTriggerDispatcher::process(Worker& worker, const Message& message,
                                     std::stop_token stop) {
    const uint32_t max_attempts = std::max<uint32_t>(config_.max_attempts, 1);

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        worker.attempts.fetch_add(1);
        auto result = executor_.execute(worker.function_id, message.payload,
                                        worker.abort.get_token());

        if (result.status == ExecutionStatus::Succeeded) {
            worker.processed.fetch_add(1);
            return;
        }
        if (result.status == ExecutionStatus::Cancelled) {
            worker.failed.fetch_add(1);
            logger_.warn("Execution of function " + worker.function_id + " for message "
                         + message.id + " was aborted");
            return;
        }

        std::string reason = result.error ? result.error->message : "unknown failure";
        if (result.error && result.error->is(ErrorKind::ValidationFailed)) {
            worker.failed.fetch_add(1);
            logger_.error("Dropping message " + message.id + " from '" + worker.queue
                          + "': " + reason);
            return;
        }
        if (attempt == max_attempts) {
            worker.failed.fetch_add(1);
            logger_.error("Giving up on message " + message.id + " from '" + worker.queue
                          + "' after " + std::to_string(attempt) + " attempt(s): " + reason);
            return;
        }

        auto delay = backoff_for(attempt);
        logger_.warn("Attempt " + std::to_string(attempt) + " for message " + message.id
                     + " failed, retrying in " + std::to_string(delay.count()) + "ms: " + reason);
        if (!wait_backoff(worker, delay, stop)) {
            worker.failed.fetch_add(1);
            logger_.warn("Dropping message " + message.id + " from '" + worker.queue
                         + "': worker stopped during backoff");
            return;
        }
    }
}

bool QueueTriggerDispatcher::wait_backoff(Worker& worker, std::chrono::milliseconds delay,
                                          std::stop_token stop) {
    std::unique_lock lock(worker.mutex);
    worker.cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

std::chrono::milliseconds QueueTriggerDispatcher::backoff_for(uint32_t attempt) const {
    uint64_t delay = config_.initial_backoff_ms;
    for (uint32_t i = 1; i < attempt && delay < config_.max_backoff_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds{std::min<uint64_t>(delay, config_.max_backoff_ms)};
}

void QueueTriggerDispatcher::begin_drain(Worker& worker) {
    // Stop first: a worker that enters Running afterwards sees the request
    // and moves itself to Draining.
    worker.thread.request_stop();
    transition(worker, WorkerState::Running, WorkerState::Draining);
    worker.cv.notify_all();
}

bool QueueTriggerDispatcher::transition(Worker& worker, WorkerState from, WorkerState to) {
    if (!worker.state.compare_exchange_strong(from, to)) return false;
    if (metrics_ != nullptr) {
        metrics_->record_worker_state(worker.function_id, worker.queue, to);
    }
    return true;
}

void QueueTriggerDispatcher::set_state(Worker& worker, WorkerState state) {
    auto previous = worker.state.exchange(state);
    if (previous == state) return;
    if (metrics_ != nullptr) {
        metrics_->record_worker_state(worker.function_id, worker.queue, state);
    }
}

}  // namespace cloudlet
