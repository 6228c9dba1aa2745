/**
 * @file queue_trigger_dispatcher.hpp
 * @brief Per-function queue workers feeding messages to the executor.
 *
 * Each activated function gets exactly one std::jthread worker that dequeues
 * from its queue and runs the function with the message payload as input.
 * The jthread's own stop token stops dequeuing; a separate abort source is
 * used to cancel the in-flight execution and is only signalled when a
 * shutdown deadline passes.
 *
 * A worker stays registered until its thread has been joined, so state()
 * reports Draining while an execution finishes and a function never has two
 * workers, even for the length of a deactivation.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/function_executor.hpp"
#include "functions/function_registry.hpp"
#include "queue/queue_server.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cloudlet {

class MetricsCollector;

struct WorkerStats {
    FunctionId function_id;
    QueueName queue;
    WorkerState state{WorkerState::Idle};
    uint64_t processed{0};          ///< Messages whose execution succeeded
    uint64_t failed{0};             ///< Messages given up on
    uint64_t attempts{0};           ///< Executions started, retries included
};

struct ShutdownReport {
    std::vector<FunctionId> timed_out;      ///< Workers aborted after the deadline

    [[nodiscard]] bool clean() const noexcept { return timed_out.empty(); }
};

class QueueTriggerDispatcher {
public:
    QueueTriggerDispatcher(QueueServer& queues,
                           FunctionExecutor& executor,
                           FunctionRegistry& registry,
                           DispatcherConfig config,
                           Logger& logger,
                           MetricsCollector* metrics = nullptr);
    ~QueueTriggerDispatcher();

    QueueTriggerDispatcher(const QueueTriggerDispatcher&) = delete;
    QueueTriggerDispatcher& operator=(const QueueTriggerDispatcher&) = delete;

    /**
     * @brief Start a worker for @p function_id on @p queue_name.
     *
     * A no-op when already active on the same queue. Fails with
     * QueueOperationFailed when active on another queue, while the previous
     * worker of the function is still draining, or after shutdown.
     */
    Result<void> activate(const FunctionId& function_id, const QueueName& queue_name);

    /**
     * @brief Stop the worker of @p function_id and join it.
     *
     * No further messages are dequeued. An execution already running is left
     * to finish while the worker reports Draining. A no-op when the function
     * has no worker; a concurrent call waits for the first one to complete.
     */
    void deactivate(const FunctionId& function_id);

    /// Stop every worker, aborting the executions still running after @p timeout.
    ShutdownReport shutdown(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<WorkerState> state(const FunctionId& function_id) const;
    [[nodiscard]] std::optional<WorkerStats> stats(const FunctionId& function_id) const;
    [[nodiscard]] std::vector<WorkerStats> workers() const;
    [[nodiscard]] size_t active_workers() const;

private:
    struct Worker;

    void run(Worker& worker, std::stop_token stop);
    void process(Worker& worker, const Message& message, std::stop_token stop);
    bool wait_backoff(Worker& worker, std::chrono::milliseconds delay, std::stop_token stop);
    void set_state(Worker& worker, WorkerState state);
    bool transition(Worker& worker, WorkerState from, WorkerState to);
    void begin_drain(Worker& worker);
    [[nodiscard]] std::chrono::milliseconds backoff_for(uint32_t attempt) const;
    [[nodiscard]] static WorkerStats snapshot(const Worker& worker);

    QueueServer& queues_;
    FunctionExecutor& executor_;
    FunctionRegistry& registry_;
    DispatcherConfig config_;
    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex workers_mutex_;
    std::condition_variable drained_cv_;    ///< Signalled when a draining worker is erased
    std::unordered_map<FunctionId, std::shared_ptr<Worker>> workers_;
    bool shut_down_{false};
};

}  // namespace cloudlet
