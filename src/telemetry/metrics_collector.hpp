/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace cloudlet {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 *
 * Every event carries "event" and "ts" fields; the rest depends on the event.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_execution(const FunctionId& id, std::string_view function_name,
                          ExecutionStatus status, Duration duration, int exit_code);
    void record_queue_event(const QueueName& queue, std::string_view event_type,
                            uint64_t bytes);
    void record_worker_state(const FunctionId& id, const QueueName& queue, WorkerState state);
    void record_schedule_fire(const FunctionId& id, Timestamp scheduled_at, bool skipped);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    /// Number of events written since construction.
    [[nodiscard]] uint64_t events_emitted() const;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t events_{0};

    void emit(std::string_view json_line);
};

}  // namespace cloudlet
