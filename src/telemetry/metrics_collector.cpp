/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace cloudlet {

namespace {

std::string now_iso() {
    return format_iso8601(std::chrono::system_clock::now());
}

}  // namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_execution(const FunctionId& id, std::string_view function_name,
                                        ExecutionStatus status, Duration duration,
                                        int exit_code) {
    std::ostringstream oss;
    oss << R"({"event":"function_execution")"
        << R"(,"ts":")" << now_iso() << "\""
        << R"(,"function_id":")" << json_escape(id) << "\""
        << R"(,"function":")" << json_escape(function_name) << "\""
        << R"(,"status":")" << to_string(status) << "\""
        << R"(,"duration_us":)" << duration.count()
        << R"(,"exit_code":)" << exit_code
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_queue_event(const QueueName& queue, std::string_view event_type,
                                          uint64_t bytes) {
    std::ostringstream oss;
    oss << R"({"event":"queue_)" << event_type << "\""
        << R"(,"ts":")" << now_iso() << "\""
        << R"(,"queue":")" << json_escape(queue) << "\""
        << R"(,"bytes":)" << bytes
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_worker_state(const FunctionId& id, const QueueName& queue,
                                           WorkerState state) {
    std::ostringstream oss;
    oss << R"({"event":"worker_state_change")"
        << R"(,"ts":")" << now_iso() << "\""
        << R"(,"function_id":")" << json_escape(id) << "\""
        << R"(,"queue":")" << json_escape(queue) << "\""
        << R"(,"state":")" << to_string(state) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_schedule_fire(const FunctionId& id, Timestamp scheduled_at,
                                            bool skipped) {
    std::ostringstream oss;
    oss << R"({"event":"schedule_fire")"
        << R"(,"ts":")" << now_iso() << "\""
        << R"(,"function_id":")" << json_escape(id) << "\""
        << R"(,"scheduled_at":")" << format_iso8601(scheduled_at) << "\""
        << R"(,"skipped":)" << (skipped ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"ts":")" << now_iso() << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t MetricsCollector::events_emitted() const {
    std::lock_guard lock(write_mutex_);
    return events_;
}

}  // namespace cloudlet
