/**
 * @file types.hpp
 * @brief Fundamental types used throughout Cloudlet.
 *
 * Defines the identifier aliases, clock aliases and the small enums shared by
 * the queue, executor and dispatch layers. All types have value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cloudlet {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using BlobId = std::string;
using FunctionId = std::string;
using MessageId = std::string;
using QueueName = std::string;
using Bytes = std::vector<uint8_t>;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Queue Overflow Policy
// ─────────────────────────────────────────────

enum class OverflowPolicy : uint8_t {
    Reject,        ///< Fail the enqueue when a quota would be exceeded
    DropOldest     ///< Evict the oldest messages until the new one fits
};

[[nodiscard]] constexpr std::string_view to_string(OverflowPolicy policy) noexcept {
    switch (policy) {
        case OverflowPolicy::Reject:     return "reject";
        case OverflowPolicy::DropOldest: return "drop_oldest";
    }
    return "unknown";
}

[[nodiscard]] std::optional<OverflowPolicy> parse_overflow_policy(std::string_view text);

// ─────────────────────────────────────────────
// Worker State
// ─────────────────────────────────────────────

enum class WorkerState : uint8_t {
    Idle,          ///< Waiting on the queue
    Running,       ///< Executing a dequeued message
    Draining,      ///< Stop requested, finishing the in-flight execution
    Stopped        ///< Loop exited
};

[[nodiscard]] constexpr std::string_view to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Idle:     return "idle";
        case WorkerState::Running:  return "running";
        case WorkerState::Draining: return "draining";
        case WorkerState::Stopped:  return "stopped";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Succeeded,
    Failed,
    Cancelled      ///< Not an error: the caller withdrew the request
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Succeeded: return "succeeded";
        case ExecutionStatus::Failed:    return "failed";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// Milliseconds since the Unix epoch.
[[nodiscard]] inline int64_t to_unix_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_ms(int64_t ms) noexcept {
    return Timestamp{std::chrono::milliseconds{ms}};
}

/// ISO 8601 UTC representation with millisecond precision.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

[[nodiscard]] inline Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

[[nodiscard]] inline std::string to_text(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace cloudlet
