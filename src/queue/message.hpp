/**
 * @file message.hpp
 * @brief Queue vocabulary: messages, per-queue configuration and stats.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>

namespace cloudlet {

inline constexpr std::string_view kDefaultContentType = "application/octet-stream";

/**
 * @brief Quota and overflow behaviour for one queue. Zero quotas are unlimited.
 */
struct QueueConfig {
    uint64_t max_bytes{0};
    uint64_t max_messages{0};
    OverflowPolicy overflow{OverflowPolicy::Reject};

    bool operator==(const QueueConfig&) const = default;
};

/**
 * @brief A message as handed back by dequeue. Immutable once admitted.
 */
struct Message {
    MessageId id;
    QueueName queue;
    std::string content_type;
    Bytes payload;
    Timestamp enqueued_at;

    [[nodiscard]] uint64_t size() const noexcept { return payload.size(); }
};

/**
 * @brief Point-in-time view of a queue, safe to hand to external evaluators.
 */
struct QueueStats {
    QueueName name;
    uint64_t message_count{0};
    uint64_t total_bytes{0};
    QueueConfig config;

    // Lifetime counters since open or the last purge
    uint64_t enqueued_total{0};
    uint64_t dequeued_total{0};
    uint64_t evicted_total{0};
    uint64_t rejected_total{0};
};

}  // namespace cloudlet
