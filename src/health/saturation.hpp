/**
 * @file saturation.hpp
 * @brief Queue saturation classification against a byte budget.
 */

#pragma once

#include "core/config.hpp"
#include "queue/message.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cloudlet {

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:  return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Critical: return "critical";
    }
    return "unknown";
}

struct QueueHealth {
    QueueName name;
    HealthStatus status{HealthStatus::Healthy};
    uint64_t total_bytes{0};
    uint64_t budget_bytes{0};       ///< The queue's own byte quota, or the global budget
    double ratio{0.0};
};

struct HealthReport {
    HealthStatus overall{HealthStatus::Healthy};
    uint64_t total_bytes{0};
    double ratio{0.0};              ///< Sum of all queues over the global budget
    std::vector<QueueHealth> queues;
};

/// Classify @p used_bytes against @p budget_bytes using the configured ratios.
[[nodiscard]] HealthStatus classify_saturation(uint64_t used_bytes,
                                               uint64_t budget_bytes,
                                               const HealthConfig& config) noexcept;

/**
 * @brief Classify every queue and the combined total.
 *
 * A queue with a byte quota is measured against that quota; an unlimited
 * queue against the global budget. The overall status is the worst of the
 * per-queue statuses and the combined total.
 */
[[nodiscard]] HealthReport assess_queue_health(const std::vector<QueueStats>& stats,
                                               const HealthConfig& config);

}  // namespace cloudlet
