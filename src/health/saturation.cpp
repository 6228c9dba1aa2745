/**
 * @file saturation.cpp
 * @brief Saturation classification implementation.
 */

#include "health/saturation.hpp"

#include <algorithm>

namespace cloudlet {

namespace {

double ratio_of(uint64_t used, uint64_t budget) noexcept {
    if (budget == 0) return 0.0;
    return static_cast<double>(used) / static_cast<double>(budget);
}

}  // namespace

HealthStatus classify_saturation(uint64_t used_bytes,
                                 uint64_t budget_bytes,
                                 const HealthConfig& config) noexcept {
    if (budget_bytes == 0) return HealthStatus::Healthy;
    double ratio = ratio_of(used_bytes, budget_bytes);
    if (ratio >= config.critical_ratio) return HealthStatus::Critical;
    if (ratio >= config.degraded_ratio) return HealthStatus::Degraded;
    return HealthStatus::Healthy;
}

HealthReport assess_queue_health(const std::vector<QueueStats>& stats,
                                 const HealthConfig& config) {
    HealthReport report;
    report.queues.reserve(stats.size());

    for (const auto& s : stats) {
        QueueHealth q;
        q.name = s.name;
        q.total_bytes = s.total_bytes;
        q.budget_bytes = s.config.max_bytes != 0 ? s.config.max_bytes : config.queue_byte_budget;
        q.ratio = ratio_of(q.total_bytes, q.budget_bytes);
        q.status = classify_saturation(q.total_bytes, q.budget_bytes, config);

        report.total_bytes += s.total_bytes;
        report.overall = std::max(report.overall, q.status);
        report.queues.push_back(std::move(q));
    }

    report.ratio = ratio_of(report.total_bytes, config.queue_byte_budget);
    report.overall = std::max(report.overall,
                              classify_saturation(report.total_bytes, config.queue_byte_budget,
                                                  config));
    return report;
}

}  // namespace cloudlet
