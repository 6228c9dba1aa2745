/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace cloudlet {

struct QueueServerConfig {
    std::filesystem::path root = "./data/queues";
    uint64_t max_message_bytes = 1048576;           ///< Single-message ceiling
    uint64_t default_max_bytes = 0;                 ///< 0 = unlimited
    uint64_t default_max_messages = 0;              ///< 0 = unlimited
    OverflowPolicy default_overflow = OverflowPolicy::Reject;
    uint64_t compaction_min_bytes = 4 * 1048576;    ///< Log size before compaction is considered
};

struct BlobStoreConfig {
    std::filesystem::path root = "./data/blobs";
    uint64_t max_blob_bytes = 100ULL * 1024 * 1024;
};

struct ExecutorConfig {
    uint32_t execution_timeout_seconds = 300;
    bool enable_parallel_execution = true;
    uint32_t max_concurrent_executions = 5;
    std::filesystem::path temp_dir;                 ///< Empty = system temp directory
    uint64_t max_output_bytes = 1048576;
    std::filesystem::path shim_path = "cloudlet_shim";
};

struct DispatcherConfig {
    uint32_t poll_interval_ms = 1000;
    uint32_t max_attempts = 3;
    uint32_t initial_backoff_ms = 1000;
    uint32_t max_backoff_ms = 30000;
    uint32_t drain_timeout_ms = 30000;
};

struct SchedulerConfig {
    uint32_t pool_threads = 0;                      ///< 0 = max_concurrent_executions
};

struct CleanupConfig {
    bool enabled = true;
    uint32_t interval_seconds = 300;
    uint32_t file_age_threshold_seconds = 600;
};

struct HealthConfig {
    uint64_t queue_byte_budget = 1ULL << 30;
    double degraded_ratio = 0.8;
    double critical_ratio = 0.95;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    QueueServerConfig queue;
    BlobStoreConfig blob_store;
    ExecutorConfig executor;
    DispatcherConfig dispatcher;
    SchedulerConfig scheduler;
    CleanupConfig cleanup;
    HealthConfig health;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. The result is not range-checked; call
 * validate_config() before wiring the host.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges, collecting every violation as a field error.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace cloudlet
