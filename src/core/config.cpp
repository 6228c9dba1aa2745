/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"
#include "queue/record_codec.hpp"

#include <toml++/toml.hpp>

namespace cloudlet {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [queue]
        if (auto queue = tbl["queue"]; queue.is_table()) {
            config.queue.root = queue["root"].value_or(std::string{"./data/queues"});
            config.queue.max_message_bytes = static_cast<uint64_t>(
                queue["max_message_bytes"].value_or(int64_t{1048576}));
            config.queue.default_max_bytes = static_cast<uint64_t>(
                queue["default_max_bytes"].value_or(int64_t{0}));
            config.queue.default_max_messages = static_cast<uint64_t>(
                queue["default_max_messages"].value_or(int64_t{0}));
            config.queue.compaction_min_bytes = static_cast<uint64_t>(
                queue["compaction_min_bytes"].value_or(int64_t{4 * 1048576}));

            auto overflow = queue["default_overflow"].value_or(std::string{"reject"});
            auto policy = parse_overflow_policy(overflow);
            if (!policy) {
                return Error::validation_failed("queue.default_overflow",
                                                "unknown overflow policy '" + overflow + "'");
            }
            config.queue.default_overflow = *policy;
        }

        // [blob_store]
        if (auto blob = tbl["blob_store"]; blob.is_table()) {
            config.blob_store.root = blob["root"].value_or(std::string{"./data/blobs"});
            config.blob_store.max_blob_bytes = static_cast<uint64_t>(
                blob["max_blob_bytes"].value_or(int64_t{100LL * 1024 * 1024}));
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.execution_timeout_seconds = static_cast<uint32_t>(
                executor["execution_timeout_seconds"].value_or(int64_t{300}));
            config.executor.enable_parallel_execution =
                executor["enable_parallel_execution"].value_or(true);
            config.executor.max_concurrent_executions = static_cast<uint32_t>(
                executor["max_concurrent_executions"].value_or(int64_t{5}));
            config.executor.temp_dir = executor["temp_dir"].value_or(std::string{});
            config.executor.max_output_bytes = static_cast<uint64_t>(
                executor["max_output_bytes"].value_or(int64_t{1048576}));
            config.executor.shim_path =
                executor["shim_path"].value_or(std::string{"cloudlet_shim"});
        }

        // [dispatcher]
        if (auto dispatcher = tbl["dispatcher"]; dispatcher.is_table()) {
            config.dispatcher.poll_interval_ms = static_cast<uint32_t>(
                dispatcher["poll_interval_ms"].value_or(int64_t{1000}));
            config.dispatcher.max_attempts = static_cast<uint32_t>(
                dispatcher["max_attempts"].value_or(int64_t{3}));
            config.dispatcher.initial_backoff_ms = static_cast<uint32_t>(
                dispatcher["initial_backoff_ms"].value_or(int64_t{1000}));
            config.dispatcher.max_backoff_ms = static_cast<uint32_t>(
                dispatcher["max_backoff_ms"].value_or(int64_t{30000}));
            config.dispatcher.drain_timeout_ms = static_cast<uint32_t>(
                dispatcher["drain_timeout_ms"].value_or(int64_t{30000}));
        }

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            config.scheduler.pool_threads = static_cast<uint32_t>(
                scheduler["pool_threads"].value_or(int64_t{0}));
        }

        // [cleanup]
        if (auto cleanup = tbl["cleanup"]; cleanup.is_table()) {
            config.cleanup.enabled = cleanup["enabled"].value_or(true);
            config.cleanup.interval_seconds = static_cast<uint32_t>(
                cleanup["interval_seconds"].value_or(int64_t{300}));
            config.cleanup.file_age_threshold_seconds = static_cast<uint32_t>(
                cleanup["file_age_threshold_seconds"].value_or(int64_t{600}));
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            config.health.queue_byte_budget = static_cast<uint64_t>(
                health["queue_byte_budget"].value_or(int64_t{1LL << 30}));
            config.health.degraded_ratio = health["degraded_ratio"].value_or(0.8);
            config.health.critical_ratio = health["critical_ratio"].value_or(0.95);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<void> validate_config(const Config& config) {
    FieldErrors errors;

    if (config.queue.root.empty()) {
        errors["queue.root"].push_back("must not be empty");
    }
    if (config.queue.max_message_bytes == 0) {
        errors["queue.max_message_bytes"].push_back("must be greater than zero");
    } else if (config.queue.max_message_bytes > RecordCodec::kMaxPayloadSize) {
        errors["queue.max_message_bytes"].push_back(
            "must be at most " + std::to_string(RecordCodec::kMaxPayloadSize)
            + " bytes, the largest payload a log record can hold");
    }
    if (config.blob_store.max_blob_bytes == 0) {
        errors["blob_store.max_blob_bytes"].push_back("must be greater than zero");
    }

    const auto& exec = config.executor;
    if (exec.execution_timeout_seconds < 1 || exec.execution_timeout_seconds > 3600) {
        errors["executor.execution_timeout_seconds"].push_back("must be between 1 and 3600");
    }
    if (exec.max_concurrent_executions < 1 || exec.max_concurrent_executions > 100) {
        errors["executor.max_concurrent_executions"].push_back("must be between 1 and 100");
    }

    const auto& disp = config.dispatcher;
    if (disp.poll_interval_ms == 0) {
        errors["dispatcher.poll_interval_ms"].push_back("must be greater than zero");
    }
    if (disp.max_attempts == 0) {
        errors["dispatcher.max_attempts"].push_back("must be at least 1");
    }
    if (disp.max_backoff_ms < disp.initial_backoff_ms) {
        errors["dispatcher.max_backoff_ms"].push_back("must not be below initial_backoff_ms");
    }

    if (config.cleanup.enabled) {
        if (config.cleanup.interval_seconds < 60 || config.cleanup.interval_seconds > 3600) {
            errors["cleanup.interval_seconds"].push_back("must be between 60 and 3600");
        }
        if (config.cleanup.file_age_threshold_seconds == 0) {
            errors["cleanup.file_age_threshold_seconds"].push_back("must be greater than zero");
        }
    }

    const auto& health = config.health;
    if (health.queue_byte_budget == 0) {
        errors["health.queue_byte_budget"].push_back("must be greater than zero");
    }
    if (!(health.degraded_ratio > 0.0 && health.degraded_ratio < health.critical_ratio
          && health.critical_ratio <= 1.0)) {
        errors["health.degraded_ratio"].push_back(
            "must satisfy 0 < degraded_ratio < critical_ratio <= 1");
    }

    if (!parse_log_level(config.telemetry.log_level)) {
        errors["telemetry.log_level"].push_back("unknown log level '"
                                                + config.telemetry.log_level + "'");
    }

    if (!errors.empty()) {
        return Error::validation_failed(std::move(errors));
    }
    return Result<void>{};
}

Config default_config() {
    return Config{};
}

}  // namespace cloudlet
