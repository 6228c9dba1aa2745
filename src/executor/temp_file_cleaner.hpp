/**
 * @file temp_file_cleaner.hpp
 * @brief Periodic removal of stale function workspaces.
 *
 * Workspaces are normally removed by their invocation. Entries left behind by
 * a crash are swept here once they are older than the age threshold. Only
 * entries carrying the workspace prefix are ever touched.
 */

#pragma once

#include "core/logger.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <thread>

namespace cloudlet {

class TempFileCleaner {
public:
    TempFileCleaner(std::filesystem::path root,
                    std::chrono::seconds interval,
                    std::chrono::seconds age_threshold,
                    Logger& logger);
    ~TempFileCleaner();

    TempFileCleaner(const TempFileCleaner&) = delete;
    TempFileCleaner& operator=(const TempFileCleaner&) = delete;

    /// Start the background sweep thread. A second call is a no-op.
    void start();

    /// Stop and join the sweep thread. Idempotent.
    void stop();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

    /**
     * @brief Sweep once, using @p now as the reference time.
     * @return Number of entries removed.
     */
    size_t sweep(std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now());

    [[nodiscard]] std::chrono::seconds age_threshold() const noexcept { return age_threshold_; }

private:
    void run(std::stop_token stop);

    std::filesystem::path root_;
    std::chrono::seconds interval_;
    std::chrono::seconds age_threshold_;
    Logger& logger_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread thread_;
};

}  // namespace cloudlet
