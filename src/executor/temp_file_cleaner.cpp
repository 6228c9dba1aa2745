/**
 * @file temp_file_cleaner.cpp
 * @brief TempFileCleaner implementation.
 */

#include "executor/temp_file_cleaner.hpp"

#include "executor/temp_workspace.hpp"

#include <string>
#include <vector>

namespace cloudlet {

TempFileCleaner::TempFileCleaner(std::filesystem::path root,
                                 std::chrono::seconds interval,
                                 std::chrono::seconds age_threshold,
                                 Logger& logger)
    : root_(std::move(root))
    , interval_(interval)
    , age_threshold_(age_threshold)
    , logger_(logger) {}

TempFileCleaner::~TempFileCleaner() {
    stop();
}

void TempFileCleaner::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
    logger_.info("Temp file cleaner started for " + root_.string());
}

void TempFileCleaner::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    wait_cv_.notify_all();
    thread_.join();
}

void TempFileCleaner::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        sweep();

        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_for(lock, stop, interval_, [] { return false; });
    }
}

size_t TempFileCleaner::sweep(std::filesystem::file_time_type now) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) return 0;

    std::vector<std::filesystem::path> stale;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        logger_.warn("Cannot scan temp directory " + root_.string() + ": " + ec.message());
        return 0;
    }

    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        auto name = entry.path().filename().string();
        if (name.rfind(kWorkspacePrefix, 0) != 0) continue;

        std::error_code time_ec;
        auto modified = entry.last_write_time(time_ec);
        if (time_ec) continue;
        if (now - modified > age_threshold_) stale.push_back(entry.path());
    }

    size_t removed = 0;
    for (const auto& path : stale) {
        std::error_code rm_ec;
        std::filesystem::remove_all(path, rm_ec);
        if (rm_ec) {
            logger_.warn("Failed to remove stale workspace " + path.string() + ": "
                         + rm_ec.message());
            continue;
        }
        ++removed;
    }

    if (removed > 0) {
        logger_.info("Removed " + std::to_string(removed) + " stale workspace(s) from "
                     + root_.string());
    }
    return removed;
}

}  // namespace cloudlet
