/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>

namespace cloudlet {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    open_current();
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::file_path(uint32_t n) const {
    if (n == 0) return log_dir_ / (prefix_ + ".ndjson");
    return log_dir_ / (prefix_ + "." + std::to_string(n) + ".ndjson");
}

void JsonFileSink::set_max_file_size_bytes(uint64_t bytes) {
    std::lock_guard lock(mutex_);
    max_file_size_bytes_ = bytes;
}

void JsonFileSink::write(std::string_view json_line) {
    std::lock_guard lock(mutex_);
    rotate_if_needed(json_line.size() + 1);
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    std::lock_guard lock(mutex_);
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::open_current() {
    auto path = file_path(0);
    current_file_.open(path, std::ios::app);
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : size;
}

void JsonFileSink::rotate_if_needed(size_t incoming) {
    if (max_file_size_bytes_ == 0) return;
    if (current_size_ == 0 || current_size_ + incoming <= max_file_size_bytes_) return;

    current_file_.flush();
    current_file_.close();

    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(file_path(0), ec);
    } else {
        std::filesystem::remove(file_path(max_files_), ec);
        for (uint32_t n = max_files_; n > 1; --n) {
            if (std::filesystem::exists(file_path(n - 1), ec)) {
                std::filesystem::rename(file_path(n - 1), file_path(n), ec);
            }
        }
        std::filesystem::rename(file_path(0), file_path(1), ec);
    }

    current_size_ = 0;
    open_current();
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

}  // namespace cloudlet
