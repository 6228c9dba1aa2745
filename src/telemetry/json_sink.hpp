/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace cloudlet {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is <dir>/<prefix>.ndjson. When it reaches the size limit it
 * becomes <prefix>.1.ndjson, older files shift up by one and anything beyond
 * max_files is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Path of the rotated file with index @p n; 0 is the active file.
    [[nodiscard]] std::filesystem::path file_path(uint32_t n) const;

    /// Byte-granular limit, used by tests to force rotation quickly.
    void set_max_file_size_bytes(uint64_t bytes);

private:
    void open_current();
    void rotate_if_needed(size_t incoming);

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::mutex mutex_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout for development and debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output, for benchmarks.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace cloudlet
