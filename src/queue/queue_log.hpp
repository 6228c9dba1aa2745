/**
 * @file queue_log.hpp
 * @brief Append-only, checksummed write-ahead log backing one queue.
 *
 * The log is the source of truth: every mutation is appended and flushed
 * before the in-memory index changes. Payloads stay on disk and are read
 * back with pread() at dequeue time.
 */

#pragma once

#include "core/file_util.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <deque>
#include <filesystem>
#include <memory>

namespace cloudlet {

/**
 * @brief Index entry for a live message. Points at its payload in the log.
 */
struct LogEntry {
    uint64_t seq{0};
    MessageId id;
    std::string content_type;
    uint64_t size{0};
    Timestamp enqueued_at;
    uint64_t payload_offset{0};
    uint64_t record_bytes{0};
};

/**
 * @brief What replay recovered from disk.
 */
struct ReplayReport {
    std::deque<LogEntry> live;          ///< Oldest first
    uint64_t next_seq{1};
    uint64_t records{0};
    uint64_t truncated_bytes{0};        ///< Torn or corrupt tail dropped on open
};

class QueueLog {
public:
    ~QueueLog() = default;

    QueueLog(const QueueLog&) = delete;
    QueueLog& operator=(const QueueLog&) = delete;

    /**
     * @brief Open (creating if needed) and replay a log file.
     *
     * A torn or corrupt tail is truncated at the last intact record. A file
     * with a foreign header is refused rather than overwritten.
     */
    static Result<std::unique_ptr<QueueLog>> open(const std::filesystem::path& path,
                                                  ReplayReport& report);

    /**
     * @brief Append pre-encoded records and fdatasync.
     * @return Log offset at which the first byte of @p records was written.
     *
     * On failure the file is truncated back to its previous length.
     */
    Result<uint64_t> append(const Bytes& records);

    Result<Bytes> read_payload(const LogEntry& entry) const;

    /**
     * @brief Rewrite the log with only the given live entries.
     *
     * Writes a sibling file, flushes it and renames it into place. Entry
     * offsets are updated only once the rename is durable.
     */
    Result<void> compact(std::deque<LogEntry>& live);

    [[nodiscard]] uint64_t size_bytes() const noexcept { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    QueueLog(std::filesystem::path path, UniqueFd fd, uint64_t size);

    std::filesystem::path path_;
    UniqueFd fd_;
    uint64_t size_;
};

}  // namespace cloudlet
