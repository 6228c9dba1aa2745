/**
 * @file queue_log.cpp
 * @brief QueueLog replay, append and compaction.
 */

#include "queue/queue_log.hpp"

#include "queue/record_codec.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cloudlet {

namespace {

constexpr size_t kCompactionFlushBytes = 1 << 20;

Result<void> pwrite_all(int fd, const uint8_t* data, size_t size, uint64_t offset) {
    size_t done = 0;
    while (done < size) {
        ssize_t n = ::pwrite(fd, data + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Error{errno_message("pwrite")};
        }
        done += static_cast<size_t>(n);
    }
    return Result<void>{};
}

Result<void> truncate_to(int fd, uint64_t size) {
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return Error{errno_message("ftruncate")};
    }
    if (::fdatasync(fd) != 0) {
        return Error{errno_message("fdatasync")};
    }
    return Result<void>{};
}

void apply_remove(std::deque<LogEntry>& live, uint64_t seq) {
    if (!live.empty() && live.front().seq == seq) {
        live.pop_front();
        return;
    }
    for (auto it = live.begin(); it != live.end(); ++it) {
        if (it->seq == seq) {
            live.erase(it);
            return;
        }
    }
}

}  // namespace

QueueLog::QueueLog(std::filesystem::path path, UniqueFd fd, uint64_t size)
    : path_(std::move(path)), fd_(std::move(fd)), size_(size) {}

Result<std::unique_ptr<QueueLog>> QueueLog::open(const std::filesystem::path& path,
                                                 ReplayReport& report) {
    report = ReplayReport{};

    UniqueFd fd{::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};
    if (!fd) {
        return Error{errno_message("open " + path.string())};
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return Error{errno_message("fstat " + path.string())};
    }
    const auto file_size = static_cast<uint64_t>(st.st_size);

    // ── Header ───────────────────────────────
    if (file_size < RecordCodec::kFileHeaderSize) {
        // New file, or a crash while the header was being written
        Bytes header;
        RecordCodec::encode_file_header(header);
        if (auto t = truncate_to(fd.get(), 0); !t) return t.error();
        if (auto w = pwrite_all(fd.get(), header.data(), header.size(), 0); !w) return w.error();
        if (::fdatasync(fd.get()) != 0) {
            return Error{errno_message("fdatasync " + path.string())};
        }
        if (auto d = fsync_directory(path.parent_path()); !d) return d.error();
        return std::unique_ptr<QueueLog>(
            new QueueLog(path, std::move(fd), RecordCodec::kFileHeaderSize));
    }

    uint8_t header[RecordCodec::kFileHeaderSize];
    if (auto r = pread_exact(fd.get(), header, sizeof(header), 0); !r) return r.error();
    if (!RecordCodec::check_file_header(header, sizeof(header))) {
        return Error{"Unrecognized queue log header in " + path.string()};
    }

    // ── Records ──────────────────────────────
    uint64_t offset = RecordCodec::kFileHeaderSize;
    Bytes buffer;

    while (offset + RecordCodec::kRecordPrefixSize <= file_size) {
        uint8_t prefix[RecordCodec::kRecordPrefixSize];
        if (auto r = pread_exact(fd.get(), prefix, sizeof(prefix), offset); !r) return r.error();

        auto body_len = RecordCodec::peek_body_size(prefix);
        if (!body_len) break;

        const uint64_t record_size = RecordCodec::kRecordPrefixSize + *body_len
                                   + RecordCodec::kRecordSuffixSize;
        if (offset + record_size > file_size) break;

        buffer.resize(static_cast<size_t>(record_size));
        if (auto r = pread_exact(fd.get(), buffer.data(), buffer.size(), offset); !r) {
            return r.error();
        }

        auto record = RecordCodec::decode(buffer.data(), buffer.size());
        if (!record) break;

        switch (record->type) {
            case RecordType::Enqueue: {
                LogEntry entry;
                entry.seq = record->seq;
                entry.id = std::move(record->id);
                entry.content_type = std::move(record->content_type);
                entry.size = record->payload_size;
                entry.enqueued_at = from_unix_ms(record->enqueued_at_ms);
                entry.payload_offset = offset + record->payload_offset;
                entry.record_bytes = record_size;
                if (entry.seq >= report.next_seq) report.next_seq = entry.seq + 1;
                report.live.push_back(std::move(entry));
                break;
            }
            case RecordType::Remove:
                apply_remove(report.live, record->seq);
                break;
            case RecordType::Purge:
                report.live.clear();
                break;
        }

        ++report.records;
        offset += record_size;
    }

    if (offset < file_size) {
        report.truncated_bytes = file_size - offset;
        if (auto t = truncate_to(fd.get(), offset); !t) return t.error();
    }

    return std::unique_ptr<QueueLog>(new QueueLog(path, std::move(fd), offset));
}

Result<uint64_t> QueueLog::append(const Bytes& records) {
    const uint64_t start = size_;

    auto written = pwrite_all(fd_.get(), records.data(), records.size(), start);
    if (written && ::fdatasync(fd_.get()) != 0) {
        written = Error{errno_message("fdatasync " + path_.string())};
    }

    if (!written) {
        // Drop whatever part of the batch reached the file
        if (::ftruncate(fd_.get(), static_cast<off_t>(start)) != 0) {
            return Error{written.error().message + "; rollback failed: "
                         + errno_message("ftruncate")};
        }
        return written.error();
    }

    size_ = start + records.size();
    return start;
}

Result<Bytes> QueueLog::read_payload(const LogEntry& entry) const {
    Bytes payload(static_cast<size_t>(entry.size));
    if (!payload.empty()) {
        auto r = pread_exact(fd_.get(), payload.data(), payload.size(), entry.payload_offset);
        if (!r) return r.error();
    }
    return payload;
}

Result<void> QueueLog::compact(std::deque<LogEntry>& live) {
    auto temp_path = path_;
    temp_path += ".compact";

    UniqueFd temp{::open(temp_path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (!temp) {
        return Error{errno_message("create " + temp_path.string())};
    }

    auto fail = [&](Error err) -> Result<void> {
        temp.reset();
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return err;
    };

    Bytes buffer;
    RecordCodec::encode_file_header(buffer);
    uint64_t flushed = 0;

    std::vector<uint64_t> new_offsets;
    std::vector<uint64_t> new_sizes;
    new_offsets.reserve(live.size());
    new_sizes.reserve(live.size());

    for (const auto& entry : live) {
        auto payload = read_payload(entry);
        if (!payload) return fail(payload.error());

        const size_t record_start = buffer.size();
        size_t rel = RecordCodec::encode_enqueue(buffer, entry.seq, entry.id,
                                                 entry.content_type, entry.enqueued_at,
                                                 *payload);
        new_offsets.push_back(flushed + rel);
        new_sizes.push_back(buffer.size() - record_start);

        if (buffer.size() >= kCompactionFlushBytes) {
            if (auto w = pwrite_all(temp.get(), buffer.data(), buffer.size(), flushed); !w) {
                return fail(w.error());
            }
            flushed += buffer.size();
            buffer.clear();
        }
    }

    if (!buffer.empty()) {
        if (auto w = pwrite_all(temp.get(), buffer.data(), buffer.size(), flushed); !w) {
            return fail(w.error());
        }
        flushed += buffer.size();
    }

    if (::fdatasync(temp.get()) != 0) {
        return fail(Error{errno_message("fdatasync " + temp_path.string())});
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        return fail(Error{"rename " + temp_path.string() + " failed: " + ec.message()});
    }

    // The renamed file is now the log; switch over before anything else can fail
    fd_ = std::move(temp);
    size_ = flushed;

    for (size_t i = 0; i < live.size(); ++i) {
        live[i].payload_offset = new_offsets[i];
        live[i].record_bytes = new_sizes[i];
    }
    return fsync_directory(path_.parent_path());
}

}  // namespace cloudlet
