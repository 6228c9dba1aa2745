/**
 * @file queue_server.cpp
 * @brief QueueServer implementation.
 */

#include "queue/queue_server.hpp"

#include "core/id.hpp"
#include "core/validation.hpp"
#include "queue/queue_log.hpp"
#include "queue/record_codec.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>

#include <toml++/toml.hpp>

namespace cloudlet {

namespace {

constexpr const char* kConfigFile = "queue.toml";
constexpr const char* kLogFile = "messages.log";

}  // namespace

// ─────────────────────────────────────────────
// Per-queue state
// ─────────────────────────────────────────────

struct QueueServer::QueueState {
    QueueName name;
    QueueConfig config;                 ///< Immutable after creation
    std::filesystem::path dir;

    std::mutex mutex;
    std::condition_variable_any available;
    std::unique_ptr<QueueLog> log;
    std::deque<LogEntry> entries;       ///< Oldest first
    uint64_t total_bytes{0};
    uint64_t live_record_bytes{0};
    uint64_t next_seq{1};

    uint64_t enqueued_total{0};
    uint64_t dequeued_total{0};
    uint64_t evicted_total{0};
    uint64_t rejected_total{0};

    // Published copy read by get_stats() without touching `mutex`
    mutable std::mutex stats_mutex;
    QueueStats snapshot;
};

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

QueueServer::QueueServer(QueueServerConfig config, Logger& logger)
    : config_(std::move(config)), logger_(logger) {}

QueueServer::~QueueServer() = default;

QueueConfig QueueServer::default_queue_config() const noexcept {
    return QueueConfig{
        .max_bytes = config_.default_max_bytes,
        .max_messages = config_.default_max_messages,
        .overflow = config_.default_overflow,
    };
}

Result<void> QueueServer::open() {
    std::error_code ec;
    std::filesystem::create_directories(config_.root, ec);
    if (ec) {
        return Error{ErrorKind::QueueOperationFailed,
                     "Cannot create queue root " + config_.root.string() + ": " + ec.message()};
    }

    std::unique_lock lock(registry_mutex_);

    for (const auto& dir_entry : std::filesystem::directory_iterator(config_.root, ec)) {
        std::error_code entry_ec;
        if (!dir_entry.is_directory(entry_ec)) continue;

        auto config_path = dir_entry.path() / kConfigFile;
        if (!std::filesystem::exists(config_path, entry_ec)) continue;

        QueueName name = dir_entry.path().filename().string();
        QueueConfig queue_config = default_queue_config();

        try {
            auto tbl = toml::parse_file(config_path.string());
            name = tbl["name"].value_or(name);
            queue_config.max_bytes = static_cast<uint64_t>(
                tbl["max_bytes"].value_or(int64_t{0}));
            queue_config.max_messages = static_cast<uint64_t>(
                tbl["max_messages"].value_or(int64_t{0}));
            auto policy = parse_overflow_policy(
                tbl["overflow"].value_or(std::string{"reject"}));
            if (!policy) {
                logger_.error("Queue " + name + ": unknown overflow policy, skipping");
                continue;
            }
            queue_config.overflow = *policy;
        } catch (const toml::parse_error& err) {
            logger_.error("Queue config " + config_path.string() + " unreadable: "
                          + std::string{err.description()});
            continue;
        }

        if (!validate_queue_name(name) || name != dir_entry.path().filename().string()) {
            logger_.error("Queue directory " + dir_entry.path().string()
                          + " does not match its configured name, skipping");
            continue;
        }

        auto state = load_queue(dir_entry.path(), name, queue_config);
        if (!state) {
            logger_.error(state.error().message);
            continue;
        }

        auto& q = **state;
        logger_.info("Recovered queue " + name + ": " + std::to_string(q.entries.size())
                     + " messages, " + std::to_string(q.total_bytes) + " bytes");
        queues_.emplace(name, std::move(*state));
    }

    if (ec) {
        return Error{ErrorKind::QueueOperationFailed,
                     "Cannot scan queue root " + config_.root.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

Result<std::unique_ptr<QueueServer::QueueState>> QueueServer::load_queue(
    const std::filesystem::path& dir, const QueueName& name, const QueueConfig& config) {

    ReplayReport report;
    auto log = QueueLog::open(dir / kLogFile, report);
    if (!log) {
        return Error::queue_operation_failed(name, "cannot open log: " + log.error().message);
    }

    if (report.truncated_bytes > 0) {
        logger_.warn("Queue " + name + ": dropped " + std::to_string(report.truncated_bytes)
                     + " bytes of incomplete log tail");
    }

    auto state = std::make_unique<QueueState>();
    state->name = name;
    state->config = config;
    state->dir = dir;
    state->log = std::move(*log);
    state->entries = std::move(report.live);
    state->next_seq = report.next_seq;
    for (const auto& entry : state->entries) {
        state->total_bytes += entry.size;
        state->live_record_bytes += entry.record_bytes;
    }

    {
        std::lock_guard lock(state->mutex);
        maybe_compact(*state);
        publish_stats(*state);
    }
    return state;
}

Result<void> QueueServer::write_queue_config(const std::filesystem::path& dir,
                                             const QueueName& name,
                                             const QueueConfig& config) {
    toml::table tbl{
        {"name", name},
        {"max_bytes", static_cast<int64_t>(config.max_bytes)},
        {"max_messages", static_cast<int64_t>(config.max_messages)},
        {"overflow", std::string{to_string(config.overflow)}},
    };

    std::ostringstream oss;
    oss << tbl << '\n';

    auto written = write_file_atomic(dir / kConfigFile, oss.str());
    if (!written) {
        return Error::queue_operation_failed(name, "cannot persist configuration: "
                                             + written.error().message);
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────

QueueServer::QueueState* QueueServer::find(const QueueName& name) const {
    std::shared_lock lock(registry_mutex_);
    auto it = queues_.find(name);
    return it == queues_.end() ? nullptr : it->second.get();
}

Result<QueueServer::QueueState*> QueueServer::get_or_create(const QueueName& name,
                                                            const QueueConfig& config) {
    if (auto valid = validate_queue_name(name); !valid) {
        return valid.error();
    }
    if (auto* existing = find(name)) {
        return existing;
    }

    // Disk work happens outside registry_mutex_; create_mutex_ keeps two
    // creators from replaying the same log concurrently.
    std::lock_guard create_lock(create_mutex_);
    if (auto* existing = find(name)) {
        return existing;
    }

    auto dir = config_.root / name;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error::queue_operation_failed(name, "cannot create directory: " + ec.message());
    }

    if (auto persisted = write_queue_config(dir, name, config); !persisted) {
        return persisted.error();
    }

    auto state = load_queue(dir, name, config);
    if (!state) return state.error();

    QueueState* raw = nullptr;
    {
        std::unique_lock lock(registry_mutex_);
        auto [it, inserted] = queues_.try_emplace(name, std::move(*state));
        raw = it->second.get();
        if (!inserted) return raw;
    }
    logger_.info("Created queue " + name + " (max_bytes=" + std::to_string(config.max_bytes)
                 + ", max_messages=" + std::to_string(config.max_messages)
                 + ", overflow=" + std::string{to_string(config.overflow)} + ")");
    return raw;
}

Result<void> QueueServer::create_queue(const QueueName& name, const QueueConfig& config) {
    auto q = get_or_create(name, config);
    if (!q) return q.error();

    if ((*q)->config != config) {
        return Error::queue_operation_failed(
            name, "already exists with a different configuration");
    }
    return Result<void>{};
}

Result<void> QueueServer::ensure_queue(const QueueName& name) {
    auto q = get_or_create(name, default_queue_config());
    if (!q) return q.error();
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Enqueue / Dequeue / Purge
// ─────────────────────────────────────────────

Result<MessageId> QueueServer::enqueue(const QueueName& name,
                                       Bytes payload,
                                       std::string content_type) {
    const uint64_t size = payload.size();
    if (size > config_.max_message_bytes) {
        return Error::queue_quota_exceeded(
            name, config_.max_message_bytes,
            "message of " + std::to_string(size) + " bytes exceeds the "
            + std::to_string(config_.max_message_bytes) + " byte ceiling");
    }

    if (content_type.size() > RecordCodec::kMaxFieldSize) {
        return Error::validation_failed(
            "content_type", "must be at most " + std::to_string(RecordCodec::kMaxFieldSize) + " bytes");
    }
    if (RecordCodec::enqueue_body_size(kIdLength, content_type.size(), size)
        > RecordCodec::kMaxBodySize) {
        return Error::queue_quota_exceeded(
            name, RecordCodec::kMaxPayloadSize,
            "message of " + std::to_string(size) + " bytes exceeds the log record limit");
    }

    auto lookup = get_or_create(name, default_queue_config());
    if (!lookup) return lookup.error();
    auto& q = **lookup;

    std::unique_lock lock(q.mutex);
    const auto& cfg = q.config;

    auto reject = [&](std::string detail, uint64_t limit) -> Result<MessageId> {
        ++q.rejected_total;
        publish_stats(q);
        return Error::queue_quota_exceeded(name, limit, std::move(detail));
    };

    if (cfg.max_bytes != 0 && size > cfg.max_bytes) {
        return reject("message of " + std::to_string(size) + " bytes exceeds the queue quota of "
                      + std::to_string(cfg.max_bytes) + " bytes", cfg.max_bytes);
    }

    // Work out how many of the oldest messages must go for this one to fit
    size_t evict = 0;
    uint64_t bytes_after = q.total_bytes;
    uint64_t count_after = q.entries.size();
    auto over_quota = [&] {
        return (cfg.max_bytes != 0 && bytes_after + size > cfg.max_bytes)
            || (cfg.max_messages != 0 && count_after + 1 > cfg.max_messages);
    };

    while (over_quota()) {
        if (cfg.overflow == OverflowPolicy::Reject || evict == q.entries.size()) {
            return reject("holds " + std::to_string(q.entries.size()) + " messages / "
                          + std::to_string(q.total_bytes) + " bytes", cfg.max_bytes);
        }
        bytes_after -= q.entries[evict].size;
        --count_after;
        ++evict;
    }

    // Write-ahead: evictions and the new message go out in one flushed append
    Bytes batch;
    for (size_t i = 0; i < evict; ++i) {
        RecordCodec::encode_remove(batch, q.entries[i].seq);
    }
    const size_t record_start = batch.size();

    LogEntry entry;
    entry.seq = q.next_seq;
    entry.id = generate_id();
    entry.content_type = std::move(content_type);
    entry.size = size;
    entry.enqueued_at = std::chrono::system_clock::now();

    const size_t payload_rel = RecordCodec::encode_enqueue(
        batch, entry.seq, entry.id, entry.content_type, entry.enqueued_at, payload);
    entry.record_bytes = batch.size() - record_start;

    auto offset = q.log->append(batch);
    if (!offset) {
        return Error::queue_operation_failed(name, "append failed: " + offset.error().message);
    }
    entry.payload_offset = *offset + payload_rel;

    // Index update only after the log is durable
    for (size_t i = 0; i < evict; ++i) {
        q.total_bytes -= q.entries.front().size;
        q.live_record_bytes -= q.entries.front().record_bytes;
        logger_.debug("Queue " + name + ": evicted message " + q.entries.front().id);
        q.entries.pop_front();
    }
    q.evicted_total += evict;

    ++q.next_seq;
    q.total_bytes += entry.size;
    q.live_record_bytes += entry.record_bytes;
    ++q.enqueued_total;
    MessageId id = entry.id;
    q.entries.push_back(std::move(entry));

    if (evict > 0) maybe_compact(q);
    publish_stats(q);

    lock.unlock();
    q.available.notify_one();
    return id;
}

Result<std::optional<Message>> QueueServer::dequeue(const QueueName& name,
                                                    std::chrono::milliseconds timeout,
                                                    std::stop_token stop) {
    auto lookup = get_or_create(name, default_queue_config());
    if (!lookup) return lookup.error();
    auto& q = **lookup;

    std::unique_lock lock(q.mutex);
    if (stop.stop_requested()) return std::optional<Message>{};

    bool ready = q.available.wait_for(lock, stop, timeout, [&q] { return !q.entries.empty(); });
    if (!ready || stop.stop_requested()) {
        return std::optional<Message>{};
    }

    const auto& front = q.entries.front();

    auto payload = q.log->read_payload(front);
    if (!payload) {
        return Error::queue_operation_failed(name, "cannot read message " + front.id + ": "
                                             + payload.error().message);
    }

    Bytes record;
    RecordCodec::encode_remove(record, front.seq);
    if (auto appended = q.log->append(record); !appended) {
        return Error::queue_operation_failed(name, "append failed: "
                                             + appended.error().message);
    }

    Message message{
        .id = front.id,
        .queue = name,
        .content_type = front.content_type,
        .payload = std::move(*payload),
        .enqueued_at = front.enqueued_at,
    };

    q.total_bytes -= front.size;
    q.live_record_bytes -= front.record_bytes;
    q.entries.pop_front();
    ++q.dequeued_total;

    maybe_compact(q);
    publish_stats(q);

    // Another waiter may be able to proceed if more messages remain
    if (!q.entries.empty()) {
        lock.unlock();
        q.available.notify_one();
    }
    return std::optional<Message>{std::move(message)};
}

Result<void> QueueServer::purge(const QueueName& name) {
    if (auto valid = validate_queue_name(name); !valid) return valid.error();

    auto* q = find(name);
    if (q == nullptr) {
        return Error::queue_operation_failed(name, "no such queue");
    }

    std::lock_guard lock(q->mutex);

    Bytes record;
    RecordCodec::encode_purge(record);
    if (auto appended = q->log->append(record); !appended) {
        return Error::queue_operation_failed(name, "append failed: "
                                             + appended.error().message);
    }

    const auto removed = q->entries.size();
    q->entries.clear();
    q->total_bytes = 0;
    q->live_record_bytes = 0;
    q->enqueued_total = 0;
    q->dequeued_total = 0;
    q->evicted_total = 0;
    q->rejected_total = 0;

    if (auto compacted = q->log->compact(q->entries); !compacted) {
        logger_.warn("Queue " + name + ": compaction after purge failed: "
                     + compacted.error().message);
    }
    publish_stats(*q);

    logger_.info("Purged queue " + name + " (" + std::to_string(removed) + " messages)");
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Stats
// ─────────────────────────────────────────────

void QueueServer::publish_stats(QueueState& q) {
    std::lock_guard lock(q.stats_mutex);
    q.snapshot.name = q.name;
    q.snapshot.message_count = q.entries.size();
    q.snapshot.total_bytes = q.total_bytes;
    q.snapshot.config = q.config;
    q.snapshot.enqueued_total = q.enqueued_total;
    q.snapshot.dequeued_total = q.dequeued_total;
    q.snapshot.evicted_total = q.evicted_total;
    q.snapshot.rejected_total = q.rejected_total;
}

std::vector<QueueStats> QueueServer::get_stats() const {
    std::vector<QueueStats> out;
    {
        std::shared_lock lock(registry_mutex_);
        out.reserve(queues_.size());
        for (const auto& [name, q] : queues_) {
            std::lock_guard stats_lock(q->stats_mutex);
            out.push_back(q->snapshot);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const QueueStats& a, const QueueStats& b) { return a.name < b.name; });
    return out;
}

std::optional<QueueStats> QueueServer::stats(const QueueName& name) const {
    auto* q = find(name);
    if (q == nullptr) return std::nullopt;
    std::lock_guard lock(q->stats_mutex);
    return q->snapshot;
}

// ─────────────────────────────────────────────
// Compaction
// ─────────────────────────────────────────────

void QueueServer::maybe_compact(QueueState& q) {
    const uint64_t log_bytes = q.log->size_bytes();
    if (log_bytes < config_.compaction_min_bytes) return;

    const uint64_t live = q.live_record_bytes + RecordCodec::kFileHeaderSize;
    const uint64_t dead = log_bytes > live ? log_bytes - live : 0;
    if (dead <= live) return;

    if (auto compacted = q.log->compact(q.entries); !compacted) {
        logger_.warn("Queue " + q.name + ": compaction failed: " + compacted.error().message);
        return;
    }
    logger_.debug("Queue " + q.name + ": compacted log from " + std::to_string(log_bytes)
                  + " to " + std::to_string(q.log->size_bytes()) + " bytes");
}

}  // namespace cloudlet
