/**
 * @file queue_server.hpp
 * @brief Durable named FIFO queues with quota and overflow enforcement.
 *
 * Each queue lives in its own directory under the configured root:
 *   <root>/<name>/queue.toml    quota and overflow policy
 *   <root>/<name>/messages.log  write-ahead log (see record_codec.hpp)
 *
 * Mutations of one queue are serialized by that queue's mutex; different
 * queues never contend. The registry itself is guarded by a shared_mutex
 * and only held while looking a queue up or inserting a new one. Creating
 * a queue (directory, config file, log replay) runs under a separate
 * creation mutex so lookups of existing queues never wait on disk I/O.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "queue/message.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudlet {

class QueueServer {
public:
    QueueServer(QueueServerConfig config, Logger& logger);
    ~QueueServer();

    QueueServer(const QueueServer&) = delete;
    QueueServer& operator=(const QueueServer&) = delete;

    /**
     * @brief Create the root directory and recover every persisted queue.
     *
     * Must be called once before any other operation. Queues whose log cannot
     * be opened are skipped and logged; the rest stay available.
     */
    Result<void> open();

    /**
     * @brief Create a queue, or confirm an identical one exists.
     *
     * Fails with QueueOperationFailed when the name is taken by a queue with a
     * different configuration.
     */
    Result<void> create_queue(const QueueName& name, const QueueConfig& config);

    /// Create the queue with the default configuration unless it already exists.
    Result<void> ensure_queue(const QueueName& name);

    /**
     * @brief Admit a message. Durable before returning.
     *
     * Unknown queues are created with the default configuration.
     */
    Result<MessageId> enqueue(const QueueName& name,
                              Bytes payload,
                              std::string content_type = std::string{kDefaultContentType});

    /**
     * @brief Remove and return the oldest message.
     *
     * Waits up to @p timeout for a message. Timeout and cancellation both
     * yield an empty optional and leave the queue unchanged.
     */
    Result<std::optional<Message>> dequeue(const QueueName& name,
                                           std::chrono::milliseconds timeout,
                                           std::stop_token stop = {});

    /// Durably remove every message and reset the lifetime counters.
    Result<void> purge(const QueueName& name);

    /// Snapshot of every queue, sorted by name.
    [[nodiscard]] std::vector<QueueStats> get_stats() const;

    [[nodiscard]] std::optional<QueueStats> stats(const QueueName& name) const;

    [[nodiscard]] const QueueServerConfig& config() const noexcept { return config_; }

private:
    struct QueueState;

    [[nodiscard]] QueueConfig default_queue_config() const noexcept;

    QueueState* find(const QueueName& name) const;
    Result<QueueState*> get_or_create(const QueueName& name, const QueueConfig& config);
    Result<std::unique_ptr<QueueState>> load_queue(const std::filesystem::path& dir,
                                                   const QueueName& name,
                                                   const QueueConfig& config);
    Result<void> write_queue_config(const std::filesystem::path& dir,
                                    const QueueName& name,
                                    const QueueConfig& config);

    void publish_stats(QueueState& q);
    void maybe_compact(QueueState& q);

    QueueServerConfig config_;
    Logger& logger_;

    mutable std::shared_mutex registry_mutex_;
    std::mutex create_mutex_;           ///< Serializes get_or_create's slow path
    std::unordered_map<QueueName, std::unique_ptr<QueueState>> queues_;
};

}  // namespace cloudlet
