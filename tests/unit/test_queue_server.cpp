/**
 * @file test_queue_server.cpp
 * @brief Unit tests for QueueServer: ordering, quotas, durability, concurrency.
 */

#include "queue/queue_server.hpp"
#include "queue/record_codec.hpp"
#include "telemetry/json_sink.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <fstream>
#include <map>
#include <set>
#include <thread>

using namespace cloudlet;
using namespace std::chrono_literals;

class QueueServerTest : public cloudlet::testing::TempDirTest {
protected:
    Logger logger_{std::make_unique<NullSink>()};

    QueueServerConfig server_config() const {
        QueueServerConfig config;
        config.root = temp_dir_ / "queues";
        config.max_message_bytes = 4096;
        return config;
    }

    std::unique_ptr<QueueServer> open_server(QueueServerConfig config) {
        auto server = std::make_unique<QueueServer>(std::move(config), logger_);
        auto opened = server->open();
        EXPECT_TRUE(opened.has_value()) << (opened ? "" : opened.error().message);
        return server;
    }

    std::unique_ptr<QueueServer> open_server() { return open_server(server_config()); }

    static std::string pop_text(QueueServer& server, const QueueName& name) {
        auto message = server.dequeue(name, 0ms);
        if (!message || !message->has_value()) return {};
        return to_text((*message)->payload);
    }
};

TEST_F(QueueServerTest, FifoOrder) {
    auto server = open_server();
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(server->enqueue("orders", to_bytes("m" + std::to_string(i))).has_value());
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(pop_text(*server, "orders"), "m" + std::to_string(i));
    }
    EXPECT_EQ(pop_text(*server, "orders"), "");
}

TEST_F(QueueServerTest, DequeueReturnsMessageMetadata) {
    auto server = open_server();
    auto id = server->enqueue("orders", to_bytes("{}"), "application/json");
    ASSERT_TRUE(id.has_value());

    auto message = server->dequeue("orders", 100ms);
    ASSERT_TRUE(message.has_value());
    ASSERT_TRUE(message->has_value());
    EXPECT_EQ((*message)->id, *id);
    EXPECT_EQ((*message)->queue, "orders");
    EXPECT_EQ((*message)->content_type, "application/json");
}

TEST_F(QueueServerTest, DequeueTimesOutEmpty) {
    auto server = open_server();
    auto start = std::chrono::steady_clock::now();
    auto message = server->dequeue("empty", 50ms);
    ASSERT_TRUE(message.has_value());
    EXPECT_FALSE(message->has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST_F(QueueServerTest, DequeueCancelledByStopToken) {
    auto server = open_server();
    std::stop_source stop;
    std::thread canceller([&stop] {
        std::this_thread::sleep_for(30ms);
        stop.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto message = server->dequeue("empty", 10s, stop.get_token());
    canceller.join();

    ASSERT_TRUE(message.has_value());
    EXPECT_FALSE(message->has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(QueueServerTest, BlockedDequeueWakesOnEnqueue) {
    auto server = open_server();
    std::thread producer([&server] {
        std::this_thread::sleep_for(30ms);
        (void)server->enqueue("wake", to_bytes("hi"));
    });
    auto message = server->dequeue("wake", 5s);
    producer.join();
    ASSERT_TRUE(message.has_value());
    ASSERT_TRUE(message->has_value());
    EXPECT_EQ(to_text((*message)->payload), "hi");
}

TEST_F(QueueServerTest, MessageCeilingEnforced) {
    auto server = open_server();
    auto result = server->enqueue("orders", Bytes(4097, 'x'));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::QueueQuotaExceeded));
    EXPECT_EQ(result.error().max_bytes, 4096u);
}

TEST_F(QueueServerTest, OversizedContentTypeRejected) {
    auto server = open_server();
    auto result = server->enqueue("orders", to_bytes("x"),
                                  std::string(RecordCodec::kMaxFieldSize + 1, 't'));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::ValidationFailed));
    EXPECT_TRUE(result.error().field_errors.contains("content_type"));
    EXPECT_FALSE(server->stats("orders").has_value());

    ASSERT_TRUE(server->enqueue("orders", to_bytes("x"),
                                std::string(RecordCodec::kMaxFieldSize, 't')).has_value());
}

TEST_F(QueueServerTest, RejectPolicyLeavesQueueUnchanged) {
    auto server = open_server();
    ASSERT_TRUE(server->create_queue("bounded", {.max_bytes = 100, .max_messages = 0,
                                                 .overflow = OverflowPolicy::Reject}).has_value());
    ASSERT_TRUE(server->enqueue("bounded", Bytes(60, 'a')).has_value());

    auto rejected = server->enqueue("bounded", Bytes(60, 'b'));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_TRUE(rejected.error().is(ErrorKind::QueueQuotaExceeded));
    EXPECT_EQ(rejected.error().queue_name, "bounded");
    EXPECT_EQ(rejected.error().max_bytes, 100u);

    auto stats = server->stats("bounded");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->message_count, 1u);
    EXPECT_EQ(stats->total_bytes, 60u);
    EXPECT_EQ(stats->rejected_total, 1u);
}

TEST_F(QueueServerTest, CountQuotaRejects) {
    auto server = open_server();
    ASSERT_TRUE(server->create_queue("two", {.max_bytes = 0, .max_messages = 2,
                                             .overflow = OverflowPolicy::Reject}).has_value());
    EXPECT_TRUE(server->enqueue("two", to_bytes("1")).has_value());
    EXPECT_TRUE(server->enqueue("two", to_bytes("2")).has_value());
    EXPECT_FALSE(server->enqueue("two", to_bytes("3")).has_value());
}

TEST_F(QueueServerTest, DropOldestEvictsInFifoOrder) {
    auto server = open_server();
    ASSERT_TRUE(server->create_queue("ring", {.max_bytes = 0, .max_messages = 3,
                                              .overflow = OverflowPolicy::DropOldest}).has_value());
    for (int i = 1; i <= 5; ++i) {
        ASSERT_TRUE(server->enqueue("ring", to_bytes(std::to_string(i))).has_value());
    }

    auto stats = server->stats("ring");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->message_count, 3u);
    EXPECT_EQ(stats->evicted_total, 2u);
    EXPECT_EQ(pop_text(*server, "ring"), "3");
    EXPECT_EQ(pop_text(*server, "ring"), "4");
    EXPECT_EQ(pop_text(*server, "ring"), "5");
}

TEST_F(QueueServerTest, DropOldestRejectsMessageLargerThanQuota) {
    auto server = open_server();
    ASSERT_TRUE(server->create_queue("small", {.max_bytes = 10, .max_messages = 0,
                                               .overflow = OverflowPolicy::DropOldest}).has_value());
    ASSERT_TRUE(server->enqueue("small", Bytes(5, 'a')).has_value());

    auto result = server->enqueue("small", Bytes(11, 'b'));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::QueueQuotaExceeded));
    EXPECT_EQ(server->stats("small")->message_count, 1u);
}

TEST_F(QueueServerTest, QuotaBoundHoldsUnderDropOldest) {
    auto server = open_server();
    ASSERT_TRUE(server->create_queue("bytes", {.max_bytes = 1000, .max_messages = 0,
                                               .overflow = OverflowPolicy::DropOldest}).has_value());
    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(server->enqueue("bytes", Bytes(static_cast<size_t>(1 + i % 97), 'z')).has_value());
        auto stats = server->stats("bytes");
        ASSERT_TRUE(stats.has_value());
        ASSERT_LE(stats->total_bytes, 1000u);
    }
}

TEST_F(QueueServerTest, CreateQueueIdempotentButConflictsOnDifferentConfig) {
    auto server = open_server();
    QueueConfig config{.max_bytes = 10, .max_messages = 5, .overflow = OverflowPolicy::Reject};
    ASSERT_TRUE(server->create_queue("q", config).has_value());
    EXPECT_TRUE(server->create_queue("q", config).has_value());
    EXPECT_TRUE(server->ensure_queue("q").has_value());

    config.max_messages = 6;
    auto conflict = server->create_queue("q", config);
    ASSERT_FALSE(conflict.has_value());
    EXPECT_TRUE(conflict.error().is(ErrorKind::QueueOperationFailed));
}

TEST_F(QueueServerTest, InvalidQueueNameRejected) {
    auto server = open_server();
    auto result = server->enqueue("../etc", to_bytes("x"));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::ValidationFailed));
}

TEST_F(QueueServerTest, MessagesSurviveRestart) {
    {
        auto server = open_server();
        ASSERT_TRUE(server->create_queue("durable", {.max_bytes = 0, .max_messages = 10,
                                                     .overflow = OverflowPolicy::DropOldest})
                        .has_value());
        for (int i = 0; i < 5; ++i) {
            ASSERT_TRUE(server->enqueue("durable", to_bytes("p" + std::to_string(i))).has_value());
        }
        EXPECT_EQ(pop_text(*server, "durable"), "p0");
    }

    auto server = open_server();
    auto stats = server->stats("durable");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->message_count, 4u);
    EXPECT_EQ(stats->config.max_messages, 10u);
    EXPECT_EQ(stats->config.overflow, OverflowPolicy::DropOldest);
    for (int i = 1; i < 5; ++i) {
        EXPECT_EQ(pop_text(*server, "durable"), "p" + std::to_string(i));
    }
}

TEST_F(QueueServerTest, TornTailRecoveredOnRestart) {
    {
        auto server = open_server();
        ASSERT_TRUE(server->enqueue("torn", to_bytes("intact")).has_value());
    }
    {
        std::ofstream ofs(temp_dir_ / "queues" / "torn" / "messages.log",
                          std::ios::binary | std::ios::app);
        ofs.put('\x01');   // first byte of a record that never finished
    }

    auto server = open_server();
    EXPECT_EQ(server->stats("torn")->message_count, 1u);
    EXPECT_EQ(pop_text(*server, "torn"), "intact");
    ASSERT_TRUE(server->enqueue("torn", to_bytes("after")).has_value());
    EXPECT_EQ(pop_text(*server, "torn"), "after");
}

TEST_F(QueueServerTest, PurgeIsDurableAndResetsCounters) {
    {
        auto server = open_server();
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(server->enqueue("purged", to_bytes("x")).has_value());
        }
        ASSERT_TRUE(server->purge("purged").has_value());
        auto stats = server->stats("purged");
        EXPECT_EQ(stats->message_count, 0u);
        EXPECT_EQ(stats->total_bytes, 0u);
        EXPECT_EQ(stats->enqueued_total, 0u);
    }

    auto server = open_server();
    auto stats = server->stats("purged");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->message_count, 0u);
    EXPECT_EQ(pop_text(*server, "purged"), "");
}

TEST_F(QueueServerTest, PurgeUnknownQueueFails) {
    auto server = open_server();
    auto result = server->purge("missing");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::QueueOperationFailed));
}

TEST_F(QueueServerTest, StatsSortedByName) {
    auto server = open_server();
    ASSERT_TRUE(server->ensure_queue("charlie").has_value());
    ASSERT_TRUE(server->ensure_queue("alpha").has_value());
    ASSERT_TRUE(server->ensure_queue("bravo").has_value());

    auto stats = server->get_stats();
    ASSERT_EQ(stats.size(), 3u);
    EXPECT_EQ(stats[0].name, "alpha");
    EXPECT_EQ(stats[1].name, "bravo");
    EXPECT_EQ(stats[2].name, "charlie");
}

TEST_F(QueueServerTest, CompactionPreservesLiveMessages) {
    auto config = server_config();
    config.compaction_min_bytes = 1024;
    {
        auto server = open_server(config);
        for (int i = 0; i < 100; ++i) {
            ASSERT_TRUE(server->enqueue("compact", Bytes(64, static_cast<uint8_t>('a' + i % 26)))
                            .has_value());
        }
        for (int i = 0; i < 95; ++i) {
            ASSERT_FALSE(pop_text(*server, "compact").empty());
        }
        auto log_size = std::filesystem::file_size(temp_dir_ / "queues" / "compact" / "messages.log");
        EXPECT_LT(log_size, 100u * 64u);
    }

    auto server = open_server(config);
    ASSERT_EQ(server->stats("compact")->message_count, 5u);
    EXPECT_EQ(pop_text(*server, "compact"), std::string(64, static_cast<char>('a' + 95 % 26)));
}

TEST_F(QueueServerTest, ConcurrentProducersAndConsumersLoseNothing) {
    auto server = open_server();
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 100;

    std::atomic<int> consumed{0};
    std::mutex seen_mutex;
    std::set<std::string> seen;
    std::stop_source stop;

    std::vector<std::jthread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&] {
            while (!stop.stop_requested()) {
                auto message = server->dequeue("shared", 20ms, stop.get_token());
                if (!message || !message->has_value()) continue;
                std::lock_guard lock(seen_mutex);
                seen.insert(to_text((*message)->payload));
                consumed.fetch_add(1);
            }
        });
    }

    std::vector<std::jthread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&server, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                auto id = server->enqueue("shared",
                                          to_bytes(std::to_string(p) + ":" + std::to_string(i)));
                ASSERT_TRUE(id.has_value());
            }
        });
    }
    producers.clear();

    EXPECT_TRUE(cloudlet::testing::wait_until(
        [&] { return consumed.load() == kProducers * kPerProducer; }, 10s));
    stop.request_stop();
    consumers.clear();

    EXPECT_EQ(seen.size(), static_cast<size_t>(kProducers * kPerProducer));
    EXPECT_EQ(server->stats("shared")->message_count, 0u);
}

TEST_F(QueueServerTest, ConcurrentProducersKeepTheirOwnOrder) {
    auto server = open_server();
    constexpr int kProducers = 6;
    constexpr int kPerProducer = 150;

    std::vector<std::jthread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&server, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                auto id = server->enqueue("ordered",
                                          to_bytes(std::to_string(p) + ":" + std::to_string(i)));
                ASSERT_TRUE(id.has_value());
            }
        });
    }

    // Single consumer draining while the producers are still running
    std::map<int, int> last_seen;
    int consumed = 0;
    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (consumed < kProducers * kPerProducer && std::chrono::steady_clock::now() < deadline) {
        auto message = server->dequeue("ordered", 20ms);
        ASSERT_TRUE(message.has_value());
        if (!message->has_value()) continue;

        auto text = to_text((*message)->payload);
        auto colon = text.find(':');
        ASSERT_NE(colon, std::string::npos);
        int producer = std::stoi(text.substr(0, colon));
        int sequence = std::stoi(text.substr(colon + 1));

        auto [it, first] = last_seen.try_emplace(producer, sequence);
        if (first) {
            EXPECT_EQ(sequence, 0) << "producer " << producer;
        } else {
            EXPECT_EQ(sequence, it->second + 1) << "producer " << producer;
            it->second = sequence;
        }
        ++consumed;
    }
    producers.clear();

    EXPECT_EQ(consumed, kProducers * kPerProducer);
    ASSERT_EQ(last_seen.size(), static_cast<size_t>(kProducers));
    for (const auto& [producer, last] : last_seen) {
        EXPECT_EQ(last, kPerProducer - 1) << "producer " << producer;
    }
}

TEST_F(QueueServerTest, ConcurrentCreationYieldsOneQueue) {
    auto server = open_server();
    constexpr int kThreads = 8;

    std::vector<std::jthread> creators;
    for (int t = 0; t < kThreads; ++t) {
        creators.emplace_back([&server, t] {
            ASSERT_TRUE(server->ensure_queue("contended").has_value());
            ASSERT_TRUE(server->ensure_queue("own-" + std::to_string(t)).has_value());
            ASSERT_TRUE(server->enqueue("contended", to_bytes(std::to_string(t))).has_value());
        });
    }
    creators.clear();

    auto contended = server->stats("contended");
    ASSERT_TRUE(contended.has_value());
    EXPECT_EQ(contended->message_count, static_cast<uint64_t>(kThreads));
    EXPECT_EQ(server->get_stats().size(), static_cast<size_t>(kThreads + 1));

    // Every enqueue landed in the single surviving log
    server.reset();
    auto reopened = open_server();
    EXPECT_EQ(reopened->stats("contended")->message_count, static_cast<uint64_t>(kThreads));
}
