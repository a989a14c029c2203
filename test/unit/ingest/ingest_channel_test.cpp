#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "logvec/core/error.h"
#include "logvec/ingest/ingest_channel.h"

using namespace logvec::ingest;
using namespace logvec::core;

namespace {

QueueItem Item(const std::string& text) {
    return QueueItem(text, 0, ItemKind::ORIGINAL);
}

} // namespace

TEST(IngestChannelTest, ZeroCapacityIsRejected) {
    EXPECT_THROW({ IngestChannel channel(0); }, InvalidArgumentError);
}

TEST(IngestChannelTest, FifoOrder) {
    IngestChannel channel(4);
    EXPECT_TRUE(channel.push(Item("a")));
    EXPECT_TRUE(channel.push(Item("b")));
    EXPECT_TRUE(channel.push(Item("c")));
    EXPECT_EQ(channel.size(), 3u);

    EXPECT_EQ(channel.pop(std::chrono::milliseconds(10))->text, "a");
    EXPECT_EQ(channel.pop(std::chrono::milliseconds(10))->text, "b");
    EXPECT_EQ(channel.pop(std::chrono::milliseconds(10))->text, "c");
    EXPECT_TRUE(channel.empty());
}

TEST(IngestChannelTest, PopTimesOutWhenEmpty) {
    IngestChannel channel(1);
    auto start = std::chrono::steady_clock::now();
    auto item = channel.pop(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_FALSE(item.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(40));
}

TEST(IngestChannelTest, TryPushFailsWhenFull) {
    IngestChannel channel(1);
    EXPECT_TRUE(channel.try_push(Item("a")));
    EXPECT_FALSE(channel.try_push(Item("b")));
    EXPECT_EQ(channel.stats().rejected, 1u);
}

TEST(IngestChannelTest, PushBlocksWhileFull) {
    IngestChannel channel(1);
    ASSERT_TRUE(channel.push(Item("first")));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        EXPECT_TRUE(channel.push(Item("second")));
        pushed.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(channel.size(), 1u);

    EXPECT_EQ(channel.pop(std::chrono::milliseconds(100))->text, "first");
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(channel.pop(std::chrono::milliseconds(100))->text, "second");
    EXPECT_EQ(channel.stats().producer_waits, 1u);
}

TEST(IngestChannelTest, CloseWakesBlockedProducer) {
    IngestChannel channel(1);
    ASSERT_TRUE(channel.push(Item("first")));

    std::atomic<bool> result{true};
    std::thread producer([&] { result.store(channel.push(Item("second"))); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_TRUE(channel.closed());
}

TEST(IngestChannelTest, ClosedChannelDrainsThenReturnsNothing) {
    IngestChannel channel(4);
    channel.push(Item("a"));
    channel.push(Item("b"));
    channel.close();

    EXPECT_FALSE(channel.push(Item("c")));
    EXPECT_EQ(channel.pop(std::chrono::milliseconds(10))->text, "a");
    EXPECT_EQ(channel.pop(std::chrono::milliseconds(10))->text, "b");

    // Closed and empty: returns immediately instead of waiting out the timeout.
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop(std::chrono::seconds(5)).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}

TEST(IngestChannelTest, ConcurrentProducersAndConsumer) {
    IngestChannel channel(8);
    const int kProducers = 4;
    const int kPerProducer = 250;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; p++) {
        producers.emplace_back([&channel, p] {
            for (int i = 0; i < kPerProducer; i++) {
                channel.push(Item(std::to_string(p) + ":" + std::to_string(i)));
            }
        });
    }

    int received = 0;
    std::thread consumer([&] {
        while (auto item = channel.pop(std::chrono::milliseconds(500))) {
            received++;
        }
    });

    for (auto& t : producers) {
        t.join();
    }
    channel.close();
    consumer.join();

    EXPECT_EQ(received, kProducers * kPerProducer);
    auto stats = channel.stats();
    EXPECT_EQ(stats.pushed, static_cast<uint64_t>(kProducers * kPerProducer));
    EXPECT_EQ(stats.popped, stats.pushed);
    EXPECT_LE(stats.size, stats.capacity);
}
