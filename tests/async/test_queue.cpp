#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "mediascan/async/queue.hpp"

namespace mediascan::async::test {

using namespace std::chrono_literals;

class ThreadSafeQueueTest : public ::testing::Test {
protected:
    ThreadSafeQueue<int> queue{3};
};

TEST_F(ThreadSafeQueueTest, PutAndTakeKeepOrder) {
    EXPECT_TRUE(queue.put(1));
    EXPECT_TRUE(queue.put(2));
    EXPECT_TRUE(queue.put(3));

    EXPECT_EQ(queue.take(), 1);
    EXPECT_EQ(queue.take(), 2);
    EXPECT_EQ(queue.take(), 3);
    EXPECT_TRUE(queue.destroy().empty());
}

TEST_F(ThreadSafeQueueTest, PutBlocksUntilSpaceIsFree) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue.put(i));
    }
    std::atomic<bool> stored{false};
    std::thread producer([&] {
        stored = queue.put(42);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(stored.load());

    EXPECT_EQ(queue.take(), 0);
    producer.join();
    EXPECT_TRUE(stored.load());
    EXPECT_EQ(queue.destroy().size(), 3);
}

TEST_F(ThreadSafeQueueTest, CloseDrainsRemainingElements) {
    queue.put(1);
    queue.put(2);
    queue.close();

    EXPECT_FALSE(queue.put(3));
    EXPECT_EQ(queue.take(), 1);
    EXPECT_EQ(queue.take(), 2);
    EXPECT_FALSE(queue.take().has_value());
}

TEST_F(ThreadSafeQueueTest, DestroyReturnsPendingElements) {
    queue.put(1);
    queue.put(2);

    auto rest = queue.destroy();
    EXPECT_EQ(rest.size(), 2);
    EXPECT_FALSE(queue.take().has_value());
    EXPECT_FALSE(queue.put(3));
}

TEST_F(ThreadSafeQueueTest, DestroyWakesBlockedConsumer) {
    std::optional<int> result{7};
    std::thread consumer([&] { result = queue.take(); });

    std::this_thread::sleep_for(50ms);
    static_cast<void>(queue.destroy());
    consumer.join();
    EXPECT_FALSE(result.has_value());
}

TEST_F(ThreadSafeQueueTest, DestroyWakesBlockedProducer) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue.put(i));
    }
    std::atomic<bool> stored{true};
    std::thread producer([&] { stored = queue.put(99); });

    std::this_thread::sleep_for(50ms);
    static_cast<void>(queue.destroy());
    producer.join();
    EXPECT_FALSE(stored.load());
}

TEST(ThreadSafeQueueMoveOnlyTest, HoldsMoveOnlyValues) {
    ThreadSafeQueue<std::unique_ptr<std::string>> queue(2);
    queue.put(std::make_unique<std::string>("sdb1"));
    auto value = queue.take();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(**value, "sdb1");
}

TEST(ThreadSafeQueueConcurrencyTest, ManyProducersOneConsumer) {
    ThreadSafeQueue<int> queue(4);
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 100;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue] {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.put(1);
            }
        });
    }

    int total = 0;
    for (int i = 0; i < kProducers * kPerProducer; ++i) {
        total += queue.take().value_or(0);
    }
    for (auto& producer : producers) {
        producer.join();
    }
    EXPECT_EQ(total, kProducers * kPerProducer);
}

}  // namespace mediascan::async::test
