#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "shop/utils/thread_safe_queue.hpp"

using namespace shop::utils;

class ThreadSafeQueueTest : public ::testing::Test {
  protected:
    ThreadSafeQueue<int> queue_;
};

TEST_F(ThreadSafeQueueTest, SingleThreadedPushAndPop) {
    ASSERT_TRUE(queue_.empty());
    ASSERT_EQ(queue_.size(), 0u);

    ASSERT_TRUE(queue_.push(42));
    ASSERT_FALSE(queue_.empty());
    ASSERT_EQ(queue_.size(), 1u);

    auto value = queue_.wait_and_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
    ASSERT_TRUE(queue_.empty());
}

TEST_F(ThreadSafeQueueTest, TryPopBehavior) {
    auto result = queue_.try_pop();
    ASSERT_FALSE(result.has_value());

    queue_.push(100);
    result = queue_.try_pop();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 100);
    ASSERT_TRUE(queue_.empty());
}

TEST_F(ThreadSafeQueueTest, CloseRejectsPushButDrainsRemaining) {
    queue_.push(1);
    queue_.push(2);
    queue_.close();

    EXPECT_TRUE(queue_.closed());
    EXPECT_FALSE(queue_.push(3));

    EXPECT_EQ(queue_.wait_and_pop(), 1);
    EXPECT_EQ(queue_.wait_and_pop(), 2);
    EXPECT_FALSE(queue_.wait_and_pop().has_value());
}

TEST_F(ThreadSafeQueueTest, CloseWakesBlockedConsumer) {
    std::atomic<bool> returned_empty{false};
    std::thread consumer([this, &returned_empty]() {
        returned_empty = !queue_.wait_and_pop().has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue_.close();
    consumer.join();

    EXPECT_TRUE(returned_empty.load());
}

TEST_F(ThreadSafeQueueTest, SingleProducerSingleConsumer) {
    std::vector<int> consumed_items;
    const int num_items = 100;

    std::thread producer([this]() {
        for (int i = 0; i < num_items; ++i) {
            queue_.push(i);
        }
        queue_.close();
    });

    std::thread consumer([this, &consumed_items]() {
        while (auto item = queue_.wait_and_pop()) {
            consumed_items.push_back(*item);
        }
    });

    producer.join();
    consumer.join();

    ASSERT_EQ(consumed_items.size(), static_cast<std::size_t>(num_items));
    for (int i = 0; i < num_items; ++i) {
        EXPECT_EQ(consumed_items[i], i);
    }
}

TEST_F(ThreadSafeQueueTest, MultiProducerMultiConsumer) {
    const int num_producers = 5;
    const int num_consumers = 5;
    const int items_per_producer = 100;
    std::atomic<int> produced_sum{0};
    std::atomic<int> consumed_sum{0};
    std::atomic<int> consumed_count{0};

    std::vector<std::thread> producers;
    for (int i = 0; i < num_producers; ++i) {
        producers.emplace_back([this, &produced_sum, i]() {
            for (int j = 0; j < items_per_producer; ++j) {
                int value = i * items_per_producer + j;
                queue_.push(value);
                produced_sum += value;
            }
        });
    }

    std::vector<std::thread> consumers;
    for (int i = 0; i < num_consumers; ++i) {
        consumers.emplace_back([this, &consumed_sum, &consumed_count]() {
            while (auto item = queue_.wait_and_pop()) {
                consumed_sum += *item;
                consumed_count++;
            }
        });
    }

    for (auto& p : producers) {
        p.join();
    }
    queue_.close();
    for (auto& c : consumers) {
        c.join();
    }

    EXPECT_EQ(consumed_count.load(), num_producers * items_per_producer);
    EXPECT_EQ(produced_sum.load(), consumed_sum.load());
    ASSERT_TRUE(queue_.empty());
}

TEST(ThreadSafeQueueMoveTest, MoveOnlyValues) {
    ThreadSafeQueue<std::unique_ptr<std::string>> queue;
    queue.push(std::make_unique<std::string>("log line"));

    auto item = queue.try_pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(**item, "log line");
}
