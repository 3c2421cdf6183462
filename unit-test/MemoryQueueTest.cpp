#include <atomic>
#include <thread>
#include "gtest/gtest.h"
#include "server/memory_queue.hpp"

using namespace std;
using namespace std::chrono_literals;
using namespace codejudge::server;

class MemoryQueueTest : public ::testing::Test {
};

TEST_F(MemoryQueueTest, FetchAndAck) {
    memory_queue mq;
    string id = mq.publish("{\"a\":1}");
    EXPECT_FALSE(id.empty());

    delivery item;
    ASSERT_TRUE(mq.fetch(item, 100ms));
    EXPECT_EQ(item.body, "{\"a\":1}");
    EXPECT_EQ(item.attempt, 1u);
    EXPECT_EQ(mq.size(), 0u);
    EXPECT_EQ(mq.in_flight(), 1u);

    mq.ack(item);
    EXPECT_EQ(mq.in_flight(), 0u);

    delivery none;
    EXPECT_FALSE(mq.fetch(none, 10ms));
}

TEST_F(MemoryQueueTest, ReleaseRedelivers) {
    memory_queue mq;
    mq.publish("x");

    delivery first;
    ASSERT_TRUE(mq.fetch(first, 100ms));
    mq.release(first, 0ms);

    delivery second;
    ASSERT_TRUE(mq.fetch(second, 100ms));
    EXPECT_EQ(second.body, "x");
    EXPECT_EQ(second.attempt, 2u);
    mq.ack(second);
}

TEST_F(MemoryQueueTest, ReleaseDelayHidesMessage) {
    memory_queue mq;
    mq.publish("x");

    delivery item;
    ASSERT_TRUE(mq.fetch(item, 100ms));
    mq.release(item, 300ms);

    delivery hidden;
    EXPECT_FALSE(mq.fetch(hidden, 50ms));
    EXPECT_EQ(mq.size(), 1u);

    delivery later;
    EXPECT_TRUE(mq.fetch(later, 2s));
    EXPECT_EQ(later.attempt, 2u);
}

TEST_F(MemoryQueueTest, VisibilityTimeoutRedelivers) {
    memory_queue mq(100ms);
    mq.publish("x");

    delivery lost;
    ASSERT_TRUE(mq.fetch(lost, 100ms));

    // 处理者没有确认消息，超时后重新可见
    delivery again;
    ASSERT_TRUE(mq.fetch(again, 2s));
    EXPECT_EQ(again.body, "x");
    EXPECT_EQ(again.attempt, 2u);

    // 过期的 receipt 无法确认消息
    mq.ack(lost);
    EXPECT_EQ(mq.in_flight(), 1u);
    mq.ack(again);
    EXPECT_EQ(mq.in_flight(), 0u);
    EXPECT_EQ(mq.size(), 0u);
}

TEST_F(MemoryQueueTest, DeadLetters) {
    memory_queue mq(30s, 2);
    mq.publish("poison");

    for (int i = 0; i < 2; ++i) {
        delivery item;
        ASSERT_TRUE(mq.fetch(item, 100ms));
        mq.release(item, 0ms);
    }

    delivery item;
    EXPECT_FALSE(mq.fetch(item, 50ms));
    auto dead = mq.dead_letters();
    ASSERT_EQ(dead.size(), 1u);
    EXPECT_EQ(dead[0], "poison");
}

TEST_F(MemoryQueueTest, FetchBatch) {
    memory_queue mq;
    for (int i = 0; i < 5; ++i)
        mq.publish(to_string(i));

    auto items = mq.fetch_batch(3, 100ms);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].body, "0");
    EXPECT_EQ(items[2].body, "2");

    auto rest = mq.fetch_batch(10, 100ms);
    EXPECT_EQ(rest.size(), 2u);

    EXPECT_TRUE(mq.fetch_batch(10, 10ms).empty());
}

TEST_F(MemoryQueueTest, BlockingFetchWakesUp) {
    memory_queue mq;
    thread producer([&mq] {
        this_thread::sleep_for(50ms);
        mq.publish("late");
    });

    delivery item;
    EXPECT_TRUE(mq.fetch(item, 5s));
    EXPECT_EQ(item.body, "late");
    producer.join();
}

TEST_F(MemoryQueueTest, EachMessageDeliveredToOneConsumer) {
    memory_queue mq;
    const int count = 200;
    for (int i = 0; i < count; ++i)
        mq.publish(to_string(i));

    atomic<int> received{0};
    vector<thread> consumers;
    for (int c = 0; c < 4; ++c) {
        consumers.emplace_back([&] {
            delivery item;
            while (mq.fetch(item, 50ms)) {
                ++received;
                mq.ack(item);
            }
        });
    }
    for (auto &consumer : consumers) consumer.join();
    EXPECT_EQ(received.load(), count);
    EXPECT_EQ(mq.in_flight(), 0u);
}
