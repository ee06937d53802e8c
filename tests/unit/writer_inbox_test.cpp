/**
 * writer_inbox_test.cpp - WriterInbox unit tests
 *
 * Tests:
 * 1. FIFO order
 * 2. Non-blocking and timed pop
 * 3. Close semantics (rejects pushes, drains queued tasks, wakes consumer)
 * 4. Many producers, one consumer
 */

#include "fleet/writer_inbox.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace lightfleet::fleet;
using namespace std::chrono_literals;

TEST(WriterInboxTest, RunsTasksInPushOrder) {
    WriterInbox inbox("test");
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(inbox.push([&order, i] { order.push_back(i); }));
    }
    EXPECT_EQ(inbox.size(), 5u);

    while (auto task = inbox.pop()) {
        (*task)();
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_TRUE(inbox.empty());
    EXPECT_EQ(inbox.name(), "test");
}

TEST(WriterInboxTest, PopOnEmptyReturnsImmediately) {
    WriterInbox inbox;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(inbox.pop().has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(WriterInboxTest, TimedPopWaitsForTask) {
    WriterInbox inbox;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        inbox.push([] {});
    });

    auto task = inbox.pop(2000);
    EXPECT_TRUE(task.has_value());
    producer.join();
}

TEST(WriterInboxTest, TimedPopTimesOut) {
    WriterInbox inbox;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(inbox.pop(30).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(WriterInboxTest, CloseRejectsPushButDrainsQueue) {
    WriterInbox inbox;
    int ran = 0;
    inbox.push([&] { ++ran; });
    inbox.close();

    EXPECT_TRUE(inbox.is_closed());
    EXPECT_FALSE(inbox.push([&] { ++ran; }));

    auto task = inbox.pop(100);
    ASSERT_TRUE(task.has_value());
    (*task)();
    EXPECT_EQ(ran, 1);
    EXPECT_FALSE(inbox.pop(100).has_value());
}

TEST(WriterInboxTest, CloseWakesBlockedConsumer) {
    WriterInbox inbox;
    std::atomic<bool> returned{false};
    std::thread consumer([&] {
        inbox.pop(5000);
        returned = true;
    });

    std::this_thread::sleep_for(20ms);
    inbox.close();
    consumer.join();
    EXPECT_TRUE(returned);
}

TEST(WriterInboxTest, ManyProducersOneConsumer) {
    WriterInbox inbox;
    constexpr int kProducers = 4;
    constexpr int kTasksEach = 250;
    int executed = 0;  // touched only by the consumer

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&] {
            for (int i = 0; i < kTasksEach; ++i) {
                inbox.push([&executed] { ++executed; });
            }
        });
    }

    int popped = 0;
    while (popped < kProducers * kTasksEach) {
        if (auto task = inbox.pop(100)) {
            (*task)();
            ++popped;
        }
    }
    for (auto &t : producers) {
        t.join();
    }
    EXPECT_EQ(executed, kProducers * kTasksEach);
    EXPECT_TRUE(inbox.empty());
}
