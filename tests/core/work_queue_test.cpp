#include "mpu/core/cancellation.hpp"
#include "mpu/core/work_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using mpu::CancellationToken;
using mpu::WorkQueue;
using namespace std::chrono_literals;

TEST(WorkQueueTest, DrainsInFifoOrderThenReportsClosed) {
    WorkQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);
    queue.close();
    queue.push(4);

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.pop(), std::optional<int>(1));
    EXPECT_EQ(queue.pop(), std::optional<int>(2));
    EXPECT_EQ(queue.pop(), std::optional<int>(3));
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(WorkQueueTest, DiscardStopsDispatch) {
    WorkQueue<int> queue;
    for (int i = 0; i < 10; ++i) {
        queue.push(i);
    }

    EXPECT_EQ(queue.pop(), std::optional<int>(0));
    EXPECT_EQ(queue.discard(), 9u);
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(WorkQueueTest, EveryItemIsConsumedExactlyOnce) {
    WorkQueue<int> queue;
    for (int i = 1; i <= 1000; ++i) {
        queue.push(i);
    }
    queue.close();

    std::atomic<long> sum{0};
    std::atomic<int> count{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&]() {
            while (auto item = queue.pop()) {
                sum += *item;
                count++;
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(count.load(), 1000);
    EXPECT_EQ(sum.load(), 500500);
}

TEST(WorkQueueTest, CloseWakesBlockedConsumer) {
    WorkQueue<int> queue;
    std::thread consumer([&]() { EXPECT_EQ(queue.pop(), std::nullopt); });

    std::this_thread::sleep_for(20ms);
    queue.close();
    consumer.join();
}

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.is_cancelled());

    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());
    EXPECT_TRUE(copy.wait_for(10s));
}

TEST(CancellationTokenTest, WaitReturnsEarlyOnCancel) {
    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();

    CancellationToken idle;
    EXPECT_FALSE(idle.wait_for(1ms));
}
