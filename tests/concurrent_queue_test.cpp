#include <gtest/gtest.h>
#include "sluice/concurrent_queue.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sluice;

using IntQueue = ConcurrentQueue<int>;

// =============================================================================
// CONSTRUCTION
// =============================================================================

TEST(ConcurrentQueueTest, BoundedReportsCapacity) {
    auto q = IntQueue::bounded(8);
    EXPECT_EQ(q.flavor(), IntQueue::Flavor::BOUNDED);
    ASSERT_TRUE(q.capacity().has_value());
    EXPECT_EQ(*q.capacity(), 8u);
    EXPECT_TRUE(q.is_empty());
    EXPECT_FALSE(q.is_full());
    EXPECT_FALSE(q.is_closed());
}

TEST(ConcurrentQueueTest, UnboundedHasNoCapacity) {
    auto q = IntQueue::unbounded();
    EXPECT_EQ(q.flavor(), IntQueue::Flavor::UNBOUNDED);
    EXPECT_FALSE(q.capacity().has_value());
    EXPECT_FALSE(q.is_full());

    for (int i = 0; i < 500; ++i) {
        ASSERT_TRUE(q.push(i).is_ok());
    }
    EXPECT_FALSE(q.is_full());
    EXPECT_EQ(q.len(), 500u);
}

TEST(ConcurrentQueueTest, ZeroCapacityThrows) {
    EXPECT_THROW(IntQueue::bounded(0), std::invalid_argument);
    EXPECT_THROW((IntQueue(QueueConfig::bounded(0))), std::invalid_argument);
}

TEST(ConcurrentQueueTest, ZeroCapacityMessage) {
    try {
        IntQueue q(QueueConfig::bounded(0));
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "capacity must be positive");
    }
}

TEST(ConcurrentQueueTest, FromConfig) {
    IntQueue bounded(QueueConfig::bounded(3));
    EXPECT_EQ(bounded.capacity().value_or(0), 3u);

    IntQueue unbounded(QueueConfig::unbounded());
    EXPECT_EQ(unbounded.flavor(), IntQueue::Flavor::UNBOUNDED);
}

TEST(QueueConfigTest, Validate) {
    EXPECT_NO_THROW(QueueConfig::bounded(1).validate());
    EXPECT_NO_THROW(QueueConfig::unbounded().validate());
    EXPECT_THROW(QueueConfig::bounded(0).validate(), std::invalid_argument);

    EXPECT_TRUE(QueueConfig::bounded(4).is_bounded());
    EXPECT_FALSE(QueueConfig::unbounded().is_bounded());
}

// =============================================================================
// OPERATIONS THROUGH THE FACADE
// =============================================================================

TEST(ConcurrentQueueTest, CapacityOneHandshake) {
    auto q = IntQueue::bounded(1);

    EXPECT_TRUE(q.push(1).is_ok());

    auto full = q.push(2);
    EXPECT_TRUE(full.is_full());
    EXPECT_EQ(full.take_item().value_or(0), 2);

    EXPECT_EQ(q.pop().value(), 1);
    EXPECT_TRUE(q.push(2).is_ok());
    EXPECT_EQ(q.pop().value(), 2);
    EXPECT_TRUE(q.pop().is_empty());
}

TEST(ConcurrentQueueTest, ForcePushOnBothFlavors) {
    auto bounded = IntQueue::bounded(2);
    ASSERT_TRUE(bounded.push(1).is_ok());
    ASSERT_TRUE(bounded.push(2).is_ok());

    auto r = bounded.force_push(3);
    ASSERT_TRUE(r.has_displaced());
    EXPECT_EQ(r.take_item().value_or(0), 1);
    EXPECT_EQ(bounded.pop().value(), 2);
    EXPECT_EQ(bounded.pop().value(), 3);

    auto unbounded = IntQueue::unbounded();
    auto u = unbounded.force_push(1);
    EXPECT_TRUE(u.is_ok());
    EXPECT_FALSE(u.has_displaced());
}

TEST(ConcurrentQueueTest, CloseThenDrain) {
    auto check = [](IntQueue& q) {
        ASSERT_TRUE(q.push(1).is_ok());
        ASSERT_TRUE(q.push(2).is_ok());
        EXPECT_TRUE(q.close());
        EXPECT_FALSE(q.close());

        auto rejected = q.push(3);
        EXPECT_TRUE(rejected.is_closed());
        EXPECT_EQ(rejected.take_item().value_or(0), 3);

        EXPECT_EQ(q.pop().value(), 1);
        EXPECT_EQ(q.pop().value(), 2);
        EXPECT_TRUE(q.pop().is_closed());
    };

    auto bounded = IntQueue::bounded(4);
    check(bounded);
    auto unbounded = IntQueue::unbounded();
    check(unbounded);
}

TEST(ConcurrentQueueTest, MoveOnlyItems) {
    auto q = ConcurrentQueue<std::unique_ptr<int>>::bounded(1);
    ASSERT_TRUE(q.push(std::make_unique<int>(1)).is_ok());

    auto rejected = q.push(std::make_unique<int>(2));
    ASSERT_TRUE(rejected.is_full());
    auto back = rejected.take_item();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(**back, 2);

    auto r = q.pop();
    ASSERT_TRUE(r.is_ok());
    std::unique_ptr<int> owned = std::move(r).value();
    EXPECT_EQ(*owned, 1);
}

TEST(ConcurrentQueueTest, TryIterDrainsUntilEmpty) {
    auto q = IntQueue::unbounded();
    for (int i = 1; i <= 5; ++i) {
        ASSERT_TRUE(q.push(i).is_ok());
    }

    std::vector<int> out;
    for (int v : q.try_iter()) {
        out.push_back(v);
    }
    EXPECT_EQ(out, (std::vector<int>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(q.pop().is_empty());

    // An empty queue yields an empty range
    int iterations = 0;
    for (int v : q.try_iter()) {
        (void)v;
        ++iterations;
    }
    EXPECT_EQ(iterations, 0);
}

TEST(ConcurrentQueueTest, TryIterOnClosedQueue) {
    auto q = IntQueue::bounded(4);
    ASSERT_TRUE(q.push(10).is_ok());
    ASSERT_TRUE(q.push(20).is_ok());
    q.close();

    int sum = 0;
    for (int v : q.try_iter()) {
        sum += v;
    }
    EXPECT_EQ(sum, 30);
    EXPECT_TRUE(q.pop().is_closed());
}

// =============================================================================
// FORMATTING
// =============================================================================

TEST(ConcurrentQueueTest, StreamsSummary) {
    auto bounded = IntQueue::bounded(4);
    ASSERT_TRUE(bounded.push(1).is_ok());
    ASSERT_TRUE(bounded.push(2).is_ok());

    std::ostringstream os;
    os << bounded;
    EXPECT_EQ(os.str(), "ConcurrentQueue { len: 2, capacity: 4, is_closed: false }");

    auto unbounded = IntQueue::unbounded();
    unbounded.close();

    std::ostringstream os2;
    os2 << unbounded;
    EXPECT_EQ(os2.str(), "ConcurrentQueue { len: 0, capacity: unbounded, is_closed: true }");
}

TEST(ResultTest, StatusNames) {
    EXPECT_STREQ(to_string(PushStatus::OK), "Ok");
    EXPECT_STREQ(to_string(PushStatus::FULL), "Full");
    EXPECT_STREQ(to_string(PushStatus::CLOSED), "Closed");
    EXPECT_STREQ(to_string(PopStatus::OK), "Ok");
    EXPECT_STREQ(to_string(PopStatus::EMPTY), "Empty");
    EXPECT_STREQ(to_string(PopStatus::CLOSED), "Closed");
}

TEST(ResultTest, StreamsResults) {
    auto q = IntQueue::bounded(1);

    std::ostringstream os;
    os << q.push(1) << ' ' << q.push(2) << ' ' << q.force_push(3) << ' '
       << q.pop() << ' ' << q.pop();
    EXPECT_EQ(os.str(), "Ok Full Ok(displaced) Ok Empty");

    q.close();
    std::ostringstream os2;
    os2 << q.push(4) << ' ' << q.force_push(5) << ' ' << q.pop();
    EXPECT_EQ(os2.str(), "Closed Closed Closed");
}

TEST(ResultTest, PopValueOnEmptyThrows) {
    auto q = IntQueue::bounded(1);
    auto r = q.pop();
    EXPECT_TRUE(r.is_empty());
    EXPECT_FALSE(static_cast<bool>(r));
    EXPECT_THROW(r.value(), std::bad_optional_access);
    EXPECT_FALSE(r.take().has_value());
}

TEST(ResultTest, TakeLeavesResultEmpty) {
    auto q = IntQueue::bounded(1);
    ASSERT_TRUE(q.push(9).is_ok());

    auto r = q.pop();
    auto v = r.take();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 9);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.take().has_value());
}

// =============================================================================
// BACKOFF
// =============================================================================

TEST(BackoffTest, CompletesAfterYieldLimit) {
    Backoff backoff;
    int snoozes = 0;
    while (!backoff.is_completed()) {
        backoff.snooze();
        ++snoozes;
    }
    EXPECT_EQ(snoozes, static_cast<int>(YIELD_LIMIT) + 1);

    // Spinning past the limit keeps yielding rather than growing
    for (int i = 0; i < 100; ++i) {
        backoff.spin();
    }
    EXPECT_TRUE(backoff.is_completed());
}

// =============================================================================
// CONCURRENCY
// =============================================================================

TEST(ConcurrentQueueTest, ExactlyOneCloseWins) {
    for (auto make : {+[]() { return std::make_unique<IntQueue>(QueueConfig::bounded(8)); },
                      +[]() { return std::make_unique<IntQueue>(QueueConfig::unbounded()); }}) {
        for (int round = 0; round < 100; ++round) {
            auto q = make();
            std::atomic<bool> go{false};
            std::atomic<int> winners{0};

            std::vector<std::thread> threads;
            for (int t = 0; t < 8; ++t) {
                threads.emplace_back([&]() {
                    while (!go.load(std::memory_order_acquire)) {
                    }
                    if (q->close()) {
                        winners.fetch_add(1, std::memory_order_relaxed);
                    }
                });
            }
            go.store(true, std::memory_order_release);
            for (auto& t : threads) t.join();

            ASSERT_EQ(winners.load(), 1);
            EXPECT_TRUE(q->is_closed());
        }
    }
}

TEST(ConcurrentQueueTest, PushRacingClose) {
    // A push that returns OK is always drained before CLOSED; one that
    // returns CLOSED never shows up
    for (auto make : {+[]() { return std::make_unique<IntQueue>(QueueConfig::bounded(16)); },
                      +[]() { return std::make_unique<IntQueue>(QueueConfig::unbounded()); }}) {
        for (int round = 0; round < 1000; ++round) {
            auto q = make();
            ASSERT_TRUE(q->push(1).is_ok());
            ASSERT_TRUE(q->push(2).is_ok());

            std::atomic<bool> go{false};
            std::optional<bool> pushed;

            std::thread closer([&]() {
                while (!go.load(std::memory_order_acquire)) {
                }
                q->close();
            });
            std::thread pusher([&]() {
                while (!go.load(std::memory_order_acquire)) {
                }
                pushed = q->push(99).is_ok();
            });

            go.store(true, std::memory_order_release);
            closer.join();
            pusher.join();

            bool found = false;
            int popped = 0;
            while (true) {
                auto r = q->pop();
                if (r.is_closed()) break;
                ASSERT_TRUE(r.is_ok());
                if (r.value() == 99) found = true;
                ++popped;
            }

            ASSERT_TRUE(pushed.has_value());
            ASSERT_EQ(found, *pushed);
            ASSERT_EQ(popped, *pushed ? 3 : 2);
        }
    }
}

TEST(ConcurrentQueueTest, PerProducerOrderSeenByEachConsumer) {
    constexpr int PRODUCERS = 3;
    constexpr int CONSUMERS = 3;
    constexpr int PER_PRODUCER = 20'000;

    for (auto make : {+[]() { return std::make_unique<ConcurrentQueue<int>>(QueueConfig::bounded(32)); },
                      +[]() { return std::make_unique<ConcurrentQueue<int>>(QueueConfig::unbounded()); }}) {
        auto q = make();
        std::atomic<int> producers_done{0};
        std::atomic<int> total{0};
        std::atomic<int> order_violations{0};

        std::vector<std::thread> consumers;
        for (int c = 0; c < CONSUMERS; ++c) {
            consumers.emplace_back([&]() {
                std::vector<int> last(PRODUCERS, -1);
                while (true) {
                    auto r = q->pop();
                    if (r.is_closed()) break;
                    if (r.is_empty()) {
                        std::this_thread::yield();
                        continue;
                    }
                    const int item = r.value();
                    const int producer = item / PER_PRODUCER;
                    const int seq = item % PER_PRODUCER;
                    if (seq <= last[producer]) {
                        order_violations.fetch_add(1, std::memory_order_relaxed);
                    }
                    last[producer] = seq;
                    total.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }

        std::vector<std::thread> producers;
        for (int p = 0; p < PRODUCERS; ++p) {
            producers.emplace_back([&, p]() {
                for (int i = 0; i < PER_PRODUCER; ++i) {
                    auto r = q->push(p * PER_PRODUCER + i);
                    while (r.is_full()) {
                        std::this_thread::yield();
                        r = q->push(*r.take_item());
                    }
                    ASSERT_TRUE(r.is_ok());
                }
                if (producers_done.fetch_add(1) + 1 == PRODUCERS) {
                    q->close();
                }
            });
        }

        for (auto& t : producers) t.join();
        for (auto& t : consumers) t.join();

        EXPECT_EQ(total.load(), PRODUCERS * PER_PRODUCER);
        EXPECT_EQ(order_violations.load(), 0);
        EXPECT_TRUE(q->pop().is_closed());
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
