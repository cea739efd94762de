#include <gtest/gtest.h>
#include <duet/core/event.hpp>
#include <future>
#include <thread>
#include <atomic>
#include <stdexcept>

namespace duet::core::test {

class EventTest : public ::testing::Test {
protected:
    EventLoop loop_;
};

// Task yang di-post dijalankan oleh processAll
TEST_F(EventTest, PostAndProcess) {
    int counter = 0;
    loop_.post([&]() { counter++; });
    loop_.post([&]() { counter++; });

    EXPECT_EQ(loop_.queueSize(), 2);
    loop_.processAll();

    EXPECT_EQ(counter, 2);
    EXPECT_EQ(loop_.queueSize(), 0);
    EXPECT_FALSE(loop_.processOne());
}

// Test event ordering
TEST_F(EventTest, TaskOrdering) {
    std::vector<int> sequence;
    for (int i = 0; i < 10; ++i) {
        loop_.post([&sequence, i]() { sequence.push_back(i); });
    }

    loop_.processAll();

    ASSERT_EQ(sequence.size(), 10);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(sequence[i], i);
    }
}

// Task yang di-post dari dalam task ikut diproses
TEST_F(EventTest, NestedPost) {
    std::vector<std::string> sequence;
    loop_.post([&]() {
        sequence.push_back("outer");
        loop_.post([&]() { sequence.push_back("inner"); });
    });

    loop_.processAll();

    ASSERT_EQ(sequence.size(), 2);
    EXPECT_EQ(sequence[1], "inner");
}

// Exception dari task dicatat, tidak merusak loop
TEST_F(EventTest, ThrowingTask) {
    int counter = 0;
    loop_.post([]() { throw std::runtime_error("boom"); });
    loop_.post([&]() { counter++; });

    EXPECT_NO_THROW(loop_.processAll());
    EXPECT_EQ(counter, 1);
}

TEST_F(EventTest, RunUntilStop) {
    std::promise<std::thread::id> started;
    auto started_future = started.get_future();

    std::thread runner([this]() { loop_.run(); });

    loop_.post([&]() { started.set_value(std::this_thread::get_id()); });
    auto loop_thread = started_future.get();
    EXPECT_NE(loop_thread, std::this_thread::get_id());
    EXPECT_TRUE(loop_.isRunning());

    loop_.stop();
    runner.join();
    EXPECT_FALSE(loop_.isRunning());
}

// Post dari banyak thread
TEST_F(EventTest, CrossThreadPost) {
    constexpr int numThreads = 4;
    constexpr int tasksPerThread = 50;
    std::atomic<int> counter{0};

    std::thread runner([this]() { loop_.run(); });

    std::vector<std::thread> producers;
    for (int i = 0; i < numThreads; ++i) {
        producers.emplace_back([&]() {
            for (int j = 0; j < tasksPerThread; ++j) {
                loop_.post([&]() { counter++; });
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    std::promise<void> drained;
    loop_.post([&]() { drained.set_value(); });
    drained.get_future().wait();

    loop_.stop();
    runner.join();
    EXPECT_EQ(counter, numThreads * tasksPerThread);
}

TEST_F(EventTest, RunAfter) {
    auto begin = std::chrono::steady_clock::now();
    bool fired = false;

    loop_.post([&]() {
        loop_.runAfter(std::chrono::milliseconds(20), [&]() {
            fired = true;
            loop_.stop();
        });
    });
    loop_.run();

    EXPECT_TRUE(fired);
    EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(15));
}

TEST_F(EventTest, TimersFireInDelayOrder) {
    std::vector<int> sequence;

    loop_.post([&]() {
        loop_.runAfter(std::chrono::milliseconds(30), [&]() {
            sequence.push_back(2);
            loop_.stop();
        });
        loop_.runAfter(std::chrono::milliseconds(5), [&]() { sequence.push_back(1); });
    });
    loop_.run();

    ASSERT_EQ(sequence.size(), 2);
    EXPECT_EQ(sequence[0], 1);
    EXPECT_EQ(sequence[1], 2);
}

TEST_F(EventTest, PendingTimerReleasedOnDestruction) {
    auto loop = std::make_unique<EventLoop>();
    bool fired = false;
    loop->runAfter(std::chrono::hours(1), [&]() { fired = true; });

    EXPECT_NO_THROW(loop.reset());
    EXPECT_FALSE(fired);
}

} // namespace duet::core::test
