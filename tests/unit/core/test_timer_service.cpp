/**
 * @file test_timer_service.cpp
 * @brief Unit tests for the shared deadline timer
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_sync/core/timer_service.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::cloud_sync::test {

using namespace std::chrono_literals;

class TimerServiceTest : public ::testing::Test {
protected:
    timer_service timers_;
};

TEST_F(TimerServiceTest, FiresAfterDelay) {
    std::promise<std::chrono::steady_clock::time_point> fired;
    auto start = std::chrono::steady_clock::now();

    auto id = timers_.schedule(30ms, [&] { fired.set_value(std::chrono::steady_clock::now()); });
    EXPECT_NE(id, 0u);

    auto future = fired.get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_GE(future.get() - start, 30ms);
}

TEST_F(TimerServiceTest, FiresInDeadlineOrder) {
    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> last;

    timers_.schedule(60ms, [&] {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(3);
        last.set_value();
    });
    timers_.schedule(20ms, [&] {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(1);
    });
    timers_.schedule(40ms, [&] {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(2);
    });

    ASSERT_EQ(last.get_future().wait_for(2s), std::future_status::ready);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(TimerServiceTest, CancelPreventsCallback) {
    std::atomic<bool> fired{false};

    auto id = timers_.schedule(50ms, [&] { fired = true; });
    EXPECT_EQ(timers_.pending(), 1u);
    EXPECT_TRUE(timers_.cancel(id));
    EXPECT_EQ(timers_.pending(), 0u);

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(fired.load());
    EXPECT_FALSE(timers_.cancel(id));
    EXPECT_FALSE(timers_.cancel(0));
}

TEST_F(TimerServiceTest, CancelWaitsForRunningCallback) {
    std::promise<void> entered;
    std::atomic<bool> finished{false};

    auto id = timers_.schedule(0ms, [&] {
        entered.set_value();
        std::this_thread::sleep_for(50ms);
        finished = true;
    });

    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(timers_.cancel(id));
    EXPECT_TRUE(finished.load());
}

TEST_F(TimerServiceTest, CallbackMayScheduleAndCancel) {
    std::promise<void> nested;
    std::atomic<bool> cancelled_fired{false};

    timers_.schedule(0ms, [&] {
        EXPECT_TRUE(timers_.is_timer_thread());
        auto doomed = timers_.schedule(10ms, [&] { cancelled_fired = true; });
        EXPECT_TRUE(timers_.cancel(doomed));
        timers_.schedule(10ms, [&] { nested.set_value(); });
    });

    ASSERT_EQ(nested.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(cancelled_fired.load());
    EXPECT_FALSE(timers_.is_timer_thread());
}

TEST_F(TimerServiceTest, DiscardDoesNotWait) {
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();

    auto id = timers_.schedule(0ms, [&entered, release_future] {
        entered.set_value();
        release_future.wait();
    });

    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(timers_.discard(id));
    release.set_value();
}

TEST_F(TimerServiceTest, ScheduleAfterShutdownIsRejected) {
    std::atomic<bool> fired{false};
    timers_.schedule(20ms, [&] { fired = true; });

    timers_.shutdown();

    EXPECT_EQ(timers_.schedule(0ms, [&] { fired = true; }), 0u);
    EXPECT_EQ(timers_.pending(), 0u);
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(fired.load());
}

}  // namespace kcenon::cloud_sync::test
