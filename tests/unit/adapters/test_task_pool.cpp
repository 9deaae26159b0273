/**
 * @file test_task_pool.cpp
 * @brief Unit tests for the worker pool adapter
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_sync/adapters/task_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::cloud_sync::adapters::test {

using namespace std::chrono_literals;

class BasicTaskPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<basic_task_pool>(2);
    }

    void TearDown() override {
        pool_.reset();
    }

    std::unique_ptr<basic_task_pool> pool_;
};

TEST_F(BasicTaskPoolTest, RunsSubmittedTasks) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool_->submit([&counter] { counter++; }));
    }
    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
        f.get();
    }

    EXPECT_EQ(counter.load(), 50);
    EXPECT_EQ(pool_->worker_count(), 2u);
    EXPECT_TRUE(pool_->is_running());
}

TEST_F(BasicTaskPoolTest, FutureCarriesException) {
    auto future = pool_->submit([] { throw std::runtime_error("boom"); });

    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the exception
    auto next = pool_->submit([] {});
    EXPECT_EQ(next.wait_for(2s), std::future_status::ready);
}

TEST_F(BasicTaskPoolTest, StageTracking) {
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto first = pool_->submit_to_stage([gate] { gate.wait(); }, pool_stage::coordinated_open);
    auto second = pool_->submit_to_stage([gate] { gate.wait(); }, pool_stage::coordinated_open);

    EXPECT_EQ(pool_->pending_tasks(pool_stage::coordinated_open), 2u);
    EXPECT_EQ(pool_->pending_tasks(pool_stage::retry), 0u);

    release.set_value();
    first.get();
    second.get();
    EXPECT_EQ(pool_->pending_tasks(pool_stage::coordinated_open), 0u);
}

TEST_F(BasicTaskPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        (void)pool_->submit([&counter] {
            std::this_thread::sleep_for(1ms);
            counter++;
        });
    }

    pool_->shutdown();

    EXPECT_EQ(counter.load(), 20);
    EXPECT_FALSE(pool_->is_running());
    auto rejected = pool_->submit([] {});
    EXPECT_THROW(rejected.get(), std::runtime_error);
}

TEST(TaskPoolFactoryTest, CreatesRunningPool) {
    auto pool = task_pool_factory::create(3, "test_pool");

    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->worker_count(), 3u);

    auto done = pool->submit([] {});
    EXPECT_EQ(done.wait_for(2s), std::future_status::ready);
    pool->shutdown();
}

TEST(TaskPoolFactoryTest, AutoDetectsWorkerCount) {
    basic_task_pool pool(0);

    EXPECT_GE(pool.worker_count(), 1u);
}

}  // namespace kcenon::cloud_sync::adapters::test
