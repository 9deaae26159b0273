/**
 * @file test_observer_registry.cpp
 * @brief Unit tests for subscription ownership and the one-shot latch
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_sync/registry/observer_registry.h>

#include "support/fake_index.h"

#include <atomic>
#include <latch>
#include <thread>
#include <vector>

namespace kcenon::cloud_sync::test {

class ObserverRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        index_ = std::make_shared<fake_index>();
        index_->set_auto_gather(false);
        view_ = std::make_unique<metadata_index_view>(index_);
        registry_ = std::make_unique<observer_registry>();
    }

    void TearDown() override {
        registry_.reset();
        view_.reset();
    }

    auto subscribe() -> std::unique_ptr<index_subscription> {
        auto subscription = view_->subscribe(index_query::prefix(""), [](auto, const auto&) {});
        EXPECT_TRUE(subscription.has_value());
        return std::move(subscription.value());
    }

    std::shared_ptr<fake_index> index_;
    std::unique_ptr<metadata_index_view> view_;
    std::unique_ptr<observer_registry> registry_;
};

TEST_F(ObserverRegistryTest, RegisterAndRelease) {
    auto id = operation_id::next();
    auto token = registry_->register_observer(id, subscribe());

    EXPECT_EQ(registry_->active_count(), 1u);
    EXPECT_EQ(registry_->operation_for(token), id);
    EXPECT_EQ(index_->active(), 1u);

    registry_->release(token);

    EXPECT_EQ(registry_->active_count(), 0u);
    EXPECT_EQ(index_->active(), 0u);
    EXPECT_EQ(registry_->registered_count(), 1u);
    EXPECT_EQ(registry_->released_count(), 1u);
    EXPECT_FALSE(registry_->operation_for(token).has_value());
}

TEST_F(ObserverRegistryTest, ReleaseIsIdempotent) {
    auto token = registry_->register_observer(operation_id::next(), subscribe());

    registry_->release(token);
    registry_->release(token);
    registry_->release(9999);

    EXPECT_EQ(registry_->released_count(), 1u);
    EXPECT_EQ(index_->stopped(), 1u);
    EXPECT_EQ(index_->unknown_stops(), 0u);
}

TEST_F(ObserverRegistryTest, RebindStopsPreviousSubscription) {
    auto token = registry_->register_observer(operation_id::next(), nullptr);

    ASSERT_TRUE(registry_->rebind(token, subscribe()).has_value());
    EXPECT_EQ(index_->active(), 1u);
    ASSERT_TRUE(registry_->rebind(token, subscribe()).has_value());
    EXPECT_EQ(index_->active(), 1u);
    EXPECT_EQ(index_->stopped(), 1u);

    registry_->release(token);

    EXPECT_EQ(registry_->subscriptions_attached(), 2u);
    EXPECT_EQ(registry_->subscriptions_stopped(), 2u);
    EXPECT_EQ(index_->active(), 0u);
}

TEST_F(ObserverRegistryTest, RebindAfterClaimOrReleaseFails) {
    auto token = registry_->register_observer(operation_id::next(), nullptr);
    ASSERT_TRUE(registry_->try_claim(token));

    auto claimed = registry_->rebind(token, subscribe());
    ASSERT_FALSE(claimed.has_value());
    EXPECT_EQ(claimed.error().code, error_code::already_completed);

    registry_->release(token);
    auto released = registry_->rebind(token, subscribe());
    ASSERT_FALSE(released.has_value());
    EXPECT_EQ(released.error().code, error_code::transfer_not_found);

    // Rejected subscriptions are stopped, not leaked
    EXPECT_EQ(index_->active(), 0u);
    EXPECT_EQ(index_->started(), index_->stopped());
}

TEST_F(ObserverRegistryTest, ClaimIsOneShot) {
    auto token = registry_->register_observer(operation_id::next(), nullptr);

    EXPECT_FALSE(registry_->is_claimed(token));
    EXPECT_TRUE(registry_->try_claim(token));
    EXPECT_TRUE(registry_->is_claimed(token));
    EXPECT_FALSE(registry_->try_claim(token));
    EXPECT_FALSE(registry_->try_claim(4242));
}

TEST_F(ObserverRegistryTest, ConcurrentClaimHasSingleWinner) {
    constexpr int kThreads = 8;

    for (int round = 0; round < 50; ++round) {
        auto token = registry_->register_observer(operation_id::next(), nullptr);
        std::atomic<int> winners{0};
        std::latch start(kThreads);
        std::vector<std::thread> threads;

        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&] {
                start.arrive_and_wait();
                if (registry_->try_claim(token)) {
                    winners++;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        EXPECT_EQ(winners.load(), 1) << "round " << round;
        registry_->release(token);
    }
}

TEST_F(ObserverRegistryTest, DestructionReleasesEverything) {
    for (int i = 0; i < 5; ++i) {
        (void)registry_->register_observer(operation_id::next(), subscribe());
    }
    EXPECT_EQ(index_->active(), 5u);

    registry_.reset();

    EXPECT_EQ(index_->active(), 0u);
    EXPECT_EQ(index_->stopped(), 5u);
}

TEST_F(ObserverRegistryTest, RegisteredEqualsReleasedAfterReleaseAll) {
    for (int i = 0; i < 10; ++i) {
        (void)registry_->register_observer(operation_id::next(),
                                           i % 2 == 0 ? subscribe() : nullptr);
    }

    registry_->release_all();

    EXPECT_EQ(registry_->registered_count(), registry_->released_count());
    EXPECT_EQ(registry_->subscriptions_attached(), registry_->subscriptions_stopped());
    EXPECT_EQ(view_->active_subscriptions(), 0u);
}

}  // namespace kcenon::cloud_sync::test
