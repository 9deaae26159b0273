/**
 * @file test_metadata_index_view.cpp
 * @brief Unit tests for the parsed index view and its subscriptions
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_sync/index/metadata_index_view.h>

#include "support/fake_index.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace kcenon::cloud_sync::test {

using namespace std::chrono_literals;

class MetadataIndexViewTest : public ::testing::Test {
protected:
    void SetUp() override {
        index_ = std::make_shared<fake_index>();
        view_ = std::make_unique<metadata_index_view>(index_);
    }

    std::shared_ptr<fake_index> index_;
    std::unique_ptr<metadata_index_view> view_;
};

// =============================================================================
// snapshot Tests
// =============================================================================

TEST_F(MetadataIndexViewTest, SnapshotParsesAndSeparatesInvalidRecords) {
    index_->set_item(make_item("Docs/a.txt", download_status::current));
    index_->set_record(metadata_record{{record_key::size_bytes, int64_t{3}}});
    index_->set_item(make_item("Docs/b.txt", download_status::not_downloaded));
    index_->set_item(make_item("Other/c.txt", download_status::current));

    auto snapshot = view_->snapshot(index_query::prefix("Docs"));

    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot.value().items.size(), 2u);
    EXPECT_EQ(snapshot.value().items[0].path, "Docs/a.txt");
    EXPECT_EQ(snapshot.value().items[1].path, "Docs/b.txt");
    ASSERT_EQ(snapshot.value().invalid_entries.size(), 1u);
    EXPECT_EQ(snapshot.value().invalid_entries[0].index, 1u);
}

TEST(IndexQueryTest, PrefixMatchesWholeComponents) {
    auto query = index_query::prefix("Docs");

    EXPECT_TRUE(query.matches("Docs"));
    EXPECT_TRUE(query.matches("Docs/a.txt"));
    EXPECT_FALSE(query.matches("Docsx/a.txt"));
    EXPECT_TRUE(index_query::prefix("").matches("anything/at/all"));
    EXPECT_FALSE(index_query::exact("Docs").matches("Docs/a.txt"));
}

// =============================================================================
// subscribe Tests
// =============================================================================

TEST_F(MetadataIndexViewTest, SubscriptionDeliversGatheringThenUpdates) {
    index_->set_item(make_item("a.txt", download_status::not_downloaded));
    std::promise<void> gathered;
    std::atomic<int> updates{0};
    std::atomic<bool> first_was_gathering{false};
    std::atomic<int> events{0};

    auto subscription = view_->subscribe(
        index_query::exact("a.txt"),
        [&](index_event event, const index_snapshot& snapshot) {
            if (events.fetch_add(1) == 0) {
                first_was_gathering = (event == index_event::gathering_complete);
                EXPECT_EQ(snapshot.items.size(), 1u);
                gathered.set_value();
            } else if (event == index_event::update) {
                updates++;
            }
        });
    ASSERT_TRUE(subscription.has_value());
    ASSERT_EQ(gathered.get_future().wait_for(2s), std::future_status::ready);

    index_->emit(index_event::update);
    index_->emit(index_event::update);

    EXPECT_TRUE(first_was_gathering.load());
    EXPECT_EQ(updates.load(), 2);
    EXPECT_EQ(subscription.value()->delivered_count(), 3u);
    EXPECT_EQ(view_->active_subscriptions(), 1u);
}

TEST_F(MetadataIndexViewTest, StopIsIdempotentAndStopsQueryOnce) {
    index_->set_auto_gather(false);

    auto subscription = view_->subscribe(index_query::prefix(""), [](auto, const auto&) {});
    ASSERT_TRUE(subscription.has_value());
    EXPECT_TRUE(subscription.value()->is_active());

    subscription.value()->stop();
    subscription.value()->stop();
    subscription.value().reset();

    EXPECT_EQ(index_->started(), 1u);
    EXPECT_EQ(index_->stopped(), 1u);
    EXPECT_EQ(index_->unknown_stops(), 0u);
    EXPECT_EQ(view_->active_subscriptions(), 0u);
}

TEST_F(MetadataIndexViewTest, DestructorStopsQuery) {
    index_->set_auto_gather(false);
    {
        auto subscription = view_->subscribe(index_query::prefix(""), [](auto, const auto&) {});
        ASSERT_TRUE(subscription.has_value());
        EXPECT_EQ(index_->active(), 1u);
    }

    EXPECT_EQ(index_->active(), 0u);
    EXPECT_EQ(index_->stopped(), 1u);
}

TEST_F(MetadataIndexViewTest, LateNotificationsAreDropped) {
    index_->set_auto_gather(false);
    std::atomic<int> calls{0};

    auto subscription = view_->subscribe(index_query::prefix(""),
                                         [&](auto, const auto&) { calls++; });
    ASSERT_TRUE(subscription.has_value());
    index_->emit(index_event::update);
    subscription.value()->stop();

    EXPECT_EQ(index_->emit_late(index_event::update), 1u);
    EXPECT_EQ(calls.load(), 1);

    // Late delivery after the subscription object is gone
    subscription.value().reset();
    EXPECT_EQ(index_->emit_late(index_event::gathering_complete), 1u);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(MetadataIndexViewTest, ListenerMayStopItsOwnSubscription) {
    std::promise<void> stopped;
    std::unique_ptr<index_subscription> holder;
    std::mutex mutex;

    {
        std::lock_guard<std::mutex> lock(mutex);
        auto subscription = view_->subscribe(
            index_query::prefix(""), [&](auto, const auto&) {
                std::lock_guard<std::mutex> inner(mutex);
                holder->stop();
                stopped.set_value();
            });
        ASSERT_TRUE(subscription.has_value());
        holder = std::move(subscription.value());
    }

    ASSERT_EQ(stopped.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(holder->is_active());
    EXPECT_EQ(index_->stopped(), 1u);
}

TEST_F(MetadataIndexViewTest, StartFailureIsPropagated) {
    index_->fail_next_queries(error{error_code::container_unavailable, "offline"});

    auto subscription = view_->subscribe(index_query::prefix(""), [](auto, const auto&) {});

    ASSERT_FALSE(subscription.has_value());
    EXPECT_EQ(subscription.error().code, error_code::container_unavailable);
    EXPECT_EQ(view_->active_subscriptions(), 0u);
}

// =============================================================================
// lookup Tests
// =============================================================================

TEST_F(MetadataIndexViewTest, LookupFindsItem) {
    index_->set_item(make_item("Docs/a.txt", download_status::current));

    auto found = view_->lookup("Docs/a.txt", 2000ms, 1000ms);

    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_TRUE(found.value()->is_current());
    EXPECT_EQ(index_->active(), 0u);
}

TEST_F(MetadataIndexViewTest, LookupOfUnknownItemIsEmpty) {
    auto found = view_->lookup("missing.txt", 2000ms, 1000ms);

    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found.value().has_value());
    EXPECT_EQ(index_->stopped(), 1u);
}

TEST_F(MetadataIndexViewTest, LookupTimesOutWithoutGathering) {
    index_->set_auto_gather(false);
    index_->set_item(make_item("a.txt", download_status::current));

    auto start = std::chrono::steady_clock::now();
    auto found = view_->lookup("a.txt", 100ms, 50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().code, error_code::timeout);
    EXPECT_GE(elapsed, 100ms);
    EXPECT_EQ(index_->started(), 1u);
    EXPECT_EQ(index_->stopped(), 1u);
    EXPECT_EQ(view_->active_subscriptions(), 0u);
}

TEST_F(MetadataIndexViewTest, LookupIgnoresUpdatesBeforeGathering) {
    index_->set_auto_gather(false);
    index_->set_item(make_item("a.txt", download_status::current));

    auto pending = std::async(std::launch::async, [this] {
        return view_->lookup("a.txt", 2000ms, 1000ms);
    });

    while (index_->active() == 0) {
        std::this_thread::sleep_for(1ms);
    }
    index_->emit(index_event::update);
    EXPECT_EQ(pending.wait_for(50ms), std::future_status::timeout);

    index_->emit(index_event::gathering_complete);
    auto found = pending.get();
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found.value().has_value());
}

}  // namespace kcenon::cloud_sync::test
