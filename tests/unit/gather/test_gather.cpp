/**
 * @file test_gather.cpp
 * @brief Unit tests for one-shot and live listings
 */

#include <kcenon/cloud_sync/gather/gather_operation.h>

#include "support/transfer_fixture.h"

#include <atomic>
#include <chrono>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::cloud_sync::test {

using namespace std::chrono_literals;

class GatherOperationTest : public TransferFixture {
protected:
    auto gather(gather_options options = {}, gather_update_callback on_update = nullptr,
                std::chrono::milliseconds timeout = 2000ms) -> result<gather_result> {
        return gather_operation::run(*context_, options, std::move(on_update), timeout,
                                     timeout / 2);
    }
};

TEST_F(GatherOperationTest, ListsItemsUnderRoot) {
    index_->set_item(make_item("Photos/a.jpg", download_status::current));
    index_->set_item(make_item("Photos/b.jpg", download_status::not_downloaded));
    index_->set_item(make_item("Music/c.mp3", download_status::current));

    auto listed = gather(gather_options{"Photos"});

    ASSERT_TRUE(listed.has_value()) << listed.error().message;
    ASSERT_EQ(listed.value().items.size(), 2u);
    EXPECT_EQ(listed.value().items[0].path, "Photos/a.jpg");
    EXPECT_EQ(listed.value().items[1].path, "Photos/b.jpg");
    EXPECT_TRUE(listed.value().invalid_entries.empty());
    EXPECT_EQ(listed.value().session, nullptr);
    expect_no_leaks();
}

TEST_F(GatherOperationTest, MalformedRecordsAreReportedNotFatal) {
    for (int i = 0; i < 10; ++i) {
        if (i % 3 == 2) {
            index_->set_record(metadata_record{{record_key::size_bytes, int64_t{i}}});
        } else {
            index_->set_item(make_item("f" + std::to_string(i) + ".txt",
                                       download_status::current));
        }
    }

    index_->set_record(metadata_record{
        {record_key::path, std::string("nan.txt")},
        {record_key::percent_downloaded, std::numeric_limits<double>::quiet_NaN()},
    });
    index_->set_record(metadata_record{
        {record_key::path, std::string("huge.txt")},
        {record_key::size_bytes, std::numeric_limits<double>::infinity()},
    });
    index_->set_record(metadata_record{
        {record_key::path, std::string("epoch.txt")},
        {record_key::modified_at, 1.0e300},
    });

    auto listed = gather();

    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed.value().items.size(), 7u);
    ASSERT_EQ(listed.value().invalid_entries.size(), 6u);
    EXPECT_EQ(listed.value().invalid_entries[0].index, 2u);
    EXPECT_FALSE(listed.value().invalid_entries[0].description.empty());
    EXPECT_EQ(listed.value().invalid_entries[3].index, 10u);
    EXPECT_NE(listed.value().invalid_entries[3].description.find("finite"), std::string::npos);
    EXPECT_EQ(listed.value().invalid_entries[4].index, 11u);
    EXPECT_EQ(listed.value().invalid_entries[5].index, 12u);
    EXPECT_NE(listed.value().invalid_entries[5].description.find("out of range"),
              std::string::npos);
}

TEST_F(GatherOperationTest, EmptyContainer) {
    auto listed = gather();

    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed.value().items.empty());
}

TEST_F(GatherOperationTest, TimesOutWithoutInitialResult) {
    index_->set_auto_gather(false);

    auto listed = gather({}, nullptr, 100ms);

    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().code, error_code::timeout);
    expect_no_leaks();
}

TEST_F(GatherOperationTest, StartFailureIsPropagated) {
    index_->fail_next_queries(error{error_code::container_unavailable, "offline"});

    auto listed = gather();

    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().code, error_code::container_unavailable);
    EXPECT_EQ(context_->registry->active_count(), 0u);
}

TEST_F(GatherOperationTest, LiveGatherDeliversUpdatesOnly) {
    index_->set_item(make_item("a.txt", download_status::current));
    std::mutex mutex;
    std::vector<std::size_t> sizes;

    auto listed = gather({}, [&](const std::vector<item>& items,
                                 const std::vector<invalid_entry>&) {
        std::lock_guard<std::mutex> lock(mutex);
        sizes.push_back(items.size());
    });
    ASSERT_TRUE(listed.has_value());
    ASSERT_NE(listed.value().session, nullptr);
    EXPECT_EQ(listed.value().items.size(), 1u);

    index_->set_item(make_item("b.txt", download_status::current));
    index_->emit(index_event::update);
    index_->set_item(make_item("c.txt", download_status::current));
    index_->emit(index_event::update);

    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(sizes, (std::vector<std::size_t>{2, 3}));
    }
    EXPECT_EQ(listed.value().session->update_count(), 2u);
    EXPECT_EQ(index_->active(), 1u);
}

TEST_F(GatherOperationTest, UpdateBeforeGatheringCompleteIsDeliveredOnce) {
    index_->set_auto_gather(false);
    index_->set_item(make_item("a.txt", download_status::current));
    std::atomic<int> updates{0};

    std::thread emitter([this] {
        if (wait_for_subscription()) {
            index_->emit(index_event::update);
        }
    });
    auto listed = gather({}, [&](const auto&, const auto&) { updates++; });
    emitter.join();

    ASSERT_TRUE(listed.has_value()) << listed.error().message;
    ASSERT_NE(listed.value().session, nullptr);
    EXPECT_EQ(listed.value().items.size(), 1u);
    EXPECT_EQ(updates.load(), 0);
    EXPECT_EQ(listed.value().session->update_count(), 0u);

    index_->set_item(make_item("b.txt", download_status::current));
    index_->emit(index_event::update);

    EXPECT_EQ(updates.load(), 1);
    listed.value().session->cancel();
    expect_no_leaks();
}

TEST_F(GatherOperationTest, CancelStopsUpdatesImmediately) {
    std::atomic<int> updates{0};

    auto listed = gather({}, [&](const auto&, const auto&) { updates++; });
    ASSERT_TRUE(listed.has_value());
    auto session = listed.value().session;
    ASSERT_NE(session, nullptr);

    index_->emit(index_event::update);
    EXPECT_EQ(updates.load(), 1);

    session->cancel();

    // Released before cancel() returned
    EXPECT_EQ(index_->active(), 0u);
    EXPECT_FALSE(session->is_active());

    index_->emit(index_event::update);
    index_->emit_late(index_event::update);
    EXPECT_EQ(updates.load(), 1);

    session->cancel();
    expect_no_leaks();
}

TEST_F(GatherOperationTest, DroppingSessionCancels) {
    {
        auto listed = gather({}, [](const auto&, const auto&) {});
        ASSERT_TRUE(listed.has_value());
        EXPECT_EQ(index_->active(), 1u);
    }

    EXPECT_EQ(index_->active(), 0u);
    expect_no_leaks();
}

TEST_F(GatherOperationTest, CallbackMayCancelItsOwnSession) {
    std::shared_ptr<gather_session> session;
    std::mutex mutex;
    std::atomic<int> updates{0};

    auto listed = gather({}, [&](const auto&, const auto&) {
        updates++;
        std::lock_guard<std::mutex> lock(mutex);
        if (session) {
            session->cancel();
        }
    });
    ASSERT_TRUE(listed.has_value());
    {
        std::lock_guard<std::mutex> lock(mutex);
        session = listed.value().session;
    }

    index_->emit(index_event::update);
    index_->emit(index_event::update);

    EXPECT_EQ(updates.load(), 1);
    EXPECT_FALSE(session->is_active());
    EXPECT_EQ(index_->active(), 0u);
}

}  // namespace kcenon::cloud_sync::test
