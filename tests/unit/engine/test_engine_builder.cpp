/**
 * @file test_engine_builder.cpp
 * @brief Unit tests for engine construction, transfers and queries
 */

#include "support/engine_fixture.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::cloud_sync::test {

using namespace std::chrono_literals;

// =============================================================================
// Builder Tests
// =============================================================================

class EngineBuilderTest : public ::testing::Test {
protected:
    std::shared_ptr<fake_index> index_ = std::make_shared<fake_index>();
    std::shared_ptr<fake_access> access_ = std::make_shared<fake_access>();

    void expect_invalid(sync_engine::builder& b) {
        auto built = b.build();
        ASSERT_FALSE(built.has_value());
        EXPECT_EQ(built.error().code, error_code::config_invalid);
    }
};

TEST_F(EngineBuilderTest, DefaultConfig) {
    auto built = sync_engine::builder().with_index(index_).with_access(access_).build();

    ASSERT_TRUE(built.has_value());
    const auto& config = built.value().config();
    EXPECT_EQ(config.transfer.idle_interval, 60000ms);
    EXPECT_EQ(config.transfer.retry.max_attempts, 3u);
    EXPECT_EQ(config.metadata_query_timeout, 30000ms);
    EXPECT_EQ(config.metadata_query_warning, 10000ms);
    EXPECT_EQ(config.pool_name, "cloud_sync_pool");
}

TEST_F(EngineBuilderTest, RequiresIndexAndAccess) {
    sync_engine::builder no_index;
    no_index.with_access(access_);
    expect_invalid(no_index);

    sync_engine::builder no_access;
    no_access.with_index(index_);
    expect_invalid(no_access);
}

TEST_F(EngineBuilderTest, RejectsInvalidTransferSettings) {
    {
        sync_engine::builder b;
        b.with_index(index_).with_access(access_).with_idle_interval(0ms);
        expect_invalid(b);
    }
    {
        retry_policy policy;
        policy.max_attempts = 0;
        sync_engine::builder b;
        b.with_index(index_).with_access(access_).with_retry_policy(policy);
        expect_invalid(b);
    }
    {
        retry_policy policy;
        policy.backoff_multiplier = 0.5;
        sync_engine::builder b;
        b.with_index(index_).with_access(access_).with_retry_policy(policy);
        expect_invalid(b);
    }
    {
        retry_policy policy;
        policy.jitter = 1.5;
        sync_engine::builder b;
        b.with_index(index_).with_access(access_).with_retry_policy(policy);
        expect_invalid(b);
    }
    {
        retry_policy policy;
        policy.initial_delay = 5000ms;
        policy.max_delay = 1000ms;
        sync_engine::builder b;
        b.with_index(index_).with_access(access_).with_retry_policy(policy);
        expect_invalid(b);
    }
    {
        sync_engine::builder b;
        b.with_index(index_).with_access(access_).with_metadata_query_timeout(0ms);
        expect_invalid(b);
    }
}

TEST_F(EngineBuilderTest, WithConfigReplacesEverything) {
    engine_config config;
    config.transfer.idle_interval = 5000ms;
    config.worker_count = 3;
    config.pool_name = "custom_pool";

    auto built = sync_engine::builder()
        .with_index(index_)
        .with_access(access_)
        .with_config(config)
        .build();

    ASSERT_TRUE(built.has_value());
    EXPECT_EQ(built.value().config().transfer.idle_interval, 5000ms);
    EXPECT_EQ(built.value().config().worker_count, 3u);
    EXPECT_EQ(built.value().config().pool_name, "custom_pool");
}

TEST_F(EngineBuilderTest, LoggingSettingsAreApplied) {
    auto previous = get_logger().settings();
    std::vector<std::string> lines;
    get_logger().set_callback([&lines](log_level, std::string_view, const std::string& line) {
        lines.push_back(line);
    });

    {
        auto built = sync_engine::builder()
            .with_index(index_)
            .with_access(access_)
            .with_worker_count(2)
            .with_logging(log_settings{log_level::debug, log_format::json, true})
            .build();
        ASSERT_TRUE(built.has_value());

        auto current = get_logger().settings();
        EXPECT_EQ(current.level, log_level::debug);
        EXPECT_EQ(current.format, log_format::json);
        EXPECT_TRUE(current.mask_paths);
    }

    get_logger().set_callback(nullptr);
    get_logger().configure(previous);

    bool started_line = false;
    for (const auto& line : lines) {
        if (line.find("\"message\":\"Engine started with 2 workers\"") != std::string::npos) {
            started_line = true;
        }
    }
    EXPECT_TRUE(started_line);
}

TEST_F(EngineBuilderTest, EngineIsMovable) {
    auto built = sync_engine::builder().with_index(index_).with_access(access_).build();
    ASSERT_TRUE(built.has_value());

    sync_engine moved(std::move(built.value()));
    EXPECT_TRUE(moved.is_available());
}

// =============================================================================
// Transfers through the engine
// =============================================================================

class SyncEngineTest : public EngineFixture {};

TEST_F(SyncEngineTest, DownloadReturnsLocalAvailability) {
    index_->set_item(make_item("Docs/a.txt", download_status::current));
    std::vector<progress_event_type> seen;

    auto downloaded = engine_->download("Docs/a.txt", [&seen](const transfer_progress_event& e) {
        seen.push_back(e.type);
    });

    ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
    EXPECT_TRUE(downloaded.value());
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), progress_event_type::done);

    auto stats = engine_->get_statistics();
    EXPECT_EQ(stats.completed_downloads, 1u);
    EXPECT_EQ(stats.active_transfers, 0u);
    EXPECT_EQ(stats.active_subscriptions, 0u);
    EXPECT_EQ(stats.registered_observers, stats.released_observers);
}

TEST_F(SyncEngineTest, DownloadOfMissingItemFails) {
    access_->on_open([](const std::string&) -> std::optional<native_failure> {
        return no_such_file();
    });

    auto downloaded = engine_->download("missing.txt");

    ASSERT_FALSE(downloaded.has_value());
    EXPECT_EQ(downloaded.error().code, error_code::not_found_on_read);
    EXPECT_EQ(engine_->get_statistics().failed_transfers, 1u);
}

TEST_F(SyncEngineTest, InvalidPathIsRejectedBeforeAnyWork) {
    for (const char* bad : {"", "/abs", "a//b", ".hidden", "a:b"}) {
        auto downloaded = engine_->download(bad);
        ASSERT_FALSE(downloaded.has_value()) << bad;
        EXPECT_EQ(downloaded.error().code, error_code::invalid_argument) << bad;
    }

    EXPECT_EQ(access_->fetches(), 0u);
    EXPECT_EQ(index_->started(), 0u);
    EXPECT_EQ(engine_->get_statistics().registered_observers, 0u);
}

TEST_F(SyncEngineTest, UnavailableContainerFailsFast) {
    access_->set_available(false);

    EXPECT_FALSE(engine_->is_available());
    EXPECT_EQ(engine_->download("a.txt").error().code, error_code::container_unavailable);
    EXPECT_EQ(engine_->upload("/tmp/a.txt", "a.txt").error().code,
              error_code::container_unavailable);
    EXPECT_EQ(engine_->gather().error().code, error_code::container_unavailable);
    EXPECT_EQ(engine_->get_metadata("a.txt").error().code, error_code::container_unavailable);
    EXPECT_EQ(access_->fetches(), 0u);
    EXPECT_EQ(access_->writes(), 0u);
}

TEST_F(SyncEngineTest, UploadCompletes) {
    auto uploaded = engine_->upload("/tmp/report.pdf", "Docs/report.pdf");

    ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;
    EXPECT_EQ(access_->writes(), 1u);
    EXPECT_EQ(access_->last_source(), std::filesystem::path("/tmp/report.pdf"));
    EXPECT_EQ(engine_->get_statistics().completed_uploads, 1u);
}

TEST_F(SyncEngineTest, UploadRejectsEmptySource) {
    auto uploaded = engine_->upload("", "Docs/report.pdf");

    ASSERT_FALSE(uploaded.has_value());
    EXPECT_EQ(uploaded.error().code, error_code::invalid_argument);
}

TEST_F(SyncEngineTest, PerTransferConfigOverridesDefault) {
    index_->set_item(make_item("slow.bin", download_status::not_downloaded, 5.0));

    download_options options;
    transfer_config config;
    config.idle_interval = 40ms;
    config.retry.max_attempts = 1;
    options.transfer = config;

    auto handle = engine_->start_download("slow.bin", options);
    ASSERT_TRUE(handle.has_value());
    auto outcome = handle.value().wait_for(2000ms);

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::timeout);
    EXPECT_EQ(engine_->get_statistics().timed_out_transfers, 1u);
}

TEST_F(SyncEngineTest, DestructionCancelsRunningTransfers) {
    index_->set_item(make_item("huge.iso", download_status::not_downloaded, 1.0));

    auto handle = engine_->start_download("huge.iso");
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(handle.value().is_valid());

    engine_.reset();

    auto outcome = handle.value().wait_for(2000ms);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::canceled);
    EXPECT_EQ(index_->active(), 0u);
    EXPECT_EQ(index_->started(), index_->stopped());
}

TEST_F(SyncEngineTest, ManyConcurrentDownloads) {
    constexpr int kCount = 20;
    std::vector<transfer_handle> handles;
    for (int i = 0; i < kCount; ++i) {
        auto path = "batch/file" + std::to_string(i) + ".dat";
        index_->set_item(make_item(path, download_status::current));
        auto handle = engine_->start_download(path);
        ASSERT_TRUE(handle.has_value());
        handles.push_back(handle.value());
    }

    for (auto& handle : handles) {
        auto outcome = handle.wait_for(5000ms);
        EXPECT_TRUE(outcome.has_value());
    }

    auto stats = engine_->get_statistics();
    EXPECT_EQ(stats.completed_downloads, static_cast<uint64_t>(kCount));
    EXPECT_EQ(stats.registered_observers, stats.released_observers);
    EXPECT_EQ(stats.active_subscriptions, 0u);
}

// =============================================================================
// Queries
// =============================================================================

TEST_F(SyncEngineTest, ContainerPathComesFromAccessPrimitive) {
    auto path = engine_->container_path();
    ASSERT_TRUE(path.has_value()) << path.error().message;
    EXPECT_EQ(path.value(), std::filesystem::path("/containers/iCloud.test"));

    access_->set_container_path(std::nullopt);
    auto missing = engine_->container_path();
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::container_unavailable);
}

TEST_F(SyncEngineTest, ContainerPathRequiresAvailableContainer) {
    access_->set_available(false);

    auto path = engine_->container_path();

    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, error_code::container_unavailable);
}

TEST_F(SyncEngineTest, ExistsReportsLocalPresenceOnly) {
    index_->set_item(make_item("remote_only.txt", download_status::not_downloaded));
    access_->set_local("local.txt", true);

    EXPECT_TRUE(engine_->exists("local.txt").value());
    EXPECT_FALSE(engine_->exists("remote_only.txt").value());
    EXPECT_EQ(engine_->exists("bad//path").error().code, error_code::invalid_argument);

    // Local presence needs no container round trip
    access_->set_available(false);
    EXPECT_TRUE(engine_->exists("local.txt").value());
    EXPECT_EQ(index_->started(), 0u);
}

TEST_F(SyncEngineTest, GetMetadata) {
    index_->set_item(make_item("Docs/a.txt", download_status::current));

    auto found = engine_->get_metadata("Docs/a.txt");
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->size_bytes.value(), 1024u);

    auto missing = engine_->get_metadata("Docs/none.txt");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(SyncEngineTest, GetMetadataTimesOut) {
    index_->set_auto_gather(false);

    auto found = engine_->get_metadata("Docs/a.txt");

    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().code, error_code::timeout);
    EXPECT_EQ(index_->active(), 0u);
}

TEST_F(SyncEngineTest, GatherThroughEngine) {
    index_->set_item(make_item("Docs/a.txt", download_status::current));
    index_->set_item(make_item("Docs/b.txt", download_status::current));

    auto listed = engine_->gather(gather_options{"Docs"});
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed.value().items.size(), 2u);

    auto bad = engine_->gather(gather_options{"/Docs"});
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, error_code::invalid_argument);
}

}  // namespace kcenon::cloud_sync::test
