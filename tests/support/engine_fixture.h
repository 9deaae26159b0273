/**
 * @file engine_fixture.h
 * @brief Fixture building a sync_engine over the scripted fakes
 */

#ifndef KCENON_CLOUD_SYNC_TEST_ENGINE_FIXTURE_H
#define KCENON_CLOUD_SYNC_TEST_ENGINE_FIXTURE_H

#include <gtest/gtest.h>

#include <kcenon/cloud_sync/engine/sync_engine.h>

#include "support/fake_access.h"
#include "support/fake_index.h"

#include <chrono>
#include <memory>

namespace kcenon::cloud_sync::test {

/**
 * @brief Test fixture owning an engine with short timeouts
 */
class EngineFixture : public ::testing::Test {
protected:
    void SetUp() override {
        index_ = std::make_shared<fake_index>();
        access_ = std::make_shared<fake_access>();

        auto engine_result = make_builder().build();
        ASSERT_TRUE(engine_result.has_value()) << "Failed to create engine";
        engine_ = std::make_unique<sync_engine>(std::move(engine_result.value()));
    }

    void TearDown() override {
        engine_.reset();
    }

    auto make_builder() -> sync_engine::builder {
        retry_policy retry;
        retry.max_attempts = 2;
        retry.initial_delay = std::chrono::milliseconds(10);
        retry.max_delay = std::chrono::milliseconds(50);
        retry.jitter = 0.0;

        sync_engine::builder b;
        b.with_index(index_)
            .with_access(access_)
            .with_idle_interval(std::chrono::milliseconds(1000))
            .with_retry_policy(retry)
            .with_worker_count(2)
            .with_metadata_query_timeout(std::chrono::milliseconds(500))
            .with_metadata_query_warning(std::chrono::milliseconds(250));
        return b;
    }

    std::shared_ptr<fake_index> index_;
    std::shared_ptr<fake_access> access_;
    std::unique_ptr<sync_engine> engine_;
};

}  // namespace kcenon::cloud_sync::test

#endif  // KCENON_CLOUD_SYNC_TEST_ENGINE_FIXTURE_H
