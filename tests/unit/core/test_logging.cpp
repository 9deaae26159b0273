/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and path masking
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_sync/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::cloud_sync::test {

// =============================================================================
// Path Masking Tests
// =============================================================================

TEST(PathMaskingTest, KeepsLastComponent) {
    EXPECT_EQ(mask_path("Documents/tax/return.pdf"), "***/***/return.pdf");
    EXPECT_EQ(mask_path("Documents/statement.pdf"), "***/statement.pdf");
}

TEST(PathMaskingTest, SingleComponentIsUnchanged) {
    EXPECT_EQ(mask_path("notes.txt"), "notes.txt");
    EXPECT_EQ(mask_path(""), "");
}

TEST(PathMaskingTest, QuotedSpansAreMasked) {
    EXPECT_EQ(mask_quoted_paths("download of 'Photos/2024/beach.jpg' stalled"),
              "download of '***/***/beach.jpg' stalled");
    EXPECT_EQ(mask_quoted_paths("no quotes in Photos/a.jpg"), "no quotes in Photos/a.jpg");
    EXPECT_EQ(mask_quoted_paths("unterminated 'Photos/a.jpg"), "unterminated 'Photos/a.jpg");
}

// =============================================================================
// Sync Log Context Tests
// =============================================================================

TEST(SyncLogContextTest, EmptyContextToJson) {
    sync_log_context ctx;

    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST(SyncLogContextTest, AllFieldsToJson) {
    sync_log_context ctx;
    ctx.operation_id = "42";
    ctx.path = "Documents/report.pdf";
    ctx.operation = "download";
    ctx.attempt = 2;
    ctx.max_attempts = 3;
    ctx.duration_ms = 1500;
    ctx.item_count = 7;
    ctx.error_code = "timeout";
    ctx.error_message = "stalled";

    auto json = ctx.to_json();

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"operation_id\":\"42\""), std::string::npos);
    EXPECT_NE(json.find("\"path\":\"Documents/report.pdf\""), std::string::npos);
    EXPECT_NE(json.find("\"operation\":\"download\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"max_attempts\":3"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1500"), std::string::npos);
    EXPECT_NE(json.find("\"item_count\":7"), std::string::npos);
    EXPECT_NE(json.find("\"error_code\":\"timeout\""), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"stalled\""), std::string::npos);
}

TEST(SyncLogContextTest, MaskedJsonHidesDirectories) {
    sync_log_context ctx;
    ctx.path = "Private/diary.txt";
    ctx.error_message = "cannot open 'Private/diary.txt'";

    auto json = ctx.to_json(true);

    EXPECT_EQ(json.find("Private"), std::string::npos);
    EXPECT_NE(json.find("\"path\":\"***/diary.txt\""), std::string::npos);
}

TEST(SyncLogContextTest, JsonEscaping) {
    sync_log_context ctx;
    ctx.operation_id = "id-with-\"quotes\"";
    ctx.error_message = "line\nbreak\tand tab";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Sync Logger Tests
// =============================================================================

class SyncLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = get_logger().settings();
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().configure(previous_);
    }

    auto capture() -> std::vector<std::string>& {
        get_logger().set_callback(
            [this](log_level, std::string_view category, const std::string& line) {
                categories_.emplace_back(category);
                lines_.push_back(line);
            });
        return lines_;
    }

    log_settings previous_;
    std::vector<std::string> categories_;
    std::vector<std::string> lines_;
};

TEST_F(SyncLoggerTest, LevelFiltering) {
    get_logger().set_level(log_level::warn);

    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::warn));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
}

TEST_F(SyncLoggerTest, CallbackReceivesFormattedTextLine) {
    get_logger().configure(log_settings{log_level::debug, log_format::text, false});
    auto& lines = capture();

    sync_log_context ctx;
    ctx.path = "a/b.txt";
    CS_LOG_INFO_CTX(log_category::transfer, "Transfer finished", ctx);
    CS_LOG_TRACE(log_category::engine, "filtered");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(categories_[0], "cloud_sync.transfer");
    EXPECT_NE(lines[0].find("[cloud_sync.transfer] Transfer finished"), std::string::npos);
    EXPECT_NE(lines[0].find("\"path\":\"a/b.txt\""), std::string::npos);
}

TEST_F(SyncLoggerTest, JsonOutputMasksPaths) {
    get_logger().configure(log_settings{log_level::info, log_format::json, true});
    auto& lines = capture();

    sync_log_context ctx;
    ctx.path = "Secret/plans.txt";
    CS_LOG_ERROR_CTX(log_category::structural, "Move of 'Secret/plans.txt' failed", ctx);

    ASSERT_EQ(lines.size(), 1u);
    const auto& json = lines[0];
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_EQ(json.find("Secret"), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"cloud_sync.structural\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Move of '***/plans.txt' failed\""), std::string::npos);
    EXPECT_NE(json.find(",\"path\":\"***/plans.txt\""), std::string::npos);
}

TEST_F(SyncLoggerTest, ConfigureRoundTripsSettings) {
    get_logger().configure(log_settings{log_level::warn, log_format::json, true});

    auto current = get_logger().settings();
    EXPECT_EQ(current.level, log_level::warn);
    EXPECT_EQ(current.format, log_format::json);
    EXPECT_TRUE(current.mask_paths);
}

}  // namespace kcenon::cloud_sync::test
