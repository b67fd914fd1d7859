/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <portal/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace portal::test {

// =============================================================================
// Log Context Tests
// =============================================================================

TEST(TransferLogContextTest, EmptyContext) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST(TransferLogContextTest, PopulatedFieldsOnly) {
    transfer_log_context ctx;
    ctx.session_id = "7";
    ctx.filename = "docs/a.txt";
    ctx.bytes_written = 11;

    EXPECT_EQ(ctx.to_json(),
              "{\"session_id\":\"7\",\"filename\":\"docs/a.txt\",\"bytes_written\":11}");
}

TEST(TransferLogContextTest, RateUsesTwoDecimals) {
    transfer_log_context ctx;
    ctx.rate_mbps = 12.3456;

    EXPECT_EQ(ctx.to_json(), "{\"rate_mbps\":12.35}");
}

TEST(TransferLogContextTest, EscapesStrings) {
    transfer_log_context ctx;
    ctx.error_message = "bad \"name\"\n";

    EXPECT_EQ(ctx.to_json(), "{\"error_message\":\"bad \\\"name\\\"\\n\"}");
}

TEST(EscapeJsonTest, ControlCharacters) {
    EXPECT_EQ(detail::escape_json(std::string("a\x01") + "b"), "a\\u0001b");
    EXPECT_EQ(detail::escape_json("tab\there"), "tab\\there");
    EXPECT_EQ(detail::escape_json("back\\slash"), "back\\\\slash");
}

// =============================================================================
// Logger Tests
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    struct record {
        log_level level;
        std::string category;
        std::string message;
        bool has_context;
    };

    void SetUp() override {
        auto& logger = get_logger();
        saved_level_ = logger.get_level();
        logger.set_quiet(true);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message,
                                   const transfer_log_context* context) {
            std::lock_guard lock(mutex_);
            records_.push_back({level, std::string(category), std::string(message),
                                context != nullptr});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_level(saved_level_);
        logger.set_quiet(false);
    }

    auto records() -> std::vector<record> {
        std::lock_guard lock(mutex_);
        return records_;
    }

    log_level saved_level_ = log_level::info;
    std::mutex mutex_;
    std::vector<record> records_;
};

TEST_F(LoggerTest, LevelFilter) {
    auto& logger = get_logger();
    logger.set_level(log_level::warn);

    EXPECT_FALSE(logger.is_enabled(log_level::info));
    EXPECT_TRUE(logger.is_enabled(log_level::warn));
    EXPECT_TRUE(logger.is_enabled(log_level::fatal));

    PORTAL_LOG_INFO(log_category::server, "filtered");
    PORTAL_LOG_ERROR(log_category::server, "kept");

    auto seen = records();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].level, log_level::error);
    EXPECT_EQ(seen[0].message, "kept");
    EXPECT_EQ(seen[0].category, "portal.server");
}

TEST_F(LoggerTest, ContextIsPassedToCallback) {
    get_logger().set_level(log_level::debug);

    transfer_log_context ctx;
    ctx.filename = "a.txt";
    PORTAL_LOG_DEBUG_CTX(log_category::receiver, "Received file", ctx);
    PORTAL_LOG_DEBUG(log_category::receiver, "no context");

    auto seen = records();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0].has_context);
    EXPECT_FALSE(seen[1].has_context);
}

TEST_F(LoggerTest, OutputFormatSwitch) {
    auto& logger = get_logger();
    logger.set_output_format(log_output_format::json);
    EXPECT_EQ(logger.get_output_format(), log_output_format::json);

    logger.set_output_format(log_output_format::text);
    EXPECT_EQ(logger.get_output_format(), log_output_format::text);
}

TEST_F(LoggerTest, InitializeIsIdempotent) {
    auto& logger = get_logger();
    logger.initialize();
    logger.initialize();
    EXPECT_TRUE(logger.is_initialized());
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

}  // namespace portal::test
