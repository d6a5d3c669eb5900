#include "base_test.hpp"
#include "../../ragged/spdlog_adapter.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

class LoggerTest : public base_test {
};

TEST_F(LoggerTest, messages_reach_adapter) {
    ragged::log_info(ragged::log_channel::generic, "loaded {} rows", 12);
    ASSERT_EQ(1, adapter->entries().size());
    auto e = adapter->entries().front();
    EXPECT_EQ(ragged::log_level::info, e.level);
    EXPECT_EQ("generic", e.channel);
    EXPECT_EQ("loaded 12 rows", e.message);
}

TEST_F(LoggerTest, level_filters_messages) {
    ragged::get_logger().set_level(ragged::log_level::warning);
    ragged::log_debug(ragged::log_channel::lazy, "hidden");
    ragged::log_info(ragged::log_channel::lazy, "hidden");
    ragged::log_warning(ragged::log_channel::lazy, "shown");
    ragged::log_error(ragged::log_channel::cache, "shown too");
    ASSERT_EQ(2, adapter->entries().size());
    EXPECT_TRUE(adapter->contains(ragged::log_level::warning, "lazy", "shown"));
    EXPECT_TRUE(adapter->contains(ragged::log_level::error, "cache", "shown too"));
}

TEST_F(LoggerTest, initialize_replaces_adapters) {
    auto other = std::make_shared<capturing_adapter>();
    ragged::initialize(other);
    ragged::log_error(ragged::log_channel::generic, "only once");
    EXPECT_TRUE(adapter->entries().empty());
    EXPECT_EQ(1, other->entries().size());
    EXPECT_TRUE(ragged::is_initialized());

    ragged::get_logger().remove("capture");
    EXPECT_TRUE(ragged::get_logger().empty());
}

TEST_F(LoggerTest, spdlog_adapter_prefixes_channel) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
    sink->set_pattern("%l %v");
    auto logger = std::make_shared<spdlog::logger>("ragged_test", sink);
    logger->set_level(spdlog::level::debug);
    ragged::initialize(std::make_shared<ragged::spdlog_adapter>(logger));
    ragged::get_logger().set_level(ragged::log_level::debug);

    ragged::log_debug(ragged::log_channel::cache, "Evicted {}", "a");
    ragged::log_warning(ragged::log_channel::lazy, "slow");
    auto lines = sink->last_formatted();
    ASSERT_EQ(2, lines.size());
    EXPECT_NE(std::string::npos, lines[0].find("debug [cache] Evicted a"));
    EXPECT_NE(std::string::npos, lines[1].find("warning [lazy] slow"));
}

TEST_F(LoggerTest, level_names) {
    EXPECT_EQ(ragged::log_level::warning, ragged::str_to_log_level("WARN"));
    EXPECT_EQ(ragged::log_level::error, ragged::str_to_log_level("error"));
    EXPECT_EQ("info", ragged::log_level_to_str(ragged::log_level::info));
    EXPECT_THROW(ragged::str_to_log_level("loud"), ragged::invalid_type);
}

TEST(LoggerDefaultTest, falls_back_to_spdlog) {
    ragged::deinitialize();
    EXPECT_FALSE(ragged::is_initialized());
    EXPECT_FALSE(ragged::get_logger().empty());
    ragged::deinitialize();
}
