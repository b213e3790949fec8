/**
 * @file test_event_log.cpp
 * @brief Тесты журнала событий
 */

#include <gtest/gtest.h>

#include "log/event_log.hpp"

#include <sstream>
#include <string>

namespace incmerkle::tests {

// =============================================================================
// Уровни и типы
// =============================================================================

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(log::parse_level("error").value(), log::LogLevel::Error);
    EXPECT_EQ(log::parse_level("warn").value(), log::LogLevel::Warn);
    EXPECT_EQ(log::parse_level("info").value(), log::LogLevel::Info);
    EXPECT_EQ(log::parse_level("debug").value(), log::LogLevel::Debug);

    auto bad = log::parse_level("INFO");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::ConfigInvalidValue);
}

TEST(EventTypeTest, ToString) {
    EXPECT_EQ(log::to_string(log::EventType::LeafInserted), "LEAF_INSERTED");
    EXPECT_EQ(log::to_string(log::EventType::TreeFull), "TREE_FULL");
    EXPECT_EQ(log::to_string(log::EventType::InvalidState), "INVALID_STATE");
    EXPECT_EQ(log::to_string(log::EventType::ProofRejected), "PROOF_REJECTED");
    EXPECT_EQ(log::to_string(log::LogLevel::Warn), "WARN");
}

// =============================================================================
// EventLog
// =============================================================================

TEST(EventLogTest, LevelFiltering) {
    log::EventLogConfig config;
    config.level = "warn";
    config.echo = false;
    log::EventLog events(config);

    EXPECT_TRUE(events.enabled(log::LogLevel::Error));
    EXPECT_TRUE(events.enabled(log::LogLevel::Warn));
    EXPECT_FALSE(events.enabled(log::LogLevel::Info));

    events.info(log::EventType::LeafInserted, "skipped");
    events.debug(log::EventType::StateLoaded, "skipped");
    events.warn(log::EventType::TreeFull, "kept");
    events.error(log::EventType::StorageError, "kept");

    auto recent = events.recent(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].type, log::EventType::TreeFull);
    EXPECT_EQ(recent[1].type, log::EventType::StorageError);
}

TEST(EventLogTest, RingBufferKeepsNewest) {
    log::EventLogConfig config;
    config.event_history = 3;
    config.echo = false;
    log::EventLog events(config);

    for (int i = 0; i < 5; ++i) {
        events.info(log::EventType::LeafInserted, std::to_string(i));
    }

    EXPECT_EQ(events.size(), 3u);
    auto recent = events.recent(10);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent.front().message, "2");
    EXPECT_EQ(recent.back().message, "4");

    auto last = events.recent(1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].message, "4");

    events.clear();
    EXPECT_EQ(events.size(), 0u);
}

TEST(EventLogTest, EchoPlainFormat) {
    log::EventLogConfig config;
    config.color = false;
    std::ostringstream out;
    log::EventLog events(config, out);

    events.warn(log::EventType::TreeFull, "depth 32");

    const std::string line = out.str();
    EXPECT_NE(line.find("[WARN] [TREE_FULL] depth 32"), std::string::npos);
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST(EventLogTest, EchoColored) {
    log::EventLogConfig config;
    std::ostringstream out;
    log::EventLog events(config, out);

    events.error(log::EventType::StorageError, "io");

    EXPECT_NE(out.str().find("\033["), std::string::npos);
    EXPECT_NE(out.str().find("STORAGE_ERROR"), std::string::npos);
}

TEST(EventLogTest, UnknownLevelFallsBackToInfo) {
    log::EventLogConfig config;
    config.level = "loud";
    config.echo = false;
    log::EventLog events(config);
    EXPECT_EQ(events.level(), log::LogLevel::Info);
}

} // namespace incmerkle::tests
