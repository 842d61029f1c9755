#include <gtest/gtest.h>
#include "vlive/log.hpp"

using namespace vlive;

TEST(LogLevel, StringConversion) {
    EXPECT_EQ(log_level_to_string(LogLevel::Warning), "warning");
    EXPECT_EQ(log_level_from_string("emergency"), LogLevel::Emergency);
    EXPECT_THROW(log_level_from_string("verbose"), std::invalid_argument);

    nlohmann::json j = LogLevel::Debug;
    EXPECT_EQ(j, "debug");
    EXPECT_EQ(nlohmann::json("error").get<LogLevel>(), LogLevel::Error);
}

TEST(Logger, FiltersBelowMinimumLevel) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger(sink, LogLevel::Warning);

    logger.debug("dispatch", {{"n", 1}});
    logger.info("dispatch", {{"n", 2}});
    logger.warning("dispatch", {{"n", 3}});
    logger.error("dispatch", {{"n", 4}});

    auto records = sink->records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].level, LogLevel::Warning);
    EXPECT_EQ(records[0].data["n"], 3);
    EXPECT_EQ(records[1].level, LogLevel::Error);
}

TEST(Logger, SetLevel) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger(sink, LogLevel::Error);
    EXPECT_FALSE(logger.enabled(LogLevel::Info));
    logger.set_level(LogLevel::Debug);
    EXPECT_TRUE(logger.enabled(LogLevel::Debug));
    logger.debug("x", nlohmann::json::object());
    EXPECT_EQ(sink->records().size(), 1u);
}

TEST(Logger, NullSinkIsIgnored) {
    Logger logger(nullptr, LogLevel::Debug);
    logger.error("x", {{"a", 1}});
    SUCCEED();
}

TEST(MemorySink, RecordsForLoggerAndClear) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger(sink, LogLevel::Debug);
    logger.info("server", {{"event", "start"}});
    logger.info("dispatch", {{"tool", "a"}});
    logger.info("server", {{"event", "stop"}});

    auto server = sink->records_for("server");
    ASSERT_EQ(server.size(), 2u);
    EXPECT_EQ(server[1].data["event"], "stop");

    sink->clear();
    EXPECT_TRUE(sink->records().empty());
}

TEST(LogRecord, JsonShape) {
    LogRecord r{LogLevel::Notice, "dispatch", {{"tool", "create_todo"}},
                std::chrono::system_clock::time_point{}};
    nlohmann::json j = r;
    EXPECT_EQ(j["level"], "notice");
    EXPECT_EQ(j["logger"], "dispatch");
    EXPECT_EQ(j["data"]["tool"], "create_todo");
    EXPECT_EQ(j["time"], "1970-01-01T00:00:00.000Z");
}
