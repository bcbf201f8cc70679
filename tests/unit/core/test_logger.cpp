#include <gtest/gtest.h>
#include "scrape/core/logger.hpp"

using namespace scrape;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logging::shutdown();
        auto sink = std::make_unique<MemorySink>();
        m_sink = sink.get();
        std::vector<std::unique_ptr<LogSink>> sinks;
        sinks.push_back(std::move(sink));
        logging::init(std::move(sinks));
        m_previous_level = logging::level();
        logging::set_level(LogLevel::Trace);
    }

    void TearDown() override {
        logging::set_level(m_previous_level);
        logging::shutdown();
    }

    MemorySink* m_sink{nullptr};
    LogLevel m_previous_level{LogLevel::Warn};
};

TEST_F(LoggerTest, RecordsNamedLogger) {
    auto& logger = logging::get("css");
    logger.info("compiled selector");

    auto entries = m_sink->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].logger_name, "css");
    EXPECT_EQ(entries[0].message, "compiled selector");
}

TEST_F(LoggerTest, SameNameSameLogger) {
    EXPECT_EQ(&logging::get("html"), &logging::get("html"));
    EXPECT_NE(&logging::get("html"), &logging::get("soup"));
}

TEST_F(LoggerTest, FormatVariants) {
    logging::get("soup").warn_fmt("parsed {} nodes in {}", 12, "doc");

    EXPECT_TRUE(m_sink->contains("parsed 12 nodes in doc"));
}

TEST_F(LoggerTest, GlobalLevelFilters) {
    logging::set_level(LogLevel::Warn);
    auto& logger = logging::get("html");

    logger.debug("hidden");
    logger.error("shown");

    EXPECT_FALSE(m_sink->contains("hidden"));
    EXPECT_TRUE(m_sink->contains("shown"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::Info));
    EXPECT_TRUE(logger.is_enabled(LogLevel::Error));
}

TEST_F(LoggerTest, LoggerLevelFilters) {
    auto& logger = logging::get("filtered");
    logger.set_level(LogLevel::Error);

    logger.warn("dropped");
    EXPECT_TRUE(m_sink->entries().empty());

    logger.set_level(LogLevel::Trace);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    logging::set_level(LogLevel::Off);
    SCRAPE_LOG_ERROR("silent");

    EXPECT_TRUE(m_sink->entries().empty());
}

TEST_F(LoggerTest, DefaultLoggerMacros) {
    SCRAPE_LOG_INFO("from macro");
    SCRAPE_LOG_DEBUG_FMT("value={}", 3);

    EXPECT_TRUE(m_sink->contains("from macro"));
    EXPECT_TRUE(m_sink->contains("value=3"));
}

TEST_F(LoggerTest, ClearDropsEntries) {
    SCRAPE_LOG_WARN("one");
    m_sink->clear();

    EXPECT_TRUE(m_sink->entries().empty());
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level(" off "), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(log_level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::Fatal), "FATAL");
}
