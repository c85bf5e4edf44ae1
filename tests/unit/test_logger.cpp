#include <gtest/gtest.h>
#include <string>
#include <termdeck/logger.hpp>
#include <vector>

using namespace termdeck;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    TERMDECK_LOG_INFO("window", "Window {} has {} tabs ({})", 3u, size_t{2}, true);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "Window 3 has 2 tabs (true)");
    EXPECT_EQ(entries_[0].category, "window");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, ExtraPlaceholdersLeftVerbatim)
{
    TERMDECK_LOG_DEBUG("notebook", "{} and {}", std::string("one"));
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "one and {}");
}

TEST_F(LoggerTest, BracesInArgumentsAreNotReformatted)
{
    TERMDECK_LOG_WARN("config", "{} then {}", "{}", "x");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{} then x");
}

TEST_F(LoggerTest, BelowMinimumLevelIsDropped)
{
    Logger::instance().set_level(LogLevel::Warning);
    TERMDECK_LOG_INFO("window", "hidden");
    TERMDECK_LOG_ERROR("window", "shown");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST(LogLevelParse, KnownNames)
{
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warning);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LogLevelNames, Strings)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Info), "INFO");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
}
