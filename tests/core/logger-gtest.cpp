#include "cdb/core/logger.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

class LoggerTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        saved_level_ = Logger::get_level();
        Logger::set_output_stream(&out_);
        Logger::set_error_stream(&err_);
    }

    void
    TearDown() override
    {
        Logger::reset_streams();
        Logger::set_level(saved_level_);
    }

    std::ostringstream out_;
    std::ostringstream err_;
    LogLevel saved_level_ = LogLevel::ERROR;
};

TEST_F(LoggerTest, ParseLevelNames)
{
    EXPECT_EQ(Logger::parse_level("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parse_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(Logger::parse_level("Debug"), LogLevel::DEBUG);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
    EXPECT_FALSE(Logger::parse_level("").has_value());
}

TEST_F(LoggerTest, SetLevelByNameRejectsUnknown)
{
    Logger::set_level(LogLevel::ERROR);
    EXPECT_FALSE(Logger::set_level(std::string("loud")));
    EXPECT_EQ(Logger::get_level(), LogLevel::ERROR);

    EXPECT_TRUE(Logger::set_level(std::string("info")));
    EXPECT_EQ(Logger::get_level(), LogLevel::INFO);
}

TEST_F(LoggerTest, LevelFiltersMessages)
{
    Logger::set_level(LogLevel::WARNING);

    LOGI("hidden info");
    LOGD("hidden debug");
    LOGW("shown warning");

    EXPECT_EQ(out_.str().find("hidden"), std::string::npos);
    EXPECT_NE(err_.str().find("[WARN]"), std::string::npos);
    EXPECT_NE(err_.str().find("shown warning"), std::string::npos);
}

TEST_F(LoggerTest, ErrorsAndInfoUseSeparateStreams)
{
    Logger::set_level(LogLevel::INFO);

    LOGE("bad ", 42);
    LOGI("fine ", 7);

    EXPECT_NE(err_.str().find("[ERROR] bad 42"), std::string::npos);
    EXPECT_EQ(err_.str().find("fine"), std::string::npos);
    EXPECT_NE(out_.str().find("[INFO]  fine 7"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything)
{
    Logger::set_level(LogLevel::NONE);
    LOGE("should not appear");
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(LoggerTest, PartitionInheritsGlobalLevel)
{
    LogPartition partition("TEST");
    Logger::set_level(LogLevel::DEBUG);
    EXPECT_EQ(partition.level(), LogLevel::DEBUG);
    EXPECT_TRUE(partition.should_log(LogLevel::DEBUG));

    Logger::set_level(LogLevel::ERROR);
    EXPECT_FALSE(partition.should_log(LogLevel::INFO));
}

TEST_F(LoggerTest, PartitionNarrowsOutput)
{
    Logger::set_level(LogLevel::DEBUG);
    LogPartition partition("NARROW", LogLevel::WARNING);

    PLOGD(partition, "not logged");
    PLOGW(partition, "logged");

    EXPECT_EQ(out_.str().find("not logged"), std::string::npos);
    EXPECT_NE(err_.str().find("[NARROW] logged"), std::string::npos);
}
