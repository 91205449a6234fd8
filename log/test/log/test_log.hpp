#pragma once

#include <log/log.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

namespace Log::Test
{
    class LogTests : public ::testing::Test
    {
      protected:
        void TearDown() override
        {
            Log::setLevel(Log::Level::Off);
        }

        Utility::TemporaryDirectory isolateDirectory_{};
    };

    TEST_F(LogTests, LevelNamesRoundTrip)
    {
        for (auto level :
             {Level::Trace, Level::Debug, Level::Info, Level::Warning, Level::Error, Level::Critical, Level::Off})
        {
            EXPECT_EQ(levelFromString(levelToString(level)), level);
        }
    }

    TEST_F(LogTests, ParseLevelIsCaseInsensitiveAndAcceptsWarn)
    {
        EXPECT_EQ(parseLevel("DEBUG"), Level::Debug);
        EXPECT_EQ(parseLevel("Warn"), Level::Warning);
        EXPECT_EQ(parseLevel("warning"), Level::Warning);
    }

    TEST_F(LogTests, UnknownLevelNameIsRejectedByParseButDefaultsToInfo)
    {
        EXPECT_FALSE(parseLevel("verbose").has_value());
        EXPECT_EQ(levelFromString("verbose"), Level::Info);
    }

    TEST_F(LogTests, SetLevelIsReflectedByLevel)
    {
        Log::setLevel(Level::Error);
        EXPECT_EQ(Log::level(), Level::Error);
        Log::setLevel(Level::Trace);
        EXPECT_EQ(Log::level(), Level::Trace);
    }

    TEST_F(LogTests, FileLoggingReceivesFormattedMessages)
    {
        const auto logFile = isolateDirectory_.path() / "logs" / "dispatch.log";
        Log::setupFileLogging(logFile);
        Log::setLevel(Level::Info);

        Log::info("channel {} opened on {}:{}", 7, "example.org", 22);
        Log::debug("this is below the threshold");
        Log::flush();

        std::ifstream reader{logFile};
        ASSERT_TRUE(reader.is_open());
        std::stringstream content;
        content << reader.rdbuf();

        EXPECT_NE(content.str().find("channel 7 opened on example.org:22"), std::string::npos);
        EXPECT_EQ(content.str().find("below the threshold"), std::string::npos);
    }

    TEST_F(LogTests, FileLoggingTwiceToTheSameFileWritesEachLineOnce)
    {
        const auto logFile = isolateDirectory_.path() / "twice.log";
        Log::setupFileLogging(logFile);
        Log::setupFileLogging(isolateDirectory_.path() / "." / "twice.log");
        Log::setLevel(Level::Info);

        Log::info("transfer session opened");
        Log::flush();

        std::ifstream reader{logFile};
        ASSERT_TRUE(reader.is_open());
        std::stringstream content;
        content << reader.rdbuf();

        const auto text = content.str();
        const auto first = text.find("transfer session opened");
        ASSERT_NE(first, std::string::npos);
        EXPECT_EQ(text.find("transfer session opened", first + 1), std::string::npos);
    }
}
