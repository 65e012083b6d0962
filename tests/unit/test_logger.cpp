/**
 * @file test_logger.cpp
 * @brief Logger singleton, level filtering and file output
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "Logger.h"
#include "LoggerMacros.h"

using namespace CipherLink;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logFile_ = (std::filesystem::temp_directory_path() / "cipherlink_test_log.txt").string();
        std::filesystem::remove(logFile_);
        previousLevel_ = Logger::instance().getLevel();
        Logger::instance().setConsoleOutput(false);
        Logger::instance().setLogFile(logFile_);
    }

    void TearDown() override {
        Logger::instance().setLogFile("");
        Logger::instance().setLevel(previousLevel_);
        Logger::instance().setConsoleOutput(true);
        std::error_code ec;
        std::filesystem::remove(logFile_, ec);
    }

    std::string contents() const {
        std::ifstream file(logFile_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string logFile_;
    LogLevel previousLevel_ = LogLevel::INFO;
};

TEST_F(LoggerTest, Singleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesFormattedLinesToFile) {
    Logger& logger = Logger::instance();
    logger.setLevel(LogLevel::DEBUG);

    logger.info("Test info message", "Coordinator");
    logger.error("Test error message");

    auto text = contents();
    EXPECT_NE(text.find("[INFO] [Coordinator] Test info message"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] [CipherLink] Test error message"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessagesAndMacros) {
    Logger& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);
    EXPECT_FALSE(logger.isDebugEnabled());
    EXPECT_FALSE(logger.isInfoEnabled());

    int evaluated = 0;
    auto message = [&evaluated]() {
        ++evaluated;
        return std::string("expensive");
    };
    LOG_DEBUG_COMP_IF(message(), "Test");
    LOG_INFO_COMP_IF(message(), "Test");
    EXPECT_EQ(evaluated, 0);

    logger.info("hidden info");
    LOG_WARN_COMP("visible warning", "Test");

    auto text = contents();
    EXPECT_EQ(text.find("hidden info"), std::string::npos);
    EXPECT_NE(text.find("[WARN] [Test] visible warning"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::parseLevel("chatty", LogLevel::ERROR), LogLevel::ERROR);
}

TEST_F(LoggerTest, ScopedTimerLogsAtDebug) {
    Logger::instance().setLevel(LogLevel::DEBUG);
    {
        SCOPED_TIMER_COMP("manifest decrypt", "Perf");
    }
    EXPECT_NE(contents().find("[DEBUG] [Perf] manifest decrypt took "), std::string::npos);
}
