/**
 * @file test_logger.cpp
 * @brief File logging and thread-safety tests for Logger
 *
 * Tests:
 * 1. Timestamped file creation in a fresh directory
 * 2. Level filtering
 * 3. Concurrent logging from multiple threads
 * 4. Session tag and console stream
 */

#include <gtest/gtest.h>
#include <proctor/core/Logger.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace proctor::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logDir_ = ::testing::TempDir() + "proctor_test_logs/nested";
        auto& logger = Logger::getInstance();
        ASSERT_TRUE(logger.initializeWithTimestamp(logDir_, LogLevel::DEBUG));
        logger.setConsoleOutput(false);
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.setSessionTag("");
        logger.closeLogFile();
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::INFO);
    }

    std::string readLog() const {
        Logger::getInstance().flush();
        std::ifstream file(Logger::getInstance().getCurrentLogFile());
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string logDir_;
};

/**
 * Test 1: File creation
 */
TEST_F(LoggerTest, CreatesTimestampedFile) {
    const std::string path = Logger::getInstance().getCurrentLogFile();
    EXPECT_EQ(path.find(logDir_), 0u);
    EXPECT_NE(path.find("log_proctor_"), std::string::npos);

    LOG_INFO("session started");
    const std::string content = readLog();
    EXPECT_NE(content.find("[INFO] session started"), std::string::npos);
    EXPECT_NE(content.find("test_logger.cpp"), std::string::npos);
}

/**
 * Test 2: Level filtering
 */
TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger::getInstance().setLevel(LogLevel::WARNING);
    LOG_DEBUG("hidden debug line");
    LOG_WARNING("visible warning line");
    LOG_ERROR("tracker error " + std::to_string(42));

    const std::string content = readLog();
    EXPECT_EQ(content.find("hidden debug line"), std::string::npos);
    EXPECT_NE(content.find("visible warning line"), std::string::npos);
    EXPECT_NE(content.find("tracker error 42"), std::string::npos);
    EXPECT_FALSE(Logger::getInstance().isEnabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::getInstance().isEnabled(LogLevel::ERROR));
}

/**
 * Test 3: Thread safety
 */
TEST_F(LoggerTest, ConcurrentLoggingKeepsLinesIntact) {
    constexpr int kThreads = 4;
    constexpr int kMessages = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kMessages; ++i) {
                LOG_INFO("worker " + std::to_string(t) + " message " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::istringstream lines(readLog());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        if (line.find("] worker ") != std::string::npos) {
            EXPECT_NE(line.find(" message "), std::string::npos) << line;
            count++;
        }
    }
    EXPECT_EQ(count, kThreads * kMessages);
}

/**
 * Test 4: Session tag, console output kept off stdout
 */
TEST_F(LoggerTest, SessionTagAndConsoleStream) {
    auto& logger = Logger::getInstance();
    logger.setSessionTag("exam-42");
    logger.setConsoleOutput(true);

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    LOG_INFO("tagged line");
    logger.flush();
    const std::string out = ::testing::internal::GetCapturedStdout();
    const std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_NE(err.find("[INFO] [exam-42] tagged line"), std::string::npos);
    EXPECT_NE(readLog().find("[exam-42] tagged line"), std::string::npos);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("WARN"), LogLevel::WARNING);
    EXPECT_EQ(logLevelFromString("Critical"), LogLevel::CRITICAL);
    EXPECT_EQ(logLevelFromString("unknown"), LogLevel::INFO);
    EXPECT_STREQ(logLevelName(LogLevel::WARNING), "WARNING");
}
