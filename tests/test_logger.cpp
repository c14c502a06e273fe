#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "graft/logger.h"
#include <gtest/gtest.h>

using namespace graft;

// ============================================================================
// Test Fixture
// ============================================================================

class LoggerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        // Capture cout for output verification
        old_cout_buf = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());
    }

    void TearDown() override {
        Logger::shutdown();

        // Restore cout
        std::cout.rdbuf(old_cout_buf);
        cout_buffer.str("");
        cout_buffer.clear();

        // Reset global min log level
        Logger::setMinLogLevel(LogLevel::INFO);
    }

    std::string getOutput() const { return cout_buffer.str(); }

  private:
    std::stringstream cout_buffer;
    std::streambuf* old_cout_buf = nullptr;
};

// ============================================================================
// Singleton Pattern Tests
// ============================================================================

TEST_F(LoggerTest, SingletonReturnsSameInstanceForSameScope) {
    Logger& logger1 = Logger::getInstance("TestScope");
    Logger& logger2 = Logger::getInstance("TestScope");
    EXPECT_EQ(&logger1, &logger2);
    EXPECT_EQ(logger1.scope(), "TestScope");
}

TEST_F(LoggerTest, SingletonReturnsDifferentInstancesForDifferentScopes) {
    Logger& logger1 = Logger::getInstance("Scope1");
    Logger& logger2 = Logger::getInstance("Scope2");
    EXPECT_NE(&logger1, &logger2);
}

// ============================================================================
// Log Level Tests
// ============================================================================

TEST_F(LoggerTest, DefaultLogLevelIsInfo) {
    EXPECT_EQ(Logger::minLogLevel(), LogLevel::INFO);
    Logger& logger = Logger::getInstance("DefaultLevel");

    logger.trace("trace");
    logger.debug("debug");
    logger.info("info");

    Logger::flush();
    std::string output = getOutput();
    EXPECT_EQ(output.find("trace"), std::string::npos);
    EXPECT_EQ(output.find("debug"), std::string::npos);
    EXPECT_NE(output.find("info"), std::string::npos);
}

TEST_F(LoggerTest, MinLogLevelFilteringWorks) {
    Logger::setMinLogLevel(LogLevel::WARNING);
    Logger& logger = Logger::getInstance("FilterTest");

    logger.info("info");
    logger.warning("warning");
    logger.error("error");

    Logger::flush();
    std::string output = getOutput();
    EXPECT_EQ(output.find("info"), std::string::npos);
    EXPECT_NE(output.find("warning"), std::string::npos);
    EXPECT_NE(output.find("error"), std::string::npos);
}

TEST_F(LoggerTest, FatalIsNeverFiltered) {
    Logger::setMinLogLevel(LogLevel::FATAL);
    Logger& logger = Logger::getInstance("FatalScope");

    logger.error("dropped");
    logger.fatal("kept");

    Logger::flush();
    std::string output = getOutput();
    EXPECT_EQ(output.find("dropped"), std::string::npos);
    EXPECT_NE(output.find("[FATAL]"), std::string::npos);
    EXPECT_NE(output.find("kept"), std::string::npos);
}

TEST_F(LoggerTest, LogUsesScopeLevel) {
    Logger& logger = Logger::getInstance("ScopeLevel", LogLevel::WARNING);
    EXPECT_EQ(logger.level(), LogLevel::WARNING);

    logger.log("scope level message");

    Logger::flush();
    std::string output = getOutput();
    EXPECT_NE(output.find("[WARNING]"), std::string::npos);
    EXPECT_NE(output.find("scope level message"), std::string::npos);
}

// ============================================================================
// Individual Log Method Tests
// ============================================================================

TEST_F(LoggerTest, TraceMethodWorks) {
    Logger::setMinLogLevel(LogLevel::TRACE);
    Logger& logger = Logger::getInstance("TraceScope", LogLevel::TRACE);

    logger.trace("trace message");

    Logger::flush();
    std::string output = getOutput();
    EXPECT_NE(output.find("[TRACE]"), std::string::npos);
    EXPECT_NE(output.find("[TraceScope]"), std::string::npos);
    EXPECT_NE(output.find("trace message"), std::string::npos);
}

TEST_F(LoggerTest, DebugMethodWorks) {
    Logger::setMinLogLevel(LogLevel::DEBUG);
    Logger& logger = Logger::getInstance("DebugScope", LogLevel::DEBUG);

    logger.debug("debug message");

    Logger::flush();
    std::string output = getOutput();
    EXPECT_NE(output.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(output.find("[DebugScope]"), std::string::npos);
    EXPECT_NE(output.find("debug message"), std::string::npos);
}

TEST_F(LoggerTest, InfoMethodWorks) {
    Logger& logger = Logger::getInstance("InfoScope", LogLevel::INFO);

    logger.info("info message");

    Logger::flush();
    std::string output = getOutput();
    EXPECT_NE(output.find("[INFO]"), std::string::npos);
    EXPECT_NE(output.find("[InfoScope]"), std::string::npos);
    EXPECT_NE(output.find("info message"), std::string::npos);
}

// ============================================================================
// Formatting Tests
// ============================================================================

TEST_F(LoggerTest, FormattedLoggingSubstitutesArguments) {
    Logger& logger = Logger::getInstance("FormatScope");

    logger.info("{} nodes, grad={:.2f}", 42, 0.5);

    Logger::flush();
    EXPECT_NE(getOutput().find("42 nodes, grad=0.50"), std::string::npos);
}

TEST_F(LoggerTest, FormatPlainLayout) {
    const LogEntry entry{"2024-01-01 00:00:00", LogLevel::ERROR, "Graph", "boom"};
    EXPECT_EQ(Logger::formatPlain(entry), "2024-01-01 00:00:00 [ERROR] [Graph] boom\n");
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_STREQ(toString(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(toString(LogLevel::WARNING), "WARNING");
    EXPECT_STREQ(toString(LogLevel::FATAL), "FATAL");
}

// ============================================================================
// File Output Tests
// ============================================================================

TEST_F(LoggerTest, LogFileReceivesPlainText) {
    const std::string path = ::testing::TempDir() + "graft_logger_test.log";
    std::remove(path.c_str());

    Logger::setLogFile(path);
    Logger::getInstance("FileScope").info("written to file");
    Logger::flush();
    Logger::shutdown();

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("[INFO] [FileScope] written to file"), std::string::npos);
    EXPECT_EQ(contents.str().find("\033["), std::string::npos);

    // BOTH also writes to the console
    EXPECT_NE(getOutput().find("written to file"), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggerTest, FileOnlyOutputSkipsConsole) {
    const std::string path = ::testing::TempDir() + "graft_logger_file_only.log";
    std::remove(path.c_str());

    Logger::setLogFile(path);
    Logger::setLogOutput(LogOutput::FILE);
    Logger::getInstance("FileOnly").info("file only message");
    Logger::shutdown();

    EXPECT_EQ(getOutput().find("file only message"), std::string::npos);
    std::remove(path.c_str());
}
