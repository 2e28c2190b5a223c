#include "test_utils.hpp"
#include "utilities/cache_dir.hpp"
#include "utilities/logger.h"

#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace {

std::string readFileContents(const std::string &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    return "";
  }
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

bool exists(const std::string &path) { return std::ifstream(path).good(); }

} // namespace

class LoggerTest : public ::testing::Test {
protected:
  void TearDown() override {
    // Point the singleton back at the suite log so later tests keep logging.
    Logger::init(nbdatatools::logsDir() + "/nbdatatools_tests.log",
                 LogLevel::DEBUG);
  }

  // Re-initializing closes the current file, which flushes it.
  void flush() { Logger::init(dir_.file("flush.log"), LogLevel::DEBUG, 0, 0); }

  testutil::TempDir dir_{"nbdt_logger"};
};

TEST_F(LoggerTest, LogLevelFiltering) {
  const std::string testLogFile = dir_.file("level_filter.log");
  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
  Logger &logger = Logger::getInstance();

  logger.log(LogLevel::TRACE, "This is a trace message.");
  logger.log(LogLevel::DEBUG, "This is a debug message.");
  logger.log(LogLevel::INFO, "This is an info message.");
  logger.log(LogLevel::WARN, "This is a warning message.");
  logger.log(LogLevel::ERROR, "This is an error message.");
  EXPECT_FALSE(logger.isEnabled(LogLevel::DEBUG));
  EXPECT_TRUE(logger.isEnabled(LogLevel::ERROR));
  flush();

  std::string logContents = readFileContents(testLogFile);
  ASSERT_NE(logContents, "");
  EXPECT_EQ(logContents.find("trace message"), std::string::npos);
  EXPECT_EQ(logContents.find("debug message"), std::string::npos);
  EXPECT_NE(logContents.find("info message"), std::string::npos);
  EXPECT_NE(logContents.find("warning message"), std::string::npos);
  EXPECT_NE(logContents.find("error message"), std::string::npos);
}

TEST_F(LoggerTest, JsonOutputFormat) {
  const std::string testLogFile = dir_.file("json_format.log");
  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::DEBUG));
  Logger::getInstance().log(LogLevel::INFO,
                            "special chars \" \\ / \b \n \r \t");
  flush();

  std::string logContents = readFileContents(testLogFile);
  ASSERT_FALSE(logContents.empty());
  EXPECT_NE(logContents.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(logContents.find("\"timestamp\":\""), std::string::npos);
  EXPECT_NE(logContents.find(
                "\"message\":\"special chars \\\" \\\\ / \\u0008 \\n \\r \\t\""),
            std::string::npos);
  EXPECT_EQ(logContents.front(), '{');
  size_t last = logContents.find_last_not_of("\n\r");
  ASSERT_NE(last, std::string::npos);
  EXPECT_EQ(logContents[last], '}');
}

TEST_F(LoggerTest, SetLogLevelAndTrace) {
  const std::string testLogFile = dir_.file("trace.log");
  ASSERT_NO_THROW(Logger::init(testLogFile, LogLevel::INFO));
  Logger::trace("hidden %d", 1);
  Logger::getInstance().setLogLevel(LogLevel::TRACE);
  Logger::trace("chunk %u of %s", 7u, "data.bin");
  flush();

  std::string logContents = readFileContents(testLogFile);
  EXPECT_EQ(logContents.find("hidden"), std::string::npos);
  EXPECT_NE(logContents.find("chunk 7 of data.bin"), std::string::npos);
}

TEST_F(LoggerTest, LogRotation) {
  const std::string baseLogFile = dir_.file("rotation.log");
  const int maxBackupFiles = 2;
  ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, 1024, maxBackupFiles));
  Logger &logger = Logger::getInstance();

  std::string message(800, 'x');
  for (int i = 0; i < 6; ++i) {
    logger.log(LogLevel::INFO, message + " #" + std::to_string(i));
  }
  flush();

  EXPECT_TRUE(exists(baseLogFile));
  EXPECT_TRUE(exists(baseLogFile + ".1"));
  EXPECT_TRUE(exists(baseLogFile + ".2"));
  EXPECT_FALSE(exists(baseLogFile + ".3"));
  EXPECT_NE(readFileContents(baseLogFile).find("#5"), std::string::npos);
}

TEST_F(LoggerTest, LogRotationNoBackups) {
  const std::string baseLogFile = dir_.file("no_backup.log");
  ASSERT_NO_THROW(Logger::init(baseLogFile, LogLevel::DEBUG, 1024, 0));
  Logger &logger = Logger::getInstance();
  std::string message(800, 'y');
  for (int i = 0; i < 4; ++i) {
    logger.log(LogLevel::INFO, message);
  }
  flush();
  EXPECT_TRUE(exists(baseLogFile));
  EXPECT_FALSE(exists(baseLogFile + ".1"));
}

TEST_F(LoggerTest, ReinitializationTest) {
  const std::string logFile1 = dir_.file("reinit1.log");
  const std::string logFile2 = dir_.file("reinit2.log");

  ASSERT_NO_THROW(Logger::init(logFile1, LogLevel::INFO));
  Logger::getInstance().log(LogLevel::INFO, "Message for logfile1");

  ASSERT_NO_THROW(Logger::init(logFile2, LogLevel::WARN));
  Logger::getInstance().log(LogLevel::WARN, "Message for logfile2");
  Logger::getInstance().log(LogLevel::INFO, "Info message for logfile2");
  flush();

  std::string contents1 = readFileContents(logFile1);
  EXPECT_NE(contents1.find("Message for logfile1"), std::string::npos);
  EXPECT_EQ(contents1.find("Message for logfile2"), std::string::npos);

  std::string contents2 = readFileContents(logFile2);
  EXPECT_NE(contents2.find("Message for logfile2"), std::string::npos);
  EXPECT_EQ(contents2.find("Info message for logfile2"), std::string::npos);
}

TEST(LoggerLevels, ParseAndFormat) {
  EXPECT_EQ(Logger::levelFromString("trace"), LogLevel::TRACE);
  EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::WARN);
  EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::ERROR);
  EXPECT_EQ(Logger::levelFromString("verbose"), LogLevel::INFO);
  EXPECT_EQ(Logger::levelToString(LogLevel::FATAL), "FATAL");
}
