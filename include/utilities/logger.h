#pragma once
#ifndef NBDATATOOLS_LOGGER_H
#define NBDATATOOLS_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Each record is written as {"timestamp","level","message"} on its own line.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  /**
   * @brief (Re)initialize the singleton.
   * @param logFile Path of the log file, or CONSOLE_ONLY_OUTPUT.
   * @param level Minimum level that is written.
   * @param maxFileSize Rotate once the file grows past this many bytes.
   * @param maxBackupFiles Number of rotated files kept as logFile.1..N.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  bool isEnabled(LogLevel level);
  void log(LogLevel level, const std::string &message);
  void logToConsole(LogLevel level, const std::string &message);
  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void trace(const char *format, ...);

  static std::string levelToString(LogLevel level);
  /// Parse "trace", "DEBUG", ... into a level; unknown names yield INFO.
  static LogLevel levelFromString(const std::string &name);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string formatRecord(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif
