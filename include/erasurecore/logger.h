#pragma once
#ifndef ERASURECORE_LOGGER_H
#define ERASURECORE_LOGGER_H
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex> // For std::mutex and std::lock_guard
#include <stdexcept>
#include <string>

namespace erasurecore {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON line logger with size based rotation.
 *
 * Every entry is written as a single JSON object holding the
 * timestamp, level and message. When the log file grows beyond
 * maxFileSize it is rotated to logFile.1 .. logFile.N.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  void log(LogLevel level, const std::string &message);

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

  /**
   * @brief Parse a level name such as "debug" or "WARN".
   * @throw std::invalid_argument if the name is not a known level.
   */
  static LogLevel levelFromString(const std::string &name);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string formatEntry(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace erasurecore

#endif // ERASURECORE_LOGGER_H
