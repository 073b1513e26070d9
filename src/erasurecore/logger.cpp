#include "erasurecore/logger.h"
#include <algorithm>
#include <cctype>
#include <cstdarg> // For va_list, va_start, va_end
#include <cstdio>  // For std::rename and std::remove
#include <new>     // For std::bad_alloc
#include <string>

namespace erasurecore {

namespace {

std::string escapeJson(const std::string &in) {
  std::string out;
  out.reserve(in.size() + 8);
  for (char c : in) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      // Control bytes and anything outside ASCII are escaped so a message
      // that is not valid UTF-8 still yields a valid JSON line.
      if (static_cast<unsigned char>(c) < 0x20 ||
          static_cast<unsigned char>(c) >= 0x80) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buf;
      } else {
        out += c;
      }
    }
  }
  return out;
}

} // namespace

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);

  delete s_instance;
  s_instance = nullptr;

  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] CRITICAL: new Logger FAILED due to "
                 "std::bad_alloc: "
              << bae.what() << std::endl;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    // Used before init: fall back to console output so library callers
    // never lose messages.
    try {
      s_instance = new Logger(CONSOLE_ONLY_OUTPUT, LogLevel::WARN,
                              10 * 1024 * 1024, 5);
    } catch (const std::bad_alloc &e) {
      std::cerr << "CRITICAL_ERROR: Emergency logger allocation failed: "
                << e.what() << std::endl;
    }
    if (!s_instance) {
      throw std::runtime_error("Logger not initialized. Call Logger::init() "
                               "first. Emergency init also failed.");
    }
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

LogLevel Logger::levelFromString(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return TRACE;
  if (upper == "DEBUG")
    return DEBUG;
  if (upper == "INFO")
    return INFO;
  if (upper == "WARN" || upper == "WARNING")
    return WARN;
  if (upper == "ERROR")
    return ERROR;
  if (upper == "FATAL")
    return FATAL;
  throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::formatEntry(LogLevel level, const std::string &message) {
  return "{\"timestamp\": \"" + getTimestamp() + "\", \"level\": \"" +
         levelToString(level) + "\", \"message\": \"" + escapeJson(message) +
         "\"}";
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0)
    return;
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize)
    return;

  logFileStream.close();
  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles + 1);
    std::remove(tooOldPath.c_str());

    for (int i = maxBackupFiles; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        if (i == maxBackupFiles) {
          std::remove(oldPath.c_str());
          continue;
        }
        std::remove(newPath.c_str());
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  const std::string jsonLine = formatEntry(level, message);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cerr << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();

  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

void Logger::trace(const char *format, ...) {
  char buffer[512];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);
  Logger::getInstance().log(LogLevel::TRACE, buffer);
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm *localTime = std::localtime(&currentTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", localTime);
  return std::string(timestamp);
}

} // namespace erasurecore
