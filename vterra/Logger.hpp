// Basic logging system, extended with log level masks.
// Source: https://www.geeksforgeeks.org/cpp/logging-system-in-cpp/

#pragma once

#include <cstdarg>
#include <cstdio>
#include <atomic>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace vterra
{
enum class LogLevel : unsigned int
{
  Debug = 1,
  Info = 2,
  Warning = 4,
  Error = 8,
  Critical = 16
};

inline LogLevel operator|(LogLevel a, LogLevel b)
{
  return static_cast<LogLevel>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

class Logger
{
 private:
  // independent builds may log from several threads, the mask is read outside of the lock
  std::atomic<unsigned> log_level { static_cast<unsigned>(
    LogLevel::Debug | LogLevel::Info | LogLevel::Warning | LogLevel::Error | LogLevel::Critical) };
  std::ofstream log_file;
  std::mutex mutex;

  static std::string levelToString(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

 public:
  // Opens the log file in append mode
  explicit Logger(const std::string& filename)
  {
    log_file.open(filename, std::ios::app);
    if (!log_file.is_open())
    {
      std::cerr << "Error opening log file." << std::endl;
    }
  }

  ~Logger() { log_file.close(); }

  void setLogLevel(LogLevel level, bool set = true)
  {
    if (set)
    {
      log_level.fetch_or(static_cast<unsigned>(level));
    }
    else
    {
      log_level.fetch_and(~static_cast<unsigned>(level));
    }
  }

  LogLevel getLogLevel() const { return static_cast<LogLevel>(log_level.load()); }

  bool isEnabled(LogLevel level) const { return (log_level.load() & static_cast<unsigned>(level)) != 0; }

  void log(LogLevel level, const std::string& message)
  {
    if (!isEnabled(level))
    {
      return;
    }

    time_t now = time(nullptr);
    tm timeinfo {};
    localtime_r(&now, &timeinfo);
    char timestamp[20];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &timeinfo);

    std::ostringstream entry;
    entry << "[vterra] [" << timestamp << "] " << levelToString(level) << ": " << message << std::endl;

    std::lock_guard<std::mutex> lock(mutex);
    std::cout << entry.str();

    if (log_file.is_open())
    {
      log_file << entry.str();
      log_file.flush(); // Ensure immediate write to file
    }
  }

  void log(LogLevel level, const char* fmt, ...)
  {
    if (!isEnabled(level))
    {
      return;
    }
    va_list args;
    va_start(args, fmt);

    // Get the size needed
    va_list args_copy;
    va_copy(args_copy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (size < 0)
    {
      va_end(args);
      log(level, std::string("formatting error in log"));
      return;
    }

    std::vector<char> buffer(size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    log(level, std::string(buffer.data(), size));
  }
};

inline Logger logger("vterra_logfile.txt");

#define VTERRA_LOG(level, msg)                                                                                         \
  {                                                                                                                    \
    if (::vterra::logger.isEnabled(level))                                                                             \
    {                                                                                                                  \
      std::stringstream ss;                                                                                            \
      ss << msg << " (" << __FILE__ << ": line " << __LINE__ << ")";                                                   \
      ::vterra::logger.log(level, ss.str());                                                                           \
    }                                                                                                                  \
  }

#define VTERRA_DEBUG(msg) VTERRA_LOG(::vterra::LogLevel::Debug, msg)
#define VTERRA_INFO(msg) VTERRA_LOG(::vterra::LogLevel::Info, msg)
#define VTERRA_WARNING(msg) VTERRA_LOG(::vterra::LogLevel::Warning, msg)
#define VTERRA_ERROR(msg) VTERRA_LOG(::vterra::LogLevel::Error, msg)
}
