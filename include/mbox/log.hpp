/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for mbox.
 * Provides MBOX_LOG_DEBUG, MBOX_LOG_INFO, MBOX_LOG_WARN, MBOX_LOG_ERROR macros.
 */

#ifndef MBOX_LOG_HPP_
#define MBOX_LOG_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace mbox {

// Minimal thread-safe logger. Lines go to stderr as
// "YYYY-MM-DD HH:MM:SS [LEVEL] message".
// The minimum level defaults to MBOX_LOG_LEVEL (DEBUG, INFO, WARN, ERROR).
class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void log(Level level, const std::string& msg) {
    if (static_cast<int>(level) < static_cast<int>(min_level().load(std::memory_order_relaxed))) {
      return;
    }
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};

    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%F %T") << " " << prefix[static_cast<int>(level)] << " " << msg;

    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << oss.str() << std::endl;
  }

  static void set_level(Level level) { min_level().store(level, std::memory_order_relaxed); }

  static Level level() { return min_level().load(std::memory_order_relaxed); }

  // Parses "DEBUG", "INFO", "WARN" or "ERROR". Returns false on anything else.
  static bool parse_level(const std::string& name, Level& out) {
    if (name == "DEBUG") {
      out = Level::kDebug;
    } else if (name == "INFO") {
      out = Level::kInfo;
    } else if (name == "WARN") {
      out = Level::kWarn;
    } else if (name == "ERROR") {
      out = Level::kError;
    } else {
      return false;
    }
    return true;
  }

  // "conn #<id> <msg>"
  static std::string with_conn(uint64_t conn_id, const std::string& msg) {
    return "conn #" + std::to_string(conn_id) + " " + msg;
  }

 private:
  static std::atomic<Level>& min_level() {
    static std::atomic<Level> level{env_level()};
    return level;
  }

  static Level env_level() {
    Level level = Level::kInfo;
    const char* env = std::getenv("MBOX_LOG_LEVEL");
    if (env != nullptr && !parse_level(env, level)) {
      level = Level::kInfo;
    }
    return level;
  }

  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }
};

#define MBOX_LOG_DEBUG(msg) ::mbox::Logger::log(::mbox::Logger::Level::kDebug, msg)
#define MBOX_LOG_INFO(msg) ::mbox::Logger::log(::mbox::Logger::Level::kInfo, msg)
#define MBOX_LOG_WARN(msg) ::mbox::Logger::log(::mbox::Logger::Level::kWarn, msg)
#define MBOX_LOG_ERROR(msg) ::mbox::Logger::log(::mbox::Logger::Level::kError, msg)

}  // namespace mbox

#endif  // MBOX_LOG_HPP_
