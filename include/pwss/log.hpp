/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for PWSS.
 * Provides PWSS_LOG_DEBUG, PWSS_LOG_INFO, PWSS_LOG_WARN, PWSS_LOG_ERROR macros.
 */

#ifndef PWSS_LOG_HPP_
#define PWSS_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace pwss {

class Logger {
 public:
  // Ordered by severity; messages below the current level are dropped.
  enum class Level { kDebug, kInfo, kWarn, kError, kOff };

  static void set_level(Level level) { min_level().store(level, std::memory_order_relaxed); }

  static Level level() { return min_level().load(std::memory_order_relaxed); }

  static bool enabled(Level level) { return level >= Logger::level() && level != Level::kOff; }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) {
      return;
    }
    static const char* const kPrefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[PWSS] " << kPrefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& min_level() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  // Streams from several reader threads log concurrently.
  static std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

#define PWSS_LOG_DEBUG(msg) ::pwss::Logger::log(::pwss::Logger::Level::kDebug, msg)
#define PWSS_LOG_INFO(msg) ::pwss::Logger::log(::pwss::Logger::Level::kInfo, msg)
#define PWSS_LOG_WARN(msg) ::pwss::Logger::log(::pwss::Logger::Level::kWarn, msg)
#define PWSS_LOG_ERROR(msg) ::pwss::Logger::log(::pwss::Logger::Level::kError, msg)

}  // namespace pwss

#endif  // PWSS_LOG_HPP_
