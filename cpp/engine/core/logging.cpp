/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Purpose:
  - Global level filter (atomic), one mutex around stream writes.
  - Line layout lives in format_log_line() so callers with their own
    stream get the same shape as log().
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace parcel {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

const char* to_string(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info")  return LogLevel::INFO;
  if (s == "warn")  return LogLevel::WARN;
  if (s == "error") return LogLevel::ERROR;
  return std::nullopt;
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string format_log_line(LogLevel lvl, std::string_view msg) {
  std::string line;
  line.reserve(msg.size() + 32);
  line += "[";
  line += utc_timestamp();
  line += "][";
  line += to_string(lvl);
  line += "] ";
  line += msg;
  line += "\n";
  return line;
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  try {
    if (!log_enabled(lvl)) return;

    const std::string line = format_log_line(lvl, msg);

    std::lock_guard<std::mutex> lk(g_log_mu);
    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    out << line;
    out.flush();
  } catch (const std::exception&) {
    // Logging must never throw; a failed write is dropped.
  }
}

} // namespace parcel
