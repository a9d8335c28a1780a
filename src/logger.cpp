#include "logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

static const char* level_name(Logger::Level lvl) {
  switch (lvl) {
    case Logger::DEBUG:
      return "DEBUG";
    case Logger::INFO:
      return "INFO";
    case Logger::WARN:
      return "WARN";
    case Logger::ERROR:
      return "ERROR";
    case Logger::OFF:
      return "OFF";
  }
  return "INFO";
}

static Logger::Level level_from_env() {
  const char* env = std::getenv("ADBLINK_LOG_LEVEL");
  if (!env || !*env)
    env = std::getenv("LOG_LEVEL");
  if (!env)
    return Logger::INFO;
  return Logger::parse_level(env, Logger::INFO);
}

static std::atomic<int>& threshold() {
  static std::atomic<int> level{level_from_env()};
  return level;
}

Logger::Level Logger::parse_level(const std::string& text, Level fallback) {
  std::string v;
  for (char c : text)
    v += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  for (Level l : {DEBUG, INFO, WARN, ERROR, OFF}) {
    if (v == level_name(l))
      return l;
  }
  if (v == "WARNING")
    return WARN;
  return fallback;
}

bool Logger::enabled(Level level) {
  return level != OFF && level >= threshold().load();
}

void Logger::set_level(Level level) {
  threshold().store(level);
}

void Logger::log(Level level, const std::string& msg) {
  if (!enabled(level))
    return;

  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%F %T") << '.' << std::setw(3) << std::setfill('0') << ms << " [" << level_name(level) << "] adblink: " << msg << '\n';

  // The pre-connect thread logs concurrently with callers.
  static std::mutex out_mutex;
  std::lock_guard<std::mutex> guard(out_mutex);
  std::cerr << oss.str();
}

std::string Logger::with_stream(uint32_t local_id, uint32_t remote_id, const std::string& msg) {
  std::ostringstream oss;
  oss << "(local=" << local_id << ", remote=" << remote_id << ") " << msg;
  return oss.str();
}

std::string Logger::with_frame(const char* direction, const char* command, uint32_t arg0, uint32_t arg1, uint32_t length) {
  std::ostringstream oss;
  oss << direction << ' ' << command << " arg0=" << arg0 << " arg1=" << arg1 << " len=" << length;
  return oss.str();
}
