#pragma once
#include <cstdint>
#include <string>

// Logger: process-wide leveled logging to stderr.
// stdout is left to the CLI, so library chatter never mixes with command output.
//
// The threshold comes from ADBLINK_LOG_LEVEL, falling back to LOG_LEVEL
// (DEBUG, INFO, WARN, ERROR or OFF, any case). Default INFO.
class Logger {
public:
  enum Level { DEBUG, INFO, WARN, ERROR, OFF };

  static void log(Level level, const std::string& msg);
  static bool enabled(Level level);
  // Override the environment, e.g. to quiet tests.
  static void set_level(Level level);
  static Level parse_level(const std::string& text, Level fallback);

  // "(local=1, remote=7) msg"
  static std::string with_stream(uint32_t local_id, uint32_t remote_id, const std::string& msg);
  // "send OPEN arg0=1 arg1=0 len=25"
  static std::string with_frame(const char* direction, const char* command, uint32_t arg0, uint32_t arg1, uint32_t length);
};
