// Small utility helpers
//
// `starts_with` provides a simple string prefix check.
// `check` logs an error (errno) when a syscall-like function returns < 0
// and converts the result into 0 (success) or -1 (failure).
// `errno_string` renders the current errno for log messages.
#pragma once
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <string>

// True if `s` starts with `prefix`.
static inline bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// "strerror (errno)" for the current errno.
static inline std::string errno_string() {
  int err = errno;
  return std::string(std::strerror(err)) + " (" + std::to_string(err) + ")";
}

// Log errno if result < 0; return 0 on success, -1 on error.
static inline int check(int result, const char* funcname) {
  if (result < 0) {
    Logger::log(Logger::ERROR, std::string(funcname) + ": " + errno_string());
    return -1;
  }
  return 0;
}
