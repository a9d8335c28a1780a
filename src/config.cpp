#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <limits.h>
#include <unistd.h>

std::string ClientConfig::default_key_label() {
  char host[HOST_NAME_MAX + 1] = {0};
  if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
    return "adblink@localhost";
  }
  return std::string("adblink@") + host;
}

// Parse an integer env var in [min_value, max_value] into `out`; leaves `out`
// unchanged when unset or invalid.
static void env_int(const char* name, int min_value, int max_value, int& out) {
  const char* env = std::getenv(name);
  if (!env || !*env)
    return;
  char* end = nullptr;
  long v = std::strtol(env, &end, 10);
  if (*end != '\0' || v < min_value || v > max_value) {
    Logger::log(Logger::WARN, std::string("ignoring invalid ") + name + "=" + env);
    return;
  }
  out = static_cast<int>(v);
}

ClientConfig ClientConfig::from_env() {
  ClientConfig config;

  if (const char* host = std::getenv("ADBLINK_HOST")) {
    if (*host)
      config.host = host;
  }

  int port = config.port;
  env_int("ADBLINK_PORT", 1, 65535, port);
  config.port = static_cast<uint16_t>(port);

  // Timeouts become SO_RCVTIMEO/SO_SNDTIMEO, where 0 means no timeout at all.
  env_int("ADBLINK_CONNECT_TIMEOUT_MS", 1, INT_MAX, config.connect_timeout_ms);
  env_int("ADBLINK_IO_TIMEOUT_MS", 1, INT_MAX, config.io_timeout_ms);
  env_int("ADBLINK_TRUST_TIMEOUT_MS", 1, INT_MAX, config.trust_timeout_ms);
  env_int("ADBLINK_DRAIN_TIMEOUT_MS", 1, INT_MAX, config.drain_timeout_ms);

  if (const char* label = std::getenv("ADBLINK_KEY_LABEL")) {
    if (*label)
      config.key_label = label;
  }

  if (const char* pre = std::getenv("ADBLINK_PRECONNECT")) {
    config.preconnect = std::string(pre) != "0";
  }
  return config;
}
