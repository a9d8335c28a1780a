#pragma once
// Client configuration: daemon address, timeouts, key label.
// Defaults match a daemon in network debug mode on the local device.
// `from_env()` applies ADBLINK_* environment overrides on top of them.
#include <cstdint>
#include <string>

struct ClientConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 5555;

  int connect_timeout_ms = 3000;
  // Ordinary reads/writes.
  int io_timeout_ms = 5000;
  // Waiting for a human to accept the key prompt on the device.
  int trust_timeout_ms = 30000;
  // Quiet period after which a command's stream is closed from our side.
  int drain_timeout_ms = 500;
  // Frames read while waiting for a stream's OKAY.
  int max_open_attempts = 10;

  // Connect in the background from `Client::init`.
  bool preconnect = true;

  // Appended to the public key ("<base64> <label>"); shown in the trust prompt.
  std::string key_label = default_key_label();

  static std::string default_key_label();

  // Defaults, overridden by ADBLINK_HOST, ADBLINK_PORT, ADBLINK_CONNECT_TIMEOUT_MS,
  // ADBLINK_IO_TIMEOUT_MS, ADBLINK_TRUST_TIMEOUT_MS, ADBLINK_DRAIN_TIMEOUT_MS,
  // ADBLINK_KEY_LABEL and ADBLINK_PRECONNECT.
  static ClientConfig from_env();
};
