// Debug bridge client: runs shell commands on the local device's daemon
//
// Responsibilities:
// - Load or generate the RSA identity (see KeyStore)
// - Keep one authenticated connection to the daemon and reuse it
// - Serialize all socket use behind one lock
// - Reconnect and retry exactly once when a command fails
//
// Nothing here throws: every failure is logged and reported as `false`,
// so callers can skip an automation step and carry on.
#pragma once
#include "config.hpp"
#include "connection.hpp"
#include "keystore.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class Client {
  ClientConfig config;
  std::unique_ptr<KeyPair> keys;
  std::unique_ptr<Connection> connection;
  std::mutex connection_lock; // guards `keys` and `connection`
  std::thread preconnect_thread;

  // The following require `connection_lock` to be held.
  bool is_connected() const;
  // Build a fresh authenticated connection. Throws AdbError on failure.
  void ensure_connected();
  // Run one command on the current connection.
  bool try_send_command(const std::string& command);
  void close_connection();

  void preconnect();
  void join_preconnect();

public:
  explicit Client(const ClientConfig& config = ClientConfig());
  ~Client();
  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Load/generate keys under `storage_dir` and, if enabled, connect in the
  // background. Returns false if the keys could not be set up.
  bool init(const std::string& storage_dir);

  // "input keyevent <code>"
  bool send_key_event(int code);

  // Run `text` in a remote shell. True once the daemon accepted the command.
  bool send_shell_command(const std::string& text);
};
