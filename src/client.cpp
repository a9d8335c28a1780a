#include "client.hpp"
#include "error.hpp"
#include "handshake.hpp"
#include "logger.hpp"
#include "stream_mux.hpp"
#include <exception>

/* ============================================================
 *                        Lifecycle
 * ============================================================ */

Client::Client(const ClientConfig& config) : config(config) {}

Client::~Client() {
  join_preconnect();
  std::lock_guard<std::mutex> guard(connection_lock);
  close_connection();
}

bool Client::init(const std::string& storage_dir) {
  join_preconnect();

  try {
    KeyStore store(storage_dir, config.key_label);
    std::unique_ptr<KeyPair> loaded(new KeyPair(store.load_or_generate()));
    std::lock_guard<std::mutex> guard(connection_lock);
    keys = std::move(loaded);
    // A connection authenticated with an older identity is no longer ours.
    close_connection();
  } catch (const std::exception& e) {
    Logger::log(Logger::ERROR, std::string("Failed to init keys: ") + e.what());
    return false;
  }

  if (config.preconnect) {
    // Best effort so the first command is fast; failure is retried later.
    preconnect_thread = std::thread(&Client::preconnect, this);
  }
  return true;
}

void Client::preconnect() {
  std::lock_guard<std::mutex> guard(connection_lock);
  if (is_connected())
    return;
  try {
    ensure_connected();
    Logger::log(Logger::INFO, "Pre-connection established");
  } catch (const std::exception& e) {
    Logger::log(Logger::DEBUG, std::string("Pre-connection failed (will retry on first command): ") + e.what());
  }
}

void Client::join_preconnect() {
  if (preconnect_thread.joinable())
    preconnect_thread.join();
}

/* ============================================================
 *                        Connection
 * ============================================================ */

bool Client::is_connected() const {
  return connection && connection->is_open();
}

void Client::ensure_connected() {
  close_connection();
  Handshake handshake(*keys, config);
  connection = handshake.connect();
}

void Client::close_connection() {
  if (connection) {
    connection->close();
    connection.reset();
  }
}

bool Client::try_send_command(const std::string& command) {
  if (!connection)
    return false;
  StreamMux mux(*connection, config);
  return mux.run_command(connection->allocate_local_id(), command);
}

/* ============================================================
 *                        Public surface
 * ============================================================ */

bool Client::send_key_event(int code) {
  return send_shell_command("input keyevent " + std::to_string(code));
}

bool Client::send_shell_command(const std::string& text) {
  std::lock_guard<std::mutex> guard(connection_lock);

  if (!keys) {
    Logger::log(Logger::WARN, std::string(error_kind_name(ErrorKind::NotInitialized)) + ": keys not loaded, call init() first");
    return false;
  }

  if (is_connected()) {
    if (try_send_command(text))
      return true;
    // Looked open but wasn't (or the daemon choked); start over once.
    Logger::log(Logger::DEBUG, "Command failed on existing connection, reconnecting...");
  }
  close_connection();

  try {
    ensure_connected();
    if (try_send_command(text))
      return true;
    Logger::log(Logger::WARN, "Command failed after reconnect: " + text);
  } catch (const AdbError& e) {
    Logger::log(Logger::WARN, std::string("Connection failed: ") + e.what());
  } catch (const std::exception& e) {
    Logger::log(Logger::ERROR, std::string("Unexpected error: ") + e.what());
  }
  close_connection();
  return false;
}
