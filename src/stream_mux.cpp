#include "stream_mux.hpp"
#include "logger.hpp"
#include "net.hpp"
#include <chrono>

StreamMux::StreamMux(Connection& conn, const ClientConfig& config) : conn(conn), config(config) {}

bool StreamMux::drain_stray(const Message& m) {
  const Header& h = m.header;
  // Their arg0 is the sender's id (our remote), arg1 is ours.
  uint32_t reply = h.command == A_WRTE ? A_OKAY : A_CLSE;
  if (!net::send_message(conn.fd, reply, h.arg1, h.arg0)) {
    return false;
  }
  Logger::log(Logger::DEBUG, Logger::with_stream(h.arg1, h.arg0, std::string("drained stray ") + command_name(h.command)));
  return true;
}

void StreamMux::close_stream(uint32_t local_id, uint32_t remote_id) {
  if (!net::send_message(conn.fd, A_CLSE, local_id, remote_id)) {
    Logger::log(Logger::DEBUG, Logger::with_stream(local_id, remote_id, "could not send CLSE"));
  }
}

void StreamMux::drain_output(uint32_t local_id, uint32_t remote_id) {
  if (!net::set_recv_timeout(conn.fd, config.drain_timeout_ms)) {
    close_stream(local_id, remote_id);
    return;
  }

  // A command that never goes quiet (e.g. a log tail) must not hold the
  // connection forever.
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.io_timeout_ms);

  while (true) {
    if (std::chrono::steady_clock::now() >= deadline) {
      Logger::log(Logger::DEBUG, Logger::with_stream(local_id, remote_id, "output still flowing, closing stream"));
      close_stream(local_id, remote_id);
      break;
    }

    Message msg;
    IoStatus status = read_message(conn.fd, msg);
    if (status == IoStatus::TIMEOUT) {
      // Quiet: end the stream from our side.
      close_stream(local_id, remote_id);
      break;
    }
    if (status != IoStatus::OK) {
      Logger::log(Logger::DEBUG, Logger::with_stream(local_id, remote_id, std::string("drain stopped: ") + io_status_name(status)));
      break;
    }

    const Header& h = msg.header;
    if (h.command == A_WRTE && h.arg0 == remote_id) {
      output.append(msg.payload.begin(), msg.payload.end());
      if (!net::send_message(conn.fd, A_OKAY, local_id, remote_id))
        break;
    } else if (h.command == A_CLSE && h.arg0 == remote_id) {
      close_stream(local_id, remote_id);
      break;
    } else if (h.command == A_WRTE || h.command == A_CLSE) {
      if (!drain_stray(msg))
        break;
    } else if (h.command == A_OKAY) {
      continue;
    } else {
      Logger::log(Logger::WARN, Logger::with_stream(local_id, remote_id, std::string("unexpected ") + command_name(h.command) + " while draining output"));
      break;
    }
  }

  if (!net::set_recv_timeout(conn.fd, config.io_timeout_ms)) {
    // Leave the socket unusable rather than stuck on the short timeout.
    conn.close();
  }
}

bool StreamMux::run_command(uint32_t local_id, const std::string& command_text) {
  output.clear();

  std::string payload = "shell:" + command_text;
  payload.push_back('\0');
  if (!net::send_message(conn.fd, build_message(A_OPEN, local_id, 0, payload))) {
    Logger::log(Logger::DEBUG, Logger::with_stream(local_id, 0, "failed to send OPEN"));
    return false;
  }

  uint32_t remote_id = 0;
  bool matched = false;
  int attempts = 0;
  while (attempts < config.max_open_attempts) {
    attempts++;
    Message msg;
    IoStatus status = read_message(conn.fd, msg);
    if (status != IoStatus::OK) {
      Logger::log(Logger::DEBUG, Logger::with_stream(local_id, 0, std::string("read failed waiting for OKAY: ") + io_status_name(status)));
      return false;
    }

    const Header& h = msg.header;
    if (h.command == A_OKAY && h.arg1 == local_id) {
      remote_id = h.arg0;
      matched = true;
      break;
    }
    if (h.command == A_CLSE && h.arg1 == local_id) {
      Logger::log(Logger::WARN, Logger::with_stream(local_id, h.arg0, "daemon refused stream: " + command_text));
      return false;
    }
    if (h.command == A_WRTE || h.command == A_CLSE) {
      if (!drain_stray(msg))
        return false;
      continue;
    }
    if (h.command == A_OKAY) {
      Logger::log(Logger::DEBUG, Logger::with_stream(h.arg1, h.arg0, "ignoring stray OKAY"));
      continue;
    }

    Logger::log(Logger::WARN, Logger::with_stream(local_id, 0, std::string("unexpected ") + command_name(h.command) + " arg0=" + std::to_string(h.arg0) +
                                                                   " arg1=" + std::to_string(h.arg1) + " while waiting for OKAY"));
    return false;
  }

  if (!matched) {
    Logger::log(Logger::WARN, Logger::with_stream(local_id, 0, "no OKAY after " + std::to_string(attempts) + " messages"));
    return false;
  }

  Logger::log(Logger::DEBUG, Logger::with_stream(local_id, remote_id, "shell command accepted: " + command_text));
  drain_output(local_id, remote_id);
  if (!output.empty()) {
    Logger::log(Logger::DEBUG, Logger::with_stream(local_id, remote_id, "output: " + output));
  }
  return true;
}
