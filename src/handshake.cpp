#include "handshake.hpp"
#include "logger.hpp"
#include "net.hpp"
#include "util.hpp"
#include <cerrno>
#include <sstream>

static const char kHostIdentity[] = "host::";

static std::string hex32(uint32_t v) {
  std::ostringstream oss;
  oss << "0x" << std::hex << v;
  return oss.str();
}

Handshake::Handshake(const KeyPair& keys, const ClientConfig& config) : keys(keys), config(config) {}

Message Handshake::await_response(int fd, const char* stage, ErrorKind on_timeout) {
  Message response;
  IoStatus status = read_message(fd, response);
  switch (status) {
    case IoStatus::OK:
      return response;
    case IoStatus::TIMEOUT:
      throw AdbError(on_timeout, std::string("no response ") + stage);
    case IoStatus::CLOSED:
      throw AdbError(on_timeout == ErrorKind::NotTrusted ? ErrorKind::NotTrusted : ErrorKind::NoResponse, std::string("daemon closed the connection ") + stage);
    case IoStatus::MALFORMED:
      throw AdbError(ErrorKind::ProtocolError, std::string("malformed frame ") + stage);
    case IoStatus::ERROR:
      break;
  }
  throw AdbError(ErrorKind::IoError, std::string("read failed ") + stage + ": " + errno_string());
}

std::unique_ptr<Connection> Handshake::connect() {
  Logger::log(Logger::DEBUG, "connecting to " + config.host + ":" + std::to_string(config.port));
  int fd = net::connect_tcp(config.host, config.port, config.connect_timeout_ms);
  if (fd < 0) {
    int err = errno;
    std::string where = config.host + ":" + std::to_string(config.port) + ": " + errno_string();
    if (err == ECONNREFUSED)
      throw AdbError(ErrorKind::ConnectRefused, where);
    if (err == ETIMEDOUT)
      throw AdbError(ErrorKind::Timeout, where);
    throw AdbError(ErrorKind::IoError, where);
  }
  return authenticate(fd);
}

std::unique_ptr<Connection> Handshake::authenticate(int fd) {
  // Owns the fd from here on; any throw closes it.
  std::unique_ptr<Connection> conn(new Connection(fd));

  if (!net::set_recv_timeout(fd, config.io_timeout_ms) || !net::set_send_timeout(fd, config.io_timeout_ms)) {
    throw AdbError(ErrorKind::IoError, "cannot set socket timeouts");
  }

  // Identity is sent with its NUL terminator.
  if (!net::send_message(fd, build_message(A_CNXN, ADB_VERSION, ADB_MAX_PAYLOAD, kHostIdentity, sizeof(kHostIdentity)))) {
    throw AdbError(ErrorKind::IoError, "failed to send CNXN");
  }

  Message response = await_response(fd, "to CNXN", ErrorKind::Timeout);

  if (response.header.command == A_AUTH) {
    if (response.header.arg0 != static_cast<uint32_t>(AuthType::TOKEN)) {
      throw AdbError(ErrorKind::ProtocolError, "expected AUTH token, got AUTH type " + std::to_string(response.header.arg0));
    }
    Logger::log(Logger::DEBUG, "AUTH challenge received (token size=" + std::to_string(response.payload.size()) + ")");

    std::vector<uint8_t> signature;
    try {
      signature = sign_auth_token(keys.private_key.get(), response.payload);
    } catch (const std::runtime_error& e) {
      throw AdbError(ErrorKind::ProtocolError, std::string("cannot sign auth token: ") + e.what());
    }
    if (!net::send_message(fd, A_AUTH, static_cast<uint32_t>(AuthType::SIGNATURE), 0, signature)) {
      throw AdbError(ErrorKind::IoError, "failed to send AUTH signature");
    }

    response = await_response(fd, "to AUTH signature", ErrorKind::Timeout);

    if (response.header.command == A_AUTH) {
      Logger::log(Logger::INFO, "Signature not recognized, sending public key (accept the debugging prompt on the device)");
      if (!net::send_message(fd, A_AUTH, static_cast<uint32_t>(AuthType::RSAPUBLICKEY), 0, keys.public_key)) {
        throw AdbError(ErrorKind::IoError, "failed to send AUTH public key");
      }

      if (!net::set_recv_timeout(fd, config.trust_timeout_ms)) {
        throw AdbError(ErrorKind::IoError, "cannot extend receive timeout");
      }
      response = await_response(fd, "while waiting for key acceptance", ErrorKind::NotTrusted);
      if (!net::set_recv_timeout(fd, config.io_timeout_ms)) {
        throw AdbError(ErrorKind::IoError, "cannot restore receive timeout");
      }

      if (response.header.command != A_CNXN) {
        throw AdbError(ErrorKind::NotTrusted, std::string("daemon answered public key with ") + command_name(response.header.command));
      }
    }
  }

  if (response.header.command != A_CNXN) {
    throw AdbError(ErrorKind::ProtocolError, "unexpected response " + hex32(response.header.command) + " (" + command_name(response.header.command) + ")");
  }

  conn->version = response.header.arg0;
  conn->max_payload = response.header.arg1;
  conn->banner.assign(response.payload.begin(), response.payload.end());
  while (!conn->banner.empty() && conn->banner.back() == '\0')
    conn->banner.pop_back();

  if (!starts_with(conn->banner, "device::")) {
    Logger::log(Logger::DEBUG, "unusual daemon banner: " + conn->banner);
  }
  Logger::log(Logger::INFO, "Connection established (version=" + hex32(conn->version) + ", max_payload=" + std::to_string(conn->max_payload) + ")");
  return conn;
}
