#pragma once
// Handshake: drives connect -> authenticate over one socket.
//
// Flow:
// 1. Send CNXN(version, max payload, "host::\0")
// 2. CNXN reply: done (key already trusted or auth disabled)
// 3. AUTH(TOKEN) reply: sign the pre-hashed token, send AUTH(SIGNATURE)
// 4. CNXN reply: done. AUTH reply: key unknown, send AUTH(RSAPUBLICKEY) and
//    wait `trust_timeout_ms` for the user to accept the prompt on the device
// Any other message is a protocol violation. Failures throw `AdbError` and
// close the socket.
#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "keystore.hpp"
#include "protocol.hpp"
#include <memory>

class Handshake {
  const KeyPair& keys;
  const ClientConfig& config;

  // Read the next message or throw the error matching the read failure.
  Message await_response(int fd, const char* stage, ErrorKind on_timeout);

public:
  Handshake(const KeyPair& keys, const ClientConfig& config);

  // TCP connect to config.host:config.port, then authenticate().
  std::unique_ptr<Connection> connect();

  // Authenticate over an already-connected socket. Takes ownership of `fd`.
  std::unique_ptr<Connection> authenticate(int fd);
};
