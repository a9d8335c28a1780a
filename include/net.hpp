#pragma once
// Net module: shared networking helpers for framed I/O over blocking TCP
// sockets with per-operation timeouts.
#include "protocol.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace net {
// Open a TCP connection to `host:port`, giving up after `timeout_ms`.
// Returns the connected fd, or -1 with errno set (ECONNREFUSED, ETIMEDOUT, ...).
int connect_tcp(const std::string& host, uint16_t port, int timeout_ms);

// Apply SO_RCVTIMEO / SO_SNDTIMEO. A timeout of 0 blocks forever.
bool set_recv_timeout(int fd, int timeout_ms);
bool set_send_timeout(int fd, int timeout_ms);

// True if `fd` is valid and the peer has not hung up or errored.
// Pending unread data does not count against the socket.
bool is_open(int fd);

// Write all bytes handling partial writes and EINTR.
bool send_all(int fd, const uint8_t* data, size_t len);

// Message/frame send following the 24-byte `Header` layout.
bool send_message(int fd, const Message& m);
bool send_message(int fd, uint32_t command, uint32_t arg0, uint32_t arg1, const std::vector<uint8_t>& payload = {});
} // namespace net
