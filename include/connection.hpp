#pragma once
// One authenticated socket to the daemon, plus what its CNXN told us.
// Owns the fd; closing is idempotent and also happens on destruction.
#include <cstdint>
#include <string>

struct Connection {
  int fd = -1;
  uint32_t version = 0;     // daemon's protocol version (CNXN arg0)
  uint32_t max_payload = 0; // daemon's max payload (CNXN arg1)
  std::string banner;       // CNXN payload, e.g. "device::ro.product.name=..."
  uint32_t next_local_id = 1;

  explicit Connection(int fd) : fd(fd) {}
  ~Connection() {
    close();
  }
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Socket is valid and the peer has not hung up.
  bool is_open() const;
  // Local ids are never reused while the connection is alive.
  uint32_t allocate_local_id() {
    return next_local_id++;
  }
  void close();
};
