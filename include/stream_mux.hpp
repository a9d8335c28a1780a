#pragma once
// StreamMux: runs one shell command as a stream over a shared connection.
//
// A stream is the pair (local_id, remote_id). Frames for earlier streams
// can still be in flight when a new one opens; they are acknowledged and
// skipped ("drained") rather than taken as this stream's reply:
// - WRTE for another stream -> OKAY back with the ids swapped
// - CLSE for another stream -> CLSE back with the ids swapped
// - OKAY for another stream -> ignored
#include "config.hpp"
#include "connection.hpp"
#include "protocol.hpp"
#include <string>

class StreamMux {
  Connection& conn;
  const ClientConfig& config;
  std::string output;

  // Acknowledge a WRTE/CLSE that belongs to some other stream.
  bool drain_stray(const Message& m);
  // Send CLSE for our stream; a failure only matters to the next command.
  void close_stream(uint32_t local_id, uint32_t remote_id);
  // Consume this stream's output until CLSE, quiet timeout, or deadline.
  void drain_output(uint32_t local_id, uint32_t remote_id);

public:
  StreamMux(Connection& conn, const ClientConfig& config);

  // OPEN "shell:<command_text>" as `local_id` and wait for the daemon's OKAY.
  // True once the daemon accepted the stream; output capture is best effort.
  bool run_command(uint32_t local_id, const std::string& command_text);

  // Output collected from the last command's WRTE frames.
  const std::string& last_output() const {
    return output;
  }
};
