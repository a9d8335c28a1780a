#pragma once
// Error kinds raised inside the client. Handshake and KeyStore throw
// `AdbError`; the public Client surface catches them and returns false.
#include <stdexcept>
#include <string>

enum class ErrorKind {
  ConnectRefused, // daemon not listening
  Timeout,        // no response within the bound
  NoResponse,     // peer closed before a full message arrived
  NotTrusted,     // public key rejected or never accepted
  ProtocolError,  // unexpected message type/shape
  NotInitialized, // called before keys were loaded
  IoError,        // local socket or file failure
};

const char* error_kind_name(ErrorKind kind);

class AdbError : public std::runtime_error {
  ErrorKind error_kind;

public:
  AdbError(ErrorKind kind, const std::string& what) : std::runtime_error(std::string(error_kind_name(kind)) + ": " + what), error_kind(kind) {}
  ErrorKind kind() const noexcept {
    return error_kind;
  }
};
