#include "error.hpp"

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ConnectRefused:
      return "ConnectRefused";
    case ErrorKind::Timeout:
      return "Timeout";
    case ErrorKind::NoResponse:
      return "NoResponse";
    case ErrorKind::NotTrusted:
      return "NotTrusted";
    case ErrorKind::ProtocolError:
      return "ProtocolError";
    case ErrorKind::NotInitialized:
      return "NotInitialized";
    case ErrorKind::IoError:
      return "IoError";
  }
  return "Unknown";
}
