#include "net.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace net {
static bool wait_connected(int fd, int timeout_ms) {
  pollfd p{fd, POLLOUT, 0};
  int rc;
  do {
    rc = poll(&p, 1, timeout_ms);
  } while (rc < 0 && errno == EINTR);
  if (rc == 0) {
    errno = ETIMEDOUT;
    return false;
  }
  if (rc < 0)
    return false;

  int err = 0;
  socklen_t len = sizeof(err);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
    return false;
  if (err != 0) {
    errno = err;
    return false;
  }
  return true;
}

int connect_tcp(const std::string& host, uint16_t port, int timeout_ms) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    // Not a dotted quad; resolve it.
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) {
      errno = EHOSTUNREACH;
      return -1;
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
  }

  int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (check(fd, "socket") < 0)
    return -1;

  // Non-blocking only for the connect so it can be bounded by poll().
  int flags = fcntl(fd, F_GETFL, 0);
  if (check(flags, "fcntl(F_GETFL)") < 0 || check(fcntl(fd, F_SETFL, flags | O_NONBLOCK), "fcntl(F_SETFL)") < 0) {
    int err = errno;
    close(fd);
    errno = err;
    return -1;
  }

  int rc = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (rc < 0 && errno != EINPROGRESS) {
    int err = errno;
    close(fd);
    errno = err;
    return -1;
  }
  if (rc < 0 && !wait_connected(fd, timeout_ms)) {
    int err = errno;
    close(fd);
    errno = err;
    return -1;
  }

  // The timeouts set later rely on a blocking socket.
  if (check(fcntl(fd, F_SETFL, flags & ~O_NONBLOCK), "fcntl(F_SETFL)") < 0) {
    int err = errno;
    close(fd);
    errno = err;
    return -1;
  }

  // Failure only costs latency.
  int one = 1;
  check(setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)), "setsockopt(TCP_NODELAY)");
  return fd;
}

static bool set_timeout(int fd, int option, int timeout_ms) {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  return check(setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)), "setsockopt") == 0;
}

bool set_recv_timeout(int fd, int timeout_ms) {
  return set_timeout(fd, SO_RCVTIMEO, timeout_ms);
}

bool set_send_timeout(int fd, int timeout_ms) {
  return set_timeout(fd, SO_SNDTIMEO, timeout_ms);
}

bool is_open(int fd) {
  if (fd < 0)
    return false;
  pollfd p{fd, POLLIN | POLLRDHUP, 0};
  int rc = poll(&p, 1, 0);
  if (rc < 0)
    return false;
  if (rc == 0)
    return true;
  return (p.revents & (POLLHUP | POLLERR | POLLRDHUP | POLLNVAL)) == 0;
}

bool send_all(int fd, const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t rc = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (rc > 0) {
      sent += static_cast<size_t>(rc);
      continue;
    }
    if (rc == 0) {
      return false; // peer closed
    }
    if (errno == EINTR)
      continue;
    return false;
  }
  return true;
}

bool send_message(int fd, const Message& m) {
  if (!validate_message(m)) {
    return false;
  }
  std::vector<uint8_t> frame = serialize_message(m);
  if (!send_all(fd, frame.data(), frame.size())) {
    Logger::log(Logger::DEBUG, std::string("send ") + command_name(m.header.command) + " failed: " + errno_string());
    return false;
  }
  if (Logger::enabled(Logger::DEBUG))
    Logger::log(Logger::DEBUG, Logger::with_frame("send", command_name(m.header.command), m.header.arg0, m.header.arg1, m.header.data_length));
  return true;
}

bool send_message(int fd, uint32_t command, uint32_t arg0, uint32_t arg1, const std::vector<uint8_t>& payload) {
  return send_message(fd, build_message(command, arg0, arg1, payload.data(), payload.size()));
}
} // namespace net
