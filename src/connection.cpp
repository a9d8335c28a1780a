#include "connection.hpp"
#include "net.hpp"
#include <unistd.h>

bool Connection::is_open() const {
  return net::is_open(fd);
}

void Connection::close() {
  if (fd != -1) {
    ::close(fd);
    fd = -1;
  }
}
