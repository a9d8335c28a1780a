#include "protocol.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>

const char* io_status_name(IoStatus status) {
  switch (status) {
    case IoStatus::OK:
      return "ok";
    case IoStatus::TIMEOUT:
      return "timeout";
    case IoStatus::CLOSED:
      return "closed";
    case IoStatus::ERROR:
      return "error";
    case IoStatus::MALFORMED:
      return "malformed";
  }
  return "unknown";
}

const char* command_name(uint32_t command) {
  switch (command) {
    case A_CNXN:
      return "CNXN";
    case A_OPEN:
      return "OPEN";
    case A_OKAY:
      return "OKAY";
    case A_CLSE:
      return "CLSE";
    case A_AUTH:
      return "AUTH";
    case A_WRTE:
      return "WRTE";
  }
  return "????";
}

uint32_t payload_checksum(const uint8_t* data, size_t len) {
  uint32_t sum = 0;
  for (size_t i = 0; i < len; ++i)
    sum += data[i];
  return sum;
}

void put_u32_le(uint8_t* dst, uint32_t v) {
  dst[0] = static_cast<uint8_t>(v & 0xFF);
  dst[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  dst[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  dst[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

uint32_t get_u32_le(const uint8_t* src) {
  return static_cast<uint32_t>(src[0]) | (static_cast<uint32_t>(src[1]) << 8) | (static_cast<uint32_t>(src[2]) << 16) | (static_cast<uint32_t>(src[3]) << 24);
}

std::array<uint8_t, ADB_HEADER_SIZE> encode_header(uint32_t command, uint32_t arg0, uint32_t arg1, const std::vector<uint8_t>& payload) {
  std::array<uint8_t, ADB_HEADER_SIZE> out{};
  put_u32_le(out.data() + 0, command);
  put_u32_le(out.data() + 4, arg0);
  put_u32_le(out.data() + 8, arg1);
  put_u32_le(out.data() + 12, static_cast<uint32_t>(payload.size()));
  put_u32_le(out.data() + 16, payload_checksum(payload));
  put_u32_le(out.data() + 20, ~command);
  return out;
}

bool decode_header(const uint8_t* bytes, Header& out) {
  out.command = get_u32_le(bytes + 0);
  out.arg0 = get_u32_le(bytes + 4);
  out.arg1 = get_u32_le(bytes + 8);
  out.data_length = get_u32_le(bytes + 12);
  out.data_check = get_u32_le(bytes + 16);
  out.magic = get_u32_le(bytes + 20);
  if (out.magic != (out.command ^ 0xFFFFFFFFu))
    return false;
  // Reject before allocating: the peer may declare any length it likes.
  return out.data_length <= ADB_MAX_PAYLOAD_CEILING;
}

Message build_message(uint32_t command, uint32_t arg0, uint32_t arg1, const void* payload, size_t pay_len) {
  Message m;
  const uint8_t* p = static_cast<const uint8_t*>(payload);
  if (pay_len)
    m.payload.assign(p, p + pay_len);
  m.header.command = command;
  m.header.arg0 = arg0;
  m.header.arg1 = arg1;
  m.header.data_length = static_cast<uint32_t>(pay_len);
  m.header.data_check = payload_checksum(m.payload);
  m.header.magic = ~command;
  m.valid = true;
  return m;
}

std::vector<uint8_t> serialize_message(const Message& m) {
  auto header = encode_header(m.header.command, m.header.arg0, m.header.arg1, m.payload);
  std::vector<uint8_t> frame(header.begin(), header.end());
  frame.insert(frame.end(), m.payload.begin(), m.payload.end());
  return frame;
}

bool validate_message(const Message& m) {
  return m.header.data_length == m.payload.size() && m.header.data_check == payload_checksum(m.payload) && m.header.magic == ~m.header.command;
}

IoStatus read_exact(int fd, void* dst, size_t n) {
  uint8_t* buf = reinterpret_cast<uint8_t*>(dst);
  size_t total = 0;

  while (total < n) {
    ssize_t bytes = read(fd, buf + total, n - total);

    if (bytes == 0) {
      return IoStatus::CLOSED;
    }

    if (bytes < 0) {
      if (errno == EINTR)
        continue;
      // SO_RCVTIMEO expiry surfaces as EAGAIN on a blocking socket.
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        return IoStatus::TIMEOUT;
      return IoStatus::ERROR;
    }

    total += bytes;
  }

  return IoStatus::OK;
}

IoStatus read_message(int fd, Message& out) {
  out = Message{};

  uint8_t raw[ADB_HEADER_SIZE];
  IoStatus status = read_exact(fd, raw, sizeof(raw));
  if (status != IoStatus::OK)
    return status;

  if (!decode_header(raw, out.header)) {
    Logger::log(Logger::WARN, std::string("rejected header cmd=") + command_name(out.header.command) + " len=" + std::to_string(out.header.data_length));
    return IoStatus::MALFORMED;
  }

  if (out.header.data_length) {
    out.payload.resize(out.header.data_length);
    status = read_exact(fd, out.payload.data(), out.payload.size());
    if (status != IoStatus::OK)
      return status;
    if (out.header.data_check != 0 && out.header.data_check != payload_checksum(out.payload)) {
      Logger::log(Logger::WARN, std::string("checksum mismatch on ") + command_name(out.header.command) + " frame");
    }
  }

  if (Logger::enabled(Logger::DEBUG))
    Logger::log(Logger::DEBUG, Logger::with_frame("recv", command_name(out.header.command), out.header.arg0, out.header.arg1, out.header.data_length));
  out.valid = true;
  return IoStatus::OK;
}
