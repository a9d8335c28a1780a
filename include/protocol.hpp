// Message protocol structures and helpers
//
// Overview:
// - Defines the debug bridge wire format exchanged with the local daemon
// - Header is a packed 24 bytes: six little-endian u32 fields
//   (command, arg0, arg1, data_length, data_check, magic)
// - `encode_header()` / `decode_header()` convert between bytes and `Header`
// - `read_exact()` / `read_message()` assemble frames from a blocking socket
#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Protocol version and payload size advertised in our CNXN.
#define ADB_VERSION 0x01000000
#define ADB_MAX_PAYLOAD 4096

// Upper bound for an incoming payload. A header declaring more is rejected
// before any payload byte is read.
#define ADB_MAX_PAYLOAD_CEILING (256 * 1024)

#define ADB_HEADER_SIZE 24

// Command tags: four ASCII characters packed little-endian.
constexpr uint32_t A_CNXN = 0x4e584e43;
constexpr uint32_t A_OPEN = 0x4e45504f;
constexpr uint32_t A_OKAY = 0x59414b4f;
constexpr uint32_t A_CLSE = 0x45534c43;
constexpr uint32_t A_AUTH = 0x48545541;
constexpr uint32_t A_WRTE = 0x45545257;

// AUTH sub-types carried in arg0.
enum class AuthType : uint32_t { TOKEN = 1, SIGNATURE = 2, RSAPUBLICKEY = 3 };

// Packed 24-byte header layout. Fields are host order in memory; use
// `encode_header()` to produce the little-endian wire form.
#pragma pack(push, 1)
struct Header {
  uint32_t command;
  uint32_t arg0;
  uint32_t arg1;
  uint32_t data_length;
  uint32_t data_check;
  uint32_t magic;
};
#pragma pack(pop)
static_assert(sizeof(Header) == ADB_HEADER_SIZE, "header must be 24 bytes");

// Complete message: header + payload.
// `valid` is set by assembly logic when the frame is ready.
struct Message {
  Header header{};
  std::vector<uint8_t> payload;
  bool valid = false;
};

// Outcome of a blocking read.
// TIMEOUT: receive timeout expired, CLOSED: peer EOF, MALFORMED: header rejected.
enum class IoStatus { OK, TIMEOUT, CLOSED, ERROR, MALFORMED };

const char* io_status_name(IoStatus status);

// Printable tag for a command ("CNXN", "OKAY", ...) or "????".
const char* command_name(uint32_t command);

// Sum of payload bytes truncated to 32 bits.
uint32_t payload_checksum(const uint8_t* data, size_t len);
inline uint32_t payload_checksum(const std::vector<uint8_t>& data) {
  return payload_checksum(data.data(), data.size());
}

// Little-endian u32 helpers.
void put_u32_le(uint8_t* dst, uint32_t v);
uint32_t get_u32_le(const uint8_t* src);

std::array<uint8_t, ADB_HEADER_SIZE> encode_header(uint32_t command, uint32_t arg0, uint32_t arg1, const std::vector<uint8_t>& payload);

// Parse 24 wire bytes into `out`.
// Returns false if the magic does not match the command or the declared
// payload length exceeds ADB_MAX_PAYLOAD_CEILING.
bool decode_header(const uint8_t* bytes, Header& out);

// Build a message with a computed header.
Message build_message(uint32_t command, uint32_t arg0, uint32_t arg1, const void* payload, size_t pay_len);
inline Message build_message(uint32_t command, uint32_t arg0, uint32_t arg1, const std::string& payload) {
  return build_message(command, arg0, arg1, payload.data(), payload.size());
}
inline Message build_message(uint32_t command, uint32_t arg0, uint32_t arg1) {
  return build_message(command, arg0, arg1, nullptr, 0);
}

// Header + payload as one contiguous buffer.
std::vector<uint8_t> serialize_message(const Message& m);

// Length and checksum agree with the payload.
bool validate_message(const Message& m);

// Read exactly `n` bytes into `dst`, looping on short reads and EINTR.
IoStatus read_exact(int fd, void* dst, size_t n);

// Read one full frame (header, then `data_length` payload bytes).
// A checksum mismatch is logged but tolerated; newer daemons send zero.
IoStatus read_message(int fd, Message& out);
#endif
