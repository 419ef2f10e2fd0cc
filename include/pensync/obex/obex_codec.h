#ifndef PENSYNC_OBEX_OBEX_CODEC_H
#define PENSYNC_OBEX_OBEX_CODEC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pensync/core/compat.h"
#include "pensync/core/io_result.h"

namespace pensync {
namespace obex {

// Request opcodes. The high bit marks the final packet of a request.
constexpr uint8_t kOpConnect = 0x80;
constexpr uint8_t kOpDisconnect = 0x81;
constexpr uint8_t kOpPutFinal = 0x82;
constexpr uint8_t kOpGetFinal = 0x83;
constexpr uint8_t kOpSetPath = 0x85;
constexpr uint8_t kOpAbort = 0xFF;

// Response codes (final bit included)
constexpr uint8_t kResponseContinue = 0x90;
constexpr uint8_t kResponseSuccess = 0xA0;
constexpr uint8_t kResponseBadRequest = 0xC0;
constexpr uint8_t kResponseForbidden = 0xC3;
constexpr uint8_t kResponseNotFound = 0xC4;
constexpr uint8_t kResponseInternalError = 0xD0;

// Header identifiers. The top two bits give the encoding.
constexpr uint8_t kHeaderName = 0x01;
constexpr uint8_t kHeaderType = 0x42;
constexpr uint8_t kHeaderLength = 0xC3;
constexpr uint8_t kHeaderTarget = 0x46;
constexpr uint8_t kHeaderBody = 0x48;
constexpr uint8_t kHeaderEndOfBody = 0x49;
constexpr uint8_t kHeaderWho = 0x4A;
constexpr uint8_t kHeaderConnectionId = 0xCB;

// SETPATH flags
constexpr uint8_t kSetPathBackup = 0x01;
constexpr uint8_t kSetPathNoCreate = 0x02;

constexpr uint8_t kObexVersion = 0x10;
constexpr uint16_t kDefaultMaxPacketLength = 0x1000;
constexpr size_t kMaxPacketLength = 0xFFFF;
constexpr size_t kPacketHeaderSize = 3;

// Folder Browsing service UUID F9EC7BC4-953C-11D2-984E-525400DC9E09
extern const std::array<uint8_t, 16> kFolderBrowsingTarget;
extern const char kFolderListingType[];

enum class HeaderEncoding : uint8_t {
  Unicode = 0x00,
  ByteSequence = 0x40,
  Byte = 0x80,
  FourByte = 0xC0
};

inline HeaderEncoding headerEncoding(uint8_t id) {
  return static_cast<HeaderEncoding>(id & 0xC0);
}

/**
 * One decoded header. `bytes` holds the raw payload of Unicode and byte
 * sequence headers; `value` holds the payload of 1 and 4 byte headers.
 */
struct Header {
  uint8_t id{0};
  std::vector<uint8_t> bytes;
  uint32_t value{0};
};

/**
 * Builds one request packet: opcode, 16-bit length, opcode specific fields
 * and headers, in insertion order.
 */
class PacketBuilder {
 public:
  explicit PacketBuilder(uint8_t opcode) : opcode_(opcode) {}

  // Fixed fields that precede the headers (CONNECT, SETPATH)
  PacketBuilder& addPrefix(const std::vector<uint8_t>& bytes);

  PacketBuilder& addConnectionId(uint32_t id);
  PacketBuilder& addName(const std::string& utf8);
  // Name header with no characters; SETPATH to root uses it
  PacketBuilder& addEmptyName();
  PacketBuilder& addType(const std::string& type);
  PacketBuilder& addTarget(const uint8_t* data, size_t length);
  PacketBuilder& addLength(uint32_t length);
  PacketBuilder& addBody(const uint8_t* data, size_t length, bool end);

  std::vector<uint8_t> build() const;

 private:
  void addByteSequence(uint8_t id, const uint8_t* data, size_t length);

  uint8_t opcode_;
  std::vector<uint8_t> prefix_;
  std::vector<uint8_t> headers_;
};

struct ConnectParameters {
  uint8_t version{0};
  uint8_t flags{0};
  uint16_t max_packet_length{0};
};

struct Response {
  uint8_t code{0};
  optional<ConnectParameters> connect;
  std::vector<Header> headers;

  const Header* find(uint8_t id) const;
};

/**
 * Decode a complete response packet.
 * @param connect_response true for the reply to CONNECT, which carries
 *        version, flags and maximum packet length before the headers.
 */
IoResult<Response> parseResponse(const uint8_t* data,
                                 size_t length,
                                 bool connect_response);

/**
 * Length announced in a packet's first three bytes.
 */
inline uint16_t packetLength(const uint8_t* header) {
  return static_cast<uint16_t>((header[1] << 8) | header[2]);
}

// UTF-8 to NUL-terminated UTF-16BE, and back. Invalid input bytes are
// replaced by U+FFFD.
std::vector<uint8_t> encodeUnicode(const std::string& utf8);
std::string decodeUnicode(const std::vector<uint8_t>& utf16be);

std::string responseCodeToString(uint8_t code);

}  // namespace obex
}  // namespace pensync

#endif  // PENSYNC_OBEX_OBEX_CODEC_H
