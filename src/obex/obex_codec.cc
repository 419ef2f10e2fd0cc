#include "pensync/obex/obex_codec.h"

#include <cerrno>

#include <fmt/format.h>

namespace pensync {
namespace obex {

const std::array<uint8_t, 16> kFolderBrowsingTarget = {
    0xF9, 0xEC, 0x7B, 0xC4, 0x95, 0x3C, 0x11, 0xD2,
    0x98, 0x4E, 0x52, 0x54, 0x00, 0xDC, 0x9E, 0x09};

const char kFolderListingType[] = "x-obex/folder-listing";

namespace {

constexpr uint32_t kReplacementChar = 0xFFFD;

void appendU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void appendU32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint32_t readU32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

// Decode one code point starting at s[i], advancing i
uint32_t nextCodePoint(const std::string& s, size_t& i) {
  auto byte = [&](size_t k) { return static_cast<uint8_t>(s[k]); };
  uint8_t lead = byte(i);
  if (lead < 0x80) {
    ++i;
    return lead;
  }

  size_t extra = 0;
  uint32_t cp = 0;
  if ((lead & 0xE0) == 0xC0) {
    extra = 1;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    extra = 2;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    extra = 3;
    cp = lead & 0x07;
  } else {
    ++i;
    return kReplacementChar;
  }

  if (i + extra >= s.size()) {
    i = s.size();
    return kReplacementChar;
  }
  for (size_t k = 1; k <= extra; ++k) {
    uint8_t b = byte(i + k);
    if ((b & 0xC0) != 0x80) {
      i += k;
      return kReplacementChar;
    }
    cp = (cp << 6) | (b & 0x3F);
  }
  i += extra + 1;
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return kReplacementChar;
  }
  return cp;
}

void appendUtf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

}  // namespace

std::vector<uint8_t> encodeUnicode(const std::string& utf8) {
  std::vector<uint8_t> out;
  out.reserve((utf8.size() + 1) * 2);
  size_t i = 0;
  while (i < utf8.size()) {
    uint32_t cp = nextCodePoint(utf8, i);
    if (cp >= 0x10000) {
      cp -= 0x10000;
      appendU16(out, static_cast<uint16_t>(0xD800 | (cp >> 10)));
      appendU16(out, static_cast<uint16_t>(0xDC00 | (cp & 0x3FF)));
    } else {
      appendU16(out, static_cast<uint16_t>(cp));
    }
  }
  appendU16(out, 0);
  return out;
}

std::string decodeUnicode(const std::vector<uint8_t>& utf16be) {
  std::string out;
  size_t i = 0;
  while (i + 1 < utf16be.size()) {
    uint32_t unit = (static_cast<uint32_t>(utf16be[i]) << 8) | utf16be[i + 1];
    i += 2;
    if (unit == 0) {
      break;
    }
    if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < utf16be.size()) {
      uint32_t low =
          (static_cast<uint32_t>(utf16be[i]) << 8) | utf16be[i + 1];
      if (low >= 0xDC00 && low <= 0xDFFF) {
        i += 2;
        appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
        continue;
      }
    }
    if (unit >= 0xD800 && unit <= 0xDFFF) {
      appendUtf8(out, kReplacementChar);
    } else {
      appendUtf8(out, unit);
    }
  }
  return out;
}

PacketBuilder& PacketBuilder::addPrefix(const std::vector<uint8_t>& bytes) {
  prefix_.insert(prefix_.end(), bytes.begin(), bytes.end());
  return *this;
}

PacketBuilder& PacketBuilder::addConnectionId(uint32_t id) {
  headers_.push_back(kHeaderConnectionId);
  appendU32(headers_, id);
  return *this;
}

PacketBuilder& PacketBuilder::addName(const std::string& utf8) {
  auto encoded = encodeUnicode(utf8);
  addByteSequence(kHeaderName, encoded.data(), encoded.size());
  return *this;
}

PacketBuilder& PacketBuilder::addEmptyName() {
  addByteSequence(kHeaderName, nullptr, 0);
  return *this;
}

PacketBuilder& PacketBuilder::addType(const std::string& type) {
  // Type is NUL-terminated ASCII
  std::vector<uint8_t> bytes(type.begin(), type.end());
  bytes.push_back(0);
  addByteSequence(kHeaderType, bytes.data(), bytes.size());
  return *this;
}

PacketBuilder& PacketBuilder::addTarget(const uint8_t* data, size_t length) {
  addByteSequence(kHeaderTarget, data, length);
  return *this;
}

PacketBuilder& PacketBuilder::addLength(uint32_t length) {
  headers_.push_back(kHeaderLength);
  appendU32(headers_, length);
  return *this;
}

PacketBuilder& PacketBuilder::addBody(const uint8_t* data,
                                      size_t length,
                                      bool end) {
  addByteSequence(end ? kHeaderEndOfBody : kHeaderBody, data, length);
  return *this;
}

void PacketBuilder::addByteSequence(uint8_t id,
                                    const uint8_t* data,
                                    size_t length) {
  headers_.push_back(id);
  appendU16(headers_, static_cast<uint16_t>(length + 3));
  if (length > 0) {
    headers_.insert(headers_.end(), data, data + length);
  }
}

std::vector<uint8_t> PacketBuilder::build() const {
  std::vector<uint8_t> packet;
  size_t total = kPacketHeaderSize + prefix_.size() + headers_.size();
  packet.reserve(total);
  packet.push_back(opcode_);
  // Wraps above kMaxPacketLength; senders check packet.size() first
  appendU16(packet, static_cast<uint16_t>(total));
  packet.insert(packet.end(), prefix_.begin(), prefix_.end());
  packet.insert(packet.end(), headers_.begin(), headers_.end());
  return packet;
}

const Header* Response::find(uint8_t id) const {
  for (const auto& header : headers) {
    if (header.id == id) {
      return &header;
    }
  }
  return nullptr;
}

IoResult<Response> parseResponse(const uint8_t* data,
                                 size_t length,
                                 bool connect_response) {
  if (length < kPacketHeaderSize) {
    return IoResult<Response>::error(EPROTO, "short OBEX packet");
  }
  size_t announced = packetLength(data);
  if (announced < kPacketHeaderSize || announced > length) {
    return IoResult<Response>::error(
        EPROTO, fmt::format("bad OBEX packet length {} (have {})", announced,
                            length));
  }

  Response response;
  response.code = data[0];
  size_t pos = kPacketHeaderSize;

  if (connect_response) {
    if (announced < pos + 4) {
      return IoResult<Response>::error(EPROTO, "short CONNECT response");
    }
    ConnectParameters params;
    params.version = data[pos];
    params.flags = data[pos + 1];
    params.max_packet_length =
        static_cast<uint16_t>((data[pos + 2] << 8) | data[pos + 3]);
    response.connect = params;
    pos += 4;
  }

  while (pos < announced) {
    Header header;
    header.id = data[pos];
    switch (headerEncoding(header.id)) {
      case HeaderEncoding::Unicode:
      case HeaderEncoding::ByteSequence: {
        if (pos + 3 > announced) {
          return IoResult<Response>::error(EPROTO, "truncated header");
        }
        size_t hlen = (static_cast<size_t>(data[pos + 1]) << 8) | data[pos + 2];
        if (hlen < 3 || pos + hlen > announced) {
          return IoResult<Response>::error(
              EPROTO, fmt::format("bad length {} for header 0x{:02X}", hlen,
                                  header.id));
        }
        header.bytes.assign(data + pos + 3, data + pos + hlen);
        pos += hlen;
        break;
      }
      case HeaderEncoding::Byte:
        if (pos + 2 > announced) {
          return IoResult<Response>::error(EPROTO, "truncated header");
        }
        header.value = data[pos + 1];
        pos += 2;
        break;
      case HeaderEncoding::FourByte:
        if (pos + 5 > announced) {
          return IoResult<Response>::error(EPROTO, "truncated header");
        }
        header.value = readU32(data + pos + 1);
        pos += 5;
        break;
    }
    response.headers.push_back(std::move(header));
  }

  return IoResult<Response>::success(std::move(response));
}

std::string responseCodeToString(uint8_t code) {
  switch (code) {
    case kResponseContinue: return "Continue";
    case kResponseSuccess: return "Success";
    case kResponseBadRequest: return "Bad Request";
    case 0xC1: return "Unauthorized";
    case kResponseForbidden: return "Forbidden";
    case kResponseNotFound: return "Not Found";
    case 0xC6: return "Not Acceptable";
    case 0xCC: return "Precondition Failed";
    case kResponseInternalError: return "Internal Server Error";
    case 0xD1: return "Not Implemented";
    case 0xD3: return "Service Unavailable";
    default: return fmt::format("0x{:02X}", code);
  }
}

}  // namespace obex
}  // namespace pensync
