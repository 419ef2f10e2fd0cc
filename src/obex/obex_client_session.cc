#include "pensync/obex/obex_client_session.h"

#include <cerrno>

#include <fmt/format.h>

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "obex"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace obex {

ObexClientSession::ObexClientSession(transport::ConnectionPtr connection,
                                     bool trace)
    : connection_(std::move(connection)), trace_(trace) {}

IoResult<NegotiateResult> ObexClientSession::negotiate(
    const std::vector<uint8_t>& target) {
  std::vector<uint8_t> params = {
      kObexVersion, 0x00,
      static_cast<uint8_t>(kDefaultMaxPacketLength >> 8),
      static_cast<uint8_t>(kDefaultMaxPacketLength & 0xFF)};

  PacketBuilder builder(kOpConnect);
  builder.addPrefix(params);
  if (!target.empty()) {
    builder.addTarget(target.data(), target.size());
  }

  auto response = exchange(builder.build(), true);
  if (!response.ok()) {
    return propagateError<NegotiateResult>(response);
  }

  NegotiateResult result;
  result.response_code = response->code;
  if (response->code == kResponseSuccess) {
    if (response->connect) {
      peer_max_packet_ = response->connect->max_packet_length;
    }
    if (const Header* id = response->find(kHeaderConnectionId)) {
      connection_id_ = id->value;
      has_connection_id_ = true;
      result.connection_id = id->value;
    }
  }
  return IoResult<NegotiateResult>::success(result);
}

IoResult<uint8_t> ObexClientSession::setRemotePath(const std::string& name) {
  PacketBuilder builder(kOpSetPath);
  if (name == "..") {
    builder.addPrefix({kSetPathBackup | kSetPathNoCreate, 0x00});
    addConnectionId(builder);
  } else {
    builder.addPrefix({kSetPathNoCreate, 0x00});
    addConnectionId(builder);
    if (name.empty()) {
      builder.addEmptyName();
    } else {
      builder.addName(name);
    }
  }

  auto response = exchange(builder.build(), false);
  if (!response.ok()) {
    return propagateError<uint8_t>(response);
  }
  return IoResult<uint8_t>::success(response->code);
}

IoResult<uint8_t> ObexClientSession::get(const GetRequest& request,
                                         const BodySink& sink) {
  PacketBuilder first(kOpGetFinal);
  addConnectionId(first);
  if (request.name) {
    first.addName(*request.name);
  }
  if (request.type) {
    first.addType(*request.type);
  }

  std::vector<uint8_t> packet = first.build();
  for (;;) {
    auto response = exchange(packet, false);
    if (!response.ok()) {
      return propagateError<uint8_t>(response);
    }

    for (const auto& header : response->headers) {
      if ((header.id == kHeaderBody || header.id == kHeaderEndOfBody) &&
          !header.bytes.empty() && sink) {
        sink(header.bytes.data(), header.bytes.size());
      }
    }

    if (response->code != kResponseContinue) {
      return IoResult<uint8_t>::success(response->code);
    }

    // Ask for the next part
    PacketBuilder next(kOpGetFinal);
    addConnectionId(next);
    packet = next.build();
  }
}

IoResult<uint8_t> ObexClientSession::remove(const std::string& name) {
  // A PUT without body deletes the named object
  PacketBuilder builder(kOpPutFinal);
  addConnectionId(builder);
  builder.addName(name);

  auto response = exchange(builder.build(), false);
  if (!response.ok()) {
    return propagateError<uint8_t>(response);
  }
  return IoResult<uint8_t>::success(response->code);
}

IoVoidResult ObexClientSession::teardown() {
  if (torn_down_.exchange(true)) {
    if (aborted_) {
      return IoVoidResult::error(ECANCELED, "session aborted");
    }
    return IoVoidResult::success();
  }

  PacketBuilder builder(kOpDisconnect);
  addConnectionId(builder);
  auto sent = send(builder.build());
  connection_->close();
  if (!sent.ok()) {
    LOG_DEBUG("DISCONNECT not delivered: {}", sent.error_message());
  }
  return sent;
}

void ObexClientSession::abort() {
  aborted_ = true;
  torn_down_ = true;
  // Not under write_mutex_: closing is what releases a blocked write
  connection_->close();
}

size_t ObexClientSession::maxRequestLength() const {
  size_t limit = kMaxPacketLength;
  uint16_t peer = peer_max_packet_;
  if (peer != 0 && peer < limit) {
    limit = peer;
  }
  return limit;
}

IoResult<Response> ObexClientSession::exchange(
    const std::vector<uint8_t>& packet,
    bool connect_response) {
  if (packet.size() > maxRequestLength()) {
    return IoResult<Response>::error(
        EMSGSIZE, fmt::format("request of {} bytes exceeds the {} byte limit",
                              packet.size(), maxRequestLength()));
  }

  auto sent = send(packet);
  if (!sent.ok()) {
    return propagateError<Response>(sent);
  }

  auto reply = receive();
  if (!reply.ok()) {
    return propagateError<Response>(reply);
  }

  auto response = parseResponse(reply->data(), reply->size(), connect_response);
  if (response.ok() && trace_) {
    LOG_DEBUG("opcode 0x{:02X} -> {} ({} headers)", packet[0],
              responseCodeToString(response->code), response->headers.size());
  }
  return response;
}

IoVoidResult ObexClientSession::send(const std::vector<uint8_t>& packet) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (torn_down_ && packet[0] != kOpDisconnect) {
    return IoVoidResult::error(ECANCELED, "session torn down");
  }
  return connection_->write(packet.data(), packet.size());
}

IoResult<std::vector<uint8_t>> ObexClientSession::receive() {
  std::vector<uint8_t> packet(kPacketHeaderSize);
  auto head = readExact(packet.data(), kPacketHeaderSize);
  if (!head.ok()) {
    return propagateError<std::vector<uint8_t>>(head);
  }

  size_t length = packetLength(packet.data());
  if (length < kPacketHeaderSize) {
    return IoResult<std::vector<uint8_t>>::error(EPROTO,
                                                 "bad OBEX packet length");
  }

  packet.resize(length);
  if (length > kPacketHeaderSize) {
    auto body = readExact(packet.data() + kPacketHeaderSize,
                          length - kPacketHeaderSize);
    if (!body.ok()) {
      return propagateError<std::vector<uint8_t>>(body);
    }
  }
  return IoResult<std::vector<uint8_t>>::success(std::move(packet));
}

IoVoidResult ObexClientSession::readExact(uint8_t* buffer, size_t length) {
  size_t offset = 0;
  while (offset < length) {
    auto n = connection_->read(buffer + offset, length - offset);
    if (!n.ok()) {
      return propagateError<std::nullptr_t>(n);
    }
    offset += *n;
  }
  return IoVoidResult::success();
}

void ObexClientSession::addConnectionId(PacketBuilder& builder) const {
  if (has_connection_id_) {
    builder.addConnectionId(connection_id_);
  }
}

}  // namespace obex
}  // namespace pensync
