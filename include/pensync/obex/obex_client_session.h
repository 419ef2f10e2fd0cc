#ifndef PENSYNC_OBEX_OBEX_CLIENT_SESSION_H
#define PENSYNC_OBEX_OBEX_CLIENT_SESSION_H

#include <atomic>
#include <mutex>

#include "pensync/obex/file_transfer_session.h"
#include "pensync/obex/obex_codec.h"
#include "pensync/transport/connection.h"

namespace pensync {
namespace obex {

/**
 * OBEX client over a connected transport.
 *
 * After a successful negotiate() every request carries the ConnectionId
 * header handed out by the peer.
 */
class ObexClientSession : public FileTransferSession {
 public:
  explicit ObexClientSession(transport::ConnectionPtr connection,
                             bool trace = false);

  IoResult<NegotiateResult> negotiate(
      const std::vector<uint8_t>& target) override;
  IoResult<uint8_t> setRemotePath(const std::string& name) override;
  IoResult<uint8_t> get(const GetRequest& request,
                        const BodySink& sink) override;
  IoResult<uint8_t> remove(const std::string& name) override;
  IoVoidResult teardown() override;
  void abort() override;

  uint16_t peerMaxPacketLength() const { return peer_max_packet_; }

  /**
   * Largest request the session will send: the peer's announced maximum, or
   * 0xFFFF before negotiate().
   */
  size_t maxRequestLength() const;

 private:
  IoResult<Response> exchange(const std::vector<uint8_t>& packet,
                              bool connect_response);
  IoVoidResult send(const std::vector<uint8_t>& packet);
  IoResult<std::vector<uint8_t>> receive();
  IoVoidResult readExact(uint8_t* buffer, size_t length);
  void addConnectionId(PacketBuilder& builder) const;

  transport::ConnectionPtr connection_;
  const bool trace_;
  std::mutex write_mutex_;
  // Read by teardown() from other threads
  std::atomic<bool> has_connection_id_{false};
  std::atomic<uint32_t> connection_id_{0};
  std::atomic<uint16_t> peer_max_packet_{0};
  std::atomic<bool> torn_down_{false};
  std::atomic<bool> aborted_{false};
};

}  // namespace obex
}  // namespace pensync

#endif  // PENSYNC_OBEX_OBEX_CLIENT_SESSION_H
