#ifndef PENSYNC_TRANSPORT_CONNECTION_H
#define PENSYNC_TRANSPORT_CONNECTION_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "pensync/core/io_result.h"

namespace pensync {
namespace transport {

/**
 * A connected, stream-oriented byte channel to a peer.
 *
 * read() and write() block. close() may be called from any thread and makes
 * a read() blocked in another thread return with an error; it is idempotent.
 */
class Connection {
 public:
  virtual ~Connection() = default;

  /**
   * Read at most `length` bytes.
   * @return Number of bytes read (always > 0), or an error. End of stream is
   *         reported as an error with code ENOTCONN.
   */
  virtual IoResult<size_t> read(uint8_t* buffer, size_t length) = 0;

  /**
   * Write the whole buffer or fail.
   */
  virtual IoVoidResult write(const uint8_t* data, size_t length) = 0;

  virtual void close() = 0;

  virtual const std::string& peerAddress() const = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

/**
 * A listening endpoint. accept() blocks until a peer connects or close() is
 * called from another thread.
 */
class Acceptor {
 public:
  virtual ~Acceptor() = default;

  virtual IoResult<ConnectionPtr> accept() = 0;

  virtual void close() = 0;
};

using AcceptorPtr = std::shared_ptr<Acceptor>;

/**
 * Entry point for obtaining connections. Address strings are opaque to the
 * callers; only the endpoint implementation interprets them.
 */
class TransportEndpoint {
 public:
  virtual ~TransportEndpoint() = default;

  /**
   * Dial a peer. Blocks until the connection is established or fails.
   */
  virtual IoResult<ConnectionPtr> dial(const std::string& address) = 0;

  /**
   * Bind and listen on a local address.
   */
  virtual IoResult<AcceptorPtr> listen(const std::string& address) = 0;
};

using TransportEndpointSharedPtr = std::shared_ptr<TransportEndpoint>;

}  // namespace transport
}  // namespace pensync

#endif  // PENSYNC_TRANSPORT_CONNECTION_H
