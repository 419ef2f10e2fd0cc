#ifndef PENSYNC_OBEX_FILE_TRANSFER_SESSION_H
#define PENSYNC_OBEX_FILE_TRANSFER_SESSION_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "pensync/core/compat.h"
#include "pensync/core/io_result.h"

namespace pensync {
namespace obex {

struct NegotiateResult {
  uint8_t response_code{0};
  optional<uint32_t> connection_id;
};

struct GetRequest {
  optional<std::string> name;
  optional<std::string> type;
};

// Receives body chunks in order as they arrive
using BodySink = std::function<void(const uint8_t* data, size_t length)>;

/**
 * Request/response primitives of a file-transfer session.
 *
 * Each call returns the peer's response code on a completed exchange and an
 * error only when the exchange itself failed (transport error or malformed
 * reply). Callers compare the code against kResponseSuccess.
 *
 * Requests are issued by one thread at a time. teardown() and abort() may be
 * called from another thread while a request is in flight; they unblock that
 * request.
 */
class FileTransferSession {
 public:
  virtual ~FileTransferSession() = default;

  virtual IoResult<NegotiateResult> negotiate(
      const std::vector<uint8_t>& target) = 0;

  /**
   * "" selects the root folder, ".." the parent, anything else a child.
   */
  virtual IoResult<uint8_t> setRemotePath(const std::string& name) = 0;

  virtual IoResult<uint8_t> get(const GetRequest& request,
                                const BodySink& sink) = 0;

  virtual IoResult<uint8_t> remove(const std::string& name) = 0;

  /**
   * Send DISCONNECT and close the transport. Does not wait for the reply.
   */
  virtual IoVoidResult teardown() = 0;

  /**
   * Close the transport without sending anything. Never blocks; a teardown()
   * stuck in its write returns with an error.
   */
  virtual void abort() = 0;
};

using FileTransferSessionPtr = std::shared_ptr<FileTransferSession>;

}  // namespace obex
}  // namespace pensync

#endif  // PENSYNC_OBEX_FILE_TRANSFER_SESSION_H
