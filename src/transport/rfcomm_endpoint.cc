#include "pensync/transport/rfcomm_endpoint.h"

#ifdef PENSYNC_HAS_BLUEZ

#include <errno.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstring>

#include <bluetooth/bluetooth.h>
#include <bluetooth/rfcomm.h>

#include "pensync/transport/bluetooth_url.h"

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "transport"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace transport {

namespace {

// The socket is shut down in close() so blocked calls return, and only
// released in the destructor so the descriptor cannot be reused while
// another thread may still be inside read() or accept().
class RfcommConnection : public Connection {
 public:
  RfcommConnection(int fd, std::string peer)
      : fd_(fd), peer_(std::move(peer)) {}

  ~RfcommConnection() override {
    close();
    ::close(fd_);
  }

  IoResult<size_t> read(uint8_t* buffer, size_t length) override {
    for (;;) {
      if (closed_) {
        return IoResult<size_t>::error(ECANCELED, "connection closed");
      }
      ssize_t n = ::read(fd_, buffer, length);
      if (n > 0) {
        return IoResult<size_t>::success(static_cast<size_t>(n));
      }
      if (n == 0) {
        return IoResult<size_t>::error(ENOTCONN, "connection closed by peer");
      }
      if (errno != EINTR) {
        return IoResult<size_t>::from_errno(errno);
      }
    }
  }

  IoVoidResult write(const uint8_t* data, size_t length) override {
    size_t offset = 0;
    while (offset < length) {
      if (closed_) {
        return IoVoidResult::error(ECANCELED, "connection closed");
      }
      ssize_t n = ::send(fd_, data + offset, length - offset, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        return IoVoidResult::from_errno(errno);
      }
      offset += static_cast<size_t>(n);
    }
    return IoVoidResult::success();
  }

  void close() override {
    if (!closed_.exchange(true)) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

  const std::string& peerAddress() const override { return peer_; }

 private:
  const int fd_;
  const std::string peer_;
  std::atomic<bool> closed_{false};
};

class RfcommAcceptor : public Acceptor {
 public:
  explicit RfcommAcceptor(int fd) : fd_(fd) {}

  ~RfcommAcceptor() override {
    close();
    ::close(fd_);
  }

  IoResult<ConnectionPtr> accept() override {
    for (;;) {
      if (closed_) {
        return IoResult<ConnectionPtr>::error(ECANCELED, "acceptor closed");
      }
      sockaddr_rc remote{};
      socklen_t len = sizeof(remote);
      int fd = ::accept(fd_, reinterpret_cast<sockaddr*>(&remote), &len);
      if (fd >= 0) {
        char peer[18] = {0};
        ba2str(&remote.rc_bdaddr, peer);
        LOG_DEBUG("accepted RFCOMM connection from {}", peer);
        return IoResult<ConnectionPtr>::success(
            std::make_shared<RfcommConnection>(fd, peer));
      }
      if (errno != EINTR) {
        return IoResult<ConnectionPtr>::from_errno(errno);
      }
    }
  }

  void close() override {
    if (!closed_.exchange(true)) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

 private:
  const int fd_;
  std::atomic<bool> closed_{false};
};

int linkModeFor(const BluetoothUrl& url) {
  int lm = 0;
  if (url.flag("authenticate", false)) {
    lm |= RFCOMM_LM_AUTH;
  }
  if (url.flag("encrypt", false)) {
    lm |= RFCOMM_LM_ENCRYPT;
  }
  if (url.flag("master", false)) {
    lm |= RFCOMM_LM_MASTER;
  }
  return lm;
}

IoVoidResult applyLinkMode(int fd, const BluetoothUrl& url) {
  int lm = linkModeFor(url);
  if (lm == 0) {
    return IoVoidResult::success();
  }
  if (::setsockopt(fd, SOL_RFCOMM, RFCOMM_LM, &lm, sizeof(lm)) < 0) {
    return IoVoidResult::from_errno(errno);
  }
  return IoVoidResult::success();
}

}  // namespace

IoResult<ConnectionPtr> RfcommEndpoint::dial(const std::string& address) {
  auto url = parseBluetoothUrl(address);
  if (!url || url->isLocal()) {
    return IoResult<ConnectionPtr>::error(EINVAL,
                                          "invalid peer address: " + address);
  }

  int fd = ::socket(AF_BLUETOOTH, SOCK_STREAM, BTPROTO_RFCOMM);
  if (fd < 0) {
    return IoResult<ConnectionPtr>::from_errno(errno);
  }

  auto lm = applyLinkMode(fd, *url);
  if (!lm.ok()) {
    ::close(fd);
    return propagateError<ConnectionPtr>(lm);
  }

  sockaddr_rc addr{};
  addr.rc_family = AF_BLUETOOTH;
  addr.rc_channel = url->channel;
  std::string device = url->deviceAddress();
  str2ba(device.c_str(), &addr.rc_bdaddr);

  LOG_DEBUG("dialing {} channel {}", device, static_cast<int>(url->channel));
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(fd);
    return IoResult<ConnectionPtr>::from_errno(err);
  }

  return IoResult<ConnectionPtr>::success(
      std::make_shared<RfcommConnection>(fd, device));
}

IoResult<AcceptorPtr> RfcommEndpoint::listen(const std::string& address) {
  auto url = parseBluetoothUrl(address);
  if (!url) {
    return IoResult<AcceptorPtr>::error(EINVAL,
                                        "invalid listen address: " + address);
  }

  int fd = ::socket(AF_BLUETOOTH, SOCK_STREAM, BTPROTO_RFCOMM);
  if (fd < 0) {
    return IoResult<AcceptorPtr>::from_errno(errno);
  }

  sockaddr_rc addr{};
  addr.rc_family = AF_BLUETOOTH;
  addr.rc_channel = url->channel;
  // Zero bdaddr binds every local adapter
  if (!url->isLocal()) {
    std::string device = url->deviceAddress();
    str2ba(device.c_str(), &addr.rc_bdaddr);
  }

  auto lm = applyLinkMode(fd, *url);
  if (!lm.ok()) {
    ::close(fd);
    return propagateError<AcceptorPtr>(lm);
  }

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
      ::listen(fd, 1) < 0) {
    int err = errno;
    ::close(fd);
    return IoResult<AcceptorPtr>::from_errno(err);
  }

  LOG_INFO("listening on RFCOMM channel {}", static_cast<int>(url->channel));
  return IoResult<AcceptorPtr>::success(std::make_shared<RfcommAcceptor>(fd));
}

}  // namespace transport
}  // namespace pensync

#endif  // PENSYNC_HAS_BLUEZ
