#ifndef PENSYNC_TESTS_MOCKS_FAKE_TRANSPORT_H
#define PENSYNC_TESTS_MOCKS_FAKE_TRANSPORT_H

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "pensync/transport/connection.h"

namespace pensync {
namespace test {

/**
 * In-memory connection. Bytes pushed with feed() are returned by read();
 * read() blocks until data arrives, the peer hangs up or close() is called.
 * Everything written is recorded. An optional responder is called for every
 * write and may feed a reply, which is how scripted peers are built.
 * setBlockWrites() makes write() hang until close(), like a send() into a
 * full socket buffer.
 */
class FakeConnection : public transport::Connection {
 public:
  using Responder =
      std::function<void(FakeConnection&, const std::vector<uint8_t>&)>;

  explicit FakeConnection(std::string peer = "fake-peer")
      : peer_(std::move(peer)) {}

  IoResult<size_t> read(uint8_t* buffer, size_t length) override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || hung_up_ || !inbound_.empty(); });
    if (closed_) {
      return IoResult<size_t>::error(EBADF, "connection closed");
    }
    if (inbound_.empty()) {
      return IoResult<size_t>::error(ENOTCONN, "end of stream");
    }
    size_t n = std::min(length, inbound_.size());
    for (size_t i = 0; i < n; ++i) {
      buffer[i] = inbound_.front();
      inbound_.pop_front();
    }
    return IoResult<size_t>::success(n);
  }

  IoVoidResult write(const uint8_t* data, size_t length) override {
    std::vector<uint8_t> frame(data, data + length);
    Responder responder;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (block_writes_ && !closed_) {
        ++blocked_writes_;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return closed_; });
      }
      if (closed_) {
        return IoVoidResult::error(EPIPE, "connection closed");
      }
      if (fail_writes_) {
        return IoVoidResult::error(EIO, "write failed");
      }
      writes_.push_back(frame);
      responder = responder_;
    }
    cv_.notify_all();
    if (responder) {
      responder(*this, frame);
    }
    return IoVoidResult::success();
  }

  void close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      closed_ = true;
    }
    cv_.notify_all();
  }

  const std::string& peerAddress() const override { return peer_; }

  void feed(const std::vector<uint8_t>& bytes) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      inbound_.insert(inbound_.end(), bytes.begin(), bytes.end());
    }
    cv_.notify_all();
  }

  // Peer closes its end: pending bytes are still delivered, then EOF
  void hangUp() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hung_up_ = true;
    }
    cv_.notify_all();
  }

  void setResponder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
  }

  void setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
  }

  void setBlockWrites(bool block) {
    std::lock_guard<std::mutex> lock(mutex_);
    block_writes_ = block;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::vector<std::vector<uint8_t>> writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
  }

  bool waitForWrites(size_t count, std::chrono::milliseconds timeout =
                                       std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout,
                        [&]() { return writes_.size() >= count; });
  }

  bool waitForClose(std::chrono::milliseconds timeout =
                        std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return closed_; });
  }

  // Waits until a write is stuck in setBlockWrites() mode
  bool waitForBlockedWrite(std::chrono::milliseconds timeout =
                               std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return blocked_writes_ > 0; });
  }

 private:
  const std::string peer_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<uint8_t> inbound_;
  std::vector<std::vector<uint8_t>> writes_;
  Responder responder_;
  bool closed_{false};
  bool hung_up_{false};
  bool fail_writes_{false};
  bool block_writes_{false};
  size_t blocked_writes_{0};
};

using FakeConnectionPtr = std::shared_ptr<FakeConnection>;

/**
 * Acceptor whose accept() hands out connections pushed with deliver().
 */
class FakeAcceptor : public transport::Acceptor {
 public:
  IoResult<transport::ConnectionPtr> accept() override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !pending_.empty(); });
    if (closed_) {
      return IoResult<transport::ConnectionPtr>::error(EBADF,
                                                       "acceptor closed");
    }
    auto connection = pending_.front();
    pending_.pop_front();
    return IoResult<transport::ConnectionPtr>::success(connection);
  }

  void close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void deliver(transport::ConnectionPtr connection) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.push_back(std::move(connection));
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<transport::ConnectionPtr> pending_;
  bool closed_{false};
};

/**
 * Endpoint with scripted dial results. dial() of an address without a
 * script fails with ECONNREFUSED. A dial can be held until release() to
 * test overlapping attempts.
 */
class FakeEndpoint : public transport::TransportEndpoint {
 public:
  IoResult<transport::ConnectionPtr> dial(const std::string& address) override {
    std::unique_lock<std::mutex> lock(mutex_);
    dials_.push_back(address);
    cv_.notify_all();
    cv_.wait(lock, [&]() { return held_.count(address) == 0; });

    auto it = connections_.find(address);
    if (it == connections_.end() || it->second.empty()) {
      return IoResult<transport::ConnectionPtr>::error(ECONNREFUSED,
                                                       "connection refused");
    }
    auto connection = it->second.front();
    it->second.pop_front();
    return IoResult<transport::ConnectionPtr>::success(connection);
  }

  IoResult<transport::AcceptorPtr> listen(const std::string& address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    listen_addresses_.push_back(address);
    if (fail_listen_) {
      return IoResult<transport::AcceptorPtr>::error(EADDRINUSE,
                                                     "address in use");
    }
    cv_.notify_all();
    return IoResult<transport::AcceptorPtr>::success(acceptor_);
  }

  void addConnection(const std::string& address,
                     transport::ConnectionPtr connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[address].push_back(std::move(connection));
  }

  void hold(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_[address] = true;
  }

  void release(const std::string& address) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      held_.erase(address);
    }
    cv_.notify_all();
  }

  void setFailListen(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_listen_ = fail;
  }

  bool waitForDial(const std::string& address,
                   std::chrono::milliseconds timeout =
                       std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() {
      return std::find(dials_.begin(), dials_.end(), address) != dials_.end();
    });
  }

  bool waitForListen(std::chrono::milliseconds timeout =
                         std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout,
                        [&]() { return !listen_addresses_.empty(); });
  }

  std::vector<std::string> dials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dials_;
  }

  std::shared_ptr<FakeAcceptor> acceptor() const { return acceptor_; }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, std::deque<transport::ConnectionPtr>> connections_;
  std::map<std::string, bool> held_;
  std::vector<std::string> dials_;
  std::vector<std::string> listen_addresses_;
  bool fail_listen_{false};
  std::shared_ptr<FakeAcceptor> acceptor_{std::make_shared<FakeAcceptor>()};
};

}  // namespace test
}  // namespace pensync

#endif  // PENSYNC_TESTS_MOCKS_FAKE_TRANSPORT_H
