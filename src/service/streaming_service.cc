#include "pensync/service/streaming_service.h"

#include <algorithm>
#include <ctime>
#include <iterator>

#include <fmt/format.h>

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "streaming"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace service {

namespace {

constexpr size_t kReadBufferSize = 1024;

std::string hexDump(const uint8_t* data, size_t length) {
  std::string out;
  out.reserve(length * 3);
  for (size_t i = 0; i < length; ++i) {
    if (i > 0) {
      out += ' ';
    }
    out += fmt::format("{:02X}", data[i]);
  }
  return out;
}

}  // namespace

// Initiator: dials the tablet. The connection is checked for staleness by
// the dispatch thread, which closes it if the attempt was superseded.

class StreamingService::Initiator : public WorkerThread {
 public:
  Initiator(uint64_t generation,
            std::string address,
            transport::TransportEndpointSharedPtr endpoint,
            StreamingService& owner)
      : WorkerThread("stream-connect", generation),
        address_(std::move(address)),
        endpoint_(std::move(endpoint)),
        owner_(owner) {}

  ~Initiator() override {
    cancel();
    join();
  }

  // dial() cannot be interrupted; a cancelled attempt closes its result.
  void cancel() override { markCancelled(); }

 protected:
  void run() override {
    auto dialed = endpoint_->dial(address_);
    if (!dialed.ok()) {
      if (!cancelled()) {
        LOG_ERROR("connection to {} failed: {}", address_,
                  dialed.error_message());
        owner_.postEvent(generation(), ConnectionBroken{});
      }
      return;
    }
    if (cancelled()) {
      (*dialed)->close();
      return;
    }
    owner_.postEvent(generation(), SessionOpened{*dialed, address_});
  }

  void onRunFailed() override {
    owner_.postEvent(generation(), ConnectionBroken{});
  }

 private:
  const std::string address_;
  transport::TransportEndpointSharedPtr endpoint_;
  StreamingService& owner_;
};

// Listener: accepts tablet connections until cancelled.

class StreamingService::Listener : public WorkerThread {
 public:
  Listener(uint64_t epoch,
           std::string address,
           transport::TransportEndpointSharedPtr endpoint,
           StreamingService& owner)
      : WorkerThread("stream-listen", epoch),
        address_(std::move(address)),
        endpoint_(std::move(endpoint)),
        owner_(owner) {}

  ~Listener() override {
    cancel();
    join();
  }

  void cancel() override {
    if (!markCancelled()) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (acceptor_) {
      acceptor_->close();
    }
  }

 protected:
  void run() override {
    auto listening = endpoint_->listen(address_);
    if (!listening.ok()) {
      owner_.postEvent(generation(),
                       ListenerFailed{fmt::format("listen on {}: {}", address_,
                                                  listening.error_message())});
      return;
    }

    transport::AcceptorPtr acceptor = *listening;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled()) {
        acceptor->close();
        return;
      }
      acceptor_ = acceptor;
    }
    LOG_DEBUG("listening on {}", address_);

    for (;;) {
      auto accepted = acceptor->accept();
      if (!accepted.ok()) {
        if (!cancelled()) {
          owner_.postEvent(generation(),
                           ListenerFailed{fmt::format(
                               "accept on {}: {}", address_,
                               accepted.error_message())});
        }
        return;
      }
      if (cancelled()) {
        (*accepted)->close();
        return;
      }
      owner_.postEvent(generation(), InboundConnection{*accepted});
    }
  }

  void onRunFailed() override {
    owner_.postEvent(generation(), ListenerFailed{"listener terminated"});
  }

 private:
  const std::string address_;
  transport::TransportEndpointSharedPtr endpoint_;
  StreamingService& owner_;

  std::mutex mutex_;
  transport::AcceptorPtr acceptor_;
};

// Session worker: owns the live connection and reads reports from it.

class StreamingService::SessionWorker : public WorkerThread {
 public:
  SessionWorker(uint64_t generation,
                transport::ConnectionPtr connection,
                bool trace,
                StreamingService& owner)
      : WorkerThread("stream-session", generation),
        connection_(std::move(connection)),
        trace_(trace),
        owner_(owner) {}

  ~SessionWorker() override {
    cancel();
    join();
  }

  void cancel() override {
    if (markCancelled()) {
      connection_->close();
    }
  }

  IoVoidResult write(const std::vector<uint8_t>& frame) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (trace_) {
      LOG_INFO("send {}", hexDump(frame.data(), frame.size()));
    }
    return connection_->write(frame.data(), frame.size());
  }

 protected:
  void run() override {
    uint8_t buffer[kReadBufferSize];
    for (;;) {
      auto received = connection_->read(buffer, sizeof(buffer));
      if (!received.ok()) {
        if (!cancelled()) {
          LOG_INFO("connection to {} lost: {}", connection_->peerAddress(),
                   received.error_message());
          owner_.postEvent(generation(), ConnectionBroken{});
        }
        return;
      }
      if (trace_) {
        LOG_INFO("received {}", hexDump(buffer, *received));
      }
      owner_.postEvent(generation(),
                       DataReceived{std::vector<uint8_t>(
                           buffer, buffer + *received)});
    }
  }

  void onRunFailed() override {
    owner_.postEvent(generation(), ConnectionBroken{});
  }

 private:
  transport::ConnectionPtr connection_;
  const bool trace_;
  StreamingService& owner_;
  std::mutex write_mutex_;
};

StreamingService::StreamingService(StreamingServiceConfig config,
                                   transport::TransportEndpointSharedPtr endpoint,
                                   DeviceDiscoverySharedPtr discovery,
                                   hid::ReportDecoderPtr decoder,
                                   hid::PathFilterPtr filter)
    : config_(std::move(config)),
      endpoint_(std::move(endpoint)),
      discovery_(std::move(discovery)),
      decoder_(std::move(decoder)),
      filter_(std::move(filter)),
      devices_(config_.devices) {
  if (!decoder_) {
    decoder_ = std::make_unique<hid::HidReportDecoder>();
  }
  if (!filter_) {
    filter_ = std::make_unique<hid::StrokePathFilter>();
  }
  dispatcher_thread_ = std::make_unique<event::DispatcherThread>(
      event::createLibeventDispatcherFactory()->createDispatcher("streaming"));
  dispatcher_thread_->start();
}

StreamingService::~StreamingService() {
  stop();
  dispatcher_thread_->stop();
}

bool StreamingService::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!listener_) {
      ++listener_epoch_;
      listener_ = std::make_shared<Listener>(
          listener_epoch_, config_.listen_address, endpoint_, *this);
      listener_->start();
      if (state_ == ConnectionState::Disconnected) {
        setStateLocked(ConnectionState::Listening);
      }
    }
  }

  std::vector<std::string> devices = deviceAddresses();
  if (devices.empty() && discovery_) {
    if (config_.debug) {
      LOG_INFO("searching for paired pen tablets");
    }
    devices =
        selectSyncAddresses(discovery_->findPeers(ServiceClass::SerialPort));
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = devices;
  }

  if (devices.empty()) {
    LOG_INFO("no pen tablet address known, waiting on {}",
             config_.listen_address);
    return false;
  }

  ConnectionState current = state();
  if (current == ConnectionState::Connected ||
      current == ConnectionState::Connecting) {
    return true;
  }
  connect(devices.front());
  return true;
}

void StreamingService::stop() {
  std::vector<WorkerThreadSharedPtr> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.debug) {
      LOG_INFO("stop");
    }
    ++generation_;
    ++listener_epoch_;
    retireSessionWorkersLocked();
    retireListenerLocked();
    workers.swap(retired_);
    clearSessionStateLocked();
    setStateLocked(ConnectionState::Disconnected);
  }

  for (auto& worker : workers) {
    worker->join();
  }
}

void StreamingService::connect(const std::string& address) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.debug) {
      LOG_INFO("connect to {}", address);
    }

    ++generation_;
    if (initiator_ && state_ == ConnectionState::Connecting) {
      LOG_DEBUG("dropping connection attempt of generation {}",
                initiator_->generation());
    }
    retireSessionWorkersLocked();
    clearSessionStateLocked();

    initiator_ =
        std::make_shared<Initiator>(generation_, address, endpoint_, *this);
    initiator_->start();
    setStateLocked(ConnectionState::Connecting);
  }
  reapRetiredWorkers();
}

void StreamingService::disconnect() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected) {
      return;
    }
    if (config_.debug) {
      LOG_INFO("disconnect from {}", connected_device_.value_or(""));
    }
    ++generation_;
    retireSessionWorkersLocked();
    enterIdleLocked();
  }
  reapRetiredWorkers();
}

bool StreamingService::setSyncMode(hid::SyncMode mode) {
  std::shared_ptr<SessionWorker> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hid::isRecognizedMode(mode)) {
      LOG_WARNING("unrecognized mode {}", static_cast<int>(mode));
      return false;
    }
    if (mode == mode_ || state_ != ConnectionState::Connected ||
        !session_worker_) {
      return false;
    }
    worker = session_worker_;
  }

  auto written = worker->write(hid::encodeModeCommand(mode));
  if (!written.ok()) {
    LOG_WARNING("sending mode {} failed: {}", hid::syncModeToString(mode),
                written.error_message());
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (session_worker_ == worker) {
    mode_ = mode;
  }
  return true;
}

bool StreamingService::eraseSync() {
  std::shared_ptr<SessionWorker> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected || !session_worker_) {
      return false;
    }
    paths_.clear();
    filter_->reset();
    worker = session_worker_;
  }

  auto written = worker->write(hid::encodeEraseCommand());
  if (!written.ok()) {
    LOG_WARNING("sending erase failed: {}", written.error_message());
    return false;
  }
  return true;
}

bool StreamingService::syncClock() {
  auto fields = hid::clockFieldsFromLocalTime(std::time(nullptr));
  return writeCommand(hid::encodeClockSyncCommand(fields), "clock sync");
}

bool StreamingService::identify() {
  return writeCommand(hid::encodeIdentifyCommand(config_.client_platform),
                      "identify");
}

bool StreamingService::writeCommand(const std::vector<uint8_t>& frame,
                                    const char* what) {
  std::shared_ptr<SessionWorker> worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected || !session_worker_) {
      return false;
    }
    worker = session_worker_;
  }

  auto written = worker->write(frame);
  if (!written.ok()) {
    LOG_WARNING("sending {} failed: {}", what, written.error_message());
    return false;
  }
  return true;
}

ConnectionState StreamingService::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

hid::SyncMode StreamingService::mode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mode_;
}

std::vector<hid::SyncPath> StreamingService::paths() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return paths_;
}

optional<std::string> StreamingService::connectedDevice() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_device_;
}

std::vector<std::string> StreamingService::deviceAddresses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_;
}

void StreamingService::postEvent(uint64_t tag, Event event) {
  dispatcher_thread_->dispatcher().post(
      [this, tag, event]() mutable { handleEvent(tag, event); });
}

void StreamingService::handleEvent(uint64_t tag, Event& event) {
  bool handshake = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isCurrentLocked(tag, event)) {
      dropStaleEventLocked(event);
    } else {
      visit(overloaded{
                [this](SessionOpened& e) { onSessionOpenedLocked(e); },
                [this](InboundConnection& e) { onInboundConnectionLocked(e); },
                [this](DataReceived& e) { onDataReceivedLocked(e); },
                [this](ConnectionBroken&) { onConnectionBrokenLocked(); },
                [this](ListenerFailed& e) { onListenerFailedLocked(e); },
            },
            event);
      handshake = (holds_alternative<SessionOpened>(event) ||
                   holds_alternative<InboundConnection>(event)) &&
                  state_ == ConnectionState::Connected;
    }
  }

  if (handshake) {
    runHandshake();
  }
  reapRetiredWorkers();
}

bool StreamingService::isCurrentLocked(uint64_t tag, const Event& event) const {
  if (holds_alternative<InboundConnection>(event) ||
      holds_alternative<ListenerFailed>(event)) {
    return tag == listener_epoch_;
  }
  return tag == generation_;
}

void StreamingService::dropStaleEventLocked(Event& event) {
  visit(overloaded{
            [](SessionOpened& e) {
              LOG_DEBUG("closing superseded connection to {}", e.address);
              e.connection->close();
            },
            [](InboundConnection& e) {
              LOG_DEBUG("closing connection from {} accepted by a stopped "
                        "listener",
                        e.connection->peerAddress());
              e.connection->close();
            },
            [](DataReceived&) {},
            [](ConnectionBroken&) {},
            [](ListenerFailed&) {},
        },
        event);
}

void StreamingService::onSessionOpenedLocked(SessionOpened& opened) {
  startSessionLocked(opened.connection, opened.address);
}

void StreamingService::onInboundConnectionLocked(InboundConnection& inbound) {
  if (state_ == ConnectionState::Connected) {
    LOG_WARNING("rejecting connection from {}, a session is already live",
                inbound.connection->peerAddress());
    inbound.connection->close();
    return;
  }
  if (config_.debug) {
    LOG_INFO("accepted connection from {}", inbound.connection->peerAddress());
  }
  startSessionLocked(inbound.connection, inbound.connection->peerAddress());
}

void StreamingService::startSessionLocked(transport::ConnectionPtr connection,
                                          const std::string& address) {
  ++generation_;
  retireSessionWorkersLocked();
  clearSessionStateLocked();

  session_worker_ = std::make_shared<SessionWorker>(
      generation_, std::move(connection), config_.debug, *this);
  session_worker_->start();

  connected_device_ = address;
  setStateLocked(ConnectionState::Connected);
}

void StreamingService::onDataReceivedLocked(const DataReceived& data) {
  auto records = decoder_->decode(data.bytes.data(), data.bytes.size());
  for (auto& record : records) {
    if (!record) {
      LOG_WARNING("skipping undecodable report record");
      continue;
    }
    visit(overloaded{
              [this](const hid::CaptureReport& report) {
                processCaptureReportLocked(report);
              },
              [](const hid::UnrecognizedReport& report) {
                LOG_DEBUG("ignoring report 0x{:02X} ({} bytes)",
                          report.report_id, report.payload.size());
              },
          },
          *record);
  }
}

void StreamingService::processCaptureReportLocked(
    const hid::CaptureReport& report) {
  notifyLocked([report](StreamingServiceCallbacks& callbacks) {
    callbacks.onCaptureReport(report);
  });

  auto completed = filter_->filter(report);
  if (!completed.empty()) {
    notifyLocked([completed](StreamingServiceCallbacks& callbacks) {
      callbacks.onDrawnPaths(completed);
    });
    paths_.insert(paths_.end(), completed.begin(), completed.end());
  }

  if (report.hasEraseFlag()) {
    paths_.clear();
    filter_->reset();
    notifyLocked(
        [](StreamingServiceCallbacks& callbacks) { callbacks.onErase(); });
  }

  if (report.hasSaveFlag()) {
    notifyLocked(
        [](StreamingServiceCallbacks& callbacks) { callbacks.onSave(); });
  }
}

void StreamingService::onConnectionBrokenLocked() {
  if (config_.debug) {
    LOG_INFO("connection broken");
  }
  retireSessionWorkersLocked();
  enterIdleLocked();
}

void StreamingService::onListenerFailedLocked(const ListenerFailed& failed) {
  LOG_ERROR("listener stopped: {}", failed.reason);
  ++listener_epoch_;
  retireListenerLocked();
  if (state_ == ConnectionState::Listening) {
    setStateLocked(ConnectionState::Disconnected);
  }
}

void StreamingService::runHandshake() {
  if (!setSyncMode(hid::SyncMode::File)) {
    LOG_WARNING("could not select {} mode",
                hid::syncModeToString(hid::SyncMode::File));
  }
  if (!syncClock()) {
    LOG_WARNING("could not set the tablet clock");
  }
  if (!identify()) {
    LOG_WARNING("could not send the identification command");
  }
}

void StreamingService::enterIdleLocked() {
  clearSessionStateLocked();
  setStateLocked(ConnectionState::Disconnected);
  if (listener_) {
    setStateLocked(ConnectionState::Listening);
  }
}

void StreamingService::clearSessionStateLocked() {
  mode_ = hid::SyncMode::None;
  paths_.clear();
  filter_->reset();
  connected_device_.reset();
}

void StreamingService::setStateLocked(ConnectionState new_state) {
  if (new_state == state_) {
    return;
  }
  ConnectionState old_state = state_;
  state_ = new_state;

  if (config_.debug) {
    LOG_INFO("device state changed from {} to {}",
             connectionStateToString(old_state),
             connectionStateToString(new_state));
  }

  notifyLocked([old_state, new_state](StreamingServiceCallbacks& callbacks) {
    callbacks.onStreamingStateChange(old_state, new_state);
  });
}

void StreamingService::retireSessionWorkersLocked() {
  if (initiator_) {
    initiator_->cancel();
    retired_.push_back(initiator_);
    initiator_.reset();
  }
  if (session_worker_) {
    session_worker_->cancel();
    retired_.push_back(session_worker_);
    session_worker_.reset();
  }
}

void StreamingService::retireListenerLocked() {
  if (listener_) {
    listener_->cancel();
    retired_.push_back(listener_);
    listener_.reset();
  }
}

void StreamingService::notifyLocked(
    std::function<void(StreamingServiceCallbacks&)> fn) {
  dispatcher_thread_->dispatcher().post([this, fn = std::move(fn)]() {
    for (auto* callbacks : callbacks_.snapshot()) {
      fn(*callbacks);
    }
  });
}

void StreamingService::reapRetiredWorkers() {
  std::vector<WorkerThreadSharedPtr> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto done = std::partition(
        retired_.begin(), retired_.end(),
        [](const WorkerThreadSharedPtr& w) { return !w->finished(); });
    finished.assign(std::make_move_iterator(done),
                    std::make_move_iterator(retired_.end()));
    retired_.erase(done, retired_.end());
  }

  for (auto& worker : finished) {
    worker->join();
  }
}

}  // namespace service
}  // namespace pensync
