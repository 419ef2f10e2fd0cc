#ifndef PENSYNC_SERVICE_STREAMING_SERVICE_H
#define PENSYNC_SERVICE_STREAMING_SERVICE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "pensync/core/compat.h"
#include "pensync/event/event_loop.h"
#include "pensync/hid/hid_report.h"
#include "pensync/hid/report_decoder.h"
#include "pensync/hid/stroke_path_filter.h"
#include "pensync/hid/sync_path.h"
#include "pensync/service/callback_registry.h"
#include "pensync/service/connection_state.h"
#include "pensync/service/device_discovery.h"
#include "pensync/service/worker_thread.h"
#include "pensync/transport/connection.h"

namespace pensync {
namespace service {

struct StreamingServiceConfig {
  // Peer URLs; the first one is dialled by start()
  std::vector<std::string> devices;
  // Local address the Listener accepts tablet connections on
  std::string listen_address{"btspp://localhost:1"};
  // Platform class announced by the identification command
  uint8_t client_platform{8};
  // Trace protocol exchanges at info level
  bool debug{false};
};

/**
 * Subscriber interface. All methods run on the service's dispatch thread,
 * one at a time, in the order the service produced them.
 */
class StreamingServiceCallbacks {
 public:
  virtual ~StreamingServiceCallbacks() = default;

  virtual void onStreamingStateChange(ConnectionState /*old_state*/,
                                      ConnectionState /*new_state*/) {}

  // Every decoded capture report, before path filtering
  virtual void onCaptureReport(const hid::CaptureReport& /*report*/) {}

  // Paths completed by one capture report
  virtual void onDrawnPaths(const std::vector<hid::SyncPath>& /*paths*/) {}

  // The tablet was erased; the accumulated paths have been cleared
  virtual void onErase() {}

  // The save button was pressed on the tablet
  virtual void onSave() {}
};

/**
 * Live capture client for one pen tablet.
 *
 * The service runs a Listener for the whole time between start() and stop()
 * so the tablet can connect on its own; connect() dials it explicitly.
 * Whichever side succeeds first becomes the session. A further inbound
 * connection while a session is live is closed immediately.
 *
 * After a session comes up the service selects File mode, sets the tablet
 * clock and sends the identification command. Inbound reports are decoded
 * on the dispatch thread, run through the path filter and fanned out to
 * subscribers.
 *
 * The service must not be destroyed from inside one of its callbacks.
 */
class StreamingService {
 public:
  StreamingService(StreamingServiceConfig config,
                   transport::TransportEndpointSharedPtr endpoint,
                   DeviceDiscoverySharedPtr discovery = nullptr,
                   hid::ReportDecoderPtr decoder = nullptr,
                   hid::PathFilterPtr filter = nullptr);
  ~StreamingService();

  StreamingService(const StreamingService&) = delete;
  StreamingService& operator=(const StreamingService&) = delete;

  /**
   * Start the Listener and, if a peer address is known or discovered,
   * connect to the first one.
   * @return true if a connection was started or is already live, false if
   *         the service only listens
   */
  bool start();

  /**
   * Cancel every worker, the Listener included, and go to Disconnected.
   * Joins worker threads.
   */
  void stop();

  void connect(const std::string& address);

  /**
   * Close the session. No-op unless Connected.
   */
  void disconnect();

  /**
   * Send the mode command.
   * @return false without sending if `mode` is the current mode, is not a
   *         recognized mode, or no session is live; otherwise whether the
   *         command was written
   */
  bool setSyncMode(hid::SyncMode mode);

  /**
   * Clear the accumulated paths and send the erase command.
   * @return false if no session is live or the write failed
   */
  bool eraseSync();

  // Set the tablet clock to the local wall clock
  bool syncClock();

  bool identify();

  bool addCallbacks(StreamingServiceCallbacks* callbacks) {
    return callbacks_.add(callbacks);
  }
  bool removeCallbacks(StreamingServiceCallbacks* callbacks) {
    return callbacks_.remove(callbacks);
  }

  ConnectionState state() const;
  hid::SyncMode mode() const;
  std::vector<hid::SyncPath> paths() const;
  optional<std::string> connectedDevice() const;
  std::vector<std::string> deviceAddresses() const;

 private:
  class Initiator;
  class Listener;
  class SessionWorker;

  // Outbound attempt succeeded
  struct SessionOpened {
    transport::ConnectionPtr connection;
    std::string address;
  };
  // Listener accepted a peer
  struct InboundConnection {
    transport::ConnectionPtr connection;
  };
  struct DataReceived {
    std::vector<uint8_t> bytes;
  };
  struct ConnectionBroken {};
  struct ListenerFailed {
    std::string reason;
  };
  using Event = variant<SessionOpened,
                        InboundConnection,
                        DataReceived,
                        ConnectionBroken,
                        ListenerFailed>;

  // Listener events are tagged with the listener epoch, all others with the
  // connection generation.
  void postEvent(uint64_t tag, Event event);
  void handleEvent(uint64_t tag, Event& event);
  void reapRetiredWorkers();
  void runHandshake();
  bool writeCommand(const std::vector<uint8_t>& frame, const char* what);

  // Require mutex_
  bool isCurrentLocked(uint64_t tag, const Event& event) const;
  void dropStaleEventLocked(Event& event);
  void onSessionOpenedLocked(SessionOpened& opened);
  void onInboundConnectionLocked(InboundConnection& inbound);
  void onDataReceivedLocked(const DataReceived& data);
  void onConnectionBrokenLocked();
  void onListenerFailedLocked(const ListenerFailed& failed);
  void startSessionLocked(transport::ConnectionPtr connection,
                          const std::string& address);
  void processCaptureReportLocked(const hid::CaptureReport& report);
  void enterIdleLocked();
  void clearSessionStateLocked();
  void setStateLocked(ConnectionState new_state);
  void retireSessionWorkersLocked();
  void retireListenerLocked();
  void notifyLocked(std::function<void(StreamingServiceCallbacks&)> fn);

  const StreamingServiceConfig config_;
  transport::TransportEndpointSharedPtr endpoint_;
  DeviceDiscoverySharedPtr discovery_;
  // Used on the dispatch thread only
  hid::ReportDecoderPtr decoder_;

  CallbackRegistry<StreamingServiceCallbacks> callbacks_;

  mutable std::mutex mutex_;
  ConnectionState state_{ConnectionState::Disconnected};
  uint64_t generation_{0};
  uint64_t listener_epoch_{0};
  hid::SyncMode mode_{hid::SyncMode::None};
  hid::PathFilterPtr filter_;
  std::vector<hid::SyncPath> paths_;
  std::shared_ptr<Initiator> initiator_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<SessionWorker> session_worker_;
  std::vector<WorkerThreadSharedPtr> retired_;
  std::vector<std::string> devices_;
  optional<std::string> connected_device_;

  std::unique_ptr<event::DispatcherThread> dispatcher_thread_;
};

}  // namespace service
}  // namespace pensync

#endif  // PENSYNC_SERVICE_STREAMING_SERVICE_H
