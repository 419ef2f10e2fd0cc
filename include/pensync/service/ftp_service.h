#ifndef PENSYNC_SERVICE_FTP_SERVICE_H
#define PENSYNC_SERVICE_FTP_SERVICE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "pensync/core/compat.h"
#include "pensync/event/event_loop.h"
#include "pensync/obex/file_transfer_session.h"
#include "pensync/obex/folder_listing.h"
#include "pensync/service/callback_registry.h"
#include "pensync/service/connection_state.h"
#include "pensync/service/device_discovery.h"
#include "pensync/service/worker_thread.h"
#include "pensync/transport/connection.h"

namespace pensync {
namespace service {

struct FtpServiceConfig {
  // Peer URLs; the first one is dialled by start()
  std::vector<std::string> devices;
  // Downloaded files land here under their remote file name
  std::string store_directory{"."};
  // Trace protocol exchanges at info level
  bool debug{false};
};

// Completion payloads, one per PendingAction

struct ConnectCompletion {
  ActionResult result{ActionResult::Fail};
  optional<uint32_t> connection_id;
};

struct DisconnectCompletion {
  ActionResult result{ActionResult::Fail};
};

struct DeleteCompletion {
  ActionResult result{ActionResult::Fail};
  optional<std::string> name;
};

struct ChangeFolderCompletion {
  ActionResult result{ActionResult::Fail};
  // Requested name as reported by the worker, resolved to the new current
  // directory before delivery
  optional<std::string> directory;
};

struct GetFileCompletion {
  ActionResult result{ActionResult::Fail};
  optional<std::string> local_path;
};

struct FolderListingCompletion {
  ActionResult result{ActionResult::Fail};
  optional<obex::FolderListing> items;
  // Set once the session entered the folder, even if the listing failed
  optional<std::string> entered_folder;
};

using FtpCompletion = variant<ConnectCompletion,
                              DisconnectCompletion,
                              DeleteCompletion,
                              ChangeFolderCompletion,
                              GetFileCompletion,
                              FolderListingCompletion>;

PendingAction pendingActionOf(const FtpCompletion& completion);

/**
 * Subscriber interface. All methods run on the service's dispatch thread,
 * one at a time, in the order the service produced them.
 */
class FtpServiceCallbacks {
 public:
  virtual ~FtpServiceCallbacks() = default;

  virtual void onFtpDeviceStateChange(ConnectionState /*old_state*/,
                                      ConnectionState /*new_state*/) {}
  virtual void onConnectComplete(ActionResult /*result*/,
                                 optional<uint32_t> /*connection_id*/) {}
  virtual void onDisconnectComplete(ActionResult /*result*/) {}
  virtual void onFolderListingComplete(
      const optional<obex::FolderListing>& /*items*/,
      ActionResult /*result*/) {}
  virtual void onChangeFolderComplete(
      const optional<std::string>& /*directory*/,
      ActionResult /*result*/) {}
  virtual void onGetFileComplete(const optional<std::string>& /*local_path*/,
                                 ActionResult /*result*/) {}
  virtual void onDeleteComplete(const optional<std::string>& /*name*/,
                                ActionResult /*result*/) {}
};

using FileTransferSessionFactory =
    std::function<obex::FileTransferSessionPtr(transport::ConnectionPtr,
                                               bool trace)>;

/**
 * Resolve a SETPATH argument against the tracked remote directory.
 * "" and "/" select the root, ".." the parent (the root is its own parent).
 */
std::string resolveRemoteDirectory(const std::string& current,
                                   const std::string& name);

/**
 * File-transfer client for one peer.
 *
 * Lifecycle: connect() starts an initiator thread that dials the peer and
 * negotiates the Folder Browsing target. On success the connection is handed
 * to a session worker thread that executes queued requests one at a time.
 *
 * Worker threads never touch service state. They post events to the
 * service's dispatcher thread, which applies state transitions under the
 * service mutex and drops events from workers of an older generation.
 *
 * The service must not be destroyed from inside one of its callbacks.
 */
class FtpService {
 public:
  FtpService(FtpServiceConfig config,
             transport::TransportEndpointSharedPtr endpoint,
             DeviceDiscoverySharedPtr discovery = nullptr,
             FileTransferSessionFactory session_factory = nullptr);
  ~FtpService();

  FtpService(const FtpService&) = delete;
  FtpService& operator=(const FtpService&) = delete;

  /**
   * Discover peers if none are configured, then connect to the first one.
   * @return false if there is no peer address to connect to
   */
  bool start();

  /**
   * Cancel every worker and go to Disconnected. Joins worker threads.
   */
  void stop();

  void connect(const std::string& address);

  /**
   * Tear the session down. No-op unless Connected. The state changes to
   * Disconnected first; the outcome of the DISCONNECT exchange follows once
   * it is written. The write happens without the service lock held.
   */
  void disconnect();

  // Queue a request on the live session. Return false unless Connected.
  bool listFolder(const std::string& name);
  bool changeFolder(const std::string& name);
  bool getFile(const std::string& name);
  bool deleteFile(const std::string& name);

  bool addCallbacks(FtpServiceCallbacks* callbacks) {
    return callbacks_.add(callbacks);
  }
  bool removeCallbacks(FtpServiceCallbacks* callbacks) {
    return callbacks_.remove(callbacks);
  }

  ConnectionState state() const;

  /**
   * Tracked remote directory, empty when not connected.
   */
  std::string directory() const;

  optional<std::string> connectedDevice() const;
  std::vector<std::string> deviceAddresses() const;

 private:
  class Initiator;
  class SessionWorker;

  struct SessionEstablished {
    obex::FileTransferSessionPtr session;
    std::string address;
  };
  struct ConnectionBroken {};
  struct ActionCompleted {
    FtpCompletion completion;
  };
  using Event = variant<SessionEstablished, ConnectionBroken, ActionCompleted>;

  void postEvent(uint64_t generation, Event event);
  void handleEvent(uint64_t generation, Event& event);
  void reapRetiredWorkers();

  // Require mutex_
  void dropStaleEventLocked(uint64_t generation, Event& event);
  void onSessionEstablishedLocked(SessionEstablished& established);
  void onConnectionBrokenLocked();
  void onActionCompletedLocked(FtpCompletion& completion);
  void setStateLocked(ConnectionState new_state);
  void retireWorkersLocked();
  void notifyLocked(std::function<void(FtpServiceCallbacks&)> fn);
  std::shared_ptr<SessionWorker> liveSessionLocked() const;

  const FtpServiceConfig config_;
  transport::TransportEndpointSharedPtr endpoint_;
  DeviceDiscoverySharedPtr discovery_;
  FileTransferSessionFactory session_factory_;

  CallbackRegistry<FtpServiceCallbacks> callbacks_;

  mutable std::mutex mutex_;
  ConnectionState state_{ConnectionState::Disconnected};
  uint64_t generation_{0};
  std::shared_ptr<Initiator> initiator_;
  std::shared_ptr<SessionWorker> session_worker_;
  // Session disconnect() is tearing down outside the lock
  obex::FileTransferSessionPtr closing_session_;
  std::vector<WorkerThreadSharedPtr> retired_;
  std::vector<std::string> devices_;
  std::string directory_;
  optional<std::string> connected_device_;

  std::unique_ptr<event::DispatcherThread> dispatcher_thread_;
};

}  // namespace service
}  // namespace pensync

#endif  // PENSYNC_SERVICE_FTP_SERVICE_H
