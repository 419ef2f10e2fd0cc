#include "pensync/service/ftp_service.h"

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <fstream>
#include <iterator>

#include "pensync/obex/obex_client_session.h"
#include "pensync/obex/obex_codec.h"

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "ftp"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace service {

namespace {

struct ListFolderRequest {
  std::string name;
};
struct ChangeFolderRequest {
  std::string name;
};
struct GetFileRequest {
  std::string name;
};
struct DeleteRequest {
  std::string name;
};

using FtpRequest = variant<ListFolderRequest,
                           ChangeFolderRequest,
                           GetFileRequest,
                           DeleteRequest>;

obex::FileTransferSessionPtr defaultSessionFactory(
    transport::ConnectionPtr connection,
    bool trace) {
  return std::make_shared<obex::ObexClientSession>(std::move(connection),
                                                   trace);
}

std::string baseName(const std::string& path) {
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos) {
    return path;
  }
  return path.substr(slash + 1);
}

std::string joinPath(const std::string& directory, const std::string& name) {
  if (directory.empty()) {
    return name;
  }
  if (directory.back() == '/') {
    return directory + name;
  }
  return directory + "/" + name;
}

void deliver(FtpServiceCallbacks& callbacks, const FtpCompletion& completion) {
  visit(overloaded{
            [&](const ConnectCompletion& c) {
              callbacks.onConnectComplete(c.result, c.connection_id);
            },
            [&](const DisconnectCompletion& c) {
              callbacks.onDisconnectComplete(c.result);
            },
            [&](const DeleteCompletion& c) {
              callbacks.onDeleteComplete(c.name, c.result);
            },
            [&](const ChangeFolderCompletion& c) {
              callbacks.onChangeFolderComplete(c.directory, c.result);
            },
            [&](const GetFileCompletion& c) {
              callbacks.onGetFileComplete(c.local_path, c.result);
            },
            [&](const FolderListingCompletion& c) {
              callbacks.onFolderListingComplete(c.items, c.result);
            },
        },
        completion);
}

ActionResult resultOf(const FtpCompletion& completion) {
  return visit([](const auto& c) { return c.result; }, completion);
}

}  // namespace

PendingAction pendingActionOf(const FtpCompletion& completion) {
  return visit(
      overloaded{
          [](const ConnectCompletion&) { return PendingAction::Connect; },
          [](const DisconnectCompletion&) { return PendingAction::Disconnect; },
          [](const DeleteCompletion&) { return PendingAction::Delete; },
          [](const ChangeFolderCompletion&) {
            return PendingAction::ChangeFolder;
          },
          [](const GetFileCompletion&) { return PendingAction::GetFile; },
          [](const FolderListingCompletion&) {
            return PendingAction::ListFolder;
          },
      },
      completion);
}

std::string resolveRemoteDirectory(const std::string& current,
                                   const std::string& name) {
  if (name.empty() || name == "/") {
    return "/";
  }

  std::string base = current.empty() ? std::string("/") : current;
  if (name == "..") {
    while (base.size() > 1 && base.back() == '/') {
      base.pop_back();
    }
    auto slash = base.rfind('/');
    if (slash == std::string::npos || slash == 0) {
      return "/";
    }
    return base.substr(0, slash);
  }

  if (base.back() != '/') {
    base += '/';
  }
  return base + name;
}

// Initiator: dials the peer and negotiates the Folder Browsing target.

class FtpService::Initiator : public WorkerThread {
 public:
  Initiator(uint64_t generation,
            std::string address,
            transport::TransportEndpointSharedPtr endpoint,
            FileTransferSessionFactory factory,
            bool trace,
            FtpService& owner)
      : WorkerThread("ftp-connect", generation),
        address_(std::move(address)),
        endpoint_(std::move(endpoint)),
        factory_(std::move(factory)),
        trace_(trace),
        owner_(owner) {}

  ~Initiator() override {
    cancel();
    join();
  }

  void cancel() override {
    if (!markCancelled()) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
      connection_->close();
    }
  }

 protected:
  void run() override {
    auto dialed = endpoint_->dial(address_);
    if (!dialed.ok()) {
      if (!cancelled()) {
        LOG_ERROR("connection to {} failed: {}", address_,
                  dialed.error_message());
      }
      owner_.postEvent(generation(), ConnectionBroken{});
      return;
    }

    transport::ConnectionPtr connection = *dialed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled()) {
        connection->close();
        return;
      }
      connection_ = connection;
    }

    auto session = factory_(connection, trace_);
    const auto& target = obex::kFolderBrowsingTarget;
    auto negotiated =
        session->negotiate(std::vector<uint8_t>(target.begin(), target.end()));

    if (!negotiated.ok() ||
        negotiated->response_code != obex::kResponseSuccess) {
      if (!cancelled()) {
        if (negotiated.ok()) {
          LOG_ERROR("file transfer server at {} refused connect: {}", address_,
                    obex::responseCodeToString(negotiated->response_code));
        } else {
          LOG_ERROR("connect to file transfer server at {} failed: {}",
                    address_, negotiated.error_message());
        }
      }
      owner_.postEvent(generation(),
                       ActionCompleted{ConnectCompletion{ActionResult::Fail,
                                                         nullopt}});
      connection->close();
      owner_.postEvent(generation(), ConnectionBroken{});
      return;
    }

    if (trace_) {
      LOG_INFO("connected to file transfer server at {}", address_);
    }

    // The session owns the connection from here on
    {
      std::lock_guard<std::mutex> lock(mutex_);
      connection_.reset();
    }

    owner_.postEvent(generation(),
                     ActionCompleted{ConnectCompletion{
                         ActionResult::Ok, negotiated->connection_id}});
    owner_.postEvent(generation(), SessionEstablished{session, address_});
  }

  void onRunFailed() override {
    owner_.postEvent(generation(), ConnectionBroken{});
  }

 private:
  const std::string address_;
  transport::TransportEndpointSharedPtr endpoint_;
  FileTransferSessionFactory factory_;
  const bool trace_;
  FtpService& owner_;

  std::mutex mutex_;
  transport::ConnectionPtr connection_;
};

// Session worker: runs queued requests against the live session.

class FtpService::SessionWorker : public WorkerThread {
 public:
  SessionWorker(uint64_t generation,
                obex::FileTransferSessionPtr session,
                std::string store_directory,
                bool trace,
                FtpService& owner)
      : WorkerThread("ftp-session", generation),
        session_(std::move(session)),
        store_directory_(std::move(store_directory)),
        trace_(trace),
        owner_(owner) {}

  ~SessionWorker() override {
    cancel();
    join();
  }

  void enqueue(FtpRequest request) {
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      queue_.push_back(std::move(request));
    }
    queue_cv_.notify_one();
  }

  // Closes the transport without a DISCONNECT; safe under the service mutex
  void cancel() override {
    detach();
    session_->abort();
  }

  /**
   * Stops taking requests and hands back the session so the caller can
   * tear it down without holding the service mutex.
   */
  obex::FileTransferSessionPtr detach() {
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      markCancelled();
      queue_.clear();
    }
    queue_cv_.notify_all();
    return session_;
  }

 protected:
  void run() override {
    for (;;) {
      FtpRequest request;
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock,
                       [this]() { return cancelled() || !queue_.empty(); });
        if (cancelled()) {
          return;
        }
        request = std::move(queue_.front());
        queue_.pop_front();
      }

      if (!execute(request)) {
        if (!cancelled()) {
          owner_.postEvent(generation(), ConnectionBroken{});
        }
        return;
      }
    }
  }

  void onRunFailed() override {
    owner_.postEvent(generation(), ConnectionBroken{});
  }

 private:
  // Returns false when the transport failed
  bool execute(const FtpRequest& request) {
    return visit(
        overloaded{
            [this](const ListFolderRequest& r) { return listFolder(r.name); },
            [this](const ChangeFolderRequest& r) {
              return changeFolder(r.name);
            },
            [this](const GetFileRequest& r) { return getFile(r.name); },
            [this](const DeleteRequest& r) { return deleteFile(r.name); },
        },
        request);
  }

  void complete(FtpCompletion completion) {
    if (!cancelled()) {
      owner_.postEvent(generation(), ActionCompleted{std::move(completion)});
    }
  }

  bool listFolder(const std::string& name) {
    FolderListingCompletion completion;

    auto entered = session_->setRemotePath(name);
    if (!entered.ok()) {
      LOG_ERROR("changing to folder '{}' failed: {}", name,
                entered.error_message());
      complete(completion);
      return false;
    }
    if (*entered != obex::kResponseSuccess) {
      LOG_ERROR("unable to change to folder '{}': {}", name,
                obex::responseCodeToString(*entered));
      complete(completion);
      return true;
    }
    completion.entered_folder = name;

    std::string body;
    obex::GetRequest get;
    get.type = std::string(obex::kFolderListingType);
    auto fetched = session_->get(get, [&body](const uint8_t* data, size_t n) {
      body.append(reinterpret_cast<const char*>(data), n);
    });
    if (!fetched.ok()) {
      LOG_ERROR("listing folder '{}' failed: {}", name,
                fetched.error_message());
      complete(completion);
      return false;
    }
    if (*fetched != obex::kResponseSuccess) {
      LOG_ERROR("listing folder '{}' refused: {}", name,
                obex::responseCodeToString(*fetched));
      complete(completion);
      return true;
    }

    if (trace_) {
      LOG_INFO("folder listing of '{}':\n{}", name, body);
    }

    auto items = obex::parseFolderListing(body);
    if (!items) {
      LOG_ERROR("unreadable listing for folder '{}'", name);
      complete(completion);
      return true;
    }

    completion.result = ActionResult::Ok;
    completion.items = std::move(items);
    complete(std::move(completion));
    return true;
  }

  bool changeFolder(const std::string& name) {
    auto changed = session_->setRemotePath(name);
    if (!changed.ok()) {
      LOG_ERROR("changing to folder '{}' failed: {}", name,
                changed.error_message());
      complete(ChangeFolderCompletion{});
      return false;
    }
    if (*changed != obex::kResponseSuccess) {
      LOG_ERROR("unable to change to folder '{}': {}", name,
                obex::responseCodeToString(*changed));
      complete(ChangeFolderCompletion{});
      return true;
    }
    complete(ChangeFolderCompletion{ActionResult::Ok, name});
    return true;
  }

  bool getFile(const std::string& name) {
    std::string file_name = baseName(name);
    if (file_name.empty() || file_name == "." || file_name == "..") {
      LOG_ERROR("refusing to store remote file '{}'", name);
      complete(GetFileCompletion{});
      return true;
    }

    std::string local_path = joinPath(store_directory_, file_name);
    // An existing copy is only replaced once the transfer succeeded
    std::string part_path = local_path + ".part";
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      LOG_ERROR("cannot open {} for writing", part_path);
      complete(GetFileCompletion{});
      return true;
    }

    bool write_failed = false;
    obex::GetRequest get;
    get.name = name;
    auto fetched = session_->get(get, [&](const uint8_t* data, size_t n) {
      if (!write_failed &&
          !out.write(reinterpret_cast<const char*>(data),
                     static_cast<std::streamsize>(n))) {
        write_failed = true;
      }
    });
    out.close();

    if (!fetched.ok()) {
      LOG_ERROR("getting '{}' failed: {}", name, fetched.error_message());
      std::remove(part_path.c_str());
      complete(GetFileCompletion{});
      return false;
    }
    if (*fetched != obex::kResponseSuccess || write_failed || out.fail()) {
      if (*fetched != obex::kResponseSuccess) {
        LOG_ERROR("getting '{}' refused: {}", name,
                  obex::responseCodeToString(*fetched));
      } else {
        LOG_ERROR("writing {} failed", part_path);
      }
      std::remove(part_path.c_str());
      complete(GetFileCompletion{});
      return true;
    }

    if (std::rename(part_path.c_str(), local_path.c_str()) != 0) {
      LOG_ERROR("moving {} to {} failed: {}", part_path, local_path,
                std::strerror(errno));
      std::remove(part_path.c_str());
      complete(GetFileCompletion{});
      return true;
    }

    if (trace_) {
      LOG_INFO("file stored in {}", local_path);
    }
    complete(GetFileCompletion{ActionResult::Ok, local_path});
    return true;
  }

  bool deleteFile(const std::string& name) {
    auto removed = session_->remove(name);
    if (!removed.ok()) {
      LOG_ERROR("deleting '{}' failed: {}", name, removed.error_message());
      complete(DeleteCompletion{});
      return false;
    }
    if (*removed != obex::kResponseSuccess) {
      LOG_ERROR("deleting '{}' refused: {}", name,
                obex::responseCodeToString(*removed));
      complete(DeleteCompletion{});
      return true;
    }
    if (trace_) {
      LOG_INFO("deleted '{}'", name);
    }
    complete(DeleteCompletion{ActionResult::Ok, name});
    return true;
  }

  obex::FileTransferSessionPtr session_;
  const std::string store_directory_;
  const bool trace_;
  FtpService& owner_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<FtpRequest> queue_;
};

FtpService::FtpService(FtpServiceConfig config,
                       transport::TransportEndpointSharedPtr endpoint,
                       DeviceDiscoverySharedPtr discovery,
                       FileTransferSessionFactory session_factory)
    : config_(std::move(config)),
      endpoint_(std::move(endpoint)),
      discovery_(std::move(discovery)),
      session_factory_(session_factory ? std::move(session_factory)
                                       : FileTransferSessionFactory(
                                             defaultSessionFactory)),
      devices_(config_.devices) {
  dispatcher_thread_ = std::make_unique<event::DispatcherThread>(
      event::createLibeventDispatcherFactory()->createDispatcher("ftp"));
  dispatcher_thread_->start();
}

FtpService::~FtpService() {
  stop();
  dispatcher_thread_->stop();
}

bool FtpService::start() {
  std::vector<std::string> devices = deviceAddresses();

  if (devices.empty() && discovery_) {
    if (config_.debug) {
      LOG_INFO("searching for paired pen tablets");
    }
    devices = selectSyncAddresses(discovery_->findPeers(
        ServiceClass::FileTransfer));
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = devices;
  }

  if (devices.empty()) {
    LOG_WARNING("no pen tablet address to connect to");
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

void FtpService::stop() {
  std::vector<WorkerThreadSharedPtr> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.debug) {
      LOG_INFO("stop");
    }
    ++generation_;
    retireWorkersLocked();
    workers.swap(retired_);
    directory_.clear();
    connected_device_.reset();
    setStateLocked(ConnectionState::Disconnected);
  }

  for (auto& worker : workers) {
    worker->join();
  }
}

void FtpService::connect(const std::string& address) {
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
    retireWorkersLocked();
    directory_.clear();
    connected_device_.reset();

    initiator_ = std::make_shared<Initiator>(generation_, address, endpoint_,
                                             session_factory_, config_.debug,
                                             *this);
    initiator_->start();
    setStateLocked(ConnectionState::Connecting);
  }
  reapRetiredWorkers();
}

void FtpService::disconnect() {
  obex::FileTransferSessionPtr session;
  std::string device;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected) {
      return;
    }

    ++generation_;
    if (session_worker_) {
      session = session_worker_->detach();
      retired_.push_back(session_worker_);
      session_worker_.reset();
    }
    retireWorkersLocked();
    closing_session_ = session;

    device = connected_device_.value_or("");
    directory_.clear();
    connected_device_.reset();
    setStateLocked(ConnectionState::Disconnected);
  }

  // DISCONNECT may block on a stalled peer; stop() or connect() abort it
  ActionResult result = ActionResult::Fail;
  if (session) {
    auto torn_down = session->teardown();
    if (torn_down.ok()) {
      result = ActionResult::Ok;
    } else {
      LOG_WARNING("disconnect from {} failed: {}", device,
                  torn_down.error_message());
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_session_ == session) {
      closing_session_.reset();
    }
    notifyLocked([result](FtpServiceCallbacks& callbacks) {
      callbacks.onDisconnectComplete(result);
    });
  }
  reapRetiredWorkers();
}

bool FtpService::listFolder(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto worker = liveSessionLocked();
  if (!worker) {
    return false;
  }
  worker->enqueue(ListFolderRequest{name});
  return true;
}

bool FtpService::changeFolder(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto worker = liveSessionLocked();
  if (!worker) {
    return false;
  }
  worker->enqueue(ChangeFolderRequest{name});
  return true;
}

bool FtpService::getFile(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto worker = liveSessionLocked();
  if (!worker) {
    return false;
  }
  worker->enqueue(GetFileRequest{name});
  return true;
}

bool FtpService::deleteFile(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto worker = liveSessionLocked();
  if (!worker) {
    return false;
  }
  worker->enqueue(DeleteRequest{name});
  return true;
}

ConnectionState FtpService::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string FtpService::directory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return directory_;
}

optional<std::string> FtpService::connectedDevice() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_device_;
}

std::vector<std::string> FtpService::deviceAddresses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_;
}

void FtpService::postEvent(uint64_t generation, Event event) {
  dispatcher_thread_->dispatcher().post(
      [this, generation, event]() mutable { handleEvent(generation, event); });
}

void FtpService::handleEvent(uint64_t generation, Event& event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
      dropStaleEventLocked(generation, event);
    } else {
      visit(overloaded{
                [this](SessionEstablished& e) {
                  onSessionEstablishedLocked(e);
                },
                [this](ConnectionBroken&) { onConnectionBrokenLocked(); },
                [this](ActionCompleted& e) {
                  onActionCompletedLocked(e.completion);
                },
            },
            event);
    }
  }
  reapRetiredWorkers();
}

void FtpService::dropStaleEventLocked(uint64_t generation, Event& event) {
  LOG_DEBUG("dropping event of generation {} (current {})", generation,
            generation_);

  // A session that completed after being superseded still has to be closed
  if (auto* established = get_if<SessionEstablished>(&event)) {
    established->session->abort();
  }
}

void FtpService::onSessionEstablishedLocked(SessionEstablished& established) {
  ++generation_;

  // The initiator has finished its job; cancelling it would close the
  // connection it just handed over.
  if (initiator_) {
    retired_.push_back(initiator_);
    initiator_.reset();
  }
  if (session_worker_) {
    session_worker_->cancel();
    retired_.push_back(session_worker_);
    session_worker_.reset();
  }

  session_worker_ = std::make_shared<SessionWorker>(
      generation_, established.session, config_.store_directory,
      config_.debug, *this);
  session_worker_->start();

  directory_ = "/";
  connected_device_ = established.address;
  setStateLocked(ConnectionState::Connected);
}

void FtpService::onConnectionBrokenLocked() {
  if (config_.debug) {
    LOG_INFO("connection broken");
  }
  retireWorkersLocked();
  directory_.clear();
  connected_device_.reset();
  setStateLocked(ConnectionState::Disconnected);
}

void FtpService::onActionCompletedLocked(FtpCompletion& completion) {
  visit(overloaded{
            [](ConnectCompletion&) {},
            [](DisconnectCompletion&) {},
            [](DeleteCompletion&) {},
            [this](ChangeFolderCompletion& c) {
              if (c.result == ActionResult::Ok && c.directory) {
                directory_ = resolveRemoteDirectory(directory_, *c.directory);
                c.directory = directory_;
              } else {
                c.directory.reset();
              }
            },
            [](GetFileCompletion&) {},
            [this](FolderListingCompletion& c) {
              if (c.entered_folder) {
                directory_ = resolveRemoteDirectory(directory_,
                                                    *c.entered_folder);
              }
            },
        },
        completion);

  if (config_.debug) {
    LOG_INFO("{} completed: {}",
             pendingActionToString(pendingActionOf(completion)),
             actionResultToString(resultOf(completion)));
  }

  notifyLocked([completion](FtpServiceCallbacks& callbacks) {
    deliver(callbacks, completion);
  });
}

void FtpService::setStateLocked(ConnectionState new_state) {
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

  notifyLocked([old_state, new_state](FtpServiceCallbacks& callbacks) {
    callbacks.onFtpDeviceStateChange(old_state, new_state);
  });
}

void FtpService::retireWorkersLocked() {
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
  if (closing_session_) {
    closing_session_->abort();
    closing_session_.reset();
  }
}

void FtpService::notifyLocked(std::function<void(FtpServiceCallbacks&)> fn) {
  dispatcher_thread_->dispatcher().post([this, fn = std::move(fn)]() {
    for (auto* callbacks : callbacks_.snapshot()) {
      fn(*callbacks);
    }
  });
}

std::shared_ptr<FtpService::SessionWorker> FtpService::liveSessionLocked()
    const {
  if (state_ != ConnectionState::Connected) {
    return nullptr;
  }
  return session_worker_;
}

void FtpService::reapRetiredWorkers() {
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
