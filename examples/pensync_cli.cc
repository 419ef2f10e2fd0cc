/**
 * Command line client for a Boogie Board Sync tablet.
 *
 *   pensync_cli <config.json> ftp [folder [file]]
 *       Connect over file transfer, list `folder` (default SAVED) and
 *       download `file` into the configured store directory.
 *
 *   pensync_cli <config.json> stream [--erase]
 *       Listen for and connect to the tablet, switch it to capture mode and
 *       print stylus events until interrupted. --erase clears the tablet
 *       once capture mode is on.
 */

#include <signal.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "pensync/config/client_config.h"
#include "pensync/service/ftp_service.h"
#include "pensync/service/streaming_service.h"
#include "pensync/transport/rfcomm_endpoint.h"

namespace pensync {
namespace examples {

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int) { g_interrupted = true; }

// Waits for service events with a timeout, waking early on SIGINT
class EventWaiter {
 public:
  template <typename Predicate>
  bool waitFor(std::chrono::milliseconds timeout, Predicate done) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!done()) {
      if (g_interrupted || std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      cv_.wait_for(lock, std::chrono::milliseconds(100));
    }
    return true;
  }

  template <typename Fn>
  void update(Fn fn) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fn();
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
};

class FtpPrinter : public service::FtpServiceCallbacks {
 public:
  void onFtpDeviceStateChange(service::ConnectionState old_state,
                              service::ConnectionState new_state) override {
    std::cout << "ftp: " << service::connectionStateToString(old_state)
              << " -> " << service::connectionStateToString(new_state)
              << std::endl;
    waiter.update([&]() { state = new_state; });
  }

  void onConnectComplete(service::ActionResult result,
                         optional<uint32_t> connection_id) override {
    std::cout << "connect: " << service::actionResultToString(result);
    if (connection_id) {
      std::cout << " (connection id " << *connection_id << ")";
    }
    std::cout << std::endl;
  }

  void onFolderListingComplete(const optional<obex::FolderListing>& items,
                               service::ActionResult result) override {
    std::cout << "list: " << service::actionResultToString(result)
              << std::endl;
    if (items) {
      for (const auto& item : *items) {
        std::cout << "  " << (item.isFolder() ? "[dir] " : "      ")
                  << item.name();
        if (!item.isFolder()) {
          std::cout << "  " << item.size() << " bytes";
        }
        std::cout << std::endl;
      }
    }
    waiter.update([&]() { ++completed; });
  }

  void onGetFileComplete(const optional<std::string>& local_path,
                         service::ActionResult result) override {
    std::cout << "get: " << service::actionResultToString(result);
    if (local_path) {
      std::cout << " -> " << *local_path;
    }
    std::cout << std::endl;
    waiter.update([&]() { ++completed; });
  }

  EventWaiter waiter;
  service::ConnectionState state{service::ConnectionState::Disconnected};
  int completed{0};
};

class StreamPrinter : public service::StreamingServiceCallbacks {
 public:
  void onStreamingStateChange(service::ConnectionState old_state,
                              service::ConnectionState new_state) override {
    std::cout << "stream: " << service::connectionStateToString(old_state)
              << " -> " << service::connectionStateToString(new_state)
              << std::endl;
    waiter.update([&]() { state = new_state; });
  }

  void onDrawnPaths(const std::vector<hid::SyncPath>& paths) override {
    for (const auto& path : paths) {
      std::cout << "path: " << path.points().size() << " points, width "
                << path.strokeWidth() << std::endl;
    }
  }

  void onErase() override { std::cout << "erase" << std::endl; }
  void onSave() override { std::cout << "save" << std::endl; }

  EventWaiter waiter;
  service::ConnectionState state{service::ConnectionState::Disconnected};
};

int runFtp(const config::ClientConfig& config,
           transport::TransportEndpointSharedPtr endpoint,
           const std::string& folder,
           const std::string& file) {
  FtpPrinter printer;
  service::FtpService ftp(config.ftp, std::move(endpoint));
  ftp.addCallbacks(&printer);

  if (!ftp.start()) {
    std::cerr << "No tablet address configured" << std::endl;
    return 1;
  }

  bool connected = printer.waiter.waitFor(std::chrono::seconds(30), [&]() {
    return printer.state == service::ConnectionState::Connected;
  });
  if (!connected) {
    std::cerr << "Could not connect to the tablet" << std::endl;
    return 1;
  }

  int expected = 1;
  ftp.listFolder(folder);
  if (!file.empty()) {
    ftp.getFile(file);
    ++expected;
  }

  bool done = printer.waiter.waitFor(std::chrono::seconds(60), [&]() {
    return printer.completed >= expected;
  });
  ftp.disconnect();
  ftp.removeCallbacks(&printer);
  return done ? 0 : 1;
}

int runStream(const config::ClientConfig& config,
              transport::TransportEndpointSharedPtr endpoint,
              bool erase) {
  StreamPrinter printer;
  service::StreamingService streaming(config.streaming, std::move(endpoint));
  streaming.addCallbacks(&printer);
  streaming.start();

  std::cout << "Waiting for the tablet, press Ctrl+C to quit" << std::endl;
  while (!g_interrupted) {
    bool connected = printer.waiter.waitFor(std::chrono::hours(24), [&]() {
      return printer.state == service::ConnectionState::Connected;
    });
    if (!connected) {
      break;
    }

    // Let the post-connect handshake go out first
    std::this_thread::sleep_for(std::chrono::seconds(1));
    if (!streaming.setSyncMode(hid::SyncMode::Capture)) {
      std::cerr << "Could not select capture mode" << std::endl;
    } else if (erase && !streaming.eraseSync()) {
      std::cerr << "Could not erase the tablet" << std::endl;
    }

    printer.waiter.waitFor(std::chrono::hours(24), [&]() {
      return printer.state != service::ConnectionState::Connected;
    });
  }

  streaming.stop();
  streaming.removeCallbacks(&printer);
  return 0;
}

void usage(const char* program) {
  std::cerr << "Usage: " << program << " <config.json> ftp [folder [file]]\n"
            << "       " << program << " <config.json> stream [--erase]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 3) {
    usage(argv[0]);
    return 2;
  }

  config::ClientConfig client_config;
  try {
    client_config = config::loadClientConfig(argv[1]);
    config::applyLoggingConfig(client_config.logging);
  } catch (const config::ConfigParseError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

#ifndef PENSYNC_HAS_BLUEZ
  std::cerr << "Built without Bluetooth support" << std::endl;
  return 1;
#else
  auto endpoint = std::make_shared<transport::RfcommEndpoint>();
  std::string command = argv[2];
  if (command == "ftp") {
    std::string folder = argc > 3 ? argv[3] : "SAVED";
    std::string file = argc > 4 ? argv[4] : "";
    return runFtp(client_config, endpoint, folder, file);
  }
  if (command == "stream") {
    bool erase = argc > 3 && std::string(argv[3]) == "--erase";
    return runStream(client_config, endpoint, erase);
  }

  usage(argv[0]);
  return 2;
#endif
}

}  // namespace examples
}  // namespace pensync

int main(int argc, char* argv[]) {
  return pensync::examples::main(argc, argv);
}
