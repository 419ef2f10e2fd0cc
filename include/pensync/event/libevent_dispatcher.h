#ifndef PENSYNC_EVENT_LIBEVENT_DISPATCHER_H
#define PENSYNC_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "pensync/event/event_loop.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace pensync {
namespace event {

using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 *
 * Posted callbacks are queued under a mutex and the loop is woken through a
 * non-blocking pipe registered with the event base.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  // DispatcherBase interface
  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  // Dispatcher interface
  const std::string& name() override { return name_; }
  void run(RunType type) override;
  void exit() override;
  void shutdown() override;

  event_base* base() { return base_; }

 private:
  void runPostCallbacks();
  void initializeLibevent();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};
  libevent_event* wakeup_event_{nullptr};
};

}  // namespace event
}  // namespace pensync

#endif  // PENSYNC_EVENT_LIBEVENT_DISPATCHER_H
