#include "pensync/event/libevent_dispatcher.h"

#include <unistd.h>

#include <cerrno>
#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "event"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace event {

namespace {

// evthread_use_pthreads must run once before any event base is created
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();

  // thread_id_ is only set once run() is called
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  base_ = event_base_new();
  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  const char* method = event_base_get_method(base_);
  LOG_DEBUG("dispatcher '{}' using backend {}", name_,
            method ? method : "unknown");

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }

  event_add(wakeup_event_, nullptr);
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup && !isThreadSafe()) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    if (rc < 0 && errno != EAGAIN) {
      LOG_ERROR("dispatcher '{}' wakeup write failed: errno {}", name_, errno);
    }
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (!isThreadSafe()) {
    // Empty callback just to wake up the loop
    post([]() {});
  } else {
    event_base_loopbreak(base_);
  }
}

void LibeventDispatcher::run(RunType type) {
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  int flags = 0;
  switch (type) {
    case RunType::Block:
      break;
    case RunType::NonBlock:
      flags = EVLOOP_NONBLOCK;
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      // Cleared on the way out so an exit() issued before run() is not lost
      exit_requested_ = false;
      return;
  }

  event_base_loop(base_, flags);
  runPostCallbacks();
}

void LibeventDispatcher::shutdown() {
  if (isThreadSafe()) {
    std::lock_guard<std::mutex> lock(post_mutex_);
    std::queue<PostCb> empty;
    post_callbacks_.swap(empty);
  }
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  // Drain the pipe
  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  // Callbacks may post more work. A post made from this thread does not
  // write to the wakeup pipe, so keep swapping until the queue stays empty.
  for (;;) {
    std::queue<PostCb> callbacks;
    {
      std::lock_guard<std::mutex> lock(post_mutex_);
      if (post_callbacks_.empty()) {
        return;
      }
      callbacks.swap(post_callbacks_);
    }

    while (!callbacks.empty()) {
      callbacks.front()();
      callbacks.pop();
    }

    if (exit_requested_) {
      return;
    }
  }
}

namespace {

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override {
    return std::make_unique<LibeventDispatcher>(name);
  }
};

}  // namespace

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace pensync
