#include <pthread.h>

#include "pensync/event/event_loop.h"

namespace pensync {
namespace event {

DispatcherThread::DispatcherThread(DispatcherPtr dispatcher)
    : dispatcher_(std::move(dispatcher)) {}

DispatcherThread::~DispatcherThread() { stop(); }

void DispatcherThread::start() {
  if (running_.exchange(true)) {
    return;  // Already running
  }

  thread_ = std::make_unique<std::thread>([this]() { threadRoutine(); });
}

void DispatcherThread::stop() {
  if (!running_.exchange(false)) {
    return;  // Already stopped
  }

  dispatcher_->exit();

  if (thread_ && thread_->joinable()) {
    thread_->join();
  }
  thread_.reset();
}

void DispatcherThread::threadRoutine() {
#ifdef __linux__
  // Linux limits thread names to 15 characters
  pthread_setname_np(pthread_self(), dispatcher_->name().substr(0, 15).c_str());
#endif

  dispatcher_->run(RunType::RunUntilExit);

  dispatcher_->shutdown();
}

}  // namespace event
}  // namespace pensync
