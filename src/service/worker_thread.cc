#include "pensync/service/worker_thread.h"

#include <pthread.h>

#include <exception>

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "service"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace service {

WorkerThread::WorkerThread(std::string name, uint64_t generation)
    : name_(std::move(name)), generation_(generation) {}

WorkerThread::~WorkerThread() {
  // Derived destructors have joined already; this only covers a worker
  // that was never started.
  join();
}

void WorkerThread::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this]() { threadRoutine(); });
}

void WorkerThread::join() {
  if (!thread_.joinable()) {
    return;
  }
  if (thread_.get_id() == std::this_thread::get_id()) {
    LOG_WARNING("worker '{}' asked to join itself", name_);
    return;
  }
  thread_.join();
}

void WorkerThread::threadRoutine() {
#ifdef __linux__
  pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
#endif

  try {
    run();
  } catch (const std::exception& e) {
    LOG_ERROR("worker '{}' (generation {}) terminated: {}", name_, generation_,
              e.what());
    onRunFailed();
  }
  finished_ = true;
}

}  // namespace service
}  // namespace pensync
