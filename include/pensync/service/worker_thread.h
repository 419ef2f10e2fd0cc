#ifndef PENSYNC_SERVICE_WORKER_THREAD_H
#define PENSYNC_SERVICE_WORKER_THREAD_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace pensync {
namespace service {

/**
 * One OS thread running one connection role (initiator, listener or session
 * worker).
 *
 * Every worker is stamped with the generation of the connection attempt it
 * serves. Events it reports carry that generation, which lets the owning
 * service drop reports from a worker that has been superseded.
 *
 * cancel() must not block: it closes whatever transport the worker is
 * blocked on. Concrete workers call cancel() and join() in their destructor
 * because run() must not outlive the derived object.
 */
class WorkerThread {
 public:
  WorkerThread(std::string name, uint64_t generation);
  virtual ~WorkerThread();

  WorkerThread(const WorkerThread&) = delete;
  WorkerThread& operator=(const WorkerThread&) = delete;

  void start();

  /**
   * Wait for run() to return. Does nothing when called from the worker's
   * own thread or before start().
   */
  void join();

  virtual void cancel() = 0;

  bool finished() const { return finished_; }
  bool cancelled() const { return cancelled_; }
  uint64_t generation() const { return generation_; }
  const std::string& name() const { return name_; }

 protected:
  virtual void run() = 0;

  /**
   * Called on the worker thread when run() exits with an exception, so the
   * failure still reaches the owner as an event.
   */
  virtual void onRunFailed() {}

  /**
   * Sets the cancelled flag. Returns true for the first caller only.
   */
  bool markCancelled() { return !cancelled_.exchange(true); }

 private:
  void threadRoutine();

  const std::string name_;
  const uint64_t generation_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> finished_{false};
  std::thread thread_;
};

using WorkerThreadSharedPtr = std::shared_ptr<WorkerThread>;

}  // namespace service
}  // namespace pensync

#endif  // PENSYNC_SERVICE_WORKER_THREAD_H
