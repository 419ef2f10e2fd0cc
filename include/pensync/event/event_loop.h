#ifndef PENSYNC_EVENT_EVENT_LOOP_H
#define PENSYNC_EVENT_EVENT_LOOP_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace pensync {
namespace event {

class Dispatcher;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using PostCb = std::function<void()>;

/**
 * Event loop run modes
 */
enum class RunType {
  Block,        // Run until no more events are registered
  NonBlock,     // Run one iteration without waiting
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * Base dispatcher interface: the part other threads are allowed to touch.
 */
class DispatcherBase {
 public:
  virtual ~DispatcherBase() = default;

  /**
   * Post a callback to be executed in the dispatcher thread.
   * Thread-safe: can be called from any thread. Callbacks run in the order
   * they were posted, one at a time.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Check if the current thread is the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;
};

/**
 * Single-threaded event dispatcher.
 *
 * Every callback handed to post() is executed on the thread that called
 * run(). A component that wants serialized handling of events produced by
 * several threads funnels them through one dispatcher.
 */
class Dispatcher : public DispatcherBase {
 public:
  virtual ~Dispatcher() = default;

  /**
   * Return the name of this dispatcher (e.g., "ftp", "streaming").
   */
  virtual const std::string& name() = 0;

  /**
   * Run the event loop on the calling thread.
   */
  virtual void run(RunType type) = 0;

  /**
   * Ask the loop to return. Safe to call from any thread.
   */
  virtual void exit() = 0;

  /**
   * Drop pending work. Only has an effect on the dispatcher thread.
   */
  virtual void shutdown() = 0;
};

/**
 * Factory for creating dispatchers
 */
class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

// Create the libevent backed factory
DispatcherFactoryPtr createLibeventDispatcherFactory();

/**
 * Owns a dispatcher and the thread that runs it.
 *
 * start() spawns the thread and runs the loop until stop() is called.
 * stop() exits the loop, joins the thread and drops any callbacks still
 * queued. It must not be called from the dispatcher thread itself.
 */
class DispatcherThread {
 public:
  explicit DispatcherThread(DispatcherPtr dispatcher);
  ~DispatcherThread();

  DispatcherThread(const DispatcherThread&) = delete;
  DispatcherThread& operator=(const DispatcherThread&) = delete;

  void start();
  void stop();

  bool running() const { return running_; }

  Dispatcher& dispatcher() { return *dispatcher_; }

 private:
  void threadRoutine();

  DispatcherPtr dispatcher_;
  std::atomic<bool> running_{false};
  std::unique_ptr<std::thread> thread_;
};

}  // namespace event
}  // namespace pensync

#endif  // PENSYNC_EVENT_EVENT_LOOP_H
