#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

#include "pensync/service/worker_thread.h"

using namespace pensync::service;

namespace {

// Blocks in run() until cancelled
class BlockingWorker : public WorkerThread {
 public:
  explicit BlockingWorker(uint64_t generation)
      : WorkerThread("blocking", generation) {}

  ~BlockingWorker() override {
    cancel();
    join();
  }

  void cancel() override {
    if (!markCancelled()) {
      ++redundant_cancels;
      return;
    }
    cv_.notify_all();
  }

  int redundant_cancels{0};

 protected:
  void run() override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return cancelled(); });
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
};

class ThrowingWorker : public WorkerThread {
 public:
  ThrowingWorker() : WorkerThread("throwing", 9) {}

  ~ThrowingWorker() override { join(); }

  void cancel() override { markCancelled(); }

  bool failure_reported{false};

 protected:
  void run() override { throw std::runtime_error("socket exploded"); }
  void onRunFailed() override { failure_reported = true; }
};

}  // namespace

TEST(WorkerThreadTest, CancelUnblocksRun) {
  BlockingWorker worker(4);
  EXPECT_EQ(worker.generation(), 4u);
  EXPECT_EQ(worker.name(), "blocking");

  worker.start();
  EXPECT_FALSE(worker.finished());

  worker.cancel();
  worker.join();
  EXPECT_TRUE(worker.cancelled());
  EXPECT_TRUE(worker.finished());
}

TEST(WorkerThreadTest, SecondCancelIsRedundant) {
  BlockingWorker worker(1);
  worker.start();
  worker.cancel();
  worker.cancel();
  worker.join();
  EXPECT_EQ(worker.redundant_cancels, 1);
}

TEST(WorkerThreadTest, JoinBeforeStartReturns) {
  BlockingWorker worker(1);
  worker.join();
  EXPECT_FALSE(worker.finished());
}

TEST(WorkerThreadTest, ExceptionInRunIsReported) {
  ThrowingWorker worker;
  worker.start();
  worker.join();
  EXPECT_TRUE(worker.finished());
  EXPECT_TRUE(worker.failure_reported);
}
