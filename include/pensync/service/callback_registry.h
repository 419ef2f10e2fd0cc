#ifndef PENSYNC_SERVICE_CALLBACK_REGISTRY_H
#define PENSYNC_SERVICE_CALLBACK_REGISTRY_H

#include <algorithm>
#include <mutex>
#include <vector>

namespace pensync {
namespace service {

/**
 * Set of subscriber pointers, safe to modify from any thread.
 *
 * Fan-out iterates over snapshot(), so a subscriber may add or remove
 * subscribers from inside a callback. A fan-out already running on another
 * thread may still reach a subscriber once after it was removed. The
 * registry does not own the subscribers.
 */
template <typename Callbacks>
class CallbackRegistry {
 public:
  /**
   * @return false if `callbacks` is null or already registered
   */
  bool add(Callbacks* callbacks) {
    if (!callbacks) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(entries_.begin(), entries_.end(), callbacks) !=
        entries_.end()) {
      return false;
    }
    entries_.push_back(callbacks);
    return true;
  }

  /**
   * @return false if `callbacks` was not registered
   */
  bool remove(Callbacks* callbacks) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(entries_.begin(), entries_.end(), callbacks);
    if (it == entries_.end()) {
      return false;
    }
    entries_.erase(it);
    return true;
  }

  std::vector<Callbacks*> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Callbacks*> entries_;
};

}  // namespace service
}  // namespace pensync

#endif  // PENSYNC_SERVICE_CALLBACK_REGISTRY_H
