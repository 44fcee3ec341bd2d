#ifndef WARDEN_CORE_EVENT_CHANNEL_H
#define WARDEN_CORE_EVENT_CHANNEL_H

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include "warden/logging/log_macros.h"

namespace warden {

/**
 * @brief Thread-safe publish/subscribe list of callbacks
 *
 * Subscribers are invoked synchronously on the emitting thread, in
 * subscription order, without the channel lock held, so a subscriber may
 * unsubscribe itself or emit on another channel.
 */
template <typename T>
class EventChannel {
 public:
  using Callback = std::function<void(const T&)>;
  using SubscriptionId = uint64_t;

  SubscriptionId subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
  }

  void unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(id);
  }

  void emit(const T& event) const {
    std::vector<Callback> callbacks;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      callbacks.reserve(subscribers_.size());
      for (const auto& entry : subscribers_) {
        callbacks.push_back(entry.second);
      }
    }

    for (const auto& callback : callbacks) {
      try {
        callback(event);
      } catch (const std::exception& e) {
        // A failing subscriber must not break the publisher
        WARDEN_LOG_NAMED("root.events", Warning,
                         "event subscriber threw: {}", e.what());
      }
    }
  }

  size_t subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::map<SubscriptionId, Callback> subscribers_;
  SubscriptionId next_id_{1};
};

}  // namespace warden

#endif  // WARDEN_CORE_EVENT_CHANNEL_H
