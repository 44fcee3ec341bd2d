#ifndef WARDEN_EVENT_LIBEVENT_DISPATCHER_H
#define WARDEN_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <deque>
#include <mutex>
#include <thread>

#include "warden/event/event_loop.h"

struct event_base;
struct event;

namespace warden {
namespace event {

/**
 * @brief Dispatcher on a libevent 2.1 event_base
 *
 * Cross-thread posts activate a user event, which needs libevent's pthread
 * locking; the constructor enables it for the process.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() const override { return name_; }
  void post(std::function<void()> callback) override;
  bool isThreadSafe() const override;
  TimerPtr createTimer(std::function<void()> callback) override;
  FileEventPtr createFileEvent(int fd,
                               uint32_t events,
                               std::function<void(uint32_t)> callback) override;
  void run() override;
  void exit() override;

  event_base* base() { return base_; }

 private:
  static void onWakeup(int fd, short what, void* arg);
  void drainPosted();

  const std::string name_;
  event_base* base_{nullptr};
  struct event* wakeup_{nullptr};
  std::atomic<std::thread::id> loop_thread_{std::thread::id()};
  std::atomic<bool> stop_requested_{false};

  std::mutex posted_mutex_;
  std::deque<std::function<void()>> posted_;
};

}  // namespace event
}  // namespace warden

#endif  // WARDEN_EVENT_LIBEVENT_DISPATCHER_H
