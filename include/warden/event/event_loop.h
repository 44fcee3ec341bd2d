#ifndef WARDEN_EVENT_EVENT_LOOP_H
#define WARDEN_EVENT_EVENT_LOOP_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

namespace warden {
namespace event {

// Readiness bits passed to and reported by file events
struct FileReadyType {
  static constexpr uint32_t Read = 0x1;
  static constexpr uint32_t Write = 0x2;
};

/**
 * @brief One-shot timer owned by the dispatcher thread
 */
class Timer {
 public:
  virtual ~Timer() = default;

  // Fire once after the delay; replaces any pending deadline
  virtual void enable(std::chrono::milliseconds delay) = 0;
  virtual void disable() = 0;
  virtual bool enabled() const = 0;
};

/**
 * @brief Level-triggered watch on a file descriptor
 *
 * The callback receives the FileReadyType bits that fired. The descriptor is
 * not owned.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // 0 stops watching
  virtual void setEnabled(uint32_t events) = 0;
};

using TimerPtr = std::unique_ptr<Timer>;
using FileEventPtr = std::unique_ptr<FileEvent>;

/**
 * @brief Single-threaded event loop
 *
 * post() and exit() may be called from any thread. Timers and file events
 * are created, armed and destroyed on the dispatcher thread once run() has
 * started.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() const = 0;

  virtual void post(std::function<void()> callback) = 0;

  // True on the thread currently inside run()
  virtual bool isThreadSafe() const = 0;

  virtual TimerPtr createTimer(std::function<void()> callback) = 0;

  virtual FileEventPtr createFileEvent(
      int fd,
      uint32_t events,
      std::function<void(uint32_t)> callback) = 0;

  /**
   * Process events and posted callbacks until exit(). Callbacks still queued
   * when the loop ends are dropped.
   */
  virtual void run() = 0;

  virtual void exit() = 0;
};

using DispatcherPtr = std::unique_ptr<Dispatcher>;

DispatcherPtr createLibeventDispatcher(const std::string& name);

/**
 * @brief Runs a dispatcher on a thread of its own
 */
class Worker {
 public:
  explicit Worker(const std::string& name);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // Returns once the loop accepts work
  void start();
  // Exit the loop and join the thread
  void stop();

  bool running() const { return running_; }
  Dispatcher& dispatcher() { return *dispatcher_; }

 private:
  std::string name_;
  DispatcherPtr dispatcher_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

/**
 * Run fn on the dispatcher thread and hand its result back.
 *
 * Runs inline when called on the dispatcher thread; otherwise blocks until
 * the loop has run it. An exception thrown by fn is rethrown here.
 */
template <typename Fn>
auto runOnDispatcher(Dispatcher& dispatcher, Fn fn) -> decltype(fn()) {
  using R = decltype(fn());
  if (dispatcher.isThreadSafe()) {
    return fn();
  }

  auto promise = std::make_shared<std::promise<R>>();
  auto result = promise->get_future();
  dispatcher.post([promise, fn]() mutable {
    try {
      if constexpr (std::is_void<R>::value) {
        fn();
        promise->set_value();
      } else {
        promise->set_value(fn());
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  });
  return result.get();
}

}  // namespace event
}  // namespace warden

#endif  // WARDEN_EVENT_EVENT_LOOP_H
