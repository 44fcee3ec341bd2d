#define WARDEN_LOG_COMPONENT "event.dispatcher"

#include "warden/event/libevent_dispatcher.h"

#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "warden/logging/log_macros.h"

namespace warden {
namespace event {

namespace {

void enablePthreadLocking() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (evthread_use_pthreads() != 0) {
      throw std::runtime_error("libevent pthread support is unavailable");
    }
  });
}

timeval toTimeval(std::chrono::milliseconds delay) {
  if (delay.count() < 0) {
    delay = std::chrono::milliseconds(0);
  }
  timeval tv;
  tv.tv_sec = static_cast<time_t>(delay.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((delay.count() % 1000) * 1000);
  return tv;
}

class LibeventTimer : public Timer {
 public:
  LibeventTimer(event_base* base, std::function<void()> callback)
      : callback_(std::move(callback)) {
    ev_ = evtimer_new(base, &LibeventTimer::onFire, this);
    if (!ev_) {
      throw std::runtime_error("evtimer_new failed");
    }
  }

  ~LibeventTimer() override { event_free(ev_); }

  void enable(std::chrono::milliseconds delay) override {
    timeval tv = toTimeval(delay);
    evtimer_add(ev_, &tv);
  }

  void disable() override { evtimer_del(ev_); }

  bool enabled() const override {
    return evtimer_pending(ev_, nullptr) != 0;
  }

 private:
  static void onFire(evutil_socket_t, short, void* arg) {
    static_cast<LibeventTimer*>(arg)->callback_();
  }

  struct event* ev_{nullptr};
  std::function<void()> callback_;
};

class LibeventFileEvent : public FileEvent {
 public:
  LibeventFileEvent(event_base* base,
                    int fd,
                    uint32_t events,
                    std::function<void(uint32_t)> callback)
      : base_(base), fd_(fd), callback_(std::move(callback)) {
    ev_ = event_new(base_, fd_, 0, &LibeventFileEvent::onReady, this);
    if (!ev_) {
      throw std::runtime_error("event_new failed for fd " +
                               std::to_string(fd_));
    }
    setEnabled(events);
  }

  ~LibeventFileEvent() override { event_free(ev_); }

  void setEnabled(uint32_t events) override {
    event_del(ev_);
    if (events == 0) {
      return;
    }

    short what = EV_PERSIST;
    if (events & FileReadyType::Read) {
      what |= EV_READ;
    }
    if (events & FileReadyType::Write) {
      what |= EV_WRITE;
    }
    event_assign(ev_, base_, fd_, what, &LibeventFileEvent::onReady, this);
    if (event_add(ev_, nullptr) != 0) {
      WARDEN_LOG(Error, "cannot watch fd {}", fd_);
    }
  }

 private:
  static void onReady(evutil_socket_t, short what, void* arg) {
    uint32_t ready = 0;
    if (what & EV_READ) {
      ready |= FileReadyType::Read;
    }
    if (what & EV_WRITE) {
      ready |= FileReadyType::Write;
    }
    if (ready != 0) {
      static_cast<LibeventFileEvent*>(arg)->callback_(ready);
    }
  }

  event_base* base_;
  int fd_;
  struct event* ev_{nullptr};
  std::function<void(uint32_t)> callback_;
};

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  enablePthreadLocking();

  base_ = event_base_new();
  if (!base_) {
    throw std::runtime_error("event_base_new failed");
  }
  // Posted work is delivered by activating this event by hand
  wakeup_ = event_new(base_, -1, 0, &LibeventDispatcher::onWakeup, this);
  if (!wakeup_) {
    event_base_free(base_);
    throw std::runtime_error("cannot create wakeup event");
  }

  WARDEN_LOG(Debug, "dispatcher {} on {}", name_,
             event_base_get_method(base_));
}

LibeventDispatcher::~LibeventDispatcher() {
  event_free(wakeup_);
  event_base_free(base_);
}

void LibeventDispatcher::post(std::function<void()> callback) {
  bool was_empty;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    was_empty = posted_.empty();
    posted_.push_back(std::move(callback));
  }
  if (was_empty) {
    event_active(wakeup_, 0, 0);
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  return loop_thread_.load() == std::this_thread::get_id();
}

TimerPtr LibeventDispatcher::createTimer(std::function<void()> callback) {
  return std::make_unique<LibeventTimer>(base_, std::move(callback));
}

FileEventPtr LibeventDispatcher::createFileEvent(
    int fd, uint32_t events, std::function<void(uint32_t)> callback) {
  return std::make_unique<LibeventFileEvent>(base_, fd, events,
                                             std::move(callback));
}

void LibeventDispatcher::run() {
  loop_thread_ = std::this_thread::get_id();
  drainPosted();

  while (!stop_requested_) {
    if (event_base_loop(base_, EVLOOP_ONCE | EVLOOP_NO_EXIT_ON_EMPTY) < 0) {
      WARDEN_LOG(Error, "dispatcher {} loop failed", name_);
      break;
    }
  }

  loop_thread_ = std::thread::id();
  stop_requested_ = false;

  std::deque<std::function<void()>> dropped;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    dropped.swap(posted_);
  }
  if (!dropped.empty()) {
    WARDEN_LOG(Debug, "dispatcher {} dropped {} callbacks", name_,
               dropped.size());
  }
}

void LibeventDispatcher::exit() {
  stop_requested_ = true;
  event_active(wakeup_, 0, 0);
}

void LibeventDispatcher::onWakeup(int, short, void* arg) {
  static_cast<LibeventDispatcher*>(arg)->drainPosted();
}

void LibeventDispatcher::drainPosted() {
  std::deque<std::function<void()>> batch;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    batch.swap(posted_);
  }
  for (auto& callback : batch) {
    callback();
  }
}

DispatcherPtr createLibeventDispatcher(const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

}  // namespace event
}  // namespace warden
