#define WARDEN_LOG_COMPONENT "event.worker"

#include <pthread.h>

#include "warden/event/event_loop.h"
#include "warden/logging/log_macros.h"

namespace warden {
namespace event {

Worker::Worker(const std::string& name)
    : name_(name), dispatcher_(createLibeventDispatcher(name)) {}

Worker::~Worker() { stop(); }

void Worker::start() {
  if (running_.exchange(true)) {
    return;
  }

  std::promise<void> ready;
  std::future<void> ready_future = ready.get_future();
  thread_ = std::thread([this, &ready]() {
    // Linux limits thread names to 15 characters
    pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
    dispatcher_->post([&ready]() { ready.set_value(); });
    dispatcher_->run();
  });
  ready_future.wait();
  WARDEN_LOG(Debug, "worker {} started", name_);
}

void Worker::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  dispatcher_->exit();
  if (thread_.joinable()) {
    thread_.join();
  }
  WARDEN_LOG(Debug, "worker {} stopped", name_);
}

}  // namespace event
}  // namespace warden
