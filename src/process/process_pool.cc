#define WARDEN_LOG_COMPONENT "process.pool"

#include "warden/process/process_pool.h"

#include <errno.h>
#include <signal.h>
#include <unistd.h>

#include <cstring>
#include <mutex>
#include <thread>

#include <fmt/format.h>

#include "warden/core/error.h"
#include "warden/logging/log_macros.h"

namespace warden {
namespace process {

const char* processStateToString(ProcessState state) {
  switch (state) {
    case ProcessState::Starting:
      return "starting";
    case ProcessState::Running:
      return "running";
    case ProcessState::Stopping:
      return "stopping";
    case ProcessState::Stopped:
      return "stopped";
    case ProcessState::Error:
      return "error";
  }
  return "unknown";
}

const char* processEventTypeToString(ProcessEvent::Type type) {
  switch (type) {
    case ProcessEvent::Type::Created:
      return "created";
    case ProcessEvent::Type::Terminated:
      return "terminated";
    case ProcessEvent::Type::Exited:
      return "exited";
    case ProcessEvent::Type::Error:
      return "error";
  }
  return "unknown";
}

namespace {

// Writing to a pipe whose reader died must fail with EPIPE instead of
// killing the supervisor.
void ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() {
    struct sigaction current;
    if (sigaction(SIGPIPE, nullptr, &current) == 0 &&
        current.sa_handler == SIG_DFL) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  });
}

std::string describeExit(const ChildProcess::ExitStatus& status) {
  if (status.term_signal) {
    return fmt::format("killed by signal {}", *status.term_signal);
  }
  if (status.exit_code) {
    return fmt::format("exited with code {}", *status.exit_code);
  }
  return "exited";
}

template <typename T>
void fail(const std::shared_ptr<std::promise<T>>& promise,
          int code,
          const std::string& message) {
  promise->set_exception(std::make_exception_ptr(WardenError(code, message)));
}

}  // namespace

struct ProcessPool::Entry {
  ManagedProcess record;
  // Declared before the events so it is destroyed after them
  ChildProcessPtr child;
  event::FileEventPtr status_event;
  event::FileEventPtr stdout_event;
  event::FileEventPtr stderr_event;
  event::FileEventPtr stdin_event;
  event::TimerPtr startup_timer;
  event::TimerPtr kill_timer;
  event::TimerPtr restart_timer;
  std::string stdout_buffer;
  std::string stderr_buffer;
  std::string pending_input;
  std::vector<StartPromise> start_waiters;
  std::vector<StopPromise> stop_waiters;
  // Run after the entry has been removed from the pool
  std::vector<std::function<void()>> after_stop;
  uint64_t generation{0};
  bool stdout_open{true};
  bool stderr_open{true};
  bool terminating{false};
  bool restart_pending{false};
  bool killed{false};
};

ProcessPool::ProcessPool(PoolOptions options)
    : options_(std::move(options)),
      worker_(std::make_unique<event::Worker>("warden-pool")),
      dispatcher_(worker_->dispatcher()) {
  ignoreSigpipe();
  worker_->start();

  event::runOnDispatcher(dispatcher_, [this]() {
    reap_timer_ = dispatcher_.createTimer([this]() {
      pollAll();
      reap_timer_->enable(options_.reap_interval);
    });
    reap_timer_->enable(options_.reap_interval);

    health_timer_ = dispatcher_.createTimer([this]() {
      evictDeadEntries();
      health_timer_->enable(options_.health_check_interval);
    });
    health_timer_->enable(options_.health_check_interval);
  });

  WARDEN_LOG(Debug, "process pool started (health sweep every {} ms)",
             options_.health_check_interval.count());
}

ProcessPool::~ProcessPool() { shutdown(); }

template <typename Fn>
auto ProcessPool::onLoop(Fn fn) -> decltype(fn()) {
  // Once the pool thread is gone nothing else touches the entries.
  if (!worker_->running()) {
    return fn();
  }
  return event::runOnDispatcher(dispatcher_, std::move(fn));
}

std::future<ManagedProcess> ProcessPool::getOrCreate(const ProcessSpec& spec) {
  auto promise = std::make_shared<std::promise<ManagedProcess>>();
  auto future = promise->get_future();

  if (shutting_down_) {
    fail(promise, errors::ShuttingDown, "process pool is shutting down");
    return future;
  }
  if (spec.id.empty()) {
    fail(promise, errors::SpawnFailed, "process spec has no id");
    return future;
  }

  dispatcher_.post([this, spec, promise]() { doGetOrCreate(spec, promise); });
  return future;
}

std::future<void> ProcessPool::terminate(const std::string& id) {
  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();

  if (!worker_->running()) {
    promise->set_value();
    return future;
  }

  dispatcher_.post([this, id, promise]() { doTerminate(id, promise); });
  return future;
}

void ProcessPool::shutdown() {
  if (shutting_down_.exchange(true)) {
    return;
  }

  WARDEN_LOG(Info, "shutting down process pool");

  std::vector<std::future<void>> pending;
  if (worker_->running()) {
    pending = event::runOnDispatcher(dispatcher_, [this]() {
      if (health_timer_) {
        health_timer_->disable();
      }

      std::vector<std::string> ids;
      for (const auto& kv : entries_) {
        ids.push_back(kv.first);
      }

      std::vector<std::future<void>> futures;
      for (const auto& id : ids) {
        Entry* entry = find(id);
        if (!entry) {
          continue;
        }
        auto promise = std::make_shared<std::promise<void>>();
        futures.push_back(promise->get_future());
        entry->stop_waiters.push_back(promise);
        beginTerminate(id);
      }
      return futures;
    });
  }

  // Terminations run concurrently; bound the total wait.
  auto deadline = std::chrono::steady_clock::now() + options_.grace_period +
                  options_.kill_retry_interval + std::chrono::seconds(1);
  for (auto& future : pending) {
    if (future.wait_until(deadline) != std::future_status::ready) {
      WARDEN_LOG(Error, "process did not exit before the shutdown deadline");
    }
  }

  runCleanupSweep();

  if (worker_->running()) {
    event::runOnDispatcher(dispatcher_, [this]() {
      reap_timer_.reset();
      health_timer_.reset();
      // Survivors are killed and reaped by ~ChildProcess
      entries_.clear();
    });
    worker_->stop();
  }

  shut_down_ = true;
  WARDEN_LOG(Info, "process pool shut down");
}

optional<ManagedProcess> ProcessPool::get(const std::string& id) {
  return onLoop([this, id]() -> optional<ManagedProcess> {
    Entry* entry = find(id);
    if (!entry) {
      return nullopt;
    }
    return snapshot(*entry);
  });
}

bool ProcessPool::isHealthy(const std::string& id) {
  return onLoop([this, id]() -> bool {
    pollChild(id);
    Entry* entry = find(id);
    return entry && !entry->terminating &&
           entry->record.state == ProcessState::Running && entry->child &&
           !entry->child->reaped();
  });
}

std::vector<ManagedProcess> ProcessPool::list() {
  return onLoop([this]() {
    std::vector<ManagedProcess> result;
    for (const auto& kv : entries_) {
      result.push_back(snapshot(*kv.second));
    }
    return result;
  });
}

size_t ProcessPool::size() {
  return onLoop([this]() { return entries_.size(); });
}

void ProcessPool::writeInput(const std::string& id, const std::string& data) {
  onLoop([this, id, data]() {
    Entry* entry = find(id);
    if (!entry || entry->terminating ||
        entry->record.state != ProcessState::Running || !entry->child ||
        entry->child->reaped()) {
      throw WardenError(errors::InvocationFailed,
                        "process " + id + " is not running");
    }
    entry->pending_input += data;
    if (!flushInput(*entry)) {
      throw WardenError(errors::InvocationFailed,
                        "stdin of process " + id + " is closed");
    }
  });
}

void ProcessPool::runHealthSweep() {
  onLoop([this]() { evictDeadEntries(); });
}

void ProcessPool::doGetOrCreate(const ProcessSpec& spec, StartPromise promise) {
  if (shutting_down_) {
    fail(promise, errors::ShuttingDown, "process pool is shutting down");
    return;
  }

  const std::string& id = spec.id;
  Entry* entry = find(id);
  if (!entry) {
    startProcess(spec, 0, {promise});
    return;
  }

  if (entry->terminating) {
    // The replacement starts once the old process is gone
    entry->after_stop.push_back(
        [this, spec, promise]() { doGetOrCreate(spec, promise); });
    return;
  }

  if (entry->record.state == ProcessState::Starting || entry->restart_pending) {
    entry->start_waiters.push_back(promise);
    return;
  }

  if (entry->record.state == ProcessState::Running) {
    pollChild(id);
    entry = find(id);
    if (entry && entry->record.state == ProcessState::Running) {
      bool reusable = true;
      if (options_.reuse_check) {
        try {
          reusable = options_.reuse_check(entry->record);
        } catch (const std::exception& e) {
          WARDEN_LOG(Warning, "reuse check for {} threw: {}", id, e.what());
          reusable = false;
        }
      }
      if (reusable) {
        WARDEN_LOG(Debug, "reusing process {} (pid {})", id,
                   entry->record.pid);
        promise->set_value(snapshot(*entry));
        return;
      }
      WARDEN_LOG(Warning, "process {} failed the reuse check, replacing it",
                 id);
    } else if (entry && entry->restart_pending) {
      entry->start_waiters.push_back(promise);
      return;
    }
  }

  if (!entry) {
    startProcess(spec, 0, {promise});
    return;
  }

  WARDEN_LOG(Info, "replacing unhealthy process {} ({})", id,
             processStateToString(entry->record.state));
  entry->after_stop.push_back(
      [this, spec, promise]() { doGetOrCreate(spec, promise); });
  beginTerminate(id);
}

void ProcessPool::doTerminate(const std::string& id, StopPromise promise) {
  Entry* entry = find(id);
  if (!entry) {
    promise->set_value();
    return;
  }
  entry->stop_waiters.push_back(promise);
  beginTerminate(id);
}

void ProcessPool::startProcess(const ProcessSpec& spec,
                               uint32_t restart_count,
                               std::vector<StartPromise> waiters) {
  const std::string id = spec.id;

  auto entry = std::make_unique<Entry>();
  entry->record.spec = spec;
  entry->record.state = ProcessState::Starting;
  entry->record.restart_count = restart_count;
  entry->record.start_time = std::chrono::system_clock::now();
  entry->generation = next_generation_++;
  entry->start_waiters = std::move(waiters);

  WARDEN_LOG(Info, "starting process {}: {} (restarts {}/{})", id,
             spec.command, restart_count, spec.max_restarts);

  Entry& ref = *entry;
  entries_[id] = std::move(entry);

  try {
    ref.child = ChildProcess::spawn(spec);
  } catch (const WardenError& e) {
    failStart(ref, e.code(), e.what());
    return;
  }
  ref.record.pid = ref.child->pid();

  const uint32_t read_events = event::FileReadyType::Read;
  ref.status_event = dispatcher_.createFileEvent(
      ref.child->statusFd(), read_events,
      [this, id](uint32_t) { onExecStatus(id); });
  ref.stdout_event = dispatcher_.createFileEvent(
      ref.child->stdoutFd(), read_events, [this, id](uint32_t) {
        if (Entry* e = find(id)) {
          readOutput(*e, OutputStream::Stdout);
        }
      });
  ref.stderr_event = dispatcher_.createFileEvent(
      ref.child->stderrFd(), read_events, [this, id](uint32_t) {
        if (Entry* e = find(id)) {
          readOutput(*e, OutputStream::Stderr);
        }
      });

  ref.startup_timer =
      dispatcher_.createTimer([this, id]() { onStartupTimeout(id); });
  ref.startup_timer->enable(spec.startup_timeout);
}

void ProcessPool::onExecStatus(const std::string& id) {
  Entry* entry = find(id);
  if (!entry || !entry->child) {
    return;
  }

  auto status = entry->child->readExecStatus();
  if (status == ChildProcess::ExecStatus::Pending) {
    return;
  }
  entry->status_event->setEnabled(0);

  if (entry->record.state != ProcessState::Starting) {
    return;
  }
  if (status == ChildProcess::ExecStatus::Succeeded) {
    if (entry->record.spec.ready_line.empty()) {
      markRunning(*entry);
    }
  } else {
    failStart(*entry, errors::SpawnFailed,
              fmt::format("failed to execute {}: {}",
                          entry->record.spec.command,
                          std::strerror(entry->child->execErrno())));
  }
}

void ProcessPool::markRunning(Entry& entry) {
  entry.record.state = ProcessState::Running;
  entry.record.last_error.clear();
  if (entry.startup_timer) {
    entry.startup_timer->disable();
  }

  WARDEN_LOG(Info, "process {} running (pid {})", entry.record.spec.id,
             entry.record.pid);

  auto waiters = std::move(entry.start_waiters);
  entry.start_waiters.clear();
  ManagedProcess record = snapshot(entry);

  emit(ProcessEvent::Type::Created, entry);
  for (auto& waiter : waiters) {
    waiter->set_value(record);
  }
}

void ProcessPool::failStart(Entry& entry,
                            int code,
                            const std::string& message) {
  entry.record.state = ProcessState::Error;
  entry.record.last_error = message;
  if (entry.startup_timer) {
    entry.startup_timer->disable();
  }
  if (entry.status_event) {
    entry.status_event->setEnabled(0);
  }
  // A child that missed its startup deadline is not kept around
  if (entry.child && !entry.child->reaped()) {
    entry.child->signal(SIGKILL);
  }

  WARDEN_LOG(Error, "process {} failed to start: {}", entry.record.spec.id,
             message);

  auto waiters = std::move(entry.start_waiters);
  entry.start_waiters.clear();

  emit(ProcessEvent::Type::Error, entry, message);
  for (auto& waiter : waiters) {
    fail(waiter, code, message);
  }
}

void ProcessPool::onStartupTimeout(const std::string& id) {
  Entry* entry = find(id);
  if (!entry || entry->record.state != ProcessState::Starting) {
    return;
  }
  failStart(*entry, errors::StartupTimeout,
            fmt::format("process {} did not start within {} ms", id,
                        entry->record.spec.startup_timeout.count()));
}

void ProcessPool::beginTerminate(const std::string& id) {
  Entry* entry = find(id);
  if (!entry) {
    return;
  }

  entry->restart_pending = false;
  if (entry->restart_timer) {
    entry->restart_timer->disable();
  }
  if (entry->startup_timer) {
    entry->startup_timer->disable();
  }
  if (!entry->start_waiters.empty()) {
    auto waiters = std::move(entry->start_waiters);
    entry->start_waiters.clear();
    for (auto& waiter : waiters) {
      fail(waiter, errors::SpawnFailed,
           "process " + id + " was terminated before it became ready");
    }
  }

  if (entry->terminating) {
    return;  // Escalation already in progress
  }
  entry->terminating = true;

  if (!entry->child || entry->child->reaped()) {
    finishTermination(id);
    return;
  }

  entry->record.state = ProcessState::Stopping;
  WARDEN_LOG(Info, "stopping process {} (pid {})", id, entry->record.pid);
  entry->child->signal(SIGTERM);

  entry->kill_timer = dispatcher_.createTimer([this, id]() { onKillTimer(id); });
  entry->kill_timer->enable(options_.grace_period);
}

void ProcessPool::onKillTimer(const std::string& id) {
  Entry* entry = find(id);
  if (!entry || !entry->child || entry->child->reaped()) {
    return;
  }

  if (!entry->killed) {
    WARDEN_LOG(Warning,
               "process {} still running {} ms after SIGTERM, sending SIGKILL",
               id, options_.grace_period.count());
  } else {
    WARDEN_LOG(Error, "process {} survived SIGKILL, retrying", id);
  }
  entry->killed = true;
  entry->child->signal(SIGKILL);
  entry->kill_timer->enable(options_.kill_retry_interval);
}

void ProcessPool::finishTermination(const std::string& id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return;
  }

  EntryPtr entry = std::move(it->second);
  entries_.erase(it);

  entry->record.state = ProcessState::Stopped;
  WARDEN_LOG(Info, "process {} terminated{}", id,
             entry->killed ? " (killed)" : "");

  auto stop_waiters = std::move(entry->stop_waiters);
  auto continuations = std::move(entry->after_stop);

  emit(ProcessEvent::Type::Terminated, *entry);
  entry.reset();

  for (auto& waiter : stop_waiters) {
    waiter->set_value();
  }
  for (auto& continuation : continuations) {
    continuation();
  }
}

void ProcessPool::pollChild(const std::string& id) {
  Entry* entry = find(id);
  if (!entry || !entry->child || entry->child->reaped()) {
    return;
  }
  auto status = entry->child->tryReap();
  if (status) {
    onChildExit(id, *status);
  }
}

void ProcessPool::pollAll() {
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& kv : entries_) {
    ids.push_back(kv.first);
  }
  for (const auto& id : ids) {
    pollChild(id);
  }
}

void ProcessPool::onChildExit(const std::string& id,
                              const ChildProcess::ExitStatus& status) {
  Entry* entry = find(id);
  if (!entry) {
    return;
  }

  // Pick up whatever the child wrote before it exited
  readOutput(*entry, OutputStream::Stdout);
  readOutput(*entry, OutputStream::Stderr);

  entry->record.exit_code = status.exit_code;
  entry->record.term_signal = status.term_signal;
  if (entry->startup_timer) {
    entry->startup_timer->disable();
  }

  if (entry->terminating) {
    finishTermination(id);
    return;
  }

  if (entry->record.state == ProcessState::Starting) {
    auto exec = entry->child->readExecStatus();
    if (entry->status_event) {
      entry->status_event->setEnabled(0);
    }
    if (exec != ChildProcess::ExecStatus::Succeeded ||
        !entry->record.spec.ready_line.empty()) {
      std::string reason =
          exec == ChildProcess::ExecStatus::Failed
              ? fmt::format("failed to execute {}: {}",
                            entry->record.spec.command,
                            std::strerror(entry->child->execErrno()))
              : fmt::format("process {} {} during startup", id,
                            describeExit(status));
      failStart(*entry, errors::SpawnFailed, reason);
      return;
    }
    markRunning(*entry);
  }

  if (entry->record.state != ProcessState::Running) {
    WARDEN_LOG(Debug, "process {} {}", id, describeExit(status));
    return;
  }

  const bool clean = status.success();
  entry->record.state = clean ? ProcessState::Stopped : ProcessState::Error;
  entry->record.last_error = clean ? std::string() : describeExit(status);
  if (clean) {
    WARDEN_LOG(Info, "process {} exited normally", id);
  } else {
    WARDEN_LOG(Warning, "process {} {}", id, describeExit(status));
  }
  emit(ProcessEvent::Type::Exited, *entry, describeExit(status));

  const ProcessSpec& spec = entry->record.spec;
  if (clean || !spec.auto_restart || shutting_down_) {
    return;
  }

  if (entry->record.restart_count >= spec.max_restarts) {
    WARDEN_LOG(Error, "process {} reached its restart limit ({})", id,
               spec.max_restarts);
    emit(ProcessEvent::Type::Error, *entry, "restart limit reached");
    return;
  }

  entry->restart_pending = true;
  const uint64_t generation = entry->generation;
  WARDEN_LOG(Info, "restarting process {} in {} ms (attempt {}/{})", id,
             options_.restart_delay.count(), entry->record.restart_count + 1,
             spec.max_restarts);
  entry->restart_timer = dispatcher_.createTimer([this, id, generation]() {
    // The restart replaces the entry that owns this timer
    dispatcher_.post([this, id, generation]() { restartProcess(id, generation); });
  });
  entry->restart_timer->enable(options_.restart_delay);
}

void ProcessPool::restartProcess(const std::string& id, uint64_t generation) {
  Entry* entry = find(id);
  if (!entry || entry->generation != generation || !entry->restart_pending ||
      shutting_down_) {
    return;
  }

  ProcessSpec spec = entry->record.spec;
  uint32_t restart_count = entry->record.restart_count + 1;
  auto waiters = std::move(entry->start_waiters);
  entries_.erase(id);

  startProcess(spec, restart_count, std::move(waiters));
}

void ProcessPool::readOutput(Entry& entry, OutputStream stream) {
  const bool is_stdout = stream == OutputStream::Stdout;
  bool& open = is_stdout ? entry.stdout_open : entry.stderr_open;
  if (!open || !entry.child) {
    return;
  }

  int fd = is_stdout ? entry.child->stdoutFd() : entry.child->stderrFd();
  std::string& buffer = is_stdout ? entry.stdout_buffer : entry.stderr_buffer;
  event::FileEventPtr& file_event =
      is_stdout ? entry.stdout_event : entry.stderr_event;

  char chunk[4096];
  while (true) {
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
      buffer.append(chunk, static_cast<size_t>(n));
      size_t pos;
      while ((pos = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        emitLine(entry, stream, std::move(line));
      }
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      break;
    }

    // EOF or a read error: the stream is finished
    if (!buffer.empty()) {
      std::string rest;
      rest.swap(buffer);
      emitLine(entry, stream, std::move(rest));
    }
    open = false;
    if (file_event) {
      file_event->setEnabled(0);
    }
    break;
  }
}

void ProcessPool::emitLine(Entry& entry,
                           OutputStream stream,
                           std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  const std::string& ready_line = entry.record.spec.ready_line;
  const bool ready = stream == OutputStream::Stdout &&
                     entry.record.state == ProcessState::Starting &&
                     !ready_line.empty() &&
                     line.find(ready_line) != std::string::npos;

  const std::string& id = entry.record.spec.id;
  if (stream == OutputStream::Stdout) {
    WARDEN_LOG_NAMED("process.output", Debug, "[{}] {}", id, line);
  } else {
    WARDEN_LOG_NAMED("process.output", Info, "[{}:stderr] {}", id, line);
  }

  ProcessOutput output;
  output.process_id = id;
  output.stream = stream;
  output.line = std::move(line);
  output_.emit(output);

  if (ready) {
    markRunning(entry);
  }
}

bool ProcessPool::flushInput(Entry& entry) {
  const std::string id = entry.record.spec.id;

  while (!entry.pending_input.empty()) {
    ssize_t n = entry.child->writeInput(entry.pending_input.data(),
                                        entry.pending_input.size());
    if (n > 0) {
      entry.pending_input.erase(0, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // Pipe full: finish when the child drains it
      if (!entry.stdin_event) {
        entry.stdin_event = dispatcher_.createFileEvent(
            entry.child->stdinFd(), event::FileReadyType::Write,
            [this, id](uint32_t) {
              if (Entry* e = find(id)) {
                flushInput(*e);
              }
            });
      } else {
        entry.stdin_event->setEnabled(event::FileReadyType::Write);
      }
      return true;
    }

    WARDEN_LOG(Warning, "write to process {} failed: {}", id,
               std::strerror(errno));
    entry.pending_input.clear();
    if (entry.stdin_event) {
      entry.stdin_event->setEnabled(0);
    }
    return false;
  }

  if (entry.stdin_event) {
    entry.stdin_event->setEnabled(0);
  }
  return true;
}

void ProcessPool::evictDeadEntries() {
  pollAll();

  std::vector<std::string> dead;
  for (const auto& kv : entries_) {
    const Entry& entry = *kv.second;
    if (entry.terminating || entry.restart_pending) {
      continue;
    }
    const bool gone = !entry.child || entry.child->reaped();
    const bool finished = entry.record.state == ProcessState::Stopped ||
                          entry.record.state == ProcessState::Error;
    if (gone && finished) {
      dead.push_back(kv.first);
    }
  }

  for (const auto& id : dead) {
    const Entry& entry = *entries_[id];
    WARDEN_LOG(Info, "evicting dead process {} ({})", id,
               entry.record.last_error.empty()
                   ? processStateToString(entry.record.state)
                   : entry.record.last_error);
    entries_.erase(id);
  }
}

void ProcessPool::runCleanupSweep() {
  if (options_.cleanup_pattern.empty()) {
    return;
  }

  ProcessSpec spec;
  spec.id = "cleanup";
  spec.command = "pkill";
  spec.args = {"-f", options_.cleanup_pattern};

  WARDEN_LOG(Info, "running cleanup sweep for '{}'", options_.cleanup_pattern);

  ChildProcessPtr child;
  try {
    child = ChildProcess::spawn(spec);
  } catch (const WardenError& e) {
    WARDEN_LOG(Warning, "cleanup sweep could not start: {}", e.what());
    return;
  }

  auto deadline = std::chrono::steady_clock::now() + options_.cleanup_timeout;
  while (true) {
    auto status = child->tryReap();
    if (status) {
      // pkill exits with 1 when nothing matched
      WARDEN_LOG(Debug, "cleanup sweep {}", describeExit(*status));
      return;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      WARDEN_LOG(Warning, "cleanup sweep timed out after {} ms",
                 options_.cleanup_timeout.count());
      return;  // ~ChildProcess kills it
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

ProcessPool::Entry* ProcessPool::find(const std::string& id) {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : it->second.get();
}

ManagedProcess ProcessPool::snapshot(const Entry& entry) const {
  return entry.record;
}

void ProcessPool::emit(ProcessEvent::Type type,
                       const Entry& entry,
                       const std::string& message) {
  ProcessEvent event;
  event.type = type;
  event.process_id = entry.record.spec.id;
  event.pid = entry.record.pid;
  event.exit_code = entry.record.exit_code;
  event.term_signal = entry.record.term_signal;
  event.restart_count = entry.record.restart_count;
  event.message = message;
  events_.emit(event);
}

}  // namespace process
}  // namespace warden
