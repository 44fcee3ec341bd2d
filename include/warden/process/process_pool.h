#ifndef WARDEN_PROCESS_PROCESS_POOL_H
#define WARDEN_PROCESS_PROCESS_POOL_H

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "warden/core/compat.h"
#include "warden/core/event_channel.h"
#include "warden/event/event_loop.h"
#include "warden/process/child_process.h"
#include "warden/process/process_types.h"

namespace warden {
namespace process {

struct PoolOptions {
  // Interval of the sweep that evicts dead entries
  std::chrono::milliseconds health_check_interval{30000};
  // How often running children are polled for exit
  std::chrono::milliseconds reap_interval{100};
  // Time between SIGTERM and SIGKILL
  std::chrono::milliseconds grace_period{2000};
  // Interval at which SIGKILL is repeated while a child refuses to die
  std::chrono::milliseconds kill_retry_interval{2000};
  // Cool-down before an automatic restart
  std::chrono::milliseconds restart_delay{1000};
  // Command-line pattern for the last-resort "pkill -f" at shutdown.
  // Empty disables the sweep.
  std::string cleanup_pattern;
  std::chrono::milliseconds cleanup_timeout{5000};
  // Extra check before a running entry is reused. By default an entry is
  // reused whenever its process is alive.
  std::function<bool(const ManagedProcess&)> reuse_check;
};

/**
 * @brief Owns child processes keyed by ProcessSpec::id
 *
 * At most one live process exists per id. All bookkeeping happens on the
 * pool's own dispatcher thread; public methods may be called from any other
 * thread. Failures are attached to the id they concern and reported through
 * the returned futures and the event channel.
 */
class ProcessPool {
 public:
  explicit ProcessPool(PoolOptions options = PoolOptions());
  ~ProcessPool();

  ProcessPool(const ProcessPool&) = delete;
  ProcessPool& operator=(const ProcessPool&) = delete;

  /**
   * Return the running process for spec.id, starting one if needed.
   *
   * A healthy entry is reused unchanged. Callers arriving while the same id
   * is starting share that start. An unhealthy entry is terminated and
   * replaced. The future fails with WardenError (SpawnFailed,
   * StartupTimeout or ShuttingDown) when no running process results.
   */
  std::future<ManagedProcess> getOrCreate(const ProcessSpec& spec);

  /**
   * Stop a process: SIGTERM, then SIGKILL after the grace period. The future
   * completes once the child has been reaped and the entry removed. Unknown
   * ids complete immediately.
   */
  std::future<void> terminate(const std::string& id);

  /**
   * Terminate every process, run the cleanup sweep and stop the pool
   * thread. Blocks until done. Idempotent.
   */
  void shutdown();

  optional<ManagedProcess> get(const std::string& id);

  /**
   * True when the entry exists, is running and its process is alive. A dead
   * process is reaped first, so it is never reported healthy.
   */
  bool isHealthy(const std::string& id);

  std::vector<ManagedProcess> list();
  size_t size();

  /**
   * Queue bytes for the child's stdin.
   * @throws WardenError(InvocationFailed) if the process is not running or
   * its stdin is closed
   */
  void writeInput(const std::string& id, const std::string& data);

  // Run the eviction sweep now instead of waiting for the timer
  void runHealthSweep();

  EventChannel<ProcessEvent>& events() { return events_; }
  EventChannel<ProcessOutput>& output() { return output_; }

  const PoolOptions& options() const { return options_; }

 private:
  struct Entry;
  using EntryPtr = std::unique_ptr<Entry>;
  using StartPromise = std::shared_ptr<std::promise<ManagedProcess>>;
  using StopPromise = std::shared_ptr<std::promise<void>>;

  template <typename Fn>
  auto onLoop(Fn fn) -> decltype(fn());

  void doGetOrCreate(const ProcessSpec& spec, StartPromise promise);
  void doTerminate(const std::string& id, StopPromise promise);

  void startProcess(const ProcessSpec& spec,
                    uint32_t restart_count,
                    std::vector<StartPromise> waiters);
  void onExecStatus(const std::string& id);
  void markRunning(Entry& entry);
  void failStart(Entry& entry, int code, const std::string& message);
  void onStartupTimeout(const std::string& id);

  void beginTerminate(const std::string& id);
  void onKillTimer(const std::string& id);
  void finishTermination(const std::string& id);

  void pollChild(const std::string& id);
  void pollAll();
  void onChildExit(const std::string& id,
                   const ChildProcess::ExitStatus& status);
  void restartProcess(const std::string& id, uint64_t generation);

  void readOutput(Entry& entry, OutputStream stream);
  void emitLine(Entry& entry, OutputStream stream, std::string line);
  bool flushInput(Entry& entry);

  void evictDeadEntries();
  void runCleanupSweep();

  Entry* find(const std::string& id);
  ManagedProcess snapshot(const Entry& entry) const;
  void emit(ProcessEvent::Type type,
            const Entry& entry,
            const std::string& message = std::string());

  PoolOptions options_;
  std::unique_ptr<event::Worker> worker_;
  event::Dispatcher& dispatcher_;

  // Owned by the dispatcher thread
  std::map<std::string, EntryPtr> entries_;
  event::TimerPtr health_timer_;
  event::TimerPtr reap_timer_;
  uint64_t next_generation_{1};

  std::atomic<bool> shutting_down_{false};
  std::atomic<bool> shut_down_{false};

  EventChannel<ProcessEvent> events_;
  EventChannel<ProcessOutput> output_;
};

}  // namespace process
}  // namespace warden

#endif  // WARDEN_PROCESS_PROCESS_POOL_H
