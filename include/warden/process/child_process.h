#ifndef WARDEN_PROCESS_CHILD_PROCESS_H
#define WARDEN_PROCESS_CHILD_PROCESS_H

#include <sys/types.h>

#include <memory>
#include <string>

#include "warden/core/compat.h"
#include "warden/process/process_types.h"

namespace warden {
namespace process {

/**
 * @brief RAII handle to a forked child process
 *
 * The child runs in its own process group with stdin, stdout and stderr
 * connected to non-blocking pipes. A close-on-exec status pipe reports the
 * outcome of exec: EOF means the program image was loaded, an errno value
 * means it could not be started.
 *
 * Destroying a handle whose child was not reaped kills the process group and
 * waits for the child.
 */
class ChildProcess {
 public:
  enum class ExecStatus { Pending, Succeeded, Failed };

  struct ExitStatus {
    optional<int> exit_code;
    optional<int> term_signal;

    bool success() const { return exit_code && *exit_code == 0; }
  };

  /**
   * Fork and exec spec.command with spec.args.
   *
   * @throws WardenError(SpawnFailed) if pipes or fork cannot be created.
   * Failure of exec itself is reported through readExecStatus().
   */
  static std::unique_ptr<ChildProcess> spawn(const ProcessSpec& spec);

  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const { return pid_; }

  int stdinFd() const { return stdin_fd_; }
  int stdoutFd() const { return stdout_fd_; }
  int stderrFd() const { return stderr_fd_; }
  int statusFd() const { return status_fd_; }

  /**
   * Non-blocking read of the exec status pipe. The result is sticky once it
   * leaves Pending.
   */
  ExecStatus readExecStatus();

  // errno reported by the child when exec failed
  int execErrno() const { return exec_errno_; }

  /**
   * Send a signal to the child's process group.
   * @return false if the child was already reaped or the signal failed
   */
  bool signal(int sig);

  /**
   * Collect the exit status without blocking.
   * @return the exit status once the child has terminated
   */
  optional<ExitStatus> tryReap();

  bool reaped() const { return reaped_; }

  /**
   * Write to the child's stdin without blocking.
   * @return bytes written, or -1 with errno set (EAGAIN when the pipe is full)
   */
  ssize_t writeInput(const char* data, size_t size);

 private:
  ChildProcess() = default;

  pid_t pid_{-1};
  int stdin_fd_{-1};
  int stdout_fd_{-1};
  int stderr_fd_{-1};
  int status_fd_{-1};
  ExecStatus exec_status_{ExecStatus::Pending};
  int exec_errno_{0};
  bool reaped_{false};
};

using ChildProcessPtr = std::unique_ptr<ChildProcess>;

}  // namespace process
}  // namespace warden

#endif  // WARDEN_PROCESS_CHILD_PROCESS_H
