#define WARDEN_LOG_COMPONENT "process.child"

#include "warden/process/child_process.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <vector>

#include "warden/core/error.h"
#include "warden/logging/log_macros.h"

extern char** environ;

namespace warden {
namespace process {

namespace {

void closeFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// Owns both ends of a pipe until they are handed out
struct Pipe {
  int fds[2]{-1, -1};

  ~Pipe() {
    closeFd(fds[0]);
    closeFd(fds[1]);
  }

  int release(int end) {
    int fd = fds[end];
    fds[end] = -1;
    return fd;
  }
};

void openPipe(Pipe& p, const char* what) {
  if (pipe2(p.fds, O_CLOEXEC) != 0) {
    throw WardenError(errors::SpawnFailed,
                      std::string("failed to create ") + what +
                          " pipe: " + std::strerror(errno));
  }
}

std::vector<std::string> buildEnvironment(
    const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** env = environ; env && *env; ++env) {
    std::string entry(*env);
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto& kv : overrides) {
    merged[kv.first] = kv.second;
  }

  std::vector<std::string> result;
  result.reserve(merged.size());
  for (const auto& kv : merged) {
    result.push_back(kv.first + "=" + kv.second);
  }
  return result;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void execChild(const char* command,
                            char* const* argv,
                            char* const* envp,
                            const char* working_directory,
                            int stdin_fd,
                            int stdout_fd,
                            int stderr_fd,
                            int status_fd) {
  setpgid(0, 0);

  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  ::signal(SIGPIPE, SIG_DFL);

  if (dup2(stdin_fd, STDIN_FILENO) < 0 || dup2(stdout_fd, STDOUT_FILENO) < 0 ||
      dup2(stderr_fd, STDERR_FILENO) < 0) {
    int err = errno;
    ssize_t n = write(status_fd, &err, sizeof(err));
    (void)n;
    _exit(127);
  }

  if (working_directory && chdir(working_directory) != 0) {
    int err = errno;
    ssize_t n = write(status_fd, &err, sizeof(err));
    (void)n;
    _exit(127);
  }

  execvpe(command, argv, envp);

  int err = errno;
  ssize_t n = write(status_fd, &err, sizeof(err));
  (void)n;
  _exit(127);
}

}  // namespace

std::unique_ptr<ChildProcess> ChildProcess::spawn(const ProcessSpec& spec) {
  if (spec.command.empty()) {
    throw WardenError(errors::SpawnFailed,
                      "no command configured for process " + spec.id);
  }

  // Everything the child needs is built before fork.
  std::vector<std::string> args;
  args.reserve(spec.args.size() + 1);
  args.push_back(spec.command);
  args.insert(args.end(), spec.args.begin(), spec.args.end());
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<std::string> env = buildEnvironment(spec.env);
  std::vector<char*> envp;
  for (auto& entry : env) {
    envp.push_back(const_cast<char*>(entry.c_str()));
  }
  envp.push_back(nullptr);

  const char* working_directory =
      spec.working_directory.empty() ? nullptr
                                     : spec.working_directory.c_str();

  Pipe in, out, err, status;
  openPipe(in, "stdin");
  openPipe(out, "stdout");
  openPipe(err, "stderr");
  openPipe(status, "status");

  pid_t pid = fork();
  if (pid < 0) {
    throw WardenError(errors::SpawnFailed,
                      "fork failed for process " + spec.id + ": " +
                          std::strerror(errno));
  }

  if (pid == 0) {
    execChild(spec.command.c_str(), argv.data(), envp.data(),
              working_directory, in.fds[0], out.fds[1], err.fds[1],
              status.fds[1]);
  }

  // Mirror the child's setpgid so signalling the group cannot race exec.
  setpgid(pid, pid);

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->pid_ = pid;
  child->stdin_fd_ = in.release(1);
  child->stdout_fd_ = out.release(0);
  child->stderr_fd_ = err.release(0);
  child->status_fd_ = status.release(0);

  setNonBlocking(child->stdin_fd_);
  setNonBlocking(child->stdout_fd_);
  setNonBlocking(child->stderr_fd_);
  setNonBlocking(child->status_fd_);

  WARDEN_LOG(Debug, "forked {} as pid {}", spec.command, pid);
  return child;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0 && !reaped_) {
    WARDEN_LOG(Warning, "killing unreaped child pid {}", pid_);
    kill(-pid_, SIGKILL);
    kill(pid_, SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
  }

  closeFd(stdin_fd_);
  closeFd(stdout_fd_);
  closeFd(stderr_fd_);
  closeFd(status_fd_);
}

ChildProcess::ExecStatus ChildProcess::readExecStatus() {
  if (exec_status_ != ExecStatus::Pending) {
    return exec_status_;
  }

  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_fd_, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == 0) {
    exec_status_ = ExecStatus::Succeeded;
  } else if (n > 0) {
    exec_status_ = ExecStatus::Failed;
    exec_errno_ = child_errno;
  } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
    exec_status_ = ExecStatus::Failed;
    exec_errno_ = errno;
  }
  return exec_status_;
}

bool ChildProcess::signal(int sig) {
  if (pid_ <= 0 || reaped_) {
    return false;
  }
  if (kill(-pid_, sig) == 0) {
    return true;
  }
  // The child may not have reached setpgid yet
  return kill(pid_, sig) == 0;
}

optional<ChildProcess::ExitStatus> ChildProcess::tryReap() {
  if (pid_ <= 0) {
    return nullopt;
  }
  if (reaped_) {
    return nullopt;
  }

  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid_, &status, WNOHANG);
  } while (rc < 0 && errno == EINTR);

  if (rc == 0) {
    return nullopt;
  }

  reaped_ = true;
  ExitStatus result;
  if (rc < 0) {
    // ECHILD: someone else collected it, exit status unknown
    WARDEN_LOG(Warning, "waitpid({}) failed: {}", pid_, std::strerror(errno));
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

ssize_t ChildProcess::writeInput(const char* data, size_t size) {
  if (stdin_fd_ < 0) {
    errno = EBADF;
    return -1;
  }
  ssize_t n;
  do {
    n = write(stdin_fd_, data, size);
  } while (n < 0 && errno == EINTR);
  return n;
}

}  // namespace process
}  // namespace warden
