#include <errno.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "warden/core/error.h"
#include "warden/process/child_process.h"

namespace warden {
namespace process {
namespace {

ProcessSpec shellSpec(const std::string& script) {
  ProcessSpec spec;
  spec.id = "child-test";
  spec.command = "sh";
  spec.args = {"-c", script};
  return spec;
}

ChildProcess::ExitStatus waitExit(ChildProcess& child) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    auto status = child.tryReap();
    if (status) {
      return *status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  ADD_FAILURE() << "child did not exit";
  return ChildProcess::ExitStatus();
}

ChildProcess::ExecStatus waitExec(ChildProcess& child) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    auto status = child.readExecStatus();
    if (status != ChildProcess::ExecStatus::Pending) {
      return status;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return ChildProcess::ExecStatus::Pending;
}

std::string readAll(int fd) {
  std::string out;
  char buf[256];
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<size_t>(n));
    } else if (n == 0) {
      break;
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
  return out;
}

TEST(ChildProcessTest, ReportsExitCode) {
  auto child = ChildProcess::spawn(shellSpec("exit 3"));
  ASSERT_GT(child->pid(), 0);

  EXPECT_EQ(waitExec(*child), ChildProcess::ExecStatus::Succeeded);
  auto status = waitExit(*child);
  ASSERT_TRUE(status.exit_code.has_value());
  EXPECT_EQ(*status.exit_code, 3);
  EXPECT_FALSE(status.success());
  EXPECT_TRUE(child->reaped());
}

TEST(ChildProcessTest, MissingExecutableFailsExec) {
  ProcessSpec spec;
  spec.id = "missing";
  spec.command = "/nonexistent/warden-test-binary";
  auto child = ChildProcess::spawn(spec);

  EXPECT_EQ(waitExec(*child), ChildProcess::ExecStatus::Failed);
  EXPECT_EQ(child->execErrno(), ENOENT);
  auto status = waitExit(*child);
  ASSERT_TRUE(status.exit_code.has_value());
  EXPECT_EQ(*status.exit_code, 127);
}

TEST(ChildProcessTest, EmptyCommandThrows) {
  ProcessSpec spec;
  spec.id = "empty";
  try {
    ChildProcess::spawn(spec);
    FAIL() << "expected SpawnFailed";
  } catch (const WardenError& e) {
    EXPECT_EQ(e.code(), errors::SpawnFailed);
  }
}

TEST(ChildProcessTest, SignalTerminates) {
  ProcessSpec spec;
  spec.id = "sleeper";
  spec.command = "sleep";
  spec.args = {"30"};
  auto child = ChildProcess::spawn(spec);
  ASSERT_EQ(waitExec(*child), ChildProcess::ExecStatus::Succeeded);

  EXPECT_TRUE(child->signal(SIGTERM));
  auto status = waitExit(*child);
  ASSERT_TRUE(status.term_signal.has_value());
  EXPECT_EQ(*status.term_signal, SIGTERM);
  EXPECT_FALSE(child->signal(SIGTERM));
}

TEST(ChildProcessTest, EnvironmentMergedOverParent) {
  ::setenv("WARDEN_INHERITED", "from-parent", 1);
  auto spec = shellSpec("echo $WARDEN_INHERITED $WARDEN_OVERRIDE");
  spec.env["WARDEN_OVERRIDE"] = "from-spec";
  auto child = ChildProcess::spawn(spec);

  EXPECT_EQ(readAll(child->stdoutFd()), "from-parent from-spec\n");
  waitExit(*child);
}

TEST(ChildProcessTest, WorkingDirectory) {
  auto spec = shellSpec("pwd");
  spec.working_directory = "/";
  auto child = ChildProcess::spawn(spec);

  EXPECT_EQ(readAll(child->stdoutFd()), "/\n");
  waitExit(*child);
}

TEST(ChildProcessTest, StdinReachesChild) {
  ProcessSpec spec;
  spec.id = "cat";
  spec.command = "head";
  spec.args = {"-n", "1"};
  auto child = ChildProcess::spawn(spec);

  std::string line = "ping\n";
  ASSERT_EQ(child->writeInput(line.data(), line.size()),
            static_cast<ssize_t>(line.size()));
  EXPECT_EQ(readAll(child->stdoutFd()), "ping\n");
  auto status = waitExit(*child);
  EXPECT_TRUE(status.success());
}

TEST(ChildProcessTest, DestructorKillsRunningChild) {
  pid_t pid;
  {
    ProcessSpec spec;
    spec.id = "sleeper";
    spec.command = "sleep";
    spec.args = {"30"};
    auto child = ChildProcess::spawn(spec);
    pid = child->pid();
    ASSERT_EQ(waitExec(*child), ChildProcess::ExecStatus::Succeeded);
  }
  EXPECT_EQ(::kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

}  // namespace
}  // namespace process
}  // namespace warden
