#ifndef WARDEN_PROCESS_PROCESS_TYPES_H
#define WARDEN_PROCESS_PROCESS_TYPES_H

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "warden/core/compat.h"

namespace warden {
namespace process {

/**
 * @brief Immutable description of a process to run
 */
struct ProcessSpec {
  // Unique key within a pool
  std::string id;
  std::string command;
  std::vector<std::string> args;
  // Empty means inherit the supervisor's working directory
  std::string working_directory;
  // Merged over the supervisor's environment
  std::map<std::string, std::string> env;
  std::chrono::milliseconds startup_timeout{10000};
  // When set, the process is started only once a stdout line contains this
  // text. Otherwise a successful exec is enough.
  std::string ready_line;
  bool auto_restart{false};
  uint32_t max_restarts{3};
};

enum class ProcessState { Starting, Running, Stopping, Stopped, Error };

const char* processStateToString(ProcessState state);

/**
 * @brief Snapshot of a pooled process
 */
struct ManagedProcess {
  ProcessSpec spec;
  pid_t pid{-1};
  ProcessState state{ProcessState::Starting};
  std::chrono::system_clock::time_point start_time;
  uint32_t restart_count{0};
  std::string last_error;
  optional<int> exit_code;
  optional<int> term_signal;
};

enum class OutputStream { Stdout, Stderr };

// One line written by a child to stdout or stderr
struct ProcessOutput {
  std::string process_id;
  OutputStream stream{OutputStream::Stdout};
  std::string line;
};

struct ProcessEvent {
  enum class Type { Created, Terminated, Exited, Error };

  Type type{Type::Created};
  std::string process_id;
  pid_t pid{-1};
  optional<int> exit_code;
  optional<int> term_signal;
  uint32_t restart_count{0};
  std::string message;
};

const char* processEventTypeToString(ProcessEvent::Type type);

}  // namespace process
}  // namespace warden

#endif  // WARDEN_PROCESS_PROCESS_TYPES_H
