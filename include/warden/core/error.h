#ifndef WARDEN_CORE_ERROR_H
#define WARDEN_CORE_ERROR_H

#include <stdexcept>
#include <string>

#include "warden/core/compat.h"

namespace warden {

// Error codes surfaced by the supervision core
namespace errors {
constexpr int SpawnFailed = 1001;
constexpr int StartupTimeout = 1002;
constexpr int UnexpectedExit = 1003;
constexpr int ConnectionFailed = 1004;
constexpr int InvocationFailed = 1005;
constexpr int NotInitialized = 1006;
constexpr int ServerNotConnected = 1007;
constexpr int ConfigInvalid = 1008;
constexpr int ProtocolError = 1009;
constexpr int ShuttingDown = 1010;
}  // namespace errors

const char* errorCodeToString(int code);

struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<T> makeSuccess(T&& value) {
  return Result<T>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool is_error(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const Error& get_error(const Result<T>& result) {
  return get<Error>(result);
}

template <typename T>
const T& get_value(const Result<T>& result) {
  return get<T>(result);
}

/**
 * @brief Base exception carrying a structured Error
 */
class WardenError : public std::runtime_error {
 public:
  explicit WardenError(const Error& error)
      : std::runtime_error(error.message), error_(error) {}
  WardenError(int code, const std::string& message)
      : WardenError(Error(code, message)) {}

  int code() const { return error_.code; }
  const Error& error() const { return error_; }

 private:
  Error error_;
};

/**
 * @brief Raised by accessors used before the orchestrator finished startup
 */
class NotInitializedError : public WardenError {
 public:
  explicit NotInitializedError(const std::string& what)
      : WardenError(errors::NotInitialized, what + " is not initialized") {}
};

/**
 * @brief Raised when a tool is invoked on a server that is not connected
 *
 * Distinct from InvocationFailed so callers can decide to reconnect rather
 * than treat the tool itself as broken.
 */
class ServerNotConnectedError : public WardenError {
 public:
  explicit ServerNotConnectedError(const std::string& server_id)
      : WardenError(errors::ServerNotConnected,
                    "server not connected: " + server_id),
        server_id_(server_id) {}

  const std::string& serverId() const { return server_id_; }

 private:
  std::string server_id_;
};

}  // namespace warden

#endif  // WARDEN_CORE_ERROR_H
