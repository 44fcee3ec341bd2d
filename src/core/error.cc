#include "warden/core/error.h"

namespace warden {

const char* errorCodeToString(int code) {
  switch (code) {
    case errors::SpawnFailed:
      return "spawn failed";
    case errors::StartupTimeout:
      return "startup timeout";
    case errors::UnexpectedExit:
      return "unexpected exit";
    case errors::ConnectionFailed:
      return "connection failed";
    case errors::InvocationFailed:
      return "invocation failed";
    case errors::NotInitialized:
      return "not initialized";
    case errors::ServerNotConnected:
      return "server not connected";
    case errors::ConfigInvalid:
      return "invalid configuration";
    case errors::ProtocolError:
      return "protocol error";
    case errors::ShuttingDown:
      return "shutting down";
    default:
      return "unknown error";
  }
}

}  // namespace warden
