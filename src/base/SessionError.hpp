#ifndef __PTYMUX_SESSION_ERROR__
#define __PTYMUX_SESSION_ERROR__

#include "Headers.hpp"

namespace ptymux {
/** @brief Failure categories reported by session commands. */
enum class ErrorCode {
  SESSION_NOT_FOUND,
  INVALID_WORKING_DIRECTORY,
  SPAWN_FAILED,
  TRANSPORT_FAILED,
  WRITE_FAILED,
  RESIZE_FAILED,
};

/** @brief Returns a stable name for an error code, e.g. "SessionNotFound". */
inline const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::SESSION_NOT_FOUND:
      return "SessionNotFound";
    case ErrorCode::INVALID_WORKING_DIRECTORY:
      return "InvalidWorkingDirectory";
    case ErrorCode::SPAWN_FAILED:
      return "SpawnFailed";
    case ErrorCode::TRANSPORT_FAILED:
      return "TransportFailed";
    case ErrorCode::WRITE_FAILED:
      return "WriteFailed";
    case ErrorCode::RESIZE_FAILED:
      return "ResizeFailed";
  }
  return "Unknown";
}

/**
 * @brief Error thrown by `SessionManager` commands.
 *
 * `what()` carries the message handed back to the host; `getCode()` lets
 * callers branch on the category without parsing text.
 */
class SessionError : public std::runtime_error {
 public:
  SessionError(ErrorCode _code, const string& message)
      : std::runtime_error(message), code(_code) {}

  ErrorCode getCode() const { return code; }

 protected:
  ErrorCode code;
};
}  // namespace ptymux

#endif  // __PTYMUX_SESSION_ERROR__
