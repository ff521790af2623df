#ifndef __PTYMUX_COMMAND_DISPATCHER_HPP__
#define __PTYMUX_COMMAND_DISPATCHER_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionManager.hpp"

namespace ptymux {
/**
 * @brief Host-facing command surface.
 *
 * A request is `{"id": ..., "command": "<name>", "payload": {...}}`. The
 * response echoes the id and is either `{"ok": true, "result": ...}` or
 * `{"ok": false, "error": "<message>", "code": "<category>"}`.
 *
 * Commands: create_terminal_session, send_terminal_input, resize_terminal,
 * close_terminal, restart_terminal_session, force_kill_terminal.
 */
class CommandDispatcher {
 public:
  explicit CommandDispatcher(shared_ptr<SessionManager> _sessionManager);

  /** @brief Runs one request. Never throws for bad input. */
  json handle(const json& request);

  /** @brief Parses a request line and runs it. */
  json handleLine(const string& line);

  /**
   * @brief Runs a command by name.
   * @throws SessionError from the session manager, std::invalid_argument for
   * malformed payloads or unknown commands.
   */
  json dispatch(const string& command, const json& payload);

 protected:
  shared_ptr<SessionManager> sessionManager;

  static json errorResponse(const json& id, const string& message,
                            const string& code);
  static const json& requireField(const json& payload, const char* key);
  static string requireString(const json& payload, const char* key);
  static optional<string> optionalString(const json& payload, const char* key);
  static uint16_t requireDimension(const json& payload, const char* key);
};
}  // namespace ptymux

#endif  // __PTYMUX_COMMAND_DISPATCHER_HPP__
