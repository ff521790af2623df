#ifndef __PTYMUX_EVENT_SINK_HPP__
#define __PTYMUX_EVENT_SINK_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace ptymux {
/** @brief Prefix of the per-session event name. */
const string EVENT_NAME_PREFIX = "terminal://";

inline string eventNameForSession(const string& sessionId) {
  return EVENT_NAME_PREFIX + sessionId;
}

/**
 * @brief Channel from the session workers to the host.
 *
 * Called concurrently from every session's workers; implementations
 * serialize internally.
 */
class EventSink {
 public:
  virtual ~EventSink() {}
  /**
   * @brief Delivers one event.
   * @throws std::runtime_error when the host can no longer receive events.
   */
  virtual void emit(const string& eventName, const json& payload) = 0;
};
}  // namespace ptymux

#endif  // __PTYMUX_EVENT_SINK_HPP__
