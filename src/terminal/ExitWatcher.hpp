#ifndef __PTYMUX_EXIT_WATCHER_HPP__
#define __PTYMUX_EXIT_WATCHER_HPP__

#include "EventSink.hpp"
#include "Headers.hpp"
#include "PtyTransport.hpp"
#include "SessionRegistry.hpp"

namespace ptymux {
/** @brief Exit code reported when waiting on the child itself failed. */
const int WAIT_FAILED_EXIT_CODE = 1;
const string WAIT_FAILED_SIGNAL = "Terminal crashed";

/**
 * @brief Waits for a session's child to end, reports it once, and drops the
 * session from the registry.
 */
class ExitWatcher {
 public:
  enum class State { WAITING, REPORTED, TERMINAL };

  ExitWatcher(const string& _sessionId, shared_ptr<PtyChild> _child,
              shared_ptr<EventSink> _eventSink,
              shared_ptr<SessionRegistry> _registry);

  /** @brief Blocks until the child ends. Only the first call does anything. */
  void run();

  State getState();

  /** @brief Builds the "exit" event payload for a status. */
  static json exitPayload(const ExitStatus& status);

 protected:
  string sessionId;
  shared_ptr<PtyChild> child;
  shared_ptr<EventSink> eventSink;
  shared_ptr<SessionRegistry> registry;
  std::mutex stateMutex;
  State state;
  bool started;

  void setState(State newState);
};
}  // namespace ptymux

#endif  // __PTYMUX_EXIT_WATCHER_HPP__
