#include "ExitWatcher.hpp"

namespace ptymux {
ExitWatcher::ExitWatcher(const string& _sessionId, shared_ptr<PtyChild> _child,
                         shared_ptr<EventSink> _eventSink,
                         shared_ptr<SessionRegistry> _registry)
    : sessionId(_sessionId),
      child(_child),
      eventSink(_eventSink),
      registry(_registry),
      state(State::WAITING),
      started(false) {}

void ExitWatcher::run() {
  {
    lock_guard<std::mutex> guard(stateMutex);
    if (started) {
      LOG(WARNING) << "Exit watcher for " << sessionId << " already ran";
      return;
    }
    started = true;
  }

  ExitStatus status;
  try {
    status = child->wait();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to wait for terminal exit: " << ex.what();
    status.exitCode = WAIT_FAILED_EXIT_CODE;
    status.signal = WAIT_FAILED_SIGNAL;
  }
  LOG(INFO) << "Terminal session " << sessionId << " exited with code "
            << status.exitCode
            << (status.signal ? " (" + *status.signal + ")" : string());

  try {
    eventSink->emit(eventNameForSession(sessionId), exitPayload(status));
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to emit terminal exit: " << ex.what();
  }
  setState(State::REPORTED);

  registry->remove(sessionId);
  setState(State::TERMINAL);
}

ExitWatcher::State ExitWatcher::getState() {
  lock_guard<std::mutex> guard(stateMutex);
  return state;
}

json ExitWatcher::exitPayload(const ExitStatus& status) {
  json payload;
  payload["type"] = "exit";
  payload["exitCode"] = status.exitCode;
  if (status.signal) {
    payload["signal"] = *status.signal;
  } else {
    payload["signal"] = nullptr;
  }
  return payload;
}

void ExitWatcher::setState(State newState) {
  lock_guard<std::mutex> guard(stateMutex);
  state = newState;
}
}  // namespace ptymux
