#ifndef __PTYMUX_SESSION_MANAGER_HPP__
#define __PTYMUX_SESSION_MANAGER_HPP__

#include "EventSink.hpp"
#include "Headers.hpp"
#include "OutputPump.hpp"
#include "PtyTransport.hpp"
#include "SessionError.hpp"
#include "SessionRegistry.hpp"

namespace ptymux {
struct SessionManagerOptions {
  OutputOptions output;
  /** @brief Shell to start instead of $SHELL (config file / --shell). */
  optional<string> shellOverride;
  /** @brief Source of the fallback working directory. */
  std::function<optional<string>()> homeDirectoryResolver;
};

/**
 * @brief Creates, drives and tears down terminal sessions.
 *
 * Every command may be called from any thread. Each session gets an
 * `OutputPump` and an `ExitWatcher` running on their own threads; they keep
 * running until the pty stream ends and the child is reaped, independently
 * of whether the session is still registered.
 */
class SessionManager {
 public:
  SessionManager(shared_ptr<PtySystem> _ptySystem,
                 shared_ptr<SessionRegistry> _registry,
                 shared_ptr<EventSink> _eventSink,
                 const SessionManagerOptions& _options);
  virtual ~SessionManager() {}

  /**
   * @brief Starts a shell on a new cols x rows pty.
   * @param cwd Working directory; the home directory is used when it is
   * absent or not an existing directory.
   * @return The new session id.
   * @throws SessionError (INVALID_WORKING_DIRECTORY, TRANSPORT_FAILED,
   * SPAWN_FAILED, also when a worker thread cannot be started). Nothing stays
   * registered when it throws.
   */
  string create(uint16_t cols, uint16_t rows, const optional<string>& cwd);

  /**
   * @brief Sends raw input to the session's shell.
   * @throws SessionError (SESSION_NOT_FOUND, WRITE_FAILED).
   */
  void write(const string& sessionId, const string& data);

  /** @throws SessionError (SESSION_NOT_FOUND, RESIZE_FAILED). */
  void resize(const string& sessionId, uint16_t cols, uint16_t rows);

  /** @brief Removes the session and kills its child. Unknown ids are fine. */
  void close(const string& sessionId);

  /** @brief close() followed by create(). Returns the replacement's id. */
  string restart(const string& sessionId, uint16_t cols, uint16_t rows,
                 const optional<string>& cwd);

  /**
   * @brief Closes one session, or every registered session when no id is
   * given. Sessions created while a full kill runs may survive it.
   */
  void forceKill(const optional<string>& sessionId);

  bool hasSession(const string& sessionId) {
    return registry->contains(sessionId);
  }
  size_t numSessions() { return registry->size(); }

  /** @brief Blocks until every worker thread started so far has returned. */
  void waitForWorkers();
  /** @brief Same with a limit. Returns false if workers are still running. */
  bool waitForWorkers(std::chrono::milliseconds timeout);

 protected:
  /** @brief Counts running worker threads so shutdown can wait for them. */
  struct WorkerCounter {
    std::mutex counterMutex;
    std::condition_variable allDone;
    int running = 0;
  };

  shared_ptr<PtySystem> ptySystem;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<EventSink> eventSink;
  SessionManagerOptions options;
  shared_ptr<WorkerCounter> workers;

  void startWorkers(const string& sessionId, unique_ptr<PtyReader> reader,
                    shared_ptr<PtyChild> child);
  /**
   * @brief Runs `work` on a detached, counted thread.
   * @throws std::system_error if the thread cannot be started.
   */
  virtual void spawnWorker(const string& threadName,
                           std::function<void()> work);
  /** @brief Best-effort kill; failures are logged and dropped. */
  void killChild(const string& sessionId, const shared_ptr<Session>& session);
  /** @brief Kills and reaps a child whose session never got registered. */
  void abandonChild(const shared_ptr<PtyChild>& child);
};
}  // namespace ptymux

#endif  // __PTYMUX_SESSION_MANAGER_HPP__
