#include "SessionManager.hpp"

#include "ExitWatcher.hpp"
#include "ShellEnvironment.hpp"

namespace ptymux {
SessionManager::SessionManager(shared_ptr<PtySystem> _ptySystem,
                               shared_ptr<SessionRegistry> _registry,
                               shared_ptr<EventSink> _eventSink,
                               const SessionManagerOptions& _options)
    : ptySystem(_ptySystem),
      registry(_registry),
      eventSink(_eventSink),
      options(_options),
      workers(new WorkerCounter()) {
  if (!options.homeDirectoryResolver) {
    options.homeDirectoryResolver = ShellEnvironment::getHomeDirectory;
  }
}

string SessionManager::create(uint16_t cols, uint16_t rows,
                              const optional<string>& cwd) {
  PtySize size;
  size.cols = cols;
  size.rows = rows;

  CommandSpec command;
  command.cwd = ShellEnvironment::resolveWorkingDirectory(
      cwd, options.homeDirectoryResolver());
  command.program = ShellEnvironment::resolveShell(options.shellOverride);
  if (ShellEnvironment::shellAcceptsLoginFlag(command.program)) {
    command.args.push_back("-l");
  }
  command.env = ShellEnvironment::buildEnvironmentOverlay(command.program);

  PtyPair pair;
  try {
    pair = ptySystem->openPty(size);
  } catch (const std::runtime_error& re) {
    throw SessionError(ErrorCode::TRANSPORT_FAILED,
                       string("Failed to open PTY: ") + re.what());
  }

  shared_ptr<PtyChild> child;
  try {
    child = pair.slave->spawnCommand(command);
  } catch (const std::runtime_error& re) {
    throw SessionError(ErrorCode::SPAWN_FAILED,
                       string("Failed to spawn shell: ") + re.what());
  }
  // The child holds its own copy of the slave now.
  pair.slave.reset();

  unique_ptr<PtyReader> reader;
  try {
    reader = pair.master->cloneReader();
  } catch (const std::runtime_error& re) {
    abandonChild(child);
    throw SessionError(ErrorCode::SPAWN_FAILED,
                       string("Failed to clone PTY reader: ") + re.what());
  }

  shared_ptr<SharedWriter> writer;
  try {
    writer.reset(new SharedWriter(pair.master->takeWriter()));
  } catch (const std::runtime_error& re) {
    abandonChild(child);
    throw SessionError(ErrorCode::SPAWN_FAILED,
                       string("Failed to take PTY writer: ") + re.what());
  }

  string sessionId = sole::uuid4().str();
  registry->insert(sessionId, shared_ptr<Session>(new Session(
                                  std::move(pair.master), writer, child)));
  LOG(INFO) << "Created terminal session " << sessionId << " (" << cols << "x"
            << rows << ") running " << command.program << " in "
            << command.cwd;

  try {
    startWorkers(sessionId, std::move(reader), child);
  } catch (const std::system_error& se) {
    registry->remove(sessionId);
    abandonChild(child);
    throw SessionError(ErrorCode::SPAWN_FAILED,
                       string("Failed to start session workers: ") +
                           se.what());
  }
  return sessionId;
}

void SessionManager::write(const string& sessionId, const string& data) {
  shared_ptr<SharedWriter> writer;
  {
    auto session = registry->get(sessionId);
    if (!session) {
      throw SessionError(ErrorCode::SESSION_NOT_FOUND,
                         "Terminal session not found");
    }
    writer = session->writer;
  }

  try {
    writer->writeAll(data);
  } catch (const std::runtime_error& re) {
    // The exit watcher decides when a session is dead, not a failed write.
    throw SessionError(ErrorCode::WRITE_FAILED,
                       string("Failed to write to terminal: ") + re.what());
  }
  VLOG(4) << "Wrote " << data.size() << " bytes to " << sessionId;
}

void SessionManager::resize(const string& sessionId, uint16_t cols,
                            uint16_t rows) {
  auto session = registry->get(sessionId);
  if (!session) {
    throw SessionError(ErrorCode::SESSION_NOT_FOUND,
                       "Terminal session not found");
  }
  PtySize size;
  size.cols = cols;
  size.rows = rows;
  try {
    session->resize(size);
  } catch (const std::runtime_error& re) {
    throw SessionError(ErrorCode::RESIZE_FAILED,
                       string("Failed to resize terminal: ") + re.what());
  }
  VLOG(1) << "Resized " << sessionId << " to " << cols << "x" << rows;
}

void SessionManager::close(const string& sessionId) {
  auto session = registry->remove(sessionId);
  if (!session) {
    VLOG(1) << "Close of unknown session " << sessionId;
    return;
  }
  LOG(INFO) << "Closing terminal session " << sessionId;
  killChild(sessionId, session);
}

string SessionManager::restart(const string& sessionId, uint16_t cols,
                               uint16_t rows, const optional<string>& cwd) {
  close(sessionId);
  string newSessionId = create(cols, rows, cwd);
  LOG(INFO) << "Restarted terminal session " << sessionId << " as "
            << newSessionId;
  return newSessionId;
}

void SessionManager::forceKill(const optional<string>& sessionId) {
  if (sessionId) {
    close(*sessionId);
    return;
  }

  auto sessions = registry->removeAll();
  LOG(INFO) << "Force killing " << sessions.size() << " terminal sessions";
  for (const auto& it : sessions) {
    killChild(it.first, it.second);
  }
}

void SessionManager::waitForWorkers() {
  unique_lock<std::mutex> lock(workers->counterMutex);
  workers->allDone.wait(lock, [this] { return workers->running == 0; });
}

bool SessionManager::waitForWorkers(std::chrono::milliseconds timeout) {
  unique_lock<std::mutex> lock(workers->counterMutex);
  return workers->allDone.wait_for(
      lock, timeout, [this] { return workers->running == 0; });
}

void SessionManager::startWorkers(const string& sessionId,
                                  unique_ptr<PtyReader> reader,
                                  shared_ptr<PtyChild> child) {
  shared_ptr<OutputPump> pump(
      new OutputPump(sessionId, std::move(reader), eventSink, options.output));
  shared_ptr<ExitWatcher> watcher(
      new ExitWatcher(sessionId, child, eventSink, registry));

  string shortId = sessionId.substr(0, 8);
  spawnWorker("output-" + shortId, [pump]() { pump->run(); });
  spawnWorker("exit-" + shortId, [watcher]() { watcher->run(); });
}

void SessionManager::spawnWorker(const string& threadName,
                                 std::function<void()> work) {
  auto counter = workers;
  {
    lock_guard<std::mutex> guard(counter->counterMutex);
    counter->running++;
  }
  auto body = [counter, threadName, work]() {
    el::Helpers::setThreadName(threadName);
    try {
      work();
    } catch (const std::exception& ex) {
      STERROR << "Worker " << threadName << " died: " << ex.what();
    }
    {
      lock_guard<std::mutex> guard(counter->counterMutex);
      counter->running--;
    }
    counter->allDone.notify_all();
  };
  try {
    std::thread(body).detach();
  } catch (const std::system_error& se) {
    {
      lock_guard<std::mutex> guard(counter->counterMutex);
      counter->running--;
    }
    counter->allDone.notify_all();
    LOG(ERROR) << "Could not start worker " << threadName << ": " << se.what();
    throw;
  }
}

void SessionManager::killChild(const string& sessionId,
                               const shared_ptr<Session>& session) {
  try {
    session->child->kill();
  } catch (const std::exception& ex) {
    // The process may already be gone.
    LOG(INFO) << "Ignoring kill failure for " << sessionId << ": "
              << ex.what();
  }
}

void SessionManager::abandonChild(const shared_ptr<PtyChild>& child) {
  try {
    child->kill();
    child->wait();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Could not clean up pid " << child->getPid() << ": "
                 << ex.what();
  }
}
}  // namespace ptymux
