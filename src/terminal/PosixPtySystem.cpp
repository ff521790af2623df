#include "PosixPtySystem.hpp"

#include "RawFdUtils.hpp"

extern char** environ;

namespace ptymux {
namespace {
// openpty() hands out inheritable fds. Holding this across openpty and the
// FD_CLOEXEC fcntls, and across every fork, keeps a concurrent spawn from
// leaking another session's pty into its shell.
std::mutex ptyAllocationMutex;
}  // namespace

PosixPtyReader::~PosixPtyReader() { RawFdUtils::closeFd(&fd); }

size_t PosixPtyReader::read(char* buf, size_t count) {
  ssize_t rc;
  do {
    rc = ::read(fd, buf, count);
  } while (rc < 0 && GetErrno() == EINTR);
  if (rc < 0) {
    // Linux reports EIO on the master once every holder of the slave is gone.
    if (GetErrno() == EIO) {
      return 0;
    }
    throw std::runtime_error(strerror(GetErrno()));
  }
  return size_t(rc);
}

PosixPtyWriter::~PosixPtyWriter() { RawFdUtils::closeFd(&fd); }

void PosixPtyWriter::writeAll(const string& data) {
  RawFdUtils::writeAll(fd, data.data(), data.size());
}

ExitStatus PosixPtyChild::toExitStatus(int rawStatus) {
  ExitStatus exitStatus;
  if (WIFSIGNALED(rawStatus)) {
    exitStatus.exitCode = 1;
    exitStatus.signal = string(strsignal(WTERMSIG(rawStatus)));
  } else if (WIFEXITED(rawStatus)) {
    exitStatus.exitCode = WEXITSTATUS(rawStatus);
  } else {
    exitStatus.exitCode = 1;
  }
  return exitStatus;
}

ExitStatus PosixPtyChild::wait() {
  {
    lock_guard<std::mutex> guard(childMutex);
    if (status) {
      return *status;
    }
  }

  // Wait without reaping so the pid stays reserved until we hold the lock.
  siginfo_t childInfo;
  int rc;
  do {
    rc = waitid(P_PID, pid, &childInfo, WEXITED | WNOWAIT);
  } while (rc < 0 && GetErrno() == EINTR);
  int waitErrno = GetErrno();

  lock_guard<std::mutex> guard(childMutex);
  if (status) {
    // Another waiter reaped the child first.
    return *status;
  }
  if (rc < 0) {
    throw std::runtime_error(string("waitid failed: ") + strerror(waitErrno));
  }

  int rawStatus = 0;
  pid_t reaped;
  do {
    reaped = waitpid(pid, &rawStatus, 0);
  } while (reaped < 0 && GetErrno() == EINTR);
  if (reaped < 0) {
    throw std::runtime_error(string("waitpid failed: ") +
                             strerror(GetErrno()));
  }
  status = toExitStatus(rawStatus);
  VLOG(1) << "Child " << pid << " exited with code " << status->exitCode;
  return *status;
}

void PosixPtyChild::kill() {
  lock_guard<std::mutex> guard(childMutex);
  if (status) {
    return;
  }
  if (::kill(pid, SIGKILL) < 0 && GetErrno() != ESRCH) {
    throw std::runtime_error(strerror(GetErrno()));
  }
}

PosixMasterPty::~PosixMasterPty() { RawFdUtils::closeFd(&fd); }

unique_ptr<PtyReader> PosixMasterPty::cloneReader() {
  return unique_ptr<PtyReader>(
      new PosixPtyReader(RawFdUtils::dupCloexec(fd)));
}

unique_ptr<PtyWriter> PosixMasterPty::takeWriter() {
  if (writerTaken) {
    throw std::runtime_error("cannot take writer more than once");
  }
  unique_ptr<PtyWriter> writer(new PosixPtyWriter(RawFdUtils::dupCloexec(fd)));
  writerTaken = true;
  return writer;
}

void PosixMasterPty::resize(const PtySize& size) {
  winsize tmpwin;
  tmpwin.ws_row = size.rows;
  tmpwin.ws_col = size.cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(fd, TIOCSWINSZ, &tmpwin) < 0) {
    throw std::runtime_error(strerror(GetErrno()));
  }
}

PosixSlavePty::~PosixSlavePty() { RawFdUtils::closeFd(&fd); }

shared_ptr<PtyChild> PosixSlavePty::spawnCommand(const CommandSpec& command) {
  // Everything the child needs is prepared before fork().
  vector<string> argStrings;
  argStrings.push_back(command.program);
  argStrings.insert(argStrings.end(), command.args.begin(), command.args.end());
  vector<char*> argv;
  for (auto& it : argStrings) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  vector<string> envStrings = PosixPtySystem::buildEnvironment(command.env);
  vector<char*> envp;
  for (auto& it : envStrings) {
    envp.push_back(&it[0]);
  }
  envp.push_back(NULL);

  // The child reports a failed chdir/exec through this pipe. On success
  // exec closes it and the parent reads EOF.
  int errorPipe[2];
  if (::pipe2(errorPipe, O_CLOEXEC) < 0) {
    throw std::runtime_error(strerror(GetErrno()));
  }

  unique_lock<std::mutex> forkLock(ptyAllocationMutex);
  pid_t pid = fork();
  if (pid != 0) {
    // The child never unwinds; it execs or _exits with its copy held.
    forkLock.unlock();
  }
  switch (pid) {
    case -1: {
      int forkErrno = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      throw std::runtime_error(string("fork failed: ") + strerror(forkErrno));
    }
    case 0: {
      ::close(errorPipe[0]);
      setsid();
      ioctl(fd, TIOCSCTTY, 0);
      dup2(fd, STDIN_FILENO);
      dup2(fd, STDOUT_FILENO);
      dup2(fd, STDERR_FILENO);
      if (fd > STDERR_FILENO) {
        ::close(fd);
      }

      // Shells remember the inherited SIGCHLD/SIGPIPE disposition as the
      // "original" one, so hand them the defaults.
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      signal(SIGINT, SIG_DFL);
      signal(SIGQUIT, SIG_DFL);
      sigset_t emptyMask;
      sigemptyset(&emptyMask);
      sigprocmask(SIG_SETMASK, &emptyMask, NULL);

      int childErrno = 0;
      if (!command.cwd.empty() && chdir(command.cwd.c_str()) < 0) {
        childErrno = errno;
      } else {
        environ = envp.data();
        execvp(argv[0], argv.data());
        childErrno = errno;
      }
      ssize_t ignored = ::write(errorPipe[1], &childErrno, sizeof(childErrno));
      (void)ignored;
      _exit(127);
    }
    default:
      break;
  }

  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(errorPipe[0]);
  if (rc > 0) {
    int rawStatus;
    while (waitpid(pid, &rawStatus, 0) < 0 && GetErrno() == EINTR) {
    }
    throw std::runtime_error(command.program + ": " + strerror(childErrno));
  }

  VLOG(1) << "Spawned " << command.program << " as pid " << pid;
  return shared_ptr<PtyChild>(new PosixPtyChild(pid));
}

PtyPair PosixPtySystem::openPty(const PtySize& size) {
  winsize tmpwin;
  tmpwin.ws_row = size.rows;
  tmpwin.ws_col = size.cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;

  int masterFd, slaveFd;
  {
    lock_guard<std::mutex> guard(ptyAllocationMutex);
    if (openpty(&masterFd, &slaveFd, NULL, NULL, &tmpwin) < 0) {
      throw std::runtime_error(string("openpty failed: ") +
                               strerror(GetErrno()));
    }
    FATAL_FAIL(fcntl(masterFd, F_SETFD, FD_CLOEXEC));
    FATAL_FAIL(fcntl(slaveFd, F_SETFD, FD_CLOEXEC));
  }
  VLOG(1) << "pty opened " << masterFd << " " << slaveFd;

  PtyPair pair;
  pair.master.reset(new PosixMasterPty(masterFd));
  pair.slave.reset(new PosixSlavePty(slaveFd));
  return pair;
}

vector<string> PosixPtySystem::buildEnvironment(
    const vector<pair<string, string>>& overlay) {
  set<string> overridden;
  for (const auto& it : overlay) {
    overridden.insert(it.first);
  }

  vector<string> result;
  for (char** entry = environ; entry != NULL && *entry != NULL; entry++) {
    string variable(*entry);
    string name = variable.substr(0, variable.find('='));
    if (overridden.find(name) == overridden.end()) {
      result.push_back(variable);
    }
  }
  for (const auto& it : overlay) {
    result.push_back(it.first + "=" + it.second);
  }
  return result;
}
}  // namespace ptymux
