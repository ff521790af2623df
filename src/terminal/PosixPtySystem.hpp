#ifndef __PTYMUX_POSIX_PTY_SYSTEM_HPP__
#define __PTYMUX_POSIX_PTY_SYSTEM_HPP__

#include "PtyTransport.hpp"

namespace ptymux {
/** @brief Reader over a dup of the master fd. EIO counts as end of stream. */
class PosixPtyReader : public PtyReader {
 public:
  explicit PosixPtyReader(int _fd) : fd(_fd) {}
  virtual ~PosixPtyReader();
  virtual size_t read(char* buf, size_t count);

 protected:
  int fd;
};

class PosixPtyWriter : public PtyWriter {
 public:
  explicit PosixPtyWriter(int _fd) : fd(_fd) {}
  virtual ~PosixPtyWriter();
  virtual void writeAll(const string& data);

 protected:
  int fd;
};

/**
 * @brief Child process started on a pty.
 *
 * `wait()` blocks without holding the handle's mutex and reaps under it, so
 * `kill()` never signals a pid that was already reaped and recycled.
 */
class PosixPtyChild : public PtyChild {
 public:
  explicit PosixPtyChild(pid_t _pid) : pid(_pid) {}
  virtual ~PosixPtyChild() {}
  virtual ExitStatus wait();
  virtual void kill();
  virtual pid_t getPid() { return pid; }

  /** @brief Converts a waitpid() status into an `ExitStatus`. */
  static ExitStatus toExitStatus(int rawStatus);

 protected:
  pid_t pid;
  std::mutex childMutex;
  optional<ExitStatus> status;
};

class PosixMasterPty : public MasterPty {
 public:
  explicit PosixMasterPty(int _fd) : fd(_fd), writerTaken(false) {}
  virtual ~PosixMasterPty();
  virtual unique_ptr<PtyReader> cloneReader();
  virtual unique_ptr<PtyWriter> takeWriter();
  virtual void resize(const PtySize& size);

 protected:
  int fd;
  bool writerTaken;
};

class PosixSlavePty : public SlavePty {
 public:
  explicit PosixSlavePty(int _fd) : fd(_fd) {}
  virtual ~PosixSlavePty();
  virtual shared_ptr<PtyChild> spawnCommand(const CommandSpec& command);

 protected:
  int fd;
};

/** @brief Allocates ptys with openpty() and starts children with fork/exec. */
class PosixPtySystem : public PtySystem {
 public:
  virtual ~PosixPtySystem() {}
  virtual PtyPair openPty(const PtySize& size);

  /**
   * @brief Builds the child's environment: the current environment with
   * every variable named in `overlay` replaced, then the overlay itself.
   */
  static vector<string> buildEnvironment(
      const vector<pair<string, string>>& overlay);
};
}  // namespace ptymux

#endif  // __PTYMUX_POSIX_PTY_SYSTEM_HPP__
