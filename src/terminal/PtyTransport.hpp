#ifndef __PTYMUX_PTY_TRANSPORT_HPP__
#define __PTYMUX_PTY_TRANSPORT_HPP__

#include "Headers.hpp"

namespace ptymux {
/** @brief Terminal geometry in character cells. */
struct PtySize {
  uint16_t cols;
  uint16_t rows;
};

/** @brief How a child process ended. */
struct ExitStatus {
  int exitCode;
  /** @brief Description of the terminating signal, if any. */
  optional<string> signal;
};

/** @brief A program to start on the slave side of a pty. */
struct CommandSpec {
  string program;
  vector<string> args;
  string cwd;
  /** @brief Variables set on top of the inherited environment. */
  vector<pair<string, string>> env;
};

/** @brief Blocking byte source cloned from a pty master. */
class PtyReader {
 public:
  virtual ~PtyReader() {}
  /**
   * @brief Reads up to `count` bytes.
   * @return The number of bytes read, 0 once the stream has ended.
   * @throws std::runtime_error on I/O failure.
   */
  virtual size_t read(char* buf, size_t count) = 0;
};

/** @brief Byte sink feeding the pty's input side. */
class PtyWriter {
 public:
  virtual ~PtyWriter() {}
  /** @throws std::runtime_error on I/O failure. */
  virtual void writeAll(const string& data) = 0;
};

/** @brief Handle to a process spawned on a pty. */
class PtyChild {
 public:
  virtual ~PtyChild() {}
  /**
   * @brief Blocks until the process ends.
   *
   * Calling it again after the process ended returns the same status.
   * @throws std::runtime_error if waiting fails.
   */
  virtual ExitStatus wait() = 0;
  /**
   * @brief Forcefully terminates the process.
   *
   * Killing a process that already ended is a no-op.
   * @throws std::runtime_error if the signal cannot be delivered.
   */
  virtual void kill() = 0;
  virtual pid_t getPid() = 0;
};

/** @brief Controlling side of a pty. */
class MasterPty {
 public:
  virtual ~MasterPty() {}
  /** @brief Returns an independent reader of the pty output. */
  virtual unique_ptr<PtyReader> cloneReader() = 0;
  /**
   * @brief Hands out the writer. Only one writer exists per master.
   * @throws std::runtime_error when the writer was already taken.
   */
  virtual unique_ptr<PtyWriter> takeWriter() = 0;
  /** @throws std::runtime_error if the size cannot be applied. */
  virtual void resize(const PtySize& size) = 0;
};

/** @brief Terminal side of a pty. Released as soon as the child runs. */
class SlavePty {
 public:
  virtual ~SlavePty() {}
  /**
   * @brief Starts `command` with the slave as its controlling terminal.
   * @throws std::runtime_error if the process cannot be started.
   */
  virtual shared_ptr<PtyChild> spawnCommand(const CommandSpec& command) = 0;
};

struct PtyPair {
  unique_ptr<MasterPty> master;
  unique_ptr<SlavePty> slave;
};

/**
 * @brief Allocates pseudo-terminals.
 *
 * `SessionManager` only talks to this interface; `PosixPtySystem` is the
 * native implementation and tests substitute fakes.
 */
class PtySystem {
 public:
  virtual ~PtySystem() {}
  /** @throws std::runtime_error if no pty can be allocated. */
  virtual PtyPair openPty(const PtySize& size) = 0;
};
}  // namespace ptymux

#endif  // __PTYMUX_PTY_TRANSPORT_HPP__
