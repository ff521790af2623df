#ifndef __PTYMUX_SESSION_HPP__
#define __PTYMUX_SESSION_HPP__

#include "PtyTransport.hpp"

namespace ptymux {
/** @brief The pty writer plus the lock every write goes through. */
class SharedWriter {
 public:
  explicit SharedWriter(unique_ptr<PtyWriter> _writer)
      : writer(std::move(_writer)) {}

  void writeAll(const string& data) {
    lock_guard<std::mutex> guard(writerMutex);
    writer->writeAll(data);
  }

 protected:
  std::mutex writerMutex;
  unique_ptr<PtyWriter> writer;
};

/**
 * @brief One live shell bound to one pty.
 *
 * The master is only touched by resize, under `masterMutex`. The writer and
 * child are shared with in-flight commands and the exit watcher, each with
 * its own lock.
 */
struct Session {
  Session(unique_ptr<MasterPty> _master, shared_ptr<SharedWriter> _writer,
          shared_ptr<PtyChild> _child)
      : master(std::move(_master)), writer(_writer), child(_child) {}

  void resize(const PtySize& size) {
    lock_guard<std::mutex> guard(masterMutex);
    master->resize(size);
  }

  std::mutex masterMutex;
  unique_ptr<MasterPty> master;
  shared_ptr<SharedWriter> writer;
  shared_ptr<PtyChild> child;
};
}  // namespace ptymux

#endif  // __PTYMUX_SESSION_HPP__
