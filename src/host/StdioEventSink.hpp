#ifndef __PTYMUX_STDIO_EVENT_SINK_HPP__
#define __PTYMUX_STDIO_EVENT_SINK_HPP__

#include "EventSink.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace ptymux {
/**
 * @brief Writes JSON documents to a descriptor, one per line.
 *
 * Lines from concurrent writers never interleave. Invalid UTF-8 in strings
 * is written as U+FFFD. After the first failed write every later write fails
 * immediately.
 */
class JsonLineWriter {
 public:
  explicit JsonLineWriter(int _fd) : fd(_fd), broken(false) {}

  /** @throws std::runtime_error if the line cannot be written. */
  void writeLine(const json& document);

  bool isBroken() {
    lock_guard<std::mutex> guard(writeMutex);
    return broken;
  }

 protected:
  int fd;
  std::mutex writeMutex;
  bool broken;
};

/** @brief Event sink that prints `{"event": name, "payload": ...}` lines. */
class StdioEventSink : public EventSink {
 public:
  explicit StdioEventSink(shared_ptr<JsonLineWriter> _writer)
      : writer(_writer) {}
  virtual ~StdioEventSink() {}

  virtual void emit(const string& eventName, const json& payload);

 protected:
  shared_ptr<JsonLineWriter> writer;
};
}  // namespace ptymux

#endif  // __PTYMUX_STDIO_EVENT_SINK_HPP__
