#ifndef __PTYMUX_OUTPUT_PUMP_HPP__
#define __PTYMUX_OUTPUT_PUMP_HPP__

#include "ChunkQueue.hpp"
#include "EventSink.hpp"
#include "Headers.hpp"
#include "OutputBatcher.hpp"
#include "PtyTransport.hpp"

namespace ptymux {
/** @brief Tuning of the output path, shared by every session. */
struct OutputOptions {
  /** @brief Longest time decoded text waits before it is flushed (~60/s). */
  std::chrono::milliseconds flushInterval = std::chrono::milliseconds(16);
  /** @brief Pending text size that forces an immediate flush. */
  size_t maxBatchBytes = 64 * 1024;
  /** @brief Size of a single read from the pty. */
  size_t readChunkBytes = 16 * 1024;
};

/**
 * @brief Streams one session's pty output to the host as "data" events.
 *
 * `run()` starts a dedicated blocking reader thread that forwards chunks
 * through a `ChunkQueue`, then decodes and batches them on the calling
 * thread. It returns once the stream ended (or the host stopped accepting
 * events) and the reader thread has been joined.
 */
class OutputPump {
 public:
  OutputPump(const string& _sessionId, unique_ptr<PtyReader> _reader,
             shared_ptr<EventSink> _eventSink, const OutputOptions& _options);

  void run();

  /** @brief Number of "data" events emitted so far. */
  int64_t getEventsEmitted() const { return eventsEmitted; }

 protected:
  string sessionId;
  string eventName;
  unique_ptr<PtyReader> reader;
  shared_ptr<EventSink> eventSink;
  OutputOptions options;
  ChunkQueue queue;
  OutputBatcher batcher;
  std::atomic<int64_t> eventsEmitted;

  void readLoop();
  /** @brief Emits the pending text, if any. Returns false if emit failed. */
  bool flush();
};
}  // namespace ptymux

#endif  // __PTYMUX_OUTPUT_PUMP_HPP__
