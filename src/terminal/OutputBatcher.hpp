#ifndef __PTYMUX_OUTPUT_BATCHER_HPP__
#define __PTYMUX_OUTPUT_BATCHER_HPP__

#include "Headers.hpp"
#include "Utf8Decoder.hpp"

namespace ptymux {
/**
 * @brief Pending output of one session: raw bytes that do not form a whole
 * character yet, and decoded text that has not been flushed.
 */
class OutputBatcher {
 public:
  explicit OutputBatcher(size_t _maxBatchBytes)
      : maxBatchBytes(_maxBatchBytes) {}

  /** @brief Decodes a chunk read from the pty into the pending text. */
  void addChunk(const string& bytes) { decoder.feed(bytes, &pending); }

  /**
   * @brief Decodes whatever bytes are still held back, replacing an
   * unfinished trailing sequence. Called once the stream has ended.
   */
  void finish() { decoder.finish(&pending); }

  /** @brief True once the pending text reached the batch size limit. */
  bool isFull() const { return pending.size() >= maxBatchBytes; }

  bool hasPending() const { return !pending.empty(); }

  /** @brief Hands out the pending text and clears it. */
  string takePending() {
    string text;
    text.swap(pending);
    return text;
  }

 protected:
  size_t maxBatchBytes;
  Utf8Decoder decoder;
  string pending;
};
}  // namespace ptymux

#endif  // __PTYMUX_OUTPUT_BATCHER_HPP__
