#ifndef __PTYMUX_CHUNK_QUEUE__
#define __PTYMUX_CHUNK_QUEUE__

#include "Headers.hpp"

namespace ptymux {
/**
 * @brief Closeable FIFO of byte chunks handed from a reader thread to a
 * consumer thread.
 *
 * Either side may close the queue. A closed queue rejects pushes; the
 * consumer still drains chunks that were queued before the close.
 */
class ChunkQueue {
 public:
  enum class PopResult { CHUNK, TIMEOUT, CLOSED };

  ChunkQueue() : closed(false), bytesQueued(0) {}

  /** @brief Queues a chunk. Returns false if the queue has been closed. */
  bool push(string chunk) {
    {
      lock_guard<std::mutex> guard(queueMutex);
      if (closed) {
        return false;
      }
      bytesQueued += chunk.size();
      chunks.push_back(std::move(chunk));
    }
    queueCondition.notify_one();
    return true;
  }

  /**
   * @brief Waits up to `timeout` for the next chunk.
   * @return CHUNK with `*chunk` filled, TIMEOUT if nothing arrived, or CLOSED
   * once the queue is closed and empty.
   */
  template <class Rep, class Period>
  PopResult popFor(string* chunk,
                   const std::chrono::duration<Rep, Period>& timeout) {
    unique_lock<std::mutex> lock(queueMutex);
    if (!queueCondition.wait_for(
            lock, timeout, [this] { return closed || !chunks.empty(); })) {
      return PopResult::TIMEOUT;
    }
    if (chunks.empty()) {
      return PopResult::CLOSED;
    }
    *chunk = std::move(chunks.front());
    chunks.pop_front();
    bytesQueued -= chunk->size();
    return PopResult::CHUNK;
  }

  void close() {
    {
      lock_guard<std::mutex> guard(queueMutex);
      closed = true;
    }
    queueCondition.notify_all();
  }

  bool isClosed() {
    lock_guard<std::mutex> guard(queueMutex);
    return closed;
  }

  size_t size() {
    lock_guard<std::mutex> guard(queueMutex);
    return bytesQueued;
  }

 protected:
  std::mutex queueMutex;
  std::condition_variable queueCondition;
  std::deque<string> chunks;
  bool closed;
  size_t bytesQueued;
};
}  // namespace ptymux

#endif  // __PTYMUX_CHUNK_QUEUE__
