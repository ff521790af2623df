#include "OutputPump.hpp"

namespace ptymux {
OutputPump::OutputPump(const string& _sessionId, unique_ptr<PtyReader> _reader,
                       shared_ptr<EventSink> _eventSink,
                       const OutputOptions& _options)
    : sessionId(_sessionId),
      eventName(eventNameForSession(_sessionId)),
      reader(std::move(_reader)),
      eventSink(_eventSink),
      options(_options),
      batcher(_options.maxBatchBytes),
      eventsEmitted(0) {}

void OutputPump::run() {
  std::thread readerThread(&OutputPump::readLoop, this);

  auto deadline = std::chrono::steady_clock::now() + options.flushInterval;
  string chunk;
  while (true) {
    auto timeout = options.flushInterval;
    if (batcher.hasPending()) {
      // Text already waiting only gets what is left of its interval.
      timeout = std::max(
          std::chrono::milliseconds(0),
          std::chrono::duration_cast<std::chrono::milliseconds>(
              deadline - std::chrono::steady_clock::now()));
    }

    auto result = queue.popFor(&chunk, timeout);
    if (result == ChunkQueue::PopResult::CLOSED) {
      batcher.finish();
      flush();
      break;
    }

    if (result == ChunkQueue::PopResult::CHUNK) {
      bool hadPending = batcher.hasPending();
      batcher.addChunk(chunk);
      auto now = std::chrono::steady_clock::now();
      if (!hadPending) {
        deadline = now + options.flushInterval;
      }
      if (!batcher.isFull() && now < deadline) {
        continue;
      }
    }

    if (!flush()) {
      // Nobody is listening anymore; make the reader's next push fail.
      queue.close();
      break;
    }
  }

  readerThread.join();
  VLOG(1) << "Output pump for " << sessionId << " finished after "
          << eventsEmitted.load() << " events";
}

void OutputPump::readLoop() {
  vector<char> buffer(options.readChunkBytes);
  while (true) {
    size_t bytesRead;
    try {
      bytesRead = reader->read(&buffer[0], buffer.size());
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Terminal read for " << sessionId << " ended: " << re.what();
      break;
    }
    if (bytesRead == 0) {
      VLOG(1) << "Terminal output for " << sessionId << " reached EOF";
      break;
    }
    VLOG(4) << "Read " << bytesRead << " bytes from " << sessionId;
    if (!queue.push(string(&buffer[0], bytesRead))) {
      break;
    }
  }
  queue.close();
}

bool OutputPump::flush() {
  if (!batcher.hasPending()) {
    return true;
  }
  json payload;
  payload["type"] = "data";
  payload["data"] = batcher.takePending();
  try {
    eventSink->emit(eventName, payload);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to emit terminal data: " << ex.what();
    return false;
  }
  eventsEmitted++;
  return true;
}
}  // namespace ptymux
