#include "OutputPump.hpp"

#include "FakePtySystem.hpp"
#include "TestHeaders.hpp"

using namespace ptymux;

namespace {
/** Returns canned chunks, then either ends the stream or fails. */
class ScriptedReader : public PtyReader {
 public:
  ScriptedReader(const vector<string>& _chunks, bool _failAtEnd)
      : chunks(_chunks.begin(), _chunks.end()), failAtEnd(_failAtEnd) {}

  virtual size_t read(char* buf, size_t count) {
    if (chunks.empty()) {
      if (failAtEnd) {
        throw std::runtime_error("Input/output error");
      }
      return 0;
    }
    string chunk = chunks.front();
    chunks.pop_front();
    if (chunk.size() > count) {
      throw std::runtime_error("chunk larger than read buffer");
    }
    memcpy(buf, chunk.data(), chunk.size());
    return chunk.size();
  }

 protected:
  deque<string> chunks;
  bool failAtEnd;
};

const string EVENT_NAME = "terminal://pump-session";

OutputOptions slowFlushOptions() {
  OutputOptions options;
  options.flushInterval = std::chrono::seconds(10);
  return options;
}
}  // namespace

TEST_CASE("Output is flushed when the stream ends", "[OutputPump]") {
  shared_ptr<RecordingEventSink> sink(new RecordingEventSink());
  OutputPump pump("pump-session",
                  unique_ptr<PtyReader>(new ScriptedReader(
                      {"hello ", "world\r\n", "caf\xC3"}, false)),
                  sink, slowFlushOptions());
  pump.run();

  auto events = sink->getEvents();
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].first == EVENT_NAME);
  REQUIRE(events[0].second["type"] == "data");
  REQUIRE(events[0].second["data"] ==
          "hello world\r\ncaf" + UTF8_REPLACEMENT_CHARACTER);
  REQUIRE(pump.getEventsEmitted() == 1);
}

TEST_CASE("A read error ends the stream like EOF", "[OutputPump]") {
  shared_ptr<RecordingEventSink> sink(new RecordingEventSink());
  OutputPump pump(
      "pump-session",
      unique_ptr<PtyReader>(new ScriptedReader({"before error"}, true)), sink,
      slowFlushOptions());
  pump.run();
  REQUIRE(sink->dataFor(EVENT_NAME) == "before error");
}

TEST_CASE("No event is sent for a silent stream", "[OutputPump]") {
  shared_ptr<RecordingEventSink> sink(new RecordingEventSink());
  OutputPump pump("pump-session",
                  unique_ptr<PtyReader>(new ScriptedReader({}, false)), sink,
                  slowFlushOptions());
  pump.run();
  REQUIRE(sink->getEvents().empty());
}

TEST_CASE("Batches are flushed once they reach the size limit",
          "[OutputPump]") {
  shared_ptr<RecordingEventSink> sink(new RecordingEventSink());
  shared_ptr<FakeTerminal> terminal(new FakeTerminal());
  OutputOptions options = slowFlushOptions();
  options.maxBatchBytes = 8;
  shared_ptr<OutputPump> pump(new OutputPump(
      "pump-session", unique_ptr<PtyReader>(new FakePtyReader(terminal)), sink,
      options));
  std::thread pumpThread([pump]() { pump->run(); });

  terminal->emitOutput("0123456789");
  REQUIRE(sink->waitForEvent(EVENT_NAME, "data", std::chrono::seconds(5)));
  REQUIRE(sink->dataFor(EVENT_NAME) == "0123456789");

  terminal->closeOutput();
  pumpThread.join();
  REQUIRE(sink->getEvents().size() == 1);
}

TEST_CASE("Pending text is flushed after the interval", "[OutputPump]") {
  shared_ptr<RecordingEventSink> sink(new RecordingEventSink());
  shared_ptr<FakeTerminal> terminal(new FakeTerminal());
  OutputOptions options;
  options.flushInterval = std::chrono::milliseconds(10);
  shared_ptr<OutputPump> pump(new OutputPump(
      "pump-session", unique_ptr<PtyReader>(new FakePtyReader(terminal)), sink,
      options));
  std::thread pumpThread([pump]() { pump->run(); });

  SECTION("Small writes are delivered without waiting for EOF") {
    terminal->emitOutput("$ ");
    REQUIRE(sink->waitForEvent(EVENT_NAME, "data", std::chrono::seconds(5)));
    REQUIRE(sink->dataFor(EVENT_NAME) == "$ ");
  }

  SECTION("A partial character waits for its remaining bytes") {
    terminal->emitOutput("x\xE2\x82");
    REQUIRE(sink->waitForEvent(EVENT_NAME, "data", std::chrono::seconds(5)));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(sink->dataFor(EVENT_NAME) == "x");

    terminal->emitOutput("\xAC");
    REQUIRE(waitUntil(
        [&]() { return sink->dataFor(EVENT_NAME) == "x\xE2\x82\xAC"; },
        std::chrono::seconds(5)));
  }

  terminal->closeOutput();
  pumpThread.join();
  for (const auto& it : sink->getEvents()) {
    REQUIRE_FALSE(it.second["data"].get<string>().empty());
  }
}

TEST_CASE("The pump stops when the host rejects events", "[OutputPump]") {
  shared_ptr<RecordingEventSink> sink(new RecordingEventSink());
  sink->setFailing(true);
  shared_ptr<FakeTerminal> terminal(new FakeTerminal());
  OutputOptions options;
  options.flushInterval = std::chrono::milliseconds(5);
  shared_ptr<OutputPump> pump(new OutputPump(
      "pump-session", unique_ptr<PtyReader>(new FakePtyReader(terminal)), sink,
      options));
  std::thread pumpThread([pump]() { pump->run(); });

  terminal->emitOutput("nobody hears this");
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  sink->setFailing(false);
  terminal->emitOutput("or this");
  terminal->closeOutput();
  pumpThread.join();

  REQUIRE(pump->getEventsEmitted() == 0);
  REQUIRE(sink->getEvents().empty());
}
