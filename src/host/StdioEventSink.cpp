#include "StdioEventSink.hpp"

#include "RawFdUtils.hpp"

namespace ptymux {
void JsonLineWriter::writeLine(const json& document) {
  // Error texts may quote raw request bytes; never fail on invalid UTF-8.
  string line = document.dump(-1, ' ', false, json::error_handler_t::replace);
  line.push_back('\n');

  lock_guard<std::mutex> guard(writeMutex);
  if (broken) {
    throw std::runtime_error("output stream is closed");
  }
  try {
    RawFdUtils::writeAll(fd, line.data(), line.size());
  } catch (const std::runtime_error& re) {
    broken = true;
    throw;
  }
}

void StdioEventSink::emit(const string& eventName, const json& payload) {
  json event;
  event["event"] = eventName;
  event["payload"] = payload;
  writer->writeLine(event);
}
}  // namespace ptymux
