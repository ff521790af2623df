#include "ChunkQueue.hpp"

#include "TestHeaders.hpp"

using namespace ptymux;

TEST_CASE("ChunkQueue hands chunks over in order", "[ChunkQueue]") {
  ChunkQueue queue;
  string chunk;

  REQUIRE(queue.popFor(&chunk, std::chrono::milliseconds(1)) ==
          ChunkQueue::PopResult::TIMEOUT);

  REQUIRE(queue.push("one"));
  REQUIRE(queue.push("two"));
  REQUIRE(queue.size() == 6);

  REQUIRE(queue.popFor(&chunk, std::chrono::milliseconds(0)) ==
          ChunkQueue::PopResult::CHUNK);
  REQUIRE(chunk == "one");
  REQUIRE(queue.popFor(&chunk, std::chrono::milliseconds(0)) ==
          ChunkQueue::PopResult::CHUNK);
  REQUIRE(chunk == "two");
  REQUIRE(queue.size() == 0);
}

TEST_CASE("ChunkQueue drains before reporting close", "[ChunkQueue]") {
  ChunkQueue queue;
  string chunk;

  REQUIRE(queue.push("last words"));
  queue.close();
  REQUIRE(queue.isClosed());
  REQUIRE_FALSE(queue.push("too late"));

  REQUIRE(queue.popFor(&chunk, std::chrono::milliseconds(0)) ==
          ChunkQueue::PopResult::CHUNK);
  REQUIRE(chunk == "last words");
  REQUIRE(queue.popFor(&chunk, std::chrono::milliseconds(0)) ==
          ChunkQueue::PopResult::CLOSED);
}

TEST_CASE("ChunkQueue wakes a waiting consumer", "[ChunkQueue]") {
  ChunkQueue queue;
  std::thread producer([&queue]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push("wake");
    queue.close();
  });

  string chunk;
  REQUIRE(queue.popFor(&chunk, std::chrono::seconds(5)) ==
          ChunkQueue::PopResult::CHUNK);
  REQUIRE(chunk == "wake");
  REQUIRE(queue.popFor(&chunk, std::chrono::seconds(5)) ==
          ChunkQueue::PopResult::CLOSED);
  producer.join();
}
