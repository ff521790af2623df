#include "SessionRegistry.hpp"

#include "FakePtySystem.hpp"
#include "TestHeaders.hpp"

using namespace ptymux;

namespace {
shared_ptr<Session> makeSession() {
  shared_ptr<FakeTerminal> terminal(new FakeTerminal());
  return shared_ptr<Session>(new Session(
      unique_ptr<MasterPty>(new FakeMasterPty(terminal, false, false)),
      shared_ptr<SharedWriter>(new SharedWriter(
          unique_ptr<PtyWriter>(new FakePtyWriter(terminal)))),
      shared_ptr<PtyChild>(new FakePtyChild(terminal, 7))));
}
}  // namespace

TEST_CASE("SessionRegistry lookup and removal", "[SessionRegistry]") {
  SessionRegistry registry;
  auto first = makeSession();
  registry.insert("a", first);
  registry.insert("b", makeSession());

  REQUIRE(registry.size() == 2);
  REQUIRE(registry.contains("a"));
  REQUIRE(registry.get("a") == first);
  REQUIRE(registry.get("missing") == nullptr);

  auto ids = registry.ids();
  std::sort(ids.begin(), ids.end());
  REQUIRE(ids == vector<string>({"a", "b"}));

  REQUIRE(registry.remove("a") == first);
  REQUIRE(registry.remove("a") == nullptr);
  REQUIRE_FALSE(registry.contains("a"));
  REQUIRE(registry.size() == 1);
}

TEST_CASE("SessionRegistry removeAll empties the map", "[SessionRegistry]") {
  SessionRegistry registry;
  registry.insert("a", makeSession());
  registry.insert("b", makeSession());
  registry.insert("c", makeSession());

  auto removed = registry.removeAll();
  REQUIRE(removed.size() == 3);
  REQUIRE(registry.size() == 0);
  REQUIRE(registry.removeAll().empty());
}

TEST_CASE("SessionRegistry survives concurrent use", "[SessionRegistry]") {
  SessionRegistry registry;
  std::atomic<int> misses(0);
  vector<std::thread> threads;
  for (int t = 0; t < 8; t++) {
    threads.push_back(std::thread([&registry, &misses, t]() {
      for (int i = 0; i < 50; i++) {
        string id = to_string(t) + "-" + to_string(i);
        registry.insert(id, makeSession());
        if (registry.get(id) == nullptr) {
          misses++;
        }
        if (i % 2 == 0 && registry.remove(id) == nullptr) {
          misses++;
        }
      }
    }));
  }
  for (auto& it : threads) {
    it.join();
  }
  REQUIRE(misses.load() == 0);
  REQUIRE(registry.size() == 8 * 25);
}
