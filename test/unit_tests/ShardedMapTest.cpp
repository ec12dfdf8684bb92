#include "ShardedMap.hpp"
#include "TestHeaders.hpp"

using namespace ng;

TEST_CASE("Basic map operations", "[ShardedMap]") {
  ShardedMap<string, int> map;
  REQUIRE(map.insertIfAbsent("a", 1));
  REQUIRE_FALSE(map.insertIfAbsent("a", 2));
  REQUIRE(*map.get("a") == 1);
  map.put("a", 3);
  REQUIRE(*map.get("a") == 3);
  REQUIRE_FALSE(map.get("b"));

  REQUIRE(*map.take("a") == 3);
  REQUIRE_FALSE(map.take("a"));
  REQUIRE_FALSE(map.erase("a"));
  REQUIRE(map.size() == 0);
}

TEST_CASE("Compute decides the fate of the slot", "[ShardedMap]") {
  typedef ShardedMap<string, vector<int>> ListMap;
  ListMap map;

  map.compute("k", [](vector<int>& values, bool present) {
    REQUIRE_FALSE(present);
    values.push_back(1);
    return ListMap::STORE;
  });
  map.compute("k", [](vector<int>& values, bool present) {
    REQUIRE(present);
    values.push_back(2);
    return ListMap::KEEP;
  });
  REQUIRE(*map.get("k") == vector<int>({1, 2}));

  map.compute("missing", [](vector<int>&, bool) { return ListMap::KEEP; });
  REQUIRE_FALSE(map.contains("missing"));

  map.compute("k", [](vector<int>&, bool) { return ListMap::ERASE; });
  REQUIRE_FALSE(map.contains("k"));
}

TEST_CASE("Concurrent compute never loses updates", "[ShardedMap]") {
  ShardedMap<int, int> map;
  vector<std::thread> threads;
  for (int t = 0; t < 8; t++) {
    threads.push_back(std::thread([&map] {
      for (int i = 0; i < 1000; i++) {
        map.compute(i % 37, [](int& value, bool) {
          value++;
          return ShardedMap<int, int>::STORE;
        });
      }
    }));
  }
  for (auto& thread : threads) {
    thread.join();
  }
  int total = 0;
  for (const auto& it : map.snapshot()) {
    total += it.second;
  }
  REQUIRE(total == 8000);
  REQUIRE(map.size() == 37);
  map.clear();
  REQUIRE(map.size() == 0);
}
