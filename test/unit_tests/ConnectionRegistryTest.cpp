#include "ConnectionRegistry.hpp"
#include "TestHeaders.hpp"

using namespace ng;
using Catch::Matchers::ContainsSubstring;

namespace {
Connection makeConnection(const string& id, const string& target) {
  return Connection{id, target, shared_ptr<EditorClient>(new EditorClient())};
}
}  // namespace

TEST_CASE("Ids are stable short hash prefixes", "[ConnectionRegistry]") {
  ConnectionRegistry registry;
  string id = registry.generateId("/tmp/nvim.sock");
  REQUIRE(id.size() == CONNECTION_ID_LENGTH);
  REQUIRE(id.find_first_not_of("0123456789abcdef") == string::npos);
  REQUIRE(id ==
          ConnectionRegistry::hashTarget("/tmp/nvim.sock").substr(0, 7));

  ConnectionRegistry other;
  REQUIRE(other.generateId("/tmp/nvim.sock") == id);
  REQUIRE(registry.generateId("127.0.0.1:6666") != id);
}

TEST_CASE("A live target keeps its id", "[ConnectionRegistry]") {
  ConnectionRegistry registry;
  string id = registry.generateId("/tmp/a.sock");
  REQUIRE(registry.insertIfAbsent(makeConnection(id, "/tmp/a.sock")));
  REQUIRE(registry.generateId("/tmp/a.sock") == id);
  REQUIRE_FALSE(registry.insertIfAbsent(makeConnection(id, "/tmp/a.sock")));
}

TEST_CASE("Colliding ids are extended", "[ConnectionRegistry]") {
  ConnectionRegistry registry;
  string digest = ConnectionRegistry::hashTarget("/tmp/b.sock");
  REQUIRE(registry.insertIfAbsent(
      makeConnection(digest.substr(0, 7), "/tmp/squatter.sock")));

  string id = registry.generateId("/tmp/b.sock");
  REQUIRE(id == digest.substr(0, 8));

  REQUIRE(registry.insertIfAbsent(
      makeConnection(digest.substr(0, 8), "/tmp/squatter2.sock")));
  REQUIRE(registry.generateId("/tmp/b.sock") == digest.substr(0, 9));
}

TEST_CASE("Unknown ids are reported by id", "[ConnectionRegistry]") {
  ConnectionRegistry registry;
  REQUIRE_THROWS_WITH(registry.get("deadbee"),
                      ContainsSubstring("No Neovim connection found for ID: "
                                        "deadbee"));
  REQUIRE(gatewayErrorKind([&] { registry.removeAndTake("deadbee"); }) ==
          ErrorKind::CONNECTION_NOT_FOUND);
  REQUIRE_FALSE(registry.contains("deadbee"));
  REQUIRE_FALSE(registry.findByTarget("/nowhere"));
}

TEST_CASE("Connections are listed by id and removed once",
          "[ConnectionRegistry]") {
  ConnectionRegistry registry;
  for (string target : {"/tmp/c.sock", "/tmp/d.sock", "127.0.0.1:1",
                        "127.0.0.1:2"}) {
    REQUIRE(registry.insertIfAbsent(
        makeConnection(registry.generateId(target), target)));
  }
  vector<Connection> connections = registry.list();
  REQUIRE(connections.size() == 4);
  for (size_t i = 1; i < connections.size(); i++) {
    REQUIRE(connections[i - 1].id < connections[i].id);
  }

  auto found = registry.findByTarget("/tmp/d.sock");
  REQUIRE(found);
  Connection taken = registry.removeAndTake(found->id);
  REQUIRE(taken.target == "/tmp/d.sock");
  REQUIRE(gatewayErrorKind([&] { registry.removeAndTake(found->id); }) ==
          ErrorKind::CONNECTION_NOT_FOUND);
  REQUIRE(registry.size() == 3);
}

TEST_CASE("Concurrent inserts and removals stay consistent",
          "[ConnectionRegistry]") {
  ConnectionRegistry registry;
  const int NUM_THREADS = 8;
  const int PER_THREAD = 50;
  vector<std::thread> threads;
  for (int t = 0; t < NUM_THREADS; t++) {
    threads.push_back(std::thread([&registry, t] {
      for (int i = 0; i < PER_THREAD; i++) {
        string target = "/tmp/" + to_string(t) + "_" + to_string(i) + ".sock";
        string id = registry.generateId(target);
        while (!registry.insertIfAbsent(Connection{id, target, nullptr})) {
          id = registry.generateId(target);
        }
        if (i % 2 == 1) {
          registry.removeAndTake(id);
        }
      }
    }));
  }
  for (auto& thread : threads) {
    thread.join();
  }
  REQUIRE(registry.size() == NUM_THREADS * PER_THREAD / 2);
  set<string> ids;
  for (const auto& connection : registry.list()) {
    ids.insert(connection.id);
  }
  REQUIRE(ids.size() == registry.size());
}
