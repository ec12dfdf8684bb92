#include "TestHeaders.hpp"
#include "ToolRouter.hpp"

using namespace ng;
using Catch::Matchers::ContainsSubstring;

namespace {
/** @brief Answers with its own tag so tests can see which instance ran. */
class TaggedTool : public DynamicTool {
 public:
  TaggedTool(const string& _name, const string& _tag)
      : DynamicTool(_name, "Tagged " + _tag, json{{"type", "object"}}),
        tag(_tag) {}

  virtual json call(shared_ptr<EditorClient>, const json& arguments) {
    return textToolResult(tag + ":" + arguments.value("input", string()));
  }

 protected:
  string tag;
};

shared_ptr<DynamicTool> tagged(const string& name, const string& tag) {
  return shared_ptr<DynamicTool>(new TaggedTool(name, tag));
}

string resultText(const json& result) {
  return result["content"][0]["text"].get<string>();
}

struct RouterFixture {
  shared_ptr<ConnectionRegistry> registry;
  shared_ptr<ToolRouter> router;

  RouterFixture()
      : registry(new ConnectionRegistry()), router(new ToolRouter(registry)) {
    router->addStaticTool(shared_ptr<StaticTool>(new StaticTool(
        "get_targets", "List sockets", json{{"type", "object"}},
        [](const json&) { return textToolResult(json::array()); })));
    router->addStaticTool(shared_ptr<StaticTool>(new StaticTool(
        "echo", "Echo arguments", json{{"type", "object"}},
        [](const json& arguments) { return textToolResult(arguments); })));
    for (string id : {"c1", "c2"}) {
      registry->insertIfAbsent(
          Connection{id, "/tmp/" + id, shared_ptr<EditorClient>()});
    }
  }
};
}  // namespace

TEST_CASE("Static names cannot be claimed by dynamic tools", "[ToolRouter]") {
  RouterFixture fixture;
  REQUIRE_THROWS_WITH(
      fixture.router->registerTool("c1", tagged("get_targets", "c1")),
      ContainsSubstring("conflicts with static tool"));
  REQUIRE(gatewayErrorKind([&] {
            fixture.router->registerTool("c1", tagged("echo", "c1"));
          }) == ErrorKind::NAME_CONFLICT);
  REQUIRE(fixture.router->getConnectionToolCount("c1") == 0);
  REQUIRE(fixture.router->list().size() == 2);
  REQUIRE(fixture.router->isStaticTool("echo"));
  REQUIRE_FALSE(fixture.router->hasTool("save_all"));
}

TEST_CASE("Each connection reaches only its own instance", "[ToolRouter]") {
  RouterFixture fixture;
  fixture.router->registerTool("c1", tagged("format", "c1"));
  fixture.router->registerTool("c2", tagged("format", "c2"));
  fixture.router->registerTool("c2", tagged("rename", "c2"));

  REQUIRE(resultText(fixture.router->dispatch(
              "format", json{{"connection_id", "c1"}, {"input", "x"}})) ==
          "c1:x");
  REQUIRE(resultText(fixture.router->dispatch(
              "format", json{{"connection_id", "c2"}})) == "c2:");
  REQUIRE(gatewayErrorKind([&] {
            fixture.router->dispatch("rename", json{{"connection_id", "c1"}});
          }) == ErrorKind::TOOL_NOT_FOUND);

  fixture.router->unregisterAll("c2");
  REQUIRE_FALSE(fixture.router->hasTool("rename"));
  REQUIRE(fixture.router->hasTool("format"));
  REQUIRE(resultText(fixture.router->dispatch(
              "format", json{{"connection_id", "c1"}})) == "c1:");
  REQUIRE(gatewayErrorKind([&] {
            fixture.router->dispatch("format", json{{"connection_id", "c2"}});
          }) == ErrorKind::TOOL_NOT_FOUND);
}

TEST_CASE("Re-registering replaces the connection's instance",
          "[ToolRouter]") {
  RouterFixture fixture;
  fixture.router->registerTool("c1", tagged("format", "old"));
  fixture.router->registerTool("c1", tagged("format", "new"));
  REQUIRE(fixture.router->getConnectionToolCount("c1") == 1);
  REQUIRE(resultText(fixture.router->dispatch(
              "format", json{{"connection_id", "c1"}})) == "new:");
}

TEST_CASE("Dispatch errors", "[ToolRouter]") {
  RouterFixture fixture;
  fixture.router->registerTool("c1", tagged("format", "c1"));

  SECTION("Missing connection id") {
    REQUIRE(gatewayErrorKind([&] {
              fixture.router->dispatch("format", json::object());
            }) == ErrorKind::INVALID_PARAMS);
    REQUIRE(gatewayErrorKind([&] {
              fixture.router->dispatch("format", json{{"connection_id", 5}});
            }) == ErrorKind::INVALID_PARAMS);
  }

  SECTION("Unknown connection") {
    REQUIRE(gatewayErrorKind([&] {
              fixture.router->dispatch("format",
                                       json{{"connection_id", "zzz"}});
            }) == ErrorKind::CONNECTION_NOT_FOUND);
  }

  SECTION("Unknown tool") {
    REQUIRE_THROWS_WITH(fixture.router->dispatch("nope", json::object()),
                        ContainsSubstring("Unknown tool: nope"));
  }

  SECTION("Static tools ignore connection ids") {
    json result = fixture.router->dispatch("echo", json{{"value", 1}});
    REQUIRE(json::parse(resultText(result)) == json{{"value", 1}});
    REQUIRE(resultText(fixture.router->dispatch("echo", json())) == "{}");
  }
}

TEST_CASE("Tool list is sorted and annotated", "[ToolRouter]") {
  RouterFixture fixture;
  fixture.router->registerTool("c2", tagged("zap", "c2"));
  fixture.router->registerTool("c1", tagged("format", "c1"));
  fixture.router->registerTool("c2", tagged("format", "c2"));

  json tools = fixture.router->list();
  vector<string> names;
  for (const auto& tool : tools) {
    names.push_back(tool["name"].get<string>());
  }
  REQUIRE(names == vector<string>({"echo", "format", "get_targets", "zap"}));

  REQUIRE_FALSE(tools[0].count("annotations"));
  REQUIRE(tools[1]["annotations"]["title"] == "Dynamic: format");
  REQUIRE(tools[1]["annotations"]["connectionCount"] == 2);
  REQUIRE(tools[1]["description"] == "Tagged c1");
  REQUIRE(tools[3]["annotations"]["connectionCount"] == 1);

  auto connectionTools = fixture.router->listConnectionTools("c2");
  REQUIRE(connectionTools.size() == 2);
  REQUIRE(connectionTools[0]->getName() == "format");
  REQUIRE(connectionTools[1]->getName() == "zap");
  REQUIRE(fixture.router->listConnectionTools("c3").empty());
}

TEST_CASE("Concurrent registration and teardown", "[ToolRouter]") {
  RouterFixture fixture;
  const int NUM_CONNECTIONS = 8;
  for (int c = 0; c < NUM_CONNECTIONS; c++) {
    string id = "conn" + to_string(c);
    fixture.registry->insertIfAbsent(
        Connection{id, "/tmp/" + id, shared_ptr<EditorClient>()});
  }
  atomic<int> misrouted(0);
  vector<std::thread> threads;
  for (int c = 0; c < NUM_CONNECTIONS; c++) {
    threads.push_back(std::thread([&fixture, &misrouted, c] {
      string id = "conn" + to_string(c);
      for (int round = 0; round < 20; round++) {
        for (int t = 0; t < 5; t++) {
          fixture.router->registerTool(id, tagged("tool" + to_string(t), id));
        }
        json result = fixture.router->dispatch(
            "tool" + to_string(round % 5), json{{"connection_id", id}});
        if (resultText(result) != id + ":") {
          misrouted++;
        }
        if (round < 19) {
          fixture.router->unregisterAll(id);
        }
      }
    }));
  }
  for (auto& thread : threads) {
    thread.join();
  }
  REQUIRE(misrouted == 0);
  json tools = fixture.router->list();
  REQUIRE(tools.size() == 7);
  for (const auto& tool : tools) {
    if (tool.count("annotations")) {
      REQUIRE(tool["annotations"]["connectionCount"] == NUM_CONNECTIONS);
    }
  }
}
