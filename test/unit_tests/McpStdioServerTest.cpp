#include "McpStdioServer.hpp"
#include "TestHeaders.hpp"

using namespace ng;

namespace {
json request(int id, const string& method, const json& params = json::object()) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method},
              {"params", params}};
}

vector<json> readLines(const string& output) {
  vector<json> messages;
  istringstream iss(output);
  string line;
  while (getline(iss, line)) {
    messages.push_back(json::parse(line));
  }
  return messages;
}

struct ServerFixture {
  shared_ptr<Gateway> gateway;
  istringstream in;
  ostringstream out;
  shared_ptr<McpStdioServer> server;

  ServerFixture() : gateway(new Gateway()) {
    server.reset(new McpStdioServer(gateway, 2, in, out));
  }
};
}  // namespace

TEST_CASE("Initialize advertises tools and resources", "[McpStdioServer]") {
  ServerFixture fixture;
  json response = fixture.server->handleMessage(
      request(1, "initialize", {{"protocolVersion", "2025-03-26"}}));
  REQUIRE(response["id"] == 1);
  REQUIRE(response["result"]["protocolVersion"] == "2025-03-26");
  REQUIRE(response["result"]["serverInfo"]["name"] == "neogate");
  REQUIRE(response["result"]["capabilities"]["tools"]["listChanged"] == true);
  REQUIRE(response["result"]["capabilities"].count("resources"));

  REQUIRE(fixture.server->handleMessage(request(2, "ping"))["result"] ==
          json::object());
}

TEST_CASE("Tools and resources are listed", "[McpStdioServer]") {
  ServerFixture fixture;
  json tools = fixture.server->handleMessage(request(1, "tools/list"))
                   ["result"]["tools"];
  REQUIRE(tools.size() == 13);
  set<string> names;
  for (const auto& tool : tools) {
    names.insert(tool["name"].get<string>());
    REQUIRE(tool["inputSchema"]["type"] == "object");
  }
  for (string name : {"get_targets", "connect", "connect_tcp", "disconnect",
                      "list_buffers", "exec_lua", "buffer_diagnostics",
                      "workspace_diagnostics", "cursor_position", "lsp_clients",
                      "buffer_code_actions", "lsp_resolve_code_action",
                      "lsp_apply_edit"}) {
    INFO(name);
    REQUIRE(names.count(name));
  }

  json resources = fixture.server->handleMessage(request(2, "resources/list"))
                       ["result"]["resources"];
  REQUIRE(resources.size() == 2);
  REQUIRE(resources[0]["uri"] == "conn-list://");
  REQUIRE(resources[1]["uri"] == "tool-overview://");

  json read = fixture.server->handleMessage(
      request(3, "resources/read", {{"uri", "conn-list://"}}));
  REQUIRE(json::parse(read["result"]["contents"][0]["text"].get<string>()) ==
          json::array());
}

TEST_CASE("Failures map to JSON-RPC error codes", "[McpStdioServer]") {
  ServerFixture fixture;

  json unknownMethod = fixture.server->handleMessage(request(1, "bogus"));
  REQUIRE(unknownMethod["error"]["code"] == -32601);

  json missingName =
      fixture.server->handleMessage(request(2, "tools/call", json::object()));
  REQUIRE(missingName["error"]["code"] == -32602);
  REQUIRE(missingName["error"]["data"]["kind"] == "InvalidParams");

  json unknownTool = fixture.server->handleMessage(
      request(3, "tools/call", {{"name", "nope"}, {"arguments", {}}}));
  REQUIRE(unknownTool["error"]["code"] == -32603);
  REQUIRE(unknownTool["error"]["data"]["kind"] == "ToolNotFound");

  json noConnection = fixture.server->handleMessage(request(
      4, "tools/call",
      {{"name", "list_buffers"}, {"arguments", {{"connection_id", "abc"}}}}));
  REQUIRE(noConnection["error"]["data"]["kind"] == "ConnectionNotFound");
  REQUIRE(noConnection["error"]["message"] ==
          "No Neovim connection found for ID: abc");

  json badResource = fixture.server->handleMessage(
      request(5, "resources/read", {{"uri", "nothing://"}}));
  REQUIRE(badResource["error"]["code"] == -32002);

  json invalid = fixture.server->handleMessage(
      json{{"jsonrpc", "2.0"}, {"id", 6}, {"method", 5}});
  REQUIRE(invalid["error"]["code"] == -32600);
  REQUIRE(invalid["id"] == 6);
  json notAnObject = fixture.server->handleMessage(json::array({1, 2}));
  REQUIRE(notAnObject["error"]["code"] == -32600);
  REQUIRE(notAnObject["id"].is_null());
}

TEST_CASE("Notifications and client responses get no reply",
          "[McpStdioServer]") {
  ServerFixture fixture;
  REQUIRE(fixture.server
              ->handleMessage(json{{"jsonrpc", "2.0"},
                                   {"method", "notifications/initialized"}})
              .is_null());
  REQUIRE(fixture.server
              ->handleMessage(json{{"jsonrpc", "2.0"}, {"id", 9},
                                   {"result", json::object()}})
              .is_null());
}

TEST_CASE("The stdio loop answers every request", "[McpStdioServer]") {
  shared_ptr<Gateway> gateway(new Gateway());
  istringstream in(request(1, "initialize").dump() + "\n" +
                   "{not json\n" + "\n" +
                   json{{"jsonrpc", "2.0"},
                        {"method", "notifications/initialized"}}
                       .dump() +
                   "\r\n" + request(2, "ping").dump() + "\n" +
                   request(3, "tools/list").dump() + "\n");
  ostringstream out;
  {
    McpStdioServer server(gateway, 4, in, out);
    server.run();
  }

  vector<json> messages = readLines(out.str());
  REQUIRE(messages.size() == 4);
  map<int, json> byId;
  bool sawParseError = false;
  for (const auto& message : messages) {
    REQUIRE(message["jsonrpc"] == "2.0");
    if (message["id"].is_null()) {
      REQUIRE(message["error"]["code"] == -32700);
      sawParseError = true;
    } else {
      byId[message["id"].get<int>()] = message;
    }
  }
  REQUIRE(sawParseError);
  REQUIRE(byId.size() == 3);
  REQUIRE(byId[2]["result"] == json::object());
  REQUIRE(byId[3]["result"]["tools"].size() == 13);
}

TEST_CASE("Error codes by kind", "[McpStdioServer]") {
  REQUIRE(McpStdioServer::errorCodeFor(ErrorKind::INVALID_PARAMS) == -32602);
  REQUIRE(McpStdioServer::errorCodeFor(ErrorKind::RESOURCE_NOT_FOUND) ==
          -32002);
  REQUIRE(McpStdioServer::errorCodeFor(ErrorKind::API_ERROR) == -32603);
  REQUIRE(McpStdioServer::errorCodeFor(ErrorKind::TRANSPORT_ERROR) == -32603);
}

namespace {
class ExposedServer : public McpStdioServer {
 public:
  using McpStdioServer::McpStdioServer;
  using McpStdioServer::writeMessage;
};
}  // namespace

TEST_CASE("An unserializable response still answers its id",
          "[McpStdioServer]") {
  shared_ptr<Gateway> gateway(new Gateway());
  istringstream in;
  ostringstream out;
  ExposedServer server(gateway, 1, in, out);

  json garbled = {{"type", "text"}, {"text", string("bad\xff name")}};
  server.writeMessage(json{{"jsonrpc", "2.0"},
                           {"id", 7},
                           {"result", {{"content", json::array({garbled})}}}});
  // Notifications that cannot be written are dropped
  server.writeMessage(json{{"jsonrpc", "2.0"},
                           {"method", "notifications/message"},
                           {"params", garbled}});

  vector<json> messages = readLines(out.str());
  REQUIRE(messages.size() == 1);
  REQUIRE(messages[0]["id"] == 7);
  REQUIRE(messages[0]["error"]["code"] == -32603);
  REQUIRE(messages[0]["error"]["data"]["kind"] == "InternalError");
}
