#include "LuaTool.hpp"

#include "LuaScripts.hpp"

namespace ng {
json LuaTool::call(shared_ptr<EditorClient> client, const json& arguments) {
  json reply;
  try {
    reply = client->executeLua(lua::EXECUTE_TOOL,
                               json::array({name, arguments.dump()}));
  } catch (const GatewayException& ge) {
    throw GatewayException(ge.getKind(), "Failed to execute Lua tool '" +
                                             name + "': " + ge.what());
  }
  return convertResponse(name, reply);
}

vector<shared_ptr<LuaTool>> LuaTool::discover(
    shared_ptr<EditorClient> client) {
  json reply = client->executeLua(lua::DISCOVER_TOOLS);
  vector<shared_ptr<LuaTool>> tools;
  if (reply.is_null() || reply.empty()) {
    return tools;
  }
  if (!reply.is_object()) {
    throw GatewayException(ErrorKind::API_ERROR,
                           "Failed to parse tool configs: expected a map, got " +
                               reply.dump());
  }
  for (auto it = reply.begin(); it != reply.end(); ++it) {
    tools.push_back(fromConfig(it.key(), it.value()));
  }
  return tools;
}

shared_ptr<LuaTool> LuaTool::fromConfig(const string& key, const json& config) {
  if (!config.is_object() || !config.count("name") ||
      !config["name"].is_string()) {
    throw GatewayException(ErrorKind::API_ERROR,
                           "Failed to parse tool config '" + key + "'");
  }
  string description;
  if (config.count("description") && config["description"].is_string()) {
    description = config["description"].get<string>();
  }
  json inputSchema = json{{"type", "object"}};
  if (config.count("input_schema") && config["input_schema"].is_object()) {
    inputSchema = config["input_schema"];
  }
  return shared_ptr<LuaTool>(
      new LuaTool(config["name"].get<string>(), description, inputSchema));
}

json LuaTool::convertResponse(const string& toolName, const json& response) {
  if (!response.is_object() || !response.count("isError") ||
      !response["isError"].is_boolean()) {
    throw GatewayException(ErrorKind::API_ERROR,
                           "Failed to parse Lua response from '" + toolName +
                               "': " + response.dump());
  }
  if (response["isError"].get<bool>()) {
    string message = "Lua tool execution failed";
    auto meta = response.find("_meta");
    if (meta != response.end() && meta->is_object() && meta->count("error")) {
      const json& error = (*meta)["error"];
      if (error.is_object() && error.count("message") &&
          error["message"].is_string()) {
        message = error["message"].get<string>();
      }
    }
    throw GatewayException(ErrorKind::API_ERROR, message);
  }

  json content = json::array();
  auto items = response.find("content");
  if (items != response.end() && items->is_array()) {
    for (const auto& item : *items) {
      if (!item.is_object() || !item.count("text") ||
          !item["text"].is_string()) {
        throw GatewayException(ErrorKind::API_ERROR,
                               "Malformed content in Lua response from '" +
                                   toolName + "'");
      }
      content.push_back(json{{"type", "text"}, {"text", item["text"]}});
    }
  }
  return json{{"content", content}, {"isError", false}};
}
}  // namespace ng
