#include "Gateway.hpp"

namespace ng {
namespace {
const string CONN_LIST_URI = "conn-list://";
const string TOOL_OVERVIEW_URI = "tool-overview://";
const string TOOLS_URI_PREFIX = "tools://";
const string DIAGNOSTICS_URI_PREFIX = "diagnostics://";

json textResource(const string& uri, const json& value) {
  return json{{"contents", json::array({json{{"uri", uri},
                                             {"mimeType", "application/json"},
                                             {"text", value.dump(2)}}})}};
}

json resourceEntry(const string& uri, const string& name,
                   const string& description) {
  return json{{"uri", uri},
              {"name", name},
              {"description", description},
              {"mimeType", "application/json"}};
}
}  // namespace

Gateway::Gateway(const GatewayOptions& _options)
    : options(_options),
      registry(new ConnectionRegistry()),
      router(new ToolRouter(registry)) {
  registerStaticTools();
}

Gateway::~Gateway() {
  toolsChangedCallback = nullptr;
  shutdown();
}

json Gateway::connect(const string& target, EndpointKind kind) {
  auto existing = registry->findByTarget(target);
  if (existing) {
    throw GatewayException(ErrorKind::ALREADY_CONNECTED,
                           "Already connected to " + target + " as " +
                               existing->id);
  }

  auto client = make_shared<EditorClient>();
  client->setCallTimeoutMs(options.callTimeoutMs);
  client->setLspTimeoutMs(options.lspTimeoutMs);
  switch (kind) {
    case EndpointKind::TCP:
      client->connectTcp(target);
      break;
    case EndpointKind::UNIX:
      client->connectPath(target);
      break;
    case EndpointKind::NAMED_PIPE:
      client->connect(SocketEndpoint(EndpointKind::NAMED_PIPE, target));
      break;
  }

  try {
    client->setupDiagnosticsAutocmd();
  } catch (const GatewayException& ge) {
    LOG(ERROR) << "Could not arm diagnostics on " << target << ": " << ge;
    client->disconnect();
    throw;
  }

  Connection connection;
  connection.target = target;
  connection.client = client;
  while (true) {
    connection.id = registry->generateId(target);
    if (registry->insertIfAbsent(connection)) {
      break;
    }
    auto holder = registry->findByTarget(target);
    if (holder) {
      // Lost a race with a concurrent connect to the same target
      client->disconnect();
      throw GatewayException(ErrorKind::ALREADY_CONNECTED,
                             "Already connected to " + target + " as " +
                                 holder->id);
    }
  }
  LOG(INFO) << "Connection " << connection.id << " -> " << target;

  discoverLuaTools(connection);
  notifyToolsChanged();

  return json{{"connection_id", connection.id},
              {"target", target},
              {"message", "Connected to Neovim at " + target}};
}

void Gateway::discoverLuaTools(const Connection& connection) {
  vector<shared_ptr<LuaTool>> tools;
  try {
    tools = LuaTool::discover(connection.client);
  } catch (const GatewayException& ge) {
    LOG(WARNING) << "Lua tool discovery failed on " << connection.id << ": "
                 << ge;
    return;
  }
  registerLuaTools(connection, tools);
}

void Gateway::registerLuaTools(const Connection& connection,
                               const vector<shared_ptr<LuaTool>>& tools) {
  for (auto& tool : tools) {
    try {
      router->registerTool(connection.id, tool);
    } catch (const GatewayException& ge) {
      LOG(WARNING) << "Skipping Lua tool from " << connection.id << ": " << ge;
    }
  }
  // disconnect() removes the connection before its tools. If it ran while
  // the tools above were being added it missed them.
  if (!isLive(connection)) {
    LOG(INFO) << "Connection " << connection.id
              << " went away during tool discovery";
    router->unregisterAll(connection.id);
    return;
  }
  LOG(INFO) << "Registered " << router->getConnectionToolCount(connection.id)
            << " Lua tools for " << connection.id;
}

bool Gateway::isLive(const Connection& connection) {
  try {
    return registry->get(connection.id).client == connection.client;
  } catch (const GatewayException& ge) {
    if (ge.getKind() != ErrorKind::CONNECTION_NOT_FOUND) {
      throw;
    }
    return false;
  }
}

json Gateway::disconnect(const string& connectionId) {
  Connection connection = registry->removeAndTake(connectionId);
  router->unregisterAll(connectionId);
  try {
    connection.client->disconnect();
  } catch (const GatewayException& ge) {
    throw GatewayException(ErrorKind::INTERNAL_ERROR,
                           string("Failed to disconnect: ") + ge.what());
  }
  notifyToolsChanged();
  return json{{"connection_id", connectionId},
              {"target", connection.target},
              {"message", "Disconnected from Neovim at " + connection.target}};
}

json Gateway::listTools() { return router->list(); }

json Gateway::callTool(const string& name, const json& arguments) {
  return router->dispatch(name, arguments);
}

json Gateway::listResources() {
  json resources = json::array();
  resources.push_back(resourceEntry(CONN_LIST_URI, "Active Neovim Connections",
                                    "List of active Neovim connections"));
  resources.push_back(
      resourceEntry(TOOL_OVERVIEW_URI, "Tool Registration Overview",
                    "Overview of all tools and their connection mappings"));
  for (const auto& connection : registry->list()) {
    resources.push_back(resourceEntry(
        DIAGNOSTICS_URI_PREFIX + connection.id + "/workspace",
        "Workspace Diagnostics (" + connection.id + ")",
        "Diagnostic messages for connection " + connection.id));
    resources.push_back(
        resourceEntry(TOOLS_URI_PREFIX + connection.id,
                      "Tools for Connection (" + connection.id + ")",
                      "List of tools available for connection " +
                          connection.id));
  }
  return resources;
}

json Gateway::readResource(const string& uri) {
  VLOG(1) << "Reading resource " << uri;
  if (uri == CONN_LIST_URI) {
    json connections = json::array();
    for (const auto& connection : registry->list()) {
      connections.push_back(
          json{{"id", connection.id}, {"target", connection.target}});
    }
    return textResource(uri, connections);
  }

  if (uri == TOOL_OVERVIEW_URI) {
    json staticTools = json::array();
    for (const auto& tool : router->listStaticTools()) {
      staticTools.push_back(json{{"name", tool->getName()},
                                 {"description", tool->getDescription()},
                                 {"type", "static"},
                                 {"available_to", "all_connections"}});
    }
    json connectionTools = json::object();
    for (const auto& connection : registry->list()) {
      json tools = json::array();
      for (const auto& tool : router->listConnectionTools(connection.id)) {
        tools.push_back(json{{"name", tool->getName()},
                             {"description", tool->getDescription()},
                             {"type", "dynamic"}});
      }
      connectionTools[connection.id] = tools;
    }
    return textResource(uri, json{{"static_tools", staticTools},
                                  {"connection_specific_tools",
                                   connectionTools}});
  }

  if (startsWith(uri, TOOLS_URI_PREFIX)) {
    return textResource(uri,
                        readToolsResource(uri.substr(TOOLS_URI_PREFIX.size())));
  }

  if (startsWith(uri, DIAGNOSTICS_URI_PREFIX)) {
    return textResource(
        uri,
        readDiagnosticsResource(uri, uri.substr(DIAGNOSTICS_URI_PREFIX.size())));
  }

  throw GatewayException(ErrorKind::RESOURCE_NOT_FOUND,
                         "Resource not found: " + uri);
}

json Gateway::readToolsResource(const string& connectionId) {
  if (connectionId.empty()) {
    throw GatewayException(ErrorKind::INVALID_PARAMS,
                           "Missing connection ID in tools URI");
  }
  registry->get(connectionId);
  json tools = json::array();
  for (const auto& tool : router->listStaticTools()) {
    tools.push_back(json{{"name", tool->getName()},
                         {"description", tool->getDescription()},
                         {"type", "static"},
                         {"connection_id", connectionId}});
  }
  size_t dynamicCount = 0;
  for (const auto& tool : router->listConnectionTools(connectionId)) {
    tools.push_back(json{{"name", tool->getName()},
                         {"description", tool->getDescription()},
                         {"type", "dynamic"},
                         {"connection_id", connectionId}});
    dynamicCount++;
  }
  return json{{"connection_id", connectionId},
              {"tools", tools},
              {"total_count", tools.size()},
              {"dynamic_count", dynamicCount}};
}

json Gateway::readDiagnosticsResource(const string& uri, const string& path) {
  auto slash = path.find('/');
  if (slash == string::npos || slash == 0) {
    throw GatewayException(ErrorKind::RESOURCE_NOT_FOUND,
                           "Resource not found: " + uri);
  }
  string connectionId = path.substr(0, slash);
  string rest = path.substr(slash + 1);
  if (rest == "workspace") {
    auto client = registry->get(connectionId).client;
    return json(
        EditorClient::flattenDiagnostics(client->getWorkspaceDiagnostics()));
  }
  if (startsWith(rest, "buffer/")) {
    auto client = registry->get(connectionId).client;
    string bufferString = rest.substr(7);
    if (bufferString.empty() || bufferString.size() > 18 ||
        bufferString.find_first_not_of("0123456789") != string::npos) {
      throw GatewayException(ErrorKind::INVALID_PARAMS,
                             "Invalid buffer ID: " + bufferString);
    }
    return json(client->getBufferDiagnostics(stoll(bufferString)));
  }
  throw GatewayException(ErrorKind::RESOURCE_NOT_FOUND,
                         "Resource not found: " + uri);
}

void Gateway::shutdown() {
  for (const auto& connection : registry->list()) {
    try {
      disconnect(connection.id);
    } catch (const GatewayException& ge) {
      // Someone else disconnected it first
      LOG(INFO) << "Skipping " << connection.id << " during shutdown: " << ge;
    }
  }
}

vector<string> Gateway::findTargets(const string& directory) {
  vector<string> targets;
  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    string filename = it->path().filename().string();
    if (startsWith(filename, "nvim-mcp.") && filename.size() > 14 &&
        filename.compare(filename.size() - 5, 5, ".sock") == 0) {
      targets.push_back(it->path().string());
    }
  }
  if (ec) {
    LOG(WARNING) << "Could not scan " << directory << ": " << ec.message();
  }
  sort(targets.begin(), targets.end());
  return targets;
}

shared_ptr<EditorClient> Gateway::requireClient(const json& arguments) {
  return registry->get(requireStringArgument(arguments, "connection_id"))
      .client;
}

void Gateway::notifyToolsChanged() {
  if (toolsChangedCallback) {
    toolsChangedCallback();
  }
}

string requireStringArgument(const json& arguments, const string& key) {
  if (!arguments.is_object() || !arguments.count(key) ||
      !arguments[key].is_string()) {
    throw GatewayException(ErrorKind::INVALID_PARAMS,
                           "Missing '" + key + "' parameter");
  }
  return arguments[key].get<string>();
}

uint64_t requireUnsignedArgument(const json& arguments, const string& key) {
  if (!arguments.is_object() || !arguments.count(key) ||
      !arguments[key].is_number_integer() ||
      (!arguments[key].is_number_unsigned() &&
       arguments[key].get<int64_t>() < 0)) {
    throw GatewayException(ErrorKind::INVALID_PARAMS,
                           "Missing or negative '" + key + "' parameter");
  }
  return arguments[key].get<uint64_t>();
}

json requireObjectArgument(const json& arguments, const string& key) {
  if (!arguments.is_object() || !arguments.count(key) ||
      !arguments[key].is_object()) {
    throw GatewayException(ErrorKind::INVALID_PARAMS,
                           "Missing '" + key + "' parameter");
  }
  return arguments[key];
}
}  // namespace ng
