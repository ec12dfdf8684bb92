#include "ToolRouter.hpp"

namespace ng {
ToolRouter::ToolRouter(shared_ptr<ConnectionRegistry> _registry)
    : registry(_registry) {}

void ToolRouter::addStaticTool(shared_ptr<StaticTool> tool) {
  if (!staticTools.insert(make_pair(tool->getName(), tool)).second) {
    STFATAL << "Static tool registered twice: " << tool->getName();
  }
}

void ToolRouter::registerTool(const string& connectionId,
                              shared_ptr<DynamicTool> tool) {
  const string& toolName = tool->getName();
  if (isStaticTool(toolName)) {
    throw GatewayException(ErrorKind::NAME_CONFLICT,
                           "Tool name '" + toolName +
                               "' conflicts with static tool");
  }
  dynamicTools.compute(toolName, [&](ToolInstances& instances, bool) {
    instances[connectionId] = tool;
    return ShardedMap<string, ToolInstances>::STORE;
  });
  connectionTools.compute(connectionId, [&](set<string>& names, bool) {
    names.insert(toolName);
    return ShardedMap<string, set<string>>::STORE;
  });
  VLOG(1) << "Registered tool '" << toolName << "' for connection "
          << connectionId;
}

void ToolRouter::unregisterAll(const string& connectionId) {
  auto names = connectionTools.take(connectionId);
  if (!names) {
    return;
  }
  for (const string& toolName : *names) {
    dynamicTools.compute(toolName, [&](ToolInstances& instances,
                                       bool present) {
      if (!present) {
        return ShardedMap<string, ToolInstances>::KEEP;
      }
      instances.erase(connectionId);
      return instances.empty() ? ShardedMap<string, ToolInstances>::ERASE
                               : ShardedMap<string, ToolInstances>::KEEP;
    });
  }
  LOG(INFO) << "Unregistered " << names->size() << " tools for connection "
            << connectionId;
}

json ToolRouter::dispatch(const string& toolName, const json& arguments) {
  auto instances = dynamicTools.get(toolName);
  if (instances) {
    if (!arguments.is_object() || !arguments.count("connection_id") ||
        !arguments["connection_id"].is_string()) {
      throw GatewayException(ErrorKind::INVALID_PARAMS,
                             "Tool '" + toolName +
                                 "' requires a string connection_id");
    }
    string connectionId = arguments["connection_id"].get<string>();
    Connection connection = registry->get(connectionId);
    auto it = instances->find(connectionId);
    if (it == instances->end()) {
      throw GatewayException(ErrorKind::TOOL_NOT_FOUND,
                             "Tool '" + toolName +
                                 "' is not available on connection " +
                                 connectionId);
    }
    VLOG(1) << "Dispatching dynamic tool " << toolName << " on "
            << connectionId;
    return it->second->call(connection.client, arguments);
  }

  auto staticIt = staticTools.find(toolName);
  if (staticIt != staticTools.end()) {
    VLOG(1) << "Dispatching static tool " << toolName;
    return staticIt->second->call(arguments.is_null() ? json::object()
                                                      : arguments);
  }
  throw GatewayException(ErrorKind::TOOL_NOT_FOUND,
                         "Unknown tool: " + toolName);
}

json ToolRouter::list() {
  map<string, json> entries;
  for (const auto& it : staticTools) {
    entries[it.first] = it.second->describe();
  }
  for (const auto& it : dynamicTools.snapshot()) {
    if (it.second.empty() || entries.count(it.first)) {
      continue;
    }
    // Instances of one name may differ per connection; any one represents it
    const auto& representative = *min_element(
        it.second.begin(), it.second.end(),
        [](const ToolInstances::value_type& a,
           const ToolInstances::value_type& b) { return a.first < b.first; });
    json entry = representative.second->describe();
    entry["annotations"] = json{
        {"title", "Dynamic: " + it.first},
        {"connectionCount", it.second.size()},
    };
    entries[it.first] = entry;
  }
  json tools = json::array();
  for (auto& it : entries) {
    tools.push_back(it.second);
  }
  return tools;
}

vector<shared_ptr<DynamicTool>> ToolRouter::listConnectionTools(
    const string& connectionId) {
  vector<shared_ptr<DynamicTool>> tools;
  auto names = connectionTools.get(connectionId);
  if (!names) {
    return tools;
  }
  for (const string& toolName : *names) {
    auto instances = dynamicTools.get(toolName);
    if (!instances) {
      continue;
    }
    auto it = instances->find(connectionId);
    if (it != instances->end()) {
      tools.push_back(it->second);
    }
  }
  return tools;
}

size_t ToolRouter::getConnectionToolCount(const string& connectionId) {
  auto names = connectionTools.get(connectionId);
  return names ? names->size() : 0;
}

bool ToolRouter::hasTool(const string& toolName) {
  return isStaticTool(toolName) || dynamicTools.contains(toolName);
}

bool ToolRouter::isStaticTool(const string& toolName) const {
  return staticTools.find(toolName) != staticTools.end();
}

vector<shared_ptr<StaticTool>> ToolRouter::listStaticTools() const {
  vector<shared_ptr<StaticTool>> tools;
  for (const auto& it : staticTools) {
    tools.push_back(it.second);
  }
  return tools;
}
}  // namespace ng
