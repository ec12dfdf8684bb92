#ifndef __NG_TOOL_ROUTER__
#define __NG_TOOL_ROUTER__

#include "ConnectionRegistry.hpp"
#include "GatewayException.hpp"
#include "Headers.hpp"
#include "ShardedMap.hpp"
#include "Tool.hpp"

namespace ng {
/**
 * @brief Resolves a tool name to a static tool or to the dynamic tool
 * instance of one connection.
 *
 * Dynamic tools live in a nested map (tool name -> connection id -> tool)
 * with an inverse index (connection id -> tool names) used for teardown.
 * Static tools are fixed before the router is shared and never change.
 */
class ToolRouter {
 public:
  explicit ToolRouter(shared_ptr<ConnectionRegistry> _registry);

  /** @brief Adds a static tool. Not safe once dispatch has started. */
  void addStaticTool(shared_ptr<StaticTool> tool);

  /**
   * @brief Registers `tool` for `connectionId`, replacing an earlier instance
   * for the same pair.
   * @throws GatewayException NAME_CONFLICT if a static tool has this name.
   */
  void registerTool(const string& connectionId, shared_ptr<DynamicTool> tool);

  /** @brief Drops every dynamic tool the connection registered. */
  void unregisterAll(const string& connectionId);

  /**
   * @brief Calls a tool. Dynamic tools take the connection from
   * `arguments.connection_id`.
   */
  json dispatch(const string& toolName, const json& arguments);

  /**
   * @brief Every static tool plus one entry per dynamic name, annotated with
   * the number of connections exposing it. Sorted by name.
   */
  json list();

  /** @brief The dynamic tools one connection registered, sorted by name. */
  vector<shared_ptr<DynamicTool>> listConnectionTools(
      const string& connectionId);

  size_t getConnectionToolCount(const string& connectionId);

  bool hasTool(const string& toolName);

  bool isStaticTool(const string& toolName) const;

  vector<shared_ptr<StaticTool>> listStaticTools() const;

 protected:
  typedef unordered_map<string, shared_ptr<DynamicTool>> ToolInstances;

  shared_ptr<ConnectionRegistry> registry;
  map<string, shared_ptr<StaticTool>> staticTools;
  ShardedMap<string, ToolInstances> dynamicTools;
  ShardedMap<string, set<string>> connectionTools;
};
}  // namespace ng

#endif  // __NG_TOOL_ROUTER__
