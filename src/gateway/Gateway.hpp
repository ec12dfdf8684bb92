#ifndef __NG_GATEWAY__
#define __NG_GATEWAY__

#include "ConnectionRegistry.hpp"
#include "GatewayException.hpp"
#include "Headers.hpp"
#include "LuaTool.hpp"
#include "ToolRouter.hpp"

namespace ng {
struct GatewayOptions {
  /** Bound on every editor rpc wait, 0 waits forever. */
  int64_t callTimeoutMs = 0;
  /** Timeout handed to LSP requests made inside the editor. */
  int64_t lspTimeoutMs = 3000;
  /** Where get_targets looks for editor sockets. */
  string socketDirectory = GetTempDirectory();
};

/**
 * @brief Turns tool calls and resource reads into registry and editor
 * operations. Owns the connection registry and the tool router.
 */
class Gateway {
 public:
  explicit Gateway(const GatewayOptions& _options = GatewayOptions());
  virtual ~Gateway();

  /**
   * @brief Connects to an editor, arms diagnostics and registers the Lua
   * tools it exposes.
   * @return {connection_id, target, message}
   */
  json connect(const string& target, EndpointKind kind);

  /** @return {connection_id, target, message} */
  json disconnect(const string& connectionId);

  json listTools();

  json callTool(const string& name, const json& arguments);

  json listResources();

  /** @return {contents: [{uri, mimeType, text}]} */
  json readResource(const string& uri);

  /** @brief Disconnects every live connection. */
  void shutdown();

  /** @brief Called whenever the set of dynamic tools may have changed. */
  void setToolsChangedCallback(std::function<void()> callback) {
    toolsChangedCallback = callback;
  }

  shared_ptr<ConnectionRegistry> getRegistry() { return registry; }
  shared_ptr<ToolRouter> getRouter() { return router; }

  /** @brief Editor sockets named nvim-mcp.*.sock in `directory`, sorted. */
  static vector<string> findTargets(const string& directory);

 protected:
  GatewayOptions options;
  shared_ptr<ConnectionRegistry> registry;
  shared_ptr<ToolRouter> router;
  std::function<void()> toolsChangedCallback;

  void registerStaticTools();
  void addTool(const string& name, const string& description,
               const json& inputSchema, StaticTool::Handler handler);
  void discoverLuaTools(const Connection& connection);
  /**
   * @brief Registers discovered tools under the connection. When the
   * connection was disconnected meanwhile, the tools are dropped again.
   */
  virtual void registerLuaTools(const Connection& connection,
                                const vector<shared_ptr<LuaTool>>& tools);
  bool isLive(const Connection& connection);
  shared_ptr<EditorClient> requireClient(const json& arguments);
  void notifyToolsChanged();

  json readToolsResource(const string& connectionId);
  json readDiagnosticsResource(const string& uri, const string& path);
};

/** @brief Reads a required string argument or fails INVALID_PARAMS. */
string requireStringArgument(const json& arguments, const string& key);
/** @brief Reads a required non-negative integer argument. */
uint64_t requireUnsignedArgument(const json& arguments, const string& key);
/** @brief Reads a required object argument. */
json requireObjectArgument(const json& arguments, const string& key);
}  // namespace ng

#endif  // __NG_GATEWAY__
