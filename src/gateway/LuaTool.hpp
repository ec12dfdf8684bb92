#ifndef __NG_LUA_TOOL__
#define __NG_LUA_TOOL__

#include "Headers.hpp"
#include "Tool.hpp"

namespace ng {
/**
 * @brief A tool implemented by the nvim-mcp Lua plugin inside the editor.
 *
 * The plugin answers with an MCP-shaped table:
 * `{content = {{type, text}...}, isError, _meta = {error = {code, message}}}`.
 */
class LuaTool : public DynamicTool {
 public:
  LuaTool(const string& _name, const string& _description,
          const json& _inputSchema)
      : DynamicTool(_name, _description, _inputSchema) {}

  virtual json call(shared_ptr<EditorClient> client, const json& arguments);

  /**
   * @brief Asks the plugin for its registered tools.
   * @return Empty when the plugin has none.
   * @throws GatewayException API_ERROR when the plugin is missing or answers
   * with something that is not a tool table.
   */
  static vector<shared_ptr<LuaTool>> discover(shared_ptr<EditorClient> client);

  /** @brief Builds one tool from a discovery entry. */
  static shared_ptr<LuaTool> fromConfig(const string& key, const json& config);

  /**
   * @brief Turns the plugin's reply into a tool result.
   * @throws GatewayException API_ERROR when the reply flags an error or is
   * malformed.
   */
  static json convertResponse(const string& toolName, const json& response);
};
}  // namespace ng

#endif  // __NG_LUA_TOOL__
