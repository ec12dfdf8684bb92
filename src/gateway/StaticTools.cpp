#include "Gateway.hpp"

namespace ng {
namespace {
json stringProperty(const string& description) {
  return json{{"type", "string"}, {"description", description}};
}

json unsignedProperty(const string& description) {
  return json{{"type", "integer"}, {"minimum", 0}, {"description", description}};
}

json objectProperty(const string& description) {
  return json{{"type", "object"}, {"description", description}};
}

json objectSchema(const json& properties, const vector<string>& required) {
  return json{{"type", "object"},
              {"properties", properties},
              {"required", required}};
}

const char* CONNECTION_ID_DESCRIPTION =
    "Unique identifier for the target Neovim instance";
const char* BUFFER_ID_DESCRIPTION = "Neovim Buffer ID";
const char* LSP_CLIENT_DESCRIPTION = "Lsp client name";
}  // namespace

void Gateway::addTool(const string& name, const string& description,
                      const json& inputSchema, StaticTool::Handler handler) {
  router->addStaticTool(
      make_shared<StaticTool>(name, description, inputSchema, handler));
}

void Gateway::registerStaticTools() {
  json connectionSchema = objectSchema(
      {{"connection_id", stringProperty(CONNECTION_ID_DESCRIPTION)}},
      {"connection_id"});
  json bufferSchema = objectSchema(
      {{"connection_id", stringProperty(CONNECTION_ID_DESCRIPTION)},
       {"id", unsignedProperty(BUFFER_ID_DESCRIPTION)}},
      {"connection_id", "id"});
  json targetSchema = objectSchema(
      {{"target",
        stringProperty("target can be a unix socket path or a TCP address")}},
      {"target"});

  addTool("get_targets", "Get available Neovim targets",
          objectSchema(json::object(), {}), [this](const json&) {
            auto targets = findTargets(options.socketDirectory);
            if (targets.empty()) {
              throw GatewayException(ErrorKind::INVALID_PARAMS,
                                     "No Neovim targets found");
            }
            return textToolResult(json(targets));
          });

  addTool("connect", "Connect to Neovim instance via unix socket(pipe)",
          targetSchema, [this](const json& arguments) {
            string target = requireStringArgument(arguments, "target");
#ifdef WIN32
            EndpointKind kind = EndpointKind::NAMED_PIPE;
#else
            EndpointKind kind = EndpointKind::UNIX;
#endif
            return textToolResult(connect(target, kind));
          });

  addTool("connect_tcp", "Connect to Neovim instance via TCP", targetSchema,
          [this](const json& arguments) {
            string target = requireStringArgument(arguments, "target");
            return textToolResult(connect(target, EndpointKind::TCP));
          });

  addTool("disconnect", "Disconnect from Neovim instance", connectionSchema,
          [this](const json& arguments) {
            return textToolResult(
                disconnect(requireStringArgument(arguments, "connection_id")));
          });

  addTool("list_buffers", "List all open buffers in Neovim", connectionSchema,
          [this](const json& arguments) {
            return textToolResult(json(requireClient(arguments)->getBuffers()));
          });

  addTool("exec_lua", "Execute Lua code in Neovim",
          objectSchema(
              {{"connection_id", stringProperty(CONNECTION_ID_DESCRIPTION)},
               {"code", stringProperty("Lua code to execute in Neovim")}},
              {"connection_id", "code"}),
          [this](const json& arguments) {
            auto client = requireClient(arguments);
            string code = requireStringArgument(arguments, "code");
            return textToolResult(json{{"result", client->executeLua(code)}});
          });

  addTool("buffer_diagnostics", "Get buffer's diagnostics", bufferSchema,
          [this](const json& arguments) {
            auto client = requireClient(arguments);
            int64_t bufferId = requireUnsignedArgument(arguments, "id");
            return textToolResult(json(client->getBufferDiagnostics(bufferId)));
          });

  addTool("workspace_diagnostics", "Get all diagnostics in the workspace",
          connectionSchema, [this](const json& arguments) {
            auto client = requireClient(arguments);
            return textToolResult(json(EditorClient::flattenDiagnostics(
                client->getWorkspaceDiagnostics())));
          });

  addTool("cursor_position",
          "Get the cursor position: buffer name, zero based row and col",
          connectionSchema, [this](const json& arguments) {
            return textToolResult(
                json(requireClient(arguments)->getCursorPosition()));
          });

  addTool("lsp_clients", "Get workspace's lsp clients", connectionSchema,
          [this](const json& arguments) {
            return textToolResult(
                json(requireClient(arguments)->lspGetClients()));
          });

  addTool(
      "buffer_code_actions", "Get buffer's code actions",
      objectSchema(
          {{"connection_id", stringProperty(CONNECTION_ID_DESCRIPTION)},
           {"id", unsignedProperty(BUFFER_ID_DESCRIPTION)},
           {"lsp_client_name", stringProperty(LSP_CLIENT_DESCRIPTION)},
           {"line", unsignedProperty("Cursor start position in the buffer, "
                                     "line number starts from 0")},
           {"character", unsignedProperty("Cursor start position in the "
                                          "buffer, character number starts "
                                          "from 0")},
           {"end_line", unsignedProperty("Cursor end position in the buffer, "
                                         "line number starts from 0")},
           {"end_character", unsignedProperty("Cursor end position in the "
                                              "buffer, character number "
                                              "starts from 0")}},
          {"connection_id", "id", "lsp_client_name", "line", "character",
           "end_line", "end_character"}),
      [this](const json& arguments) {
        auto client = requireClient(arguments);
        string clientName = requireStringArgument(arguments, "lsp_client_name");
        int64_t bufferId = requireUnsignedArgument(arguments, "id");
        Range range;
        range.start.line = requireUnsignedArgument(arguments, "line");
        range.start.character = requireUnsignedArgument(arguments, "character");
        range.end.line = requireUnsignedArgument(arguments, "end_line");
        range.end.character =
            requireUnsignedArgument(arguments, "end_character");
        return textToolResult(
            client->lspGetCodeActions(clientName, bufferId, range));
      });

  addTool("lsp_resolve_code_action",
          "Resolve a code action that has no edit or command yet",
          objectSchema(
              {{"connection_id", stringProperty(CONNECTION_ID_DESCRIPTION)},
               {"lsp_client_name", stringProperty(LSP_CLIENT_DESCRIPTION)},
               {"code_action", objectProperty("Code action to resolve")}},
              {"connection_id", "lsp_client_name", "code_action"}),
          [this](const json& arguments) {
            auto client = requireClient(arguments);
            string clientName =
                requireStringArgument(arguments, "lsp_client_name");
            return textToolResult(client->lspResolveCodeAction(
                clientName, requireObjectArgument(arguments, "code_action")));
          });

  addTool("lsp_apply_edit", "Apply a workspace edit through an LSP client",
          objectSchema(
              {{"connection_id", stringProperty(CONNECTION_ID_DESCRIPTION)},
               {"lsp_client_name", stringProperty(LSP_CLIENT_DESCRIPTION)},
               {"workspace_edit", objectProperty("LSP WorkspaceEdit")}},
              {"connection_id", "lsp_client_name", "workspace_edit"}),
          [this](const json& arguments) {
            auto client = requireClient(arguments);
            string clientName =
                requireStringArgument(arguments, "lsp_client_name");
            return textToolResult(client->lspApplyWorkspaceEdit(
                clientName, requireObjectArgument(arguments, "workspace_edit")));
          });
}
}  // namespace ng
