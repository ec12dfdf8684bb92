#ifndef __NG_LUA_SCRIPTS__
#define __NG_LUA_SCRIPTS__

#include "Headers.hpp"

// Lua run inside the editor through nvim_exec_lua. Scripts that take
// arguments read them from `...` in the order documented above each one.
// Everything returned is either a plain table (no editor handles, which
// would arrive as msgpack extension values) or a JSON string.
namespace ng {
namespace lua {
const string LIST_BUFFERS = R"lua(
local buffers = {}
for _, buf in ipairs(vim.api.nvim_list_bufs()) do
  table.insert(buffers, {
    id = buf,
    name = vim.api.nvim_buf_get_name(buf),
    line_count = vim.api.nvim_buf_line_count(buf),
  })
end
return buffers
)lua";

// Arms a DiagnosticChanged autocmd that pushes the buffer's full diagnostic
// list to every attached rpc channel. Re-running it replaces the autocmd.
const string SETUP_DIAGNOSTICS_AUTOCMD = R"lua(
local group = vim.api.nvim_create_augroup('NeoGateDiagnostics', { clear = true })
vim.api.nvim_create_autocmd('DiagnosticChanged', {
  group = group,
  callback = function(args)
    vim.rpcnotify(0, 'NVIM_MCP_DiagnosticsChanged', {
      buf = args.buf,
      diagnostics = args.data.diagnostics,
    })
  end,
})
return true
)lua";

const string CURSOR_POSITION = R"lua(
local bufname = vim.api.nvim_buf_get_name(0)
local row, col = unpack(vim.api.nvim_win_get_cursor(0))
-- row is one-indexed, col is zero-indexed
return { bufname = bufname, row = row - 1, col = col }
)lua";

const string LSP_GET_CLIENTS = R"lua(
local clients = {}
for _, client in ipairs(vim.lsp.get_clients()) do
  table.insert(clients, { id = client.id, name = client.name })
end
return vim.json.encode(clients)
)lua";

// Shared prologue: resolves `client_name` to a live LSP client or returns
// an err_msg reply.
const string LSP_FIND_CLIENT = R"lua(
local client
for _, v in ipairs(vim.lsp.get_clients()) do
  if v.name == client_name then
    client = v
  end
end
if client == nil then
  return vim.json.encode({
    err_msg = string.format('LSP client %s not found', vim.json.encode(client_name)),
  })
end
)lua";

// Shared epilogue: sends `method` with `params` and encodes the reply.
const string LSP_REQUEST_SYNC = R"lua(
local response, err = client:request_sync(method, params, timeout_ms, bufnr)
if err then
  return vim.json.encode({
    err_msg = string.format('LSP client %s request_sync error: %s',
      vim.json.encode(client_name), vim.json.encode(err)),
  })
end
if response == nil then
  return vim.json.encode({
    err_msg = string.format('LSP client %s timed out', vim.json.encode(client_name)),
  })
end
if response.err then
  return vim.json.encode({
    err_msg = string.format('LSP client %s returned error: %s',
      vim.json.encode(client_name), vim.json.encode(response.err)),
  })
end
if response.result == nil then
  return 'null'
end
return vim.json.encode(response.result)
)lua";

// Arguments: client_name, range_json, timeout_ms, bufnr
const string LSP_CODE_ACTIONS = R"lua(
local client_name, range_raw, timeout_ms, bufnr = ...
)lua" + LSP_FIND_CLIENT + R"lua(
local method = 'textDocument/codeAction'
local params = {
  textDocument = { uri = vim.uri_from_bufnr(bufnr) },
  range = vim.json.decode(range_raw),
  context = { diagnostics = {} },
}
)lua" + LSP_REQUEST_SYNC;

// Arguments: client_name, code_action_json, timeout_ms, bufnr
const string LSP_RESOLVE_CODE_ACTION = R"lua(
local client_name, action_raw, timeout_ms, bufnr = ...
)lua" + LSP_FIND_CLIENT + R"lua(
local method = 'codeAction/resolve'
local params = vim.json.decode(action_raw)
)lua" + LSP_REQUEST_SYNC;

// Arguments: client_name, workspace_edit_json
const string LSP_APPLY_WORKSPACE_EDIT = R"lua(
local client_name, edit_raw = ...
)lua" + LSP_FIND_CLIENT + R"lua(
local workspace_edit = vim.json.decode(edit_raw)
local ok, err = pcall(vim.lsp.util.apply_workspace_edit, workspace_edit,
  client.offset_encoding or 'utf-16')
if not ok then
  return vim.json.encode({
    err_msg = string.format('Failed to apply workspace edit: %s', tostring(err)),
  })
end
return vim.json.encode({ applied = true })
)lua";

const string DISCOVER_TOOLS = R"lua(
return require('nvim-mcp').get_registered_tools()
)lua";

// Arguments: tool_name, arguments_json
const string EXECUTE_TOOL = R"lua(
local name, args_raw = ...
return require('nvim-mcp').execute_tool(name, vim.json.decode(args_raw))
)lua";
}  // namespace lua
}  // namespace ng

#endif  // __NG_LUA_SCRIPTS__
