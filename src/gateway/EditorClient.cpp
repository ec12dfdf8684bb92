#include "EditorClient.hpp"

#include "LuaScripts.hpp"

namespace ng {
namespace {
// Lua hands back an empty table as an empty map or nil, never as [].
json asList(const json& value, const string& what) {
  if (value.is_null() || (value.is_object() && value.empty())) {
    return json::array();
  }
  if (!value.is_array()) {
    throw GatewayException(ErrorKind::API_ERROR,
                           "Expected a list of " + what + ", got " +
                               value.dump());
  }
  return value;
}

template <typename T>
vector<T> parseList(const json& value, const string& what) {
  try {
    return asList(value, what).get<vector<T>>();
  } catch (const json::exception& je) {
    throw GatewayException(ErrorKind::API_ERROR,
                           "Malformed " + what + ": " + je.what());
  }
}
}  // namespace

void to_json(json& j, const BufferInfo& b) {
  j = json{{"id", b.id}, {"name", b.name}, {"line_count", b.lineCount}};
}

void from_json(const json& j, BufferInfo& b) {
  j.at("id").get_to(b.id);
  j.at("name").get_to(b.name);
  j.at("line_count").get_to(b.lineCount);
}

void to_json(json& j, const Diagnostic& d) {
  j = json{{"buffer_id", d.bufferId}, {"lnum", d.lnum},
           {"col", d.col},            {"end_lnum", d.endLnum},
           {"end_col", d.endCol},     {"severity", d.severity},
           {"message", d.message},    {"source", d.source}};
}

void from_json(const json& j, Diagnostic& d) {
  // The editor names the buffer "bufnr", cached copies use "buffer_id".
  if (j.count("buffer_id")) {
    j.at("buffer_id").get_to(d.bufferId);
  } else {
    d.bufferId = j.value("bufnr", int64_t(0));
  }
  j.at("lnum").get_to(d.lnum);
  j.at("col").get_to(d.col);
  d.endLnum = j.value("end_lnum", d.lnum);
  d.endCol = j.value("end_col", d.col);
  d.severity = j.value("severity", int64_t(0));
  j.at("message").get_to(d.message);
  d.source = j.value("source", string());
}

void to_json(json& j, const Position& p) {
  j = json{{"line", p.line}, {"character", p.character}};
}

void from_json(const json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

void to_json(json& j, const Range& r) {
  j = json{{"start", r.start}, {"end", r.end}};
}

void from_json(const json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

void to_json(json& j, const LspClientInfo& c) {
  j = json{{"id", c.id}, {"name", c.name}};
}

void from_json(const json& j, LspClientInfo& c) {
  j.at("id").get_to(c.id);
  j.at("name").get_to(c.name);
}

void to_json(json& j, const CursorPosition& c) {
  j = json{{"bufname", c.bufname}, {"row", c.row}, {"col", c.col}};
}

void from_json(const json& j, CursorPosition& c) {
  j.at("bufname").get_to(c.bufname);
  j.at("row").get_to(c.row);
  j.at("col").get_to(c.col);
}

EditorClient::EditorClient() : callTimeoutMs(0), lspTimeoutMs(3000) {}

EditorClient::~EditorClient() {
  shared_ptr<RpcClient> client;
  {
    lock_guard<mutex> guard(stateMutex);
    client = rpcClient;
    rpcClient.reset();
  }
  if (client) {
    client->shutdown();
  }
}

void EditorClient::connectPath(const string& path) {
  connectStream(path, SocketEndpoint::parsePath(path));
}

void EditorClient::connectTcp(const string& address) {
  connectStream(address, SocketEndpoint::parseTcpAddress(address));
}

void EditorClient::connect(const SocketEndpoint& endpoint) {
  ostringstream oss;
  oss << endpoint;
  connectStream(endpoint.getKind() == EndpointKind::TCP ? oss.str()
                                                        : endpoint.getName(),
                endpoint);
}

void EditorClient::connectStream(const string& _target,
                                 const SocketEndpoint& endpoint) {
  lock_guard<mutex> guard(stateMutex);
  if (rpcClient) {
    throw GatewayException(ErrorKind::ALREADY_CONNECTED,
                           "Already connected to " + target);
  }
  Stream stream = Transport::connect(endpoint);
  rpcClient.reset(new RpcClient(stream));
  target = _target;
  LOG(INFO) << "Connected to editor at " << target;
}

void EditorClient::disconnect() {
  shared_ptr<RpcClient> client;
  string oldTarget;
  {
    lock_guard<mutex> guard(stateMutex);
    if (!rpcClient) {
      throw GatewayException(ErrorKind::NOT_CONNECTED,
                             "Not connected to an editor");
    }
    client = rpcClient;
    oldTarget = target;
    rpcClient.reset();
  }
  client->shutdown();
  {
    lock_guard<mutex> guard(diagnosticsMutex);
    diagnosticsCache.clear();
  }
  LOG(INFO) << "Disconnected from editor at " << oldTarget;
}

bool EditorClient::isConnected() {
  lock_guard<mutex> guard(stateMutex);
  return rpcClient.get() != NULL;
}

string EditorClient::getTarget() {
  lock_guard<mutex> guard(stateMutex);
  return target;
}

shared_ptr<RpcClient> EditorClient::requireClient() {
  lock_guard<mutex> guard(stateMutex);
  if (!rpcClient) {
    throw GatewayException(ErrorKind::NOT_CONNECTED,
                           "Not connected to an editor");
  }
  return rpcClient;
}

json EditorClient::callEditor(const string& method, const json& params) {
  auto client = requireClient();
  return client->call(method, params, callTimeoutMs);
}

vector<BufferInfo> EditorClient::getBuffers() {
  return parseList<BufferInfo>(executeLua(lua::LIST_BUFFERS), "buffers");
}

json EditorClient::executeLua(const string& code, const json& args) {
  requireClient();
  if (code.empty()) {
    throw GatewayException(ErrorKind::API_ERROR, "Lua code is empty");
  }
  VLOG(1) << "Executing lua: " << code;
  return callEditor("nvim_exec_lua", json::array({code, args}));
}

void EditorClient::setupDiagnosticsAutocmd() {
  auto client = requireClient();
  client->subscribe(DIAGNOSTICS_CHANGED_NOTIFICATION,
                    [this](const json& params) { onDiagnosticsChanged(params); });
  executeLua(lua::SETUP_DIAGNOSTICS_AUTOCMD);
  LOG(INFO) << "Diagnostics autocmd armed on " << getTarget();
}

void EditorClient::onDiagnosticsChanged(const json& params) {
  if (!params.is_array() || params.empty() || !params[0].is_object()) {
    LOG(WARNING) << "Ignoring malformed diagnostics notification: "
                 << params.dump();
    return;
  }
  const json& payload = params[0];
  if (!payload.count("buf") || !payload["buf"].is_number_integer()) {
    LOG(WARNING) << "Diagnostics notification without a buffer: "
                 << payload.dump();
    return;
  }
  int64_t bufferId = payload["buf"].get<int64_t>();
  vector<Diagnostic> diagnostics;
  try {
    diagnostics = parseList<Diagnostic>(
        payload.count("diagnostics") ? payload["diagnostics"] : json(),
        "diagnostics");
  } catch (const GatewayException& ge) {
    LOG(WARNING) << "Dropping diagnostics for buffer " << bufferId << ": "
                 << ge.what();
    return;
  }
  for (auto& diagnostic : diagnostics) {
    diagnostic.bufferId = bufferId;
  }
  VLOG(1) << "Buffer " << bufferId << " now has " << diagnostics.size()
          << " diagnostics";
  lock_guard<mutex> guard(diagnosticsMutex);
  diagnosticsCache[bufferId] = diagnostics;
}

vector<Diagnostic> EditorClient::getBufferDiagnostics(int64_t bufferId) {
  requireClient();
  lock_guard<mutex> guard(diagnosticsMutex);
  auto it = diagnosticsCache.find(bufferId);
  if (it == diagnosticsCache.end()) {
    return vector<Diagnostic>();
  }
  return it->second;
}

map<int64_t, vector<Diagnostic>> EditorClient::getWorkspaceDiagnostics() {
  requireClient();
  lock_guard<mutex> guard(diagnosticsMutex);
  return diagnosticsCache;
}

vector<Diagnostic> EditorClient::flattenDiagnostics(
    const map<int64_t, vector<Diagnostic>>& byBuffer) {
  vector<Diagnostic> diagnostics;
  for (const auto& it : byBuffer) {
    diagnostics.insert(diagnostics.end(), it.second.begin(), it.second.end());
  }
  return diagnostics;
}

CursorPosition EditorClient::getCursorPosition() {
  json reply = executeLua(lua::CURSOR_POSITION);
  try {
    return reply.get<CursorPosition>();
  } catch (const json::exception& je) {
    throw GatewayException(ErrorKind::API_ERROR,
                           string("Malformed cursor position: ") + je.what());
  }
}

json EditorClient::callLspScript(const string& script, const json& args) {
  json reply = executeLua(script, args);
  if (!reply.is_string()) {
    throw GatewayException(ErrorKind::API_ERROR,
                           "LSP script returned a non-string reply: " +
                               reply.dump());
  }
  json decoded;
  try {
    decoded = json::parse(reply.get<string>());
  } catch (const json::parse_error& pe) {
    throw GatewayException(ErrorKind::API_ERROR,
                           string("LSP script returned invalid JSON: ") +
                               pe.what());
  }
  if (decoded.is_object() && decoded.count("err_msg")) {
    const json& errMsg = decoded["err_msg"];
    throw GatewayException(
        ErrorKind::API_ERROR,
        errMsg.is_string() ? errMsg.get<string>() : errMsg.dump());
  }
  return decoded;
}

vector<LspClientInfo> EditorClient::lspGetClients() {
  return parseList<LspClientInfo>(
      callLspScript(lua::LSP_GET_CLIENTS, json::array()), "LSP clients");
}

json EditorClient::lspGetCodeActions(const string& clientName,
                                     int64_t bufferId, const Range& range) {
  json args = json::array(
      {clientName, json(range).dump(), int64_t(lspTimeoutMs), bufferId});
  return asList(callLspScript(lua::LSP_CODE_ACTIONS, args), "code actions");
}

json EditorClient::lspResolveCodeAction(const string& clientName,
                                        const json& codeAction) {
  json args = json::array(
      {clientName, codeAction.dump(), int64_t(lspTimeoutMs), int64_t(0)});
  return callLspScript(lua::LSP_RESOLVE_CODE_ACTION, args);
}

json EditorClient::lspApplyWorkspaceEdit(const string& clientName,
                                         const json& workspaceEdit) {
  json args = json::array({clientName, workspaceEdit.dump()});
  return callLspScript(lua::LSP_APPLY_WORKSPACE_EDIT, args);
}
}  // namespace ng
