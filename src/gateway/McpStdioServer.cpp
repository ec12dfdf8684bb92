#include "McpStdioServer.hpp"

namespace ng {
namespace {
const int PARSE_ERROR = -32700;
const int INVALID_REQUEST = -32600;
const int METHOD_NOT_FOUND = -32601;
const int INVALID_PARAMS = -32602;
const int INTERNAL_ERROR = -32603;
const int RESOURCE_NOT_FOUND = -32002;
const string DEFAULT_PROTOCOL_VERSION = "2024-11-05";
}  // namespace

McpStdioServer::McpStdioServer(shared_ptr<Gateway> _gateway, int _threads,
                               istream& _in, ostream& _out)
    : gateway(_gateway), in(_in), out(_out), threads(_threads) {
  gateway->setToolsChangedCallback([this]() {
    sendNotification("notifications/tools/list_changed", json::object());
  });
}

McpStdioServer::~McpStdioServer() {
  pool.reset();
  gateway->setToolsChangedCallback(nullptr);
}

int McpStdioServer::errorCodeFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_PARAMS:
      return INVALID_PARAMS;
    case ErrorKind::RESOURCE_NOT_FOUND:
      return RESOURCE_NOT_FOUND;
    default:
      return INTERNAL_ERROR;
  }
}

void McpStdioServer::run() {
  el::Helpers::setThreadName("mcp-stdin");
  pool.reset(new ThreadPool(threads));
  string line;
  while (getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    handleLine(line);
  }
  LOG(INFO) << "Input closed, draining requests";
  // Joins the workers once every queued request has finished.
  pool.reset();
}

void McpStdioServer::handleLine(const string& line) {
  json message;
  try {
    message = json::parse(line);
  } catch (const json::parse_error& pe) {
    LOG(WARNING) << "Unparseable message: " << pe.what();
    writeMessage(errorResponse(json(nullptr), PARSE_ERROR,
                               string("Parse error: ") + pe.what(),
                               "ParseError"));
    return;
  }
  if (message.is_object() && message.count("id") && message.count("method")) {
    {
      lock_guard<mutex> guard(cancelMutex);
      inFlight[message["id"].dump()] = false;
    }
    pool->enqueue([this, message] { runRequest(message); });
    return;
  }
  json response = handleMessage(message);
  if (!response.is_null()) {
    writeMessage(response);
  }
}

void McpStdioServer::runRequest(const json& request) {
  el::Helpers::setThreadName("mcp-worker");
  json response = handleMessage(request);
  bool cancelled = false;
  {
    lock_guard<mutex> guard(cancelMutex);
    auto it = inFlight.find(request["id"].dump());
    if (it != inFlight.end()) {
      cancelled = it->second;
      inFlight.erase(it);
    }
  }
  if (cancelled) {
    LOG(INFO) << "Dropping response to cancelled request "
              << request["id"].dump();
    return;
  }
  writeMessage(response);
}

json McpStdioServer::handleMessage(const json& message) {
  if (!message.is_object() || !message.count("method") ||
      !message["method"].is_string()) {
    if (message.is_object() && message.count("id") &&
        !message.count("method")) {
      // A response to something we never ask for
      VLOG(1) << "Ignoring client response " << message.dump();
      return json();
    }
    return errorResponse(message.is_object() && message.count("id")
                             ? message["id"]
                             : json(nullptr),
                         INVALID_REQUEST, "Invalid request", "InvalidRequest");
  }
  string method = message["method"].get<string>();
  json params = message.count("params") ? message["params"] : json::object();
  bool isNotification = !message.count("id");
  json id = isNotification ? json(nullptr) : message["id"];
  VLOG(1) << "Handling " << method;

  if (isNotification) {
    if (method == "notifications/cancelled") {
      cancel(params);
    } else if (method != "notifications/initialized") {
      VLOG(1) << "Ignoring notification " << method;
    }
    return json();
  }

  try {
    auto result = invoke(method, params);
    if (!result) {
      return errorResponse(id, METHOD_NOT_FOUND, "Method not found: " + method,
                           "MethodNotFound");
    }
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", *result}};
  } catch (const GatewayException& ge) {
    LOG(INFO) << method << " failed: " << ge;
    return errorResponse(id, errorCodeFor(ge.getKind()), ge.what(),
                         ge.getKindName());
  } catch (const json::exception& je) {
    LOG(INFO) << method << " failed: " << je.what();
    return errorResponse(id, INVALID_PARAMS, je.what(), "InvalidParams");
  } catch (const std::exception& e) {
    LOG(ERROR) << method << " failed unexpectedly: " << e.what();
    return errorResponse(id, INTERNAL_ERROR, e.what(), "InternalError");
  }
}

optional<json> McpStdioServer::invoke(const string& method, const json& params) {
  if (method == "initialize") {
    string version = DEFAULT_PROTOCOL_VERSION;
    if (params.is_object() && params.count("protocolVersion") &&
        params["protocolVersion"].is_string()) {
      version = params["protocolVersion"].get<string>();
    }
    return json{
        {"protocolVersion", version},
        {"capabilities",
         {{"tools", {{"listChanged", true}}}, {"resources", json::object()}}},
        {"serverInfo", {{"name", "neogate"}, {"version", NG_VERSION}}}};
  }
  if (method == "ping") {
    return json::object();
  }
  if (method == "tools/list") {
    return json{{"tools", gateway->listTools()}};
  }
  if (method == "tools/call") {
    string name = requireStringArgument(params, "name");
    json arguments = params.count("arguments") ? params["arguments"]
                                               : json::object();
    return gateway->callTool(name, arguments);
  }
  if (method == "resources/list") {
    return json{{"resources", gateway->listResources()}};
  }
  if (method == "resources/read") {
    return gateway->readResource(requireStringArgument(params, "uri"));
  }
  return nullopt;
}

void McpStdioServer::cancel(const json& params) {
  if (!params.is_object() || !params.count("requestId")) {
    return;
  }
  lock_guard<mutex> guard(cancelMutex);
  auto it = inFlight.find(params["requestId"].dump());
  if (it != inFlight.end()) {
    it->second = true;
    LOG(INFO) << "Request " << it->first << " cancelled by client";
  }
}

void McpStdioServer::sendNotification(const string& method,
                                      const json& params) {
  writeMessage(json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
}

void McpStdioServer::writeMessage(const json& message) {
  string line;
  try {
    line = message.dump();
  } catch (const json::type_error& te) {
    LOG(ERROR) << "Cannot serialize outgoing message: " << te.what();
    if (!message.is_object() || !message.count("id")) {
      return;
    }
    // The client is still owed an answer for this id
    line = errorResponse(message["id"], INTERNAL_ERROR,
                         string("Cannot serialize response: ") + te.what(),
                         "InternalError")
               .dump();
  }
  lock_guard<mutex> guard(outMutex);
  out << line << "\n";
  out.flush();
}

json McpStdioServer::errorResponse(const json& id, int code,
                                   const string& message, const string& kind) {
  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"error",
               {{"code", code}, {"message", message}, {"data", {{"kind", kind}}}}}};
}
}  // namespace ng
