#ifndef __NG_EDITOR_CLIENT__
#define __NG_EDITOR_CLIENT__

#include "GatewayException.hpp"
#include "Headers.hpp"
#include "RpcClient.hpp"

namespace ng {
struct BufferInfo {
  int64_t id = 0;
  string name;
  int64_t lineCount = 0;
};

struct Diagnostic {
  int64_t bufferId = 0;
  int64_t lnum = 0;
  int64_t col = 0;
  int64_t endLnum = 0;
  int64_t endCol = 0;
  int64_t severity = 0;
  string message;
  string source;
};

/** @brief Zero based LSP position. */
struct Position {
  uint64_t line = 0;
  uint64_t character = 0;
};

struct Range {
  Position start;
  Position end;
};

struct LspClientInfo {
  int64_t id = 0;
  string name;
};

/** @brief Cursor of the current window, row and col both zero based. */
struct CursorPosition {
  string bufname;
  int64_t row = 0;
  int64_t col = 0;
};

void to_json(json& j, const BufferInfo& b);
void from_json(const json& j, BufferInfo& b);
void to_json(json& j, const Diagnostic& d);
void from_json(const json& j, Diagnostic& d);
void to_json(json& j, const Position& p);
void from_json(const json& j, Position& p);
void to_json(json& j, const Range& r);
void from_json(const json& j, Range& r);
void to_json(json& j, const LspClientInfo& c);
void from_json(const json& j, LspClientInfo& c);
void to_json(json& j, const CursorPosition& c);
void from_json(const json& j, CursorPosition& c);

/**
 * @brief Typed editor operations on top of one RpcClient.
 *
 * The client is either disconnected or connected to exactly one target.
 * Every operation except connect fails with NOT_CONNECTED while disconnected.
 * Diagnostics pushed by the editor are cached per buffer; the cache is only
 * ever replaced wholesale, one buffer at a time.
 */
class EditorClient {
 public:
  EditorClient();
  virtual ~EditorClient();

  /** @brief Connects to a Unix domain socket or Windows named pipe. */
  void connectPath(const string& path);
  /** @brief Connects to "host:port" over TCP. */
  void connectTcp(const string& address);
  void connect(const SocketEndpoint& endpoint);

  /** @brief Closes the connection. The client may connect again later. */
  void disconnect();

  bool isConnected();

  /** @brief The target string this client was connected with. */
  string getTarget();

  /** @brief Bound on every rpc wait, 0 to wait forever. */
  void setCallTimeoutMs(int64_t timeoutMs) { callTimeoutMs = timeoutMs; }
  /** @brief Timeout handed to LSP requests made inside the editor. */
  void setLspTimeoutMs(int64_t timeoutMs) { lspTimeoutMs = timeoutMs; }

  vector<BufferInfo> getBuffers();

  /**
   * @brief Runs Lua inside the editor and returns what the chunk returns.
   * @param args Values the chunk reads through `...`.
   */
  json executeLua(const string& code, const json& args = json::array());

  /**
   * @brief Arms the DiagnosticChanged autocmd and starts caching the
   * diagnostics it reports.
   */
  void setupDiagnosticsAutocmd();

  /** @brief Cached diagnostics for one buffer, empty when never reported. */
  vector<Diagnostic> getBufferDiagnostics(int64_t bufferId);
  /**
   * @brief Every cached buffer with its diagnostics. A buffer whose
   * diagnostics were cleared maps to an empty sequence.
   */
  map<int64_t, vector<Diagnostic>> getWorkspaceDiagnostics();

  /** @brief Concatenates per-buffer diagnostics in buffer id order. */
  static vector<Diagnostic> flattenDiagnostics(
      const map<int64_t, vector<Diagnostic>>& byBuffer);

  CursorPosition getCursorPosition();

  vector<LspClientInfo> lspGetClients();
  /** @brief Code actions the named LSP client offers for a buffer range. */
  json lspGetCodeActions(const string& clientName, int64_t bufferId,
                         const Range& range);
  json lspResolveCodeAction(const string& clientName, const json& codeAction);
  json lspApplyWorkspaceEdit(const string& clientName,
                             const json& workspaceEdit);

 protected:
  mutex stateMutex;
  shared_ptr<RpcClient> rpcClient;
  string target;

  mutex diagnosticsMutex;
  map<int64_t, vector<Diagnostic>> diagnosticsCache;

  atomic<int64_t> callTimeoutMs;
  atomic<int64_t> lspTimeoutMs;

  void connectStream(const string& _target, const SocketEndpoint& endpoint);
  shared_ptr<RpcClient> requireClient();
  json callEditor(const string& method, const json& params);
  /** @brief Runs one of the LSP scripts and decodes its JSON reply. */
  json callLspScript(const string& script, const json& args);
  void onDiagnosticsChanged(const json& params);
};
}  // namespace ng

#endif  // __NG_EDITOR_CLIENT__
